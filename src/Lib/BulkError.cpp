//
// Created by lewis on 4/2/24.
//

#include "BulkError.h"

auto eBulkError::resourceReference() const -> std::string {
    if (!context_.resource || !context_.resource->is_object()) {
        return {};
    }

    const auto& resource = *context_.resource;
    auto resourceType = resource.contains("resourceType") && resource["resourceType"].is_string()
                        ? resource["resourceType"].get<std::string>() : std::string{"Unknown"};
    auto resourceId = resource.contains("id") && resource["id"].is_string()
                      ? resource["id"].get<std::string>() : std::string{"unknown"};

    return resourceType + "/" + resourceId;
}

auto eBulkError::toJson() const -> nlohmann::json {
    nlohmann::json result = {
            {"message", what()},
            {"issueType", context_.issueType}
    };

    if (!context_.request.empty()) {
        result["request"] = context_.request;
    }

    if (!context_.response.empty()) {
        result["response"] = context_.response;
    }

    if (!context_.filePath.empty()) {
        result["filePath"] = context_.filePath;
    }

    if (context_.resource) {
        result["resource"] = *context_.resource;
    }

    if (context_.lineNumber) {
        result["lineNumber"] = *context_.lineNumber;
    }

    return result;
}
