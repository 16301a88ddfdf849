//
// Created by lewis on 3/11/20.
//

#include "HttpUtils.h"

auto getHeader(const SimpleWeb::CaseInsensitiveMultimap& headers, const std::string &header) -> std::string {
    // Header names are case insensitive
    auto headerItem = headers.find(header);
    if (headerItem != headers.end()) {
        return headerItem->second;
    }

    // Return an empty string
    return {};
}

auto createOperationOutcome(
        const std::string& severity,
        const std::string& code,
        const std::string& diagnostics
) -> nlohmann::json {
    return {
            {"resourceType", "OperationOutcome"},
            {"issue", nlohmann::json::array({
                    {
                            {"severity", severity},
                            {"code", code},
                            {"diagnostics", diagnostics}
                    }
            })}
    };
}

void writeOperationOutcome(
        const std::shared_ptr<HttpServerImpl::Response>& response,
        SimpleWeb::StatusCode status,
        const std::string& severity,
        const std::string& code,
        const std::string& diagnostics,
        SimpleWeb::CaseInsensitiveMultimap headers
) {
    headers.emplace("Content-Type", "application/fhir+json");

    response->write(status, createOperationOutcome(severity, code, diagnostics).dump(), headers);
}

auto readParameters(const std::shared_ptr<HttpServerImpl::Request>& request) -> nlohmann::json {
    nlohmann::json parameters;

    try {
        request->content >> parameters;
    } catch (nlohmann::json::exception&) {
        throw eBadRequest("Invalid request body. Expected a FHIR Parameters resource.");
    }

    if (!parameters.is_object() || !parameters.contains("parameter") || !parameters["parameter"].is_array()) {
        throw eBadRequest("Invalid request body. Expected a FHIR Parameters resource.");
    }

    return parameters;
}

auto findParameter(const nlohmann::json& parameters, const std::string& name) -> const nlohmann::json* {
    for (const auto& parameter : parameters.at("parameter")) {
        if (parameter.is_object() && parameter.value("name", "") == name) {
            return &parameter;
        }
    }

    return nullptr;
}

auto getParameterString(
        const nlohmann::json& parameters,
        const std::string& name,
        std::initializer_list<const char*> valueKeys
) -> std::optional<std::string> {
    const auto* parameter = findParameter(parameters, name);
    if (parameter == nullptr) {
        return std::nullopt;
    }

    for (const auto* key : valueKeys) {
        if (parameter->contains(key) && (*parameter)[key].is_string()) {
            auto value = (*parameter)[key].get<std::string>();
            if (!value.empty()) {
                return value;
            }
        }
    }

    return std::nullopt;
}
