//
// Created by lewis on 4/2/24.
//

#ifndef BULK_SUBMIT_SERVER_BULKERROR_H
#define BULK_SUBMIT_SERVER_BULKERROR_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// FHIR issue type codes attached to download errors
constexpr const char* ISSUE_TYPE_PROCESSING = "processing";
constexpr const char* ISSUE_TYPE_INVALID = "invalid";
constexpr const char* ISSUE_TYPE_NOT_FOUND = "not-found";
constexpr const char* ISSUE_TYPE_INCOMPLETE = "incomplete";

struct sBulkErrorContext {
    // "GET <url>" for the request that failed, if any
    std::string request;

    // "<status code> <reason>" of the response that failed, if any
    std::string response;

    // The local file that was being written
    std::string filePath;

    // The resource that failed validation, or the resource that owns a failed attachment
    std::optional<nlohmann::json> resource;

    // 1-based line within the ndjson file
    std::optional<uint64_t> lineNumber;

    std::string issueType = ISSUE_TYPE_PROCESSING;
};

class eBulkError : public std::runtime_error {
public:
    explicit eBulkError(const std::string& message, sBulkErrorContext context = {})
            : std::runtime_error(message), context_(std::move(context)) {}

    [[nodiscard]] auto context() const -> const sBulkErrorContext& { return context_; }

    [[nodiscard]] auto issueType() const -> const std::string& { return context_.issueType; }

    // "<resourceType>/<id>" for the attached resource, or empty if there is none
    [[nodiscard]] auto resourceReference() const -> std::string;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

private:
    sBulkErrorContext context_;
};

#endif //BULK_SUBMIT_SERVER_BULKERROR_H
