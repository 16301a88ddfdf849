//
// Created by lewis on 3/11/20.
//

#ifndef BULK_SUBMIT_SERVER_HTTPUTILS_H
#define BULK_SUBMIT_SERVER_HTTPUTILS_H

#include "HttpServer.h"
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>

// A request the client has to fix. Answered with 400 and an OperationOutcome
class eBadRequest : public std::runtime_error {
public:
    explicit eBadRequest(const std::string& what) : std::runtime_error(what) {}
};

auto getHeader(const SimpleWeb::CaseInsensitiveMultimap& headers, const std::string &header) -> std::string;

auto createOperationOutcome(const std::string& severity, const std::string& code, const std::string& diagnostics) -> nlohmann::json;

void writeOperationOutcome(
        const std::shared_ptr<HttpServerImpl::Response>& response,
        SimpleWeb::StatusCode status,
        const std::string& severity,
        const std::string& code,
        const std::string& diagnostics,
        SimpleWeb::CaseInsensitiveMultimap headers = {}
);

// Reads the request body as a FHIR Parameters resource. Throws eBadRequest if it isn't one
auto readParameters(const std::shared_ptr<HttpServerImpl::Request>& request) -> nlohmann::json;

// Finds the first parameter with the given name in a Parameters resource, or nullptr
auto findParameter(const nlohmann::json& parameters, const std::string& name) -> const nlohmann::json*;

// Returns the first non-empty string among the value keys of the named parameter
auto getParameterString(
        const nlohmann::json& parameters,
        const std::string& name,
        std::initializer_list<const char*> valueKeys = {"valueString"}
) -> std::optional<std::string>;

#endif //BULK_SUBMIT_SERVER_HTTPUTILS_H
