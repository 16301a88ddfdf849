//
// Created by lewis on 4/3/24.
//

#ifndef BULK_SUBMIT_SERVER_FHIRRESOURCES_H
#define BULK_SUBMIT_SERVER_FHIRRESOURCES_H

#include <nlohmann/json.hpp>
#include <string>

// True if resourceType names a FHIR R4 resource
auto isFhirResourceType(const std::string& resourceType) -> bool;

// Throws std::invalid_argument describing the first problem found. expectedType is ignored if empty
void validateResource(const nlohmann::json& resource, const std::string& expectedType);

// File extension (including the leading ".") for an attachment content type, or an empty string if unknown
auto extensionFromContentType(const std::string& contentType) -> std::string;

#endif //BULK_SUBMIT_SERVER_FHIRRESOURCES_H
