//
// Created by lewis on 4/8/24.
//

#include "ErrorManifest.h"
#include "../Lib/GeneralUtils.h"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

ErrorManifest::ErrorManifest(
        std::string submissionId,
        std::string slug,
        std::filesystem::path jobsDirectory,
        std::string baseUrl
) : submissionId(std::move(submissionId)),
    slug(std::move(slug)),
    baseUrl(std::move(baseUrl)),
    transactionTime(formatTimestamp(std::chrono::system_clock::now())) {
    filesDirectory = std::move(jobsDirectory) / this->slug / "files";
}

auto ErrorManifest::findEntry(const std::string& manifestUrl) -> std::shared_ptr<sErrorManifestEntry> {
    auto entry = std::find_if(vEntries.begin(), vEntries.end(), [&manifestUrl](const auto& item) {
        return item->manifestUrl == manifestUrl;
    });

    return entry == vEntries.end() ? nullptr : *entry;
}

auto ErrorManifest::findOrAddEntry(const std::string& manifestUrl) -> std::shared_ptr<sErrorManifestEntry> {
    if (auto entry = findEntry(manifestUrl)) {
        return entry;
    }

    // Each manifest url gets its own, initially empty, record file
    auto fileName = generateUUID() + ".ndjson";

    auto entry = std::make_shared<sErrorManifestEntry>();
    entry->manifestUrl = manifestUrl;
    entry->url = baseUrl + "/jobs/" + slug + "/files/" + fileName;
    entry->recordPath = filesDirectory / fileName;

    std::filesystem::create_directories(filesDirectory);
    std::ofstream recordFile(entry->recordPath, std::ios::out | std::ios::trunc);
    if (!recordFile.is_open()) {
        throw std::runtime_error("Unable to create record file " + entry->recordPath.string());
    }

    vEntries.push_back(entry);
    return entry;
}

void ErrorManifest::addSuccess(const std::string& manifestUrl) {
    std::unique_lock<std::mutex> lock(mutex_);

    // Successes only count, nothing is written
    findOrAddEntry(manifestUrl)->success++;
}

void ErrorManifest::addError(const eBulkError& error, const std::string& manifestUrl) {
    auto operationOutcome = createOperationOutcome(error);

    std::unique_lock<std::mutex> lock(mutex_);

    auto entry = findOrAddEntry(manifestUrl);

    // The directory may have been removed since the entry was created
    std::filesystem::create_directories(entry->recordPath.parent_path());

    std::ofstream recordFile(entry->recordPath, std::ios::out | std::ios::app);
    if (!recordFile.is_open()) {
        throw std::runtime_error("Unable to open record file " + entry->recordPath.string());
    }

    recordFile << operationOutcome.dump() << '\n';
    recordFile.close();
    if (recordFile.fail()) {
        throw std::runtime_error("Failed writing to record file " + entry->recordPath.string());
    }

    entry->error++;
}

void ErrorManifest::removeManifestUrl(const std::string& manifestUrl) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto entry = findEntry(manifestUrl);
    if (!entry) {
        throw std::out_of_range("No error manifest entry for " + manifestUrl);
    }

    std::filesystem::remove(entry->recordPath);
    vEntries.erase(std::remove(vEntries.begin(), vEntries.end(), entry), vEntries.end());
}

auto ErrorManifest::hasManifestUrl(const std::string& manifestUrl) const -> bool {
    std::unique_lock<std::mutex> lock(mutex_);

    return std::any_of(vEntries.begin(), vEntries.end(), [&manifestUrl](const auto& item) {
        return item->manifestUrl == manifestUrl;
    });
}

auto ErrorManifest::getEntries() const -> std::vector<sErrorManifestEntry> {
    std::unique_lock<std::mutex> lock(mutex_);

    std::vector<sErrorManifestEntry> entries;
    for (const auto& entry : vEntries) {
        entries.push_back(*entry);
    }

    return entries;
}

auto ErrorManifest::toJson() const -> nlohmann::json {
    auto errors = nlohmann::json::array();

    for (const auto& entry : getEntries()) {
        errors.push_back({
                {"type", "OperationOutcome"},
                {"url", entry.url},
                {"extension", {
                        {"manifestUrl", entry.manifestUrl},
                        {"countSeverity", {
                                {"success", entry.success},
                                {"error", entry.error}
                        }}
                }}
        });
    }

    return {
            {"extension", {{"submissionId", submissionId}}},
            {"transactionTime", transactionTime},
            {"request", baseUrl + "/$bulk-submit-status"},
            {"requiresAccessToken", false},
            {"output", nlohmann::json::array()},
            {"error", errors}
    };
}

auto ErrorManifest::createOperationOutcome(const eBulkError& error) -> nlohmann::json {
    nlohmann::json operationOutcome = {
            {"resourceType", "OperationOutcome"},
            {"id", generateUUID()},
            {"issue", nlohmann::json::array({
                    {
                            {"severity", "error"},
                            {"code", error.issueType().empty() ? std::string{ISSUE_TYPE_PROCESSING} : error.issueType()},
                            {"details", {{"text", error.what()}}}
                    }
            })}
    };

    // Point back at the resource the error is about
    if (error.context().resource) {
        operationOutcome["extension"] = nlohmann::json::array({
                {
                        {"url", "http://hl7.org/fhir/StructureDefinition/artifact-relatedArtifact"},
                        {"valueRelatedArtifact", {
                                {"type", "comments-on"},
                                {"resourceReference", error.resourceReference()}
                        }}
                }
        });
    }

    return operationOutcome;
}
