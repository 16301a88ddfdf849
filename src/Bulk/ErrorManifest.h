//
// Created by lewis on 4/8/24.
//

#ifndef BULK_SUBMIT_SERVER_ERRORMANIFEST_H
#define BULK_SUBMIT_SERVER_ERRORMANIFEST_H

#include "../Lib/BulkError.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct sErrorManifestEntry {
    std::string manifestUrl;

    // Public url of the OperationOutcome record file
    std::string url;

    std::filesystem::path recordPath;
    uint64_t success = 0;
    uint64_t error = 0;
};

/*
 * Processing outcomes of a submission, grouped by the manifest that produced them.
 *
 * Each manifest url gets an ndjson file of OperationOutcome records, written under
 * <jobsDirectory>/<slug>/files/ and published at <baseUrl>/jobs/<slug>/files/.
 */
class ErrorManifest {
public:
    ErrorManifest(std::string submissionId, std::string slug, std::filesystem::path jobsDirectory, std::string baseUrl);

    void addSuccess(const std::string& manifestUrl);

    // Appends an OperationOutcome for the error to the manifest url's record file
    void addError(const eBulkError& error, const std::string& manifestUrl);

    // Deletes the record file and forgets the manifest url. Throws std::out_of_range if the url isn't known
    void removeManifestUrl(const std::string& manifestUrl);

    [[nodiscard]] auto hasManifestUrl(const std::string& manifestUrl) const -> bool;

    [[nodiscard]] auto getEntries() const -> std::vector<sErrorManifestEntry>;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    static auto createOperationOutcome(const eBulkError& error) -> nlohmann::json;

private:
    auto findEntry(const std::string& manifestUrl) -> std::shared_ptr<sErrorManifestEntry>;
    auto findOrAddEntry(const std::string& manifestUrl) -> std::shared_ptr<sErrorManifestEntry>;

    std::string submissionId;
    std::string slug;
    std::filesystem::path filesDirectory;
    std::string baseUrl;
    std::string transactionTime;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<sErrorManifestEntry>> vEntries;
};

#endif //BULK_SUBMIT_SERVER_ERRORMANIFEST_H
