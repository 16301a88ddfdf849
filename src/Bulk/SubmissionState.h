//
// Created by lewis on 4/9/24.
//

#ifndef BULK_SUBMIT_SERVER_SUBMISSIONSTATE_H
#define BULK_SUBMIT_SERVER_SUBMISSIONSTATE_H

#include "ErrorManifest.h"
#include "../Lib/TestingMacros.h"
#include "JobState.h"
#include <chrono>
#include <client_http.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct sSubmitter {
    std::string system;
    std::string value;

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"system", system}, {"value", value}};
    }
};

enum class eSubmissionStatus {
    inProgress,
    complete,
    aborted
};

auto submissionStatusToString(eSubmissionStatus status) -> std::string;

struct sSubmissionConfig {
    // Each submission writes to <jobsDirectory>/<slug>/
    std::filesystem::path jobsDirectory;

    // Public base url used in the error manifest
    std::string baseUrl;
};

struct sJobRequest {
    std::string manifestUrl;
    std::string outputFormat;
    std::string fhirBaseUrl;
    SimpleWeb::CaseInsensitiveMultimap fileRequestHeaders;
};

/*
 * All the jobs submitted under one submitter and submission id.
 */
class SubmissionState {
public:
    SubmissionState(std::string submissionId, sSubmitter submitter, sSubmissionConfig config);
    virtual ~SubmissionState() = default;
    SubmissionState(SubmissionState const&) = delete;
    auto operator =(SubmissionState const&) -> SubmissionState& = delete;
    SubmissionState(SubmissionState&&) = delete;
    auto operator=(SubmissionState&&) -> SubmissionState& = delete;

    // sha256 of "<system>|<value>:<submissionId>", as lowercase hex
    static auto computeSlug(const std::string& submissionId, const sSubmitter& submitter) -> std::string;

    // Creates a pending job, with a fetcher writing in to this submission's directory, and adds it
    auto createJob(const sJobRequest& request) -> std::shared_ptr<JobState>;

    void addJob(const std::shared_ptr<JobState>& job);
    void removeJob(const std::string& jobId);
    [[nodiscard]] auto getJobs() const -> std::vector<std::shared_ptr<JobState>>;
    [[nodiscard]] auto findJobByManifestUrl(const std::string& manifestUrl) const -> std::shared_ptr<JobState>;

    // Requests on one submission hold this for the whole of their check and update, so they run one at a time
    [[nodiscard]] auto lockRequests() -> std::unique_lock<std::mutex> { return std::unique_lock<std::mutex>(requestMutex); }

    // Starts every pending, failed or aborted job. Jobs whose last run is still going are left alone
    void start();

    void complete();

    // Marks the submission aborted and aborts every job
    void abort();

    // Aborts the job for oldManifestUrl and waits for it, drops its outcomes and deletes its files, then creates a job
    // for the new manifest. Files that can't be deleted are recorded as errors of the new manifest.
    // Throws std::out_of_range if no job has oldManifestUrl
    auto replaceManifest(const std::string& oldManifestUrl, const sJobRequest& request) -> std::shared_ptr<JobState>;

    [[nodiscard]] auto getProgress() const -> double;
    [[nodiscard]] auto getStatus() const -> eSubmissionStatus;
    [[nodiscard]] auto isTerminal() const -> bool;

    [[nodiscard]] auto getSlug() const -> const std::string& { return slug; }
    [[nodiscard]] auto getSubmissionId() const -> const std::string& { return submissionId; }
    [[nodiscard]] auto getSubmitter() const -> const sSubmitter& { return submitter; }
    [[nodiscard]] auto getCreatedAt() const -> std::chrono::system_clock::time_point { return createdAt; }
    [[nodiscard]] auto getDirectory() const -> std::filesystem::path { return config.jobsDirectory / slug; }
    [[nodiscard]] auto getErrorManifest() const -> std::shared_ptr<ErrorManifest> { return pErrorManifest; }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

private:
    const std::string submissionId;
    const sSubmitter submitter;
    const sSubmissionConfig config;
    const std::string slug;
    const std::chrono::system_clock::time_point createdAt;
    const std::shared_ptr<ErrorManifest> pErrorManifest;

    std::mutex requestMutex;

    mutable std::mutex mutex_;
    eSubmissionStatus status = eSubmissionStatus::inProgress;

    // Ordered by job id, like the original job map
    std::map<std::string, std::shared_ptr<JobState>> mJobs;

// Testing
EXPOSE_PROPERTY_FOR_TESTING(status);
};

#endif //BULK_SUBMIT_SERVER_SUBMISSIONSTATE_H
