//
// Created by lewis on 4/8/24.
//

#ifndef BULK_SUBMIT_SERVER_JOBSTATE_H
#define BULK_SUBMIT_SERVER_JOBSTATE_H

#include "../Lib/BulkError.h"
#include "../Lib/TestingMacros.h"
#include "ManifestFetcher.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

enum class eJobStatus {
    pending,
    inProgress,
    complete,
    failed,
    aborted
};

auto jobStatusToString(eJobStatus status) -> std::string;

enum class eJobEvent {
    start,
    progress,
    complete,
    error,
    abort
};

struct sJobSnapshot {
    eJobStatus status = eJobStatus::pending;

    // 0 to 100. 100 once the run has finished, whatever the outcome
    uint32_t progress = 0;

    std::optional<std::string> error;
};

struct sJobEventData {
    eJobEvent event;
    uint64_t downloaded = 0;
    uint64_t total = 0;
    std::string message;
};

// The job lifecycle. Every change to a job's state goes through here
auto transitionJob(const sJobSnapshot& current, const sJobEventData& event) -> sJobSnapshot;

struct sJobCallbacks {
    // Every error reported while the job runs
    std::function<void(const eBulkError& error)> onError;

    // A file was downloaded completely and had the expected number of resources
    std::function<void(const std::string& url, uint64_t count)> onFileComplete;
};

/*
 * One manifest download within a submission.
 */
class JobState {
public:
    JobState(
            std::string submissionId,
            std::string manifestUrl,
            std::string outputFormat,
            std::shared_ptr<ManifestFetcher> fetcher
    );
    virtual ~JobState();
    JobState(JobState const&) = delete;
    auto operator =(JobState const&) -> JobState& = delete;
    JobState(JobState&&) = delete;
    auto operator=(JobState&&) -> JobState& = delete;

    // Runs the fetcher on a background thread. Throws if the job has no manifest url, or if an earlier run is still
    // going and was not aborted
    void start(sJobCallbacks callbacks = {});

    // Stops the fetcher and detaches from it. Safe to call more than once
    void abort();

    // Waits for the current run to finish. Returns false if it's still running after timeout
    auto wait(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto getJobId() const -> const std::string& { return jobId; }
    [[nodiscard]] auto getSubmissionId() const -> const std::string& { return submissionId; }
    [[nodiscard]] auto getManifestUrl() const -> const std::string& { return manifestUrl; }
    [[nodiscard]] auto getOutputFormat() const -> const std::string& { return outputFormat; }
    [[nodiscard]] auto getCreatedAt() const -> std::chrono::system_clock::time_point { return createdAt; }
    [[nodiscard]] auto getFetcher() const -> std::shared_ptr<ManifestFetcher> { return pFetcher; }

    // True from start until the fetcher has returned, whatever the status says
    [[nodiscard]] auto isRunning() const -> bool;

    [[nodiscard]] auto getSnapshot() const -> sJobSnapshot;
    [[nodiscard]] auto getStatus() const -> eJobStatus;
    [[nodiscard]] auto getProgress() const -> uint32_t;
    [[nodiscard]] auto getError() const -> std::optional<std::string>;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

private:
    // Returns false if the event belongs to a run that has been aborted or replaced
    auto apply(const sJobEventData& event, uint64_t eventRunId) -> bool;
    [[nodiscard]] auto isCurrentRun(uint64_t eventRunId) const -> bool;
    void attachFetcher(const sJobCallbacks& callbacks, uint64_t eventRunId);

    const std::string jobId;
    const std::string submissionId;
    const std::string manifestUrl;
    const std::string outputFormat;
    const std::chrono::system_clock::time_point createdAt;
    std::shared_ptr<ManifestFetcher> pFetcher;

    mutable std::mutex mutex_;
    std::condition_variable runCV;
    sJobSnapshot snapshot;
    bool bRunning = false;

    // Events from a run that has since been aborted are ignored
    uint64_t runId = 0;

    // Serialises start and abort
    std::mutex controlMutex;

    std::jthread runThread;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(runId);
};

#endif //BULK_SUBMIT_SERVER_JOBSTATE_H
