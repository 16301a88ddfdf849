//
// Created by lewis on 4/8/24.
//

#include "JobState.h"
#include "../Lib/GeneralUtils.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

auto jobStatusToString(eJobStatus status) -> std::string {
    switch (status) {
        case eJobStatus::pending:
            return "pending";
        case eJobStatus::inProgress:
            return "in-progress";
        case eJobStatus::complete:
            return "complete";
        case eJobStatus::failed:
            return "failed";
        case eJobStatus::aborted:
            return "aborted";
    }

    return "unknown";
}

auto transitionJob(const sJobSnapshot& current, const sJobEventData& event) -> sJobSnapshot {
    auto next = current;

    switch (event.event) {
        case eJobEvent::start:
            next.status = eJobStatus::inProgress;
            next.progress = 0;
            next.error.reset();
            break;

        case eJobEvent::progress:
            // Progress only moves while the run is going, a failed run keeps downloading the remaining files
            if (current.status != eJobStatus::inProgress && current.status != eJobStatus::failed) {
                break;
            }

            if (event.total > 0) {
                // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
                auto percent = std::round(100.0 * static_cast<double>(event.downloaded) / static_cast<double>(event.total));
                // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
                next.progress = static_cast<uint32_t>(std::min(percent, 100.0));
            }
            break;

        case eJobEvent::complete:
            if (current.status == eJobStatus::aborted) {
                break;
            }

            // Complete means the run is over, errors along the way are kept in error
            next.status = eJobStatus::complete;
            // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
            next.progress = 100;
            break;

        case eJobEvent::error:
            if (current.status == eJobStatus::aborted) {
                break;
            }

            next.status = eJobStatus::failed;
            next.error = event.message;
            break;

        case eJobEvent::abort:
            next.status = eJobStatus::aborted;
            break;
    }

    return next;
}

JobState::JobState(
        std::string submissionId,
        std::string manifestUrl,
        std::string outputFormat,
        std::shared_ptr<ManifestFetcher> fetcher
) : jobId(generateUUID()),
    submissionId(std::move(submissionId)),
    manifestUrl(std::move(manifestUrl)),
    outputFormat(std::move(outputFormat)),
    createdAt(std::chrono::system_clock::now()),
    pFetcher(std::move(fetcher)) {
}

JobState::~JobState() {
    bool running = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        running = bRunning;
        runId++;
    }

    pFetcher->clearEvents();

    // Make sure the run thread finishes promptly, it is joined when runThread is destroyed
    if (running) {
        pFetcher->abort();
    }
}

auto JobState::apply(const sJobEventData& event, uint64_t eventRunId) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);

    if (eventRunId != runId) {
        return false;
    }

    snapshot = transitionJob(snapshot, event);
    return true;
}

auto JobState::isCurrentRun(uint64_t eventRunId) const -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return eventRunId == runId;
}

void JobState::attachFetcher(const sJobCallbacks& callbacks, uint64_t eventRunId) {
    sManifestFetcherEvents events;

    events.onStart = [this, eventRunId]() {
        apply({eJobEvent::start}, eventRunId);
    };

    events.onProgress = [this, eventRunId](uint64_t downloaded, uint64_t total) {
        apply({eJobEvent::progress, downloaded, total}, eventRunId);
    };

    events.onComplete = [this, eventRunId]() {
        apply({eJobEvent::complete}, eventRunId);
    };

    events.onAbort = [this, eventRunId]() {
        apply({eJobEvent::abort}, eventRunId);
    };

    events.onError = [this, eventRunId, onError = callbacks.onError](const eBulkError& error) {
        std::cerr << "Job " << jobId << ": " << error.what() << std::endl;

        if (apply({eJobEvent::error, 0, 0, error.what()}, eventRunId) && onError) {
            onError(error);
        }
    };

    events.onDownloadComplete = [this, eventRunId, onFileComplete = callbacks.onFileComplete](
            const std::string& url, uint64_t count) {
        if (isCurrentRun(eventRunId) && onFileComplete) {
            onFileComplete(url, count);
        }
    };

    pFetcher->setEvents(std::move(events));
}

void JobState::start(sJobCallbacks callbacks) {
    std::unique_lock<std::mutex> controlLock(controlMutex);

    {
        std::unique_lock<std::mutex> lock(mutex_);

        if (snapshot.status == eJobStatus::inProgress) {
            throw std::runtime_error("Job " + jobId + " is already in progress");
        }

        // A failed run keeps downloading its remaining files. Only an aborted run is cancelled and can be waited for
        if (bRunning && snapshot.status != eJobStatus::aborted) {
            throw std::runtime_error("Job " + jobId + " is still running");
        }

        if (manifestUrl.empty()) {
            throw std::invalid_argument("Job " + jobId + " has no manifest url");
        }
    }

    // An earlier run may still be winding down after an abort
    if (runThread.joinable()) {
        runThread.join();
    }

    pFetcher->reset();

    uint64_t currentRunId = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        currentRunId = ++runId;
        snapshot = transitionJob(snapshot, {eJobEvent::start});
        bRunning = true;
    }

    attachFetcher(callbacks, currentRunId);

    std::cout << "Job " << jobId << ": Starting download of " << manifestUrl << std::endl;

    runThread = std::jthread([this, fetcher = pFetcher]() {
        try {
            fetcher->run(manifestUrl);
        } catch (std::exception& e) {
            dumpExceptions(e);
        }

        {
            std::unique_lock<std::mutex> lock(mutex_);
            bRunning = false;
        }
        runCV.notify_all();
    });
}

void JobState::abort() {
    std::unique_lock<std::mutex> controlLock(controlMutex);

    {
        std::unique_lock<std::mutex> lock(mutex_);

        if (snapshot.status == eJobStatus::aborted) {
            return;
        }

        snapshot = transitionJob(snapshot, {eJobEvent::abort});

        // Anything the fetcher reports from here on belongs to the aborted run
        runId++;
    }

    std::cout << "Job " << jobId << ": Aborted" << std::endl;

    pFetcher->clearEvents();
    pFetcher->abort();
}

auto JobState::wait(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return runCV.wait_for(lock, timeout, [this] { return !bRunning; });
}

auto JobState::isRunning() const -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return bRunning;
}

auto JobState::getSnapshot() const -> sJobSnapshot {
    std::unique_lock<std::mutex> lock(mutex_);
    return snapshot;
}

auto JobState::getStatus() const -> eJobStatus {
    return getSnapshot().status;
}

auto JobState::getProgress() const -> uint32_t {
    return getSnapshot().progress;
}

auto JobState::getError() const -> std::optional<std::string> {
    return getSnapshot().error;
}

auto JobState::toJson() const -> nlohmann::json {
    auto current = getSnapshot();

    nlohmann::json result = {
            {"jobId", jobId},
            {"manifestUrl", manifestUrl},
            {"outputFormat", outputFormat},
            {"status", jobStatusToString(current.status)},
            {"progress", current.progress}
    };

    result["error"] = current.error ? nlohmann::json(*current.error) : nlohmann::json(nullptr);

    return result;
}
