//
// Created by lewis on 4/9/24.
//

#include "SubmissionState.h"
#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <utility>

auto submissionStatusToString(eSubmissionStatus status) -> std::string {
    switch (status) {
        case eSubmissionStatus::inProgress:
            return "in-progress";
        case eSubmissionStatus::complete:
            return "complete";
        case eSubmissionStatus::aborted:
            return "aborted";
    }

    return "unknown";
}

SubmissionState::SubmissionState(std::string _submissionId, sSubmitter _submitter, sSubmissionConfig _config) :
    submissionId(std::move(_submissionId)),
    submitter(std::move(_submitter)),
    config(std::move(_config)),
    slug(computeSlug(submissionId, submitter)),
    createdAt(std::chrono::system_clock::now()),
    pErrorManifest(std::make_shared<ErrorManifest>(submissionId, slug, config.jobsDirectory, config.baseUrl)) {
}

auto SubmissionState::computeSlug(const std::string& submissionId, const sSubmitter& submitter) -> std::string {
    return sha256Hex(submitter.system + "|" + submitter.value + ":" + submissionId);
}

auto SubmissionState::createJob(const sJobRequest& request) -> std::shared_ptr<JobState> {
    auto fetcher = std::make_shared<ManifestFetcher>(
            sManifestFetcherOptions{
                    getDirectory(),
                    request.fhirBaseUrl,
                    request.fileRequestHeaders
            }
    );

    auto job = std::make_shared<JobState>(submissionId, request.manifestUrl, request.outputFormat, fetcher);
    addJob(job);

    return job;
}

void SubmissionState::addJob(const std::shared_ptr<JobState>& job) {
    std::unique_lock<std::mutex> lock(mutex_);
    mJobs[job->getJobId()] = job;
}

void SubmissionState::removeJob(const std::string& jobId) {
    std::unique_lock<std::mutex> lock(mutex_);
    mJobs.erase(jobId);
}

auto SubmissionState::getJobs() const -> std::vector<std::shared_ptr<JobState>> {
    std::unique_lock<std::mutex> lock(mutex_);

    std::vector<std::shared_ptr<JobState>> jobs;
    jobs.reserve(mJobs.size());
    for (const auto& [jobId, job] : mJobs) {
        jobs.push_back(job);
    }

    return jobs;
}

auto SubmissionState::findJobByManifestUrl(const std::string& manifestUrl) const -> std::shared_ptr<JobState> {
    std::unique_lock<std::mutex> lock(mutex_);

    for (const auto& [jobId, job] : mJobs) {
        if (job->getManifestUrl() == manifestUrl) {
            return job;
        }
    }

    return nullptr;
}

void SubmissionState::start() {
    for (const auto& job : getJobs()) {
        auto jobStatus = job->getStatus();
        if (jobStatus != eJobStatus::pending && jobStatus != eJobStatus::failed && jobStatus != eJobStatus::aborted) {
            continue;
        }

        // A failed job may still be downloading its remaining files
        if (jobStatus != eJobStatus::aborted && job->isRunning()) {
            continue;
        }

        // The callbacks hold the error manifest rather than the submission, they may outlive it on the job thread
        sJobCallbacks callbacks;
        callbacks.onError = [errorManifest = pErrorManifest, manifestUrl = job->getManifestUrl()](
                const eBulkError& error) {
            try {
                errorManifest->addError(error, manifestUrl);
            } catch (std::exception& e) {
                dumpExceptions(e);
            }
        };

        callbacks.onFileComplete = [errorManifest = pErrorManifest, manifestUrl = job->getManifestUrl()](
                const std::string&, uint64_t) {
            try {
                errorManifest->addSuccess(manifestUrl);
            } catch (std::exception& e) {
                dumpExceptions(e);
            }
        };

        try {
            job->start(callbacks);
        } catch (std::runtime_error& e) {
            // Started by someone else in the meantime, the other jobs still need starting
            std::cerr << "Submission " << slug << ": Job " << job->getJobId() << " not started" << std::endl;
            dumpExceptions(e);
        }
    }
}

void SubmissionState::complete() {
    std::unique_lock<std::mutex> lock(mutex_);
    status = eSubmissionStatus::complete;
}

void SubmissionState::abort() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        status = eSubmissionStatus::aborted;
    }

    for (const auto& job : getJobs()) {
        job->abort();
    }
}

auto SubmissionState::replaceManifest(
        const std::string& oldManifestUrl,
        const sJobRequest& request
) -> std::shared_ptr<JobState> {
    auto oldJob = findJobByManifestUrl(oldManifestUrl);
    if (!oldJob) {
        throw std::out_of_range("No job found for manifest url " + oldManifestUrl);
    }

    oldJob->abort();

    // The aborted run must stop writing before its files are deleted
    if (!oldJob->wait(std::chrono::seconds(FILE_CONNECT_TIMEOUT_SECONDS))) {
        std::cerr << "Submission " << slug << ": Job " << oldJob->getJobId() << " is still running, rolling back anyway"
                  << std::endl;
    }

    removeJob(oldJob->getJobId());

    // Dropped before the roll back so a replacement with the same url keeps its roll back errors
    if (pErrorManifest->hasManifestUrl(oldManifestUrl)) {
        pErrorManifest->removeManifestUrl(oldManifestUrl);
    }

    auto fetcher = oldJob->getFetcher();

    sManifestFetcherEvents rollbackEvents;
    rollbackEvents.onError = [errorManifest = pErrorManifest, manifestUrl = request.manifestUrl, submissionSlug = slug](
            const eBulkError& error) {
        std::cerr << "Submission " << submissionSlug << ": " << error.what() << std::endl;

        try {
            errorManifest->addError(error, manifestUrl);
        } catch (std::exception& e) {
            dumpExceptions(e);
        }
    };
    fetcher->setEvents(std::move(rollbackEvents));

    // Without the old manifest there is nothing known to delete, the replacement goes ahead regardless
    try {
        fetcher->undoAll(oldManifestUrl);
    } catch (std::exception& e) {
        std::cerr << "Submission " << slug << ": Unable to roll back files of " << oldManifestUrl << std::endl;
        dumpExceptions(e);
    }

    fetcher->clearEvents();

    return createJob(request);
}

auto SubmissionState::getProgress() const -> double {
    auto jobs = getJobs();
    if (jobs.empty()) {
        return 0;
    }

    auto sum = std::accumulate(jobs.begin(), jobs.end(), 0.0, [](double total, const auto& job) {
        return total + job->getProgress();
    });

    return roundToPrecision(sum / static_cast<double>(jobs.size()), 2);
}

auto SubmissionState::getStatus() const -> eSubmissionStatus {
    std::unique_lock<std::mutex> lock(mutex_);
    return status;
}

auto SubmissionState::isTerminal() const -> bool {
    auto current = getStatus();
    return current == eSubmissionStatus::complete || current == eSubmissionStatus::aborted;
}

auto SubmissionState::toJson() const -> nlohmann::json {
    auto jobs = nlohmann::json::array();
    for (const auto& job : getJobs()) {
        auto snapshot = job->getSnapshot();
        jobs.push_back({
                {"jobId", job->getJobId()},
                {"manifestUrl", job->getManifestUrl()},
                {"status", jobStatusToString(snapshot.status)},
                {"progress", snapshot.progress},
                {"error", snapshot.error ? nlohmann::json(*snapshot.error) : nlohmann::json(nullptr)}
        });
    }

    return {
            {"slug", slug},
            {"submissionId", submissionId},
            {"submitter", submitter.toJson()},
            {"createdAt", formatTimestamp(createdAt)},
            {"status", submissionStatusToString(getStatus())},
            {"progress", getProgress()},
            {"jobs", jobs}
    };
}
