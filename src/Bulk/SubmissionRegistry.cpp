//
// Created by lewis on 4/10/24.
//

#include "SubmissionRegistry.h"
#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace {
auto hoursToSeconds(double hours) -> std::chrono::seconds {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    return std::chrono::seconds(static_cast<int64_t>(std::llround(hours * 60 * 60)));
}
} // namespace

SubmissionRegistry::SubmissionRegistry() :
    SubmissionRegistry(
            sSubmissionConfig{JOBS_DIRECTORY, BASE_URL},
            sSubmissionLifetimes{
                    hoursToSeconds(PENDING_SUBMISSION_LIFETIME_HOURS),
                    hoursToSeconds(COMPLETED_SUBMISSION_LIFETIME_HOURS)
            }
    ) {
}

SubmissionRegistry::SubmissionRegistry(sSubmissionConfig _config, sSubmissionLifetimes _lifetimes) :
    config(std::move(_config)), lifetimes(_lifetimes) {
}

auto SubmissionRegistry::findOrCreate(
        const std::string& submissionId,
        const sSubmitter& submitter
) -> std::shared_ptr<SubmissionState> {
    if (auto existing = find(submissionId, submitter)) {
        return existing;
    }

    auto submission = std::make_shared<SubmissionState>(submissionId, submitter, config);

    // Another request may have created the same submission in the meantime, emplace keeps the first one
    auto result = submissionMap.emplace(submission->getSlug(), submission);
    if (result.second) {
        std::cout << "Registry: Created submission " << submission->getSlug() << " for " << submissionId << std::endl;
    }

    return result.first->second;
}

auto SubmissionRegistry::find(const std::string& slug) -> std::shared_ptr<SubmissionState> {
    auto iter = submissionMap.find(slug);
    if (iter == submissionMap.end()) {
        return nullptr;
    }

    return iter->second;
}

auto SubmissionRegistry::find(
        const std::string& submissionId,
        const sSubmitter& submitter
) -> std::shared_ptr<SubmissionState> {
    return find(SubmissionState::computeSlug(submissionId, submitter));
}

auto SubmissionRegistry::getAll() -> std::vector<std::shared_ptr<SubmissionState>> {
    std::vector<std::shared_ptr<SubmissionState>> submissions;
    for (const auto& [slug, submission] : submissionMap) {
        submissions.push_back(submission);
    }

    return submissions;
}

void SubmissionRegistry::add(const std::shared_ptr<SubmissionState>& submission) {
    auto result = submissionMap.emplace(submission->getSlug(), submission);
    if (!result.second) {
        throw std::runtime_error("Submission " + submission->getSlug() + " is already registered");
    }
}

auto SubmissionRegistry::remove(const std::string& slug) -> bool {
    return submissionMap.erase(slug) != 0;
}

auto SubmissionRegistry::isExpired(
        const std::shared_ptr<SubmissionState>& submission,
        std::chrono::system_clock::time_point now
) const -> bool {
    auto age = now - submission->getCreatedAt();
    auto lifetime = submission->isTerminal() ? lifetimes.completed : lifetimes.pending;

    return age > lifetime;
}

auto SubmissionRegistry::sweep(std::chrono::system_clock::time_point now) -> uint64_t {
    uint64_t removed = 0;

    for (const auto& submission : getAll()) {
        if (!isExpired(submission, now)) {
            continue;
        }

        // Only the sweep that actually removed the submission cleans it up
        if (!remove(submission->getSlug())) {
            continue;
        }

        std::cout << "Registry: Removing expired submission " << submission->getSlug() << std::endl;

        {
            // Let a request that is already working on the submission finish first
            auto requestLock = submission->lockRequests();
            submission->abort();
        }

        // Give the job threads the chance to stop writing before the directory goes
        for (const auto& job : submission->getJobs()) {
            if (!job->wait(std::chrono::seconds(FILE_CONNECT_TIMEOUT_SECONDS))) {
                std::cerr << "Registry: Job " << job->getJobId() << " is still running" << std::endl;
            }
        }

        std::error_code errorCode;
        std::filesystem::remove_all(submission->getDirectory(), errorCode);
        if (errorCode) {
            std::cerr << "Registry: Unable to delete " << submission->getDirectory()
                      << ": " << errorCode.message() << std::endl;
        }

        removed++;
    }

    return removed;
}
