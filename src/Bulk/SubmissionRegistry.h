//
// Created by lewis on 4/10/24.
//

#ifndef BULK_SUBMIT_SERVER_SUBMISSIONREGISTRY_H
#define BULK_SUBMIT_SERVER_SUBMISSIONREGISTRY_H

#include "../Interfaces/ISubmissionRegistry.h"
#include "../Lib/TestingMacros.h"
#include "SubmissionState.h"
#include <chrono>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <memory>
#include <string>
#include <vector>

struct sSubmissionLifetimes {
    // How long an in-progress submission is kept, counted from its creation
    std::chrono::seconds pending;

    // How long a complete or aborted submission is kept, counted from its creation
    std::chrono::seconds completed;
};

class SubmissionRegistry : public ISubmissionRegistry {
public:
    // Reads the jobs directory, base url and lifetimes from the environment
    SubmissionRegistry();
    SubmissionRegistry(sSubmissionConfig config, sSubmissionLifetimes lifetimes);

    // ISubmissionRegistry interface implementation
    auto findOrCreate(const std::string& submissionId, const sSubmitter& submitter) -> std::shared_ptr<SubmissionState> override;
    auto find(const std::string& slug) -> std::shared_ptr<SubmissionState> override;
    auto find(const std::string& submissionId, const sSubmitter& submitter) -> std::shared_ptr<SubmissionState> override;
    auto getAll() -> std::vector<std::shared_ptr<SubmissionState>> override;

    // Throws std::runtime_error if a submission with the same slug is already registered
    void add(const std::shared_ptr<SubmissionState>& submission) override;
    auto remove(const std::string& slug) -> bool override;

    // Removes every submission that has outlived its lifetime, aborting its jobs and deleting its directory.
    // Returns the number of submissions removed
    auto sweep(std::chrono::system_clock::time_point now) -> uint64_t override;

    [[nodiscard]] auto getConfig() const -> const sSubmissionConfig& { return config; }

private:
    [[nodiscard]] auto isExpired(const std::shared_ptr<SubmissionState>& submission, std::chrono::system_clock::time_point now) const -> bool;

    sSubmissionConfig config;
    sSubmissionLifetimes lifetimes;

    folly::ConcurrentHashMap<std::string, std::shared_ptr<SubmissionState>> submissionMap;

// Testing
EXPOSE_PROPERTY_FOR_TESTING(lifetimes);
EXPOSE_PROPERTY_FOR_TESTING_READONLY(submissionMap);
};

#endif //BULK_SUBMIT_SERVER_SUBMISSIONREGISTRY_H
