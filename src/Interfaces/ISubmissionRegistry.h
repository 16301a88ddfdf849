//
// Interface for the submission registry
// The HTTP layer only talks to the registry through this interface
//

#ifndef BULK_SUBMIT_SERVER_I_SUBMISSION_REGISTRY_H
#define BULK_SUBMIT_SERVER_I_SUBMISSION_REGISTRY_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Forward declarations to avoid circular dependencies
class SubmissionState;
struct sSubmitter;

// Interface for submission lookup and retention
class ISubmissionRegistry {
public:
    virtual ~ISubmissionRegistry() = default;

    // Submission lookup
    virtual auto findOrCreate(const std::string& submissionId, const sSubmitter& submitter) -> std::shared_ptr<SubmissionState> = 0;
    virtual auto find(const std::string& slug) -> std::shared_ptr<SubmissionState> = 0;
    virtual auto find(const std::string& submissionId, const sSubmitter& submitter) -> std::shared_ptr<SubmissionState> = 0;
    virtual auto getAll() -> std::vector<std::shared_ptr<SubmissionState>> = 0;

    // Submission management
    virtual void add(const std::shared_ptr<SubmissionState>& submission) = 0;
    virtual auto remove(const std::string& slug) -> bool = 0;

    // Retention
    virtual auto sweep(std::chrono::system_clock::time_point now) -> uint64_t = 0;
};

#endif //BULK_SUBMIT_SERVER_I_SUBMISSION_REGISTRY_H
