//
// Created by lewis on 3/6/20.
//

#ifndef BULK_SUBMIT_SERVER_SETTINGS_H
#define BULK_SUBMIT_SERVER_SETTINGS_H

#include <cstdint>
#include <string>

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
inline auto GET_ENV(const std::string &variable, const std::string &_default) -> std::string {
    // NOLINTNEXTLINE(clang-analyzer-cplusplus.StringChecker,concurrency-mt-unsafe)
    return std::getenv(variable.c_str()) != nullptr ? std::string(std::getenv(variable.c_str())) : _default;
}

// The public url of this server, without a trailing slash. Used to build status and record file urls
#define BASE_URL                            GET_ENV("BASE_URL", "http://localhost:8000")

// Root directory under which each submission gets a directory named after its slug
#define JOBS_DIRECTORY                      GET_ENV("JOBS_DIRECTORY", "jobs")

#define PENDING_SUBMISSION_LIFETIME_HOURS   std::stod(GET_ENV("PENDING_SUBMISSION_LIFETIME_HOURS", "48"))
#define COMPLETED_SUBMISSION_LIFETIME_HOURS std::stod(GET_ENV("COMPLETED_SUBMISSION_LIFETIME_HOURS", "48"))

#define FILE_CONNECT_TIMEOUT_SECONDS        std::stoi(GET_ENV("FILE_CONNECT_TIMEOUT_SECONDS", "30"))
#define FILE_REQUEST_TIMEOUT_SECONDS        std::stoi(GET_ENV("FILE_REQUEST_TIMEOUT_SECONDS", std::to_string(60*60)))

#define VERIFY_TLS_CERTIFICATES             (GET_ENV("VERIFY_TLS_CERTIFICATES", "true") == "true")

#ifndef BUILD_TESTS
    const uint32_t SUBMISSION_SWEEP_INTERVAL_SECONDS = 60*10;
#else
    const uint32_t SUBMISSION_SWEEP_INTERVAL_SECONDS = 1;

    #undef FILE_REQUEST_TIMEOUT_SECONDS
    #undef FILE_CONNECT_TIMEOUT_SECONDS
    #define FILE_REQUEST_TIMEOUT_SECONDS 10
    #define FILE_CONNECT_TIMEOUT_SECONDS 5
#endif

// Size of the blocks read from a file response body while splitting it into ndjson lines
const uint64_t NDJSON_READ_CHUNK_SIZE = (1024ULL*64ULL);

const uint16_t HTTP_PORT = 8000;
const uint32_t HTTP_WORKER_POOL_SIZE = 32;
const uint32_t HTTP_CONTENT_TIMEOUT_SECONDS = 60;

#endif //BULK_SUBMIT_SERVER_SETTINGS_H
