#ifndef BULK_SUBMIT_SERVER_TEST_UTILS_H
#define BULK_SUBMIT_SERVER_TEST_UTILS_H

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <client_http.hpp>
#include <server_http.hpp>

auto randomInt(uint64_t start, uint64_t end) -> uint64_t;
auto readFile(const std::filesystem::path& path) -> std::string;
auto readLines(const std::filesystem::path& path) -> std::vector<std::string>;

// Polls condition every few milliseconds. Returns false if it's still false after timeout
auto waitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> bool;

/**
 * RAII class for a temporary directory that is removed with everything in it
 * Uses portable std::filesystem for temporary directory and random names
 */
class TemporaryDirectory
{
public:
    TemporaryDirectory() : directory(generateTempPath())
    {
        std::filesystem::create_directories(directory);
    }

    ~TemporaryDirectory()
    {
        // Clean up the directory
        std::error_code ec;
        std::filesystem::remove_all(directory, ec);
        // Ignore errors during cleanup (directory might already be deleted)
    }

    // Delete copy constructor and assignment operator
    TemporaryDirectory(const TemporaryDirectory&)            = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&&)                 = delete;
    TemporaryDirectory& operator=(TemporaryDirectory&&)      = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path&
    {
        return directory;
    }

private:
    std::filesystem::path directory;

    static auto generateTempPath() -> std::filesystem::path
    {
        // Get system temp directory
        auto tempDir = std::filesystem::temp_directory_path();

        // Generate random directory name
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<uint64_t> dis(0, std::numeric_limits<uint64_t>::max());

        std::stringstream ss;
        ss << "bulk_submit_test_" << std::hex << std::setfill('0') << std::setw(16) << dis(gen);

        return tempDir / ss.str();
    }
};

using TestHttpServer = SimpleWeb::Server<SimpleWeb::HTTP>;
using TestHttpClient = SimpleWeb::Client<SimpleWeb::HTTP>;

#endif  // BULK_SUBMIT_SERVER_TEST_UTILS_H
