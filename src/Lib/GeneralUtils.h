//
// Created by lewis on 2/10/20.
//

#ifndef BULK_SUBMIT_SERVER_GENERALUTILS_H
#define BULK_SUBMIT_SERVER_GENERALUTILS_H

#include "TestingMacros.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

auto base64Encode(std::string input) -> std::string;

// Throws if the input contains characters outside the base64 alphabet
auto base64Decode(std::string input) -> std::string;

auto generateUUID() -> std::string;
auto sha256Hex(const std::string& input) -> std::string;
auto roundToPrecision(double value, uint32_t precision) -> double;
auto formatTimestamp(std::chrono::system_clock::time_point timePoint) -> std::string;
void dumpExceptions(std::exception& exception);
auto acceptingConnections(uint16_t port) -> bool;

struct InterruptableTimer {
    // Returns false if killed
    template<class R, class P>
    auto wait_for( std::chrono::duration<R,P> const& time ) const -> bool {
        std::unique_lock<std::mutex> lock(m);
        return !cv.wait_for(lock, time, [&]{ return terminate; });
    }

    void stop() {
        std::unique_lock<std::mutex> const lock(m);
        terminate = true;
        cv.notify_all();
    }

private:
    mutable std::condition_variable cv;
    mutable std::mutex m;
    bool terminate = false;
};

#endif //BULK_SUBMIT_SERVER_GENERALUTILS_H
