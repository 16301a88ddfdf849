//
// Created by lewis on 4/12/24.
//

#include "../GeneralUtils.h"
#include <boost/test/unit_test.hpp>
#include <chrono>
#include <set>
#include <thread>

BOOST_AUTO_TEST_SUITE(GeneralUtils_test_suite)
    BOOST_AUTO_TEST_CASE(test_base64_encode_decode) {
        BOOST_CHECK_EQUAL(base64Encode("hello"), "aGVsbG8=");
        BOOST_CHECK_EQUAL(base64Encode("hi"), "aGk=");
        BOOST_CHECK_EQUAL(base64Encode("abc"), "YWJj");

        BOOST_CHECK_EQUAL(base64Decode("aGVsbG8="), "hello");
        BOOST_CHECK_EQUAL(base64Decode("aGk="), "hi");
        BOOST_CHECK_EQUAL(base64Decode("YWJj"), "abc");

        // Missing padding and embedded whitespace are tolerated
        BOOST_CHECK_EQUAL(base64Decode("aGVsbG8"), "hello");
        BOOST_CHECK_EQUAL(base64Decode("aGVs\nbG8="), "hello");
    }

    BOOST_AUTO_TEST_CASE(test_base64_decode_rejects_invalid_input) {
        // Characters outside the alphabet
        BOOST_CHECK_THROW(base64Decode("not base64!"), std::exception);
        BOOST_CHECK_THROW(base64Decode("aGVs*G8="), std::exception);

        // Padding in the middle
        BOOST_CHECK_THROW(base64Decode("aG=sbG8="), std::invalid_argument);

        // Too much padding
        BOOST_CHECK_THROW(base64Decode("aG==="), std::invalid_argument);

        // A single dangling character can't encode a byte
        BOOST_CHECK_THROW(base64Decode("aGVsb"), std::invalid_argument);
    }

    BOOST_AUTO_TEST_CASE(test_generate_uuid) {
        std::set<std::string> uuids;
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        for (auto i = 0; i < 100; i++) {
            auto uuid = generateUUID();
            // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
            BOOST_CHECK_EQUAL(uuid.size(), 36);
            uuids.insert(uuid);
        }

        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        BOOST_CHECK_EQUAL(uuids.size(), 100);
    }

    BOOST_AUTO_TEST_CASE(test_sha256_hex) {
        BOOST_CHECK_EQUAL(sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
        BOOST_CHECK_EQUAL(sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    BOOST_AUTO_TEST_CASE(test_round_to_precision) {
        // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        BOOST_CHECK_CLOSE(roundToPrecision(33.3333, 2), 33.33, 0.0001);
        BOOST_CHECK_CLOSE(roundToPrecision(66.6666, 2), 66.67, 0.0001);
        BOOST_CHECK_CLOSE(roundToPrecision(50.0, 2), 50.0, 0.0001);
        BOOST_CHECK_CLOSE(roundToPrecision(2.5, 0), 3.0, 0.0001);
        // NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    }

    BOOST_AUTO_TEST_CASE(test_format_timestamp) {
        using namespace std::chrono;

        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        auto timePoint = sys_days{year{2024} / 4 / 1} + hours{12} + minutes{30} + seconds{15} + milliseconds{250};
        BOOST_CHECK_EQUAL(formatTimestamp(timePoint), "2024-04-01T12:30:15.250Z");
    }

    BOOST_AUTO_TEST_CASE(test_interruptable_timer) {
        InterruptableTimer timer;

        // Runs out normally
        BOOST_CHECK_EQUAL(timer.wait_for(std::chrono::milliseconds(10)), true);

        // Stopping from another thread wakes the waiter early
        std::thread stopper([&timer]() {
            // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            timer.stop();
        });

        auto start = std::chrono::steady_clock::now();
        BOOST_CHECK_EQUAL(timer.wait_for(std::chrono::seconds(10)), false);
        BOOST_CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));

        stopper.join();
    }
BOOST_AUTO_TEST_SUITE_END()
