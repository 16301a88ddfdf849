//
// Created by lewis on 4/12/24.
//

#include "../NdjsonLineBuffer.h"
#include <boost/test/unit_test.hpp>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(NdjsonLineBuffer_test_suite)
    BOOST_AUTO_TEST_CASE(test_lines_in_single_chunk) {
        NdjsonLineBuffer buffer;
        std::vector<std::string> lines;
        auto onLine = [&lines](const std::string& line) { lines.push_back(line); };

        buffer.push("{\"a\":1}\n{\"b\":2}\n", onLine);

        BOOST_CHECK_EQUAL(lines.size(), 2);
        BOOST_CHECK_EQUAL(lines[0], "{\"a\":1}");
        BOOST_CHECK_EQUAL(lines[1], "{\"b\":2}");
        BOOST_CHECK_EQUAL(buffer.hasPending(), false);
    }

    BOOST_AUTO_TEST_CASE(test_line_split_across_chunks) {
        NdjsonLineBuffer buffer;
        std::vector<std::string> lines;
        auto onLine = [&lines](const std::string& line) { lines.push_back(line); };

        buffer.push("{\"resourceType\":", onLine);
        BOOST_CHECK_EQUAL(lines.size(), 0);
        BOOST_CHECK_EQUAL(buffer.hasPending(), true);

        buffer.push("\"Patient\",", onLine);
        buffer.push("\"id\":\"1\"}\n{\"resou", onLine);
        BOOST_CHECK_EQUAL(lines.size(), 1);
        BOOST_CHECK_EQUAL(lines[0], R"({"resourceType":"Patient","id":"1"})");

        buffer.push("rceType\":\"Patient\",\"id\":\"2\"}", onLine);
        BOOST_CHECK_EQUAL(lines.size(), 1);

        // The last line has no trailing newline
        buffer.flush(onLine);
        BOOST_CHECK_EQUAL(lines.size(), 2);
        BOOST_CHECK_EQUAL(lines[1], R"({"resourceType":"Patient","id":"2"})");
        BOOST_CHECK_EQUAL(buffer.hasPending(), false);
    }

    BOOST_AUTO_TEST_CASE(test_byte_at_a_time) {
        NdjsonLineBuffer buffer;
        std::vector<std::string> lines;
        auto onLine = [&lines](const std::string& line) { lines.push_back(line); };

        std::string body = "one\ntwo\nthree\n";
        for (auto character : body) {
            buffer.push(std::string_view(&character, 1), onLine);
        }
        buffer.flush(onLine);

        BOOST_CHECK_EQUAL(lines.size(), 3);
        BOOST_CHECK_EQUAL(lines[0], "one");
        BOOST_CHECK_EQUAL(lines[1], "two");
        BOOST_CHECK_EQUAL(lines[2], "three");
    }

    BOOST_AUTO_TEST_CASE(test_crlf_and_blank_lines) {
        NdjsonLineBuffer buffer;
        std::vector<std::string> lines;
        auto onLine = [&lines](const std::string& line) { lines.push_back(line); };

        buffer.push("first\r\n\r\n   \n\nsecond\r", onLine);
        buffer.push("\n\t\n", onLine);
        buffer.flush(onLine);

        // Blank lines are passed on, so callers can keep counting physical lines
        const std::vector<std::string> expected = {"first", "", "   ", "", "second", "\t"};
        BOOST_CHECK_EQUAL_COLLECTIONS(lines.begin(), lines.end(), expected.begin(), expected.end());
    }

    BOOST_AUTO_TEST_CASE(test_flush_blank_trailing_line) {
        NdjsonLineBuffer buffer;
        std::vector<std::string> lines;
        auto onLine = [&lines](const std::string& line) { lines.push_back(line); };

        buffer.push("line\n  ", onLine);
        BOOST_CHECK_EQUAL(buffer.hasPending(), true);

        buffer.flush(onLine);
        BOOST_REQUIRE_EQUAL(lines.size(), 2);
        BOOST_CHECK_EQUAL(lines[1], "  ");
        BOOST_CHECK_EQUAL(buffer.hasPending(), false);

        // Flushing an empty buffer does nothing
        buffer.flush(onLine);
        BOOST_CHECK_EQUAL(lines.size(), 2);
    }

    BOOST_AUTO_TEST_CASE(test_is_blank) {
        BOOST_CHECK_EQUAL(NdjsonLineBuffer::isBlank(""), true);
        BOOST_CHECK_EQUAL(NdjsonLineBuffer::isBlank(" \t "), true);
        BOOST_CHECK_EQUAL(NdjsonLineBuffer::isBlank(" {} "), false);
    }
BOOST_AUTO_TEST_SUITE_END()
