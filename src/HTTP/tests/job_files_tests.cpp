//
// Created by lewis on 4/14/24.
//

#include "../../tests/fixtures/HttpClientFixture.h"
#include "../../tests/fixtures/HttpServerFixture.h"
#include "../../tests/utils.h"
#include <boost/test/unit_test.hpp>
#include <fstream>

struct JobFilesTestDataFixture : public HttpServerFixture, public HttpClientFixture {
    JobFilesTestDataFixture() {
        auto directory = jobsDirectory.path() / "abc" / "output";
        std::filesystem::create_directories(directory);

        std::ofstream(directory / "Patient.ndjson") << R"({"resourceType":"Patient","id":"1"})" << "\n";
        std::ofstream(directory / "scan.png", std::ios::binary) << "png-bytes";
    }

    static auto header(const std::shared_ptr<TestHttpClient::Response>& response, const std::string& name) -> std::string {
        auto value = response->header.find(name);
        return value == response->header.end() ? std::string{} : value->second;
    }
};

BOOST_FIXTURE_TEST_SUITE(JobFiles_test_suite, JobFilesTestDataFixture)
    BOOST_AUTO_TEST_CASE(test_serve_ndjson_file) {
        auto response = httpClient.request("GET", "/jobs/abc/output/Patient.ndjson");

        BOOST_CHECK_EQUAL(std::stoi(response->status_code), static_cast<int>(SimpleWeb::StatusCode::success_ok));
        BOOST_CHECK_EQUAL(header(response, "Content-Type"), "application/fhir+ndjson");
        BOOST_CHECK_EQUAL(header(response, "Content-Disposition"), "inline; filename=\"Patient.ndjson\"");
        BOOST_CHECK_EQUAL(response->content.string(), "{\"resourceType\":\"Patient\",\"id\":\"1\"}\n");
    }

    BOOST_AUTO_TEST_CASE(test_serve_other_file) {
        auto response = httpClient.request("GET", "/jobs/abc/output/scan.png");

        BOOST_CHECK_EQUAL(std::stoi(response->status_code), static_cast<int>(SimpleWeb::StatusCode::success_ok));
        BOOST_CHECK_EQUAL(header(response, "Content-Type"), "application/octet-stream");
        BOOST_CHECK_EQUAL(response->content.string(), "png-bytes");
    }

    BOOST_AUTO_TEST_CASE(test_missing_file) {
        auto response = httpClient.request("GET", "/jobs/abc/output/Missing.ndjson");
        jsonResult = nlohmann::json::parse(response->content.string());

        BOOST_CHECK_EQUAL(std::stoi(response->status_code), static_cast<int>(SimpleWeb::StatusCode::client_error_not_found));
        BOOST_CHECK_EQUAL(jsonResult["issue"][0]["diagnostics"], "File not found");

        // Directories are not served
        response = httpClient.request("GET", "/jobs/abc/output");
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), static_cast<int>(SimpleWeb::StatusCode::client_error_not_found));
    }

    BOOST_AUTO_TEST_CASE(test_path_traversal) {
        auto response = httpClient.request("GET", "/jobs/abc/../../etc/passwd");
        jsonResult = nlohmann::json::parse(response->content.string());

        BOOST_CHECK_EQUAL(std::stoi(response->status_code), static_cast<int>(SimpleWeb::StatusCode::client_error_bad_request));
        BOOST_CHECK_EQUAL(jsonResult["issue"][0]["code"], "invalid");
        BOOST_CHECK_EQUAL(jsonResult["issue"][0]["diagnostics"], "Invalid path");
    }
BOOST_AUTO_TEST_SUITE_END()
