//
// Created by lewis on 4/12/24.
//

#include "../UrlUtils.h"
#include <boost/test/unit_test.hpp>
#include <stdexcept>

BOOST_AUTO_TEST_SUITE(UrlUtils_test_suite)
    BOOST_AUTO_TEST_CASE(test_resolve_rfc3986_examples) {
        // Normal examples from RFC 3986 section 5.4.1
        const std::string base = "http://a/b/c/d;p?q";

        BOOST_CHECK_EQUAL(resolveUrl(base, "g"), "http://a/b/c/g");
        BOOST_CHECK_EQUAL(resolveUrl(base, "./g"), "http://a/b/c/g");
        BOOST_CHECK_EQUAL(resolveUrl(base, "g/"), "http://a/b/c/g/");
        BOOST_CHECK_EQUAL(resolveUrl(base, "/g"), "http://a/g");
        BOOST_CHECK_EQUAL(resolveUrl(base, "//g"), "http://g");
        BOOST_CHECK_EQUAL(resolveUrl(base, "?y"), "http://a/b/c/d;p?y");
        BOOST_CHECK_EQUAL(resolveUrl(base, "g?y"), "http://a/b/c/g?y");
        BOOST_CHECK_EQUAL(resolveUrl(base, "#s"), "http://a/b/c/d;p?q#s");
        BOOST_CHECK_EQUAL(resolveUrl(base, "g#s"), "http://a/b/c/g#s");
        BOOST_CHECK_EQUAL(resolveUrl(base, ""), "http://a/b/c/d;p?q");
        BOOST_CHECK_EQUAL(resolveUrl(base, "."), "http://a/b/c/");
        BOOST_CHECK_EQUAL(resolveUrl(base, ".."), "http://a/b/");
        BOOST_CHECK_EQUAL(resolveUrl(base, "../g"), "http://a/b/g");
        BOOST_CHECK_EQUAL(resolveUrl(base, "../.."), "http://a/");
        BOOST_CHECK_EQUAL(resolveUrl(base, "../../g"), "http://a/g");

        // Abnormal examples
        BOOST_CHECK_EQUAL(resolveUrl(base, "../../../g"), "http://a/g");
        BOOST_CHECK_EQUAL(resolveUrl(base, "/./g"), "http://a/g");
        BOOST_CHECK_EQUAL(resolveUrl(base, "g."), "http://a/b/c/g.");
    }

    BOOST_AUTO_TEST_CASE(test_resolve_absolute_reference) {
        BOOST_CHECK_EQUAL(
                resolveUrl("http://localhost:8080/fhir/manifest.json", "https://files.example.org/Patient.ndjson"),
                "https://files.example.org/Patient.ndjson"
        );
    }

    BOOST_AUTO_TEST_CASE(test_resolve_relative_file_urls) {
        const std::string manifest = "http://localhost:8080/exports/123/manifest.json";

        BOOST_CHECK_EQUAL(resolveUrl(manifest, "Patient.ndjson"), "http://localhost:8080/exports/123/Patient.ndjson");
        BOOST_CHECK_EQUAL(resolveUrl(manifest, "../456/Patient.ndjson"), "http://localhost:8080/exports/456/Patient.ndjson");
        BOOST_CHECK_EQUAL(resolveUrl(manifest, "/files/Patient.ndjson"), "http://localhost:8080/files/Patient.ndjson");
    }

    BOOST_AUTO_TEST_CASE(test_resolve_invalid_base) {
        BOOST_CHECK_THROW(resolveUrl("not a url", "Patient.ndjson"), std::invalid_argument);
    }

    BOOST_AUTO_TEST_CASE(test_url_basename) {
        BOOST_CHECK_EQUAL(urlBasename("http://localhost/files/Patient.ndjson"), "Patient.ndjson");
        BOOST_CHECK_EQUAL(urlBasename("http://localhost/files/Patient.ndjson?_format=ndjson#top"), "Patient.ndjson");
        BOOST_CHECK_EQUAL(urlBasename("http://localhost/files/"), "");
        BOOST_CHECK_EQUAL(urlBasename("http://localhost"), "");
        BOOST_CHECK_EQUAL(urlBasename("Observation.ndjson"), "Observation.ndjson");
    }

    BOOST_AUTO_TEST_CASE(test_parse_http_url) {
        auto url = parseHttpUrl("http://localhost:23458/fhir/manifest.json?a=b");
        BOOST_CHECK_EQUAL(url.scheme, "http");
        BOOST_CHECK_EQUAL(url.hostPort, "localhost:23458");
        BOOST_CHECK_EQUAL(url.pathAndQuery, "/fhir/manifest.json?a=b");
        BOOST_CHECK_EQUAL(url.isHttps(), false);

        url = parseHttpUrl("HTTPS://example.org");
        BOOST_CHECK_EQUAL(url.scheme, "https");
        BOOST_CHECK_EQUAL(url.hostPort, "example.org");
        BOOST_CHECK_EQUAL(url.pathAndQuery, "/");
        BOOST_CHECK_EQUAL(url.isHttps(), true);

        BOOST_CHECK_THROW(parseHttpUrl("ftp://example.org/file"), std::invalid_argument);
    }

    BOOST_AUTO_TEST_CASE(test_remove_dot_segments) {
        BOOST_CHECK_EQUAL(removeDotSegments("/a/b/c/./../../g"), "/a/g");
        BOOST_CHECK_EQUAL(removeDotSegments("mid/content=5/../6"), "mid/6");
        BOOST_CHECK_EQUAL(removeDotSegments("/../a"), "/a");
    }
BOOST_AUTO_TEST_SUITE_END()
