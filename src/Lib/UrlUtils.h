//
// Created by lewis on 4/3/24.
//

#ifndef BULK_SUBMIT_SERVER_URLUTILS_H
#define BULK_SUBMIT_SERVER_URLUTILS_H

#include <string>

struct sHttpUrl {
    // "http" or "https"
    std::string scheme;

    // "host" or "host:port", as accepted by the SimpleWeb client
    std::string hostPort;

    // The request target, always starting with "/"
    std::string pathAndQuery;

    [[nodiscard]] auto isHttps() const -> bool { return scheme == "https"; }
};

// Resolves reference against base (RFC 3986, section 5.2). Throws std::invalid_argument if base isn't a valid url
auto resolveUrl(const std::string& base, const std::string& reference) -> std::string;

// Last path segment of the url, without query or fragment. Empty if the path ends with "/"
auto urlBasename(const std::string& url) -> std::string;

// Throws std::invalid_argument if the url isn't an absolute http or https url
auto parseHttpUrl(const std::string& url) -> sHttpUrl;

auto removeDotSegments(const std::string& path) -> std::string;

#endif //BULK_SUBMIT_SERVER_URLUTILS_H
