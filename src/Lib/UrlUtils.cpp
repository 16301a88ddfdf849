//
// Created by lewis on 4/3/24.
//

#include "UrlUtils.h"
#include <algorithm>
#include <cctype>
#include <folly/Uri.h>
#include <stdexcept>

namespace {
    auto hasScheme(const std::string& reference) -> bool {
        auto colon = reference.find(':');
        if (colon == std::string::npos || colon == 0 || std::isalpha(static_cast<unsigned char>(reference[0])) == 0) {
            return false;
        }

        return std::all_of(reference.begin(), reference.begin() + static_cast<std::ptrdiff_t>(colon), [](unsigned char character) {
            return std::isalnum(character) != 0 || character == '+' || character == '-' || character == '.';
        });
    }

    auto stripFragment(const std::string& url) -> std::string {
        return url.substr(0, url.find('#'));
    }
}

auto removeDotSegments(const std::string& path) -> std::string {
    std::string input = path;
    std::string output;

    auto removeLastSegment = [&output]() {
        auto lastSlash = output.rfind('/');
        output.erase(lastSlash == std::string::npos ? 0 : lastSlash);
    };

    while (!input.empty()) {
        if (input.starts_with("../")) {
            input.erase(0, 3);
        } else if (input.starts_with("./")) {
            input.erase(0, 2);
        } else if (input.starts_with("/./")) {
            input.replace(0, 3, "/");
        } else if (input == "/.") {
            input = "/";
        } else if (input.starts_with("/../")) {
            input.replace(0, 4, "/");
            removeLastSegment();
        } else if (input == "/..") {
            input = "/";
            removeLastSegment();
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            // Move the first segment, including its leading "/", to the output
            auto nextSlash = input.find('/', input[0] == '/' ? 1 : 0);
            output += input.substr(0, nextSlash);
            input.erase(0, nextSlash);
        }
    }

    return output;
}

auto resolveUrl(const std::string& base, const std::string& reference) -> std::string {
    if (hasScheme(reference)) {
        return reference;
    }

    // Throws std::invalid_argument if the base url is malformed
    folly::Uri baseUri(base);

    if (reference.empty()) {
        return stripFragment(base);
    }

    if (reference.starts_with("//")) {
        return baseUri.scheme() + ":" + reference;
    }

    // Split the reference into its path, query and fragment
    std::string referencePath = reference;
    std::string fragment;
    auto hash = referencePath.find('#');
    if (hash != std::string::npos) {
        fragment = referencePath.substr(hash);
        referencePath.erase(hash);
    }

    std::string query;
    auto question = referencePath.find('?');
    if (question != std::string::npos) {
        query = referencePath.substr(question);
        referencePath.erase(question);
    }

    std::string basePath = baseUri.path();
    std::string targetPath;

    if (referencePath.empty()) {
        targetPath = basePath;
        if (query.empty() && !baseUri.query().empty()) {
            query = "?" + baseUri.query();
        }
    } else if (referencePath[0] == '/') {
        targetPath = removeDotSegments(referencePath);
    } else {
        // Merge with everything up to and including the last "/" of the base path
        std::string merged;
        if (!baseUri.authority().empty() && basePath.empty()) {
            merged = "/" + referencePath;
        } else {
            auto lastSlash = basePath.rfind('/');
            merged = (lastSlash == std::string::npos ? "" : basePath.substr(0, lastSlash + 1)) + referencePath;
        }
        targetPath = removeDotSegments(merged);
    }

    return baseUri.scheme() + "://" + baseUri.authority() + targetPath + query + fragment;
}

auto urlBasename(const std::string& url) -> std::string {
    auto path = url.substr(0, url.find_first_of("?#"));

    // Skip over the scheme and authority so a bare host isn't mistaken for a file name
    auto authorityStart = path.find("://");
    if (authorityStart != std::string::npos) {
        auto pathStart = path.find('/', authorityStart + 3);
        path = pathStart == std::string::npos ? "" : path.substr(pathStart);
    }

    auto lastSlash = path.rfind('/');
    return lastSlash == std::string::npos ? path : path.substr(lastSlash + 1);
}

auto parseHttpUrl(const std::string& url) -> sHttpUrl {
    folly::Uri uri(url);

    std::string scheme = uri.scheme();
    std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });

    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument("Unsupported url scheme: " + url);
    }

    if (uri.host().empty()) {
        throw std::invalid_argument("Url has no host: " + url);
    }

    sHttpUrl result;
    result.scheme = scheme;
    result.hostPort = uri.host();
    if (uri.port() != 0) {
        result.hostPort += ":" + std::to_string(uri.port());
    }

    result.pathAndQuery = uri.path().empty() ? "/" : uri.path();
    if (!uri.query().empty()) {
        result.pathAndQuery += "?" + uri.query();
    }

    return result;
}
