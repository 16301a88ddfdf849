//
// Created by lewis on 4/4/24.
//

#ifndef BULK_SUBMIT_SERVER_HTTPCLIENT_H
#define BULK_SUBMIT_SERVER_HTTPCLIENT_H

#include <client_http.hpp>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>

struct sHttpResponseInfo {
    uint32_t statusCode = 0;

    // eg "404 Not Found"
    std::string statusLine;

    SimpleWeb::CaseInsensitiveMultimap header;

    // The start of the body for unsuccessful responses, for error reporting
    std::string errorBody;

    [[nodiscard]] auto isSuccess() const -> bool { return statusCode >= 200 && statusCode < 300; }

    [[nodiscard]] auto contentType() const -> std::string;
};

using HttpChunkHandler = std::function<void(const char* data, std::size_t size)>;

// Decides whether the body of a 2xx response should be read, given its status and headers
using HttpResponseFilter = std::function<bool(const sHttpResponseInfo&)>;

/*
 * Performs a GET request against an http or https url.
 *
 * For a 2xx response the body is passed to onChunk block by block until it ends, or until stopToken is signalled.
 * If acceptBody is set and returns false the body is skipped. Other responses are returned without calling onChunk.
 * Connection failures and timeouts throw.
 */
auto httpGet(
        const std::string& url,
        const SimpleWeb::CaseInsensitiveMultimap& header,
        const HttpChunkHandler& onChunk,
        const std::stop_token& stopToken = {},
        const HttpResponseFilter& acceptBody = nullptr
) -> sHttpResponseInfo;

// As above, collecting the body of a 2xx response in to body
auto httpGetString(
        const std::string& url,
        const SimpleWeb::CaseInsensitiveMultimap& header,
        std::string& body,
        const std::stop_token& stopToken = {}
) -> sHttpResponseInfo;

#endif //BULK_SUBMIT_SERVER_HTTPCLIENT_H
