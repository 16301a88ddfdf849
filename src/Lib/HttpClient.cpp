//
// Created by lewis on 4/4/24.
//

#include "HttpClient.h"
#include "../Settings.h"
#include "UrlUtils.h"
#include <client_https.hpp>
#include <exception>
#include <memory>
#include <stdexcept>
#include <stop_token>

namespace {
    // Keep enough of an error body to be useful in an error record
    const std::size_t MAX_ERROR_BODY_SIZE = 1024;

    template<class ClientT>
    auto performGet(
            ClientT& client,
            const sHttpUrl& url,
            const SimpleWeb::CaseInsensitiveMultimap& header,
            const HttpChunkHandler& onChunk,
            const std::stop_token& stopToken,
            const HttpResponseFilter& acceptBody
    ) -> sHttpResponseInfo {
        const auto target = url.hostPort + url.pathAndQuery;
        if (stopToken.stop_requested()) {
            throw std::runtime_error("Request to " + target + " was cancelled");
        }

        // The request runs on this thread. Stopping the client only closes its connections, so the response handler
        // always gets called and run() always returns
        auto ioContext = std::make_shared<SimpleWeb::io_context>();
        client.io_service = ioContext;
        client.config.timeout_connect = FILE_CONNECT_TIMEOUT_SECONDS;
        client.config.timeout = FILE_REQUEST_TIMEOUT_SECONDS;

        // The handler is called every time this much of the body has arrived
        client.config.max_response_streambuf_size = NDJSON_READ_CHUNK_SIZE;

        sHttpResponseInfo result;
        bool bHaveHeader = false;
        bool bSkipBody = false;
        bool bClosed = false;
        SimpleWeb::error_code requestError;
        std::exception_ptr handlerError;

        client.request(
                "GET",
                url.pathAndQuery,
                "",
                header,
                [&](const std::shared_ptr<typename ClientT::Response>& response, const SimpleWeb::error_code& errorCode) {
                    if (errorCode) {
                        requestError = errorCode;
                        return;
                    }

                    if (bClosed) {
                        return;
                    }

                    try {
                        if (!bHaveHeader) {
                            bHaveHeader = true;
                            result.statusLine = response->status_code;
                            result.statusCode = static_cast<uint32_t>(std::stoul(response->status_code));
                            result.header = response->header;

                            bSkipBody = result.isSuccess() && acceptBody && !acceptBody(result);
                        }

                        auto chunk = response->content.string();

                        if (!result.isSuccess()) {
                            result.errorBody += chunk.substr(0, MAX_ERROR_BODY_SIZE - result.errorBody.size());
                        } else if (!bSkipBody && !stopToken.stop_requested()) {
                            onChunk(chunk.data(), chunk.size());
                        }

                        // Nothing more is needed from this response
                        bool bDone = bSkipBody || stopToken.stop_requested()
                                     || result.errorBody.size() >= MAX_ERROR_BODY_SIZE;
                        if (bDone && !response->content.end) {
                            bClosed = true;
                            response->close();
                        }
                    } catch (...) {
                        // Rethrown once the request has finished
                        handlerError = std::current_exception();
                        bClosed = true;
                        response->close();
                    }
                }
        );

        {
            // Closing the client's connections ends a request that is in flight
            std::stop_callback cancelRequest(stopToken, [&client]() { client.stop(); });
            ioContext->run();
        }

        if (handlerError) {
            std::rethrow_exception(handlerError);
        }

        if (stopToken.stop_requested()) {
            throw std::runtime_error("Request to " + target + " was cancelled");
        }

        if (requestError && !bClosed) {
            throw SimpleWeb::system_error(requestError);
        }

        if (!bHaveHeader) {
            throw std::runtime_error("Request to " + target + " ended without a response");
        }

        return result;
    }
}

auto sHttpResponseInfo::contentType() const -> std::string {
    auto contentType = header.find("Content-Type");
    return contentType == header.end() ? std::string{} : contentType->second;
}

auto httpGet(
        const std::string& url,
        const SimpleWeb::CaseInsensitiveMultimap& header,
        const HttpChunkHandler& onChunk,
        const std::stop_token& stopToken,
        const HttpResponseFilter& acceptBody
) -> sHttpResponseInfo {
    auto target = parseHttpUrl(url);

    if (target.isHttps()) {
        SimpleWeb::Client<SimpleWeb::HTTPS> client(target.hostPort, VERIFY_TLS_CERTIFICATES);
        return performGet(client, target, header, onChunk, stopToken, acceptBody);
    }

    SimpleWeb::Client<SimpleWeb::HTTP> client(target.hostPort);
    return performGet(client, target, header, onChunk, stopToken, acceptBody);
}

auto httpGetString(
        const std::string& url,
        const SimpleWeb::CaseInsensitiveMultimap& header,
        std::string& body,
        const std::stop_token& stopToken
) -> sHttpResponseInfo {
    body.clear();
    return httpGet(
            url,
            header,
            [&body](const char* data, std::size_t size) { body.append(data, size); },
            stopToken
    );
}
