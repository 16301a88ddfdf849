//
// Created by lewis on 2/26/20.
//

#include "HttpServer.h"
#include "../Settings.h"
#include <memory>

HttpServer::HttpServer(const std::shared_ptr<ISubmissionRegistry>& registry, const std::filesystem::path& jobsDirectory) {
    server.config.port = HTTP_PORT;
    server.config.address = "0.0.0.0";
    server.config.thread_pool_size = HTTP_WORKER_POOL_SIZE;
    server.config.timeout_content = HTTP_CONTENT_TIMEOUT_SECONDS;

    // Add the various API's. The paths are regular expressions, so $ has to be escaped
    BulkSubmitApi("/\\$bulk-submit", this, registry);
    BulkStatusApi("/\\$bulk-submit-status", this, registry);
    JobFilesApi("/jobs/", this, jobsDirectory);
}

void HttpServer::start() {
    server_thread = std::thread([this]() {
        // Start server
        this->server.start();
    });

    std::cout << "API: Server listening on port " << server.config.port << std::endl << std::endl;
}

void HttpServer::join() {
    if (server_thread.joinable()) {
        server_thread.join();
    }
}

void HttpServer::stop() {
    server.stop();
    join();
}
