//
// Created by lewis on 2/26/20.
//

#ifndef BULK_SUBMIT_SERVER_HTTPSERVER_H
#define BULK_SUBMIT_SERVER_HTTPSERVER_H

#include "../Interfaces/IHttpServer.h"
#include "../Interfaces/ISubmissionRegistry.h"
#include "../Lib/GeneralUtils.h"
#include <filesystem>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <server_http.hpp>
#include <thread>
#include <utility>

class HttpServer : public IHttpServer {
public:
    HttpServer(const std::shared_ptr<ISubmissionRegistry>& registry, const std::filesystem::path& jobsDirectory);

    void start() override;

    void join() override;

    void stop() override;

    auto getServer() -> HttpServerImpl & override { return this->server; }

private:
    HttpServerImpl server;
    std::thread server_thread;
};

void BulkSubmitApi(const std::string &path, HttpServer *server, const std::shared_ptr<ISubmissionRegistry>& registry);
void BulkStatusApi(const std::string &path, HttpServer *server, const std::shared_ptr<ISubmissionRegistry>& registry);
void JobFilesApi(const std::string &path, HttpServer *server, const std::filesystem::path& jobsDirectory);

#endif //BULK_SUBMIT_SERVER_HTTPSERVER_H
