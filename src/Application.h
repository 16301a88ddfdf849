//
// Created by lewis on 4/16/24.
//

#ifndef BULK_SUBMIT_SERVER_APPLICATION_H
#define BULK_SUBMIT_SERVER_APPLICATION_H

#include "Bulk/SubmissionRegistry.h"
#include "HTTP/HttpServer.h"
#include "Interfaces/IApplication.h"
#include "Lib/GeneralUtils.h"
#include <atomic>
#include <memory>
#include <thread>

// Owns the submission registry, the http server and the sweep thread
class Application : public IApplication {
public:
    Application();
    ~Application() override;

    // IApplication interface implementation
    auto getSubmissionRegistry() -> std::shared_ptr<ISubmissionRegistry> override { return submissionRegistry; }
    auto getHttpServer() -> std::shared_ptr<IHttpServer> override { return httpServer; }

    // Starts the http server and the sweep thread without blocking
    void initialize() override;

    void shutdown() override;
    [[nodiscard]] auto isRunning() const -> bool override { return bRunning; }

    // Initializes, then blocks until the http server exits
    void run() override;

private:
    void runSweeper();

    std::shared_ptr<SubmissionRegistry> submissionRegistry;
    std::shared_ptr<HttpServer> httpServer;
    std::atomic<bool> bRunning = false;

    InterruptableTimer sweepTimer;
    std::jthread sweepThread;
};

// Factory function to create application instance
auto createApplication() -> std::shared_ptr<IApplication>;

#endif //BULK_SUBMIT_SERVER_APPLICATION_H
