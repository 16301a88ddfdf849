//
// Created by lewis on 4/16/24.
//

#include "Application.h"
#include "Settings.h"
#include <filesystem>
#include <iostream>

Application::Application() {
    submissionRegistry = std::make_shared<SubmissionRegistry>();
    httpServer = std::make_shared<HttpServer>(submissionRegistry, submissionRegistry->getConfig().jobsDirectory);
}

Application::~Application() {
    sweepTimer.stop();
}

void Application::initialize() {
    std::cout << "Application initializing..." << std::endl;

    std::filesystem::create_directories(submissionRegistry->getConfig().jobsDirectory);

    bRunning = true;

    sweepThread = std::jthread([this]() { runSweeper(); });

    httpServer->start();
}

void Application::shutdown() {
    std::cout << "Application shutting down..." << std::endl;

    bRunning = false;

    sweepTimer.stop();
    httpServer->stop();

    // Stop everything that is still downloading
    for (const auto& submission : submissionRegistry->getAll()) {
        submission->abort();
    }
}

void Application::run() {
    initialize();

    httpServer->join();
}

void Application::runSweeper() {
    // wait_for returns false once the timer is stopped
    while (sweepTimer.wait_for(std::chrono::seconds(SUBMISSION_SWEEP_INTERVAL_SECONDS))) {
        try {
            auto removed = submissionRegistry->sweep(std::chrono::system_clock::now());
            if (removed != 0) {
                std::cout << "Application: Swept " << removed << " expired submissions" << std::endl;
            }
        } catch (std::exception& e) {
            dumpExceptions(e);
        }
    }
}

auto createApplication() -> std::shared_ptr<IApplication> {
    return std::make_shared<Application>();
}
