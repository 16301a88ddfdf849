//
// Application interface
// Provides access to application state without global variables
//

#ifndef BULK_SUBMIT_SERVER_I_APPLICATION_H
#define BULK_SUBMIT_SERVER_I_APPLICATION_H

#include "IHttpServer.h"
#include "ISubmissionRegistry.h"
#include <memory>

class IApplication {
public:
    virtual ~IApplication() = default;

    // Prevent copying and moving
    IApplication(const IApplication&)                    = delete;
    auto operator=(const IApplication&) -> IApplication& = delete;
    IApplication(IApplication&&)                         = delete;
    auto operator=(IApplication&&) -> IApplication&      = delete;

    // Server component access
    virtual auto getSubmissionRegistry() -> std::shared_ptr<ISubmissionRegistry> = 0;
    virtual auto getHttpServer() -> std::shared_ptr<IHttpServer> = 0;

    // Application lifecycle
    virtual void initialize() = 0;
    virtual void shutdown() = 0;
    [[nodiscard]] virtual auto isRunning() const -> bool = 0;
    virtual void run() = 0;

protected:
    // Allow derived classes to construct
    IApplication() = default;
};

#endif //BULK_SUBMIT_SERVER_I_APPLICATION_H
