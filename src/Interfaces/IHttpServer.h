//
// Interface for HTTP server functionality
// This breaks circular dependencies by providing a pure interface
//

#ifndef BULK_SUBMIT_SERVER_I_HTTP_SERVER_H
#define BULK_SUBMIT_SERVER_I_HTTP_SERVER_H

#include <server_http.hpp>

using HttpServerImpl = SimpleWeb::Server<SimpleWeb::HTTP>;

// Interface for HTTP server operations
class IHttpServer {
public:
    virtual ~IHttpServer() = default;

    // Server lifecycle
    virtual void start() = 0;
    virtual void join() = 0;
    virtual void stop() = 0;

    // Route registration
    virtual auto getServer() -> HttpServerImpl& = 0;
};

#endif //BULK_SUBMIT_SERVER_I_HTTP_SERVER_H
