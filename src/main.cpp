#include "Application.h"

auto main() -> int
{
    auto application = createApplication();

    // Starts the sweep thread and the http server, and blocks until the http server exits
    application->run();

    return 0;
}
