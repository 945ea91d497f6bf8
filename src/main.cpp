#include "Application.h"

auto main() -> int
{
    auto application = createApplication();

    // Blocks until the http server exits
    application->run();

    return 0;
}
