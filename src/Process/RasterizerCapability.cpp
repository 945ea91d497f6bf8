//
// Cached availability of the external page rasterizer
//

#include "RasterizerCapability.h"
#include "../Lib/Errors.h"
#include "../Settings.h"
#include <iostream>

RasterizerCapability::RasterizerCapability(std::shared_ptr<IProcessInvoker> invoker, std::string executable)
        : invoker(std::move(invoker)), executable(std::move(executable)) {}

auto RasterizerCapability::isAvailable() -> bool {
    if (available) {
        return true;
    }

    std::unique_lock<std::mutex> lock(checkMutex);

    // Another request may have finished a check while we waited
    if (available) {
        return true;
    }

    available = invoker->canRun(executable, {"-v"}, std::chrono::seconds(RASTERIZER_CHECK_TIMEOUT_SECONDS));

    std::cout << "Rasterizer: " << executable << (available ? " is available" : " is not available") << '\n';

    return available;
}

void RasterizerCapability::ensureAvailable() {
    if (!isAvailable()) {
        throw eUnavailableError("Server requires `pdftoppm` (Poppler). Please install poppler-utils (pdftoppm).");
    }
}

void RasterizerCapability::markUnavailable() {
    available = false;
}
