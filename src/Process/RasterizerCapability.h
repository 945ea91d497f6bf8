//
// Cached availability of the external page rasterizer
//

#ifndef DOCCONV_SERVER_RASTERIZERCAPABILITY_H
#define DOCCONV_SERVER_RASTERIZERCAPABILITY_H

#include "../Interfaces/IProcessInvoker.h"
#include "../Lib/TestingMacros.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

class RasterizerCapability {
public:
    RasterizerCapability(std::shared_ptr<IProcessInvoker> invoker, std::string executable);

    // Checks the rasterizer if it has not been found yet. A confirmed availability is never checked again
    // until markUnavailable() is called.
    auto isAvailable() -> bool;

    // Throws eUnavailableError naming the missing dependency if the rasterizer can't be used
    void ensureAvailable();

    // Called when a run of the rasterizer failed to start, so the next request checks again
    void markUnavailable();

    [[nodiscard]] auto getExecutable() const -> const std::string& { return executable; }

    [[nodiscard]] auto getInvoker() const -> const std::shared_ptr<IProcessInvoker>& { return invoker; }

private:
    std::shared_ptr<IProcessInvoker> invoker;
    std::string executable;
    std::atomic<bool> available{false};

    // Only one check runs at a time, concurrent callers wait for its answer
    std::mutex checkMutex;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(available);
};

#endif //DOCCONV_SERVER_RASTERIZERCAPABILITY_H
