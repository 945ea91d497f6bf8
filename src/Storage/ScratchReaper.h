//
// Background sweeper that bounds scratch space growth
//

#ifndef DOCCONV_SERVER_SCRATCHREAPER_H
#define DOCCONV_SERVER_SCRATCHREAPER_H

#include "../Lib/GeneralUtils.h"
#include "ArtifactRegistry.h"
#include "ChunkStore.h"
#include "ScratchSpace.h"
#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>

struct sReaperPolicy {
    std::chrono::seconds artifactExpiry;
    std::chrono::seconds sessionExpiry;
    std::chrono::seconds rasterRetention;
    std::chrono::seconds interval;
};

struct sSweepResult {
    std::size_t artifacts = 0;
    std::size_t rasterOutputs = 0;
    std::size_t sessions = 0;
    std::size_t registryEntries = 0;
};

class ScratchReaper {
public:
    ScratchReaper(std::shared_ptr<ScratchSpace> scratch,
                  std::shared_ptr<ChunkStore> chunkStore,
                  std::shared_ptr<ArtifactRegistry> registry,
                  sReaperPolicy policy);

    ~ScratchReaper();

    ScratchReaper(ScratchReaper const&) = delete;
    auto operator=(ScratchReaper const&) -> ScratchReaper& = delete;
    ScratchReaper(ScratchReaper&&) = delete;
    auto operator=(ScratchReaper&&) -> ScratchReaper& = delete;

    void start();
    void stop();

    // Runs one pass over the scratch namespace as if the current time were now
    auto sweep(std::chrono::system_clock::time_point now) -> sSweepResult;

private:
    void run();

    auto sweepArtifacts(std::chrono::system_clock::time_point now) -> std::size_t;
    auto sweepRasterOutputs(std::chrono::system_clock::time_point now) -> std::size_t;
    auto sweepSessions(std::chrono::system_clock::time_point now) -> std::size_t;

    std::shared_ptr<ScratchSpace> scratch;
    std::shared_ptr<ChunkStore> chunkStore;
    std::shared_ptr<ArtifactRegistry> registry;
    sReaperPolicy policy;

    InterruptableTimer timer;
    std::thread reaperThread;
};

#endif //DOCCONV_SERVER_SCRATCHREAPER_H
