//
// Background sweeper that bounds scratch space growth
//

#include "ScratchReaper.h"
#include "../Settings.h"
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace {
    auto lastModified(const std::filesystem::path& path) -> std::optional<std::chrono::system_clock::time_point> {
        std::error_code errorCode;
        auto fileTime = std::filesystem::last_write_time(path, errorCode);
        if (errorCode) {
            return std::nullopt;
        }

        return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(fileTime)
        );
    }

    auto isOlderThan(const std::filesystem::path& path,
                     std::chrono::system_clock::time_point now,
                     std::chrono::seconds age) -> bool {
        auto modified = lastModified(path);
        return modified && *modified + age <= now;
    }

    auto listDirectory(const std::filesystem::path& directory) -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> entries;

        std::error_code errorCode;
        if (!std::filesystem::is_directory(directory, errorCode)) {
            return entries;
        }

        for (const auto& entry : std::filesystem::directory_iterator(directory, errorCode)) {
            entries.push_back(entry.path());
        }

        if (errorCode) {
            std::cerr << "Reaper: Unable to list " << directory << ": " << errorCode.message() << '\n';
        }

        return entries;
    }
}

ScratchReaper::ScratchReaper(std::shared_ptr<ScratchSpace> scratch,
                             std::shared_ptr<ChunkStore> chunkStore,
                             std::shared_ptr<ArtifactRegistry> registry,
                             sReaperPolicy policy)
        : scratch(std::move(scratch)), chunkStore(std::move(chunkStore)), registry(std::move(registry)), policy(policy) {}

ScratchReaper::~ScratchReaper() {
    stop();
}

void ScratchReaper::start() {
    reaperThread = std::thread(&ScratchReaper::run, this);
}

void ScratchReaper::stop() {
    timer.stop();
    if (reaperThread.joinable()) {
        reaperThread.join();
    }
}

void ScratchReaper::run() {
    // wait_for returns false once the timer has been stopped
    while (timer.wait_for(policy.interval)) {
        try {
            auto result = sweep(std::chrono::system_clock::now());

            if (result.artifacts + result.rasterOutputs + result.sessions + result.registryEntries > 0) {
                std::cout << "Reaper: Removed " << result.artifacts << " artifacts, "
                          << result.rasterOutputs << " rasterization outputs, "
                          << result.sessions << " upload sessions and "
                          << result.registryEntries << " registry entries" << '\n';
            }
        } catch (std::exception& exception) {
            dumpExceptions(exception);
        }
    }
}

auto ScratchReaper::sweep(std::chrono::system_clock::time_point now) -> sSweepResult {
    sSweepResult result;
    result.registryEntries = registry->expire(now);
    result.artifacts = sweepArtifacts(now);
    result.rasterOutputs = sweepRasterOutputs(now);
    result.sessions = sweepSessions(now);
    return result;
}

auto ScratchReaper::sweepArtifacts(std::chrono::system_clock::time_point now) -> std::size_t {
    std::size_t removed = 0;

    // Registry entries for these have already expired, so nothing can resolve to them any more
    for (const auto& artifact : listDirectory(scratch->assembledRoot())) {
        if (isOlderThan(artifact, now, policy.artifactExpiry)) {
            removeQuietly(artifact);
            removed++;
        }
    }

    return removed;
}

auto ScratchReaper::sweepRasterOutputs(std::chrono::system_clock::time_point now) -> std::size_t {
    std::size_t removed = 0;

    // Work directories are normally removed as soon as their response finishes, this is the upper bound
    for (const auto& entry : listDirectory(scratch->root())) {
        if (entry.filename().string().rfind(RASTER_WORKDIR_PREFIX, 0) == 0
            && isOlderThan(entry, now, policy.rasterRetention)) {
            removeAllQuietly(entry);
            removed++;
        }
    }

    for (const auto& upload : listDirectory(scratch->rasterUploadRoot())) {
        if (isOlderThan(upload, now, policy.rasterRetention)) {
            removeQuietly(upload);
            removed++;
        }
    }

    return removed;
}

auto ScratchReaper::sweepSessions(std::chrono::system_clock::time_point now) -> std::size_t {
    std::size_t removed = 0;

    // Sessions known to this process
    for (const auto& uploadId : chunkStore->sessionIds()) {
        auto session = chunkStore->findSession(uploadId);
        if (!session) {
            continue;
        }

        bool purge = false;
        {
            std::unique_lock<std::mutex> lock(session->mutex);

            auto idle = session->lastActivity + policy.sessionExpiry <= now;
            auto abandoned = session->state == eUploadState::pending && session->inflightWrites == 0;
            auto finished = session->state == eUploadState::purged;

            if (idle && (abandoned || finished)) {
                // Any chunk write that raced with us now sees a closed session
                session->state = eUploadState::purged;
                purge = true;
            }
        }

        if (purge) {
            removeAllQuietly(scratch->chunkDirectory(uploadId));
            chunkStore->dropSession(uploadId);
            removed++;
        }
    }

    // Orphaned session directories left by an earlier process
    for (const auto& directory : listDirectory(scratch->chunkRoot())) {
        auto uploadId = directory.filename().string();
        if (chunkStore->findSession(uploadId)) {
            continue;
        }

        if (isOlderThan(directory, now, policy.sessionExpiry)) {
            removeAllQuietly(directory);
            removed++;
        }
    }

    return removed;
}
