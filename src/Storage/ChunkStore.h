//
// Durable per-session storage for uploaded chunks
//

#ifndef DOCCONV_SERVER_CHUNKSTORE_H
#define DOCCONV_SERVER_CHUNKSTORE_H

#include "../Lib/TestingMacros.h"
#include "ScratchSpace.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

enum class eUploadState {
    pending,
    assembling,
    assembled,
    purged
};

auto uploadStateName(eUploadState state) -> std::string;

struct sUploadSession {
    explicit sUploadSession(std::string uploadId) : uploadId(std::move(uploadId)) {}

    const std::string uploadId;

    // Guards every field below. State transitions happen only while this is held.
    mutable std::mutex mutex;
    std::condition_variable writesDrainedCV;
    eUploadState state = eUploadState::pending;
    uint32_t inflightWrites = 0;
    std::chrono::system_clock::time_point lastActivity = std::chrono::system_clock::now();
};

class ChunkStore {
public:
    explicit ChunkStore(std::shared_ptr<ScratchSpace> scratch);

    // Stores one chunk. A repeated write for the same index replaces the earlier chunk.
    void putChunk(const std::string& uploadId, const std::string& index, std::string_view bytes);

    // Lists the stored chunk files of a session, sorted by chunk index
    [[nodiscard]] auto listChunks(const std::string& uploadId) const -> std::vector<std::filesystem::path>;

    // Returns the session for uploadId, creating a pending one if none is known
    auto getSession(const std::string& uploadId) -> std::shared_ptr<sUploadSession>;

    // Returns the session for uploadId or nullptr
    auto findSession(const std::string& uploadId) const -> std::shared_ptr<sUploadSession>;

    void dropSession(const std::string& uploadId);

    [[nodiscard]] auto sessionIds() const -> std::vector<std::string>;

    [[nodiscard]] auto getScratch() const -> const std::shared_ptr<ScratchSpace>& { return scratch; }

private:
    std::shared_ptr<ScratchSpace> scratch;
    folly::ConcurrentHashMap<std::string, std::shared_ptr<sUploadSession>> sessions;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(sessions);
};

#endif //DOCCONV_SERVER_CHUNKSTORE_H
