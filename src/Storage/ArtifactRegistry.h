//
// In-memory mapping from registry keys to assembled artifacts
//

#ifndef DOCCONV_SERVER_ARTIFACTREGISTRY_H
#define DOCCONV_SERVER_ARTIFACTREGISTRY_H

#include "../Lib/TestingMacros.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct sArtifactEntry {
    sArtifactEntry(std::filesystem::path path, std::chrono::system_clock::time_point registeredAt, uint64_t recency)
            : path(std::move(path)), registeredAt(registeredAt), lastAccess(recency) {}

    const std::filesystem::path path;
    const std::chrono::system_clock::time_point registeredAt;

    // Monotonic access tick, larger is more recently used
    std::atomic<uint64_t> lastAccess;
};

// Bounded LRU map with a time to live. Entries never outlive the process; a key that is unknown, expired, evicted
// or whose file has disappeared resolves to nothing rather than to a different file.
class ArtifactRegistry {
public:
    ArtifactRegistry(std::size_t capacity, std::chrono::seconds timeToLive);

    void registerArtifact(const std::string& key, const std::filesystem::path& path);

    auto resolve(const std::string& key) -> std::optional<std::filesystem::path>;

    // Drops every entry registered before now - timeToLive. Returns the number of entries removed.
    auto expire(std::chrono::system_clock::time_point now) -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    void evictLeastRecentlyUsed();

    std::size_t capacity;
    std::chrono::seconds timeToLive;
    std::atomic<uint64_t> accessCounter{0};
    folly::ConcurrentHashMap<std::string, std::shared_ptr<sArtifactEntry>> entries;

    // Serializes capacity enforcement only, lookups never take it
    std::mutex evictionMutex;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(entries);
};

#endif //DOCCONV_SERVER_ARTIFACTREGISTRY_H
