//
// In-memory mapping from registry keys to assembled artifacts
//

#include "ArtifactRegistry.h"
#include <iostream>
#include <limits>
#include <system_error>
#include <vector>

ArtifactRegistry::ArtifactRegistry(std::size_t capacity, std::chrono::seconds timeToLive)
        : capacity(capacity == 0 ? 1 : capacity), timeToLive(timeToLive) {}

void ArtifactRegistry::registerArtifact(const std::string& key, const std::filesystem::path& path) {
    entries.insert_or_assign(
            key,
            std::make_shared<sArtifactEntry>(path, std::chrono::system_clock::now(), ++accessCounter)
    );

    if (entries.size() > capacity) {
        evictLeastRecentlyUsed();
    }
}

auto ArtifactRegistry::resolve(const std::string& key) -> std::optional<std::filesystem::path> {
    auto iter = entries.find(key);
    if (iter == entries.cend()) {
        return std::nullopt;
    }

    auto entry = iter->second;

    // Expired entries behave as if they were never registered
    if (entry->registeredAt + timeToLive <= std::chrono::system_clock::now()) {
        entries.erase_if_equal(key, entry);
        return std::nullopt;
    }

    // The reaper may have deleted the file already
    std::error_code errorCode;
    if (!std::filesystem::is_regular_file(entry->path, errorCode)) {
        entries.erase_if_equal(key, entry);
        return std::nullopt;
    }

    entry->lastAccess = ++accessCounter;
    return entry->path;
}

auto ArtifactRegistry::expire(std::chrono::system_clock::time_point now) -> std::size_t {
    std::vector<std::pair<std::string, std::shared_ptr<sArtifactEntry>>> expired;
    for (const auto& [key, entry] : entries) {
        if (entry->registeredAt + timeToLive <= now) {
            expired.emplace_back(key, entry);
        }
    }

    std::size_t removed = 0;
    for (const auto& [key, entry] : expired) {
        removed += entries.erase_if_equal(key, entry);
    }

    return removed;
}

auto ArtifactRegistry::size() const -> std::size_t {
    return entries.size();
}

void ArtifactRegistry::evictLeastRecentlyUsed() {
    std::unique_lock<std::mutex> lock(evictionMutex);

    while (entries.size() > capacity) {
        std::string oldestKey;
        std::shared_ptr<sArtifactEntry> oldestEntry;
        uint64_t oldestAccess = std::numeric_limits<uint64_t>::max();

        for (const auto& [key, entry] : entries) {
            auto access = entry->lastAccess.load();
            if (access < oldestAccess) {
                oldestAccess = access;
                oldestKey = key;
                oldestEntry = entry;
            }
        }

        if (!oldestEntry) {
            return;
        }

        std::cout << "Registry: Evicting " << oldestKey << " (capacity " << capacity << ")" << '\n';
        entries.erase_if_equal(oldestKey, oldestEntry);
    }
}
