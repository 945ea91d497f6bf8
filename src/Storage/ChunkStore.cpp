//
// Durable per-session storage for uploaded chunks
//

#include "ChunkStore.h"
#include "../Lib/Errors.h"
#include "../Lib/GeneralUtils.h"
#include "../Lib/OrderKey.h"
#include "../Settings.h"
#include <system_error>

auto uploadStateName(eUploadState state) -> std::string {
    switch (state) {
        case eUploadState::pending:
            return "pending";
        case eUploadState::assembling:
            return "assembling";
        case eUploadState::assembled:
            return "assembled";
        case eUploadState::purged:
            return "purged";
    }
    return "unknown";
}

namespace {
    // Keeps a session's in-flight write count accurate however the write ends
    struct sInflightWrite {
        explicit sInflightWrite(std::shared_ptr<sUploadSession> session) : session(std::move(session)) {}

        ~sInflightWrite() {
            std::unique_lock<std::mutex> lock(session->mutex);
            session->inflightWrites--;
            session->lastActivity = std::chrono::system_clock::now();
            session->writesDrainedCV.notify_all();
        }

        sInflightWrite(sInflightWrite const&) = delete;
        auto operator=(sInflightWrite const&) -> sInflightWrite& = delete;
        sInflightWrite(sInflightWrite&&) = delete;
        auto operator=(sInflightWrite&&) -> sInflightWrite& = delete;

        std::shared_ptr<sUploadSession> session;
    };
}

ChunkStore::ChunkStore(std::shared_ptr<ScratchSpace> scratch) : scratch(std::move(scratch)) {}

void ChunkStore::putChunk(const std::string& uploadId, const std::string& index, std::string_view bytes) {
    if (!isSafeIdentifier(uploadId)) {
        throw eValidationError("uploadId must be 1-64 characters of A-Z, a-z, 0-9, '_' or '-'");
    }

    if (!isSafeIdentifier(index)) {
        throw eValidationError("chunkIndex must be 1-64 characters of A-Z, a-z, 0-9, '_' or '-'");
    }

    auto session = getSession(uploadId);

    {
        std::unique_lock<std::mutex> lock(session->mutex);

        // Chunks can only be added while the session has not been assembled
        if (session->state != eUploadState::pending) {
            throw eSessionStateError(
                    "Upload " + uploadId + " is " + uploadStateName(session->state) + " and no longer accepts chunks"
            );
        }

        session->inflightWrites++;
        session->lastActivity = std::chrono::system_clock::now();
    }

    // The write itself runs without holding the session lock
    sInflightWrite inflightWrite(session);

    auto directory = scratch->chunkDirectory(uploadId);
    ensureDirectory(directory);
    writeFileAtomically(directory / (CHUNK_FILE_PREFIX + index), bytes);
}

auto ChunkStore::listChunks(const std::string& uploadId) const -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> chunks;

    auto directory = scratch->chunkDirectory(uploadId);

    std::error_code errorCode;
    if (!std::filesystem::is_directory(directory, errorCode)) {
        return chunks;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory, errorCode)) {
        auto name = entry.path().filename().string();
        if (entry.is_regular_file() && name.rfind(CHUNK_FILE_PREFIX, 0) == 0) {
            chunks.push_back(entry.path());
        }
    }

    if (errorCode) {
        throw eStorageError("Unable to list chunks in " + directory.string() + ": " + errorCode.message());
    }

    sortByOrderKey(chunks, CHUNK_FILE_PREFIX);
    return chunks;
}

auto ChunkStore::getSession(const std::string& uploadId) -> std::shared_ptr<sUploadSession> {
    auto result = sessions.try_emplace(uploadId, std::make_shared<sUploadSession>(uploadId));
    return result.first->second;
}

auto ChunkStore::findSession(const std::string& uploadId) const -> std::shared_ptr<sUploadSession> {
    auto iter = sessions.find(uploadId);
    if (iter == sessions.cend()) {
        return nullptr;
    }
    return iter->second;
}

void ChunkStore::dropSession(const std::string& uploadId) {
    sessions.erase(uploadId);
}

auto ChunkStore::sessionIds() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    for (const auto& [uploadId, session] : sessions) {
        ids.push_back(uploadId);
    }
    return ids;
}
