//
// Concatenates a session's chunks into one durable artifact
//

#include "Assembler.h"
#include "../Lib/Errors.h"
#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include <fstream>
#include <iostream>
#include <system_error>

namespace {
    // Puts a session back to pending if an assembly fails before the artifact is durable
    struct sAssemblyAttempt {
        explicit sAssemblyAttempt(std::shared_ptr<sUploadSession> session) : session(std::move(session)) {}

        ~sAssemblyAttempt() {
            if (!committed) {
                std::unique_lock<std::mutex> lock(session->mutex);
                session->state = eUploadState::pending;
                session->lastActivity = std::chrono::system_clock::now();
            }
        }

        sAssemblyAttempt(sAssemblyAttempt const&) = delete;
        auto operator=(sAssemblyAttempt const&) -> sAssemblyAttempt& = delete;
        sAssemblyAttempt(sAssemblyAttempt&&) = delete;
        auto operator=(sAssemblyAttempt&&) -> sAssemblyAttempt& = delete;

        std::shared_ptr<sUploadSession> session;
        bool committed = false;
    };
}

Assembler::Assembler(std::shared_ptr<ChunkStore> chunkStore, std::shared_ptr<ArtifactRegistry> registry)
        : chunkStore(std::move(chunkStore)), registry(std::move(registry)) {}

auto Assembler::makeRegistryKey(const std::string& uploadId, const std::string& filename) -> std::string {
    return uploadId + "__" + sanitizeFileName(filename);
}

auto Assembler::assemble(const std::string& uploadId, const std::string& filename) -> std::string {
    if (!isSafeIdentifier(uploadId)) {
        throw eValidationError("uploadId must be 1-64 characters of A-Z, a-z, 0-9, '_' or '-'");
    }

    if (filename.empty()) {
        throw eValidationError("filename is required");
    }

    auto session = chunkStore->getSession(uploadId);

    {
        std::unique_lock<std::mutex> lock(session->mutex);

        // Let any chunk writes that were already accepted land before the chunk list is taken
        if (!session->writesDrainedCV.wait_for(
                lock,
                std::chrono::seconds(ASSEMBLE_WAIT_FOR_WRITES_SECONDS),
                [&session] { return session->inflightWrites == 0; })) {
            throw eSessionStateError("Upload " + uploadId + " still has chunk writes in progress");
        }

        if (session->state != eUploadState::pending) {
            throw eSessionStateError(
                    "Upload " + uploadId + " is " + uploadStateName(session->state) + " and cannot be assembled again"
            );
        }

        session->state = eUploadState::assembling;
    }

    sAssemblyAttempt attempt(session);

    auto chunks = chunkStore->listChunks(uploadId);
    if (chunks.empty()) {
        // Nothing was ever staged here, don't keep an empty session around
        if (!std::filesystem::exists(chunkStore->getScratch()->chunkDirectory(uploadId))) {
            chunkStore->dropSession(uploadId);
        }
        throw eNoChunksError("No chunks found for upload " + uploadId);
    }

    auto assembledRoot = chunkStore->getScratch()->assembledRoot();
    ensureDirectory(assembledRoot);
    auto output = ScratchSpace::uniquePath(assembledRoot, sanitizeFileName(filename));

    concatenate(chunks, output);

    {
        std::unique_lock<std::mutex> lock(session->mutex);
        session->state = eUploadState::assembled;
        attempt.committed = true;
    }

    auto key = makeRegistryKey(uploadId, filename);
    registry->registerArtifact(key, output);

    std::cout << "Assembler: Assembled " << chunks.size() << " chunks of upload " << uploadId << " into " << output << '\n';

    purgeChunks(uploadId, chunks);

    {
        std::unique_lock<std::mutex> lock(session->mutex);
        session->state = eUploadState::purged;
        session->lastActivity = std::chrono::system_clock::now();
    }

    return key;
}

void Assembler::concatenate(const std::vector<std::filesystem::path>& chunks, const std::filesystem::path& output) {
    // Assemble under a hidden name first so a failed assembly never leaves a plausible looking artifact behind
    auto partial = output.parent_path() / ("." + output.filename().string() + ".partial");

    try {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw eStorageError("Unable to create " + partial.string());
        }

        std::vector<char> buffer(FILE_COPY_BLOCK_SIZE);
        for (const auto& chunk : chunks) {
            std::ifstream in(chunk, std::ios::binary);
            if (!in.is_open()) {
                throw eStorageError("Unable to open chunk " + chunk.string());
            }

            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                auto count = in.gcount();
                if (count > 0) {
                    out.write(buffer.data(), count);
                }
            }

            if (in.bad()) {
                throw eStorageError("Unable to read chunk " + chunk.string());
            }

            if (!out) {
                throw eStorageError("Unable to write to " + partial.string());
            }
        }

        out.flush();
        if (!out) {
            throw eStorageError("Unable to write to " + partial.string());
        }
    } catch (eStorageError& exception) {
        dumpExceptions(exception);
        removeQuietly(partial);
        throw;
    }

    std::error_code errorCode;
    std::filesystem::rename(partial, output, errorCode);
    if (errorCode) {
        removeQuietly(partial);
        throw eStorageError("Unable to move " + partial.string() + " to " + output.string() + ": " + errorCode.message());
    }
}

void Assembler::purgeChunks(const std::string& uploadId, const std::vector<std::filesystem::path>& chunks) {
    for (const auto& chunk : chunks) {
        removeQuietly(chunk);
    }

    // The artifact is already durable, failing to remove the directory only leaves scratch for the reaper
    auto directory = chunkStore->getScratch()->chunkDirectory(uploadId);
    std::error_code errorCode;
    std::filesystem::remove(directory, errorCode);
    if (errorCode) {
        std::cerr << "Assembler: Unable to remove chunk directory " << directory << ": " << errorCode.message() << '\n';
    }
}
