//
// Layout of the scratch namespace and the file system primitives built on it
//

#include "ScratchSpace.h"
#include "../Lib/Errors.h"
#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include <fstream>
#include <iostream>
#include <system_error>

// Number of random hex digits used to make scratch names unique
const uint32_t SCRATCH_NAME_RANDOM_LENGTH = 20;
const uint32_t SCRATCH_NAME_ATTEMPTS = 16;

ScratchSpace::ScratchSpace(std::filesystem::path root) : rootPath(std::move(root)) {}

auto ScratchSpace::chunkRoot() const -> std::filesystem::path {
    return rootPath / CHUNK_NAMESPACE;
}

auto ScratchSpace::chunkDirectory(const std::string& uploadId) const -> std::filesystem::path {
    return chunkRoot() / uploadId;
}

auto ScratchSpace::assembledRoot() const -> std::filesystem::path {
    return rootPath / ASSEMBLED_NAMESPACE;
}

auto ScratchSpace::rasterUploadRoot() const -> std::filesystem::path {
    return rootPath / RASTER_UPLOAD_NAMESPACE;
}

auto ScratchSpace::createWorkDirectory(const std::string& prefix) const -> std::filesystem::path {
    ensureDirectory(rootPath);

    for (uint32_t attempt = 0; attempt < SCRATCH_NAME_ATTEMPTS; attempt++) {
        auto candidate = rootPath / (prefix + generateRandomHex(SCRATCH_NAME_RANDOM_LENGTH));

        // create_directory reports false if the directory already existed, which means another request owns it
        std::error_code errorCode;
        if (std::filesystem::create_directory(candidate, errorCode)) {
            return candidate;
        }

        if (errorCode) {
            throw eStorageError("Unable to create work directory " + candidate.string() + ": " + errorCode.message());
        }
    }

    throw eStorageError("Unable to create a unique work directory under " + rootPath.string());
}

auto ScratchSpace::uniquePath(const std::filesystem::path& directory, const std::string& suffix) -> std::filesystem::path {
    for (uint32_t attempt = 0; attempt < SCRATCH_NAME_ATTEMPTS; attempt++) {
        auto candidate = directory / (generateRandomHex(SCRATCH_NAME_RANDOM_LENGTH) + "_" + suffix);
        if (!std::filesystem::exists(candidate)) {
            return candidate;
        }
    }

    throw eStorageError("Unable to generate a unique file name under " + directory.string());
}

void ensureDirectory(const std::filesystem::path& directory) {
    std::error_code errorCode;
    std::filesystem::create_directories(directory, errorCode);

    // A concurrent creator may win the race, which is fine as long as the directory exists afterwards
    if (errorCode && !std::filesystem::is_directory(directory)) {
        throw eStorageError("Unable to create directory " + directory.string() + ": " + errorCode.message());
    }
}

void writeFileAtomically(const std::filesystem::path& path, std::string_view data) {
    // Temporary names start with a dot so directory listings that look for a prefix never pick them up
    auto temporary = path.parent_path() / ("." + path.filename().string() + "." + generateRandomHex(SCRATCH_NAME_RANDOM_LENGTH) + ".tmp");

    {
        std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);
        if (!stream.is_open()) {
            throw eStorageError("Unable to open " + temporary.string() + " for writing");
        }

        stream.write(data.data(), static_cast<std::streamsize>(data.size()));
        stream.flush();

        if (!stream) {
            stream.close();
            removeQuietly(temporary);
            throw eStorageError("Unable to write " + std::to_string(data.size()) + " bytes to " + temporary.string());
        }
    }

    std::error_code errorCode;
    std::filesystem::rename(temporary, path, errorCode);
    if (errorCode) {
        removeQuietly(temporary);
        throw eStorageError("Unable to move " + temporary.string() + " to " + path.string() + ": " + errorCode.message());
    }
}

void removeQuietly(const std::filesystem::path& path) {
    std::error_code errorCode;
    std::filesystem::remove(path, errorCode);
    if (errorCode) {
        std::cerr << "Scratch: Unable to remove " << path << ": " << errorCode.message() << '\n';
    }
}

void removeAllQuietly(const std::filesystem::path& path) {
    std::error_code errorCode;
    std::filesystem::remove_all(path, errorCode);
    if (errorCode) {
        std::cerr << "Scratch: Unable to remove " << path << ": " << errorCode.message() << '\n';
    }
}

auto sanitizeFileName(const std::string& fileName) -> std::string {
    // Take the base name, treating both separators as path separators
    auto separator = fileName.find_last_of("/\\");
    auto baseName = separator == std::string::npos ? fileName : fileName.substr(separator + 1);

    // Quotes and control characters would break the Content-Disposition header
    std::string result;
    for (auto character : baseName) {
        if (static_cast<unsigned char>(character) < 0x20 || character == '"') {
            result.push_back('_');
        } else {
            result.push_back(character);
        }
    }

    if (result.empty() || result == "." || result == "..") {
        return "upload";
    }

    return result;
}
