//
// Layout of the scratch namespace and the file system primitives built on it
//

#ifndef DOCCONV_SERVER_SCRATCHSPACE_H
#define DOCCONV_SERVER_SCRATCHSPACE_H

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

class ScratchSpace {
public:
    explicit ScratchSpace(std::filesystem::path root);

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return rootPath; }

    // upload_chunks/
    [[nodiscard]] auto chunkRoot() const -> std::filesystem::path;
    // upload_chunks/<uploadId>/
    [[nodiscard]] auto chunkDirectory(const std::string& uploadId) const -> std::filesystem::path;
    // assembled_uploads/
    [[nodiscard]] auto assembledRoot() const -> std::filesystem::path;
    // pdf_to_images/
    [[nodiscard]] auto rasterUploadRoot() const -> std::filesystem::path;

    // Creates a fresh, exclusively owned directory "<root>/<prefix><random>"
    [[nodiscard]] auto createWorkDirectory(const std::string& prefix) const -> std::filesystem::path;

    // Returns a path in directory that did not exist at the time of the call: "<directory>/<random>_<suffix>"
    [[nodiscard]] static auto uniquePath(const std::filesystem::path& directory, const std::string& suffix) -> std::filesystem::path;

private:
    std::filesystem::path rootPath;
};

// Creates directory and any missing parents. Safe to call concurrently for the same path.
void ensureDirectory(const std::filesystem::path& directory);

// Writes data to path via a temporary sibling and a rename, so readers never observe a partial file
void writeFileAtomically(const std::filesystem::path& path, std::string_view data);

// Best-effort deletion. Failures are logged and never thrown.
void removeQuietly(const std::filesystem::path& path);
void removeAllQuietly(const std::filesystem::path& path);

// Reduces a caller supplied file name to a safe base name
auto sanitizeFileName(const std::string& fileName) -> std::string;

// Owns a scratch directory and removes it with its contents on destruction
class ScopedDirectory {
public:
    explicit ScopedDirectory(std::filesystem::path directory) : directory(std::move(directory)) {}

    ~ScopedDirectory() {
        removeAllQuietly(directory);
    }

    ScopedDirectory(ScopedDirectory const&) = delete;
    auto operator=(ScopedDirectory const&) -> ScopedDirectory& = delete;
    ScopedDirectory(ScopedDirectory&&) = delete;
    auto operator=(ScopedDirectory&&) -> ScopedDirectory& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return directory; }

private:
    std::filesystem::path directory;
};

// Owns a scratch file and removes it on destruction
class ScopedFile {
public:
    ScopedFile() = default;
    explicit ScopedFile(std::filesystem::path file) : file(std::move(file)) {}

    ~ScopedFile() {
        if (!file.empty()) {
            removeQuietly(file);
        }
    }

    ScopedFile(ScopedFile const&) = delete;
    auto operator=(ScopedFile const&) -> ScopedFile& = delete;
    ScopedFile(ScopedFile&&) = delete;
    auto operator=(ScopedFile&&) -> ScopedFile& = delete;

    void reset(std::filesystem::path newFile) {
        if (!file.empty()) {
            removeQuietly(file);
        }
        file = std::move(newFile);
    }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return file; }

private:
    std::filesystem::path file;
};

#endif //DOCCONV_SERVER_SCRATCHSPACE_H
