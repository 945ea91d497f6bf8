//
// Streaming ZIP archive writer
//

#ifndef DOCCONV_SERVER_ZIPWRITER_H
#define DOCCONV_SERVER_ZIPWRITER_H

#include "../Lib/ByteSink.h"
#include <archive.h>
#include <archive_entry.h>
#include <cstdint>
#include <ctime>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct sZipEntry {
    std::string name;
    uint64_t size = 0;
};

// libarchive writes the container through a callback into the sink, so each entry is sent as it is compressed
// and only libarchive's central directory records are held in memory.
class ZipWriter {
public:
    explicit ZipWriter(IByteSink& sink, int compressionLevel = 6);
    ~ZipWriter();

    ZipWriter(ZipWriter const&) = delete;
    auto operator=(ZipWriter const&) -> ZipWriter& = delete;
    ZipWriter(ZipWriter&&) = delete;
    auto operator=(ZipWriter&&) -> ZipWriter& = delete;

    // Deflates the file at source into a new entry, reading it in bounded blocks
    void addFile(const std::string& entryName, const std::filesystem::path& source);

    // Writes the central directory. No entries can be added afterwards.
    void finish();

    [[nodiscard]] auto entries() const -> const std::vector<sZipEntry>& { return written; }

private:
    static auto writeCallback(struct archive* archive, void* client, const void* buffer, size_t length) -> la_ssize_t;

    // Throws for a failed libarchive call. A failure raised by the sink is rethrown as is.
    void check(int result, const std::string& what);

    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    IByteSink& sink;
    std::unique_ptr<struct archive, decltype(&archive_write_free)> archive;
    std::exception_ptr sinkError;
    std::time_t startedAt;
    std::vector<sZipEntry> written;
    bool finished = false;
};

#endif //DOCCONV_SERVER_ZIPWRITER_H
