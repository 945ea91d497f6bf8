//
// Streaming ZIP archive writer
//

#include "ZipWriter.h"
#include "../Lib/Errors.h"
#include "../Settings.h"
#include <chrono>
#include <fstream>
#include <iostream>

namespace {
    // -rw-r--r--
    const int ENTRY_PERMISSIONS = 0644;
}

ZipWriter::ZipWriter(IByteSink& sink, int compressionLevel) :
        sink(sink),
        archive(archive_write_new(), &archive_write_free),
        // Every entry of one archive carries the time the archive was started
        startedAt(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now())) {
    if (!archive) {
        throw eConversionError("Unable to create an archive writer");
    }

    check(archive_write_set_format_zip(archive.get()), "Unable to select the ZIP format");
    check(archive_write_set_format_option(archive.get(), "zip", "compression", "deflate"),
          "Unable to select deflate compression");

    // compression-level only exists from libarchive 3.6, older versions deflate at their default level
    if (archive_write_set_format_option(archive.get(), "zip", "compression-level",
                                        std::to_string(compressionLevel).c_str()) < ARCHIVE_WARN) {
        std::cerr << "ZipWriter: Compression level " << compressionLevel << " not supported, using the default"
                  << '\n';
    }

    // Pages never approach 4 GiB, plain ZIP records are read by every client
    check(archive_write_set_format_option(archive.get(), "zip", "zip64", nullptr), "Unable to disable ZIP64");

    // No blocking or padding, the sink does its own buffering
    check(archive_write_set_bytes_per_block(archive.get(), 0), "Unable to set the archive block size");
    check(archive_write_set_bytes_in_last_block(archive.get(), 1), "Unable to set the archive block size");

    check(archive_write_open(archive.get(), this, nullptr, &ZipWriter::writeCallback, nullptr),
          "Unable to open the archive");
}

ZipWriter::~ZipWriter() {
    // An archive that was never finished must not write its central directory into the sink while being freed
    if (!finished && archive) {
        archive_write_fail(archive.get());
    }
}

auto ZipWriter::writeCallback(struct archive* /*archive*/, void* client, const void* buffer, size_t length) -> la_ssize_t {
    auto* writer = static_cast<ZipWriter*>(client);
    if (writer->sinkError) {
        return -1;
    }

    // Exceptions can't cross libarchive, the failure is kept and rethrown by check()
    try {
        writer->sink.write(static_cast<const char*>(buffer), length);
    } catch (std::exception&) {
        writer->sinkError = std::current_exception();
        return -1;
    }

    return static_cast<la_ssize_t>(length);
}

void ZipWriter::check(int result, const std::string& what) {
    if (result >= ARCHIVE_WARN) {
        return;
    }

    if (sinkError) {
        std::rethrow_exception(sinkError);
    }

    const char* message = archive_error_string(archive.get());
    throw eConversionError(what + ": " + (message != nullptr ? message : "unknown libarchive error"));
}

void ZipWriter::addFile(const std::string& entryName, const std::filesystem::path& source) {
    if (finished) {
        throw eConversionError("Cannot add an entry to a finished archive");
    }

    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        throw eStorageError("Unable to open " + source.string() + " for archiving");
    }

    std::error_code errorCode;
    auto size = std::filesystem::file_size(source, errorCode);
    if (errorCode) {
        throw eStorageError("Unable to read the size of " + source.string() + ": " + errorCode.message());
    }

    std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), &archive_entry_free);
    if (!entry) {
        throw eConversionError("Unable to create an archive entry");
    }

    archive_entry_set_pathname(entry.get(), entryName.c_str());
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), ENTRY_PERMISSIONS);
    archive_entry_set_mtime(entry.get(), startedAt, 0);

    check(archive_write_header(archive.get(), entry.get()), "Unable to add " + entryName);

    std::vector<char> block(FILE_COPY_BLOCK_SIZE);
    while (in) {
        in.read(block.data(), static_cast<std::streamsize>(block.size()));
        auto count = static_cast<std::size_t>(in.gcount());

        if (in.bad()) {
            throw eStorageError("Unable to read " + source.string() + " for archiving");
        }

        if (count > 0 && archive_write_data(archive.get(), block.data(), count) < 0) {
            check(ARCHIVE_FATAL, "Unable to compress " + entryName);
        }
    }

    check(archive_write_finish_entry(archive.get()), "Unable to finish " + entryName);
    sink.flush();

    written.push_back({entryName, size});
}

void ZipWriter::finish() {
    if (finished) {
        return;
    }
    finished = true;

    check(archive_write_close(archive.get()), "Unable to finish the archive");
    sink.flush();
}
