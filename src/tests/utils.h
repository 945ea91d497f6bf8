#ifndef DOCCONV_SERVER_TEST_UTILS_H
#define DOCCONV_SERVER_TEST_UTILS_H

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <client_http.hpp>

#include "../Codec/ImageCodec.h"
#include "../Lib/ByteSink.h"
#include "../Lib/Errors.h"

auto randomInt(uint64_t start, uint64_t end) -> uint64_t;
auto generateRandomData(uint32_t count) -> std::string;

auto readFile(const std::filesystem::path& path) -> std::string;
void writeFile(const std::filesystem::path& path, const std::string& data);

// A gradient so that every pixel of a small test image can be told apart
auto makeRasterImage(uint32_t width, uint32_t height, uint32_t components) -> sRasterImage;
auto makeJpeg(uint32_t width, uint32_t height, uint32_t components = 3) -> std::string;
auto makePng(uint32_t width, uint32_t height, bool withAlpha = false) -> std::string;

// Inserts an EXIF APP1 segment carrying orientation directly after the SOI marker
auto withExifOrientation(const std::string& jpeg, uint16_t orientation) -> std::string;

struct sPdfPage {
    double mediaWidth = 0;
    double mediaHeight = 0;
    double drawWidth = 0;
    double drawHeight = 0;
    double drawX = 0;
    double drawBottom = 0;
    uint32_t pixelWidth = 0;
    uint32_t pixelHeight = 0;
};

// Reads back the page geometry of documents produced by PdfWriter, in page order
auto parsePdfPages(const std::string& pdf) -> std::vector<sPdfPage>;

struct sZipTestEntry {
    std::string name;
    uint32_t crc = 0;
    uint16_t method = 0;
    uint32_t compressedSize = 0;
    std::string data;
};

// Reads every entry of a ZIP archive through its central directory, inflating deflated entries
auto parseZip(const std::string& zip) -> std::vector<sZipTestEntry>;

/**
 * RAII class for a temporary directory that is removed with its contents on destruction
 */
class TemporaryDirectory
{
public:
    TemporaryDirectory()
    {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<uint64_t> dis(0, std::numeric_limits<uint64_t>::max());

        std::stringstream ss;
        ss << "docconv_test_" << std::hex << std::setfill('0') << std::setw(16) << dis(gen);

        directory = std::filesystem::temp_directory_path() / ss.str();
        std::filesystem::create_directories(directory);
    }

    ~TemporaryDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(directory, ec);
        // Ignore errors during cleanup (directory might already be deleted)
    }

    TemporaryDirectory(const TemporaryDirectory&)                    = delete;
    auto operator=(const TemporaryDirectory&) -> TemporaryDirectory& = delete;
    TemporaryDirectory(TemporaryDirectory&&)                         = delete;
    auto operator=(TemporaryDirectory&&) -> TemporaryDirectory&      = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path&
    {
        return directory;
    }

private:
    std::filesystem::path directory;
};

/**
 * Writes an executable shell script standing in for pdftoppm. It answers "-v" with success and otherwise writes
 * pageCount copies of pagePng as "<last argument>-<n>.png", each followed by the digits of n, then exits with exitCode.
 */
auto writeFakeRasterizer(const std::filesystem::path& directory, const std::string& pagePng, uint32_t pageCount,
                         int exitCode = 0) -> std::filesystem::path;

// A stand in for pdftoppm that never finishes
auto writeHangingRasterizer(const std::filesystem::path& directory) -> std::filesystem::path;

// Number of entries in directory whose names start with prefix
auto countEntriesWithPrefix(const std::filesystem::path& directory, const std::string& prefix) -> std::size_t;

using TestHttpClient = SimpleWeb::Client<SimpleWeb::HTTP>;

// Behaves like a client that goes away after receiving a number of flushed pages or entries. Every later write or
// flush throws again and is counted, so a test can tell whether work carried on after the disconnect.
class DisconnectingByteSink : public IByteSink
{
public:
    explicit DisconnectingByteSink(uint32_t flushesBeforeDisconnect) : flushesBeforeDisconnect(flushesBeforeDisconnect) {}

    void write(const char* data, std::size_t size) override
    {
        if (disconnected)
        {
            callsAfterDisconnect++;
            throw eClientDisconnected("Client has disconnected");
        }

        received.append(data, size);
    }

    void flush() override
    {
        if (disconnected)
        {
            callsAfterDisconnect++;
            throw eClientDisconnected("Client has disconnected");
        }

        if (++flushes >= flushesBeforeDisconnect)
        {
            disconnected = true;
            throw eClientDisconnected("Client has disconnected");
        }
    }

    using IByteSink::write;

    uint32_t flushesBeforeDisconnect;
    uint32_t flushes              = 0;
    uint32_t callsAfterDisconnect = 0;
    bool disconnected             = false;
    std::string received;
};

#endif  // DOCCONV_SERVER_TEST_UTILS_H
