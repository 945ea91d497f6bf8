//
// Runtime configuration for the conversion server
//

#ifndef DOCCONV_SERVER_SETTINGS_H
#define DOCCONV_SERVER_SETTINGS_H

#include <cstdint>
#include <filesystem>
#include <string>

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
inline auto GET_ENV(const std::string &variable, const std::string &_default) -> std::string {
    // NOLINTNEXTLINE(clang-analyzer-cplusplus.StringChecker,concurrency-mt-unsafe)
    return std::getenv(variable.c_str()) != nullptr ? std::string(std::getenv(variable.c_str())) : _default;
}

#define SCRATCH_ROOT                        GET_ENV("SCRATCH_ROOT", std::filesystem::temp_directory_path().string())
#define MAX_REQUEST_SIZE                    std::stoull(GET_ENV("MAX_REQUEST_SIZE", std::to_string(1024ULL*1024ULL*512ULL)))

#define RASTERIZER_EXECUTABLE               GET_ENV("RASTERIZER_EXECUTABLE", "pdftoppm")
#define RASTERIZER_TIMEOUT_SECONDS          std::stoi(GET_ENV("RASTERIZER_TIMEOUT_SECONDS", std::to_string(120)))

#define ARTIFACT_REGISTRY_CAPACITY          std::stoull(GET_ENV("ARTIFACT_REGISTRY_CAPACITY", std::to_string(4096)))
#define ARTIFACT_EXPIRY_SECONDS             std::stoi(GET_ENV("ARTIFACT_EXPIRY_SECONDS", std::to_string(60*60*24)))
#define UPLOAD_SESSION_EXPIRY_SECONDS       std::stoi(GET_ENV("UPLOAD_SESSION_EXPIRY_SECONDS", std::to_string(60*60*24)))
#define RASTER_OUTPUT_RETENTION_SECONDS     std::stoi(GET_ENV("RASTER_OUTPUT_RETENTION_SECONDS", std::to_string(60*5)))
#define SCRATCH_REAPER_INTERVAL_SECONDS     std::stoi(GET_ENV("SCRATCH_REAPER_INTERVAL_SECONDS", std::to_string(60)))

// Scratch namespaces, relative to SCRATCH_ROOT
constexpr const char* CHUNK_NAMESPACE = "upload_chunks";
constexpr const char* ASSEMBLED_NAMESPACE = "assembled_uploads";
constexpr const char* RASTER_UPLOAD_NAMESPACE = "pdf_to_images";
constexpr const char* RASTER_WORKDIR_PREFIX = "pdf_images_";

constexpr const char* CHUNK_FILE_PREFIX = "chunk_";
constexpr const char* RASTER_PAGE_PREFIX = "page";

const uint32_t RASTERIZER_DPI = 150;
const uint32_t RASTERIZER_CHECK_TIMEOUT_SECONDS = 10;

const uint32_t DEFAULT_JPEG_QUALITY = 80;
const uint32_t MIN_JPEG_QUALITY = 1;
const uint32_t MAX_JPEG_QUALITY = 100;

// Largest page margin accepted, in points (20 inches). PDF viewers reject pages over 14400 points a side.
const double MAX_PAGE_MARGIN = 1440;

const uint32_t MAX_CONVERSION_SOURCES = 100;
const uint32_t MAX_IDENTIFIER_LENGTH = 64;

constexpr const char* DEFAULT_DOCUMENT_NAME = "images.pdf";
constexpr const char* DEFAULT_ARCHIVE_NAME = "images.zip";

// Chunk writes still in flight when an assembly starts are given this long to finish
const uint32_t ASSEMBLE_WAIT_FOR_WRITES_SECONDS = 30;

// Size of each block read from disk when concatenating or archiving files
const uint64_t FILE_COPY_BLOCK_SIZE = (1024ULL*64ULL);

// Bytes buffered by a streaming response before a chunk is sent to the client
const uint64_t RESPONSE_CHUNK_SIZE = (1024ULL*64ULL);

const uint16_t HTTP_PORT = 8000;
const uint32_t HTTP_WORKER_POOL_SIZE = 32;
const uint32_t HTTP_CONTENT_TIMEOUT_SECONDS = 300;

constexpr const char* API_PATH = "/tools/pdf-converter/";

#endif //DOCCONV_SERVER_SETTINGS_H
