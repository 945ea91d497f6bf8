//
// Composes an ordered list of images into one PDF, one page per image
//

#include "ImageToDocumentPipeline.h"
#include "../Codec/PdfWriter.h"
#include "../Lib/Errors.h"
#include "../Storage/ScratchSpace.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>

namespace {
    // Large enough for the markers in front of the frame header of virtually every image, EXIF thumbnails included
    const std::size_t HEADER_SNIFF_SIZE = 256 * 1024;

    auto readFile(const std::filesystem::path& path, std::size_t limit) -> std::string {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            throw eStorageError("Unable to open " + path.string());
        }

        std::string data;
        std::vector<char> buffer(FILE_COPY_BLOCK_SIZE);
        while (in && data.size() < limit) {
            auto wanted = std::min<std::size_t>(buffer.size(), limit - data.size());
            in.read(buffer.data(), static_cast<std::streamsize>(wanted));
            data.append(buffer.data(), static_cast<std::size_t>(in.gcount()));
        }

        if (in.bad()) {
            throw eStorageError("Unable to read " + path.string());
        }

        return data;
    }

    auto readFileInfo(const std::filesystem::path& path) -> sImageInfo {
        auto header = readFile(path, HEADER_SNIFF_SIZE);
        try {
            return readImageInfo(header);
        } catch (eConversionError&) {
            // The header may run past the sniffed window, only a failure on the whole file counts
            if (header.size() < HEADER_SNIFF_SIZE) {
                throw;
            }
        }
        return readImageInfo(readFile(path, std::numeric_limits<std::size_t>::max()));
    }
}

ImageToDocumentPipeline::ImageToDocumentPipeline(std::shared_ptr<ArtifactRegistry> registry)
        : registry(std::move(registry)) {}

auto normaliseQuality(double quality) -> uint32_t {
    if (!std::isfinite(quality)) {
        throw eValidationError("quality must be a number between 1 and 100");
    }

    // Clamped before rounding, lround of a value outside the range of long is unspecified
    auto clamped = std::clamp(quality, static_cast<double>(MIN_JPEG_QUALITY), static_cast<double>(MAX_JPEG_QUALITY));
    return static_cast<uint32_t>(std::lround(clamped));
}

auto ImageToDocumentPipeline::prepare(sImageToDocumentRequest request) -> sPreparedDocument {
    sPreparedDocument document;

    auto sourceCount = request.tempKeys.empty() ? request.images.size() : request.tempKeys.size();
    if (sourceCount == 0) {
        throw eValidationError("No images uploaded");
    }

    if (sourceCount > MAX_CONVERSION_SOURCES) {
        throw eValidationError(
                "At most " + std::to_string(MAX_CONVERSION_SOURCES) + " images can be converted at once, got "
                + std::to_string(sourceCount)
        );
    }

    if (!std::isfinite(request.margin)) {
        throw eValidationError("margin must be a finite number");
    }

    if (request.margin > MAX_PAGE_MARGIN) {
        throw eValidationError("margin must be at most " + formatPdfNumber(MAX_PAGE_MARGIN) + " points");
    }

    document.pageSizePolicy = request.pageSizePolicy;
    document.orientation = request.orientation;
    document.margin = std::max(0.0, request.margin);
    document.quality = std::clamp(request.quality, MIN_JPEG_QUALITY, MAX_JPEG_QUALITY);
    document.outputName = request.outputName.empty() ? DEFAULT_DOCUMENT_NAME : sanitizeFileName(request.outputName);

    // Every source is resolved before any header is checked, so a missing key is reported before a bad image
    if (!request.tempKeys.empty()) {
        for (const auto& key : request.tempKeys) {
            auto path = registry->resolve(key);
            if (!path) {
                throw eMissingArtifactError("Missing assembled file for key: " + key);
            }

            sImageSource source;
            source.name = key;
            source.path = *path;
            document.sources.push_back(std::move(source));
        }
    } else {
        for (std::size_t index = 0; index < request.images.size(); index++) {
            sImageSource source;
            source.name = "image " + std::to_string(index + 1);
            source.bytes = std::move(request.images[index]);
            document.sources.push_back(std::move(source));
        }
    }

    for (auto& source : document.sources) {
        try {
            source.info = source.path.empty() ? readImageInfo(source.bytes) : readFileInfo(source.path);
        } catch (eConversionError& exception) {
            throw eConversionError(source.name + ": " + exception.what());
        }
    }

    return document;
}

auto ImageToDocumentPipeline::write(const sPreparedDocument& document, IByteSink& sink) -> std::size_t {
    PdfWriter writer(sink);

    for (const auto& source : document.sources) {
        sRasterImage image;
        try {
            // Files are only read now so at most one source image is held in memory at a time
            image = source.path.empty()
                    ? decodeImage(source.bytes)
                    : decodeImage(readFile(source.path, std::numeric_limits<std::size_t>::max()));
        } catch (eConversionError& exception) {
            throw eConversionError(source.name + ": " + exception.what());
        }

        auto jpeg = encodeJpeg(image, document.quality);

        auto placement = computePlacement(
                document.pageSizePolicy,
                document.orientation,
                document.margin,
                image.width,
                image.height
        );

        writer.addJpegPage(placement, jpeg, image.width, image.height, image.components);
    }

    writer.finish();
    return writer.pageCount();
}

auto ImageToDocumentPipeline::build(sImageToDocumentRequest request, IByteSink& sink) -> std::size_t {
    auto document = prepare(std::move(request));
    return write(document, sink);
}
