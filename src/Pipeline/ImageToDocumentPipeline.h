//
// Composes an ordered list of images into one PDF, one page per image
//

#ifndef DOCCONV_SERVER_IMAGETODOCUMENTPIPELINE_H
#define DOCCONV_SERVER_IMAGETODOCUMENTPIPELINE_H

#include "../Codec/ImageCodec.h"
#include "../Layout/LayoutEngine.h"
#include "../Lib/ByteSink.h"
#include "../Settings.h"
#include "../Storage/ArtifactRegistry.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct sImageToDocumentRequest {
    // Raw bytes of directly uploaded images
    std::vector<std::string> images;
    // Registry keys of assembled uploads. When present these are used instead of images.
    std::vector<std::string> tempKeys;

    ePageSizePolicy pageSizePolicy = ePageSizePolicy::automatic;
    eOrientation orientation = eOrientation::portrait;
    double margin = 0;
    uint32_t quality = DEFAULT_JPEG_QUALITY;
    std::string outputName = DEFAULT_DOCUMENT_NAME;
};

// One source whose header has been checked. Exactly one of bytes or path holds the image.
struct sImageSource {
    std::string name;
    std::string bytes;
    std::filesystem::path path;
    sImageInfo info;
};

struct sPreparedDocument {
    std::vector<sImageSource> sources;
    ePageSizePolicy pageSizePolicy = ePageSizePolicy::automatic;
    eOrientation orientation = eOrientation::portrait;
    double margin = 0;
    uint32_t quality = DEFAULT_JPEG_QUALITY;
    std::string outputName;
};

// Rounds a requested JPEG quality into [MIN_JPEG_QUALITY, MAX_JPEG_QUALITY]. A value that is not finite is a
// validation error.
auto normaliseQuality(double quality) -> uint32_t;

class ImageToDocumentPipeline {
public:
    explicit ImageToDocumentPipeline(std::shared_ptr<ArtifactRegistry> registry);

    // Validates the request, resolves every source and checks every image header. Nothing is written, so any
    // failure here can still be reported to the caller as a normal error.
    auto prepare(sImageToDocumentRequest request) -> sPreparedDocument;

    // Decodes, re-encodes and lays out each source in order, streaming the document to sink one page at a time.
    // Returns the number of pages written.
    static auto write(const sPreparedDocument& document, IByteSink& sink) -> std::size_t;

    auto build(sImageToDocumentRequest request, IByteSink& sink) -> std::size_t;

private:
    std::shared_ptr<ArtifactRegistry> registry;
};

#endif //DOCCONV_SERVER_IMAGETODOCUMENTPIPELINE_H
