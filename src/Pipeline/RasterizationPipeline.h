//
// Rasterizes a PDF with an external tool and archives the page images
//

#ifndef DOCCONV_SERVER_RASTERIZATIONPIPELINE_H
#define DOCCONV_SERVER_RASTERIZATIONPIPELINE_H

#include "../Lib/ByteSink.h"
#include "../Process/RasterizerCapability.h"
#include "../Settings.h"
#include "../Storage/ArtifactRegistry.h"
#include "../Storage/ScratchSpace.h"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct sRasterizationRequest {
    // Registry key of an assembled upload, used in preference to document
    std::string tempKey;
    // Raw bytes of a directly uploaded document
    std::string document;
    std::string uploadName = "upload.pdf";
    std::string outputName = DEFAULT_ARCHIVE_NAME;
};

// Pages produced by one rasterization. The work directory is deleted when this is destroyed, so it must outlive
// the response that streams the archive.
struct sRasterizedDocument {
    std::unique_ptr<ScopedDirectory> workDirectory;
    std::vector<std::filesystem::path> pages;
    std::string outputName;
};

class RasterizationPipeline {
public:
    RasterizationPipeline(std::shared_ptr<ScratchSpace> scratch,
                          std::shared_ptr<ArtifactRegistry> registry,
                          std::shared_ptr<RasterizerCapability> capability,
                          std::chrono::seconds timeout);

    // Resolves the source, checks the rasterizer is available and renders every page into a fresh work directory.
    // Throws before anything has been written to a response.
    auto rasterize(const sRasterizationRequest& request) -> sRasterizedDocument;

    // Streams the pages into a ZIP archive in page order, naming them page_1.png, page_2.png, ...
    static void writeArchive(const sRasterizedDocument& document, IByteSink& sink);

    static auto archiveEntryName(std::size_t pageIndex) -> std::string;

private:
    std::shared_ptr<ScratchSpace> scratch;
    std::shared_ptr<ArtifactRegistry> registry;
    std::shared_ptr<RasterizerCapability> capability;
    std::chrono::seconds timeout;
};

#endif //DOCCONV_SERVER_RASTERIZATIONPIPELINE_H
