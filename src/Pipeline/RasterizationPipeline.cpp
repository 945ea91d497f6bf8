//
// Rasterizes a PDF with an external tool and archives the page images
//

#include "RasterizationPipeline.h"
#include "../Codec/ZipWriter.h"
#include "../Lib/Errors.h"
#include "../Lib/OrderKey.h"
#include <boost/algorithm/string/case_conv.hpp>
#include <iostream>
#include <optional>
#include <system_error>

RasterizationPipeline::RasterizationPipeline(std::shared_ptr<ScratchSpace> scratch,
                                             std::shared_ptr<ArtifactRegistry> registry,
                                             std::shared_ptr<RasterizerCapability> capability,
                                             std::chrono::seconds timeout)
        : scratch(std::move(scratch)), registry(std::move(registry)), capability(std::move(capability)),
          timeout(timeout) {}

auto RasterizationPipeline::archiveEntryName(std::size_t pageIndex) -> std::string {
    return "page_" + std::to_string(pageIndex + 1) + ".png";
}

auto RasterizationPipeline::rasterize(const sRasterizationRequest& request) -> sRasterizedDocument {
    // Resolve the source without touching anything else
    std::optional<std::filesystem::path> source;
    if (!request.tempKey.empty()) {
        source = registry->resolve(request.tempKey);
        if (!source) {
            throw eMissingArtifactError("Missing assembled file for provided tempKey");
        }
    } else if (request.document.empty()) {
        throw eValidationError("No PDF uploaded");
    }

    // Never attempt a run against a rasterizer that is known to be missing
    capability->ensureAvailable();

    // The rasterizer reads from a path, so direct uploads are persisted first and removed once it has run
    ScopedFile persistedUpload;
    if (!source) {
        ensureDirectory(scratch->rasterUploadRoot());
        auto path = ScratchSpace::uniquePath(scratch->rasterUploadRoot(), sanitizeFileName(request.uploadName));
        writeFileAtomically(path, request.document);
        persistedUpload.reset(path);
        source = path;
    }

    sRasterizedDocument result;
    result.outputName = request.outputName.empty() ? DEFAULT_ARCHIVE_NAME : sanitizeFileName(request.outputName);
    result.workDirectory = std::make_unique<ScopedDirectory>(scratch->createWorkDirectory(RASTER_WORKDIR_PREFIX));

    const auto& workDirectory = result.workDirectory->path();
    std::vector<std::string> args = {
            "-png",
            "-r", std::to_string(RASTERIZER_DPI),
            source->string(),
            (workDirectory / RASTER_PAGE_PREFIX).string()
    };

    sProcessResult processResult;
    try {
        processResult = capability->getInvoker()->run(capability->getExecutable(), args, timeout);
    } catch (eSpawnError& exception) {
        // The tool may have been removed since it was last checked
        capability->markUnavailable();
        throw eRasterizationError(std::string("Unable to start the rasterizer: ") + exception.what());
    }

    if (processResult.timedOut) {
        throw eRasterizationError(
                "The rasterizer did not finish within " + std::to_string(timeout.count()) + " seconds"
        );
    }

    if (processResult.exitCode != 0) {
        throw eRasterizationError("The rasterizer failed with exit status " + std::to_string(processResult.exitCode));
    }

    std::error_code errorCode;
    for (const auto& entry : std::filesystem::directory_iterator(workDirectory, errorCode)) {
        auto extension = boost::algorithm::to_lower_copy(entry.path().extension().string());
        if (entry.is_regular_file() && extension == ".png") {
            result.pages.push_back(entry.path());
        }
    }

    if (errorCode) {
        throw eStorageError("Unable to list " + workDirectory.string() + ": " + errorCode.message());
    }

    if (result.pages.empty()) {
        throw eRasterizationError("No images generated from PDF");
    }

    sortByOrderKey(result.pages, RASTER_PAGE_PREFIX);

    std::cout << "Rasterizer: Rendered " << result.pages.size() << " pages into " << workDirectory << '\n';

    return result;
}

void RasterizationPipeline::writeArchive(const sRasterizedDocument& document, IByteSink& sink) {
    ZipWriter archive(sink);

    for (std::size_t index = 0; index < document.pages.size(); index++) {
        archive.addFile(archiveEntryName(index), document.pages[index]);
    }

    archive.finish();
}
