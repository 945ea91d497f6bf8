//
// Owns every server component and wires the API onto the http server
//

#include "Application.h"
#include "Process/ProcessInvoker.h"
#include "Settings.h"
#include <iostream>

Application::Application(std::shared_ptr<IProcessInvoker> invoker) : invoker(std::move(invoker)) {
    scratch = std::make_shared<ScratchSpace>(SCRATCH_ROOT);
    chunkStore = std::make_shared<ChunkStore>(scratch);
    registry = std::make_shared<ArtifactRegistry>(
            ARTIFACT_REGISTRY_CAPACITY,
            std::chrono::seconds(ARTIFACT_EXPIRY_SECONDS)
    );
    assembler = std::make_shared<Assembler>(chunkStore, registry);

    reaper = std::make_shared<ScratchReaper>(
            scratch, chunkStore, registry,
            sReaperPolicy{
                    .artifactExpiry = std::chrono::seconds(ARTIFACT_EXPIRY_SECONDS),
                    .sessionExpiry = std::chrono::seconds(UPLOAD_SESSION_EXPIRY_SECONDS),
                    .rasterRetention = std::chrono::seconds(RASTER_OUTPUT_RETENTION_SECONDS),
                    .interval = std::chrono::seconds(SCRATCH_REAPER_INTERVAL_SECONDS)
            }
    );

    capability = std::make_shared<RasterizerCapability>(this->invoker, RASTERIZER_EXECUTABLE);
    imagePipeline = std::make_shared<ImageToDocumentPipeline>(registry);
    rasterizationPipeline = std::make_shared<RasterizationPipeline>(
            scratch, registry, capability, std::chrono::seconds(RASTERIZER_TIMEOUT_SECONDS)
    );

    httpServer = std::make_shared<HttpServer>();
    UploadApi(API_PATH, httpServer.get(), chunkStore, assembler);
    ConvertApi(API_PATH, httpServer.get(), imagePipeline, rasterizationPipeline);
}

void Application::start() {
    std::cout << "Application: Scratch space at " << scratch->root() << std::endl;

    // Start sweeping expired artifacts and abandoned sessions
    reaper->start();

    // Report a missing rasterizer at startup rather than on the first request. Image to PDF works regardless.
    if (!capability->isAvailable()) {
        std::cerr << "Application: " << capability->getExecutable()
                  << " is not available, pdf-to-images requests will fail until it is installed" << std::endl;
    }

    // Now finally start the http server to handle api requests
    httpServer->start();
}

void Application::run() {
    start();
    httpServer->join();
}

void Application::stop() {
    httpServer->stop();
    reaper->stop();
}

auto createApplication() -> std::shared_ptr<Application> {
    return std::make_shared<Application>(std::make_shared<ProcessInvoker>());
}
