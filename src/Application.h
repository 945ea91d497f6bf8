//
// Owns every server component and wires the API onto the http server
//

#ifndef DOCCONV_SERVER_APPLICATION_H
#define DOCCONV_SERVER_APPLICATION_H

#include "HTTP/HttpServer.h"
#include "Interfaces/IProcessInvoker.h"
#include "Pipeline/ImageToDocumentPipeline.h"
#include "Pipeline/RasterizationPipeline.h"
#include "Process/RasterizerCapability.h"
#include "Storage/ArtifactRegistry.h"
#include "Storage/Assembler.h"
#include "Storage/ChunkStore.h"
#include "Storage/ScratchReaper.h"
#include "Storage/ScratchSpace.h"
#include <memory>

class Application {
public:
    // Builds the components from the environment. The invoker is replaceable so tests can supply their own.
    explicit Application(std::shared_ptr<IProcessInvoker> invoker);

    // Starts the background reaper and the http server without blocking
    void start();

    // Starts everything and blocks until the http server exits
    void run();

    void stop();

    auto getScratch() -> std::shared_ptr<ScratchSpace> { return scratch; }
    auto getRegistry() -> std::shared_ptr<ArtifactRegistry> { return registry; }
    auto getHttpServer() -> std::shared_ptr<HttpServer> { return httpServer; }

private:
    std::shared_ptr<ScratchSpace> scratch;
    std::shared_ptr<ChunkStore> chunkStore;
    std::shared_ptr<ArtifactRegistry> registry;
    std::shared_ptr<Assembler> assembler;
    std::shared_ptr<ScratchReaper> reaper;
    std::shared_ptr<IProcessInvoker> invoker;
    std::shared_ptr<RasterizerCapability> capability;
    std::shared_ptr<ImageToDocumentPipeline> imagePipeline;
    std::shared_ptr<RasterizationPipeline> rasterizationPipeline;
    std::shared_ptr<HttpServer> httpServer;
};

// Factory function to create application instance
auto createApplication() -> std::shared_ptr<Application>;

#endif //DOCCONV_SERVER_APPLICATION_H
