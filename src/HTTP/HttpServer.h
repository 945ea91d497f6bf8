//
// Created by lewis on 2/26/20.
//

#ifndef DOCCONV_SERVER_HTTPSERVER_H
#define DOCCONV_SERVER_HTTPSERVER_H

#include "../Lib/GeneralUtils.h"
#include "../Pipeline/ImageToDocumentPipeline.h"
#include "../Pipeline/RasterizationPipeline.h"
#include "../Storage/Assembler.h"
#include "../Storage/ChunkStore.h"
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <server_http.hpp>
#include <thread>

using HttpServerImpl = SimpleWeb::Server<SimpleWeb::HTTP>;

class HttpServer {
public:
    HttpServer();

    void start();

    void join();

    void stop();

    auto getServer() -> HttpServerImpl & { return this->server; }

private:
    HttpServerImpl server;
    std::thread server_thread;
};

void UploadApi(const std::string &path, HttpServer *server,
               const std::shared_ptr<ChunkStore>& chunkStore, const std::shared_ptr<Assembler>& assembler);
void ConvertApi(const std::string &path, HttpServer *server,
                const std::shared_ptr<ImageToDocumentPipeline>& imagePipeline,
                const std::shared_ptr<RasterizationPipeline>& rasterizationPipeline);

#endif //DOCCONV_SERVER_HTTPSERVER_H
