//
// Chunked upload staging and assembly
//

#include "../Lib/Errors.h"
#include "HttpServer.h"
#include "HttpUtils.h"

// Length of server generated upload ids, in hex digits
const uint32_t GENERATED_UPLOAD_ID_LENGTH = 16;

void UploadApi(const std::string &path, HttpServer *server,
               const std::shared_ptr<ChunkStore>& chunkStore, const std::shared_ptr<Assembler>& assembler) {
    // Post     -> Store one chunk (upload-chunk)
    // Post     -> Assemble the stored chunks (assemble-upload)
    // Get      -> Usage hints

    // Store one chunk of an upload
    server->getServer().resource["^" + path + "upload-chunk$"]["POST"] = [chunkStore](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        try {
            // Process the query parameters
            auto query_fields = request->parse_query_string();

            // The first chunk of an upload may leave it to the server to pick the id
            auto uploadId = getQueryParamAsString(query_fields, "uploadId");
            if (uploadId.empty()) {
                uploadId = generateRandomHex(GENERATED_UPLOAD_ID_LENGTH);
            }

            auto chunkIndex = getQueryParamAsString(query_fields, "chunkIndex");
            if (chunkIndex.empty()) {
                throw eValidationError("chunkIndex is required");
            }

            // The body is the raw chunk
            auto bytes = request->content.string();
            chunkStore->putChunk(uploadId, chunkIndex, bytes);

            // Report success
            nlohmann::json result;
            result["ok"] = true;
            result["uploadId"] = uploadId;
            result["chunkIndex"] = chunkIndex;

            writeJsonResponse(response, SimpleWeb::StatusCode::success_ok, result);
        } catch (std::exception& e) {
            writeErrorResponse(response, e);
        }
    };

    server->getServer().resource["^" + path + "upload-chunk$"]["GET"] = [](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &/*request*/) {
        writeUsageHint(
                response,
                "POST the raw chunk bytes to upload-chunk?uploadId=<id>&chunkIndex=<index>. "
                "Omit uploadId on the first chunk to have one generated."
        );
    };

    // Assemble the chunks of an upload into one file
    server->getServer().resource["^" + path + "assemble-upload$"]["POST"] = [assembler](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        try {
            // Read the json from the post body
            auto post_data = readJsonBody(request);

            auto uploadId = getJsonString(post_data, "uploadId");
            auto filename = getJsonString(post_data, "filename");
            if (uploadId.empty() || filename.empty()) {
                throw eValidationError("uploadId and filename required");
            }

            auto tempKey = assembler->assemble(uploadId, filename);

            // Report success
            nlohmann::json result;
            result["ok"] = true;
            result["tempKey"] = tempKey;

            writeJsonResponse(response, SimpleWeb::StatusCode::success_ok, result);
        } catch (std::exception& e) {
            writeErrorResponse(response, e);
        }
    };

    server->getServer().resource["^" + path + "assemble-upload$"]["GET"] = [](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &/*request*/) {
        writeUsageHint(
                response,
                "POST JSON {uploadId, filename} to assemble-upload once every chunk has been uploaded. "
                "The returned tempKey can be passed to image-to-pdf or pdf-to-images."
        );
    };
}
