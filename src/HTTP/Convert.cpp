//
// Image to PDF and PDF to image conversions
//

#include "../Lib/Errors.h"
#include "ChunkedResponseWriter.h"
#include "HttpServer.h"
#include "HttpUtils.h"
#include <boost/algorithm/string/predicate.hpp>
#include <functional>

namespace {
    auto decodeBase64Field(const std::string& value, const std::string& field) -> std::string {
        try {
            return base64Decode(value);
        } catch (std::exception& exception) {
            throw eValidationError(field + " is not valid base64: " + exception.what());
        }
    }

    auto parseImageToDocumentRequest(const nlohmann::json& body) -> sImageToDocumentRequest {
        sImageToDocumentRequest request;

        // Assembled uploads take precedence over inline images
        request.tempKeys = getJsonStringList(body, "tempKeys");

        if (request.tempKeys.empty() && body.contains("images") && !body["images"].is_null()) {
            if (!body["images"].is_array()) {
                throw eValidationError("images must be an array of base64 encoded images");
            }

            for (const auto& image : body["images"]) {
                if (!image.is_string()) {
                    throw eValidationError("images must be an array of base64 encoded images");
                }
                request.images.push_back(decodeBase64Field(image.get<std::string>(), "images"));
            }
        }

        request.pageSizePolicy = parsePageSizePolicy(getJsonString(body, "pageSize"));
        request.orientation = parseOrientation(getJsonString(body, "orientation"));
        request.margin = getJsonNumber(body, "margin", 0);

        request.quality = normaliseQuality(getJsonNumber(body, "quality", DEFAULT_JPEG_QUALITY));

        auto outputName = getJsonString(body, "outputName");
        if (!outputName.empty()) {
            request.outputName = outputName;
        }

        return request;
    }

    auto parseRasterizationRequest(const std::shared_ptr<HttpServerImpl::Request>& httpRequest) -> sRasterizationRequest {
        sRasterizationRequest request;

        auto query_fields = httpRequest->parse_query_string();
        auto contentType = getHeader(httpRequest->header, "Content-Type");

        // A raw PDF body, optionally with a key of an assembled upload in the query string
        if (boost::algorithm::istarts_with(contentType, "application/pdf")) {
            request.tempKey = getQueryParamAsString(query_fields, "tempKey");
            if (request.tempKey.empty()) {
                request.document = httpRequest->content.string();
            }

            auto filename = getQueryParamAsString(query_fields, "filename");
            if (!filename.empty()) {
                request.uploadName = filename;
            }

            auto outputName = getQueryParamAsString(query_fields, "outputName");
            if (!outputName.empty()) {
                request.outputName = outputName;
            }

            return request;
        }

        auto body = readJsonBody(httpRequest);

        // Only the first of several keys is used
        auto tempKeys = getJsonStringList(body, "tempKeys");
        if (tempKeys.empty()) {
            tempKeys = getJsonStringList(body, "tempKey");
        }

        if (!tempKeys.empty()) {
            request.tempKey = tempKeys.front();
        } else {
            auto pdf = getJsonString(body, "pdf");
            if (!pdf.empty()) {
                request.document = decodeBase64Field(pdf, "pdf");
            }
        }

        auto filename = getJsonString(body, "filename");
        if (!filename.empty()) {
            request.uploadName = filename;
        }

        auto outputName = getJsonString(body, "outputName");
        if (!outputName.empty()) {
            request.outputName = outputName;
        }

        return request;
    }

    auto attachmentHeaders(const std::string& contentType, const std::string& filename) -> SimpleWeb::CaseInsensitiveMultimap {
        SimpleWeb::CaseInsensitiveMultimap headers;
        headers.emplace("Content-Type", contentType);
        headers.emplace("Content-Disposition", "attachment; filename=\"" + filename + "\"");
        return headers;
    }

    // Streams a body produced by produce. Failures before the headers went out become normal error responses,
    // later failures truncate the response.
    void streamResponse(const std::shared_ptr<HttpServerImpl::Response>& response,
                        const SimpleWeb::CaseInsensitiveMultimap& headers,
                        const std::function<void(IByteSink&)>& produce) {
        ChunkedResponseWriter writer(response);

        try {
            writer.begin(headers);
            produce(writer);
            writer.finish();
        } catch (eClientDisconnected& e) {
            // Remaining pages are not worth generating for nobody
            dumpExceptions(e);
            writer.abort();
        } catch (std::exception& e) {
            if (!writer.hasBegun()) {
                writeErrorResponse(response, e);
                return;
            }

            dumpExceptions(e);
            writer.abort();
        }
    }
}

void ConvertApi(const std::string &path, HttpServer *server,
                const std::shared_ptr<ImageToDocumentPipeline>& imagePipeline,
                const std::shared_ptr<RasterizationPipeline>& rasterizationPipeline) {
    // Post     -> Compose images into a PDF (image-to-pdf)
    // Post     -> Rasterize a PDF into a ZIP of PNG pages (pdf-to-images)
    // Get      -> Usage hints

    // Compose images into a PDF
    server->getServer().resource["^" + path + "image-to-pdf$"]["POST"] = [imagePipeline](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        sPreparedDocument document;
        try {
            // Read the json from the post body
            auto post_data = readJsonBody(request);

            // Every source is resolved and checked before the first byte of the document is sent
            document = imagePipeline->prepare(parseImageToDocumentRequest(post_data));
        } catch (std::exception& e) {
            writeErrorResponse(response, e);
            return;
        }

        streamResponse(
                response,
                attachmentHeaders("application/pdf", document.outputName),
                [&document](IByteSink& sink) {
                    auto pages = ImageToDocumentPipeline::write(document, sink);
                    std::cout << "API: Sent " << pages << " page document " << document.outputName << '\n';
                }
        );
    };

    server->getServer().resource["^" + path + "image-to-pdf$"]["GET"] = [](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &/*request*/) {
        writeUsageHint(
                response,
                "POST JSON with `images` (base64 encoded JPEG or PNG) or `tempKeys` to create a PDF. "
                "Optional fields: pageSize (auto|A4|letter), orientation, margin, quality, outputName."
        );
    };

    // Rasterize a PDF into a ZIP of PNG pages
    server->getServer().resource["^" + path + "pdf-to-images$"]["POST"] = [rasterizationPipeline](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        // Owns the work directory, which is removed when this handler returns however the response ended
        sRasterizedDocument document;
        try {
            document = rasterizationPipeline->rasterize(parseRasterizationRequest(request));
        } catch (std::exception& e) {
            writeErrorResponse(response, e);
            return;
        }

        streamResponse(
                response,
                attachmentHeaders("application/zip", document.outputName),
                [&document](IByteSink& sink) {
                    RasterizationPipeline::writeArchive(document, sink);
                    std::cout << "API: Sent " << document.pages.size() << " page archive " << document.outputName << '\n';
                }
        );
    };

    server->getServer().resource["^" + path + "pdf-to-images$"]["GET"] = [](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &/*request*/) {
        writeUsageHint(
                response,
                "POST a PDF as the raw body with Content-Type application/pdf, or JSON with `pdf` (base64) or "
                "`tempKeys`, to receive a ZIP of PNG pages named page_1.png, page_2.png, ..."
        );
    };
}
