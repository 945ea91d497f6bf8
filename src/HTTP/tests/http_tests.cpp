//
// End to end requests against the running http server
//

#include "../../Lib/GeneralUtils.h"
#include "../../Pipeline/RasterizationPipeline.h"
#include "../../Settings.h"
#include "../../tests/fixtures/HttpClientFixture.h"
#include "../../tests/fixtures/HttpServerFixture.h"
#include "../../tests/utils.h"
#include <array>
#include <boost/asio.hpp>
#include <boost/test/unit_test.hpp>
#include <chrono>
#include <thread>

struct HttpTestDataFixture : public HttpServerFixture, public HttpClientFixture {
    static auto url(const std::string& route) -> std::string {
        return std::string(API_PATH) + route;
    }

    auto postJson(const std::string& route, const nlohmann::json& body) -> std::shared_ptr<TestHttpClient::Response> {
        SimpleWeb::CaseInsensitiveMultimap headers;
        headers.emplace("Content-Type", "application/json");
        return httpClient.request("POST", url(route), body.dump(), headers);
    }

    auto uploadChunk(const std::string& uploadId, const std::string& index, const std::string& bytes)
            -> std::shared_ptr<TestHttpClient::Response> {
        return httpClient.request(
                "POST", url("upload-chunk?uploadId=" + uploadId + "&chunkIndex=" + index), bytes
        );
    }

    // Uploads bytes in chunks sent out of order and returns the registry key of the assembled file
    auto uploadFile(const std::string& uploadId, const std::string& bytes, const std::string& filename) -> std::string {
        auto half = bytes.size() / 2;
        BOOST_CHECK_EQUAL(std::stoi(uploadChunk(uploadId, "1", bytes.substr(half))->status_code), 200);
        BOOST_CHECK_EQUAL(std::stoi(uploadChunk(uploadId, "0", bytes.substr(0, half))->status_code), 200);

        auto response = postJson("assemble-upload", {{"uploadId", uploadId}, {"filename", filename}});
        BOOST_REQUIRE_EQUAL(std::stoi(response->status_code), 200);

        jsonResult = nlohmann::json::parse(response->content.string());
        return jsonResult["tempKey"].get<std::string>();
    }

    static auto header(const std::shared_ptr<TestHttpClient::Response>& response, const std::string& name) -> std::string {
        auto iter = response->header.find(name);
        return iter == response->header.end() ? std::string() : iter->second;
    }

    void checkError(const std::shared_ptr<TestHttpClient::Response>& response, int status, const std::string& code) {
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), status);
        jsonResult = nlohmann::json::parse(response->content.string());
        BOOST_CHECK_EQUAL(jsonResult["code"].get<std::string>(), code);
        BOOST_CHECK(!jsonResult["error"].get<std::string>().empty());
    }
};

BOOST_FIXTURE_TEST_SUITE(Http_test_suite, HttpTestDataFixture)
    BOOST_AUTO_TEST_CASE(test_usage_hints) {
        for (const auto* route : {"upload-chunk", "assemble-upload", "image-to-pdf", "pdf-to-images"}) {
            auto response = httpClient.request("GET", url(route));
            BOOST_CHECK_EQUAL(std::stoi(response->status_code), (int) SimpleWeb::StatusCode::success_ok);

            jsonResult = nlohmann::json::parse(response->content.string());
            BOOST_CHECK_EQUAL(jsonResult["ok"].get<bool>(), true);
            BOOST_CHECK(!jsonResult["message"].get<std::string>().empty());
        }
    }

    BOOST_AUTO_TEST_CASE(test_upload_chunk) {
        auto response = uploadChunk("session1", "0", "data");
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), (int) SimpleWeb::StatusCode::success_ok);

        jsonResult = nlohmann::json::parse(response->content.string());
        BOOST_CHECK_EQUAL(jsonResult["ok"].get<bool>(), true);
        BOOST_CHECK_EQUAL(jsonResult["uploadId"].get<std::string>(), "session1");
        BOOST_CHECK_EQUAL(jsonResult["chunkIndex"].get<std::string>(), "0");

        // The server picks an id when none is given
        response = httpClient.request("POST", url("upload-chunk?chunkIndex=0"), "data");
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), (int) SimpleWeb::StatusCode::success_ok);
        jsonResult = nlohmann::json::parse(response->content.string());
        BOOST_CHECK_EQUAL(jsonResult["uploadId"].get<std::string>().size(), 16);

        // The chunk index is required and both identifiers must be safe
        checkError(httpClient.request("POST", url("upload-chunk?uploadId=session1"), "data"), 400, "ValidationError");
        checkError(uploadChunk("..%2Fescape", "0", "data"), 400, "ValidationError");
        checkError(uploadChunk("session1", "a.b", "data"), 400, "ValidationError");
    }

    BOOST_AUTO_TEST_CASE(test_assemble_upload) {
        uploadChunk("session2", "2", "B");
        uploadChunk("session2", "10", "C");
        uploadChunk("session2", "1", "A");

        auto response = postJson("assemble-upload", {{"uploadId", "session2"}, {"filename", "letters.txt"}});
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), (int) SimpleWeb::StatusCode::success_ok);

        jsonResult = nlohmann::json::parse(response->content.string());
        BOOST_CHECK_EQUAL(jsonResult["ok"].get<bool>(), true);
        auto tempKey = jsonResult["tempKey"].get<std::string>();
        BOOST_CHECK_EQUAL(tempKey, "session2__letters.txt");

        auto path = application->getRegistry()->resolve(tempKey);
        BOOST_REQUIRE(path.has_value());
        BOOST_CHECK_EQUAL(readFile(*path), "ABC");

        // Assembling again conflicts with the finished session, late chunks are refused
        checkError(postJson("assemble-upload", {{"uploadId", "session2"}, {"filename", "letters.txt"}}), 409, "SessionStateError");
        checkError(uploadChunk("session2", "3", "D"), 409, "SessionStateError");
    }

    BOOST_AUTO_TEST_CASE(test_assemble_upload_errors) {
        checkError(postJson("assemble-upload", {{"uploadId", "session3"}}), 400, "ValidationError");
        checkError(postJson("assemble-upload", {{"filename", "a.pdf"}}), 400, "ValidationError");
        checkError(postJson("assemble-upload", {{"uploadId", "never-uploaded"}, {"filename", "a.pdf"}}), 400, "NoChunksError");
        checkError(httpClient.request("POST", url("assemble-upload"), "{not json"), 400, "ValidationError");
        checkError(httpClient.request("POST", url("assemble-upload"), "[1, 2]"), 400, "ValidationError");
    }

    BOOST_AUTO_TEST_CASE(test_image_to_pdf_inline) {
        jsonParams = {
                {"images", {base64Encode(makeJpeg(10, 20)), "data:image/png;base64," + base64Encode(makePng(30, 40))}},
                {"outputName", "scan.pdf"}
        };

        auto response = postJson("image-to-pdf", jsonParams);
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), (int) SimpleWeb::StatusCode::success_ok);
        BOOST_CHECK_EQUAL(header(response, "Content-Type"), "application/pdf");
        BOOST_CHECK_EQUAL(header(response, "Content-Disposition"), "attachment; filename=\"scan.pdf\"");

        auto pdf = response->content.string();
        BOOST_CHECK(pdf.rfind("%PDF-1.4", 0) == 0);

        auto pages = parsePdfPages(pdf);
        BOOST_REQUIRE_EQUAL(pages.size(), 2);
        BOOST_CHECK_EQUAL(pages[0].mediaWidth, 10);
        BOOST_CHECK_EQUAL(pages[1].mediaWidth, 30);
    }

    BOOST_AUTO_TEST_CASE(test_image_to_pdf_from_chunked_uploads) {
        auto first = uploadFile("image1", makeJpeg(64, 48), "first.jpg");
        auto second = uploadFile("image2", makePng(48, 64), "second.png");

        jsonParams = {
                {"tempKeys", second + "," + first},
                {"pageSize", "A4"},
                {"orientation", "landscape"},
                {"margin", "36"},
                {"quality", 90}
        };

        auto response = postJson("image-to-pdf", jsonParams);
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), (int) SimpleWeb::StatusCode::success_ok);
        BOOST_CHECK_EQUAL(header(response, "Content-Disposition"), "attachment; filename=\"images.pdf\"");

        auto pages = parsePdfPages(response->content.string());
        BOOST_REQUIRE_EQUAL(pages.size(), 2);
        BOOST_CHECK_EQUAL(pages[0].pixelWidth, 48);
        BOOST_CHECK_EQUAL(pages[1].pixelWidth, 64);
        BOOST_CHECK_CLOSE(pages[0].mediaWidth, A4_HEIGHT_POINTS, 0.0001);
    }

    BOOST_AUTO_TEST_CASE(test_image_to_pdf_errors) {
        checkError(postJson("image-to-pdf", nlohmann::json::object()), 400, "ValidationError");
        checkError(postJson("image-to-pdf", {{"images", nlohmann::json::array()}}), 400, "ValidationError");
        checkError(postJson("image-to-pdf", {{"images", {"not*base64"}}}), 400, "ValidationError");
        checkError(postJson("image-to-pdf", {{"images", "abc"}}), 400, "ValidationError");
        checkError(postJson("image-to-pdf", {{"tempKeys", {"unknown"}}}), 400, "MissingArtifactError");
        checkError(postJson("image-to-pdf", {{"images", {base64Encode(makeJpeg(4, 4))}}, {"pageSize", "tabloid"}}),
                   400, "ValidationError");
        checkError(postJson("image-to-pdf", {{"images", {base64Encode(makeJpeg(4, 4))}}, {"margin", "wide"}}),
                   400, "ValidationError");

        // Undecodable images are a server side conversion failure, reported before any document bytes
        auto response = postJson("image-to-pdf", {{"images", {base64Encode(makeJpeg(4, 4)), base64Encode("text")}}});
        checkError(response, 500, "ConversionError");
        BOOST_CHECK_EQUAL(header(response, "Content-Type"), "application/json");
    }

    BOOST_AUTO_TEST_CASE(test_pdf_to_images_raw_body) {
        SimpleWeb::CaseInsensitiveMultimap headers;
        headers.emplace("Content-Type", "application/pdf");

        auto response = httpClient.request("POST", url("pdf-to-images?outputName=doc.zip"), "%PDF-1.4 fake", headers);
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), (int) SimpleWeb::StatusCode::success_ok);
        BOOST_CHECK_EQUAL(header(response, "Content-Type"), "application/zip");
        BOOST_CHECK_EQUAL(header(response, "Content-Disposition"), "attachment; filename=\"doc.zip\"");

        auto entries = parseZip(response->content.string());
        BOOST_REQUIRE_EQUAL(entries.size(), FAKE_RASTERIZER_PAGES);
        for (std::size_t index = 0; index < entries.size(); index++) {
            BOOST_CHECK_EQUAL(entries[index].name, RasterizationPipeline::archiveEntryName(index));
            BOOST_CHECK(entries[index].data == pagePng + std::to_string(index + 1));
        }

        // The uploaded document did not outlive the request
        BOOST_CHECK_EQUAL(countEntriesWithPrefix(application->getScratch()->rasterUploadRoot(), ""), 0);
    }

    BOOST_AUTO_TEST_CASE(test_pdf_to_images_json) {
        auto response = postJson("pdf-to-images", {{"pdf", base64Encode("%PDF-1.4 fake")}});
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), (int) SimpleWeb::StatusCode::success_ok);
        BOOST_CHECK_EQUAL(header(response, "Content-Disposition"), "attachment; filename=\"images.zip\"");
        BOOST_CHECK_EQUAL(parseZip(response->content.string()).size(), FAKE_RASTERIZER_PAGES);

        // An assembled upload, only the first key counts
        auto tempKey = uploadFile("document1", "%PDF-1.4 assembled fake", "doc.pdf");
        response = postJson("pdf-to-images", {{"tempKeys", {tempKey, "ignored"}}});
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), (int) SimpleWeb::StatusCode::success_ok);
        BOOST_CHECK_EQUAL(parseZip(response->content.string()).size(), FAKE_RASTERIZER_PAGES);
    }

    BOOST_AUTO_TEST_CASE(test_pdf_to_images_errors) {
        checkError(postJson("pdf-to-images", nlohmann::json::object()), 400, "ValidationError");
        checkError(postJson("pdf-to-images", {{"tempKey", "unknown"}}), 400, "MissingArtifactError");
        checkError(postJson("pdf-to-images", {{"pdf", "not*base64"}}), 400, "ValidationError");

        SimpleWeb::CaseInsensitiveMultimap headers;
        headers.emplace("Content-Type", "application/pdf");
        checkError(httpClient.request("POST", url("pdf-to-images"), "", headers), 400, "ValidationError");
    }
BOOST_AUTO_TEST_SUITE_END()

struct UnavailableRasterizerFixture : public HttpClientFixture {
    TemporaryDirectory scratchDirectory;
    std::shared_ptr<Application> application;

    UnavailableRasterizerFixture()
    {
        setenv("SCRATCH_ROOT", scratchDirectory.path().c_str(), 1);
        setenv("RASTERIZER_EXECUTABLE", "docconv-no-such-rasterizer", 1);

        application = createApplication();
        application->start();

        BOOST_CHECK_EQUAL(acceptingConnections(8000), true);
    }

    ~UnavailableRasterizerFixture()
    {
        application->stop();

        unsetenv("SCRATCH_ROOT");
        unsetenv("RASTERIZER_EXECUTABLE");
    }

    UnavailableRasterizerFixture(UnavailableRasterizerFixture const&)                    = delete;
    auto operator=(UnavailableRasterizerFixture const&) -> UnavailableRasterizerFixture& = delete;
    UnavailableRasterizerFixture(UnavailableRasterizerFixture&&)                         = delete;
    auto operator=(UnavailableRasterizerFixture&&) -> UnavailableRasterizerFixture&      = delete;
};

BOOST_FIXTURE_TEST_SUITE(Http_unavailable_rasterizer_test_suite, UnavailableRasterizerFixture)
    BOOST_AUTO_TEST_CASE(test_pdf_to_images_without_rasterizer) {
        SimpleWeb::CaseInsensitiveMultimap headers;
        headers.emplace("Content-Type", "application/pdf");

        auto response = httpClient.request("POST", std::string(API_PATH) + "pdf-to-images", "%PDF-1.4 fake", headers);
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), (int) SimpleWeb::StatusCode::server_error_internal_server_error);

        jsonResult = nlohmann::json::parse(response->content.string());
        BOOST_CHECK_EQUAL(jsonResult["code"].get<std::string>(), "UnavailableError");
        BOOST_CHECK(jsonResult["error"].get<std::string>().find("pdftoppm") != std::string::npos);

        // Nothing was written to scratch for the request
        BOOST_CHECK_EQUAL(countEntriesWithPrefix(scratchDirectory.path(), RASTER_WORKDIR_PREFIX), 0);
        BOOST_CHECK_EQUAL(countEntriesWithPrefix(application->getScratch()->rasterUploadRoot(), ""), 0);

        // Image to PDF keeps working
        response = httpClient.request(
                "POST", std::string(API_PATH) + "image-to-pdf",
                nlohmann::json({{"images", {base64Encode(makeJpeg(4, 4))}}}).dump()
        );
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), (int) SimpleWeb::StatusCode::success_ok);
    }
BOOST_AUTO_TEST_SUITE_END()

// Pages large enough that an archive can't fit in the socket buffers, so the response is still being written when
// the client goes away
const uint32_t LARGE_PAGE_SIZE = 4 * 1024 * 1024;
const uint32_t LARGE_PAGE_COUNT = 8;

struct LargePageRasterizerFixture : public HttpClientFixture {
    TemporaryDirectory scratchDirectory;
    TemporaryDirectory toolDirectory;
    std::shared_ptr<Application> application;

    LargePageRasterizerFixture()
    {
        setenv("SCRATCH_ROOT", scratchDirectory.path().c_str(), 1);
        setenv("RASTERIZER_EXECUTABLE",
               writeFakeRasterizer(toolDirectory.path(), generateRandomData(LARGE_PAGE_SIZE), LARGE_PAGE_COUNT).c_str(), 1);

        application = createApplication();
        application->start();

        BOOST_CHECK_EQUAL(acceptingConnections(8000), true);
    }

    ~LargePageRasterizerFixture()
    {
        application->stop();

        unsetenv("SCRATCH_ROOT");
        unsetenv("RASTERIZER_EXECUTABLE");
    }

    LargePageRasterizerFixture(LargePageRasterizerFixture const&)                    = delete;
    auto operator=(LargePageRasterizerFixture const&) -> LargePageRasterizerFixture& = delete;
    LargePageRasterizerFixture(LargePageRasterizerFixture&&)                         = delete;
    auto operator=(LargePageRasterizerFixture&&) -> LargePageRasterizerFixture&      = delete;

    auto workDirectories() -> std::size_t {
        return countEntriesWithPrefix(scratchDirectory.path(), RASTER_WORKDIR_PREFIX);
    }
};

BOOST_FIXTURE_TEST_SUITE(Http_client_disconnect_test_suite, LargePageRasterizerFixture)
    BOOST_AUTO_TEST_CASE(test_client_disconnect_mid_archive) {
        boost::asio::io_context context;
        boost::asio::ip::tcp::socket socket(context);
        socket.connect({boost::asio::ip::make_address("127.0.0.1"), 8000});

        std::string body = "%PDF-1.4 fake document";
        std::string request = "POST " + std::string(API_PATH) + "pdf-to-images HTTP/1.1\r\n"
                              "Host: localhost:8000\r\n"
                              "Content-Type: application/pdf\r\n"
                              "Content-Length: " + std::to_string(body.size()) + "\r\n"
                              "\r\n" + body;
        boost::asio::write(socket, boost::asio::buffer(request));

        // Read just the status line and headers of the streamed archive
        std::string received;
        std::array<char, 4096> buffer{};
        while (received.find("\r\n\r\n") == std::string::npos) {
            auto count = socket.read_some(boost::asio::buffer(buffer));
            received.append(buffer.data(), count);
        }

        BOOST_CHECK_EQUAL(received.rfind("HTTP/1.1 200", 0), 0);
        BOOST_CHECK(received.find("chunked") != std::string::npos);

        // The archive is still being sent, so its pages are still on disk
        BOOST_CHECK_EQUAL(workDirectories(), 1);

        // Go away with most of the archive unread
        socket.close();

        // The server notices on its next send, stops archiving and removes the pages
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        while (workDirectories() != 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        BOOST_CHECK_EQUAL(workDirectories(), 0);

        // Nothing is left behind for the upload either
        BOOST_CHECK_EQUAL(countEntriesWithPrefix(application->getScratch()->rasterUploadRoot(), ""), 0);

        // The server carries on serving other clients
        auto response = httpClient.request("GET", std::string(API_PATH) + "pdf-to-images");
        BOOST_CHECK_EQUAL(std::stoi(response->status_code), (int) SimpleWeb::StatusCode::success_ok);
    }
BOOST_AUTO_TEST_SUITE_END()
