//
// Byte sink that streams a response body using HTTP chunked transfer encoding
//

#include "ChunkedResponseWriter.h"
#include "../Lib/Errors.h"
#include <future>
#include <iostream>
#include <sstream>

ChunkedResponseWriter::ChunkedResponseWriter(std::shared_ptr<HttpServerImpl::Response> response, uint64_t chunkSize)
        : response(std::move(response)), chunkSize(chunkSize == 0 ? 1 : chunkSize) {}

void ChunkedResponseWriter::begin(SimpleWeb::CaseInsensitiveMultimap headers) {
    headers.emplace("Transfer-Encoding", "chunked");

    // Write the headers
    response->write(SimpleWeb::StatusCode::success_ok, headers);
    send("headers");

    begun = true;
}

void ChunkedResponseWriter::write(const char* data, std::size_t size) {
    buffer.append(data, size);

    if (buffer.size() >= chunkSize) {
        flush();
    }
}

void ChunkedResponseWriter::flush() {
    if (buffer.empty()) {
        return;
    }

    std::ostringstream size;
    size << std::hex << buffer.size();

    *response << size.str() << "\r\n";
    response->write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    *response << "\r\n";

    sent += buffer.size();
    buffer.clear();

    send("content");
}

void ChunkedResponseWriter::finish() {
    if (finished) {
        return;
    }

    flush();

    *response << "0\r\n\r\n";
    send("terminating chunk");

    finished = true;
}

void ChunkedResponseWriter::abort() {
    if (finished) {
        return;
    }

    std::cerr << "API: Aborting streamed response after " << sent << " bytes" << '\n';

    buffer.clear();
    response->close_connection_after_response = true;
    finished = true;
}

void ChunkedResponseWriter::send(const std::string& what) {
    std::promise<SimpleWeb::error_code> sendPromise;
    response->send([&sendPromise](const SimpleWeb::error_code &errorCode) {
        sendPromise.set_value(errorCode);
    });

    if (auto errorCode = sendPromise.get_future().get()) {
        throw eClientDisconnected(
                "Error transmitting " + what + " to client. Perhaps client has disconnected? "
                + std::to_string(errorCode.value()) + " " + errorCode.message()
        );
    }
}
