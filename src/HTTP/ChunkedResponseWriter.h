//
// Byte sink that streams a response body using HTTP chunked transfer encoding
//

#ifndef DOCCONV_SERVER_CHUNKEDRESPONSEWRITER_H
#define DOCCONV_SERVER_CHUNKEDRESPONSEWRITER_H

#include "../Lib/ByteSink.h"
#include "../Settings.h"
#include "HttpServer.h"
#include <memory>
#include <string>

class ChunkedResponseWriter : public IByteSink {
public:
    explicit ChunkedResponseWriter(std::shared_ptr<HttpServerImpl::Response> response,
                                   uint64_t chunkSize = RESPONSE_CHUNK_SIZE);

    // Sends the 200 status line and headers. Once this has succeeded errors can only be reported by abort().
    void begin(SimpleWeb::CaseInsensitiveMultimap headers);

    // Buffers data, sending a chunk each time chunkSize bytes have accumulated
    void write(const char* data, std::size_t size) override;

    // Sends whatever is buffered as one chunk
    void flush() override;

    using IByteSink::write;

    // Sends the remaining data and the terminating zero length chunk
    void finish();

    // Ends a response that failed part way through. The terminating chunk is withheld and the connection is closed,
    // so the client sees a truncated transfer rather than a complete body.
    void abort();

    [[nodiscard]] auto hasBegun() const -> bool { return begun; }

private:
    // Waits until everything written to the response so far has been handed to the socket
    void send(const std::string& what);

    std::shared_ptr<HttpServerImpl::Response> response;
    uint64_t chunkSize;
    std::string buffer;
    uint64_t sent = 0;
    bool begun = false;
    bool finished = false;
};

#endif //DOCCONV_SERVER_CHUNKEDRESPONSEWRITER_H
