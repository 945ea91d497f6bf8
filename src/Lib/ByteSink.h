//
// Destination for streamed document and archive bytes
//

#ifndef DOCCONV_SERVER_BYTESINK_H
#define DOCCONV_SERVER_BYTESINK_H

#include <cstddef>
#include <cstdint>
#include <string>

class IByteSink {
public:
    virtual ~IByteSink() = default;

    // Appends bytes to the stream. Throws eClientDisconnected if the receiving end has gone away.
    virtual void write(const char* data, std::size_t size) = 0;

    // Pushes any buffered bytes to the receiving end
    virtual void flush() = 0;

    void write(const std::string& data) {
        write(data.data(), data.size());
    }
};

// Collects everything written in memory, used by tests and for small payloads
class StringByteSink : public IByteSink {
public:
    void write(const char* data, std::size_t size) override {
        buffer.append(data, size);
    }

    void flush() override {}

    using IByteSink::write;

    [[nodiscard]] auto str() const -> const std::string& { return buffer; }

private:
    std::string buffer;
};

// Tracks the absolute stream offset, which both the PDF cross-reference table and the ZIP central directory need
class CountingByteSink : public IByteSink {
public:
    explicit CountingByteSink(IByteSink& sink) : sink(sink) {}

    void write(const char* data, std::size_t size) override {
        sink.write(data, size);
        bytesWritten += size;
    }

    void flush() override {
        sink.flush();
    }

    using IByteSink::write;

    [[nodiscard]] auto offset() const -> uint64_t { return bytesWritten; }

private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    IByteSink& sink;
    uint64_t bytesWritten = 0;
};

#endif //DOCCONV_SERVER_BYTESINK_H
