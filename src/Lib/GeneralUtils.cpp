#include "GeneralUtils.h"
#include "../Settings.h"
#include <algorithm>
#include <cctype>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <folly/experimental/exception_tracer/ExceptionTracer.h>
#include <folly/experimental/exception_tracer/StackTrace.h>
#include <iostream>
#include <random>
#include <string>
#include <thread>

// From https://github.com/kenba/via-httplib/blob/master/include/via/http/authentication/base64.hpp
auto base64Encode(std::string input) -> std::string
{
    // The input must be in multiples of 3, otherwise the transformation
    // may overflow the input buffer, so pad with zero.
    const uint32_t num_pad_chars((3 - input.size() % 3) % 3);
    input.append(num_pad_chars, 0);

    // Transform to Base64
    using boost::archive::iterators::transform_width, boost::archive::iterators::base64_from_binary;
    // NOLINTNEXTLINE (cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    using ItBase64T = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;
    std::string output(ItBase64T(input.begin()),
                       ItBase64T(input.end() - num_pad_chars));

    // Pad blank characters with =
    output.append(num_pad_chars, '=');

    return output;
}

// From https://github.com/kenba/via-httplib/blob/master/include/via/http/authentication/base64.hpp
auto base64Decode(std::string input) -> std::string
{
    using boost::archive::iterators::transform_width, boost::archive::iterators::binary_from_base64;

    // NOLINTNEXTLINE (cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    using ItBinaryT = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

    // Strip any data url prefix ("data:image/png;base64,")
    auto comma = input.find(',');
    if (input.rfind("data:", 0) == 0 && comma != std::string::npos) {
        input.erase(0, comma + 1);
    }

    // Drop line breaks and existing padding before the padding is recomputed from the remaining length
    input.erase(std::remove_if(input.begin(), input.end(), [](unsigned char character) {
        return std::isspace(character) != 0 || character == '=';
    }), input.end());

    // If the input isn't a multiple of 4, pad with A (zero bits) and trim the surplus output afterwards
    const uint32_t num_pad_chars((4 - input.size() % 4) % 4);
    input.append(num_pad_chars, 'A');

    // binary_from_base64 throws dataflow_exception on characters outside the alphabet
    std::string output(ItBinaryT(input.begin()), ItBinaryT(input.end()));
    output.erase(output.end() - std::min<std::size_t>(num_pad_chars, output.size()), output.end());
    return output;
}

auto generateRandomHex(uint32_t length) -> std::string {
    static const char* digits = "0123456789abcdef";
    thread_local std::mt19937_64 generator(std::random_device{}());
    std::uniform_int_distribution<int> distribution(0, 15);

    std::string result;
    result.reserve(length);
    for (uint32_t i = 0; i < length; i++) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        result.push_back(digits[distribution(generator)]);
    }
    return result;
}

// Identifiers that end up as path components (upload ids, chunk indices) must be [A-Za-z0-9_-]{1,64}
auto isSafeIdentifier(const std::string& value) -> bool {
    if (value.empty() || value.size() > MAX_IDENTIFIER_LENGTH) {
        return false;
    }

    return std::all_of(value.begin(), value.end(), [](unsigned char character) {
        return std::isalnum(character) != 0 || character == '_' || character == '-';
    });
}

void dumpExceptions(std::exception& exception) {
    std::cerr << "--- Exception: " << exception.what() << '\n';
    auto exceptions = folly::exception_tracer::getCurrentExceptions();
    for (auto& exc : exceptions) {
        std::cerr << exc << "\n";
    }
}

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
auto acceptingConnections(uint16_t port) -> bool {
    using boost::asio::io_service, boost::asio::ip::tcp;
    using ec = boost::system::error_code;

    bool result = false;

    for (auto counter = 0; counter < 10 && !result; counter++) {
        try {
            io_service svc;
            tcp::socket socket(svc);
            boost::asio::steady_timer tim(svc, std::chrono::milliseconds(100));

            tim.async_wait([&](ec) { socket.cancel(); });
            socket.async_connect({{}, port}, [&](ec errorCode) {
                result = !errorCode;
            });

            svc.run();
        } catch (std::exception& exception) {
            // Connection errors are expected while the server is still starting
            std::cerr << "Waiting for port " << port << ": " << exception.what() << '\n';
        }

        if (!result) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    return result;
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

// To prevent the compiler optimizing away the exception tracing from folly, we need to reference it.
extern "C" auto getCaughtExceptionStackTraceStack() -> const folly::exception_tracer::StackTrace*;
extern "C" auto getUncaughtExceptionStackTraceStack() -> const folly::exception_tracer::StackTraceStack*;

// forceExceptionStackTraceRef is intentionally unused and marked volatile so the compiler doesn't optimize away the
// required functions from folly.
volatile void forceExceptionStackTraceRef()
{
    getCaughtExceptionStackTraceStack();
    getUncaughtExceptionStackTraceStack();
}
