//
// Created by lewis on 2/10/20.
//

#ifndef DOCCONV_SERVER_GENERALUTILS_H
#define DOCCONV_SERVER_GENERALUTILS_H

#include "TestingMacros.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

auto base64Encode(std::string input) -> std::string;
auto base64Decode(std::string input) -> std::string;
auto generateRandomHex(uint32_t length) -> std::string;
auto isSafeIdentifier(const std::string& value) -> bool;
void dumpExceptions(std::exception& exception);
auto acceptingConnections(uint16_t port) -> bool;

struct InterruptableTimer {
    // Returns false if killed
    template<class R, class P>
    auto wait_for( std::chrono::duration<R,P> const& time ) const -> bool {
        std::unique_lock<std::mutex> lock(m);
        return !cv.wait_for(lock, time, [&]{ return terminate; });
    }

    void stop() {
        std::unique_lock<std::mutex> const lock(m);
        terminate = true;
        cv.notify_all();
    }

private:
    mutable std::condition_variable cv;
    mutable std::mutex m;
    bool terminate = false;
};

#endif //DOCCONV_SERVER_GENERALUTILS_H
