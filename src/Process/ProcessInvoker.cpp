//
// Runs external executables with Boost.Process
//

#include "ProcessInvoker.h"
#include "../Lib/Errors.h"
#include "../Lib/GeneralUtils.h"
#include <boost/process.hpp>
#include <iostream>
#include <system_error>

auto ProcessInvoker::resolveExecutable(const std::string& executable) -> std::string {
    if (executable.empty()) {
        return {};
    }

    // A path is used as given
    if (executable.find('/') != std::string::npos) {
        return executable;
    }

    return boost::process::search_path(executable).string();
}

auto ProcessInvoker::canRun(const std::string& executable, const std::vector<std::string>& args,
                            std::chrono::seconds timeout) -> bool {
    try {
        auto result = run(executable, args, timeout);
        return !result.timedOut && result.exitCode == 0;
    } catch (eSpawnError& exception) {
        dumpExceptions(exception);
        return false;
    }
}

auto ProcessInvoker::run(const std::string& executable, const std::vector<std::string>& args,
                         std::chrono::seconds timeout) -> sProcessResult {
    auto path = resolveExecutable(executable);
    if (path.empty()) {
        throw eSpawnError("Unable to find executable " + executable);
    }

    // Only the exit status matters, callers look at the files the tool produced
    std::error_code errorCode;
    boost::process::child child(
            boost::process::exe = path,
            boost::process::args = args,
            boost::process::std_in < boost::process::null,
            boost::process::std_out > boost::process::null,
            boost::process::std_err > boost::process::null,
            errorCode
    );

    if (errorCode) {
        throw eSpawnError("Unable to start " + path + ": " + errorCode.message());
    }

    sProcessResult result;

    if (!child.wait_for(timeout, errorCode)) {
        if (errorCode) {
            throw eSpawnError("Unable to wait for " + path + ": " + errorCode.message());
        }

        std::cerr << "Process: " << path << " did not finish within " << timeout.count() << " seconds, killing it" << '\n';

        std::error_code killError;
        child.terminate(killError);
        if (killError) {
            std::cerr << "Process: Unable to kill " << path << ": " << killError.message() << '\n';
        }

        result.timedOut = true;
        return result;
    }

    result.exitCode = child.exit_code();
    return result;
}
