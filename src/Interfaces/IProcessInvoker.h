//
// Interface for running external executables
// Lets the pipelines be tested against substitute tools
//

#ifndef DOCCONV_SERVER_I_PROCESS_INVOKER_H
#define DOCCONV_SERVER_I_PROCESS_INVOKER_H

#include <chrono>
#include <string>
#include <vector>

struct sProcessResult {
    int exitCode = -1;
    bool timedOut = false;
};

class IProcessInvoker {
public:
    virtual ~IProcessInvoker() = default;

    // True if the executable can be started with the given arguments and exits with status 0 within timeout
    virtual auto canRun(const std::string& executable, const std::vector<std::string>& args,
                        std::chrono::seconds timeout) -> bool = 0;

    // Runs the executable to completion or until timeout, after which it is killed.
    // Throws eSpawnError if it could not be started at all.
    virtual auto run(const std::string& executable, const std::vector<std::string>& args,
                     std::chrono::seconds timeout) -> sProcessResult = 0;
};

#endif //DOCCONV_SERVER_I_PROCESS_INVOKER_H
