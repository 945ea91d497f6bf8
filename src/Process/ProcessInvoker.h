//
// Runs external executables with Boost.Process
//

#ifndef DOCCONV_SERVER_PROCESSINVOKER_H
#define DOCCONV_SERVER_PROCESSINVOKER_H

#include "../Interfaces/IProcessInvoker.h"

class ProcessInvoker : public IProcessInvoker {
public:
    auto canRun(const std::string& executable, const std::vector<std::string>& args,
                std::chrono::seconds timeout) -> bool override;

    auto run(const std::string& executable, const std::vector<std::string>& args,
             std::chrono::seconds timeout) -> sProcessResult override;

    // Finds the executable on PATH unless it already names a file. Returns an empty string if it can't be found.
    static auto resolveExecutable(const std::string& executable) -> std::string;
};

#endif //DOCCONV_SERVER_PROCESSINVOKER_H
