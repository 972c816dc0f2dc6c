/**
 * @file ShellProcessRunner.hpp
 * @brief ProcessRunner that launches programs through the system shell.
 */

#pragma once
#include "domain/ProcessRunner.hpp"
#include <string>
#include <vector>

namespace voicescribe::infrastructure {

/**
 * @class ShellProcessRunner
 * @brief Runs a command via std::system, optionally wrapped in coreutils `timeout`.
 */
class ShellProcessRunner : public domain::ProcessRunner {
public:
    /**
     * @param timeoutSeconds Wall-clock limit per run; 0 disables the limit.
     */
    explicit ShellProcessRunner(int timeoutSeconds = 0);

    domain::ProcessResult run(const std::string& program, const std::vector<std::string>& args) override;

    /** @brief Checks that a program can be found on PATH. */
    static bool HasTool(const std::string& tool);

    /** @brief Quotes one argument for a POSIX shell. */
    static std::string Quote(const std::string& arg);

private:
    int m_timeoutSeconds;
};

} // namespace voicescribe::infrastructure
