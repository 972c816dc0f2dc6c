/**
 * @file ProcessRunner.hpp
 * @brief Interface for launching external programs.
 */

#pragma once
#include <string>
#include <vector>

namespace voicescribe::domain {

/**
 * @struct ProcessResult
 * @brief Outcome of one external process run.
 */
struct ProcessResult {
    bool launched = false; ///< False if the program could not be started at all.
    bool timedOut = false; ///< True if the run was killed for exceeding its time limit.
    int exitCode = -1; ///< Exit status when launched.
    std::string error; ///< Launch failure description.
};

/**
 * @class ProcessRunner
 * @brief Runs a program to completion and reports how it ended.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Blocks until the program exits or its time limit expires.
     * @param program Executable name or path.
     * @param args Arguments, passed verbatim.
     */
    virtual ProcessResult run(const std::string& program, const std::vector<std::string>& args) = 0;
};

} // namespace voicescribe::domain
