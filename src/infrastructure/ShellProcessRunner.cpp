#include "infrastructure/ShellProcessRunner.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <sys/wait.h>

namespace voicescribe::infrastructure {

namespace {
// Exit codes reserved by the shell and by coreutils `timeout`.
constexpr int kShellNotExecutable = 126;
constexpr int kShellNotFound = 127;
constexpr int kTimeoutExpired = 124;
constexpr int kTimeoutKilled = 137;
constexpr int kKillGraceSeconds = 5;
}

ShellProcessRunner::ShellProcessRunner(int timeoutSeconds)
    : m_timeoutSeconds(timeoutSeconds) {}

std::string ShellProcessRunner::Quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

bool ShellProcessRunner::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + Quote(tool) + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

domain::ProcessResult ShellProcessRunner::run(const std::string& program, const std::vector<std::string>& args) {
    std::stringstream cmd;
    if (m_timeoutSeconds > 0) {
        cmd << "timeout --kill-after=" << kKillGraceSeconds << "s " << m_timeoutSeconds << "s ";
    }
    cmd << Quote(program);
    for (const auto& arg : args) {
        cmd << ' ' << Quote(arg);
    }
    cmd << " </dev/null";

    domain::ProcessResult result;
    int status = std::system(cmd.str().c_str());
    if (status == -1) {
        result.error = "Could not create a process for " + program;
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    if (result.exitCode == kShellNotFound || result.exitCode == kShellNotExecutable) {
        result.error = program + " could not be started (exit " + std::to_string(result.exitCode) + ")";
        return result;
    }

    result.launched = true;
    if (m_timeoutSeconds > 0 && (result.exitCode == kTimeoutExpired || result.exitCode == kTimeoutKilled)) {
        result.timedOut = true;
        std::cerr << "[ShellProcessRunner] " << program << " exceeded " << m_timeoutSeconds << "s and was stopped" << std::endl;
    }
    return result;
}

} // namespace voicescribe::infrastructure
