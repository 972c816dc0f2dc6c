/**
 * @file ClientApp.hpp
 * @brief Command-line client: transcribe files and manage local history.
 */

#pragma once

#include "domain/TranscriptionRepository.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace voicescribe::app {

/**
 * @class ClientApp
 * @brief Dispatches the `transcribe`, `history`, `show` and `delete` commands.
 */
class ClientApp {
public:
    /**
     * @param config Client settings (server URL, timeouts).
     * @param history Store receiving finished transcriptions.
     * @param out Final results and listings.
     * @param err Progress and error messages.
     */
    ClientApp(const infrastructure::ClientConfig& config,
              std::shared_ptr<domain::TranscriptionRepository> history,
              std::ostream& out,
              std::ostream& err);

    /**
     * @brief Runs one command.
     * @param args Arguments after the program name.
     * @return Exit code (0 for success).
     */
    int Run(const std::vector<std::string>& args);

    static void PrintUsage(std::ostream& os);

private:
    int transcribe(const std::string& filePath, bool synchronous);
    int listHistory();
    int show(const std::string& id);
    int remove(const std::string& id);

    infrastructure::ClientConfig m_config;
    std::shared_ptr<domain::TranscriptionRepository> m_history;
    std::ostream& m_out;
    std::ostream& m_err;
};

} // namespace voicescribe::app
