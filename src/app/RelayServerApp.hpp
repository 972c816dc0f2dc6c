/**
 * @file RelayServerApp.hpp
 * @brief Wires the relay components together and runs the HTTP server.
 */

#pragma once

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/HttpRelayServer.hpp"
#include <memory>

namespace voicescribe::app {

/**
 * @class RelayServerApp
 * @brief Owns the server lifecycle: construction from config, serving, and shutdown on SIGINT/SIGTERM.
 */
class RelayServerApp {
public:
    explicit RelayServerApp(const infrastructure::RelayConfig& config);

    /**
     * @brief Serves until a termination signal arrives.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /** @brief Builds the pipeline and checks external tools. */
    bool Init();

    infrastructure::RelayConfig m_config;
    std::unique_ptr<infrastructure::HttpRelayServer> m_server;
};

} // namespace voicescribe::app
