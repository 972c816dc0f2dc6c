/**
 * @file HttpRelayServer.hpp
 * @brief HTTP surface of the transcription relay.
 */

#pragma once
#include "application/TranscriptionRelay.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace voicescribe::infrastructure {

/**
 * @class HttpRelayServer
 * @brief Serves `/api/transcribe`, `/api/transcribe/stream` and `/api/health` over cpp-httplib.
 */
class HttpRelayServer {
public:
    /**
     * @param relay Shared pipeline used by every request.
     * @param maxBodyBytes Largest accepted request body.
     * @param workerThreads Size of the connection thread pool.
     */
    HttpRelayServer(std::shared_ptr<application::TranscriptionRelay> relay,
                    std::size_t maxBodyBytes,
                    std::size_t workerThreads);
    ~HttpRelayServer();

    HttpRelayServer(const HttpRelayServer&) = delete;
    HttpRelayServer& operator=(const HttpRelayServer&) = delete;

    /** @brief Binds and serves until stop(). Returns false if the address cannot be bound. */
    bool listen(const std::string& host, int port);

    /** @brief Binds to an ephemeral port. @return The port, or -1 on failure. */
    int bindToAnyPort(const std::string& host);

    /** @brief Serves on a socket bound by bindToAnyPort(); blocks until stop(). */
    bool listenAfterBind();

    void stop();

private:
    void registerRoutes();

    std::shared_ptr<application::TranscriptionRelay> m_relay;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace voicescribe::infrastructure
