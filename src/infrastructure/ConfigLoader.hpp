/**
 * @file ConfigLoader.hpp
 * @brief Loads relay and client settings from settings.json and the environment.
 *
 * Precedence, lowest to highest: built-in defaults, settings.json,
 * environment variables. Command-line flags are applied by the executables.
 */

#pragma once

#include <cstddef>
#include <string>
#include <optional>

namespace voicescribe::infrastructure {

/**
 * @struct RelayConfig
 * @brief Settings of the relay server.
 */
struct RelayConfig {
    std::string host = "0.0.0.0";
    int port = 5000;
    std::size_t maxBodyBytes = 50 * 1024 * 1024; ///< Base64 JSON bodies up to 50 MB.
    std::size_t workerThreads = 8;
    std::string ffmpegPath = "ffmpeg";
    int conversionTimeoutSeconds = 120;
    std::size_t maxConcurrentConversions = 4;
    std::string upstreamBaseUrl = "https://api.openai.com";
    std::string upstreamApiKey;
    std::string upstreamModel = "gpt-4o-mini-transcribe";
    int upstreamTimeoutSeconds = 600;
};

/**
 * @struct ClientConfig
 * @brief Settings of the command-line client.
 */
struct ClientConfig {
    std::string serverUrl = "http://localhost:5000";
    int timeoutSeconds = 600;
    std::string historyPath; ///< Empty selects the default data directory.
};

class ConfigLoader {
public:
    /**
     * @brief Reads relay settings.
     * @param configPath settings.json to read; the XDG default when not given.
     * A missing or malformed file leaves the defaults in place.
     */
    static RelayConfig LoadRelayConfig(const std::optional<std::string>& configPath = std::nullopt);

    /** @brief Reads client settings. @see LoadRelayConfig */
    static ClientConfig LoadClientConfig(const std::optional<std::string>& configPath = std::nullopt);

    /** @brief Overrides relay settings from VOICESCRIBE_PORT, VOICESCRIBE_FFMPEG, OPENAI_API_KEY, OPENAI_BASE_URL. */
    static void ApplyEnvironment(RelayConfig& config);

    /** @brief Overrides client settings from VOICESCRIBE_SERVER_URL. */
    static void ApplyEnvironment(ClientConfig& config);
};

} // namespace voicescribe::infrastructure
