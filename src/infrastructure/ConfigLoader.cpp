/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace voicescribe::infrastructure {

namespace {

std::optional<nlohmann::json> ReadSettings(const std::optional<std::string>& configPath) {
    std::filesystem::path path = configPath ? std::filesystem::path(*configPath) : PathUtils::GetSettingsPath();
    if (!std::filesystem::exists(path)) {
        if (configPath) {
            std::cerr << "[ConfigLoader] Settings file not found: " << path.string() << ". Using defaults." << std::endl;
        }
        return std::nullopt;
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] " << path.string() << " is not a JSON object. Using defaults." << std::endl;
            return std::nullopt;
        }
        return j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path.string() << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    // nlohmann converts negative numbers to unsigned targets by wrapping.
    if constexpr (std::is_unsigned_v<T>) {
        if (!it->is_number_unsigned()) {
            std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a non-negative integer, got "
                      << it->dump() << std::endl;
            return;
        }
    } else if constexpr (std::is_integral_v<T>) {
        if (!it->is_number_integer() ||
            it->get<long long>() < std::numeric_limits<T>::min() ||
            it->get<long long>() > std::numeric_limits<T>::max()) {
            std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected an integer, got "
                      << it->dump() << std::endl;
            return;
        }
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

template <typename T>
void ReadBoundedKey(const nlohmann::json& j, const char* key, T& target, T minimum, T maximum) {
    T value = target;
    ReadKey(j, key, value);
    if (value < minimum || value > maximum) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << value << " is outside ["
                  << minimum << ", " << maximum << "]" << std::endl;
        return;
    }
    target = value;
}

constexpr int kMaxPort = 65535;
constexpr int kMaxTimeoutSeconds = 24 * 60 * 60;
constexpr std::size_t kMaxWorkerThreads = 1024;
constexpr std::size_t kMaxConversions = 256;

const char* NonEmptyEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

RelayConfig ConfigLoader::LoadRelayConfig(const std::optional<std::string>& configPath) {
    RelayConfig config;
    if (auto j = ReadSettings(configPath)) {
        ReadKey(*j, "host", config.host);
        ReadBoundedKey(*j, "port", config.port, 1, kMaxPort);
        ReadKey(*j, "max_body_bytes", config.maxBodyBytes);
        ReadBoundedKey(*j, "worker_threads", config.workerThreads, std::size_t{1}, kMaxWorkerThreads);
        ReadKey(*j, "ffmpeg_path", config.ffmpegPath);
        ReadBoundedKey(*j, "conversion_timeout_seconds", config.conversionTimeoutSeconds, 0, kMaxTimeoutSeconds);
        ReadBoundedKey(*j, "max_concurrent_conversions", config.maxConcurrentConversions, std::size_t{1}, kMaxConversions);
        ReadKey(*j, "upstream_base_url", config.upstreamBaseUrl);
        ReadKey(*j, "upstream_api_key", config.upstreamApiKey);
        ReadKey(*j, "upstream_model", config.upstreamModel);
        ReadBoundedKey(*j, "upstream_timeout_seconds", config.upstreamTimeoutSeconds, 1, kMaxTimeoutSeconds);
    }
    ApplyEnvironment(config);
    return config;
}

ClientConfig ConfigLoader::LoadClientConfig(const std::optional<std::string>& configPath) {
    ClientConfig config;
    if (auto j = ReadSettings(configPath)) {
        ReadKey(*j, "server_url", config.serverUrl);
        ReadBoundedKey(*j, "client_timeout_seconds", config.timeoutSeconds, 1, kMaxTimeoutSeconds);
        ReadKey(*j, "history_path", config.historyPath);
    }
    ApplyEnvironment(config);
    return config;
}

void ConfigLoader::ApplyEnvironment(RelayConfig& config) {
    if (const char* port = NonEmptyEnv("VOICESCRIBE_PORT")) {
        try {
            int value = std::stoi(port);
            if (value < 1 || value > kMaxPort) {
                throw std::out_of_range("port");
            }
            config.port = value;
        } catch (const std::exception&) {
            std::cerr << "[ConfigLoader] Ignoring invalid VOICESCRIBE_PORT: " << port << std::endl;
        }
    }
    if (const char* ffmpeg = NonEmptyEnv("VOICESCRIBE_FFMPEG")) {
        config.ffmpegPath = ffmpeg;
    }
    if (const char* key = NonEmptyEnv("OPENAI_API_KEY")) {
        config.upstreamApiKey = key;
    }
    if (const char* baseUrl = NonEmptyEnv("OPENAI_BASE_URL")) {
        config.upstreamBaseUrl = baseUrl;
    }
}

void ConfigLoader::ApplyEnvironment(ClientConfig& config) {
    if (const char* url = NonEmptyEnv("VOICESCRIBE_SERVER_URL")) {
        config.serverUrl = url;
    }
}

} // namespace voicescribe::infrastructure
