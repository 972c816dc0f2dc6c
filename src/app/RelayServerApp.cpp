/**
 * @file RelayServerApp.cpp
 * @brief Implementation of the RelayServerApp class.
 */
#include "app/RelayServerApp.hpp"

#include "application/AudioNormalizer.hpp"
#include "application/FormatConverter.hpp"
#include "application/TranscriptionRelay.hpp"
#include "infrastructure/OpenAITranscriptionClient.hpp"
#include "infrastructure/ShellProcessRunner.hpp"

#include <csignal>
#include <iostream>
#include <pthread.h>
#include <thread>

namespace voicescribe::app {

RelayServerApp::RelayServerApp(const infrastructure::RelayConfig& config)
    : m_config(config) {}

bool RelayServerApp::Init() {
    if (!infrastructure::ShellProcessRunner::HasTool(m_config.ffmpegPath)) {
        std::cerr << "[RelayServerApp] Warning: '" << m_config.ffmpegPath
                  << "' not found. Only wav and mp3 uploads will work." << std::endl;
    }
    if (m_config.upstreamApiKey.empty()) {
        std::cerr << "[RelayServerApp] Warning: no upstream API key configured (set OPENAI_API_KEY)." << std::endl;
    }

    auto runner = std::make_shared<infrastructure::ShellProcessRunner>(m_config.conversionTimeoutSeconds);
    auto converter = std::make_shared<application::FormatConverter>(
        runner, m_config.ffmpegPath, m_config.maxConcurrentConversions);
    auto normalizer = std::make_shared<application::AudioNormalizer>(converter);
    auto speechToText = std::make_shared<infrastructure::OpenAITranscriptionClient>(
        m_config.upstreamBaseUrl, m_config.upstreamApiKey, m_config.upstreamModel, m_config.upstreamTimeoutSeconds);
    auto relay = std::make_shared<application::TranscriptionRelay>(normalizer, speechToText);

    m_server = std::make_unique<infrastructure::HttpRelayServer>(relay, m_config.maxBodyBytes, m_config.workerThreads);

    std::cout << "[RelayServerApp] Upstream: " << m_config.upstreamBaseUrl << " model=" << m_config.upstreamModel
              << ", conversions: max " << m_config.maxConcurrentConversions << " concurrent, "
              << m_config.conversionTimeoutSeconds << "s timeout" << std::endl;
    return true;
}

int RelayServerApp::Run() {
    // Block termination signals in every thread; a dedicated thread waits for them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    if (!Init()) {
        return 1;
    }

    std::thread signalWatcher([this, signals]() {
        int received = 0;
        if (sigwait(&signals, &received) == 0) {
            std::cout << "[RelayServerApp] Signal " << received << " received, shutting down" << std::endl;
            m_server->stop();
        }
    });

    bool ok = m_server->listen(m_config.host, m_config.port);

    if (!ok) {
        // Wake the watcher so it can be joined.
        pthread_kill(signalWatcher.native_handle(), SIGTERM);
    }
    signalWatcher.join();
    std::cout << "[RelayServerApp] Stopped" << std::endl;
    return ok ? 0 : 1;
}

} // namespace voicescribe::app
