/**
 * @file TestSupport.hpp
 * @brief Mock collaborators shared by the test executables.
 */

#pragma once

#include "application/EventChannel.hpp"
#include "domain/Errors.hpp"
#include "domain/ProcessRunner.hpp"
#include "domain/SpeechToTextService.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace voicescribe::test {

/** @brief Twelve-byte headers that classify as each format. */
inline std::string WavHeader() { return std::string("RIFF\x24\x00\x00\x00WAVE", 12) + "fmt "; }
inline std::string Mp3Header() { return std::string("ID3\x04\x00\x00\x00\x00\x00\x00\x00\x00", 12) + "data"; }
inline std::string WebmHeader() { return std::string("\x1A\x45\xDF\xA3\x9F\x42\x86\x81\x01\x42\xF7\x81", 12) + "webm"; }

/**
 * @brief Scripted upstream provider.
 */
class MockSpeechToText : public domain::SpeechToTextService {
public:
    std::vector<std::string> fragments;
    std::string syncText = "sync transcript";
    bool failBeforeStream = false;
    int failAfterFragments = -1; ///< Throw once this many fragments were delivered; -1 never.
    std::chrono::milliseconds fragmentDelay{0}; ///< Pause before each fragment, like a live provider.

    std::atomic<int> deliveredFragments{0};
    std::atomic<int> streamCalls{0};
    std::atomic<int> syncCalls{0};
    domain::NormalizedAudio lastAudio;

    std::string transcribe(const domain::NormalizedAudio& audio) override {
        ++syncCalls;
        lastAudio = audio;
        if (failBeforeStream) {
            throw domain::UpstreamFailure("provider unavailable", 503);
        }
        return syncText;
    }

    bool transcribeStream(const domain::NormalizedAudio& audio, const OnDelta& onDelta) override {
        ++streamCalls;
        lastAudio = audio;
        if (failBeforeStream) {
            throw domain::UpstreamFailure("provider unavailable", 503);
        }
        for (std::size_t i = 0; i < fragments.size(); ++i) {
            if (failAfterFragments >= 0 && static_cast<int>(i) == failAfterFragments) {
                throw domain::UpstreamFailure("stream interrupted");
            }
            if (fragmentDelay.count() > 0) {
                std::this_thread::sleep_for(fragmentDelay);
            }
            ++deliveredFragments;
            if (!onDelta(fragments[i])) {
                return false;
            }
        }
        if (failAfterFragments >= 0 && static_cast<std::size_t>(failAfterFragments) >= fragments.size()) {
            throw domain::UpstreamFailure("stream interrupted");
        }
        return true;
    }
};

/**
 * @brief Process runner that never launches anything.
 *
 * Records the input/output paths from ffmpeg-style arguments and, on success,
 * writes `outputBytes` to the output path.
 */
class StubProcessRunner : public domain::ProcessRunner {
public:
    enum class Behaviour { Succeed, ExitNonZero, FailLaunch, TimeOut, SucceedWithoutOutput };

    Behaviour behaviour = Behaviour::Succeed;
    int exitCode = 1;
    std::string outputBytes = std::string("RIFF\x10\x00\x00\x00WAVEfmt converted", 27);

    std::atomic<int> calls{0};
    std::filesystem::path lastInput;
    std::filesystem::path lastOutput;
    bool inputExistedDuringRun = false;
    std::string inputSeen;

    domain::ProcessResult run(const std::string&, const std::vector<std::string>& args) override {
        ++calls;
        std::lock_guard<std::mutex> lock(m_mutex);
        for (std::size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == "-i") lastInput = args[i + 1];
        }
        lastOutput = args.empty() ? std::filesystem::path() : std::filesystem::path(args.back());
        inputExistedDuringRun = std::filesystem::exists(lastInput);
        if (inputExistedDuringRun) {
            std::ifstream in(lastInput, std::ios::binary);
            inputSeen.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        domain::ProcessResult result;
        switch (behaviour) {
            case Behaviour::FailLaunch:
                result.error = "ffmpeg could not be started (exit 127)";
                return result;
            case Behaviour::TimeOut:
                result.launched = true;
                result.timedOut = true;
                result.exitCode = 124;
                writeOutput("partial");
                return result;
            case Behaviour::ExitNonZero:
                result.launched = true;
                result.exitCode = exitCode;
                writeOutput("partial");
                return result;
            case Behaviour::SucceedWithoutOutput:
                result.launched = true;
                result.exitCode = 0;
                return result;
            case Behaviour::Succeed:
                result.launched = true;
                result.exitCode = 0;
                writeOutput(outputBytes);
                return result;
        }
        return result;
    }

private:
    void writeOutput(const std::string& bytes) {
        std::ofstream out(lastOutput, std::ios::binary);
        out << bytes;
    }

    std::mutex m_mutex;
};

/**
 * @brief EventChannel that records everything the relay does.
 */
class RecordingChannel : public application::EventChannel {
public:
    bool opened = false;
    bool closed = false;
    bool throwOnOpen = false;
    int failWritesFrom = -1; ///< write() returns false from this index on; -1 never.
    int jsonStatus = 0;
    nlohmann::json jsonBody;
    std::vector<std::string> frames;
    int writeAttempts = 0;

    void respond(int status, const nlohmann::json& body) override {
        jsonStatus = status;
        jsonBody = body;
    }

    void open() override {
        if (throwOnOpen) {
            throw std::runtime_error("headers could not be sent");
        }
        opened = true;
    }

    bool write(const std::string& frame) override {
        int index = writeAttempts++;
        if (failWritesFrom >= 0 && index >= failWritesFrom) {
            return false;
        }
        frames.push_back(frame);
        return true;
    }

    void close() override { closed = true; }
};

/** @brief Fresh scratch directory under the system temp directory. */
inline std::filesystem::path MakeScratchDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("voicescribe_test_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

/** @brief Number of entries in a directory. */
inline std::size_t CountEntries(const std::filesystem::path& dir) {
    std::size_t count = 0;
    for (auto it = std::filesystem::directory_iterator(dir); it != std::filesystem::directory_iterator(); ++it) {
        ++count;
    }
    return count;
}

} // namespace voicescribe::test
