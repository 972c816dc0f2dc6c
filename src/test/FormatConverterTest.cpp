#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>
#include "application/AudioNormalizer.hpp"
#include "application/FormatConverter.hpp"
#include "domain/Errors.hpp"
#include "TestSupport.hpp"

using namespace voicescribe;
using application::AudioNormalizer;
using application::FormatConverter;
using test::StubProcessRunner;

namespace {

// Tracks how many conversions overlap.
class SlowRunner : public domain::ProcessRunner {
public:
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    domain::ProcessResult run(const std::string&, const std::vector<std::string>& args) override {
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        {
            std::ofstream out(args.back(), std::ios::binary);
            out << "RIFF....WAVE";
        }
        --active;
        domain::ProcessResult result;
        result.launched = true;
        result.exitCode = 0;
        return result;
    }
};

} // namespace

static void ExpectConversionFailure(FormatConverter& converter, StubProcessRunner& runner, const std::filesystem::path& dir) {
    bool threw = false;
    try {
        converter.convert(test::WebmHeader());
    } catch (const domain::ConversionFailure&) {
        threw = true;
    }
    assert(threw);
    assert(!std::filesystem::exists(runner.lastInput));
    assert(!std::filesystem::exists(runner.lastOutput));
    assert(test::CountEntries(dir) == 0);
}

static void TestSuccessfulConversion() {
    std::cout << "[Test] Successful conversion..." << std::endl;
    auto dir = test::MakeScratchDir("convert_ok");
    auto runner = std::make_shared<StubProcessRunner>();
    FormatConverter converter(runner, "ffmpeg", 2, dir);

    auto result = converter.convert(test::WebmHeader());
    assert(result.extension == "wav");
    assert(result.bytes == runner->outputBytes);
    assert(runner->inputExistedDuringRun);
    assert(runner->inputSeen == test::WebmHeader());
    assert(runner->lastInput.parent_path() == dir);
    assert(runner->lastInput != runner->lastOutput);
    assert(test::CountEntries(dir) == 0);
    std::filesystem::remove_all(dir);
}

static void TestFailures() {
    auto dir = test::MakeScratchDir("convert_fail");
    auto runner = std::make_shared<StubProcessRunner>();
    FormatConverter converter(runner, "ffmpeg", 2, dir);

    std::cout << "[Test] Non-zero exit..." << std::endl;
    runner->behaviour = StubProcessRunner::Behaviour::ExitNonZero;
    runner->exitCode = 1;
    ExpectConversionFailure(converter, *runner, dir);

    std::cout << "[Test] Launch failure..." << std::endl;
    runner->behaviour = StubProcessRunner::Behaviour::FailLaunch;
    ExpectConversionFailure(converter, *runner, dir);

    std::cout << "[Test] Timeout..." << std::endl;
    runner->behaviour = StubProcessRunner::Behaviour::TimeOut;
    ExpectConversionFailure(converter, *runner, dir);

    std::cout << "[Test] Exit 0 without output..." << std::endl;
    runner->behaviour = StubProcessRunner::Behaviour::SucceedWithoutOutput;
    ExpectConversionFailure(converter, *runner, dir);

    std::cout << "[Test] Exit code is carried on the failure..." << std::endl;
    runner->behaviour = StubProcessRunner::Behaviour::ExitNonZero;
    runner->exitCode = 69;
    try {
        converter.convert(test::WebmHeader());
        assert(false);
    } catch (const domain::ConversionFailure& e) {
        assert(e.exitCode() == 69);
    }
    std::filesystem::remove_all(dir);
}

static void TestConcurrencyLimit() {
    std::cout << "[Test] Concurrent conversions respect the limit..." << std::endl;
    auto dir = test::MakeScratchDir("convert_gate");
    auto runner = std::make_shared<SlowRunner>();
    FormatConverter converter(runner, "ffmpeg", 2, dir);

    std::vector<std::thread> threads;
    std::atomic<int> succeeded{0};
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&]() {
            auto result = converter.convert(test::WebmHeader());
            if (result.extension == "wav") ++succeeded;
        });
    }
    for (auto& t : threads) t.join();

    assert(succeeded == 6);
    assert(runner->peak.load() <= 2);
    assert(test::CountEntries(dir) == 0);
    std::filesystem::remove_all(dir);
}

static void TestNormalizer() {
    auto dir = test::MakeScratchDir("normalize");
    auto runner = std::make_shared<StubProcessRunner>();
    auto normalizer = std::make_shared<AudioNormalizer>(std::make_shared<FormatConverter>(runner, "ffmpeg", 1, dir));

    std::cout << "[Test] WAV and MP3 pass through untouched..." << std::endl;
    auto wav = normalizer->normalize(test::WavHeader());
    assert(wav.extension == "wav" && wav.bytes == test::WavHeader());
    auto mp3 = normalizer->normalize(test::Mp3Header());
    assert(mp3.extension == "mp3" && mp3.bytes == test::Mp3Header());
    assert(runner->calls == 0);

    std::cout << "[Test] WebM and unknown input are converted..." << std::endl;
    auto webm = normalizer->normalize(test::WebmHeader());
    assert(webm.extension == "wav" && webm.bytes == runner->outputBytes);
    auto shortInput = normalizer->normalize("tiny");
    assert(shortInput.extension == "wav");
    assert(runner->calls == 2);
    assert(test::CountEntries(dir) == 0);
    std::filesystem::remove_all(dir);
}

static void TestUnusableTempDirectory() {
    std::cout << "[Test] Unusable temporary directory is a conversion failure..." << std::endl;
    const char* previous = std::getenv("TMPDIR");
    std::string saved = previous ? previous : "";
    setenv("TMPDIR", "/nonexistent/voicescribe-tmp", 1);

    auto runner = std::make_shared<StubProcessRunner>();
    FormatConverter converter(runner, "ffmpeg", 1);
    bool threw = false;
    try {
        converter.convert(test::WebmHeader());
    } catch (const domain::ConversionFailure&) {
        threw = true;
    }

    if (previous) {
        setenv("TMPDIR", saved.c_str(), 1);
    } else {
        unsetenv("TMPDIR");
    }
    assert(threw);
    assert(runner->calls == 0);
}

int main() {
    std::cout << "[Test] Starting FormatConverter Test..." << std::endl;
    TestSuccessfulConversion();
    TestFailures();
    TestConcurrencyLimit();
    TestNormalizer();
    TestUnusableTempDirectory();
    std::cout << "[PASS] Conversion leaves no transient files behind." << std::endl;
    return 0;
}
