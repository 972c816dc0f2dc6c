#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "application/StreamDecoder.hpp"
#include "application/TranscriptionRelay.hpp"
#include "infrastructure/Base64.hpp"
#include "TestSupport.hpp"

using namespace voicescribe;
using application::TranscriptionRelay;
using infrastructure::Base64;
using json = nlohmann::json;

namespace {

struct Fixture {
    std::filesystem::path dir = test::MakeScratchDir("relay");
    std::shared_ptr<test::StubProcessRunner> runner = std::make_shared<test::StubProcessRunner>();
    std::shared_ptr<test::MockSpeechToText> upstream = std::make_shared<test::MockSpeechToText>();
    TranscriptionRelay relay{
        std::make_shared<application::AudioNormalizer>(
            std::make_shared<application::FormatConverter>(runner, "ffmpeg", 1, dir)),
        upstream};

    ~Fixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

std::string RequestFor(const std::string& bytes) {
    return json{{"audio", Base64::Encode(bytes)}}.dump();
}

std::string Joined(const std::vector<std::string>& frames) {
    std::string all;
    for (const auto& frame : frames) all += frame;
    return all;
}

} // namespace

static void TestStreamHappyPath() {
    std::cout << "[Test] Deltas followed by done..." << std::endl;
    Fixture f;
    f.upstream->fragments = {"Hello", "", " world", "!"};
    test::RecordingChannel channel;

    f.relay.transcribeStream(RequestFor(test::WavHeader()), channel);

    assert(channel.opened && channel.closed);
    assert(channel.jsonStatus == 0);
    assert(channel.frames.size() == 4);
    assert(channel.frames[0] == "data: {\"text\":\"Hello\",\"type\":\"delta\"}\n\n");
    assert(channel.frames[3] == "data: {\"text\":\"Hello world!\",\"type\":\"done\"}\n\n");
    assert(f.upstream->lastAudio.extension == "wav");
    assert(f.runner->calls == 0);

    // What the relay emits is exactly what the client decoder understands.
    application::StreamDecoder decoder;
    decoder.feed(Joined(channel.frames));
    assert(decoder.completed() && decoder.text() == "Hello world!");
}

static void TestStreamConvertsWebm() {
    std::cout << "[Test] WebM input goes through conversion..." << std::endl;
    Fixture f;
    f.upstream->fragments = {"ok"};
    test::RecordingChannel channel;

    f.relay.transcribeStream(RequestFor(test::WebmHeader()), channel);

    assert(f.runner->calls == 1);
    assert(f.upstream->lastAudio.extension == "wav");
    assert(f.upstream->lastAudio.bytes == f.runner->outputBytes);
    assert(channel.frames.back().find("\"type\":\"done\"") != std::string::npos);
    assert(test::CountEntries(f.dir) == 0);
}

static void TestStreamRejectsBadRequests() {
    std::cout << "[Test] Missing audio answers 400 before streaming..." << std::endl;
    Fixture f;
    const std::string bodies[] = {"{}", "{\"audio\":\"\"}", "{\"audio\":42}", "not json", "[1]"};
    for (const auto& body : bodies) {
        test::RecordingChannel channel;
        f.relay.transcribeStream(body, channel);
        assert(!channel.opened);
        assert(channel.frames.empty());
        assert(channel.jsonStatus == 400);
        assert(channel.jsonBody.contains("error"));
    }
    test::RecordingChannel channel;
    f.relay.transcribeStream("{}", channel);
    assert(channel.jsonBody["error"] == "Audio data (base64) is required");
    assert(f.upstream->streamCalls == 0);
}

static void TestStreamFailureBeforeCommit() {
    std::cout << "[Test] Failure before headers are sent answers 500..." << std::endl;
    Fixture f;
    test::RecordingChannel channel;
    channel.throwOnOpen = true;

    f.relay.transcribeStream(RequestFor(test::WavHeader()), channel);

    assert(channel.jsonStatus == 500);
    assert(channel.frames.empty());
    assert(f.upstream->streamCalls == 0);
}

static void TestStreamFailureAfterCommit() {
    std::cout << "[Test] Upstream failure mid-stream yields a single error event..." << std::endl;
    Fixture f;
    f.upstream->fragments = {"Hel", "lo", "never"};
    f.upstream->failAfterFragments = 2;
    test::RecordingChannel channel;

    f.relay.transcribeStream(RequestFor(test::WavHeader()), channel);

    assert(channel.jsonStatus == 0);
    assert(channel.closed);
    assert(channel.frames.size() == 3);
    assert(channel.frames[2].find("\"type\":\"error\"") != std::string::npos);
    assert(Joined(channel.frames).find("\"type\":\"done\"") == std::string::npos);

    std::cout << "[Test] Conversion failure after commit is an error event..." << std::endl;
    Fixture g;
    g.runner->behaviour = test::StubProcessRunner::Behaviour::ExitNonZero;
    test::RecordingChannel converted;
    g.relay.transcribeStream(RequestFor(test::WebmHeader()), converted);
    assert(converted.opened && converted.jsonStatus == 0);
    assert(converted.frames.size() == 1);
    assert(converted.frames[0].find("\"type\":\"error\"") != std::string::npos);
    assert(g.upstream->streamCalls == 0);
    assert(test::CountEntries(g.dir) == 0);

    std::cout << "[Test] Invalid base64 after commit is an error event..." << std::endl;
    test::RecordingChannel garbled;
    g.relay.transcribeStream("{\"audio\":\"!!!\"}", garbled);
    assert(garbled.opened && garbled.jsonStatus == 0);
    assert(garbled.frames.size() == 1 && garbled.frames[0].find("\"type\":\"error\"") != std::string::npos);
}

static void TestClientDisconnect() {
    std::cout << "[Test] Client disconnect stops upstream consumption..." << std::endl;
    Fixture f;
    f.upstream->fragments = {"a", "b", "c", "d", "e"};
    test::RecordingChannel channel;
    channel.failWritesFrom = 1;

    f.relay.transcribeStream(RequestFor(test::WavHeader()), channel);

    assert(f.upstream->deliveredFragments == 2);
    assert(channel.frames.size() == 1);
    assert(channel.writeAttempts == 2);
    assert(channel.closed);
}

static void TestSyncEndpoint() {
    std::cout << "[Test] Synchronous transcription..." << std::endl;
    Fixture f;
    auto ok = f.relay.transcribe(RequestFor(test::Mp3Header()));
    assert(ok.status == 200 && ok.body["text"] == "sync transcript");
    assert(f.upstream->lastAudio.extension == "mp3");

    auto missing = f.relay.transcribe("{\"other\":1}");
    assert(missing.status == 400 && missing.body["error"] == "Audio data (base64) is required");

    auto badBase64 = f.relay.transcribe("{\"audio\":\"%%%\"}");
    assert(badBase64.status == 400);

    f.upstream->failBeforeStream = true;
    auto failed = f.relay.transcribe(RequestFor(test::WavHeader()));
    assert(failed.status == 500 && failed.body.contains("error"));
}

int main() {
    std::cout << "[Test] Starting TranscriptionRelay Test..." << std::endl;
    TestStreamHappyPath();
    TestStreamConvertsWebm();
    TestStreamRejectsBadRequests();
    TestStreamFailureBeforeCommit();
    TestStreamFailureAfterCommit();
    TestClientDisconnect();
    TestSyncEndpoint();
    std::cout << "[PASS] Relay honours the streaming contract." << std::endl;
    return 0;
}
