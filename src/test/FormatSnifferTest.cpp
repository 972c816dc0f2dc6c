#include <cassert>
#include <iostream>
#include <string>
#include "domain/FormatSniffer.hpp"
#include "TestSupport.hpp"

using voicescribe::domain::AudioFormat;
using voicescribe::domain::FormatSniffer;
using voicescribe::domain::IsUpstreamAccepted;

int main() {
    std::cout << "[Test] Starting FormatSniffer Test..." << std::endl;

    assert(FormatSniffer::Classify(voicescribe::test::WavHeader()) == AudioFormat::Wav);
    assert(FormatSniffer::Classify(voicescribe::test::Mp3Header()) == AudioFormat::Mp3);
    assert(FormatSniffer::Classify(voicescribe::test::WebmHeader()) == AudioFormat::WebM);

    // Bare MPEG frame sync without an ID3 tag.
    std::string frameSync("\xFF\xFB\x90\x64\x00\x00\x00\x00\x00\x00\x00\x00", 12);
    assert(FormatSniffer::Classify(frameSync) == AudioFormat::Mp3);
    frameSync[1] = '\xF3';
    assert(FormatSniffer::Classify(frameSync) == AudioFormat::Mp3);
    frameSync[1] = '\xF2';
    assert(FormatSniffer::Classify(frameSync) == AudioFormat::Unknown);

    std::string mp4("\x00\x00\x00\x20" "ftypM4A \x00\x00", 14);
    assert(FormatSniffer::Classify(mp4) == AudioFormat::Mp4);

    std::string ogg("OggS\x00\x02\x00\x00\x00\x00\x00\x00", 12);
    assert(FormatSniffer::Classify(ogg) == AudioFormat::Ogg);

    std::cout << "[Test] Short buffers are never classified..." << std::endl;
    assert(FormatSniffer::Classify("") == AudioFormat::Unknown);
    assert(FormatSniffer::Classify("RIFF") == AudioFormat::Unknown);
    assert(FormatSniffer::Classify(std::string("RIFF\0\0\0\0WAV", 11)) == AudioFormat::Unknown);
    assert(FormatSniffer::Classify(std::string("RIFF\0\0\0\0WAVE", 12)) == AudioFormat::Wav);

    assert(FormatSniffer::Classify("plain text, definitely not audio") == AudioFormat::Unknown);

    std::cout << "[Test] Only wav and mp3 are accepted upstream..." << std::endl;
    assert(IsUpstreamAccepted(AudioFormat::Wav));
    assert(IsUpstreamAccepted(AudioFormat::Mp3));
    assert(!IsUpstreamAccepted(AudioFormat::WebM));
    assert(!IsUpstreamAccepted(AudioFormat::Mp4));
    assert(!IsUpstreamAccepted(AudioFormat::Ogg));
    assert(!IsUpstreamAccepted(AudioFormat::Unknown));

    std::cout << "[PASS] FormatSniffer classifies all known headers." << std::endl;
    return 0;
}
