#include "domain/FormatSniffer.hpp"

namespace voicescribe::domain {

namespace {

unsigned char ByteAt(const std::string& bytes, std::size_t index) {
    return static_cast<unsigned char>(bytes[index]);
}

bool HasPrefixAt(const std::string& bytes, std::size_t offset, const char* signature, std::size_t length) {
    return bytes.compare(offset, length, signature, length) == 0;
}

} // namespace

AudioFormat FormatSniffer::Classify(const std::string& bytes) noexcept {
    if (bytes.size() < kMinimumHeaderSize) {
        return AudioFormat::Unknown;
    }

    if (HasPrefixAt(bytes, 0, "RIFF", 4)) {
        return AudioFormat::Wav;
    }

    if (ByteAt(bytes, 0) == 0x1A && ByteAt(bytes, 1) == 0x45 &&
        ByteAt(bytes, 2) == 0xDF && ByteAt(bytes, 3) == 0xA3) {
        return AudioFormat::WebM;
    }

    // MPEG audio frame sync (layer III variants) or an ID3v2 tag.
    if (ByteAt(bytes, 0) == 0xFF &&
        (ByteAt(bytes, 1) == 0xFB || ByteAt(bytes, 1) == 0xFA || ByteAt(bytes, 1) == 0xF3)) {
        return AudioFormat::Mp3;
    }
    if (HasPrefixAt(bytes, 0, "ID3", 3)) {
        return AudioFormat::Mp3;
    }

    if (HasPrefixAt(bytes, 4, "ftyp", 4)) {
        return AudioFormat::Mp4;
    }

    if (HasPrefixAt(bytes, 0, "OggS", 4)) {
        return AudioFormat::Ogg;
    }

    return AudioFormat::Unknown;
}

} // namespace voicescribe::domain
