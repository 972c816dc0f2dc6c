#pragma once

#include "domain/AudioFormat.hpp"
#include <cstddef>
#include <string>

namespace voicescribe::domain {

/**
 * @brief Classifies audio bytes by their container signature.
 * Stateless; performs no I/O.
 */
class FormatSniffer {
public:
    /** Minimum number of bytes inspected before any signature is trusted. */
    static constexpr std::size_t kMinimumHeaderSize = 12;

    /**
     * @brief Returns the first matching format in wav, webm, mp3, mp4, ogg order.
     * @param bytes Raw audio bytes.
     * @return AudioFormat::Unknown for short buffers or unrecognised data.
     */
    static AudioFormat Classify(const std::string& bytes) noexcept;
};

} // namespace voicescribe::domain
