/**
 * @file AudioFormat.hpp
 * @brief Audio container tags and the buffers that carry them through a request.
 */

#pragma once
#include <string>

namespace voicescribe::domain {

/**
 * @enum AudioFormat
 * @brief Container formats recognised from leading magic bytes.
 */
enum class AudioFormat {
    Wav,
    Mp3,
    WebM,
    Mp4,
    Ogg,
    Unknown
};

/** @brief Lowercase tag used in logs and as the upstream file extension. */
inline std::string AudioFormatToString(AudioFormat format) {
    switch (format) {
        case AudioFormat::Wav: return "wav";
        case AudioFormat::Mp3: return "mp3";
        case AudioFormat::WebM: return "webm";
        case AudioFormat::Mp4: return "mp4";
        case AudioFormat::Ogg: return "ogg";
        case AudioFormat::Unknown: return "unknown";
    }
    return "unknown";
}

/** @brief True for the formats the upstream provider accepts as-is. */
inline bool IsUpstreamAccepted(AudioFormat format) {
    return format == AudioFormat::Wav || format == AudioFormat::Mp3;
}

/**
 * @struct AudioBuffer
 * @brief Raw request audio and the format it was classified as.
 */
struct AudioBuffer {
    std::string bytes; ///< Decoded audio bytes.
    AudioFormat format = AudioFormat::Unknown; ///< Result of classification.
};

/**
 * @struct NormalizedAudio
 * @brief Bytes actually sent upstream, tagged with the extension that names the payload.
 */
struct NormalizedAudio {
    std::string bytes; ///< Original bytes or converter output.
    std::string extension; ///< "wav" or "mp3".
};

} // namespace voicescribe::domain
