/**
 * @file SpeechToTextService.hpp
 * @brief Interface for the upstream speech-to-text provider.
 */

#pragma once

#include "domain/AudioFormat.hpp"
#include <functional>
#include <string>

namespace voicescribe::domain {

/**
 * @class SpeechToTextService
 * @brief Abstract provider offering a blocking and an incremental transcription call.
 *
 * Implementations throw UpstreamFailure when the provider cannot be reached,
 * rejects the request or fails mid-stream.
 */
class SpeechToTextService {
public:
    virtual ~SpeechToTextService() = default;

    /**
     * @brief Callback for each incremental text fragment, in provider order.
     * Returning false asks the provider to stop streaming.
     */
    using OnDelta = std::function<bool(const std::string& fragment)>;

    /**
     * @brief Transcribes the whole payload in one call.
     * @param audio Normalized audio with its extension hint.
     * @return The transcript.
     */
    virtual std::string transcribe(const NormalizedAudio& audio) = 0;

    /**
     * @brief Streams the transcript as fragments.
     * @param audio Normalized audio with its extension hint.
     * @param onDelta Invoked once per fragment; the next fragment is not read until it returns.
     * @return True if the provider signalled completion, false if onDelta stopped the stream.
     */
    virtual bool transcribeStream(const NormalizedAudio& audio, const OnDelta& onDelta) = 0;
};

} // namespace voicescribe::domain
