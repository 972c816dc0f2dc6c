/**
 * @file TranscriptionRelay.hpp
 * @brief Server-side pipeline from a base64 request body to an upstream transcript.
 */

#pragma once
#include "application/AudioNormalizer.hpp"
#include "application/EventChannel.hpp"
#include "domain/SpeechToTextService.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace voicescribe::application {

/**
 * @class TranscriptionRelay
 * @brief Validates, normalizes and transcribes request audio.
 *
 * Each call is an independent sequential pipeline; the relay holds no
 * per-request state and may be shared across server threads.
 */
class TranscriptionRelay {
public:
    /**
     * @struct Reply
     * @brief Status and JSON body for a non-streaming response.
     */
    struct Reply {
        int status;
        nlohmann::json body;
    };

    TranscriptionRelay(std::shared_ptr<AudioNormalizer> normalizer,
                       std::shared_ptr<domain::SpeechToTextService> speechToText);

    /**
     * @brief Synchronous endpoint: returns `{text}` or `{error}`.
     * @param requestBody Raw JSON body `{audio: base64}`.
     */
    Reply transcribe(const std::string& requestBody);

    /**
     * @brief Streaming endpoint.
     *
     * Before the channel is opened, failures are answered with a 400/500 JSON
     * response. Once opened, every upstream fragment becomes a delta frame,
     * followed by exactly one done frame or one error frame.
     */
    void transcribeStream(const std::string& requestBody, EventChannel& channel);

    /**
     * @brief Pulls the base64 audio field out of a request body.
     * @throws domain::InvalidRequest if the body is not an object or audio is missing/empty.
     */
    static std::string ExtractAudioField(const std::string& requestBody);

    /**
     * @brief Decodes the base64 audio field.
     * @throws domain::InvalidRequest on malformed base64 or an empty payload.
     */
    static std::string DecodeAudio(const std::string& audioBase64);

private:
    void failStream(EventChannel& channel, const std::string& message);

    std::shared_ptr<AudioNormalizer> m_normalizer;
    std::shared_ptr<domain::SpeechToTextService> m_speechToText;
};

} // namespace voicescribe::application
