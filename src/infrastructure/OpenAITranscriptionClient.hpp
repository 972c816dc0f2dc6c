/**
 * @file OpenAITranscriptionClient.hpp
 * @brief HTTP client for an OpenAI-compatible audio transcription API.
 */

#pragma once
#include "domain/SpeechToTextService.hpp"
#include <string>

namespace voicescribe::infrastructure {

/**
 * @class OpenAITranscriptionClient
 * @brief Implements SpeechToTextService against `POST /v1/audio/transcriptions`.
 */
class OpenAITranscriptionClient : public domain::SpeechToTextService {
public:
    /**
     * @param baseUrl Scheme, host, optional port and optional path prefix, e.g. "https://api.openai.com".
     * @param apiKey Bearer token; omitted from requests when empty.
     * @param model Transcription model name.
     * @param timeoutSeconds Read timeout for each request.
     */
    OpenAITranscriptionClient(const std::string& baseUrl,
                              const std::string& apiKey,
                              const std::string& model = "gpt-4o-mini-transcribe",
                              int timeoutSeconds = 600);

    /** @brief Blocking transcription. @see domain::SpeechToTextService::transcribe */
    std::string transcribe(const domain::NormalizedAudio& audio) override;

    /** @brief Streams transcript deltas. @see domain::SpeechToTextService::transcribeStream */
    bool transcribeStream(const domain::NormalizedAudio& audio, const OnDelta& onDelta) override;

    /**
     * @brief Builds the multipart/form-data request body.
     * @param boundary Boundary string without leading dashes.
     * @param stream Adds the `stream=true` field.
     */
    std::string buildMultipartBody(const domain::NormalizedAudio& audio, const std::string& boundary, bool stream) const;

private:
    std::string m_host; ///< "scheme://host[:port]".
    std::string m_pathPrefix; ///< Path before "/v1", usually empty.
    std::string m_apiKey;
    std::string m_model;
    int m_timeoutSeconds;
};

} // namespace voicescribe::infrastructure
