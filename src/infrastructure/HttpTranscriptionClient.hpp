/**
 * @file HttpTranscriptionClient.hpp
 * @brief Client for the relay's HTTP endpoints.
 */

#pragma once
#include "application/StreamDecoder.hpp"
#include <string>

namespace voicescribe::infrastructure {

/**
 * @class HttpTranscriptionClient
 * @brief Uploads audio to the relay and returns the transcript.
 */
class HttpTranscriptionClient {
public:
    /**
     * @param serverUrl Relay origin, e.g. "http://localhost:5000".
     * @param timeoutSeconds Read timeout between received chunks.
     */
    explicit HttpTranscriptionClient(const std::string& serverUrl, int timeoutSeconds = 600);

    /**
     * @brief Streams the transcript, reporting partial text as it arrives.
     * @throws domain::RelayReportedError when the relay ends the stream with an error event.
     * @throws domain::TransportFailure on connection failures and non-200 responses.
     */
    std::string transcribeStream(const std::string& audioBytes,
                                 application::StreamDecoder::OnProgress onProgress = nullptr);

    /**
     * @brief Calls the synchronous endpoint.
     * @throws domain::TransportFailure on connection failures and non-200 responses.
     */
    std::string transcribe(const std::string& audioBytes);

private:
    std::string m_serverUrl;
    int m_timeoutSeconds;
};

} // namespace voicescribe::infrastructure
