/**
 * @file OpenAITranscriptionClient.cpp
 * @brief Implementation of the OpenAITranscriptionClient class.
 */
#include "infrastructure/OpenAITranscriptionClient.hpp"
#include "application/WireProtocol.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/TransientFile.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <cstring>
#include <iostream>

using json = nlohmann::json;

namespace voicescribe::infrastructure {

namespace {

constexpr const char* kTranscriptionsPath = "/v1/audio/transcriptions";
constexpr const char* kDeltaEvent = "transcript.text.delta";
constexpr const char* kDoneEvent = "transcript.text.done";
constexpr const char* kStreamTerminator = "[DONE]";

std::string MimeTypeFor(const std::string& extension) {
    if (extension == "mp3") return "audio/mpeg";
    return "audio/wav";
}

std::string ErrorMessageFrom(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error")) {
        const auto& err = parsed["error"];
        if (err.is_object() && err.contains("message") && err["message"].is_string()) {
            return err["message"].get<std::string>();
        }
        if (err.is_string()) {
            return err.get<std::string>();
        }
    }
    return body;
}

void ApplyTimeouts(httplib::Client& cli, int timeoutSeconds) {
    cli.set_connection_timeout(30);
    cli.set_read_timeout(timeoutSeconds);
    cli.set_write_timeout(timeoutSeconds);
}

} // namespace

OpenAITranscriptionClient::OpenAITranscriptionClient(const std::string& baseUrl,
                                                     const std::string& apiKey,
                                                     const std::string& model,
                                                     int timeoutSeconds)
    : m_apiKey(apiKey), m_model(model), m_timeoutSeconds(timeoutSeconds) {
    // Split "scheme://host:port/prefix" into the client origin and a path prefix.
    std::string url = baseUrl;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    std::size_t schemeEnd = url.find("://");
    std::size_t pathStart = url.find('/', schemeEnd == std::string::npos ? 0 : schemeEnd + 3);
    if (pathStart == std::string::npos) {
        m_host = url;
    } else {
        m_host = url.substr(0, pathStart);
        m_pathPrefix = url.substr(pathStart);
    }
    // A base URL ending in /v1 is accepted as well as the bare origin.
    if (m_pathPrefix.size() >= 3 && m_pathPrefix.compare(m_pathPrefix.size() - 3, 3, "/v1") == 0) {
        m_pathPrefix.erase(m_pathPrefix.size() - 3);
    }
}

std::string OpenAITranscriptionClient::buildMultipartBody(const domain::NormalizedAudio& audio,
                                                          const std::string& boundary,
                                                          bool stream) const {
    std::string body;
    body.reserve(audio.bytes.size() + 1024);

    auto addField = [&](const std::string& name, const std::string& value) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
        body += value + "\r\n";
    };

    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"file\"; filename=\"audio." + audio.extension + "\"\r\n";
    body += "Content-Type: " + MimeTypeFor(audio.extension) + "\r\n\r\n";
    body += audio.bytes;
    body += "\r\n";

    addField("model", m_model);
    addField("response_format", "json");
    if (stream) {
        addField("stream", "true");
    }
    body += "--" + boundary + "--\r\n";
    return body;
}

std::string OpenAITranscriptionClient::transcribe(const domain::NormalizedAudio& audio) {
    httplib::Client cli(m_host);
    ApplyTimeouts(cli, m_timeoutSeconds);

    std::string boundary = "VoiceScribeBoundary" + TransientFile::GenerateId();
    httplib::Headers headers;
    if (!m_apiKey.empty()) {
        headers.emplace("Authorization", "Bearer " + m_apiKey);
    }

    std::cout << "[OpenAITranscriptionClient] Sending " << audio.bytes.size() << " bytes (" << audio.extension
              << ") to " << m_model << std::endl;

    auto res = cli.Post(m_pathPrefix + kTranscriptionsPath, headers,
                        buildMultipartBody(audio, boundary, false),
                        "multipart/form-data; boundary=" + boundary);
    if (!res) {
        throw domain::UpstreamFailure("Connection to transcription service failed. Error code: " +
                                      std::to_string(static_cast<int>(res.error())));
    }
    if (res->status != 200) {
        std::cerr << "[OpenAITranscriptionClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        throw domain::UpstreamFailure("Transcription service error: " + ErrorMessageFrom(res->body), res->status);
    }

    json body = json::parse(res->body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("text") || !body["text"].is_string()) {
        std::cerr << "[OpenAITranscriptionClient] Response JSON missing 'text' field: " << res->body << std::endl;
        throw domain::UpstreamFailure("Transcription service returned an unexpected response", res->status);
    }
    return body["text"].get<std::string>();
}

bool OpenAITranscriptionClient::transcribeStream(const domain::NormalizedAudio& audio, const OnDelta& onDelta) {
    httplib::Client cli(m_host);
    ApplyTimeouts(cli, m_timeoutSeconds);

    std::string boundary = "VoiceScribeBoundary" + TransientFile::GenerateId();

    httplib::Request req;
    req.method = "POST";
    req.path = m_pathPrefix + kTranscriptionsPath;
    req.set_header("Accept", application::WireProtocol::kContentType);
    req.set_header("Content-Type", "multipart/form-data; boundary=" + boundary);
    if (!m_apiKey.empty()) {
        req.set_header("Authorization", "Bearer " + m_apiKey);
    }
    req.body = buildMultipartBody(audio, boundary, true);

    int status = 0;
    std::string errorBody;
    std::string streamError;
    bool completed = false;
    bool stopped = false;
    application::LineBuffer lines;
    const std::size_t prefixLength = std::strlen(application::WireProtocol::kEventPrefix);

    req.response_handler = [&](const httplib::Response& response) {
        status = response.status;
        return true;
    };

    req.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (status != 200) {
            errorBody.append(data, length);
            return true;
        }
        lines.append(data, length);

        std::string line;
        while (lines.nextLine(line)) {
            if (line.compare(0, prefixLength, application::WireProtocol::kEventPrefix) != 0) {
                continue;
            }
            std::string payload = line.substr(prefixLength);
            if (payload == kStreamTerminator) {
                completed = true;
                continue;
            }
            json event = json::parse(payload, nullptr, false);
            if (event.is_discarded() || !event.is_object()) {
                continue;
            }
            if (event.contains("error")) {
                streamError = ErrorMessageFrom(payload);
                return false;
            }
            std::string type = event.value("type", "");
            if (type == kDeltaEvent) {
                auto delta = event.find("delta");
                if (delta != event.end() && delta->is_string() && !onDelta(delta->get<std::string>())) {
                    stopped = true;
                    return false;
                }
            } else if (type == kDoneEvent) {
                completed = true;
            }
        }
        return true;
    };

    std::cout << "[OpenAITranscriptionClient] Streaming " << audio.bytes.size() << " bytes (" << audio.extension
              << ") to " << m_model << std::endl;

    auto res = cli.send(req);
    if (stopped) {
        std::cout << "[OpenAITranscriptionClient] Stream stopped by consumer" << std::endl;
        return false;
    }
    if (!streamError.empty()) {
        throw domain::UpstreamFailure("Transcription stream error: " + streamError, status);
    }
    if (!res) {
        throw domain::UpstreamFailure("Transcription stream failed. Error code: " +
                                      std::to_string(static_cast<int>(res.error())), status);
    }
    if (status != 200) {
        std::cerr << "[OpenAITranscriptionClient] HTTP Error " << status << ": " << errorBody << std::endl;
        throw domain::UpstreamFailure("Transcription service error: " + ErrorMessageFrom(errorBody), status);
    }
    if (!completed) {
        throw domain::UpstreamFailure("Transcription stream closed without a completion event", status);
    }
    return true;
}

} // namespace voicescribe::infrastructure
