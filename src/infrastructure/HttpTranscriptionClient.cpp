#include "infrastructure/HttpTranscriptionClient.hpp"
#include "application/WireProtocol.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Base64.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <exception>

using json = nlohmann::json;

namespace voicescribe::infrastructure {

namespace {

std::string RequestBody(const std::string& audioBytes) {
    return json{{"audio", Base64::Encode(audioBytes)}}.dump();
}

std::string FailureMessage(int status, const std::string& body) {
    std::string message = "Transcription failed (HTTP " + std::to_string(status) + ")";
    json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error") && parsed["error"].is_string()) {
        message += ": " + parsed["error"].get<std::string>();
    }
    return message;
}

} // namespace

HttpTranscriptionClient::HttpTranscriptionClient(const std::string& serverUrl, int timeoutSeconds)
    : m_serverUrl(serverUrl), m_timeoutSeconds(timeoutSeconds) {
    while (!m_serverUrl.empty() && m_serverUrl.back() == '/') {
        m_serverUrl.pop_back();
    }
}

std::string HttpTranscriptionClient::transcribeStream(const std::string& audioBytes,
                                                      application::StreamDecoder::OnProgress onProgress) {
    httplib::Client cli(m_serverUrl);
    cli.set_read_timeout(m_timeoutSeconds);
    cli.set_write_timeout(m_timeoutSeconds);

    application::StreamDecoder decoder(std::move(onProgress));

    httplib::Request req;
    req.method = "POST";
    req.path = "/api/transcribe/stream";
    req.set_header("Accept", application::WireProtocol::kContentType);
    req.set_header("Content-Type", "application/json");
    req.body = RequestBody(audioBytes);

    int status = 0;
    std::string errorBody;
    std::exception_ptr decodeError;

    req.response_handler = [&](const httplib::Response& response) {
        status = response.status;
        return true;
    };
    req.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (status != 200) {
            errorBody.append(data, length);
            return true;
        }
        // Exceptions must not unwind through the HTTP library; keep the first and stop reading.
        try {
            decoder.feed(data, length);
        } catch (const std::exception&) {
            decodeError = std::current_exception();
            return false;
        }
        return true;
    };

    auto res = cli.send(req);
    if (decodeError) {
        std::rethrow_exception(decodeError);
    }
    if (!res) {
        throw domain::TransportFailure("Connection to relay failed. Error code: " +
                                       std::to_string(static_cast<int>(res.error())));
    }
    if (status != 200) {
        throw domain::TransportFailure(FailureMessage(status, errorBody));
    }
    return decoder.finish();
}

std::string HttpTranscriptionClient::transcribe(const std::string& audioBytes) {
    httplib::Client cli(m_serverUrl);
    cli.set_read_timeout(m_timeoutSeconds);
    cli.set_write_timeout(m_timeoutSeconds);

    auto res = cli.Post("/api/transcribe", RequestBody(audioBytes), "application/json");
    if (!res) {
        throw domain::TransportFailure("Connection to relay failed. Error code: " +
                                       std::to_string(static_cast<int>(res.error())));
    }
    if (res->status != 200) {
        throw domain::TransportFailure(FailureMessage(res->status, res->body));
    }

    json body = json::parse(res->body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("text") || !body["text"].is_string()) {
        throw domain::TransportFailure("Relay returned an unexpected response");
    }
    return body["text"].get<std::string>();
}

} // namespace voicescribe::infrastructure
