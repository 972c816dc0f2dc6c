#include "application/TranscriptionRelay.hpp"
#include "application/WireProtocol.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Base64.hpp"

#include <iostream>

namespace voicescribe::application {

using json = nlohmann::json;

TranscriptionRelay::TranscriptionRelay(std::shared_ptr<AudioNormalizer> normalizer,
                                       std::shared_ptr<domain::SpeechToTextService> speechToText)
    : m_normalizer(std::move(normalizer))
    , m_speechToText(std::move(speechToText))
{}

std::string TranscriptionRelay::ExtractAudioField(const std::string& requestBody) {
    json body = json::parse(requestBody, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw domain::InvalidRequest("Request body must be a JSON object");
    }
    auto it = body.find("audio");
    if (it == body.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        throw domain::InvalidRequest("Audio data (base64) is required");
    }
    return it->get<std::string>();
}

std::string TranscriptionRelay::DecodeAudio(const std::string& audioBase64) {
    auto bytes = infrastructure::Base64::Decode(audioBase64);
    if (!bytes) {
        throw domain::InvalidRequest("Audio data is not valid base64");
    }
    if (bytes->empty()) {
        throw domain::InvalidRequest("Audio data is empty");
    }
    return std::move(*bytes);
}

TranscriptionRelay::Reply TranscriptionRelay::transcribe(const std::string& requestBody) {
    try {
        std::string bytes = DecodeAudio(ExtractAudioField(requestBody));
        domain::NormalizedAudio audio = m_normalizer->normalize(bytes);
        std::string text = m_speechToText->transcribe(audio);
        std::cout << "[TranscriptionRelay] Transcribed " << audio.bytes.size() << " bytes ("
                  << audio.extension << "), " << text.size() << " chars" << std::endl;
        return {200, {{"text", text}}};
    } catch (const domain::InvalidRequest& e) {
        return {400, {{"error", e.what()}}};
    } catch (const std::exception& e) {
        std::cerr << "[TranscriptionRelay] Transcription failed: " << e.what() << std::endl;
        return {500, {{"error", e.what()}}};
    }
}

void TranscriptionRelay::transcribeStream(const std::string& requestBody, EventChannel& channel) {
    bool streaming = false;

    try {
        std::string audioBase64 = ExtractAudioField(requestBody);

        channel.open();
        streaming = true;

        std::string bytes = DecodeAudio(audioBase64);
        domain::NormalizedAudio audio = m_normalizer->normalize(bytes);

        std::string fullText;
        bool clientGone = false;
        bool finished = m_speechToText->transcribeStream(audio, [&](const std::string& fragment) {
            if (fragment.empty()) {
                return true;
            }
            fullText += fragment;
            if (!channel.write(WireProtocol::EncodeFrame(domain::StreamEvent::Delta(fragment)))) {
                clientGone = true;
                return false;
            }
            return true;
        });

        if (clientGone) {
            throw domain::TransportFailure("Client disconnected during streaming");
        }
        if (!finished) {
            throw domain::UpstreamFailure("Upstream stream ended before completion");
        }
        if (!channel.write(WireProtocol::EncodeFrame(domain::StreamEvent::Done(fullText)))) {
            throw domain::TransportFailure("Client disconnected before the final event");
        }
        channel.close();
        std::cout << "[TranscriptionRelay] Stream completed, " << fullText.size() << " chars" << std::endl;
    } catch (const domain::TransportFailure& e) {
        std::cerr << "[TranscriptionRelay] " << e.what() << "; abandoning response" << std::endl;
        channel.close();
    } catch (const domain::InvalidRequest& e) {
        if (streaming) {
            failStream(channel, e.what());
        } else {
            channel.respond(400, {{"error", e.what()}});
        }
    } catch (const std::exception& e) {
        std::cerr << "[TranscriptionRelay] Streaming transcription failed: " << e.what() << std::endl;
        if (streaming) {
            failStream(channel, e.what());
        } else {
            channel.respond(500, {{"error", e.what()}});
        }
    }
}

void TranscriptionRelay::failStream(EventChannel& channel, const std::string& message) {
    if (!channel.write(WireProtocol::EncodeFrame(domain::StreamEvent::Error(message)))) {
        std::cerr << "[TranscriptionRelay] Could not deliver error event: client gone" << std::endl;
    }
    channel.close();
}

} // namespace voicescribe::application
