#include "application/StreamDecoder.hpp"
#include "domain/Errors.hpp"

#include <cstring>
#include <iostream>

namespace voicescribe::application {

using json = nlohmann::json;

StreamDecoder::StreamDecoder(OnProgress onProgress)
    : m_onProgress(std::move(onProgress)) {}

void StreamDecoder::feed(const char* data, std::size_t length) {
    if (m_failed) {
        return;
    }
    m_lines.append(data, length);

    std::string line;
    while (m_lines.nextLine(line)) {
        processLine(line);
    }
}

void StreamDecoder::processLine(const std::string& line) {
    const std::size_t prefixLength = std::strlen(WireProtocol::kEventPrefix);
    if (line.compare(0, prefixLength, WireProtocol::kEventPrefix) != 0) {
        return;
    }

    json payload;
    try {
        payload = json::parse(line.substr(prefixLength));
    } catch (const json::parse_error&) {
        // Incomplete or garbled frame; wait for the next one.
        return;
    }

    auto event = WireProtocol::FromJson(payload);
    if (!event) {
        std::cerr << "[StreamDecoder] Ignoring unrecognised frame: " << line << std::endl;
        return;
    }

    switch (event->type) {
        case domain::StreamEvent::Type::Delta:
            if (event->text.empty()) {
                return;
            }
            m_fullText += event->text;
            if (m_onProgress) {
                m_onProgress(m_fullText);
            }
            break;
        case domain::StreamEvent::Type::Done:
            m_fullText = event->text;
            m_completed = true;
            break;
        case domain::StreamEvent::Type::Error:
            m_failed = true;
            throw domain::RelayReportedError(event->text);
    }
}

std::string StreamDecoder::finish() const {
    if (!m_completed) {
        std::cerr << "[StreamDecoder] Stream ended without a done event; returning accumulated text" << std::endl;
    }
    return m_fullText;
}

std::string StreamDecoder::Consume(domain::ByteStream& stream, OnProgress onProgress) {
    StreamDecoder decoder(std::move(onProgress));
    std::string chunk;
    while (stream.read(chunk)) {
        decoder.feed(chunk);
    }
    return decoder.finish();
}

} // namespace voicescribe::application
