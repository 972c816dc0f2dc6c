#include "application/WireProtocol.hpp"
#include "domain/Errors.hpp"

namespace voicescribe::application {

using json = nlohmann::json;

json WireProtocol::ToJson(const domain::StreamEvent& event) {
    switch (event.type) {
        case domain::StreamEvent::Type::Delta:
            return {{"type", "delta"}, {"text", event.text}};
        case domain::StreamEvent::Type::Done:
            return {{"type", "done"}, {"text", event.text}};
        case domain::StreamEvent::Type::Error:
            return {{"type", "error"}, {"error", event.text}};
    }
    return {{"type", "error"}, {"error", event.text}};
}

std::string WireProtocol::EncodeFrame(const domain::StreamEvent& event) {
    // Invalid UTF-8 from upstream is replaced rather than aborting the stream.
    return std::string(kEventPrefix) + ToJson(event).dump(-1, ' ', false, json::error_handler_t::replace) + "\n\n";
}

std::optional<domain::StreamEvent> WireProtocol::FromJson(const json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    auto typeIt = payload.find("type");
    if (typeIt == payload.end() || !typeIt->is_string()) {
        return std::nullopt;
    }

    const std::string type = typeIt->get<std::string>();
    if (type == "delta" || type == "done") {
        auto textIt = payload.find("text");
        if (textIt == payload.end() || textIt->is_null()) {
            if (type == "done") {
                throw domain::MalformedWireFrame("done event without text");
            }
            return domain::StreamEvent::Delta("");
        }
        if (!textIt->is_string()) {
            throw domain::MalformedWireFrame(type + " event text is not a string");
        }
        auto text = textIt->get<std::string>();
        return type == "delta" ? domain::StreamEvent::Delta(text) : domain::StreamEvent::Done(text);
    }
    if (type == "error") {
        auto errIt = payload.find("error");
        if (errIt != payload.end() && errIt->is_string()) {
            return domain::StreamEvent::Error(errIt->get<std::string>());
        }
        return domain::StreamEvent::Error(errIt == payload.end() ? "Unknown relay error" : errIt->dump());
    }
    return std::nullopt;
}

void LineBuffer::append(const char* data, std::size_t length) {
    // Drop consumed lines before growing so the buffer tracks only pending bytes.
    if (m_consumed > 0) {
        m_buffer.erase(0, m_consumed);
        m_consumed = 0;
    }
    m_buffer.append(data, length);
}

bool LineBuffer::nextLine(std::string& line) {
    std::size_t newline = m_buffer.find('\n', m_consumed);
    if (newline == std::string::npos) {
        return false;
    }
    std::size_t end = newline;
    if (end > m_consumed && m_buffer[end - 1] == '\r') {
        --end;
    }
    line.assign(m_buffer, m_consumed, end - m_consumed);
    m_consumed = newline + 1;
    return true;
}

} // namespace voicescribe::application
