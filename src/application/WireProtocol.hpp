/**
 * @file WireProtocol.hpp
 * @brief Framing of stream events as `data: <json>` lines.
 */

#pragma once
#include "domain/StreamEvent.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace voicescribe::application {

/**
 * @brief Encodes and decodes the relay's event-stream frames.
 *
 * A frame is `data: <payload>\n\n` where the payload is one of
 * `{"type":"delta","text":...}`, `{"type":"done","text":...}` or
 * `{"type":"error","error":...}`.
 */
class WireProtocol {
public:
    static constexpr const char* kEventPrefix = "data: ";
    static constexpr const char* kContentType = "text/event-stream";

    /** @brief Full frame including the trailing blank line. */
    static std::string EncodeFrame(const domain::StreamEvent& event);

    /** @brief JSON payload of a frame. */
    static nlohmann::json ToJson(const domain::StreamEvent& event);

    /**
     * @brief Interprets a parsed payload.
     * @return std::nullopt for non-object payloads and unknown types.
     * @throws domain::MalformedWireFrame when a known type carries fields of the wrong kind.
     */
    static std::optional<domain::StreamEvent> FromJson(const nlohmann::json& payload);
};

/**
 * @class LineBuffer
 * @brief Reassembles newline-terminated lines from arbitrarily split chunks.
 *
 * Bytes are held until their line completes, so multi-byte UTF-8 sequences
 * split across chunks are never cut.
 */
class LineBuffer {
public:
    void append(const char* data, std::size_t length);
    void append(const std::string& chunk) { append(chunk.data(), chunk.size()); }

    /**
     * @brief Pops the next complete line without its terminator (and a trailing '\r').
     * @return False when only an incomplete fragment remains.
     */
    bool nextLine(std::string& line);

    /** @brief The incomplete fragment after the last newline. */
    std::string remainder() const { return m_buffer.substr(m_consumed); }

private:
    std::string m_buffer;
    std::size_t m_consumed = 0;
};

} // namespace voicescribe::application
