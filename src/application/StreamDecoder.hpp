/**
 * @file StreamDecoder.hpp
 * @brief Client-side reassembly of the relay's event stream into text.
 */

#pragma once
#include "application/WireProtocol.hpp"
#include "domain/ByteStream.hpp"
#include <functional>
#include <string>

namespace voicescribe::application {

/**
 * @class StreamDecoder
 * @brief Incremental decoder fed with raw network chunks.
 *
 * Deltas are appended to a running transcript and reported through the
 * progress callback; a done event replaces the transcript; an error event
 * raises domain::RelayReportedError and stops the decoder.
 */
class StreamDecoder {
public:
    /** @brief Receives the running transcript after each non-empty delta. */
    using OnProgress = std::function<void(const std::string& fullText)>;

    explicit StreamDecoder(OnProgress onProgress = nullptr);

    /**
     * @brief Processes every line completed by this chunk.
     * @throws domain::RelayReportedError on an error event.
     * @throws domain::MalformedWireFrame on a frame that parses but fails validation.
     */
    void feed(const char* data, std::size_t length);
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    /** @brief Running transcript so far. */
    const std::string& text() const { return m_fullText; }

    /** @brief True once a done event has been seen. */
    bool completed() const { return m_completed; }

    /**
     * @brief Ends decoding and returns the transcript.
     * A stream that ended without a done event still yields the accumulated deltas.
     */
    std::string finish() const;

    /**
     * @brief Drains a byte stream to its end.
     * @return Final transcript.
     */
    static std::string Consume(domain::ByteStream& stream, OnProgress onProgress = nullptr);

private:
    void processLine(const std::string& line);

    LineBuffer m_lines;
    std::string m_fullText;
    OnProgress m_onProgress;
    bool m_completed = false;
    bool m_failed = false;
};

} // namespace voicescribe::application
