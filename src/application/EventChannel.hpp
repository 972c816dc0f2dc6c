/**
 * @file EventChannel.hpp
 * @brief Response side of one streaming request.
 */

#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace voicescribe::application {

/**
 * @class EventChannel
 * @brief A response that is either a single JSON body or, once opened, an event stream.
 *
 * respond() is only meaningful before open(); after open() the response
 * headers are on the wire and only write() and close() apply.
 */
class EventChannel {
public:
    virtual ~EventChannel() = default;

    /** @brief Sends a complete JSON response with the given status. */
    virtual void respond(int status, const nlohmann::json& body) = 0;

    /** @brief Commits the event-stream headers and flushes them to the client. */
    virtual void open() = 0;

    /**
     * @brief Writes one encoded frame.
     * @return False if the client can no longer be written to.
     */
    virtual bool write(const std::string& frame) = 0;

    /** @brief Ends the stream. */
    virtual void close() = 0;
};

} // namespace voicescribe::application
