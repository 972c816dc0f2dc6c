/**
 * @file HttpEventChannel.hpp
 * @brief EventChannel handing frames from a producer thread to an httplib connection.
 */

#pragma once
#include "application/EventChannel.hpp"
#include <condition_variable>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace voicescribe::infrastructure {

/**
 * @class HttpEventChannel
 * @brief Single-slot hand-off between the relay pipeline and the response writer.
 *
 * The relay runs on a producer thread and calls respond()/open()/write();
 * the server thread waits in awaitMode() to learn which kind of response to
 * send, then drains frames with next(). write() blocks while the previous
 * frame is undelivered, so a slow client slows the producer.
 */
class HttpEventChannel : public application::EventChannel {
public:
    enum class Mode { Pending, Json, Stream };

    void respond(int status, const nlohmann::json& body) override;
    void open() override;
    bool write(const std::string& frame) override;
    void close() override;

    /**
     * @brief Blocks until the relay chose a JSON reply or a stream.
     * A producer that closes without choosing yields a 500 JSON reply.
     */
    Mode awaitMode();

    int status() const;
    nlohmann::json body() const;

    /**
     * @brief Blocks for the next frame.
     * @return False once the producer closed and every frame was delivered.
     */
    bool next(std::string& frame);

    /** @brief Marks the client as gone; pending and future writes fail. */
    void cancel();

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    Mode m_mode = Mode::Pending;
    int m_status = 500;
    nlohmann::json m_body;
    std::optional<std::string> m_slot;
    bool m_closed = false;
    bool m_cancelled = false;
};

} // namespace voicescribe::infrastructure
