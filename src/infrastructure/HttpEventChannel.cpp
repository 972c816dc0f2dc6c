#include "infrastructure/HttpEventChannel.hpp"

#include <iostream>

namespace voicescribe::infrastructure {

void HttpEventChannel::respond(int status, const nlohmann::json& body) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_mode == Mode::Stream) {
            std::cerr << "[HttpEventChannel] JSON reply after stream start ignored: " << body.dump() << std::endl;
            return;
        }
        m_mode = Mode::Json;
        m_status = status;
        m_body = body;
    }
    m_cv.notify_all();
}

void HttpEventChannel::open() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_mode = Mode::Stream;
    }
    m_cv.notify_all();
}

bool HttpEventChannel::write(const std::string& frame) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return !m_slot || m_cancelled; });
    if (m_cancelled || m_mode != Mode::Stream) {
        return false;
    }
    m_slot = frame;
    lock.unlock();
    m_cv.notify_all();
    return true;
}

void HttpEventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

HttpEventChannel::Mode HttpEventChannel::awaitMode() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_mode != Mode::Pending || m_closed; });
    if (m_mode == Mode::Pending) {
        m_mode = Mode::Json;
        m_status = 500;
        m_body = {{"error", "Relay produced no response"}};
    }
    return m_mode;
}

int HttpEventChannel::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

nlohmann::json HttpEventChannel::body() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_body;
}

bool HttpEventChannel::next(std::string& frame) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_slot || m_closed || m_cancelled; });
    if (!m_slot || m_cancelled) {
        return false;
    }
    frame = std::move(*m_slot);
    m_slot.reset();
    lock.unlock();
    m_cv.notify_all();
    return true;
}

void HttpEventChannel::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
        m_slot.reset();
    }
    m_cv.notify_all();
}

} // namespace voicescribe::infrastructure
