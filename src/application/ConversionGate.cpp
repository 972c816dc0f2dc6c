#include "application/ConversionGate.hpp"

namespace voicescribe::application {

ConversionGate::ConversionGate(std::size_t maxConcurrent)
    : m_capacity(maxConcurrent == 0 ? 1 : maxConcurrent) {}

void ConversionGate::acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_inUse < m_capacity; });
    ++m_inUse;
}

void ConversionGate::release() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_inUse;
    }
    m_cv.notify_one();
}

std::size_t ConversionGate::inUse() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inUse;
}

ConversionGate::Slot::Slot(ConversionGate& gate) : m_gate(gate) {
    m_gate.acquire();
}

ConversionGate::Slot::~Slot() {
    m_gate.release();
}

} // namespace voicescribe::application
