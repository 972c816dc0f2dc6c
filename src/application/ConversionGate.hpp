/**
 * @file ConversionGate.hpp
 * @brief Bounds the number of external conversions running at once.
 */

#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace voicescribe::application {

/**
 * @class ConversionGate
 * @brief Counting gate; callers block until a slot is free.
 */
class ConversionGate {
public:
    explicit ConversionGate(std::size_t maxConcurrent);

    /**
     * @class Slot
     * @brief Holds one slot until destroyed.
     */
    class Slot {
    public:
        explicit Slot(ConversionGate& gate);
        ~Slot();
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        ConversionGate& m_gate;
    };

    std::size_t inUse() const;
    std::size_t capacity() const { return m_capacity; }

private:
    void acquire();
    void release();

    const std::size_t m_capacity;
    std::size_t m_inUse = 0;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace voicescribe::application
