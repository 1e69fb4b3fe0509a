/**
 * RingBuffer.hpp - Lock-free single-producer/single-consumer sample buffer
 *
 * Sits between the PortAudio callbacks and the engine thread: the capture
 * callback produces and the voice loop consumes, playback the other way round.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <vector>

namespace gideon::audio {

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity)
        : buffer_(capacity) {}

    /**
     * Copy up to `count` samples in. Producer side.
     * @return number of samples written (less than count when full)
     */
    std::size_t push(const T* data, std::size_t count) {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t tail = tail_.load(std::memory_order_acquire);
        const std::size_t n = std::min(count, buffer_.size() - (head - tail));

        for (std::size_t i = 0; i < n; ++i) {
            buffer_[(head + i) % buffer_.size()] = data[i];
        }
        head_.store(head + n, std::memory_order_release);
        return n;
    }

    /**
     * Copy up to `count` samples out. Consumer side; applies a pending clear() first.
     * @return number of samples read
     */
    std::size_t pop(T* out, std::size_t count) {
        std::size_t tail = tail_.load(std::memory_order_relaxed);
        const std::size_t head = head_.load(std::memory_order_acquire);
        tail = std::max(tail, clear_to_.load(std::memory_order_acquire));
        const std::size_t n = std::min(count, head - tail);

        for (std::size_t i = 0; i < n; ++i) {
            out[i] = buffer_[(tail + i) % buffer_.size()];
        }
        tail_.store(tail + n, std::memory_order_release);
        return n;
    }

    // Samples the consumer will still see
    std::size_t available() const {
        const std::size_t head = head_.load(std::memory_order_acquire);
        const std::size_t tail = std::max(tail_.load(std::memory_order_acquire),
                                          clear_to_.load(std::memory_order_acquire));
        return head - tail;
    }

    std::size_t capacity() const { return buffer_.size(); }

    /**
     * Drop everything pushed so far. Safe from either side: only the
     * consumer moves the tail, on its next pop(). Samples pushed after
     * the call are kept.
     */
    void clear() {
        const std::size_t head = head_.load(std::memory_order_acquire);
        std::size_t target = clear_to_.load(std::memory_order_relaxed);
        while (target < head &&
               !clear_to_.compare_exchange_weak(target, head, std::memory_order_acq_rel)) {
        }
    }

private:
    // Indices only grow; the slot is index % capacity
    std::vector<T> buffer_;
    std::atomic<std::size_t> head_{0};
    std::atomic<std::size_t> tail_{0};
    std::atomic<std::size_t> clear_to_{0};
};

} // namespace gideon::audio
