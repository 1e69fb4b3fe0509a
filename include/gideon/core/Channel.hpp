/**
 * Channel.hpp - Bounded multi-producer queue feeding a single task
 */

#pragma once

#include "gideon/core/CancellationToken.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace gideon::core {

template <typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity = 64) : capacity_(capacity) {}

    /**
     * @return false if the channel is closed or full
     */
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return popLocked();
    }

    /**
     * Wait up to `timeout` for an item. Gives up early on close or cancellation.
     */
    std::optional<T> popFor(std::chrono::milliseconds timeout, const CancellationToken* token = nullptr) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::unique_lock<std::mutex> lock(mutex_);

        while (queue_.empty()) {
            if (closed_ || isCancelled(token)) {
                return std::nullopt;
            }
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return std::nullopt;
            }
            auto slice = std::min<std::chrono::steady_clock::duration>(
                deadline - now, std::chrono::milliseconds(20));
            cv_.wait_for(lock, slice);
        }
        return popLocked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> popLocked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace gideon::core
