/**
 * CancellationToken.hpp - Explicit cancellation passed into blocking calls
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace gideon::core {

class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = false;
    }

    bool isCancelled() const { return cancelled_.load(); }

    /**
     * Sleep for up to `duration`.
     * @return false if the token was cancelled before or during the wait
     */
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this]() { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

inline bool isCancelled(const CancellationToken* token) {
    return token && token->isCancelled();
}

} // namespace gideon::core
