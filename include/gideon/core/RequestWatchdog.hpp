/**
 * RequestWatchdog.hpp - Aborts a blocking call on cancellation or at a deadline
 *
 * Armed around a call that cannot watch a CancellationToken itself (an HTTP
 * round trip). A helper thread runs `abort` once, when the token is
 * cancelled or the deadline passes, whichever comes first.
 */

#pragma once

#include "gideon/core/CancellationToken.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace gideon::core {

class RequestWatchdog {
public:
    static constexpr std::chrono::milliseconds POLL{10};

    RequestWatchdog(const CancellationToken* token,
                    std::chrono::steady_clock::time_point deadline,
                    std::function<void()> abort)
        : token_(token)
        , deadline_(deadline)
        , abort_(std::move(abort)) {
        thread_ = std::thread([this]() { watch(); });
    }

    ~RequestWatchdog() { disarm(); }

    RequestWatchdog(const RequestWatchdog&) = delete;
    RequestWatchdog& operator=(const RequestWatchdog&) = delete;

    /**
     * Stop watching. After this returns `abort` is not running and never will.
     * @return true if it fired
     */
    bool disarm() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        return fired_.load();
    }

    bool fired() const { return fired_.load(); }

private:
    void watch() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!done_) {
            if (isCancelled(token_) || std::chrono::steady_clock::now() >= deadline_) {
                fired_ = true;
                lock.unlock();
                if (abort_) abort_();
                return;
            }
            auto wake = std::min(deadline_, std::chrono::steady_clock::now() + POLL);
            cv_.wait_until(lock, wake, [this]() { return done_; });
        }
    }

    const CancellationToken* token_;
    std::chrono::steady_clock::time_point deadline_;
    std::function<void()> abort_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    std::atomic<bool> fired_{false};
    std::thread thread_;
};

} // namespace gideon::core
