/**
 * AudioArbiter.cpp - Capture/playback mutual exclusion
 */

#include "gideon/core/AudioArbiter.hpp"

#include <algorithm>
#include <iostream>

namespace gideon::core {

// Waits are sliced so a cancelled token is noticed promptly
constexpr std::chrono::milliseconds WAIT_SLICE{20};

const char* toString(AudioMode mode) {
    switch (mode) {
        case AudioMode::NONE:        return "NONE";
        case AudioMode::CAPTURE:     return "CAPTURE";
        case AudioMode::PLAYBACK:    return "PLAYBACK";
        case AudioMode::CALIBRATION: return "CALIBRATION";
    }
    return "UNKNOWN";
}

AudioLease::~AudioLease() {
    release();
}

AudioLease::AudioLease(AudioLease&& other) noexcept
    : arbiter_(other.arbiter_)
    , mode_(other.mode_) {
    other.arbiter_ = nullptr;
    other.mode_ = AudioMode::NONE;
}

AudioLease& AudioLease::operator=(AudioLease&& other) noexcept {
    if (this != &other) {
        release();
        arbiter_ = other.arbiter_;
        mode_ = other.mode_;
        other.arbiter_ = nullptr;
        other.mode_ = AudioMode::NONE;
    }
    return *this;
}

void AudioLease::release() {
    if (arbiter_) {
        arbiter_->release(mode_);
        arbiter_ = nullptr;
        mode_ = AudioMode::NONE;
    }
}

AudioLease AudioArbiter::acquire(AudioMode mode,
                                 std::chrono::milliseconds timeout,
                                 const CancellationToken* token) {
    if (mode == AudioMode::NONE) {
        return {};
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);

    while (active_ != AudioMode::NONE) {
        if (isCancelled(token)) {
            return {};
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            std::cerr << "[AudioArbiter] Timed out waiting for " << toString(mode)
                      << " (held by " << toString(active_) << ")" << std::endl;
            return {};
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, WAIT_SLICE);
        cv_.wait_for(lock, slice);
    }

    if (isCancelled(token)) {
        return {};
    }

    active_ = mode;
    ++grants_;
    return AudioLease(this, mode);
}

void AudioArbiter::release(AudioMode mode) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ == mode) {
            active_ = AudioMode::NONE;
        }
    }
    cv_.notify_all();
}

AudioMode AudioArbiter::activeMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

bool AudioArbiter::waitIdle(std::chrono::milliseconds timeout, const CancellationToken* token) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);

    while (active_ != AudioMode::NONE) {
        if (isCancelled(token)) {
            return false;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, WAIT_SLICE);
        cv_.wait_for(lock, slice);
    }
    return true;
}

std::uint64_t AudioArbiter::grantCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return grants_;
}

} // namespace gideon::core
