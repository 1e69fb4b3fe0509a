/**
 * AudioArbiter.hpp - Exclusive ownership of the microphone and the speaker
 *
 * Capture, playback and calibration are mutually exclusive. Whoever needs
 * the audio hardware acquires a lease; the lease releases on destruction.
 */

#pragma once

#include "gideon/core/CancellationToken.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace gideon::core {

enum class AudioMode {
    NONE,
    CAPTURE,
    PLAYBACK,
    CALIBRATION
};

const char* toString(AudioMode mode);

class AudioArbiter;

class AudioLease {
public:
    AudioLease() = default;
    ~AudioLease();

    AudioLease(AudioLease&& other) noexcept;
    AudioLease& operator=(AudioLease&& other) noexcept;
    AudioLease(const AudioLease&) = delete;
    AudioLease& operator=(const AudioLease&) = delete;

    bool held() const { return arbiter_ != nullptr; }
    AudioMode mode() const { return mode_; }
    void release();

private:
    friend class AudioArbiter;
    AudioLease(AudioArbiter* arbiter, AudioMode mode) : arbiter_(arbiter), mode_(mode) {}

    AudioArbiter* arbiter_ = nullptr;
    AudioMode mode_ = AudioMode::NONE;
};

class AudioArbiter {
public:
    AudioArbiter() = default;
    AudioArbiter(const AudioArbiter&) = delete;
    AudioArbiter& operator=(const AudioArbiter&) = delete;

    /**
     * Wait until the hardware is free, then take it in `mode`.
     * Returns an empty lease on timeout or cancellation.
     */
    AudioLease acquire(AudioMode mode,
                       std::chrono::milliseconds timeout,
                       const CancellationToken* token = nullptr);

    AudioMode activeMode() const;
    bool isIdle() const { return activeMode() == AudioMode::NONE; }

    /**
     * Block until no lease is held.
     * @return false on timeout or cancellation
     */
    bool waitIdle(std::chrono::milliseconds timeout, const CancellationToken* token = nullptr) const;

    std::uint64_t grantCount() const;

private:
    friend class AudioLease;
    void release(AudioMode mode);

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    AudioMode active_ = AudioMode::NONE;
    std::uint64_t grants_ = 0;
};

} // namespace gideon::core
