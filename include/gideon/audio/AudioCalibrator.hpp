/**
 * AudioCalibrator.hpp - Capture device selection and noise-floor calibration
 */

#pragma once

#include "gideon/Config.hpp"
#include "gideon/Types.hpp"
#include "gideon/audio/Interfaces.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gideon::audio {

struct DeviceScore {
    DeviceInfo device;
    int sample_rate = 0;
    double snr_db = 0.0;
    double score = 0.0;
};

class AudioCalibrator {
public:
    AudioCalibrator(const AudioSettings& settings, DeviceProbe& probe);

    /**
     * Pick the best capture device and measure its noise floor.
     * Returns a disabled session when no device is usable.
     */
    AudioSession calibrate();

    AudioSession recalibrate(const std::string& reason);

    // Copy of the current session; replaced atomically by (re)calibration
    AudioSession session() const;

    /**
     * Count a recognition failure.
     * @return true once the consecutive-failure threshold is reached
     */
    bool noteRecognitionFailure();
    void noteRecognitionSuccess();
    int consecutiveFailures() const { return failures_.load(); }

    bool isDue(SystemClock::time_point now) const;
    int calibrationCount() const { return calibrations_.load(); }

    /**
     * Score one device: channel count, default flag and a short test
     * capture's signal-to-noise ratio. nullopt if unusable.
     */
    std::optional<DeviceScore> scoreDevice(const DeviceInfo& device);

    float thresholdFor(const std::vector<float>& ambient) const;

    static double snrDb(const std::vector<float>& samples, int sample_rate);

private:
    std::optional<int> pickSampleRate(const DeviceInfo& device);

    const AudioSettings& settings_;
    DeviceProbe& probe_;

    mutable std::mutex mutex_;
    AudioSession session_;
    std::atomic<int> failures_{0};
    std::atomic<int> calibrations_{0};
};

} // namespace gideon::audio
