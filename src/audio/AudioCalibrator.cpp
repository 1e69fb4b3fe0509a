/**
 * AudioCalibrator.cpp - Device scoring and ambient energy threshold
 *
 * Threshold = ambient RMS * multiplier, clamped so a dead-silent room does
 * not make every breath "speech" and a noisy one does not deafen the loop.
 */

#include "gideon/audio/AudioCalibrator.hpp"
#include "gideon/audio/WavCodec.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace gideon::audio {

// Scores closer than this are treated as a tie
constexpr double SCORE_EPSILON = 1e-6;
constexpr double MAX_SNR_DB = 40.0;

AudioCalibrator::AudioCalibrator(const AudioSettings& settings, DeviceProbe& probe)
    : settings_(settings)
    , probe_(probe) {
    session_.sample_rate_hz = settings_.preferred_sample_rate;
    session_.energy_threshold = settings_.min_energy_threshold;
}

AudioSession AudioCalibrator::calibrate() {
    calibrations_++;

    std::optional<DeviceScore> best;
    if (!probe_.refreshDevices()) {
        std::cerr << "[AudioCalibrator] Device list not refreshed, using the previous one" << std::endl;
    }
    auto devices = probe_.listInputDevices();
    std::cout << "[AudioCalibrator] Found " << devices.size() << " input devices" << std::endl;

    for (const auto& device : devices) {
        if (device.max_input_channels <= 0) {
            continue;
        }
        auto scored = scoreDevice(device);
        if (!scored) {
            continue;
        }

        std::cout << "[AudioCalibrator]   [" << device.id << "] " << device.name
                  << " score=" << scored->score << " snr=" << scored->snr_db << "dB"
                  << (device.is_default ? " (default)" : "") << std::endl;

        if (!best || scored->score > best->score + SCORE_EPSILON) {
            best = scored;
        } else if (std::abs(scored->score - best->score) <= SCORE_EPSILON &&
                   scored->device.is_default && !best->device.is_default) {
            best = scored;
        }
    }

    AudioSession next;
    next.last_calibrated_at = SystemClock::now();

    if (!best) {
        std::cerr << "[AudioCalibrator] No usable capture device - audio disabled" << std::endl;
        next.enabled = false;
        next.sample_rate_hz = settings_.preferred_sample_rate;
        next.energy_threshold = settings_.min_energy_threshold;
    } else {
        next.enabled = true;
        next.device_id = best->device.id;
        next.device_name = best->device.name;
        next.sample_rate_hz = best->sample_rate;

        auto ambient = probe_.captureSamples(best->device.id, best->sample_rate, settings_.ambient_window);
        if (ambient && !ambient->empty()) {
            next.energy_threshold = thresholdFor(*ambient);
        } else {
            std::cerr << "[AudioCalibrator] Ambient capture failed, keeping previous threshold" << std::endl;
            std::lock_guard<std::mutex> lock(mutex_);
            next.energy_threshold = std::clamp(session_.energy_threshold,
                                               settings_.min_energy_threshold,
                                               settings_.max_energy_threshold);
        }

        std::cout << "[AudioCalibrator] Using [" << next.device_id << "] " << next.device_name
                  << " @ " << next.sample_rate_hz << "Hz, threshold=" << next.energy_threshold
                  << std::endl;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = next;
    }
    failures_ = 0;
    return next;
}

AudioSession AudioCalibrator::recalibrate(const std::string& reason) {
    std::cout << "[AudioCalibrator] Recalibrating (reason: " << reason << ")" << std::endl;
    return calibrate();
}

AudioSession AudioCalibrator::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

bool AudioCalibrator::noteRecognitionFailure() {
    int count = ++failures_;
    return count >= settings_.failures_before_recalibration;
}

void AudioCalibrator::noteRecognitionSuccess() {
    failures_ = 0;
}

bool AudioCalibrator::isDue(SystemClock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (calibrations_.load() == 0) {
        return true;
    }
    return now - session_.last_calibrated_at >= settings_.recalibration_interval;
}

std::optional<int> AudioCalibrator::pickSampleRate(const DeviceInfo& device) {
    if (probe_.supportsSampleRate(device.id, settings_.preferred_sample_rate)) {
        return settings_.preferred_sample_rate;
    }
    for (int rate : settings_.supported_sample_rates) {
        if (rate != settings_.preferred_sample_rate && probe_.supportsSampleRate(device.id, rate)) {
            return rate;
        }
    }
    return std::nullopt;
}

std::optional<DeviceScore> AudioCalibrator::scoreDevice(const DeviceInfo& device) {
    auto rate = pickSampleRate(device);
    if (!rate) {
        std::cerr << "[AudioCalibrator] " << device.name << ": no supported sample rate" << std::endl;
        return std::nullopt;
    }

    auto samples = probe_.captureSamples(device.id, *rate, settings_.snr_window);
    if (!samples || samples->empty()) {
        std::cerr << "[AudioCalibrator] " << device.name << ": test capture failed" << std::endl;
        return std::nullopt;
    }

    DeviceScore result;
    result.device = device;
    result.sample_rate = *rate;
    result.snr_db = snrDb(*samples, *rate);
    result.score = std::min(device.max_input_channels, 2)
                 + (device.is_default ? 1.0 : 0.0)
                 + std::clamp(result.snr_db, 0.0, MAX_SNR_DB) / 10.0;
    return result;
}

float AudioCalibrator::thresholdFor(const std::vector<float>& ambient) const {
    float noise = rms(ambient.data(), ambient.size());
    return std::clamp(noise * settings_.threshold_multiplier,
                      settings_.min_energy_threshold,
                      settings_.max_energy_threshold);
}

double AudioCalibrator::snrDb(const std::vector<float>& samples, int sample_rate) {
    // 10ms frames; loud frames vs quiet frames of the same capture
    std::size_t frame = std::max<std::size_t>(1, static_cast<std::size_t>(sample_rate / 100));
    std::vector<float> levels;
    for (std::size_t i = 0; i + frame <= samples.size(); i += frame) {
        levels.push_back(rms(samples.data() + i, frame));
    }
    if (levels.empty()) {
        return 0.0;
    }

    std::sort(levels.begin(), levels.end());
    constexpr double FLOOR = 1e-6;
    double noise = std::max<double>(levels[levels.size() / 5], FLOOR);
    double signal = std::max<double>(levels[(levels.size() * 95) / 100], FLOOR);
    return 20.0 * std::log10(signal / noise);
}

} // namespace gideon::audio
