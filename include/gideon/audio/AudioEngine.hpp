/**
 * AudioEngine.hpp - PortAudio capture, playback and device enumeration
 */

#pragma once

#include "gideon/Config.hpp"
#include "gideon/audio/Interfaces.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace gideon::audio {

class AudioEngine : public CaptureSource, public DeviceProbe {
public:
    AudioEngine(const AudioSettings& settings, int playback_sample_rate);
    ~AudioEngine() override;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    /**
     * Initialize PortAudio and open the playback stream.
     * Capture streams are opened per session by startCapture().
     */
    bool initialize();
    bool isInitialized() const;

    // DeviceProbe
    /**
     * Restart PortAudio so hot-plugged devices show up, then reopen playback.
     * Refused while capturing or while queued speech is still playing.
     */
    bool refreshDevices() override;
    std::vector<DeviceInfo> listInputDevices() override;
    bool supportsSampleRate(int device_id, int sample_rate) override;
    std::optional<std::vector<float>> captureSamples(
        int device_id, int sample_rate, std::chrono::milliseconds duration) override;

    // CaptureSource
    bool startCapture(const AudioSession& session) override;
    ReadStatus readFrame(std::vector<float>& frame, std::chrono::milliseconds timeout) override;
    void stopCapture() override;
    bool isCapturing() const override;

    // Playback (mono float at playbackSampleRate())
    bool hasPlayback() const;
    std::size_t queuePlayback(const float* samples, std::size_t count);
    void clearPlayback();
    bool isPlaying() const;
    int playbackSampleRate() const;

    // Time for the last queued samples to leave the device after isPlaying() turns false
    std::chrono::milliseconds outputLatency() const;

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace gideon::audio
