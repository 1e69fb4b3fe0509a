/**
 * Interfaces.hpp - Audio collaborators consumed by the engine
 *
 * AudioEngine implements the PortAudio versions; tests provide scripted fakes.
 */

#pragma once

#include "gideon/Types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gideon::audio {

struct DeviceInfo {
    int id = -1;
    std::string name;
    int max_input_channels = 0;
    double default_sample_rate = 0.0;
    bool is_default = false;
};

/**
 * Enumerates capture devices and records short test captures.
 */
class DeviceProbe {
public:
    virtual ~DeviceProbe() = default;

    /**
     * Re-read the system's device list. listInputDevices() reports the
     * list as of the last successful refresh.
     * @return false if the list could not be re-read now; the previous one stands
     */
    virtual bool refreshDevices() = 0;

    virtual std::vector<DeviceInfo> listInputDevices() = 0;
    virtual bool supportsSampleRate(int device_id, int sample_rate) = 0;

    /**
     * Blocking mono capture of `duration` from a device.
     * @return nullopt if the device cannot be opened or read
     */
    virtual std::optional<std::vector<float>> captureSamples(
        int device_id, int sample_rate, std::chrono::milliseconds duration) = 0;
};

enum class ReadStatus {
    FRAME,
    TIMEOUT,
    STOPPED,
    ERROR
};

/**
 * Microphone stream. Must tolerate stopCapture() mid-stream.
 */
class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    virtual bool startCapture(const AudioSession& session) = 0;

    /**
     * Wait up to `timeout` for the next frame of mono samples.
     */
    virtual ReadStatus readFrame(std::vector<float>& frame, std::chrono::milliseconds timeout) = 0;

    virtual void stopCapture() = 0;
    virtual bool isCapturing() const = 0;
};

/**
 * Frame-level speech classifier used to confirm energy-gated frames.
 */
class VoiceActivity {
public:
    virtual ~VoiceActivity() = default;
    virtual bool isSpeech(const float* samples, std::size_t count) = 0;
    virtual void reset() = 0;
};

} // namespace gideon::audio
