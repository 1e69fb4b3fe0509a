/**
 * AudioEngine.cpp - PortAudio wrapper implementation
 *
 * Capture runs a callback stream feeding a ring buffer that the voice loop
 * drains frame by frame. Playback is a long-lived output stream fed from a
 * second ring buffer. Calibration captures use blocking reads on a
 * short-lived stream.
 */

#include "gideon/audio/AudioEngine.hpp"
#include "gideon/audio/RingBuffer.hpp"

#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <cstring>
#include <iostream>
#include <mutex>
#include <thread>

namespace gideon::audio {

constexpr std::size_t CAPTURE_BUFFER_SECONDS = 10;
constexpr std::size_t PLAYBACK_BUFFER_SECONDS = 30;
constexpr std::chrono::milliseconds POLL_INTERVAL{5};

struct AudioEngine::Impl {
    const AudioSettings& settings;
    int playback_rate;

    PaStream* inputStream = nullptr;
    PaStream* outputStream = nullptr;
    int inputChannels = 1;
    int captureRate = 16000;

    RingBuffer<float> captureBuffer;
    RingBuffer<float> playbackBuffer;
    std::vector<float> downmix;

    std::atomic<bool> initialized{false};
    std::atomic<bool> capturing{false};
    std::atomic<bool> playbackOpen{false};
    std::atomic<std::size_t> droppedSamples{0};

    mutable std::mutex errorMutex;
    std::string lastError;

    // Serialises stream open/close, device queries and device-list refreshes
    mutable std::mutex streamMutex;

    Impl(const AudioSettings& s, int rate)
        : settings(s)
        , playback_rate(rate)
        , captureBuffer(48000 * CAPTURE_BUFFER_SECONDS)
        , playbackBuffer(static_cast<std::size_t>(rate) * PLAYBACK_BUFFER_SECONDS) {
    }

    void fail(const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(errorMutex);
            lastError = message;
        }
        std::cerr << "[AudioEngine] " << message << std::endl;
    }

    static int captureCallback(const void* input, void* /*output*/, unsigned long frameCount,
                               const PaStreamCallbackTimeInfo* /*timeInfo*/,
                               PaStreamCallbackFlags /*statusFlags*/, void* userData) {
        auto* impl = static_cast<Impl*>(userData);
        const float* samples = static_cast<const float*>(input);
        if (!samples) {
            return paContinue;
        }

        std::size_t written = 0;
        if (impl->inputChannels == 1) {
            written = impl->captureBuffer.push(samples, frameCount);
        } else {
            // downmix is sized in startCapture() for the largest callback
            std::size_t n = std::min<std::size_t>(frameCount, impl->downmix.size());
            for (std::size_t f = 0; f < n; ++f) {
                float sum = 0.0f;
                for (int c = 0; c < impl->inputChannels; ++c) {
                    sum += samples[f * impl->inputChannels + c];
                }
                impl->downmix[f] = sum / static_cast<float>(impl->inputChannels);
            }
            written = impl->captureBuffer.push(impl->downmix.data(), n);
        }
        if (written < frameCount) {
            impl->droppedSamples += frameCount - written;
        }
        return paContinue;
    }

    static int playbackCallback(const void* /*input*/, void* output, unsigned long frameCount,
                                const PaStreamCallbackTimeInfo* /*timeInfo*/,
                                PaStreamCallbackFlags /*statusFlags*/, void* userData) {
        auto* impl = static_cast<Impl*>(userData);
        float* out = static_cast<float*>(output);

        std::size_t read = impl->playbackBuffer.pop(out, frameCount);
        if (read < frameCount) {
            std::memset(out + read, 0, (frameCount - read) * sizeof(float));
        }
        return paContinue;
    }

    PaStreamParameters inputParams(int device_id, int channels) const {
        PaStreamParameters params;
        params.device = device_id;
        params.channelCount = channels;
        params.sampleFormat = paFloat32;
        const PaDeviceInfo* info = Pa_GetDeviceInfo(device_id);
        params.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
        params.hostApiSpecificStreamInfo = nullptr;
        return params;
    }

    // Mono if the device takes it, else its first two channels
    int pickChannels(int device_id, int sample_rate) const {
        PaStreamParameters mono = inputParams(device_id, 1);
        if (Pa_IsFormatSupported(&mono, nullptr, sample_rate) == paFormatIsSupported) {
            return 1;
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(device_id);
        int channels = info ? std::min(info->maxInputChannels, 2) : 0;
        if (channels <= 0) {
            return 0;
        }
        PaStreamParameters multi = inputParams(device_id, channels);
        return Pa_IsFormatSupported(&multi, nullptr, sample_rate) == paFormatIsSupported ? channels : 0;
    }

    bool openPlayback() {
        PaDeviceIndex device = Pa_GetDefaultOutputDevice();
        if (device == paNoDevice) {
            fail("No output device available, speech output disabled");
            playbackOpen = false;
            return false;
        }

        PaStreamParameters params;
        params.device = device;
        params.channelCount = 1;
        params.sampleFormat = paFloat32;
        params.suggestedLatency = Pa_GetDeviceInfo(device)->defaultLowOutputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        PaError err = Pa_OpenStream(&outputStream, nullptr, &params, playback_rate,
                                    settings.frames_per_buffer, paClipOff, playbackCallback, this);
        if (err != paNoError) {
            fail(std::string("Pa_OpenStream (output) failed: ") + Pa_GetErrorText(err));
            outputStream = nullptr;
            playbackOpen = false;
            return false;
        }

        err = Pa_StartStream(outputStream);
        if (err != paNoError) {
            fail(std::string("Pa_StartStream (output) failed: ") + Pa_GetErrorText(err));
            Pa_CloseStream(outputStream);
            outputStream = nullptr;
            playbackOpen = false;
            return false;
        }
        playbackOpen = true;

        std::cout << "[AudioEngine] Playback on " << Pa_GetDeviceInfo(device)->name
                  << " @ " << playback_rate << "Hz" << std::endl;
        return true;
    }

    // Leaves playbackOpen alone so a refresh does not look like lost output
    void closePlayback() {
        if (outputStream) {
            Pa_StopStream(outputStream);
            Pa_CloseStream(outputStream);
            outputStream = nullptr;
        }
    }

    // Session ids go stale when a refresh renumbers devices; the name does not
    int resolveDevice(const AudioSession& session) const {
        const int count = Pa_GetDeviceCount();
        auto usable = [](const PaDeviceInfo* info) { return info && info->maxInputChannels > 0; };

        if (session.device_id >= 0 && session.device_id < count) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(session.device_id);
            if (usable(info) && (session.device_name.empty() ||
                                 (info->name && session.device_name == info->name))) {
                return session.device_id;
            }
        }
        for (int i = 0; i < count; ++i) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (usable(info) && info->name && session.device_name == info->name) {
                return i;
            }
        }
        return paNoDevice;
    }

    void closeCapture() {
        capturing = false;
        if (inputStream) {
            Pa_StopStream(inputStream);
            Pa_CloseStream(inputStream);
            inputStream = nullptr;
        }
    }
};

AudioEngine::AudioEngine(const AudioSettings& settings, int playback_sample_rate)
    : pImpl_(std::make_unique<Impl>(settings, playback_sample_rate))
{
}

AudioEngine::~AudioEngine() {
    stopCapture();
    pImpl_->closePlayback();
    pImpl_->playbackOpen = false;

    if (pImpl_->initialized) {
        Pa_Terminate();
    }
}

bool AudioEngine::initialize() {
    if (pImpl_->initialized) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->fail(std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err));
        return false;
    }
    pImpl_->initialized = true;

    std::cout << "[AudioEngine] Found " << Pa_GetDeviceCount() << " audio devices" << std::endl;

    // Playback is optional: without it replies go to the console
    std::lock_guard<std::mutex> lock(pImpl_->streamMutex);
    pImpl_->openPlayback();
    return true;
}

bool AudioEngine::isInitialized() const {
    return pImpl_->initialized;
}

bool AudioEngine::refreshDevices() {
    if (!pImpl_->initialized) {
        return false;
    }

    std::lock_guard<std::mutex> lock(pImpl_->streamMutex);
    // PortAudio only enumerates in Pa_Initialize, and that needs every stream closed
    if (pImpl_->capturing || pImpl_->playbackBuffer.available() > 0) {
        return false;
    }

    pImpl_->closePlayback();
    Pa_Terminate();

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->initialized = false;
        pImpl_->playbackOpen = false;
        pImpl_->fail(std::string("Pa_Initialize (refresh) failed: ") + Pa_GetErrorText(err));
        return false;
    }

    pImpl_->openPlayback();
    return true;
}

std::vector<DeviceInfo> AudioEngine::listInputDevices() {
    std::vector<DeviceInfo> devices;
    if (!pImpl_->initialized) {
        return devices;
    }

    std::lock_guard<std::mutex> lock(pImpl_->streamMutex);

    int count = Pa_GetDeviceCount();
    if (count < 0) {
        pImpl_->fail(std::string("Pa_GetDeviceCount failed: ") + Pa_GetErrorText(count));
        return devices;
    }

    PaDeviceIndex default_input = Pa_GetDefaultInputDevice();
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) {
            continue;
        }
        DeviceInfo device;
        device.id = i;
        device.name = info->name ? info->name : "";
        device.max_input_channels = info->maxInputChannels;
        device.default_sample_rate = info->defaultSampleRate;
        device.is_default = (i == default_input);
        devices.push_back(device);
    }
    return devices;
}

bool AudioEngine::supportsSampleRate(int device_id, int sample_rate) {
    if (!pImpl_->initialized) {
        return false;
    }

    std::lock_guard<std::mutex> lock(pImpl_->streamMutex);
    if (device_id < 0 || device_id >= Pa_GetDeviceCount()) {
        return false;
    }
    return pImpl_->pickChannels(device_id, sample_rate) > 0;
}

std::optional<std::vector<float>> AudioEngine::captureSamples(
    int device_id, int sample_rate, std::chrono::milliseconds duration) {
    if (!pImpl_->initialized) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(pImpl_->streamMutex);
    int channels = pImpl_->pickChannels(device_id, sample_rate);
    if (channels <= 0) {
        return std::nullopt;
    }

    PaStreamParameters params = pImpl_->inputParams(device_id, channels);
    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(&stream, &params, nullptr, sample_rate,
                                pImpl_->settings.frames_per_buffer, paClipOff, nullptr, nullptr);
    if (err != paNoError) {
        pImpl_->fail(std::string("Pa_OpenStream (probe) failed: ") + Pa_GetErrorText(err));
        return std::nullopt;
    }

    err = Pa_StartStream(stream);
    if (err != paNoError) {
        pImpl_->fail(std::string("Pa_StartStream (probe) failed: ") + Pa_GetErrorText(err));
        Pa_CloseStream(stream);
        return std::nullopt;
    }

    const std::size_t frames = static_cast<std::size_t>(sample_rate) * duration.count() / 1000;
    const std::size_t chunk = static_cast<std::size_t>(pImpl_->settings.frames_per_buffer);
    std::vector<float> interleaved(chunk * channels);
    std::vector<float> mono;
    mono.reserve(frames);

    bool ok = true;
    while (mono.size() < frames) {
        std::size_t n = std::min(chunk, frames - mono.size());
        err = Pa_ReadStream(stream, interleaved.data(), n);
        if (err != paNoError && err != paInputOverflowed) {
            pImpl_->fail(std::string("Pa_ReadStream failed: ") + Pa_GetErrorText(err));
            ok = false;
            break;
        }
        for (std::size_t f = 0; f < n; ++f) {
            float sum = 0.0f;
            for (int c = 0; c < channels; ++c) {
                sum += interleaved[f * channels + c];
            }
            mono.push_back(sum / static_cast<float>(channels));
        }
    }

    Pa_StopStream(stream);
    Pa_CloseStream(stream);

    if (!ok) {
        return std::nullopt;
    }
    return mono;
}

bool AudioEngine::startCapture(const AudioSession& session) {
    if (!pImpl_->initialized || !session.enabled) {
        return false;
    }

    std::lock_guard<std::mutex> lock(pImpl_->streamMutex);
    pImpl_->closeCapture();

    const int device_id = pImpl_->resolveDevice(session);
    if (device_id == paNoDevice) {
        pImpl_->fail("Device " + session.device_name + " is gone");
        return false;
    }

    int channels = pImpl_->pickChannels(device_id, session.sample_rate_hz);
    if (channels <= 0) {
        pImpl_->fail("Device " + session.device_name + " rejects " +
                     std::to_string(session.sample_rate_hz) + "Hz");
        return false;
    }

    pImpl_->inputChannels = channels;
    pImpl_->captureRate = session.sample_rate_hz;
    pImpl_->downmix.assign(static_cast<std::size_t>(pImpl_->settings.frames_per_buffer) * 4, 0.0f);
    pImpl_->droppedSamples = 0;

    // Leftovers from the previous session
    pImpl_->captureBuffer.clear();

    PaStreamParameters params = pImpl_->inputParams(device_id, channels);
    PaError err = Pa_OpenStream(&pImpl_->inputStream, &params, nullptr, session.sample_rate_hz,
                                pImpl_->settings.frames_per_buffer, paClipOff,
                                Impl::captureCallback, pImpl_.get());
    if (err != paNoError) {
        pImpl_->fail(std::string("Pa_OpenStream (input) failed: ") + Pa_GetErrorText(err));
        pImpl_->inputStream = nullptr;
        return false;
    }

    err = Pa_StartStream(pImpl_->inputStream);
    if (err != paNoError) {
        pImpl_->fail(std::string("Pa_StartStream (input) failed: ") + Pa_GetErrorText(err));
        Pa_CloseStream(pImpl_->inputStream);
        pImpl_->inputStream = nullptr;
        return false;
    }

    pImpl_->capturing = true;
    return true;
}

ReadStatus AudioEngine::readFrame(std::vector<float>& frame, std::chrono::milliseconds timeout) {
    if (!pImpl_->capturing) {
        return ReadStatus::STOPPED;
    }

    const std::size_t want = static_cast<std::size_t>(pImpl_->settings.frames_per_buffer);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (pImpl_->captureBuffer.available() < want) {
        if (!pImpl_->capturing) {
            return ReadStatus::STOPPED;
        }
        if (pImpl_->inputStream && Pa_IsStreamActive(pImpl_->inputStream) < 0) {
            pImpl_->fail("Capture stream is no longer active");
            return ReadStatus::ERROR;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    std::size_t n = std::min(want, pImpl_->captureBuffer.available());
    if (n == 0) {
        return ReadStatus::TIMEOUT;
    }
    frame.resize(n);
    frame.resize(pImpl_->captureBuffer.pop(frame.data(), n));
    return ReadStatus::FRAME;
}

void AudioEngine::stopCapture() {
    std::lock_guard<std::mutex> lock(pImpl_->streamMutex);
    if (pImpl_->droppedSamples > 0) {
        std::cerr << "[AudioEngine] Capture overflow dropped " << pImpl_->droppedSamples
                  << " samples" << std::endl;
        pImpl_->droppedSamples = 0;
    }
    pImpl_->closeCapture();
}

bool AudioEngine::isCapturing() const {
    return pImpl_->capturing;
}

bool AudioEngine::hasPlayback() const {
    return pImpl_->playbackOpen;
}

// Samples queued during a refresh play once the output stream reopens
std::size_t AudioEngine::queuePlayback(const float* samples, std::size_t count) {
    if (!pImpl_->playbackOpen) {
        return 0;
    }
    return pImpl_->playbackBuffer.push(samples, count);
}

void AudioEngine::clearPlayback() {
    pImpl_->playbackBuffer.clear();
}

bool AudioEngine::isPlaying() const {
    return pImpl_->playbackBuffer.available() > 0;
}

int AudioEngine::playbackSampleRate() const {
    return pImpl_->playback_rate;
}

std::chrono::milliseconds AudioEngine::outputLatency() const {
    std::lock_guard<std::mutex> lock(pImpl_->streamMutex);
    if (!pImpl_->outputStream) {
        return std::chrono::milliseconds(0);
    }
    const PaStreamInfo* info = Pa_GetStreamInfo(pImpl_->outputStream);
    if (!info) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds(static_cast<long>(info->outputLatency * 1000.0));
}

std::string AudioEngine::lastError() const {
    std::lock_guard<std::mutex> lock(pImpl_->errorMutex);
    return pImpl_->lastError;
}

} // namespace gideon::audio
