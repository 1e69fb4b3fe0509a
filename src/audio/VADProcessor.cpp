/**
 * VADProcessor.cpp - Voice Activity Detection via libfvad
 *
 * Confirms energy-gated capture frames as speech. Samples are accumulated
 * into fixed fvad frames; a chunk is speech if any frame in it is.
 */

#include "gideon/audio/VADProcessor.hpp"
#include "gideon/audio/WavCodec.hpp"

#include <fvad.h>
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <vector>

namespace gideon::audio {

namespace {

bool fvadSupports(int rate) {
    return rate == 8000 || rate == 16000 || rate == 32000 || rate == 48000;
}

} // anonymous namespace

struct VADProcessor::Impl {
    Fvad* vad = nullptr;
    std::mutex mutex;

    int input_rate = 16000;   // rate of incoming samples
    int vad_rate = 16000;     // rate fvad runs at
    int frame_ms = 20;
    int frame_samples = 320;
    VADMode mode = VADMode::AGGRESSIVE;

    std::vector<float> frameBuffer;
    std::vector<std::int16_t> frame16;
    bool lastDecision = false;

    bool configure(int rate) {
        input_rate = rate;
        vad_rate = fvadSupports(rate) ? rate : 16000;
        frame_samples = (vad_rate * frame_ms) / 1000;
        frameBuffer.clear();
        frameBuffer.reserve(frame_samples);
        frame16.assign(frame_samples, 0);
        lastDecision = false;

        if (!vad) return false;
        return restart();
    }

    // fvad_reset() also resets mode and rate to their defaults
    bool restart() {
        fvad_reset(vad);
        if (fvad_set_mode(vad, static_cast<int>(mode)) < 0) {
            std::cerr << "[VADProcessor] Invalid mode" << std::endl;
        }
        if (fvad_set_sample_rate(vad, vad_rate) < 0) {
            std::cerr << "[VADProcessor] Invalid sample rate: " << vad_rate << std::endl;
            return false;
        }
        return true;
    }

    bool processFrame() {
        for (int i = 0; i < frame_samples; ++i) {
            float sample = std::clamp(frameBuffer[i], -1.0f, 1.0f);
            frame16[i] = static_cast<std::int16_t>(sample * 32767.0f);
        }
        frameBuffer.clear();

        int result = fvad_process(vad, frame16.data(), static_cast<std::size_t>(frame_samples));
        if (result < 0) {
            std::cerr << "[VADProcessor] fvad_process failed" << std::endl;
            return false;
        }
        return result == 1;
    }
};

VADProcessor::VADProcessor(int sample_rate, VADMode mode, int frame_ms)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->frame_ms = frame_ms;
    pImpl_->mode = mode;

    pImpl_->vad = fvad_new();
    if (!pImpl_->vad) {
        std::cerr << "[VADProcessor] Failed to create fvad instance" << std::endl;
        return;
    }

    if (!pImpl_->configure(sample_rate)) {
        fvad_free(pImpl_->vad);
        pImpl_->vad = nullptr;
        return;
    }

    std::cout << "[VADProcessor] Initialized (sample_rate=" << sample_rate
              << "Hz, frame=" << frame_ms << "ms, mode=" << static_cast<int>(mode) << ")"
              << std::endl;
}

VADProcessor::~VADProcessor() {
    if (pImpl_->vad) {
        fvad_free(pImpl_->vad);
    }
}

bool VADProcessor::isReady() const {
    return pImpl_->vad != nullptr;
}

bool VADProcessor::setSampleRate(int sample_rate) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    if (sample_rate == pImpl_->input_rate) {
        return pImpl_->vad != nullptr;
    }
    bool ok = pImpl_->configure(sample_rate);
    if (ok && pImpl_->vad_rate != sample_rate) {
        std::cout << "[VADProcessor] " << sample_rate << "Hz input resampled to "
                  << pImpl_->vad_rate << "Hz" << std::endl;
    }
    return ok;
}

int VADProcessor::sampleRate() const {
    return pImpl_->input_rate;
}

bool VADProcessor::isSpeech(const float* samples, std::size_t count) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    // Without fvad the energy gate alone decides
    if (!pImpl_->vad || !samples || count == 0) {
        return true;
    }

    std::vector<float> converted;
    const float* input = samples;
    std::size_t n = count;
    if (pImpl_->vad_rate != pImpl_->input_rate) {
        converted = resampleLinear(std::vector<float>(samples, samples + count),
                                   pImpl_->input_rate, pImpl_->vad_rate);
        input = converted.data();
        n = converted.size();
    }

    bool any_frame = false;
    bool speech = false;
    for (std::size_t i = 0; i < n; ++i) {
        pImpl_->frameBuffer.push_back(input[i]);
        if (pImpl_->frameBuffer.size() >= static_cast<std::size_t>(pImpl_->frame_samples)) {
            any_frame = true;
            speech = pImpl_->processFrame() || speech;
        }
    }

    if (any_frame) {
        pImpl_->lastDecision = speech;
    }
    return pImpl_->lastDecision;
}

void VADProcessor::reset() {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    pImpl_->frameBuffer.clear();
    pImpl_->lastDecision = false;
    if (pImpl_->vad) {
        pImpl_->restart();
    }
}

} // namespace gideon::audio
