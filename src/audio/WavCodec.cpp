/**
 * WavCodec.cpp - WAV parsing for TTS responses, linear resampling
 */

#include "gideon/audio/WavCodec.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>

namespace gideon::audio {

namespace {

template <typename T>
T readLE(const std::uint8_t* p) {
    T value;
    std::memcpy(&value, p, sizeof(T));
    return value;
}

bool hasTag(const std::uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

} // anonymous namespace

std::optional<WavAudio> decodeWav(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < 44 || !hasTag(bytes.data(), "RIFF") || !hasTag(bytes.data() + 8, "WAVE")) {
        std::cerr << "[WavCodec] Invalid WAV: no RIFF/WAVE header" << std::endl;
        return std::nullopt;
    }

    std::uint16_t audio_format = 0;
    std::uint16_t channels = 0;
    std::uint32_t sample_rate = 0;
    std::uint16_t bits = 0;
    std::size_t data_offset = 0;
    std::size_t data_size = 0;

    // Walk chunks; the header may carry LIST/fact chunks before "data"
    std::size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const std::uint8_t* chunk = bytes.data() + pos;
        std::uint32_t chunk_size = readLE<std::uint32_t>(chunk + 4);

        if (hasTag(chunk, "fmt ") && pos + 8 + 16 <= bytes.size()) {
            audio_format = readLE<std::uint16_t>(chunk + 8);
            channels = readLE<std::uint16_t>(chunk + 10);
            sample_rate = readLE<std::uint32_t>(chunk + 12);
            bits = readLE<std::uint16_t>(chunk + 22);
        } else if (hasTag(chunk, "data")) {
            data_offset = pos + 8;
            data_size = std::min<std::size_t>(chunk_size, bytes.size() - data_offset);
            break;
        }
        pos += 8 + chunk_size + (chunk_size & 1);
    }

    if (data_offset == 0 || channels == 0 || sample_rate == 0) {
        std::cerr << "[WavCodec] Invalid WAV: missing fmt or data chunk" << std::endl;
        return std::nullopt;
    }

    const std::size_t bytes_per_sample = bits / 8;
    if (bytes_per_sample == 0) {
        return std::nullopt;
    }
    const std::size_t frames = data_size / (bytes_per_sample * channels);
    const std::uint8_t* data = bytes.data() + data_offset;

    WavAudio wav;
    wav.sample_rate = static_cast<int>(sample_rate);
    wav.channels = channels;
    wav.samples.resize(frames);

    for (std::size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (std::size_t c = 0; c < channels; ++c) {
            const std::uint8_t* p = data + (f * channels + c) * bytes_per_sample;
            float sample = 0.0f;
            if (bits == 16 && audio_format == 1) {
                sample = static_cast<float>(readLE<std::int16_t>(p)) / 32768.0f;
            } else if (bits == 24 && audio_format == 1) {
                std::int32_t val = (p[0] << 8) | (p[1] << 16) | (p[2] << 24);
                val >>= 8;  // Sign-extend
                sample = static_cast<float>(val) / 8388608.0f;
            } else if (bits == 32 && audio_format == 3) {
                sample = readLE<float>(p);
            } else {
                std::cerr << "[WavCodec] Unsupported WAV format: " << bits << " bits, format "
                          << audio_format << std::endl;
                return std::nullopt;
            }
            sum += sample;
        }
        wav.samples[f] = std::clamp(sum / static_cast<float>(channels), -1.0f, 1.0f);
    }

    return wav;
}

std::optional<WavAudio> decodeWav(const std::string& bytes) {
    return decodeWav(std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
}

std::vector<float> resampleLinear(const std::vector<float>& samples, int from_rate, int to_rate) {
    if (samples.empty() || from_rate <= 0 || to_rate <= 0 || from_rate == to_rate) {
        return samples;
    }

    double ratio = static_cast<double>(to_rate) / from_rate;
    std::size_t new_size = static_cast<std::size_t>(samples.size() * ratio);
    std::vector<float> resampled(new_size);

    for (std::size_t i = 0; i < new_size; i++) {
        double src_pos = i / ratio;
        std::size_t idx = static_cast<std::size_t>(src_pos);
        double frac = src_pos - idx;

        if (idx + 1 < samples.size()) {
            resampled[i] = static_cast<float>(samples[idx] * (1.0 - frac) + samples[idx + 1] * frac);
        } else if (idx < samples.size()) {
            resampled[i] = samples[idx];
        }
    }

    return resampled;
}

float rms(const float* samples, std::size_t count) {
    if (!samples || count == 0) {
        return 0.0f;
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

} // namespace gideon::audio
