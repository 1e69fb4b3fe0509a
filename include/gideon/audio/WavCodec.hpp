/**
 * WavCodec.hpp - RIFF/WAVE decoding and sample-rate conversion
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gideon::audio {

struct WavAudio {
    std::vector<float> samples;  // mono, [-1, 1]
    int sample_rate = 0;
    int channels = 0;            // channel count in the source file
};

/**
 * Decode 16/24-bit PCM or 32-bit float WAV data, downmixing to mono.
 * @return nullopt for malformed or unsupported data
 */
std::optional<WavAudio> decodeWav(const std::vector<std::uint8_t>& bytes);
std::optional<WavAudio> decodeWav(const std::string& bytes);

/**
 * Linear-interpolation resampler.
 */
std::vector<float> resampleLinear(const std::vector<float>& samples, int from_rate, int to_rate);

float rms(const float* samples, std::size_t count);

} // namespace gideon::audio
