/**
 * test_wav.cpp - WAV decoding, resampling and RMS
 */

#include "gideon/audio/WavCodec.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <vector>

using namespace gideon::audio;

namespace {

void put16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(v & 0xFF);
    out.push_back((v >> 8) & 0xFF);
}

void put32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back((v >> (8 * i)) & 0xFF);
}

void tag(std::vector<std::uint8_t>& out, const char* t) {
    out.insert(out.end(), t, t + 4);
}

std::vector<std::uint8_t> makePcm16(int rate, int channels, const std::vector<std::int16_t>& interleaved,
                                    bool list_chunk = false) {
    std::vector<std::uint8_t> body;
    tag(body, "WAVE");
    tag(body, "fmt ");
    put32(body, 16);
    put16(body, 1);
    put16(body, static_cast<std::uint16_t>(channels));
    put32(body, static_cast<std::uint32_t>(rate));
    put32(body, static_cast<std::uint32_t>(rate * channels * 2));
    put16(body, static_cast<std::uint16_t>(channels * 2));
    put16(body, 16);
    if (list_chunk) {
        tag(body, "LIST");
        put32(body, 4);
        tag(body, "INFO");
    }
    tag(body, "data");
    put32(body, static_cast<std::uint32_t>(interleaved.size() * 2));
    for (auto s : interleaved) put16(body, static_cast<std::uint16_t>(s));

    std::vector<std::uint8_t> wav;
    tag(wav, "RIFF");
    put32(wav, static_cast<std::uint32_t>(body.size()));
    wav.insert(wav.end(), body.begin(), body.end());
    return wav;
}

} // anonymous namespace

void test_decode_mono() {
    auto bytes = makePcm16(24000, 1, {0, 16384, -16384, 32767, 0, 0, 0, 0});
    auto wav = decodeWav(bytes);
    assert(wav.has_value());
    assert(wav->sample_rate == 24000);
    assert(wav->channels == 1);
    assert(wav->samples.size() == 8);
    assert(std::fabs(wav->samples[1] - 0.5f) < 1e-4f);
    assert(std::fabs(wav->samples[2] + 0.5f) < 1e-4f);

    std::cout << "[PASS] test_decode_mono" << std::endl;
}

void test_decode_stereo_downmix() {
    // L/R pairs; the decoder averages them
    auto bytes = makePcm16(16000, 2, {16384, 0, 16384, 16384, -16384, -16384, 0, 0}, true);
    auto wav = decodeWav(bytes);
    assert(wav.has_value());
    assert(wav->channels == 2);
    assert(wav->samples.size() == 4);
    assert(std::fabs(wav->samples[0] - 0.25f) < 1e-4f);
    assert(std::fabs(wav->samples[1] - 0.5f) < 1e-4f);
    assert(std::fabs(wav->samples[2] + 0.5f) < 1e-4f);

    std::cout << "[PASS] test_decode_stereo_downmix" << std::endl;
}

void test_decode_rejects_garbage() {
    std::string not_wav(64, 'x');
    assert(!decodeWav(not_wav).has_value());
    assert(!decodeWav(std::vector<std::uint8_t>{}).has_value());

    std::cout << "[PASS] test_decode_rejects_garbage" << std::endl;
}

void test_resample() {
    std::vector<float> ramp(1600);
    for (std::size_t i = 0; i < ramp.size(); ++i) ramp[i] = static_cast<float>(i) / ramp.size();

    auto down = resampleLinear(ramp, 16000, 8000);
    assert(down.size() == 800);
    assert(std::fabs(down[100] - ramp[200]) < 1e-5f);

    auto up = resampleLinear(ramp, 16000, 48000);
    assert(up.size() == 4800);

    auto same = resampleLinear(ramp, 16000, 16000);
    assert(same == ramp);

    std::cout << "[PASS] test_resample" << std::endl;
}

void test_rms() {
    std::vector<float> constant(256, 0.5f);
    assert(std::fabs(rms(constant.data(), constant.size()) - 0.5f) < 1e-5f);
    assert(rms(constant.data(), 0) == 0.0f);

    std::cout << "[PASS] test_rms" << std::endl;
}

int main() {
    std::cout << "=== WavCodec Tests ===" << std::endl;

    test_decode_mono();
    test_decode_stereo_downmix();
    test_decode_rejects_garbage();
    test_resample();
    test_rms();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
