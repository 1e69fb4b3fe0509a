/**
 * VADProcessor.hpp - Voice activity detection via libfvad
 */

#pragma once

#include "gideon/audio/Interfaces.hpp"

#include <cstddef>
#include <memory>

namespace gideon::audio {

enum class VADMode {
    QUALITY = 0,
    LOW_BITRATE = 1,
    AGGRESSIVE = 2,
    VERY_AGGRESSIVE = 3
};

class VADProcessor : public VoiceActivity {
public:
    /**
     * @param sample_rate  rate of the samples passed to isSpeech()
     * @param frame_ms     fvad frame length: 10, 20 or 30
     */
    explicit VADProcessor(int sample_rate = 16000, VADMode mode = VADMode::AGGRESSIVE, int frame_ms = 20);
    ~VADProcessor() override;

    VADProcessor(const VADProcessor&) = delete;
    VADProcessor& operator=(const VADProcessor&) = delete;

    bool isReady() const;

    /**
     * Follow the capture session. Rates fvad cannot take (22050, 44100)
     * are resampled to 16 kHz internally.
     */
    bool setSampleRate(int sample_rate);
    int sampleRate() const;

    // True if any complete fvad frame in this chunk is speech
    bool isSpeech(const float* samples, std::size_t count) override;
    void reset() override;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace gideon::audio
