/**
 * STTEngine.hpp - Speech-to-text using whisper.cpp
 */

#pragma once

#include "gideon/Config.hpp"
#include "gideon/stt/Transcriber.hpp"

#include <memory>
#include <string>

namespace gideon::stt {

class STTEngine : public Transcriber {
public:
    /**
     * Load the ggml model once; it stays resident for the process lifetime.
     */
    explicit STTEngine(const SpeechSettings& settings);
    ~STTEngine() override;

    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    /**
     * Resamples to 16 kHz, runs greedy decoding and reports the mean token
     * probability as confidence. Aborts on deadline or cancellation.
     */
    Transcription transcribe(const std::vector<float>& audio,
                             int sample_rate,
                             std::chrono::milliseconds timeout,
                             const core::CancellationToken* token) override;

    bool isReady() const override;
    std::string getModelInfo() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gideon::stt
