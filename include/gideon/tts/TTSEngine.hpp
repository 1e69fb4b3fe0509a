/**
 * TTSEngine.hpp - Speech output through an HTTP synthesis server
 */

#pragma once

#include "gideon/Config.hpp"
#include "gideon/tts/SpeechSink.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gideon::audio {
class AudioEngine;
}

namespace gideon::tts {

class TTSEngine : public SpeechSink {
public:
    /**
     * @param playback  output device; nullptr prints replies to the console
     */
    TTSEngine(const SpeechSettings& settings, audio::AudioEngine* playback);
    ~TTSEngine() override;

    TTSEngine(const TTSEngine&) = delete;
    TTSEngine& operator=(const TTSEngine&) = delete;

    /**
     * Synthesize sentence by sentence and play each as it arrives.
     * Falls back to printing the text when synthesis is unavailable.
     */
    SpeakStatus speak(const std::string& text,
                      std::chrono::milliseconds timeout,
                      const core::CancellationToken* token) override;

    // Synthesis server answers its health check and a playback device is open
    bool isReady() const override;

    // Mono samples at the playback rate; empty on failure
    std::vector<float> synthesize(const std::string& text);

    // Same, giving up after `timeout` or once the token is cancelled
    std::vector<float> synthesize(const std::string& text,
                                  std::chrono::milliseconds timeout,
                                  const core::CancellationToken* token);

    static std::vector<std::string> splitSentences(const std::string& text);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gideon::tts
