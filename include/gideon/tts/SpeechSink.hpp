/**
 * SpeechSink.hpp - Speech output collaborator
 */

#pragma once

#include "gideon/core/CancellationToken.hpp"

#include <chrono>
#include <string>

namespace gideon::tts {

enum class SpeakStatus {
    DONE,
    TIMEOUT,
    CANCELLED,
    FAILED
};

const char* toString(SpeakStatus status);

class SpeechSink {
public:
    virtual ~SpeechSink() = default;

    /**
     * Speak `text` and block until playback has finished, timed out or
     * been cancelled. Nothing may still be playing when this returns.
     */
    virtual SpeakStatus speak(const std::string& text,
                              std::chrono::milliseconds timeout,
                              const core::CancellationToken* token) = 0;

    virtual bool isReady() const = 0;
};

} // namespace gideon::tts
