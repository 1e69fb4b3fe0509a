/**
 * Transcriber.hpp - Speech-to-text collaborator
 */

#pragma once

#include "gideon/Types.hpp"
#include "gideon/core/CancellationToken.hpp"

#include <chrono>
#include <vector>

namespace gideon::stt {

enum class TranscriptionStatus {
    OK,
    EMPTY,      // decoded, but no words
    TIMEOUT,
    FAILED,
    CANCELLED
};

const char* toString(TranscriptionStatus status);

struct Transcription {
    TranscriptionStatus status = TranscriptionStatus::FAILED;
    Utterance utterance;

    bool ok() const { return status == TranscriptionStatus::OK; }
};

class Transcriber {
public:
    virtual ~Transcriber() = default;

    /**
     * Transcribe mono float audio. Gives up after `timeout` or on cancellation.
     */
    virtual Transcription transcribe(const std::vector<float>& audio,
                                     int sample_rate,
                                     std::chrono::milliseconds timeout,
                                     const core::CancellationToken* token) = 0;

    virtual bool isReady() const = 0;
};

} // namespace gideon::stt
