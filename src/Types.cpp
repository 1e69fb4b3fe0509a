/**
 * Types.cpp - String conversions for shared enums
 */

#include "gideon/Types.hpp"

namespace gideon {

const char* toString(HealthState state) {
    switch (state) {
        case HealthState::OK:       return "OK";
        case HealthState::DEGRADED: return "DEGRADED";
        case HealthState::FAILED:   return "FAILED";
    }
    return "UNKNOWN";
}

const char* toString(EngineError error) {
    switch (error) {
        case EngineError::AudioUnavailable:         return "AudioUnavailable";
        case EngineError::RecognitionTimeout:       return "RecognitionTimeout";
        case EngineError::TranscriptionFailure:     return "TranscriptionFailure";
        case EngineError::LanguageModelUnavailable: return "LanguageModelUnavailable";
        case EngineError::MemoryCeilingExceeded:    return "MemoryCeilingExceeded";
        case EngineError::ShutdownRequested:        return "ShutdownRequested";
    }
    return "Unknown";
}

} // namespace gideon
