/**
 * Transcriber.cpp - Status names
 */

#include "gideon/stt/Transcriber.hpp"

namespace gideon::stt {

const char* toString(TranscriptionStatus status) {
    switch (status) {
        case TranscriptionStatus::OK:        return "ok";
        case TranscriptionStatus::EMPTY:     return "empty";
        case TranscriptionStatus::TIMEOUT:   return "timeout";
        case TranscriptionStatus::FAILED:    return "failed";
        case TranscriptionStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

} // namespace gideon::stt
