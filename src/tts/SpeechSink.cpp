/**
 * SpeechSink.cpp - Status names
 */

#include "gideon/tts/SpeechSink.hpp"

namespace gideon::tts {

const char* toString(SpeakStatus status) {
    switch (status) {
        case SpeakStatus::DONE:      return "done";
        case SpeakStatus::TIMEOUT:   return "timeout";
        case SpeakStatus::CANCELLED: return "cancelled";
        case SpeakStatus::FAILED:    return "failed";
    }
    return "unknown";
}

} // namespace gideon::tts
