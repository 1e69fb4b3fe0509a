/**
 * Types.hpp - Value types shared across the Gideon voice engine
 */

#pragma once

#include <chrono>
#include <map>
#include <string>

namespace gideon {

using SystemClock = std::chrono::system_clock;

/**
 * Capture parameters selected by the AudioCalibrator.
 * Replaced as a whole on every (re)calibration.
 */
struct AudioSession {
    int device_id = -1;
    std::string device_name;
    int sample_rate_hz = 16000;
    float energy_threshold = 0.003f;  // RMS on the [-1, 1] float scale, always > 0
    SystemClock::time_point last_calibrated_at{};
    bool enabled = false;             // false: no capture device, text-only mode
};

/**
 * One unit of transcribed speech. Consumed once, never persisted.
 */
struct Utterance {
    std::string raw_text;
    float confidence = 0.0f;
    SystemClock::time_point captured_at{};
};

struct ConversationTurn {
    std::string user_text;
    std::string assistant_text;
    SystemClock::time_point timestamp{};
};

enum class HealthState {
    OK,
    DEGRADED,
    FAILED
};

struct ComponentHealth {
    HealthState state = HealthState::OK;
    SystemClock::time_point last_checked_at{};
    std::string detail;
};

/**
 * Snapshot written by the HealthMonitor on every probe cycle.
 */
struct HealthStatus {
    std::map<std::string, ComponentHealth> components;
    bool memory_ceiling_exceeded = false;
    bool text_mode = false;
    SystemClock::time_point probed_at{};
};

/**
 * Failure taxonomy reported to the presentation layer.
 * Only ShutdownRequested ends the voice loop.
 */
enum class EngineError {
    AudioUnavailable,
    RecognitionTimeout,
    TranscriptionFailure,
    LanguageModelUnavailable,
    MemoryCeilingExceeded,
    ShutdownRequested
};

const char* toString(HealthState state);
const char* toString(EngineError error);

} // namespace gideon
