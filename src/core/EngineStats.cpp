/**
 * EngineStats.cpp - Derived statistics
 */

#include "gideon/core/EngineStats.hpp"

namespace gideon::core {

void EngineStats::recordRecognition(bool success) {
    recognition_attempts_++;
    if (success) {
        recognition_successes_++;
    }
}

void EngineStats::recordResponseLatency(double latency_ms) {
    responses_++;
    if (latency_ms > 0.0) {
        latency_total_us_ += static_cast<std::uint64_t>(latency_ms * 1000.0);
    }
}

void EngineStats::recordCacheLookup(bool hit) {
    if (hit) {
        cache_hits_++;
    } else {
        cache_misses_++;
    }
}

void EngineStats::recordRemoteCall(bool success) {
    remote_calls_++;
    if (!success) {
        remote_failures_++;
    }
}

StatsSnapshot EngineStats::snapshot() const {
    StatsSnapshot s;
    s.recognition_attempts = recognition_attempts_.load();
    s.recognition_successes = recognition_successes_.load();
    s.wake_word_hits = wake_word_hits_.load();
    s.utterances_discarded = utterances_discarded_.load();
    s.responses = responses_.load();
    s.cache_hits = cache_hits_.load();
    s.cache_misses = cache_misses_.load();
    s.remote_calls = remote_calls_.load();
    s.remote_failures = remote_failures_.load();
    s.fallback_replies = fallback_replies_.load();
    s.health_probes = health_probes_.load();
    s.memory_reclaims = memory_reclaims_.load();

    if (s.recognition_attempts > 0) {
        s.recognition_success_rate =
            static_cast<double>(s.recognition_successes) / static_cast<double>(s.recognition_attempts);
    }
    if (s.responses > 0) {
        s.average_response_latency_ms =
            static_cast<double>(latency_total_us_.load()) / 1000.0 / static_cast<double>(s.responses);
    }
    auto lookups = s.cache_hits + s.cache_misses;
    if (lookups > 0) {
        s.cache_hit_rate = static_cast<double>(s.cache_hits) / static_cast<double>(lookups);
    }
    return s;
}

} // namespace gideon::core
