/**
 * EngineStats.hpp - Counters behind the statistics feed
 *
 * Written by VoiceLoop, ResponseEngine and HealthMonitor from their own
 * threads; read as a consistent-enough snapshot by the presentation layer.
 */

#pragma once

#include <atomic>
#include <cstdint>

namespace gideon::core {

struct StatsSnapshot {
    std::uint64_t recognition_attempts = 0;
    std::uint64_t recognition_successes = 0;
    std::uint64_t wake_word_hits = 0;
    std::uint64_t utterances_discarded = 0;
    std::uint64_t responses = 0;
    std::uint64_t cache_hits = 0;
    std::uint64_t cache_misses = 0;
    std::uint64_t remote_calls = 0;
    std::uint64_t remote_failures = 0;
    std::uint64_t fallback_replies = 0;
    std::uint64_t health_probes = 0;
    std::uint64_t memory_reclaims = 0;

    double recognition_success_rate = 0.0;
    double average_response_latency_ms = 0.0;
    double cache_hit_rate = 0.0;
};

class EngineStats {
public:
    void recordRecognition(bool success);
    void recordWakeWordHit() { wake_word_hits_++; }
    void recordDiscard() { utterances_discarded_++; }
    void recordResponseLatency(double latency_ms);
    void recordCacheLookup(bool hit);
    void recordRemoteCall(bool success);
    void recordFallback() { fallback_replies_++; }
    void recordProbe() { health_probes_++; }
    void recordReclaim() { memory_reclaims_++; }

    StatsSnapshot snapshot() const;

private:
    std::atomic<std::uint64_t> recognition_attempts_{0};
    std::atomic<std::uint64_t> recognition_successes_{0};
    std::atomic<std::uint64_t> wake_word_hits_{0};
    std::atomic<std::uint64_t> utterances_discarded_{0};
    std::atomic<std::uint64_t> responses_{0};
    std::atomic<std::uint64_t> latency_total_us_{0};
    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> cache_misses_{0};
    std::atomic<std::uint64_t> remote_calls_{0};
    std::atomic<std::uint64_t> remote_failures_{0};
    std::atomic<std::uint64_t> fallback_replies_{0};
    std::atomic<std::uint64_t> health_probes_{0};
    std::atomic<std::uint64_t> memory_reclaims_{0};
};

} // namespace gideon::core
