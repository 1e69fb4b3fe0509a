/**
 * Config.cpp - Validation and environment overrides
 */

#include "gideon/Config.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace gideon {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return value;
    }
    return fallback;
}

} // anonymous namespace

void validateConfig(const EngineConfig& config) {
    const auto& audio = config.audio;
    require(!audio.supported_sample_rates.empty(), "audio.supported_sample_rates is empty");
    require(std::find(audio.supported_sample_rates.begin(), audio.supported_sample_rates.end(),
                      audio.preferred_sample_rate) != audio.supported_sample_rates.end(),
            "audio.preferred_sample_rate must be one of the supported rates");
    require(audio.frames_per_buffer > 0, "audio.frames_per_buffer must be positive");
    require(audio.min_energy_threshold > 0.0f, "audio.min_energy_threshold must be > 0");
    require(audio.max_energy_threshold >= audio.min_energy_threshold,
            "audio.max_energy_threshold must be >= min_energy_threshold");
    require(audio.threshold_multiplier > 0.0f, "audio.threshold_multiplier must be > 0");
    require(audio.ambient_window.count() > 0, "audio.ambient_window must be positive");
    require(audio.failures_before_recalibration > 0, "audio.failures_before_recalibration must be > 0");
    require(audio.listen_timeout.count() > 0, "audio.listen_timeout must be positive");
    require(audio.phrase_limit >= audio.min_speech, "audio.phrase_limit must cover min_speech");
    require(audio.vad_mode >= 0 && audio.vad_mode <= 3, "audio.vad_mode must be in [0, 3]");

    require(!config.wake.variants.empty(), "wake.variants is empty");
    require(config.wake.threshold > 0.0f && config.wake.threshold <= 1.0f,
            "wake.threshold must be in (0, 1]");

    require(config.speech.transcription_timeout.count() > 0, "speech.transcription_timeout must be positive");
    require(config.speech.speak_timeout.count() > 0, "speech.speak_timeout must be positive");

    require(config.llm.timeout.count() > 0, "llm.timeout must be positive");
    require(config.llm.max_tokens > 0, "llm.max_tokens must be positive");

    require(config.response.memory_capacity > 0, "response.memory_capacity must be > 0");
    require(config.response.cache_capacity > 0, "response.cache_capacity must be > 0");
    require(config.response.max_retries >= 0, "response.max_retries must be >= 0");

    require(config.health.probe_interval.count() > 0, "health.probe_interval must be positive");
    require(config.health.memory_ceiling_mb > 0, "health.memory_ceiling_mb must be > 0");
    require(config.health.lm_failure_threshold > 0, "health.lm_failure_threshold must be > 0");
    require(config.health.min_cache_capacity > 0 && config.health.min_memory_capacity > 0,
            "health minimum capacities must be > 0");
}

void applyEnvironment(EngineConfig& config) {
    config.llm.base_url = envOr("GIDEON_LLM_URL", config.llm.base_url);
    config.llm.model = envOr("GIDEON_LLM_MODEL", config.llm.model);
    config.llm.api_key = envOr("GIDEON_API_KEY", envOr("OPENAI_API_KEY", config.llm.api_key));
    config.speech.whisper_model = envOr("GIDEON_WHISPER_MODEL", config.speech.whisper_model);
    config.speech.tts_url = envOr("GIDEON_TTS_URL", config.speech.tts_url);

    if (config.llm.api_key.empty() && config.llm.require_api_key) {
        std::cerr << "[Config] No API key set (GIDEON_API_KEY / OPENAI_API_KEY); "
                  << "remote replies disabled" << std::endl;
    }
}

} // namespace gideon
