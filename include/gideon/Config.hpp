/**
 * Config.hpp - Engine configuration
 *
 * Built once at startup and passed by const reference into every component.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gideon {

struct AudioSettings {
    int preferred_sample_rate = 16000;
    std::vector<int> supported_sample_rates{16000, 22050, 44100, 48000};
    int frames_per_buffer = 512;

    // Calibration
    std::chrono::milliseconds ambient_window{500};
    std::chrono::milliseconds snr_window{300};
    float threshold_multiplier = 1.5f;
    float min_energy_threshold = 0.003f;
    float max_energy_threshold = 0.1f;
    std::chrono::seconds recalibration_interval{60};
    int failures_before_recalibration = 3;
    std::chrono::milliseconds calibration_wait{5000};

    // Capture
    std::chrono::milliseconds listen_timeout{3000};
    std::chrono::milliseconds phrase_limit{8000};
    std::chrono::milliseconds trailing_silence{800};
    std::chrono::milliseconds min_speech{200};
    std::chrono::milliseconds read_timeout{100};
    std::chrono::milliseconds idle_poll{100};

    bool use_vad = true;
    int vad_mode = 2;
    bool force_text_mode = false;
};

struct WakeWordSettings {
    std::vector<std::string> variants{
        "gideon", "hey gideon", "ok gideon", "okay gideon",
        "hi gideon", "hello gideon", "gedeon", "gidion"
    };
    float threshold = 0.75f;
    bool require_wake_word = true;
    std::chrono::milliseconds follow_up_window{8000};
    std::string acknowledgement = "Yes?";
};

struct SpeechSettings {
    std::string whisper_model = "models/whisper/ggml-base.en.bin";
    std::string language = "en";
    int threads = 4;
    std::chrono::milliseconds transcription_timeout{10000};
    float min_confidence = 0.0f;

    std::string tts_url = "http://localhost:5050";
    int playback_sample_rate = 24000;
    std::chrono::milliseconds speak_timeout{30000};
};

struct LanguageModelSettings {
    std::string base_url = "http://localhost:8080";
    std::string api_key;
    bool require_api_key = false;
    std::string model = "gpt-3.5-turbo";
    std::string chat_path = "/v1/chat/completions";
    std::string health_path = "/v1/models";
    std::string system_prompt =
        "You are Gideon, a helpful AI assistant. Be concise and friendly.";
    int max_tokens = 150;
    float temperature = 0.7f;
    std::chrono::milliseconds timeout{5000};
    std::chrono::milliseconds ping_timeout{2000};
};

struct ResponseSettings {
    std::size_t memory_capacity = 10;
    std::size_t context_turns = 10;
    std::size_t cache_capacity = 50;
    std::chrono::milliseconds cache_ttl{std::chrono::hours(1)};  // zero disables expiry
    int max_retries = 1;
    std::chrono::milliseconds retry_backoff{250};
    std::uint32_t fallback_seed = 0;  // 0: seed from std::random_device
    std::string conversation_log;     // empty: no log store
};

struct HealthSettings {
    std::chrono::milliseconds probe_interval{std::chrono::seconds(30)};
    std::size_t memory_ceiling_mb = 250;
    int lm_failure_threshold = 3;
    int probe_failures_before_action = 2;
    std::size_t min_cache_capacity = 5;
    std::size_t min_memory_capacity = 2;
    bool publish_status = true;
    std::string status_segment = "gideon_status";
};

struct EngineConfig {
    AudioSettings audio;
    WakeWordSettings wake;
    SpeechSettings speech;
    LanguageModelSettings llm;
    ResponseSettings response;
    HealthSettings health;
};

/**
 * Check value ranges and cross-field constraints.
 * @throws std::invalid_argument describing the first bad field
 */
void validateConfig(const EngineConfig& config);

/**
 * Override fields from GIDEON_* environment variables.
 * The API key falls back to OPENAI_API_KEY.
 */
void applyEnvironment(EngineConfig& config);

} // namespace gideon
