/**
 * STTEngine.cpp - Speech-to-Text Engine using whisper.cpp
 *
 * Uses whisper.cpp for local, offline speech recognition.
 * Model is preloaded at startup and stays resident in RAM.
 */

#include "gideon/stt/STTEngine.hpp"
#include "gideon/audio/WavCodec.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "whisper.h"

namespace gideon::stt {

constexpr int WHISPER_RATE = 16000;

namespace {

struct AbortState {
    std::chrono::steady_clock::time_point deadline;
    const core::CancellationToken* token = nullptr;
    bool timed_out = false;
};

bool shouldAbort(void* user_data) {
    auto* state = static_cast<AbortState*>(user_data);
    if (core::isCancelled(state->token)) {
        return true;
    }
    if (std::chrono::steady_clock::now() >= state->deadline) {
        state->timed_out = true;
        return true;
    }
    return false;
}

} // anonymous namespace

struct STTEngine::Impl {
    std::string model_path;
    std::string language;
    int n_threads;

    whisper_context* ctx = nullptr;
    whisper_full_params params;
    std::mutex mutex;  // one whisper_full at a time per context

    Impl(const SpeechSettings& settings)
        : model_path(settings.whisper_model), language(settings.language), n_threads(settings.threads) {

        struct whisper_context_params cparams = whisper_context_default_params();
        ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);

        if (!ctx) {
            std::cerr << "[STTEngine] Failed to load model: " << model_path << std::endl;
            std::cerr << "[STTEngine] Set GIDEON_WHISPER_MODEL or pass --whisper <path>" << std::endl;
            return;
        }

        // Greedy decoding keeps latency low for short commands
        params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.language = language.c_str();
        params.n_threads = n_threads;
        params.print_progress = false;
        params.print_timestamps = false;
        params.print_realtime = false;
        params.print_special = false;
        params.translate = false;
        params.single_segment = true;
        params.no_context = true;
        params.suppress_blank = true;

        std::cout << "[STTEngine] Model loaded: " << model_path << std::endl;
        std::cout << "[STTEngine] Language: " << language << ", Threads: " << n_threads << std::endl;
    }

    ~Impl() {
        if (ctx) {
            whisper_free(ctx);
            ctx = nullptr;
        }
    }

    float confidence() const {
        const whisper_token eot = whisper_token_eot(ctx);
        double sum = 0.0;
        int count = 0;
        const int n_segments = whisper_full_n_segments(ctx);
        for (int i = 0; i < n_segments; ++i) {
            const int n_tokens = whisper_full_n_tokens(ctx, i);
            for (int j = 0; j < n_tokens; ++j) {
                // Special tokens (timestamps, language, eot) sit at or above eot
                if (whisper_full_get_token_id(ctx, i, j) >= eot) {
                    continue;
                }
                sum += whisper_full_get_token_p(ctx, i, j);
                count++;
            }
        }
        return count > 0 ? static_cast<float>(sum / count) : 0.0f;
    }
};

STTEngine::STTEngine(const SpeechSettings& settings)
    : impl_(std::make_unique<Impl>(settings)) {
}

STTEngine::~STTEngine() = default;

Transcription STTEngine::transcribe(const std::vector<float>& audio,
                                    int sample_rate,
                                    std::chrono::milliseconds timeout,
                                    const core::CancellationToken* token) {
    Transcription result;
    result.utterance.captured_at = SystemClock::now();

    if (!impl_->ctx) {
        result.status = TranscriptionStatus::FAILED;
        return result;
    }
    if (audio.empty()) {
        result.status = TranscriptionStatus::EMPTY;
        return result;
    }

    std::vector<float> pcm = audio::resampleLinear(audio, sample_rate, WHISPER_RATE);

    std::lock_guard<std::mutex> lock(impl_->mutex);

    AbortState abort_state;
    abort_state.deadline = std::chrono::steady_clock::now() + timeout;
    abort_state.token = token;

    whisper_full_params params = impl_->params;
    params.abort_callback = shouldAbort;
    params.abort_callback_user_data = &abort_state;

    int rc = whisper_full(impl_->ctx, params, pcm.data(), static_cast<int>(pcm.size()));

    if (core::isCancelled(token)) {
        result.status = TranscriptionStatus::CANCELLED;
        return result;
    }
    if (abort_state.timed_out) {
        std::cerr << "[STTEngine] Transcription exceeded " << timeout.count() << " ms" << std::endl;
        result.status = TranscriptionStatus::TIMEOUT;
        return result;
    }
    if (rc != 0) {
        std::cerr << "[STTEngine] Transcription failed: " << rc << std::endl;
        result.status = TranscriptionStatus::FAILED;
        return result;
    }

    std::string text;
    const int n_segments = whisper_full_n_segments(impl_->ctx);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(impl_->ctx, i);
        if (segment_text) {
            text += segment_text;
        }
    }

    result.utterance.raw_text = text;
    result.utterance.confidence = impl_->confidence();
    result.status = text.find_first_not_of(" \t\r\n") == std::string::npos
                        ? TranscriptionStatus::EMPTY
                        : TranscriptionStatus::OK;
    return result;
}

bool STTEngine::isReady() const {
    return impl_ && impl_->ctx != nullptr;
}

std::string STTEngine::getModelInfo() const {
    if (!isReady()) {
        return "Model not loaded";
    }
    return "whisper (" + impl_->model_path + ")";
}

} // namespace gideon::stt
