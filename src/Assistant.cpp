/**
 * Assistant.cpp - Component wiring
 *
 * Connects: AudioEngine -> AudioCalibrator / VAD -> STT -> WakeWordMatcher
 *           -> ResponseEngine (cache, LLM, fallback) -> TTS -> AudioEngine
 */

#include "gideon/Assistant.hpp"
#include "gideon/audio/AudioCalibrator.hpp"
#include "gideon/audio/AudioEngine.hpp"
#include "gideon/audio/VADProcessor.hpp"
#include "gideon/core/AudioArbiter.hpp"
#include "gideon/ipc/StatusPublisher.hpp"
#include "gideon/llm/JsonlConversationLog.hpp"
#include "gideon/llm/LLMClient.hpp"
#include "gideon/llm/ResponseEngine.hpp"
#include "gideon/stt/STTEngine.hpp"
#include "gideon/tts/TTSEngine.hpp"
#include "gideon/wakeword/WakeWordMatcher.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace gideon {

struct Assistant::Impl {
    const EngineConfig& config;

    // Components
    core::EngineStats stats;
    core::AudioArbiter arbiter;
    std::unique_ptr<audio::AudioEngine> audio;
    std::unique_ptr<audio::VADProcessor> vad;
    std::unique_ptr<audio::AudioCalibrator> calibrator;
    std::unique_ptr<stt::STTEngine> stt;
    std::unique_ptr<wakeword::WakeWordMatcher> matcher;
    std::unique_ptr<llm::LLMClient> llm;
    std::unique_ptr<llm::JsonlConversationLog> conversation_log;
    std::unique_ptr<llm::ResponseEngine> responder;
    std::unique_ptr<tts::TTSEngine> tts;
    std::unique_ptr<health::ProcessMemoryProbe> memory_probe;
    std::unique_ptr<ipc::StatusPublisher> publisher;
    std::unique_ptr<health::HealthMonitor> monitor;
    std::unique_ptr<VoiceLoop> loop;

    VoiceLoopCallbacks callbacks;
    std::atomic<bool> initialized{false};
    std::atomic<bool> running{false};
    std::mutex status_mutex;  // probes run on the monitor thread and on demand from the loop
    bool ceiling_reported = false;

    explicit Impl(const EngineConfig& c) : config(c) {}

    void onStatus(const HealthStatus& status) {
        std::lock_guard<std::mutex> lock(status_mutex);
        if (publisher && publisher->isOpen()) {
            publisher->publish(status, stats.snapshot());
        }
        // Status flag only; logged once per excursion
        if (status.memory_ceiling_exceeded && !ceiling_reported) {
            std::cerr << "[Assistant] " << toString(EngineError::MemoryCeilingExceeded)
                      << ", caches reduced" << std::endl;
        }
        ceiling_reported = status.memory_ceiling_exceeded;
    }

    VoiceLoopCallbacks wrapCallbacks() {
        VoiceLoopCallbacks wrapped = callbacks;
        wrapped.onSessionChanged = [this](const AudioSession& session) {
            if (vad && session.enabled) {
                vad->setSampleRate(session.sample_rate_hz);
            }
            if (callbacks.onSessionChanged) {
                callbacks.onSessionChanged(session);
            }
        };
        wrapped.onProbeRequested = [this]() {
            if (monitor) {
                monitor->probe();
            }
            if (callbacks.onProbeRequested) {
                callbacks.onProbeRequested();
            }
        };
        return wrapped;
    }

    void build() {
        std::cout << "[Assistant] Initializing components..." << std::endl;

        // Audio Engine
        audio = std::make_unique<audio::AudioEngine>(config.audio, config.speech.playback_sample_rate);
        if (config.audio.force_text_mode) {
            std::cout << "[Assistant] Text mode requested, audio disabled" << std::endl;
        } else if (!audio->initialize()) {
            std::cerr << "[Assistant] AudioEngine init failed: " << audio->lastError() << std::endl;
        } else {
            std::cout << "[Assistant] AudioEngine OK" << std::endl;
        }

        // VAD
        if (config.audio.use_vad) {
            vad = std::make_unique<audio::VADProcessor>(
                config.audio.preferred_sample_rate, static_cast<audio::VADMode>(config.audio.vad_mode));
            std::cout << "[Assistant] VADProcessor " << (vad->isReady() ? "OK" : "unavailable") << std::endl;
        }

        calibrator = std::make_unique<audio::AudioCalibrator>(config.audio, *audio);

        // STT
        if (!config.audio.force_text_mode) {
            stt = std::make_unique<stt::STTEngine>(config.speech);
            if (!stt->isReady()) {
                std::cerr << "[Assistant] STTEngine init failed, voice input disabled" << std::endl;
            } else {
                std::cout << "[Assistant] STTEngine OK (" << stt->getModelInfo() << ")" << std::endl;
            }
        }

        matcher = std::make_unique<wakeword::WakeWordMatcher>(config.wake.variants, config.wake.threshold);

        // LLM
        llm = std::make_unique<llm::LLMClient>(config.llm);
        if (!llm->isConfigured()) {
            std::cerr << "[Assistant] Language model not configured, canned replies only" << std::endl;
        }
        if (!config.response.conversation_log.empty()) {
            conversation_log = std::make_unique<llm::JsonlConversationLog>(config.response.conversation_log);
        }
        responder = std::make_unique<llm::ResponseEngine>(
            config.response, llm.get(), &stats,
            (conversation_log && conversation_log->isOpen()) ? conversation_log.get() : nullptr);

        // TTS
        audio::AudioEngine* playback = (audio->hasPlayback()) ? audio.get() : nullptr;
        tts = std::make_unique<tts::TTSEngine>(config.speech, playback);

        // Health
        memory_probe = std::make_unique<health::ProcessMemoryProbe>();
        if (config.health.publish_status) {
            publisher = std::make_unique<ipc::StatusPublisher>(config.health.status_segment);
        }

        const bool voice_input = !config.audio.force_text_mode && audio->isInitialized() && stt->isReady();

        VoiceLoopParts parts{
            *calibrator,
            voice_input ? audio.get() : nullptr,
            voice_input ? stt.get() : nullptr,
            *matcher,
            *responder,
            tts.get(),
            arbiter,
            (vad && vad->isReady()) ? vad.get() : nullptr,
            &stats
        };
        loop = std::make_unique<VoiceLoop>(config, parts);

        health::HealthTargets targets;
        targets.calibrator = calibrator.get();
        targets.devices = audio.get();
        targets.model = llm.get();
        targets.responder = responder.get();
        targets.transcriber = stt.get();
        targets.speech = tts.get();
        targets.memory = memory_probe.get();
        targets.stats = &stats;

        health::HealthActions actions;
        actions.requestRecalibration = [this](const std::string& reason) {
            if (loop) {
                loop->requestRecalibration(reason);
            }
        };
        actions.onStatus = [this](const HealthStatus& status) { onStatus(status); };

        monitor = std::make_unique<health::HealthMonitor>(config.health, targets, actions);

        std::cout << "[Assistant] All components initialized" << std::endl;
    }
};

Assistant::Assistant(const EngineConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

Assistant::~Assistant() {
    stop();
}

bool Assistant::initialize() {
    if (impl_->initialized.exchange(true)) {
        return false;
    }
    impl_->build();
    return true;
}

void Assistant::setCallbacks(VoiceLoopCallbacks callbacks) {
    impl_->callbacks = std::move(callbacks);
}

bool Assistant::start() {
    if (!impl_->initialized || impl_->running) {
        return false;
    }
    impl_->loop->setCallbacks(impl_->wrapCallbacks());
    if (!impl_->loop->start()) {
        return false;
    }
    impl_->monitor->start();
    impl_->running = true;
    std::cout << "[Assistant] Started" << std::endl;
    return true;
}

void Assistant::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    std::cout << "[Assistant] Stopping..." << std::endl;
    impl_->loop->stop();
    impl_->monitor->stop();
    if (impl_->conversation_log) {
        impl_->conversation_log->flush();
    }
    std::cout << "[Assistant] Stopped" << std::endl;
}

bool Assistant::isRunning() const {
    return impl_->running;
}

HealthStatus Assistant::health() const {
    return impl_->monitor ? impl_->monitor->snapshot() : HealthStatus{};
}

core::StatsSnapshot Assistant::stats() const {
    return impl_->stats.snapshot();
}

health::MemoryReport Assistant::memoryReport() const {
    return impl_->monitor ? impl_->monitor->memoryReport() : health::MemoryReport{};
}

bool Assistant::recalibrate(const std::string& reason) {
    return impl_->loop && impl_->loop->requestRecalibration(reason);
}

bool Assistant::probe() {
    return impl_->loop && impl_->loop->post(Command{Command::Kind::PROBE, ""});
}

bool Assistant::submitText(const std::string& text) {
    return impl_->loop && impl_->loop->submitText(text);
}

VoiceState Assistant::state() const {
    return impl_->loop ? impl_->loop->state() : VoiceState::IDLE;
}

bool Assistant::textMode() const {
    return impl_->loop ? impl_->loop->textMode() : true;
}

} // namespace gideon
