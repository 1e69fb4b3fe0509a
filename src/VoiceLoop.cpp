/**
 * VoiceLoop.cpp - Conversation state machine
 *
 * Flow: IDLE -> LISTENING -> TRANSCRIBING -> MATCHING -> RESPONDING -> SPEAKING -> IDLE
 *
 * The capture lease is held only in LISTENING and the playback lease only in
 * SPEAKING; calibration runs from IDLE under its own lease.
 */

#include "gideon/VoiceLoop.hpp"
#include "gideon/audio/WavCodec.hpp"
#include "gideon/core/Channel.hpp"

#include <atomic>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <thread>

namespace gideon {

namespace {

constexpr std::chrono::milliseconds PRE_ROLL{300};

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

double elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // anonymous namespace

const char* toString(VoiceState state) {
    switch (state) {
        case VoiceState::IDLE:         return "IDLE";
        case VoiceState::LISTENING:    return "LISTENING";
        case VoiceState::TRANSCRIBING: return "TRANSCRIBING";
        case VoiceState::MATCHING:     return "MATCHING";
        case VoiceState::RESPONDING:   return "RESPONDING";
        case VoiceState::SPEAKING:     return "SPEAKING";
        case VoiceState::SHUTDOWN:     return "SHUTDOWN";
    }
    return "UNKNOWN";
}

struct VoiceLoop::Impl {
    const EngineConfig& config;
    VoiceLoopParts parts;
    VoiceLoopCallbacks callbacks;

    core::CancellationToken token;
    core::Channel<Command> commands{64};
    std::atomic<VoiceState> state{VoiceState::IDLE};
    std::thread worker;

    // Current turn
    core::AudioLease capture_lease;
    AudioSession session;
    std::vector<float> captured;
    Utterance utterance;
    std::string command_text;
    std::string reply_text;
    bool typed_turn = false;

    std::string pending_recalibration;
    std::atomic<bool> text_mode{true};
    std::atomic<std::int64_t> follow_up_until{0};  // steady_clock ticks
    bool follow_up_announced = false;

    Impl(const EngineConfig& cfg, VoiceLoopParts p)
        : config(cfg)
        , parts(p) {
    }

    void setState(VoiceState next) {
        state = next;
        if (callbacks.onStateChange) {
            callbacks.onStateChange(next);
        }
    }

    void reportError(EngineError error, const std::string& detail) {
        std::cerr << "[VoiceLoop] " << toString(error) << ": " << detail << std::endl;
        if (callbacks.onError) {
            callbacks.onError(error, detail);
        }
    }

    bool computeTextMode() const {
        return config.audio.force_text_mode || !session.enabled ||
               parts.capture == nullptr || parts.transcriber == nullptr;
    }

    bool followUpOpen() const {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        return now < follow_up_until.load();
    }

    void openFollowUp() {
        auto until = std::chrono::steady_clock::now() + config.wake.follow_up_window;
        follow_up_until = until.time_since_epoch().count();
        follow_up_announced = false;
    }

    void resetTurn() {
        captured.clear();
        utterance = Utterance{};
        command_text.clear();
        reply_text.clear();
        typed_turn = false;
    }

    // ----- Shutdown -----

    void enterShutdown() {
        if (state == VoiceState::SHUTDOWN) {
            return;
        }
        std::cout << "[VoiceLoop] Shutting down from " << toString(state.load()) << std::endl;
        if (parts.capture && parts.capture->isCapturing()) {
            parts.capture->stopCapture();
        }
        capture_lease.release();
        commands.close();
        resetTurn();
        setState(VoiceState::SHUTDOWN);
        if (callbacks.onError) {
            callbacks.onError(EngineError::ShutdownRequested, "shutdown requested");
        }
    }

    // ----- Calibration -----

    void runCalibration(const std::string& reason) {
        auto lease = parts.arbiter.acquire(core::AudioMode::CALIBRATION,
                                           config.audio.calibration_wait, &token);
        if (!lease.held()) {
            if (!token.isCancelled()) {
                std::cerr << "[VoiceLoop] Audio busy, postponing calibration (" << reason << ")" << std::endl;
                pending_recalibration = reason;
            }
            return;
        }

        bool was_text = text_mode.load();
        session = (parts.calibrator.calibrationCount() == 0)
                      ? parts.calibrator.calibrate()
                      : parts.calibrator.recalibrate(reason);
        lease.release();
        pending_recalibration.clear();

        text_mode = computeTextMode();
        if (callbacks.onSessionChanged) {
            callbacks.onSessionChanged(session);
        }

        if (text_mode && (!was_text || parts.calibrator.calibrationCount() == 1)) {
            std::string detail = session.enabled ? "voice input disabled" : "no capture device";
            reportError(EngineError::AudioUnavailable, detail + ", text input only");
        } else if (!text_mode && was_text) {
            std::cout << "[VoiceLoop] Voice input enabled on " << session.device_name << std::endl;
        }
    }

    void maybeCalibrate() {
        if (!pending_recalibration.empty()) {
            runCalibration(pending_recalibration);
        } else if (parts.calibrator.isDue(SystemClock::now())) {
            runCalibration(parts.calibrator.calibrationCount() == 0 ? "startup" : "interval");
        }
    }

    // ----- Commands -----

    // @return true if the command started a turn
    bool handleCommand(const Command& cmd) {
        switch (cmd.kind) {
            case Command::Kind::SHUTDOWN:
                token.cancel();
                enterShutdown();
                return false;

            case Command::Kind::RECALIBRATE:
                pending_recalibration = cmd.payload.empty() ? "manual" : cmd.payload;
                return false;

            case Command::Kind::PROBE:
                if (callbacks.onProbeRequested) {
                    callbacks.onProbeRequested();
                }
                return false;

            case Command::Kind::TEXT_INPUT: {
                std::string text = trim(cmd.payload);
                if (text.empty()) {
                    return false;
                }
                resetTurn();
                typed_turn = true;
                command_text = text;
                utterance.raw_text = text;
                utterance.confidence = 1.0f;
                utterance.captured_at = SystemClock::now();
                std::cout << "[VoiceLoop] User (typed): " << text << std::endl;
                if (callbacks.onUserUtterance) {
                    callbacks.onUserUtterance(text);
                }
                setState(VoiceState::RESPONDING);
                return true;
            }
        }
        return false;
    }

    // ----- IDLE -----

    bool beginCapture() {
        capture_lease = parts.arbiter.acquire(core::AudioMode::CAPTURE,
                                              config.audio.calibration_wait, &token);
        if (!capture_lease.held()) {
            return false;
        }
        session = parts.calibrator.session();
        if (!parts.capture->startCapture(session)) {
            capture_lease.release();
            reportError(EngineError::AudioUnavailable, "failed to start capture on " + session.device_name);
            if (parts.calibrator.noteRecognitionFailure()) {
                pending_recalibration = "failure";
            }
            return false;
        }
        return true;
    }

    void stepIdle() {
        while (auto cmd = commands.tryPop()) {
            if (handleCommand(*cmd) || state == VoiceState::SHUTDOWN) {
                return;
            }
        }

        maybeCalibrate();
        if (token.isCancelled()) {
            enterShutdown();
            return;
        }

        if (!followUpOpen() && !follow_up_announced && follow_up_until.load() != 0) {
            follow_up_announced = true;
            std::cout << "[VoiceLoop] Follow-up window closed, waiting for wake word" << std::endl;
        }

        if (text_mode) {
            if (auto cmd = commands.popFor(config.audio.idle_poll, &token)) {
                handleCommand(*cmd);
            }
            return;
        }

        resetTurn();
        if (!beginCapture()) {
            token.waitFor(config.audio.idle_poll);
            return;
        }
        setState(VoiceState::LISTENING);
    }

    // ----- LISTENING -----

    void endCapture() {
        if (parts.capture->isCapturing()) {
            parts.capture->stopCapture();
        }
        capture_lease.release();
    }

    void stepListening() {
        const int rate = session.sample_rate_hz > 0 ? session.sample_rate_hz : config.audio.preferred_sample_rate;
        const double listen_ms = static_cast<double>(config.audio.listen_timeout.count());
        const double phrase_ms = static_cast<double>(config.audio.phrase_limit.count());
        const double silence_limit_ms = static_cast<double>(config.audio.trailing_silence.count());
        const std::size_t pre_roll = static_cast<std::size_t>(rate) * PRE_ROLL.count() / 1000;

        if (parts.vad) parts.vad->reset();
        captured.clear();

        bool heard_speech = false;
        double waited_ms = 0.0;   // audio time before speech
        double speech_ms = 0.0;   // audio time since speech began
        double voiced_ms = 0.0;
        double silence_ms = 0.0;
        auto started = std::chrono::steady_clock::now();
        auto speech_started = started;
        auto last_voice = started;
        bool phrase_cut = false;

        std::vector<float> frame;
        while (true) {
            if (token.isCancelled()) {
                endCapture();
                enterShutdown();
                return;
            }

            audio::ReadStatus status = parts.capture->readFrame(frame, config.audio.read_timeout);

            if (status == audio::ReadStatus::STOPPED || status == audio::ReadStatus::ERROR) {
                endCapture();
                if (token.isCancelled()) {
                    enterShutdown();
                    return;
                }
                if (status == audio::ReadStatus::ERROR) {
                    reportError(EngineError::AudioUnavailable, "capture stream error");
                    if (parts.calibrator.noteRecognitionFailure()) {
                        pending_recalibration = "failure";
                    }
                }
                setState(VoiceState::IDLE);
                return;
            }

            if (status == audio::ReadStatus::FRAME && !frame.empty()) {
                double frame_ms = frame.size() * 1000.0 / rate;
                float level = audio::rms(frame.data(), frame.size());
                bool voiced = level >= session.energy_threshold;
                if (voiced && config.audio.use_vad && parts.vad) {
                    voiced = parts.vad->isSpeech(frame.data(), frame.size());
                }

                if (!heard_speech) {
                    captured.insert(captured.end(), frame.begin(), frame.end());
                    if (captured.size() > pre_roll) {
                        captured.erase(captured.begin(), captured.end() - static_cast<std::ptrdiff_t>(pre_roll));
                    }
                    if (voiced) {
                        heard_speech = true;
                        speech_started = std::chrono::steady_clock::now();
                    } else {
                        waited_ms += frame_ms;
                    }
                } else {
                    captured.insert(captured.end(), frame.begin(), frame.end());
                }

                if (heard_speech) {
                    speech_ms += frame_ms;
                    if (voiced) {
                        voiced_ms += frame_ms;
                        silence_ms = 0.0;
                        last_voice = std::chrono::steady_clock::now();
                    } else {
                        silence_ms += frame_ms;
                    }
                }
            }

            if (!heard_speech) {
                if (waited_ms >= listen_ms || elapsedMs(started) >= listen_ms) {
                    // RecognitionTimeout: nothing said, not worth reporting
                    endCapture();
                    captured.clear();
                    setState(VoiceState::IDLE);
                    return;
                }
                continue;
            }

            if (silence_ms >= silence_limit_ms || elapsedMs(last_voice) >= silence_limit_ms) {
                break;
            }
            if (speech_ms >= phrase_ms || elapsedMs(speech_started) >= phrase_ms) {
                phrase_cut = true;
                break;
            }
        }

        endCapture();

        if (phrase_cut) {
            std::cout << "[VoiceLoop] Phrase limit reached, transcribing what was heard" << std::endl;
        }
        if (voiced_ms < static_cast<double>(config.audio.min_speech.count())) {
            captured.clear();
            setState(VoiceState::IDLE);
            return;
        }
        setState(VoiceState::TRANSCRIBING);
    }

    // ----- TRANSCRIBING -----

    void recognitionFailed(const std::string& detail) {
        if (parts.stats) parts.stats->recordRecognition(false);
        reportError(EngineError::TranscriptionFailure, detail);
        if (parts.calibrator.noteRecognitionFailure()) {
            std::cout << "[VoiceLoop] " << parts.calibrator.consecutiveFailures()
                      << " consecutive recognition failures, recalibrating" << std::endl;
            pending_recalibration = "failure";
        }
        captured.clear();
        setState(VoiceState::IDLE);
    }

    void stepTranscribing() {
        const int rate = session.sample_rate_hz > 0 ? session.sample_rate_hz : config.audio.preferred_sample_rate;
        auto result = parts.transcriber->transcribe(captured, rate, config.speech.transcription_timeout, &token);
        captured.clear();

        if (token.isCancelled() || result.status == stt::TranscriptionStatus::CANCELLED) {
            if (token.isCancelled()) {
                enterShutdown();
            } else {
                setState(VoiceState::IDLE);
            }
            return;
        }

        std::string text = trim(result.utterance.raw_text);
        if (!result.ok() || text.empty()) {
            recognitionFailed(std::string("transcription ") + stt::toString(result.status));
            return;
        }
        if (result.utterance.confidence < config.speech.min_confidence) {
            recognitionFailed("low confidence " + std::to_string(result.utterance.confidence));
            return;
        }

        if (parts.stats) parts.stats->recordRecognition(true);
        parts.calibrator.noteRecognitionSuccess();
        utterance = result.utterance;
        utterance.raw_text = text;
        setState(VoiceState::MATCHING);
    }

    // ----- MATCHING -----

    void stepMatching() {
        const std::string& text = utterance.raw_text;

        if (!config.wake.require_wake_word) {
            auto match = parts.matcher.match(text);
            command_text = match.matched ? match.command : text;
        } else if (auto match = parts.matcher.match(text); match.matched) {
            if (parts.stats) parts.stats->recordWakeWordHit();
            std::cout << "[VoiceLoop] Wake word '" << match.variant << "' (score "
                      << match.score << ")" << std::endl;
            command_text = match.command;
        } else if (followUpOpen()) {
            command_text = text;
        } else {
            // Ambient chatter: no reply, no side effects
            if (parts.stats) parts.stats->recordDiscard();
            std::cout << "[VoiceLoop] Ignored (no wake word): " << text << std::endl;
            resetTurn();
            if (token.isCancelled()) {
                enterShutdown();
            } else if (beginCapture()) {
                setState(VoiceState::LISTENING);
            } else {
                setState(VoiceState::IDLE);
            }
            return;
        }

        std::cout << "[VoiceLoop] User: " << text << std::endl;
        if (callbacks.onUserUtterance) {
            callbacks.onUserUtterance(text);
        }
        setState(VoiceState::RESPONDING);
    }

    // ----- RESPONDING -----

    void stepResponding() {
        if (command_text.empty()) {
            reply_text = config.wake.acknowledgement;
        } else {
            auto started = std::chrono::steady_clock::now();
            auto reply = parts.responder.respond(command_text, &token);
            if (parts.stats) parts.stats->recordResponseLatency(elapsedMs(started));
            reply_text = reply.text;
            std::cout << "[VoiceLoop] Reply from " << llm::toString(reply.tier) << std::endl;
        }

        if (token.isCancelled()) {
            enterShutdown();
            return;
        }

        std::cout << "[VoiceLoop] Gideon: " << reply_text << std::endl;
        if (callbacks.onAssistantResponse) {
            callbacks.onAssistantResponse(reply_text);
        }
        setState(VoiceState::SPEAKING);
    }

    // ----- SPEAKING -----

    void stepSpeaking() {
        if (parts.speech) {
            auto lease = parts.arbiter.acquire(core::AudioMode::PLAYBACK,
                                               config.audio.calibration_wait, &token);
            if (lease.held()) {
                auto status = parts.speech->speak(reply_text, config.speech.speak_timeout, &token);
                lease.release();
                if (status != tts::SpeakStatus::DONE && status != tts::SpeakStatus::CANCELLED) {
                    std::cerr << "[VoiceLoop] Speech output " << tts::toString(status) << std::endl;
                }
            } else if (!token.isCancelled()) {
                std::cerr << "[VoiceLoop] Speaker busy, reply not spoken" << std::endl;
            }
        }

        if (token.isCancelled()) {
            enterShutdown();
            return;
        }

        if (!typed_turn) {
            openFollowUp();
        }
        resetTurn();
        setState(VoiceState::IDLE);
    }
};

VoiceLoop::VoiceLoop(const EngineConfig& config, VoiceLoopParts parts)
    : impl_(std::make_unique<Impl>(config, parts)) {
}

VoiceLoop::~VoiceLoop() {
    stop();
}

void VoiceLoop::setCallbacks(VoiceLoopCallbacks callbacks) {
    impl_->callbacks = std::move(callbacks);
}

bool VoiceLoop::step() {
    if (impl_->state == VoiceState::SHUTDOWN) {
        return false;
    }
    if (impl_->token.isCancelled()) {
        impl_->enterShutdown();
        return false;
    }

    switch (impl_->state.load()) {
        case VoiceState::IDLE:         impl_->stepIdle(); break;
        case VoiceState::LISTENING:    impl_->stepListening(); break;
        case VoiceState::TRANSCRIBING: impl_->stepTranscribing(); break;
        case VoiceState::MATCHING:     impl_->stepMatching(); break;
        case VoiceState::RESPONDING:   impl_->stepResponding(); break;
        case VoiceState::SPEAKING:     impl_->stepSpeaking(); break;
        case VoiceState::SHUTDOWN:     break;
    }
    return impl_->state != VoiceState::SHUTDOWN;
}

void VoiceLoop::run() {
    std::cout << "[VoiceLoop] Running" << std::endl;
    while (step()) {
    }
    std::cout << "[VoiceLoop] Stopped" << std::endl;
}

bool VoiceLoop::start() {
    if (impl_->worker.joinable() || impl_->state == VoiceState::SHUTDOWN) {
        return false;
    }
    impl_->worker = std::thread([this]() { run(); });
    return true;
}

void VoiceLoop::stop() {
    requestShutdown();
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

bool VoiceLoop::post(Command command) {
    return impl_->commands.push(std::move(command));
}

bool VoiceLoop::submitText(const std::string& text) {
    return post({Command::Kind::TEXT_INPUT, text});
}

bool VoiceLoop::requestRecalibration(const std::string& reason) {
    return post({Command::Kind::RECALIBRATE, reason});
}

void VoiceLoop::requestShutdown() {
    impl_->token.cancel();
    impl_->commands.push({Command::Kind::SHUTDOWN, ""});
}

VoiceState VoiceLoop::state() const {
    return impl_->state.load();
}

bool VoiceLoop::textMode() const {
    return impl_->text_mode.load();
}

bool VoiceLoop::followUpOpen() const {
    return impl_->followUpOpen();
}

} // namespace gideon
