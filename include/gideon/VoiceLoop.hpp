/**
 * VoiceLoop.hpp - Listen -> transcribe -> match -> respond -> speak state machine
 *
 * One task owns the state machine and, through the AudioArbiter, the
 * microphone and speaker. Everything else talks to it through the command
 * channel (post / submitText / requestRecalibration / requestShutdown).
 */

#pragma once

#include "gideon/Config.hpp"
#include "gideon/Types.hpp"
#include "gideon/audio/AudioCalibrator.hpp"
#include "gideon/audio/Interfaces.hpp"
#include "gideon/core/AudioArbiter.hpp"
#include "gideon/core/EngineStats.hpp"
#include "gideon/llm/ResponseEngine.hpp"
#include "gideon/stt/Transcriber.hpp"
#include "gideon/tts/SpeechSink.hpp"
#include "gideon/wakeword/WakeWordMatcher.hpp"

#include <functional>
#include <memory>
#include <string>

namespace gideon {

enum class VoiceState {
    IDLE,
    LISTENING,
    TRANSCRIBING,
    MATCHING,
    RESPONDING,
    SPEAKING,
    SHUTDOWN
};

const char* toString(VoiceState state);

struct Command {
    enum class Kind {
        RECALIBRATE,
        PROBE,
        SHUTDOWN,
        TEXT_INPUT
    };

    Kind kind;
    std::string payload;  // recalibration reason or typed text
};

struct VoiceLoopCallbacks {
    std::function<void(VoiceState)> onStateChange;
    std::function<void(const std::string&)> onUserUtterance;
    std::function<void(const std::string&)> onAssistantResponse;
    std::function<void(EngineError, const std::string&)> onError;
    std::function<void()> onProbeRequested;
    std::function<void(const AudioSession&)> onSessionChanged;
};

/**
 * Collaborators. capture, transcriber and speech may be null: without the
 * first two the loop runs in text mode, without speech replies are only
 * reported through onAssistantResponse.
 */
struct VoiceLoopParts {
    audio::AudioCalibrator& calibrator;
    audio::CaptureSource* capture;
    stt::Transcriber* transcriber;
    wakeword::WakeWordMatcher& matcher;
    llm::ResponseEngine& responder;
    tts::SpeechSink* speech;
    core::AudioArbiter& arbiter;
    audio::VoiceActivity* vad = nullptr;
    core::EngineStats* stats = nullptr;
};

class VoiceLoop {
public:
    VoiceLoop(const EngineConfig& config, VoiceLoopParts parts);
    ~VoiceLoop();

    VoiceLoop(const VoiceLoop&) = delete;
    VoiceLoop& operator=(const VoiceLoop&) = delete;

    void setCallbacks(VoiceLoopCallbacks callbacks);

    /**
     * Run the handler for the current state once.
     * @return false once the loop is in SHUTDOWN
     */
    bool step();

    // step() until SHUTDOWN
    void run();

    // run() on a worker thread
    bool start();

    // requestShutdown() and join the worker
    void stop();

    bool post(Command command);
    bool submitText(const std::string& text);
    bool requestRecalibration(const std::string& reason);

    // Cancels every pending wait; the loop enters SHUTDOWN on its next step
    void requestShutdown();

    VoiceState state() const;
    bool textMode() const;
    bool followUpOpen() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gideon
