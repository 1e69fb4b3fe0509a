/**
 * Fakes.hpp - Scripted stand-ins for hardware, models and servers
 */

#pragma once

#include "gideon/audio/Interfaces.hpp"
#include "gideon/health/HealthMonitor.hpp"
#include "gideon/llm/LanguageModel.hpp"
#include "gideon/stt/Transcriber.hpp"
#include "gideon/tts/SpeechSink.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace gideon::testing {

// Shared view of what the fake hardware is doing right now
struct HardwareMonitor {
    std::atomic<bool> capturing{false};
    std::atomic<bool> speaking{false};
    std::atomic<bool> calibrating{false};
    std::atomic<int> violations{0};

    void check() {
        int active = (capturing ? 1 : 0) + (speaking ? 1 : 0) + (calibrating ? 1 : 0);
        if (active > 1) violations++;
    }
};

class FakeDeviceProbe : public audio::DeviceProbe {
public:
    std::vector<audio::DeviceInfo> devices;  // what is plugged in
    std::vector<audio::DeviceInfo> listed;   // what the last refresh saw
    bool refuse_refresh = false;
    int refreshes = 0;
    std::vector<int> rates{16000};
    float ambient_level = 0.001f;
    bool fail_capture = false;
    int fail_after = -1;  // captures numbered above this fail
    HardwareMonitor* monitor = nullptr;
    int captures = 0;

    static audio::DeviceInfo device(int id, const std::string& name, int channels, bool is_default) {
        audio::DeviceInfo d;
        d.id = id;
        d.name = name;
        d.max_input_channels = channels;
        d.default_sample_rate = 16000.0;
        d.is_default = is_default;
        return d;
    }

    bool refreshDevices() override {
        refreshes++;
        if (refuse_refresh) return false;
        listed = devices;
        return true;
    }

    std::vector<audio::DeviceInfo> listInputDevices() override { return listed; }

    bool supportsSampleRate(int, int sample_rate) override {
        for (int r : rates) {
            if (r == sample_rate) return true;
        }
        return false;
    }

    std::optional<std::vector<float>> captureSamples(int, int sample_rate,
                                                     std::chrono::milliseconds duration) override {
        captures++;
        if (monitor) {
            monitor->calibrating = true;
            monitor->check();
            monitor->calibrating = false;
        }
        if (fail_capture || (fail_after >= 0 && captures > fail_after)) {
            return std::nullopt;
        }
        std::size_t n = static_cast<std::size_t>(sample_rate) * duration.count() / 1000;
        std::vector<float> samples(n);
        for (std::size_t i = 0; i < n; ++i) {
            samples[i] = (i % 2 == 0) ? ambient_level : -ambient_level;
        }
        return samples;
    }
};

/**
 * Replays the same pattern on every capture session:
 * `lead` silent frames, `voiced` loud frames, `trail` silent frames,
 * then TIMEOUT until stopped.
 */
class FakeCapture : public audio::CaptureSource {
public:
    int frame_samples = 320;  // 20 ms at 16 kHz
    int lead = 5;
    int voiced = 20;
    int trail = 60;
    float level = 0.2f;
    bool fail_start = false;
    HardwareMonitor* monitor = nullptr;
    std::atomic<int> sessions{0};

    bool startCapture(const AudioSession&) override {
        if (fail_start) return false;
        cursor_ = 0;
        capturing_ = true;
        sessions++;
        if (monitor) {
            monitor->capturing = true;
            monitor->check();
        }
        return true;
    }

    audio::ReadStatus readFrame(std::vector<float>& frame, std::chrono::milliseconds) override {
        if (!capturing_) {
            return audio::ReadStatus::STOPPED;
        }
        if (monitor) monitor->check();
        int total = lead + voiced + trail;
        if (cursor_ >= total) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            return audio::ReadStatus::TIMEOUT;
        }
        bool loud = cursor_ >= lead && cursor_ < lead + voiced;
        frame.assign(static_cast<std::size_t>(frame_samples), loud ? level : 0.0f);
        cursor_++;
        return audio::ReadStatus::FRAME;
    }

    void stopCapture() override {
        capturing_ = false;
        if (monitor) monitor->capturing = false;
    }

    bool isCapturing() const override { return capturing_; }

private:
    int cursor_ = 0;
    std::atomic<bool> capturing_{false};
};

class FakeTranscriber : public stt::Transcriber {
public:
    bool ready = true;
    std::function<stt::Transcription()> next;
    std::atomic<int> calls{0};

    static stt::Transcription ok(const std::string& text, float confidence = 0.9f) {
        stt::Transcription t;
        t.status = stt::TranscriptionStatus::OK;
        t.utterance.raw_text = text;
        t.utterance.confidence = confidence;
        t.utterance.captured_at = SystemClock::now();
        return t;
    }

    static stt::Transcription failed(stt::TranscriptionStatus status = stt::TranscriptionStatus::FAILED) {
        stt::Transcription t;
        t.status = status;
        return t;
    }

    stt::Transcription transcribe(const std::vector<float>&, int, std::chrono::milliseconds,
                                  const core::CancellationToken*) override {
        calls++;
        return next ? next() : failed();
    }

    bool isReady() const override { return ready; }
};

class FakeSpeech : public tts::SpeechSink {
public:
    bool ready = true;
    HardwareMonitor* monitor = nullptr;
    std::vector<std::string> spoken;
    std::mutex mutex;

    tts::SpeakStatus speak(const std::string& text, std::chrono::milliseconds,
                           const core::CancellationToken* token) override {
        if (monitor) {
            monitor->speaking = true;
            monitor->check();
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            spoken.push_back(text);
        }
        if (monitor) monitor->speaking = false;
        return core::isCancelled(token) ? tts::SpeakStatus::CANCELLED : tts::SpeakStatus::DONE;
    }

    bool isReady() const override { return ready; }
};

class FakeModel : public llm::LanguageModel {
public:
    bool configured = true;
    std::deque<llm::ModelStatus> script;          // consumed per complete(); empty means OK
    llm::ModelStatus default_status = llm::ModelStatus::OK;
    llm::ModelStatus ping_status = llm::ModelStatus::OK;
    std::string reply_text = "It is noon.";
    std::atomic<int> calls{0};
    std::atomic<int> pings{0};
    std::size_t last_context = 0;

    bool isConfigured() const override { return configured; }

    llm::ModelReply complete(const std::string&, const std::vector<ConversationTurn>& context,
                             const core::CancellationToken*) override {
        calls++;
        last_context = context.size();
        llm::ModelReply reply;
        reply.status = default_status;
        if (!script.empty()) {
            reply.status = script.front();
            script.pop_front();
        }
        if (reply.status == llm::ModelStatus::OK) {
            reply.text = reply_text;
            reply.http_status = 200;
        }
        return reply;
    }

    llm::ModelStatus ping() override {
        pings++;
        return ping_status;
    }
};

class FakeMemoryProbe : public health::MemoryProbe {
public:
    std::deque<std::size_t> readings;  // consumed per call; the last one repeats
    int reclaims = 0;

    std::optional<std::size_t> residentBytes() override {
        if (readings.empty()) return std::nullopt;
        std::size_t value = readings.front();
        if (readings.size() > 1) readings.pop_front();
        return value;
    }

    void reclaim() override { reclaims++; }
};

class RecordingLog : public llm::ConversationLog {
public:
    std::vector<ConversationTurn> turns;
    void appendTurn(const ConversationTurn& turn) override { turns.push_back(turn); }
};

inline std::size_t megabytes(std::size_t mb) {
    return mb * 1024 * 1024;
}

} // namespace gideon::testing
