/**
 * TTSEngine.cpp - TTS server client
 *
 * Talks to a persistent synthesis server (POST /synthesize {"text": ...}
 * returning WAV, GET /health) so the voice model stays loaded between turns.
 */

#include "gideon/tts/TTSEngine.hpp"
#include "gideon/audio/AudioEngine.hpp"
#include "gideon/audio/WavCodec.hpp"
#include "gideon/core/RequestWatchdog.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <regex>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gideon::tts {

constexpr std::chrono::milliseconds DRAIN_POLL{20};
constexpr std::chrono::milliseconds HEALTH_TIMEOUT{1000};
constexpr std::chrono::milliseconds CONNECT_TIMEOUT{2000};

namespace {

void setTimeout(httplib::Client& client, std::chrono::milliseconds connect, std::chrono::milliseconds read) {
    client.set_connection_timeout(static_cast<time_t>(connect.count() / 1000),
                                  static_cast<time_t>((connect.count() % 1000) * 1000));
    client.set_read_timeout(static_cast<time_t>(read.count() / 1000),
                            static_cast<time_t>((read.count() % 1000) * 1000));
}

} // anonymous namespace

struct TTSEngine::Impl {
    const SpeechSettings& settings;
    audio::AudioEngine* playback;

    std::unique_ptr<httplib::Client> client;
    std::unique_ptr<httplib::Client> health;
    std::mutex client_mutex;
    mutable std::mutex health_mutex;

    Impl(const SpeechSettings& s, audio::AudioEngine* p)
        : settings(s)
        , playback(p) {
        client = std::make_unique<httplib::Client>(settings.tts_url);
        health = std::make_unique<httplib::Client>(settings.tts_url);
        setTimeout(*health, HEALTH_TIMEOUT, HEALTH_TIMEOUT);
    }

    bool serverAvailable() const {
        std::lock_guard<std::mutex> lock(health_mutex);
        auto res = health->Get("/health");
        return res && res->status == 200;
    }

    /**
     * POST one sentence. Read timeout is whatever is left before `deadline`,
     * and cancelling the token aborts the request in flight.
     */
    std::vector<float> synthesizeUntil(const std::string& text,
                                       std::chrono::steady_clock::time_point deadline,
                                       const core::CancellationToken* token) {
        if (text.empty()) {
            return {};
        }

        json req_json = {{"text", text}};

        std::lock_guard<std::mutex> lock(client_mutex);
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0 || core::isCancelled(token)) {
            return {};
        }
        setTimeout(*client, std::min(CONNECT_TIMEOUT, remaining), remaining);

        core::RequestWatchdog watchdog(token, deadline, [this]() { client->stop(); });
        auto res = client->Post("/synthesize", req_json.dump(), "application/json");
        if (watchdog.disarm()) {
            std::cerr << "[TTSEngine] Request aborted: "
                      << (core::isCancelled(token) ? "cancelled" : "out of time") << std::endl;
            return {};
        }
        if (!res) {
            std::cerr << "[TTSEngine] Request failed: " << httplib::to_string(res.error()) << std::endl;
            return {};
        }
        if (res->status != 200) {
            std::cerr << "[TTSEngine] Request failed: HTTP " << res->status << std::endl;
            return {};
        }

        auto wav = audio::decodeWav(res->body);
        if (!wav || wav->samples.empty()) {
            return {};
        }

        int target = playback ? playback->playbackSampleRate() : settings.playback_sample_rate;
        return audio::resampleLinear(wav->samples, wav->sample_rate, target);
    }

    void consoleFallback(const std::string& text) {
        std::cout << "[TTS FALLBACK] " << text << std::endl;
    }

    // Wait for queued audio to leave the device
    SpeakStatus drain(std::chrono::steady_clock::time_point deadline, const core::CancellationToken* token) {
        while (playback->isPlaying()) {
            if (core::isCancelled(token)) {
                playback->clearPlayback();
                return SpeakStatus::CANCELLED;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                playback->clearPlayback();
                return SpeakStatus::TIMEOUT;
            }
            std::this_thread::sleep_for(DRAIN_POLL);
        }
        std::this_thread::sleep_for(playback->outputLatency());
        return SpeakStatus::DONE;
    }

    // Push samples, waiting for room when the ring buffer is full
    SpeakStatus enqueue(const std::vector<float>& samples,
                        std::chrono::steady_clock::time_point deadline,
                        const core::CancellationToken* token) {
        std::size_t offset = 0;
        while (offset < samples.size()) {
            offset += playback->queuePlayback(samples.data() + offset, samples.size() - offset);
            if (offset >= samples.size()) break;
            if (core::isCancelled(token)) {
                playback->clearPlayback();
                return SpeakStatus::CANCELLED;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                playback->clearPlayback();
                return SpeakStatus::TIMEOUT;
            }
            std::this_thread::sleep_for(DRAIN_POLL);
        }
        return SpeakStatus::DONE;
    }
};

TTSEngine::TTSEngine(const SpeechSettings& settings, audio::AudioEngine* playback)
    : impl_(std::make_unique<Impl>(settings, playback)) {
    if (impl_->serverAvailable()) {
        std::cout << "[TTSEngine] Connected to TTS server at " << settings.tts_url << std::endl;
    } else {
        std::cout << "[TTSEngine] TTS server not reachable at " << settings.tts_url
                  << ", replies will be printed" << std::endl;
    }
}

TTSEngine::~TTSEngine() = default;

bool TTSEngine::isReady() const {
    return impl_->playback && impl_->playback->hasPlayback() && impl_->serverAvailable();
}

std::vector<float> TTSEngine::synthesize(const std::string& text) {
    return synthesize(text, impl_->settings.speak_timeout, nullptr);
}

std::vector<float> TTSEngine::synthesize(const std::string& text,
                                         std::chrono::milliseconds timeout,
                                         const core::CancellationToken* token) {
    return impl_->synthesizeUntil(text, std::chrono::steady_clock::now() + timeout, token);
}

SpeakStatus TTSEngine::speak(const std::string& text,
                             std::chrono::milliseconds timeout,
                             const core::CancellationToken* token) {
    if (text.empty()) {
        return SpeakStatus::DONE;
    }

    if (!impl_->playback || !impl_->playback->hasPlayback()) {
        impl_->consoleFallback(text);
        return SpeakStatus::DONE;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool played_any = false;

    for (const auto& sentence : splitSentences(text)) {
        if (core::isCancelled(token)) {
            impl_->playback->clearPlayback();
            return SpeakStatus::CANCELLED;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            impl_->playback->clearPlayback();
            return SpeakStatus::TIMEOUT;
        }

        auto samples = impl_->synthesizeUntil(sentence, deadline, token);
        if (core::isCancelled(token)) {
            impl_->playback->clearPlayback();
            return SpeakStatus::CANCELLED;
        }
        if (samples.empty() && std::chrono::steady_clock::now() >= deadline) {
            impl_->playback->clearPlayback();
            return SpeakStatus::TIMEOUT;
        }
        if (samples.empty()) {
            if (!played_any) {
                // Server down: the turn still completes, on the console
                impl_->consoleFallback(text);
                return SpeakStatus::DONE;
            }
            std::cerr << "[TTSEngine] Skipping unsynthesizable sentence" << std::endl;
            continue;
        }

        SpeakStatus queued = impl_->enqueue(samples, deadline, token);
        if (queued != SpeakStatus::DONE) {
            return queued;
        }
        played_any = true;
    }

    return impl_->drain(deadline, token);
}

std::vector<std::string> TTSEngine::splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::regex sentence_regex(R"([^.!?]+[.!?]+\s*)");

    auto begin = std::sregex_iterator(text.begin(), text.end(), sentence_regex);
    auto end = std::sregex_iterator();

    std::size_t consumed = 0;
    for (auto it = begin; it != end; ++it) {
        std::string sentence = it->str();
        consumed = static_cast<std::size_t>(it->position() + it->length());
        if (sentence.find_first_not_of(" \t\r\n") != std::string::npos) {
            sentences.push_back(sentence);
        }
    }

    // Trailing text without terminal punctuation
    if (consumed < text.size()) {
        std::string rest = text.substr(consumed);
        if (rest.find_first_not_of(" \t\r\n") != std::string::npos) {
            sentences.push_back(rest);
        }
    }

    return sentences;
}

} // namespace gideon::tts
