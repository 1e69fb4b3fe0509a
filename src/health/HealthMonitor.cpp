/**
 * HealthMonitor.cpp - Audio, language model, speech and memory probes
 */

#include "gideon/health/HealthMonitor.hpp"
#include "gideon/core/CancellationToken.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>

namespace gideon::health {

namespace {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

// Capacities come back once usage falls below this share of the ceiling
constexpr double RESTORE_RATIO = 0.8;

constexpr const char* TRIAL_PROMPT = "Reply with the single word: ready";

// What switched the remote tier off decides what switches it back on
enum class BypassCause {
    NONE,
    FAILED_COMPLETIONS,
    UNREACHABLE,
    AUTH_REJECTED
};

ComponentHealth makeHealth(HealthState state, std::string detail) {
    ComponentHealth h;
    h.state = state;
    h.detail = std::move(detail);
    h.last_checked_at = SystemClock::now();
    return h;
}

} // anonymous namespace

struct HealthMonitor::Impl {
    const HealthSettings& settings;
    HealthTargets targets;
    HealthActions actions;

    std::mutex probe_mutex;
    mutable std::mutex status_mutex;
    HealthStatus status;

    int audio_failures = 0;
    int ping_failures = 0;
    BypassCause bypass_cause = BypassCause::NONE;

    // Memory accounting
    mutable std::mutex memory_mutex;
    MemoryReport report;
    double total_mb = 0.0;

    core::CancellationToken token;
    std::thread worker;
    std::atomic<bool> running{false};

    Impl(const HealthSettings& s, HealthTargets t, HealthActions a)
        : settings(s)
        , targets(t)
        , actions(std::move(a)) {
    }

    void escalateAudio(const std::string& why) {
        if (++audio_failures < settings.probe_failures_before_action) {
            return;
        }
        std::cerr << "[HealthMonitor] Audio probe failed " << audio_failures
                  << " times (" << why << "), requesting recalibration" << std::endl;
        audio_failures = 0;
        if (actions.requestRecalibration) {
            actions.requestRecalibration("health-check-failure");
        }
    }

    ComponentHealth probeAudio(bool& text_mode) {
        if (!targets.calibrator) {
            text_mode = true;
            return makeHealth(HealthState::FAILED, "no calibrator");
        }

        AudioSession session = targets.calibrator->session();
        std::vector<audio::DeviceInfo> devices;
        bool refreshed = false;
        if (targets.devices) {
            // Refused while a stream is open; the device in use is then still there
            refreshed = targets.devices->refreshDevices();
            devices = targets.devices->listInputDevices();
        }

        if (!session.enabled) {
            text_mode = true;
            // A device appeared since the last calibration
            if (!devices.empty()) {
                escalateAudio("capture device available while in text mode");
            }
            return makeHealth(HealthState::FAILED, "no capture device, text mode");
        }

        if (!targets.devices) {
            return makeHealth(HealthState::OK, session.device_name);
        }

        bool present = std::any_of(devices.begin(), devices.end(), [&](const audio::DeviceInfo& d) {
            return session.device_name.empty() ? d.id == session.device_id
                                               : d.name == session.device_name;
        });

        if (present) {
            audio_failures = 0;
            return makeHealth(HealthState::OK, session.device_name + " @ " +
                              std::to_string(session.sample_rate_hz) + "Hz" +
                              (refreshed ? "" : " (in use)"));
        }

        escalateAudio("device missing");
        return makeHealth(HealthState::DEGRADED, "device no longer enumerable: " + session.device_name);
    }

    // Keeps the first cause while already bypassed
    void bypass(llm::ResponseEngine* responder, BypassCause cause) {
        if (!responder) return;
        if (!responder->remoteBypassed()) {
            bypass_cause = cause;
        }
        responder->setRemoteBypass(true);
    }

    void liftBypass(llm::ResponseEngine* responder) {
        responder->resetRemoteFailures();
        responder->setRemoteBypass(false);
        bypass_cause = BypassCause::NONE;
    }

    ComponentHealth probeModel() {
        llm::ResponseEngine* responder = targets.responder;

        if (!targets.model || !targets.model->isConfigured()) {
            return makeHealth(HealthState::FAILED, "not configured, fallback replies only");
        }

        llm::ModelStatus ping = targets.model->ping();
        int remote_failures = responder ? responder->consecutiveRemoteFailures() : 0;
        bool bypassed = responder && responder->remoteBypassed();

        if (ping == llm::ModelStatus::OK) {
            ping_failures = 0;
            if (bypassed) {
                if (bypass_cause == BypassCause::UNREACHABLE || bypass_cause == BypassCause::AUTH_REJECTED) {
                    liftBypass(responder);
                    return makeHealth(HealthState::OK, "reachable again, remote replies restored");
                }
                // The health endpoint can answer while completions still fail: try one
                llm::ModelReply trial = targets.model->complete(TRIAL_PROMPT, {}, &token);
                if (trial.ok()) {
                    liftBypass(responder);
                    return makeHealth(HealthState::OK, "trial completion succeeded, remote replies restored");
                }
                return makeHealth(HealthState::DEGRADED, std::string("reachable but trial completion ") +
                                  llm::toString(trial.status) + ", using fallback");
            }
            if (remote_failures < settings.lm_failure_threshold) {
                return makeHealth(HealthState::OK, "reachable");
            }
            bypass(responder, BypassCause::FAILED_COMPLETIONS);
            return makeHealth(HealthState::DEGRADED,
                              std::to_string(remote_failures) + " failed completions, using fallback");
        }

        ping_failures++;
        if (ping == llm::ModelStatus::AUTH_ERROR) {
            bypass(responder, BypassCause::AUTH_REJECTED);
            return makeHealth(HealthState::FAILED, "authentication rejected, using fallback");
        }

        std::string detail = std::string("ping ") + llm::toString(ping);
        if (remote_failures >= settings.lm_failure_threshold) {
            bypass(responder, BypassCause::FAILED_COMPLETIONS);
            return makeHealth(HealthState::DEGRADED, detail + ", using fallback");
        }
        if (ping_failures >= settings.probe_failures_before_action) {
            bypass(responder, BypassCause::UNREACHABLE);
            return makeHealth(HealthState::DEGRADED, detail + ", using fallback");
        }
        return makeHealth(HealthState::DEGRADED, detail);
    }

    void recordMemory(double mb) {
        std::lock_guard<std::mutex> lock(memory_mutex);
        report.current_mb = mb;
        report.peak_mb = std::max(report.peak_mb, mb);
        report.measurements++;
        total_mb += mb;
        report.average_mb = total_mb / static_cast<double>(report.measurements);
    }

    ComponentHealth probeMemory(bool& ceiling_exceeded) {
        auto bytes = targets.memory->residentBytes();
        if (!bytes) {
            return makeHealth(HealthState::DEGRADED, "resident size unavailable");
        }

        const double ceiling = static_cast<double>(settings.memory_ceiling_mb) * BYTES_PER_MB;
        double used = static_cast<double>(*bytes);
        recordMemory(used / BYTES_PER_MB);

        if (used <= ceiling) {
            if (used < ceiling * RESTORE_RATIO && targets.responder && targets.responder->capacitiesReduced()) {
                targets.responder->restoreCapacities();
            }
            return makeHealth(HealthState::OK, std::to_string(static_cast<int>(used / BYTES_PER_MB)) + " MB");
        }

        std::cerr << "[HealthMonitor] Memory " << static_cast<int>(used / BYTES_PER_MB) << " MB over ceiling "
                  << settings.memory_ceiling_mb << " MB, reclaiming" << std::endl;

        if (targets.responder) targets.responder->releaseUnused();
        targets.memory->reclaim();
        if (targets.stats) targets.stats->recordReclaim();
        {
            std::lock_guard<std::mutex> lock(memory_mutex);
            report.reclaims++;
        }

        auto after = targets.memory->residentBytes();
        if (after && static_cast<double>(*after) <= ceiling) {
            recordMemory(static_cast<double>(*after) / BYTES_PER_MB);
            return makeHealth(HealthState::OK, "reclaimed to " +
                              std::to_string(static_cast<int>(*after / BYTES_PER_MB)) + " MB");
        }

        if (targets.responder &&
            targets.responder->shrink(settings.min_cache_capacity, settings.min_memory_capacity)) {
            std::lock_guard<std::mutex> lock(memory_mutex);
            report.capacity_reductions++;
        }
        ceiling_exceeded = true;
        return makeHealth(HealthState::DEGRADED, "over ceiling after reclamation, capacities reduced");
    }

    HealthStatus runProbe() {
        std::lock_guard<std::mutex> lock(probe_mutex);

        HealthStatus next;
        next.probed_at = SystemClock::now();

        next.components["audio"] = probeAudio(next.text_mode);
        next.components["language_model"] = probeModel();

        if (!targets.transcriber) {
            next.components["speech_to_text"] = makeHealth(HealthState::FAILED, "not loaded");
            next.text_mode = true;
        } else if (!targets.transcriber->isReady()) {
            next.components["speech_to_text"] = makeHealth(HealthState::FAILED, "model not ready");
            next.text_mode = true;
        } else {
            next.components["speech_to_text"] = makeHealth(HealthState::OK, "ready");
        }

        if (!targets.speech) {
            next.components["speech_output"] = makeHealth(HealthState::DEGRADED, "console output only");
        } else if (!targets.speech->isReady()) {
            next.components["speech_output"] = makeHealth(HealthState::DEGRADED, "unreachable, console fallback");
        } else {
            next.components["speech_output"] = makeHealth(HealthState::OK, "ready");
        }

        if (targets.memory) {
            next.components["memory"] = probeMemory(next.memory_ceiling_exceeded);
        }

        if (targets.stats) targets.stats->recordProbe();

        {
            std::lock_guard<std::mutex> status_lock(status_mutex);
            status = next;
        }

        for (const auto& [name, health] : next.components) {
            if (health.state != HealthState::OK) {
                std::cout << "[HealthMonitor] " << name << ": " << toString(health.state)
                          << " (" << health.detail << ")" << std::endl;
            }
        }

        if (actions.onStatus) {
            actions.onStatus(next);
        }
        return next;
    }
};

HealthMonitor::HealthMonitor(const HealthSettings& settings, HealthTargets targets, HealthActions actions)
    : impl_(std::make_unique<Impl>(settings, targets, std::move(actions))) {
}

HealthMonitor::~HealthMonitor() {
    stop();
}

HealthStatus HealthMonitor::probe() {
    return impl_->runProbe();
}

HealthStatus HealthMonitor::snapshot() const {
    std::lock_guard<std::mutex> lock(impl_->status_mutex);
    return impl_->status;
}

bool HealthMonitor::start() {
    if (impl_->running.exchange(true)) {
        return false;
    }
    impl_->token.reset();
    impl_->worker = std::thread([this]() {
        std::cout << "[HealthMonitor] Probing every "
                  << impl_->settings.probe_interval.count() << " ms" << std::endl;
        do {
            impl_->runProbe();
        } while (impl_->token.waitFor(impl_->settings.probe_interval));
    });
    return true;
}

void HealthMonitor::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    impl_->token.cancel();
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

bool HealthMonitor::isRunning() const {
    return impl_->running.load();
}

MemoryReport HealthMonitor::memoryReport() const {
    std::lock_guard<std::mutex> lock(impl_->memory_mutex);
    return impl_->report;
}

} // namespace gideon::health
