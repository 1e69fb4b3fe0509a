/**
 * test_health_monitor.cpp - Probes and corrective actions
 */

#include "gideon/audio/AudioCalibrator.hpp"
#include "gideon/health/HealthMonitor.hpp"
#include "gideon/llm/ResponseEngine.hpp"
#include "support/Fakes.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace gideon;
using namespace gideon::health;
using namespace gideon::testing;
using namespace std::chrono_literals;

namespace {

ResponseSettings responseSettings() {
    ResponseSettings settings;
    settings.retry_backoff = 1ms;
    settings.max_retries = 0;
    return settings;
}

} // anonymous namespace

void test_all_healthy() {
    AudioSettings audio_settings;
    HealthSettings settings;
    auto response_settings = responseSettings();

    FakeDeviceProbe devices;
    devices.devices.push_back(FakeDeviceProbe::device(1, "Mic", 1, true));
    audio::AudioCalibrator calibrator(audio_settings, devices);
    calibrator.calibrate();

    FakeModel model;
    llm::ResponseEngine responder(response_settings, &model);
    FakeTranscriber transcriber;
    FakeSpeech speech;
    FakeMemoryProbe memory;
    memory.readings = {megabytes(100)};
    core::EngineStats stats;

    HealthTargets targets{&calibrator, &devices, &model, &responder, &transcriber, &speech, &memory, &stats};
    std::vector<HealthStatus> published;
    HealthActions actions;
    actions.onStatus = [&published](const HealthStatus& s) { published.push_back(s); };
    HealthMonitor monitor(settings, targets, actions);

    HealthStatus status = monitor.probe();
    for (const auto& name : {"audio", "language_model", "speech_to_text", "speech_output", "memory"}) {
        assert(status.components.at(name).state == HealthState::OK);
    }
    assert(!status.text_mode);
    assert(!status.memory_ceiling_exceeded);
    assert(published.size() == 1);
    assert(monitor.snapshot().components.size() == 5);
    assert(stats.snapshot().health_probes == 1);
    assert(model.pings == 1);

    std::cout << "[PASS] test_all_healthy" << std::endl;
}

void test_missing_device_requests_recalibration() {
    AudioSettings audio_settings;
    HealthSettings settings;

    FakeDeviceProbe devices;
    devices.devices.push_back(FakeDeviceProbe::device(1, "USB Mic", 1, true));
    audio::AudioCalibrator calibrator(audio_settings, devices);
    calibrator.calibrate();

    // Unplugged
    devices.devices.clear();

    std::vector<std::string> reasons;
    HealthTargets targets;
    targets.calibrator = &calibrator;
    targets.devices = &devices;
    HealthActions actions;
    actions.requestRecalibration = [&reasons](const std::string& r) { reasons.push_back(r); };
    HealthMonitor monitor(settings, targets, actions);

    HealthStatus first = monitor.probe();
    assert(first.components.at("audio").state == HealthState::DEGRADED);
    assert(reasons.empty());

    monitor.probe();
    assert(reasons.size() == 1);
    assert(reasons[0] == "health-check-failure");
    assert(devices.refreshes == 3);

    std::cout << "[PASS] test_missing_device_requests_recalibration" << std::endl;
}

void test_device_in_use_not_reported_missing() {
    AudioSettings audio_settings;
    HealthSettings settings;

    FakeDeviceProbe devices;
    devices.devices.push_back(FakeDeviceProbe::device(1, "USB Mic", 1, true));
    audio::AudioCalibrator calibrator(audio_settings, devices);
    calibrator.calibrate();

    // Capture stream open: the list cannot be re-read and the last one stands
    devices.refuse_refresh = true;
    devices.devices.clear();

    std::vector<std::string> reasons;
    HealthTargets targets;
    targets.calibrator = &calibrator;
    targets.devices = &devices;
    HealthActions actions;
    actions.requestRecalibration = [&reasons](const std::string& r) { reasons.push_back(r); };
    HealthMonitor monitor(settings, targets, actions);

    for (int i = 0; i < 3; ++i) {
        HealthStatus status = monitor.probe();
        assert(status.components.at("audio").state == HealthState::OK);
        assert(status.components.at("audio").detail.find("(in use)") != std::string::npos);
    }
    assert(reasons.empty());

    std::cout << "[PASS] test_device_in_use_not_reported_missing" << std::endl;
}

void test_new_device_in_text_mode() {
    AudioSettings audio_settings;
    HealthSettings settings;

    FakeDeviceProbe devices;
    audio::AudioCalibrator calibrator(audio_settings, devices);
    assert(!calibrator.calibrate().enabled);

    devices.devices.push_back(FakeDeviceProbe::device(2, "Headset", 1, true));

    std::vector<std::string> reasons;
    HealthTargets targets;
    targets.calibrator = &calibrator;
    targets.devices = &devices;
    HealthActions actions;
    actions.requestRecalibration = [&reasons](const std::string& r) { reasons.push_back(r); };
    HealthMonitor monitor(settings, targets, actions);

    assert(monitor.probe().text_mode);
    assert(reasons.empty());
    monitor.probe();
    assert(reasons.size() == 1);
    assert(reasons[0] == "health-check-failure");

    std::cout << "[PASS] test_new_device_in_text_mode" << std::endl;
}

void test_text_mode_reported() {
    AudioSettings audio_settings;
    HealthSettings settings;
    FakeDeviceProbe devices;
    audio::AudioCalibrator calibrator(audio_settings, devices);
    calibrator.calibrate();

    HealthTargets targets;
    targets.calibrator = &calibrator;
    targets.devices = &devices;
    HealthMonitor monitor(settings, targets);

    HealthStatus status = monitor.probe();
    assert(status.text_mode);
    assert(status.components.at("audio").state == HealthState::FAILED);
    assert(status.components.at("speech_to_text").state == HealthState::FAILED);
    assert(status.components.at("speech_output").state == HealthState::DEGRADED);
    assert(status.components.at("language_model").state == HealthState::FAILED);

    std::cout << "[PASS] test_text_mode_reported" << std::endl;
}

void test_model_bypass_lifted_on_recovery() {
    HealthSettings settings;
    auto response_settings = responseSettings();
    FakeModel model;
    model.default_status = llm::ModelStatus::SERVER_ERROR;
    llm::ResponseEngine responder(response_settings, &model);
    for (int i = 0; i < 3; ++i) {
        responder.respond("question " + std::to_string(i));
    }

    HealthTargets targets;
    targets.model = &model;
    targets.responder = &responder;
    HealthMonitor monitor(settings, targets);

    // Health endpoint fine, completions failing
    assert(monitor.probe().components.at("language_model").state == HealthState::DEGRADED);
    assert(responder.remoteBypassed());

    // Still bypassed while pings fail
    model.ping_status = llm::ModelStatus::NETWORK_ERROR;
    monitor.probe();
    assert(responder.remoteBypassed());

    model.ping_status = llm::ModelStatus::OK;
    model.default_status = llm::ModelStatus::OK;
    assert(monitor.probe().components.at("language_model").state == HealthState::OK);
    assert(!responder.remoteBypassed());
    assert(responder.consecutiveRemoteFailures() == 0);
    assert(responder.respond("fresh question").tier == llm::ReplyTier::REMOTE);

    std::cout << "[PASS] test_model_bypass_lifted_on_recovery" << std::endl;
}

void test_bypass_held_while_completions_fail() {
    HealthSettings settings;
    auto response_settings = responseSettings();
    FakeModel model;
    model.default_status = llm::ModelStatus::TIMEOUT;  // pings still answer
    llm::ResponseEngine responder(response_settings, &model);
    for (int i = 0; i < 3; ++i) {
        responder.respond("question " + std::to_string(i));
    }
    assert(model.calls == 3);

    HealthTargets targets;
    targets.model = &model;
    targets.responder = &responder;
    HealthMonitor monitor(settings, targets);

    assert(monitor.probe().components.at("language_model").state == HealthState::DEGRADED);
    assert(responder.remoteBypassed());
    assert(model.calls == 3);

    // Each later probe spends one trial completion and keeps the bypass while it fails
    for (int i = 0; i < 2; ++i) {
        ComponentHealth lm = monitor.probe().components.at("language_model");
        assert(lm.state == HealthState::DEGRADED);
        assert(lm.detail.find("trial completion timeout") != std::string::npos);
        assert(responder.remoteBypassed());
    }
    assert(model.calls == 5);

    auto reply = responder.respond("hello there");
    assert(reply.tier == llm::ReplyTier::FALLBACK);
    assert(model.calls == 5);

    model.default_status = llm::ModelStatus::OK;
    assert(monitor.probe().components.at("language_model").state == HealthState::OK);
    assert(!responder.remoteBypassed());
    assert(responder.respond("and now?").tier == llm::ReplyTier::REMOTE);

    std::cout << "[PASS] test_bypass_held_while_completions_fail" << std::endl;
}

void test_auth_failure() {
    HealthSettings settings;
    auto response_settings = responseSettings();
    FakeModel model;
    model.ping_status = llm::ModelStatus::AUTH_ERROR;
    llm::ResponseEngine responder(response_settings, &model);

    HealthTargets targets;
    targets.model = &model;
    targets.responder = &responder;
    HealthMonitor monitor(settings, targets);

    assert(monitor.probe().components.at("language_model").state == HealthState::FAILED);
    assert(responder.remoteBypassed());

    std::cout << "[PASS] test_auth_failure" << std::endl;
}

void test_repeated_ping_failures_bypass() {
    HealthSettings settings;
    auto response_settings = responseSettings();
    FakeModel model;
    model.ping_status = llm::ModelStatus::TIMEOUT;
    llm::ResponseEngine responder(response_settings, &model);

    HealthTargets targets;
    targets.model = &model;
    targets.responder = &responder;
    HealthMonitor monitor(settings, targets);

    monitor.probe();
    assert(!responder.remoteBypassed());
    monitor.probe();
    assert(responder.remoteBypassed());

    // Unreachable, not failing: an answered ping is enough to come back
    model.ping_status = llm::ModelStatus::OK;
    assert(monitor.probe().components.at("language_model").state == HealthState::OK);
    assert(!responder.remoteBypassed());
    assert(model.calls == 0);

    std::cout << "[PASS] test_repeated_ping_failures_bypass" << std::endl;
}

void test_memory_reclaim_recovers() {
    HealthSettings settings;
    auto response_settings = responseSettings();
    llm::ResponseEngine responder(response_settings, nullptr);
    FakeMemoryProbe memory;
    memory.readings = {megabytes(300), megabytes(200)};
    core::EngineStats stats;

    HealthTargets targets;
    targets.responder = &responder;
    targets.memory = &memory;
    targets.stats = &stats;
    HealthMonitor monitor(settings, targets);

    HealthStatus status = monitor.probe();
    assert(status.components.at("memory").state == HealthState::OK);
    assert(!status.memory_ceiling_exceeded);
    assert(memory.reclaims == 1);
    assert(!responder.capacitiesReduced());
    assert(stats.snapshot().memory_reclaims == 1);

    MemoryReport report = monitor.memoryReport();
    assert(report.reclaims == 1);
    assert(report.capacity_reductions == 0);
    assert(report.measurements == 2);
    assert(report.peak_mb > 299.0 && report.peak_mb < 301.0);

    std::cout << "[PASS] test_memory_reclaim_recovers" << std::endl;
}

void test_memory_ceiling_shrinks_then_restores() {
    HealthSettings settings;
    auto response_settings = responseSettings();
    llm::ResponseEngine responder(response_settings, nullptr);
    FakeMemoryProbe memory;
    memory.readings = {megabytes(400)};

    HealthTargets targets;
    targets.responder = &responder;
    targets.memory = &memory;
    HealthMonitor monitor(settings, targets);

    HealthStatus status = monitor.probe();
    assert(status.memory_ceiling_exceeded);
    assert(status.components.at("memory").state == HealthState::DEGRADED);
    assert(responder.capacitiesReduced());
    assert(responder.cache().capacity() == 25);
    assert(monitor.memoryReport().capacity_reductions == 1);

    // Between the ceiling and the restore mark: keep the reduced sizes
    memory.readings = {megabytes(220)};
    assert(!monitor.probe().memory_ceiling_exceeded);
    assert(responder.capacitiesReduced());

    memory.readings = {megabytes(100)};
    monitor.probe();
    assert(!responder.capacitiesReduced());
    assert(responder.cache().capacity() == 50);

    std::cout << "[PASS] test_memory_ceiling_shrinks_then_restores" << std::endl;
}

void test_background_probing() {
    HealthSettings settings;
    settings.probe_interval = 20ms;
    core::EngineStats stats;
    HealthTargets targets;
    targets.stats = &stats;
    HealthMonitor monitor(settings, targets);

    assert(monitor.start());
    assert(!monitor.start());
    assert(monitor.isRunning());
    std::this_thread::sleep_for(150ms);
    monitor.stop();
    assert(!monitor.isRunning());

    auto probes = stats.snapshot().health_probes;
    assert(probes >= 2);
    std::this_thread::sleep_for(50ms);
    assert(stats.snapshot().health_probes == probes);

    std::cout << "[PASS] test_background_probing (" << probes << " probes)" << std::endl;
}

int main() {
    std::cout << "=== HealthMonitor Tests ===" << std::endl;

    test_all_healthy();
    test_missing_device_requests_recalibration();
    test_device_in_use_not_reported_missing();
    test_new_device_in_text_mode();
    test_text_mode_reported();
    test_model_bypass_lifted_on_recovery();
    test_bypass_held_while_completions_fail();
    test_auth_failure();
    test_repeated_ping_failures_bypass();
    test_memory_reclaim_recovers();
    test_memory_ceiling_shrinks_then_restores();
    test_background_probing();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
