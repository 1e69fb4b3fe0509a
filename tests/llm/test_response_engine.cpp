/**
 * test_response_engine.cpp - Cache, remote and fallback tiers
 */

#include "gideon/Config.hpp"
#include "gideon/health/HealthMonitor.hpp"
#include "gideon/llm/FallbackResponder.hpp"
#include "gideon/llm/ResponseEngine.hpp"
#include "support/Fakes.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace gideon;
using namespace gideon::llm;
using gideon::testing::FakeModel;
using gideon::testing::RecordingLog;
using namespace std::chrono_literals;

namespace {

ResponseSettings fastSettings() {
    ResponseSettings settings;
    settings.retry_backoff = 1ms;
    settings.fallback_seed = 17;
    return settings;
}

bool inPool(ReplyCategory category, const std::string& reply) {
    const auto& pool = replyPool(category);
    return std::find(pool.begin(), pool.end(), reply) != pool.end();
}

} // anonymous namespace

void test_remote_then_cache() {
    auto settings = fastSettings();
    FakeModel model;
    core::EngineStats stats;
    RecordingLog log;
    ResponseEngine engine(settings, &model, &stats, &log);

    Reply first = engine.respond("What time is it");
    assert(first.tier == ReplyTier::REMOTE);
    assert(first.text == "It is noon.");

    Reply second = engine.respond("  what   time is IT ");
    assert(second.tier == ReplyTier::CACHE);
    assert(second.text == first.text);
    assert(model.calls == 1);

    assert(engine.memory().size() == 2);
    assert(log.turns.size() == 2);
    assert(log.turns[0].assistant_text == "It is noon.");

    auto s = stats.snapshot();
    assert(s.cache_hits == 1 && s.cache_misses == 1);
    assert(s.remote_calls == 1 && s.remote_failures == 0);

    std::cout << "[PASS] test_remote_then_cache" << std::endl;
}

void test_context_passed_to_model() {
    auto settings = fastSettings();
    settings.context_turns = 2;
    FakeModel model;
    ResponseEngine engine(settings, &model);

    engine.respond("one");
    assert(model.last_context == 0);
    engine.respond("two");
    engine.respond("three");
    engine.respond("four");
    assert(model.last_context == 2);

    std::cout << "[PASS] test_context_passed_to_model" << std::endl;
}

void test_single_retry_on_transient_failure() {
    auto settings = fastSettings();
    FakeModel model;
    model.script = {ModelStatus::TIMEOUT, ModelStatus::OK};
    ResponseEngine engine(settings, &model);

    Reply reply = engine.respond("tell me a story");
    assert(reply.tier == ReplyTier::REMOTE);
    assert(model.calls == 2);
    assert(engine.consecutiveRemoteFailures() == 0);

    std::cout << "[PASS] test_single_retry_on_transient_failure" << std::endl;
}

void test_exhausted_retries_fall_back() {
    auto settings = fastSettings();
    FakeModel model;
    model.default_status = ModelStatus::TIMEOUT;
    core::EngineStats stats;
    ResponseEngine engine(settings, &model, &stats);

    Reply reply = engine.respond("hello");
    assert(reply.tier == ReplyTier::FALLBACK);
    assert(inPool(ReplyCategory::GREETING, reply.text));
    assert(model.calls == 2);  // one try plus one retry
    assert(engine.consecutiveRemoteFailures() == 1);
    assert(!engine.cache().contains("hello"));  // fallback never cached
    assert(engine.memory().size() == 1);

    auto s = stats.snapshot();
    assert(s.remote_failures == 2);
    assert(s.fallback_replies == 1);

    std::cout << "[PASS] test_exhausted_retries_fall_back" << std::endl;
}

void test_auth_error_not_retried() {
    auto settings = fastSettings();
    FakeModel model;
    model.default_status = ModelStatus::AUTH_ERROR;
    ResponseEngine engine(settings, &model);

    Reply reply = engine.respond("what is the capital of peru");
    assert(reply.tier == ReplyTier::FALLBACK);
    assert(model.calls == 1);

    std::cout << "[PASS] test_auth_error_not_retried" << std::endl;
}

void test_unconfigured_model_skipped() {
    auto settings = fastSettings();
    FakeModel model;
    model.configured = false;
    ResponseEngine engine(settings, &model);
    assert(!engine.remoteConfigured());

    assert(engine.respond("hello").tier == ReplyTier::FALLBACK);
    assert(model.calls == 0);

    ResponseEngine no_model(settings, nullptr);
    assert(no_model.respond("thanks").tier == ReplyTier::FALLBACK);

    std::cout << "[PASS] test_unconfigured_model_skipped" << std::endl;
}

void test_empty_input_uses_error_pool() {
    auto settings = fastSettings();
    FakeModel model;
    ResponseEngine engine(settings, &model);

    Reply reply = engine.respond("   ");
    assert(reply.tier == ReplyTier::FALLBACK);
    assert(inPool(ReplyCategory::ERROR, reply.text));
    assert(model.calls == 0);

    std::cout << "[PASS] test_empty_input_uses_error_pool" << std::endl;
}

void test_bypass() {
    auto settings = fastSettings();
    FakeModel model;
    ResponseEngine engine(settings, &model);

    engine.respond("cached question");
    engine.setRemoteBypass(true);
    assert(engine.remoteBypassed());

    // Cache still answers; uncached input goes straight to fallback
    assert(engine.respond("cached question").tier == ReplyTier::CACHE);
    assert(engine.respond("new question").tier == ReplyTier::FALLBACK);
    assert(model.calls == 1);

    engine.setRemoteBypass(false);
    assert(engine.respond("new question").tier == ReplyTier::REMOTE);

    std::cout << "[PASS] test_bypass" << std::endl;
}

void test_cancelled_backoff() {
    auto settings = fastSettings();
    settings.retry_backoff = 5000ms;
    FakeModel model;
    model.default_status = ModelStatus::NETWORK_ERROR;
    ResponseEngine engine(settings, &model);

    core::CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(30ms);
        token.cancel();
    });

    auto started = std::chrono::steady_clock::now();
    Reply reply = engine.respond("slow question", &token);
    canceller.join();

    assert(std::chrono::steady_clock::now() - started < 2000ms);
    assert(reply.tier == ReplyTier::FALLBACK);
    assert(model.calls == 1);
    assert(engine.consecutiveRemoteFailures() == 0);  // cancellation is not a failure

    std::cout << "[PASS] test_cancelled_backoff" << std::endl;
}

void test_shrink_and_restore() {
    auto settings = fastSettings();
    ResponseEngine engine(settings, nullptr);

    assert(engine.shrink(5, 2));
    assert(engine.cache().capacity() == 25);
    assert(engine.memory().capacity() == 5);
    assert(engine.capacitiesReduced());

    engine.shrink(5, 2);
    engine.shrink(5, 2);
    engine.shrink(5, 2);
    assert(engine.cache().capacity() == 5);
    assert(engine.memory().capacity() == 2);
    assert(!engine.shrink(5, 2));

    engine.restoreCapacities();
    assert(!engine.capacitiesReduced());
    assert(engine.cache().capacity() == 50);
    assert(engine.memory().capacity() == 10);

    std::cout << "[PASS] test_shrink_and_restore" << std::endl;
}

void test_offline_scenario() {
    // Three timed-out requests, then the health probe routes around the model
    auto settings = fastSettings();
    settings.max_retries = 0;
    HealthSettings health_settings;
    FakeModel model;
    model.default_status = ModelStatus::TIMEOUT;
    model.ping_status = ModelStatus::TIMEOUT;
    ResponseEngine engine(settings, &model);

    engine.respond("what is the meaning of life");
    engine.respond("who won the game last night");
    engine.respond("how far away is the moon");
    assert(engine.consecutiveRemoteFailures() == 3);
    assert(model.calls == 3);

    health::HealthTargets targets;
    targets.model = &model;
    targets.responder = &engine;
    health::HealthMonitor monitor(health_settings, targets);
    HealthStatus status = monitor.probe();
    assert(status.components.at("language_model").state == HealthState::DEGRADED);
    assert(engine.remoteBypassed());

    Reply reply = engine.respond("hello");
    assert(reply.tier == ReplyTier::FALLBACK);
    assert(inPool(ReplyCategory::GREETING, reply.text));
    assert(model.calls == 3);

    std::cout << "[PASS] test_offline_scenario" << std::endl;
}

int main() {
    std::cout << "=== ResponseEngine Tests ===" << std::endl;

    test_remote_then_cache();
    test_context_passed_to_model();
    test_single_retry_on_transient_failure();
    test_exhausted_retries_fall_back();
    test_auth_error_not_retried();
    test_unconfigured_model_skipped();
    test_empty_input_uses_error_pool();
    test_bypass();
    test_cancelled_backoff();
    test_shrink_and_restore();
    test_offline_scenario();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
