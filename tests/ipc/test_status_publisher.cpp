/**
 * test_status_publisher.cpp - Shared-memory status feed
 */

#include "gideon/ipc/StatusPublisher.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <unistd.h>

#include <nlohmann/json.hpp>

using namespace gideon;
using namespace gideon::ipc;
using json = nlohmann::json;

namespace {

std::string segmentName(const std::string& stem) {
    return "gideon_test_" + stem + "_" + std::to_string(::getpid());
}

HealthStatus sampleStatus() {
    HealthStatus status;
    status.probed_at = SystemClock::time_point(std::chrono::milliseconds(1700000000000LL));
    status.text_mode = true;
    status.memory_ceiling_exceeded = false;

    ComponentHealth audio;
    audio.state = HealthState::FAILED;
    audio.detail = "no capture device, text mode";
    audio.last_checked_at = status.probed_at;
    status.components["audio"] = audio;

    ComponentHealth model;
    model.state = HealthState::DEGRADED;
    model.detail = "ping timeout";
    status.components["language_model"] = model;
    return status;
}

} // anonymous namespace

void test_status_json() {
    core::StatsSnapshot stats;
    stats.recognition_attempts = 4;
    stats.recognition_successes = 3;
    stats.recognition_success_rate = 0.75;
    stats.cache_hits = 2;

    json doc = json::parse(statusToJson(sampleStatus(), stats));
    assert(doc["probed_at"] == 1700000000000LL);
    assert(doc["text_mode"] == true);
    assert(doc["memory_ceiling_exceeded"] == false);
    assert(doc["components"]["audio"]["state"] == "FAILED");
    assert(doc["components"]["audio"]["detail"] == "no capture device, text mode");
    assert(doc["components"]["language_model"]["state"] == "DEGRADED");
    assert(doc["stats"]["recognition_attempts"] == 4);
    assert(doc["stats"]["recognition_success_rate"] == 0.75);
    assert(doc["stats"]["cache_hits"] == 2);

    std::cout << "[PASS] test_status_json" << std::endl;
}

void test_publish_and_read() {
    std::string name = segmentName("feed");
    StatusPublisher publisher(name);
    if (!publisher.isOpen()) {
        std::cout << "[SKIP] test_publish_and_read - shared memory unavailable" << std::endl;
        return;
    }
    assert(publisher.name() == name);
    assert(publisher.sequence() == 0);

    StatusReader reader(name);
    assert(reader.isOpen());
    assert(!reader.read().has_value());

    assert(publisher.publish(std::string(R"({"hello":1})")));
    auto first = reader.read();
    assert(first.has_value());
    assert(first->sequence == 1);
    assert(first->payload == R"({"hello":1})");

    core::StatsSnapshot stats;
    assert(publisher.publish(sampleStatus(), stats));
    auto second = reader.read();
    assert(second.has_value());
    assert(second->sequence == 2);
    assert(publisher.sequence() == 2);
    json doc = json::parse(second->payload);
    assert(doc["components"].size() == 2);

    std::cout << "[PASS] test_publish_and_read" << std::endl;
}

void test_oversized_payload_rejected() {
    std::string name = segmentName("small");
    StatusPublisher publisher(name, 4096);
    if (!publisher.isOpen()) {
        std::cout << "[SKIP] test_oversized_payload_rejected - shared memory unavailable" << std::endl;
        return;
    }

    assert(publisher.publish(std::string("small")));
    assert(!publisher.publish(std::string(8192, 'x')));

    // The previous document survives
    StatusReader reader(name);
    auto doc = reader.read();
    assert(doc.has_value());
    assert(doc->payload == "small");
    assert(doc->sequence == 1);

    std::cout << "[PASS] test_oversized_payload_rejected" << std::endl;
}

void test_segment_removed_with_publisher() {
    std::string name = segmentName("gone");
    {
        StatusPublisher publisher(name);
        if (!publisher.isOpen()) {
            std::cout << "[SKIP] test_segment_removed_with_publisher - shared memory unavailable" << std::endl;
            return;
        }
        assert(publisher.publish(std::string("{}")));
    }

    StatusReader reader(name);
    assert(!reader.isOpen());
    assert(!reader.read().has_value());

    StatusPublisher tiny(segmentName("tiny"), 4);
    assert(!tiny.isOpen());
    assert(!tiny.publish(std::string("{}")));

    std::cout << "[PASS] test_segment_removed_with_publisher" << std::endl;
}

int main() {
    std::cout << "=== StatusPublisher Tests ===" << std::endl;

    test_status_json();
    test_publish_and_read();
    test_oversized_payload_rejected();
    test_segment_removed_with_publisher();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
