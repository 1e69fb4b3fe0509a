/**
 * StatusPublisher.cpp - boost::interprocess wrapper for the status feed
 */

#include "gideon/ipc/StatusPublisher.hpp"

#include <cstring>
#include <iostream>
#include <new>

#include <boost/interprocess/mapped_region.hpp>
#include <boost/interprocess/shared_memory_object.hpp>
#include <boost/interprocess/sync/interprocess_mutex.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gideon::ipc {

namespace bip = boost::interprocess;

namespace {

struct StatusHeader {
    bip::interprocess_mutex mutex;
    std::uint64_t sequence;
    std::uint32_t length;
};

char* payloadOf(StatusHeader* header) {
    return reinterpret_cast<char*>(header) + sizeof(StatusHeader);
}

std::int64_t epochMs(SystemClock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // anonymous namespace

std::string statusToJson(const HealthStatus& status, const core::StatsSnapshot& stats) {
    json components = json::object();
    for (const auto& [name, health] : status.components) {
        components[name] = {
            {"state", toString(health.state)},
            {"last_checked_at", epochMs(health.last_checked_at)},
            {"detail", health.detail}
        };
    }

    json doc = {
        {"probed_at", epochMs(status.probed_at)},
        {"text_mode", status.text_mode},
        {"memory_ceiling_exceeded", status.memory_ceiling_exceeded},
        {"components", components},
        {"stats", {
            {"recognition_attempts", stats.recognition_attempts},
            {"recognition_successes", stats.recognition_successes},
            {"recognition_success_rate", stats.recognition_success_rate},
            {"wake_word_hits", stats.wake_word_hits},
            {"utterances_discarded", stats.utterances_discarded},
            {"responses", stats.responses},
            {"average_response_latency_ms", stats.average_response_latency_ms},
            {"cache_hits", stats.cache_hits},
            {"cache_misses", stats.cache_misses},
            {"cache_hit_rate", stats.cache_hit_rate},
            {"remote_calls", stats.remote_calls},
            {"remote_failures", stats.remote_failures},
            {"fallback_replies", stats.fallback_replies},
            {"health_probes", stats.health_probes},
            {"memory_reclaims", stats.memory_reclaims}
        }}
    };
    return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

struct StatusPublisher::Impl {
    std::string name;
    bip::shared_memory_object shm;
    bip::mapped_region region;
    StatusHeader* header = nullptr;
    std::uint64_t sequence = 0;
};

StatusPublisher::StatusPublisher(const std::string& name, std::size_t size)
    : impl_(std::make_unique<Impl>()) {
    impl_->name = name;
    if (size <= sizeof(StatusHeader)) {
        std::cerr << "[StatusPublisher] Segment too small: " << size << std::endl;
        return;
    }

    try {
        // A crashed run can leave a stale segment with a locked mutex
        bip::shared_memory_object::remove(name.c_str());
        impl_->shm = bip::shared_memory_object(bip::create_only, name.c_str(), bip::read_write);
        impl_->shm.truncate(static_cast<bip::offset_t>(size));
        impl_->region = bip::mapped_region(impl_->shm, bip::read_write);

        impl_->header = new (impl_->region.get_address()) StatusHeader();
        impl_->header->sequence = 0;
        impl_->header->length = 0;

        std::cout << "[StatusPublisher] Created: " << name
                  << " (" << size / 1024 << " KB)" << std::endl;
    } catch (const bip::interprocess_exception& e) {
        std::cerr << "[StatusPublisher] Error: " << e.what() << std::endl;
        impl_->header = nullptr;
    }
}

StatusPublisher::~StatusPublisher() {
    if (impl_->header) {
        impl_->header->~StatusHeader();
        impl_->header = nullptr;
        bip::shared_memory_object::remove(impl_->name.c_str());
    }
}

bool StatusPublisher::isOpen() const {
    return impl_->header != nullptr;
}

bool StatusPublisher::publish(const std::string& payload) {
    if (!impl_->header) {
        return false;
    }
    const std::size_t room = impl_->region.get_size() - sizeof(StatusHeader);
    if (payload.size() > room) {
        std::cerr << "[StatusPublisher] Snapshot of " << payload.size()
                  << " bytes exceeds segment (" << room << ")" << std::endl;
        return false;
    }

    bip::scoped_lock<bip::interprocess_mutex> lock(impl_->header->mutex);
    std::memcpy(payloadOf(impl_->header), payload.data(), payload.size());
    impl_->header->length = static_cast<std::uint32_t>(payload.size());
    impl_->header->sequence = ++impl_->sequence;
    return true;
}

bool StatusPublisher::publish(const HealthStatus& status, const core::StatsSnapshot& stats) {
    return publish(statusToJson(status, stats));
}

std::uint64_t StatusPublisher::sequence() const {
    return impl_->sequence;
}

const std::string& StatusPublisher::name() const {
    return impl_->name;
}

struct StatusReader::Impl {
    bip::shared_memory_object shm;
    bip::mapped_region region;
    StatusHeader* header = nullptr;
};

StatusReader::StatusReader(const std::string& name)
    : impl_(std::make_unique<Impl>()) {
    try {
        impl_->shm = bip::shared_memory_object(bip::open_only, name.c_str(), bip::read_write);
        impl_->region = bip::mapped_region(impl_->shm, bip::read_write);
        if (impl_->region.get_size() > sizeof(StatusHeader)) {
            impl_->header = static_cast<StatusHeader*>(impl_->region.get_address());
        }
    } catch (const bip::interprocess_exception& e) {
        std::cerr << "[StatusReader] Cannot open " << name << ": " << e.what() << std::endl;
    }
}

StatusReader::~StatusReader() = default;

bool StatusReader::isOpen() const {
    return impl_->header != nullptr;
}

std::optional<StatusDocument> StatusReader::read() const {
    if (!impl_->header) {
        return std::nullopt;
    }
    const std::size_t room = impl_->region.get_size() - sizeof(StatusHeader);

    bip::scoped_lock<bip::interprocess_mutex> lock(impl_->header->mutex);
    if (impl_->header->sequence == 0 || impl_->header->length > room) {
        return std::nullopt;
    }
    StatusDocument doc;
    doc.sequence = impl_->header->sequence;
    doc.payload.assign(payloadOf(impl_->header), impl_->header->length);
    return doc;
}

} // namespace gideon::ipc
