/**
 * StatusPublisher.hpp - Health and statistics feed over shared memory
 *
 * The overlay process polls a named segment holding the latest JSON
 * snapshot. Segment layout: StatusHeader followed by `length` bytes.
 */

#pragma once

#include "gideon/Types.hpp"
#include "gideon/core/EngineStats.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace gideon::ipc {

constexpr std::size_t STATUS_SEGMENT_SIZE = 64 * 1024;

std::string statusToJson(const HealthStatus& status, const core::StatsSnapshot& stats);

class StatusPublisher {
public:
    explicit StatusPublisher(const std::string& name, std::size_t size = STATUS_SEGMENT_SIZE);
    ~StatusPublisher();  // removes the segment

    StatusPublisher(const StatusPublisher&) = delete;
    StatusPublisher& operator=(const StatusPublisher&) = delete;

    bool isOpen() const;

    /**
     * Replace the published document.
     * @return false if closed or the payload does not fit
     */
    bool publish(const std::string& payload);
    bool publish(const HealthStatus& status, const core::StatsSnapshot& stats);

    std::uint64_t sequence() const;
    const std::string& name() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

struct StatusDocument {
    std::uint64_t sequence = 0;
    std::string payload;
};

class StatusReader {
public:
    explicit StatusReader(const std::string& name);
    ~StatusReader();

    StatusReader(const StatusReader&) = delete;
    StatusReader& operator=(const StatusReader&) = delete;

    // false if no publisher has created the segment
    bool isOpen() const;

    // nullopt until something has been published
    std::optional<StatusDocument> read() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gideon::ipc
