/**
 * HealthMonitor.hpp - Periodic probes and local corrective actions
 *
 * Never fails the process: every action (recalibration request, cache
 * shrink, remote bypass) is reversible and applied through the owning
 * component's own API.
 */

#pragma once

#include "gideon/Config.hpp"
#include "gideon/Types.hpp"
#include "gideon/audio/AudioCalibrator.hpp"
#include "gideon/audio/Interfaces.hpp"
#include "gideon/core/EngineStats.hpp"
#include "gideon/llm/LanguageModel.hpp"
#include "gideon/llm/ResponseEngine.hpp"
#include "gideon/stt/Transcriber.hpp"
#include "gideon/tts/SpeechSink.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace gideon::health {

class MemoryProbe {
public:
    virtual ~MemoryProbe() = default;

    // nullopt if the footprint cannot be read
    virtual std::optional<std::size_t> residentBytes() = 0;

    // Return freed heap pages to the OS
    virtual void reclaim() = 0;
};

/**
 * Resident set size from /proc/self/statm; reclaim() is malloc_trim(0).
 */
class ProcessMemoryProbe : public MemoryProbe {
public:
    std::optional<std::size_t> residentBytes() override;
    void reclaim() override;
};

struct MemoryReport {
    double current_mb = 0.0;
    double peak_mb = 0.0;
    double average_mb = 0.0;
    std::uint64_t measurements = 0;
    std::uint64_t reclaims = 0;
    std::uint64_t capacity_reductions = 0;
};

/**
 * Components to probe. Null entries are reported as FAILED or skipped.
 */
struct HealthTargets {
    audio::AudioCalibrator* calibrator = nullptr;
    audio::DeviceProbe* devices = nullptr;
    llm::LanguageModel* model = nullptr;
    llm::ResponseEngine* responder = nullptr;
    stt::Transcriber* transcriber = nullptr;
    tts::SpeechSink* speech = nullptr;
    MemoryProbe* memory = nullptr;
    core::EngineStats* stats = nullptr;
};

struct HealthActions {
    std::function<void(const std::string&)> requestRecalibration;
    std::function<void(const HealthStatus&)> onStatus;
};

class HealthMonitor {
public:
    HealthMonitor(const HealthSettings& settings, HealthTargets targets, HealthActions actions = {});
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // Run every check once and apply corrective actions
    HealthStatus probe();

    // Last status written by probe()
    HealthStatus snapshot() const;

    // probe() every probe_interval on a background thread
    bool start();
    void stop();
    bool isRunning() const;

    MemoryReport memoryReport() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gideon::health
