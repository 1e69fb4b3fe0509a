/**
 * Assistant.hpp - Builds the concrete engine and runs it
 *
 * Owns every adapter (PortAudio, fvad, whisper, HTTP model and TTS clients,
 * conversation log, status feed) and wires them into the VoiceLoop and the
 * HealthMonitor.
 */

#pragma once

#include "gideon/Config.hpp"
#include "gideon/Types.hpp"
#include "gideon/VoiceLoop.hpp"
#include "gideon/core/EngineStats.hpp"
#include "gideon/health/HealthMonitor.hpp"

#include <memory>
#include <string>

namespace gideon {

class Assistant {
public:
    explicit Assistant(const EngineConfig& config);
    ~Assistant();

    Assistant(const Assistant&) = delete;
    Assistant& operator=(const Assistant&) = delete;

    /**
     * Construct and connect the components. Missing hardware or models
     * degrade to text mode instead of failing.
     * @return false only if called twice
     */
    bool initialize();

    // Presentation-layer hooks; set before start()
    void setCallbacks(VoiceLoopCallbacks callbacks);

    // Start the voice loop and the health monitor
    bool start();
    void stop();
    bool isRunning() const;

    HealthStatus health() const;
    core::StatsSnapshot stats() const;
    health::MemoryReport memoryReport() const;

    bool recalibrate(const std::string& reason = "manual");
    bool probe();
    bool submitText(const std::string& text);

    VoiceState state() const;
    bool textMode() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gideon
