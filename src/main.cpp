/**
 * Gideon Voice Engine - Main Entry Point
 *
 * Wake-word voice assistant with a tiered reply engine
 * (cache, remote language model, canned fallback).
 */

#include "gideon/Assistant.hpp"
#include "gideon/Config.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

namespace {

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --text                 type commands on stdin instead of speaking\n"
              << "  --llm-url <url>        OpenAI-compatible server (GIDEON_LLM_URL)\n"
              << "  --model <name>         chat model name (GIDEON_LLM_MODEL)\n"
              << "  --whisper <path>       whisper ggml model (GIDEON_WHISPER_MODEL)\n"
              << "  --tts-url <url>        TTS server (GIDEON_TTS_URL)\n"
              << "  --wake-threshold <f>   wake word similarity threshold, 0..1\n"
              << "  --log-turns <path>     append turns to a JSON-lines file\n"
              << "  --no-status-shm        do not publish the status segment\n"
              << "  --help                 show this help\n";
}

// 0 to continue, otherwise the exit code
int parseArgs(int argc, char* argv[], gideon::EngineConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "[Gideon] Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return -1;
        } else if (arg == "--text") {
            config.audio.force_text_mode = true;
        } else if (arg == "--no-status-shm") {
            config.health.publish_status = false;
        } else if (arg == "--llm-url") {
            if (!next(value)) return 2;
            config.llm.base_url = value;
        } else if (arg == "--model") {
            if (!next(value)) return 2;
            config.llm.model = value;
        } else if (arg == "--whisper") {
            if (!next(value)) return 2;
            config.speech.whisper_model = value;
        } else if (arg == "--tts-url") {
            if (!next(value)) return 2;
            config.speech.tts_url = value;
        } else if (arg == "--log-turns") {
            if (!next(value)) return 2;
            config.response.conversation_log = value;
        } else if (arg == "--wake-threshold") {
            if (!next(value)) return 2;
            try {
                config.wake.threshold = std::stof(value);
            } catch (const std::exception&) {
                std::cerr << "[Gideon] Not a number: " << value << std::endl;
                return 2;
            }
        } else {
            std::cerr << "[Gideon] Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    gideon::EngineConfig config;
    gideon::applyEnvironment(config);

    int rc = parseArgs(argc, argv, config);
    if (rc != 0) {
        return rc < 0 ? 0 : rc;
    }

    try {
        gideon::validateConfig(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Gideon] Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    std::cout << R"(
    ╔═══════════════════════════════════════════════╗
    ║          GIDEON VOICE ENGINE v0.1.0           ║
    ║   Say "hey Gideon" or type a command below    ║
    ╚═══════════════════════════════════════════════╝
    )" << std::endl;

    gideon::Assistant assistant(config);
    assistant.initialize();

    gideon::VoiceLoopCallbacks callbacks;
    callbacks.onAssistantResponse = [](const std::string& reply) {
        std::cout << "Gideon: " << reply << std::endl;
    };
    callbacks.onError = [](gideon::EngineError error, const std::string& detail) {
        if (error == gideon::EngineError::ShutdownRequested) {
            g_running = false;
            return;
        }
        std::cerr << "[Gideon] " << gideon::toString(error)
                  << (detail.empty() ? "" : ": " + detail) << std::endl;
        if (error == gideon::EngineError::AudioUnavailable) {
            std::cout << "[Gideon] Audio unavailable, type your commands instead" << std::endl;
        }
    };
    assistant.setCallbacks(callbacks);

    if (!assistant.start()) {
        std::cerr << "[Gideon] Failed to start" << std::endl;
        return 1;
    }

    // Typed commands. poll() keeps the reader responsive to shutdown.
    std::thread reader([&assistant]() {
        std::string pending;
        char buf[512];
        while (g_running) {
            pollfd pfd{STDIN_FILENO, POLLIN, 0};
            int ready = poll(&pfd, 1, 100);
            if (ready <= 0) {
                continue;
            }
            ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
            if (n <= 0) {
                std::cout << "[Gideon] stdin closed" << std::endl;
                break;
            }
            pending.append(buf, static_cast<std::size_t>(n));

            std::size_t eol;
            while ((eol = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, eol);
                pending.erase(0, eol + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();

                if (line == "/quit" || line == "/exit") {
                    g_running = false;
                } else if (line == "/recalibrate") {
                    assistant.recalibrate("manual");
                } else if (line == "/probe") {
                    assistant.probe();
                } else if (!line.empty()) {
                    assistant.submitText(line);
                }
            }
        }
    });

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[Gideon] Shutting down..." << std::endl;
    reader.join();
    assistant.stop();

    auto stats = assistant.stats();
    auto memory = assistant.memoryReport();
    std::cout << "[Gideon] Responses: " << stats.responses
              << ", cache hit rate: " << stats.cache_hit_rate
              << ", recognition success rate: " << stats.recognition_success_rate
              << ", peak memory: " << memory.peak_mb << " MB" << std::endl;
    std::cout << "[Gideon] Goodbye!" << std::endl;
    return 0;
}
