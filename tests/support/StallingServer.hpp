/**
 * StallingServer.hpp - Local HTTP server whose POST handlers hang until released
 *
 * Stands in for a language model or TTS server that accepted the request and
 * then stopped answering. GETs answer 200 at once so health checks pass.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include <httplib.h>

namespace gideon::testing {

class StallingServer {
public:
    /**
     * @param path  POST path that stalls
     * @param body  sent once released, or after `stall` at the latest
     */
    StallingServer(const std::string& path, std::string body, std::string content_type,
                   std::chrono::milliseconds stall = std::chrono::seconds(10))
        : body_(std::move(body))
        , content_type_(std::move(content_type))
        , stall_(stall) {
        server_.Get(".*", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("{}", "application/json");
        });
        server_.Post(path, [this](const httplib::Request&, httplib::Response& res) {
            requests_++;
            auto until = std::chrono::steady_clock::now() + stall_;
            while (!released_ && std::chrono::steady_clock::now() < until) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            res.set_content(body_, content_type_.c_str());
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        if (port_ <= 0) {
            return;
        }
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~StallingServer() {
        released_ = true;
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    StallingServer(const StallingServer&) = delete;
    StallingServer& operator=(const StallingServer&) = delete;

    bool isRunning() const { return port_ > 0 && server_.is_running(); }
    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }
    int requests() const { return requests_.load(); }

private:
    httplib::Server server_;
    std::string body_;
    std::string content_type_;
    std::chrono::milliseconds stall_;
    std::atomic<bool> released_{false};
    std::atomic<int> requests_{0};
    int port_ = -1;
    std::thread thread_;
};

} // namespace gideon::testing
