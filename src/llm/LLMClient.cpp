/**
 * LLMClient.cpp - HTTP client for OpenAI-compatible chat servers
 *
 * Works against api.openai.com behind a proxy or a local llama.cpp /
 * Ollama server exposing /v1/chat/completions.
 */

#include "gideon/llm/LLMClient.hpp"
#include "gideon/core/RequestWatchdog.hpp"

#include <iostream>
#include <mutex>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gideon::llm {

namespace {

void setTimeouts(httplib::Client& client, std::chrono::milliseconds timeout) {
    const auto sec = static_cast<time_t>(timeout.count() / 1000);
    const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);
}

ModelStatus statusForError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Read:
        case httplib::Error::Write:
            return ModelStatus::TIMEOUT;
        default:
            return ModelStatus::NETWORK_ERROR;
    }
}

} // anonymous namespace

struct LLMClient::Impl {
    const LanguageModelSettings& settings;
    std::unique_ptr<httplib::Client> client;
    std::unique_ptr<httplib::Client> pinger;
    // httplib::Client is not safe for concurrent use
    std::mutex mutex;
    std::mutex ping_mutex;

    Impl(const LanguageModelSettings& s) : settings(s) {
        client = std::make_unique<httplib::Client>(settings.base_url);
        setTimeouts(*client, settings.timeout);

        pinger = std::make_unique<httplib::Client>(settings.base_url);
        setTimeouts(*pinger, settings.ping_timeout);

        if (!settings.api_key.empty()) {
            client->set_bearer_token_auth(settings.api_key);
            pinger->set_bearer_token_auth(settings.api_key);
        }
    }
};

LLMClient::LLMClient(const LanguageModelSettings& settings)
    : impl_(std::make_unique<Impl>(settings)) {
    std::cout << "[LLMClient] " << settings.model << " at " << settings.base_url
              << (settings.api_key.empty() ? " (no API key)" : "") << std::endl;
}

LLMClient::~LLMClient() = default;

bool LLMClient::isConfigured() const {
    if (impl_->settings.base_url.empty()) {
        return false;
    }
    return !impl_->settings.require_api_key || !impl_->settings.api_key.empty();
}

std::string LLMClient::buildRequest(const std::string& prompt,
                                    const std::vector<ConversationTurn>& context) const {
    json messages = json::array();
    messages.push_back({{"role", "system"}, {"content", impl_->settings.system_prompt}});
    for (const auto& turn : context) {
        messages.push_back({{"role", "user"}, {"content", turn.user_text}});
        messages.push_back({{"role", "assistant"}, {"content", turn.assistant_text}});
    }
    messages.push_back({{"role", "user"}, {"content", prompt}});

    json req_json = {
        {"model", impl_->settings.model},
        {"messages", messages},
        {"max_tokens", impl_->settings.max_tokens},
        {"temperature", impl_->settings.temperature},
        {"stream", false}
    };
    return req_json.dump();
}

ModelStatus LLMClient::statusForHttp(int http_status) {
    if (http_status >= 200 && http_status < 300) return ModelStatus::OK;
    if (http_status == 401 || http_status == 403) return ModelStatus::AUTH_ERROR;
    if (http_status == 408 || http_status == 429) return ModelStatus::SERVER_ERROR;
    if (http_status >= 500) return ModelStatus::SERVER_ERROR;
    return ModelStatus::BAD_RESPONSE;
}

ModelReply LLMClient::parseResponse(const std::string& body) {
    ModelReply reply;
    try {
        json res_json = json::parse(body);
        const auto& choices = res_json.at("choices");
        if (!choices.is_array() || choices.empty()) {
            reply.status = ModelStatus::BAD_RESPONSE;
            reply.error = "no choices";
            return reply;
        }
        reply.text = choices.at(0).at("message").value("content", "");
        auto first = reply.text.find_first_not_of(" \t\r\n");
        auto last = reply.text.find_last_not_of(" \t\r\n");
        reply.text = (first == std::string::npos) ? "" : reply.text.substr(first, last - first + 1);
        reply.status = reply.text.empty() ? ModelStatus::BAD_RESPONSE : ModelStatus::OK;
        if (reply.text.empty()) {
            reply.error = "empty content";
        }
    } catch (const std::exception& e) {
        std::cerr << "[LLMClient] JSON parse error: " << e.what() << std::endl;
        reply.status = ModelStatus::BAD_RESPONSE;
        reply.error = e.what();
    }
    return reply;
}

ModelReply LLMClient::complete(const std::string& prompt,
                               const std::vector<ConversationTurn>& context,
                               const core::CancellationToken* token) {
    ModelReply reply;
    if (!isConfigured()) {
        reply.status = ModelStatus::NOT_CONFIGURED;
        return reply;
    }

    std::string body = buildRequest(prompt, context);

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (core::isCancelled(token)) {
        reply.status = ModelStatus::CANCELLED;
        return reply;
    }

    // Connect, write and read each get the full timeout; the watchdog bounds their sum
    auto deadline = std::chrono::steady_clock::now() + impl_->settings.timeout;
    core::RequestWatchdog watchdog(token, deadline, [this]() { impl_->client->stop(); });
    auto res = impl_->client->Post(impl_->settings.chat_path, body, "application/json");
    const bool aborted = watchdog.disarm();

    if (aborted && core::isCancelled(token)) {
        reply.status = ModelStatus::CANCELLED;
        reply.error = "cancelled";
        return reply;
    }
    if (aborted && !res) {
        reply.status = ModelStatus::TIMEOUT;
        reply.error = "no reply within " + std::to_string(impl_->settings.timeout.count()) + " ms";
        std::cerr << "[LLMClient] Request failed: " << reply.error << std::endl;
        return reply;
    }

    if (!res) {
        reply.status = statusForError(res.error());
        reply.error = httplib::to_string(res.error());
        std::cerr << "[LLMClient] Request failed: " << reply.error << std::endl;
        return reply;
    }

    reply.http_status = res->status;
    ModelStatus http = statusForHttp(res->status);
    if (http != ModelStatus::OK) {
        std::cerr << "[LLMClient] Request failed: HTTP " << res->status << std::endl;
        reply.status = http;
        reply.error = "HTTP " + std::to_string(res->status);
        return reply;
    }

    ModelReply parsed = parseResponse(res->body);
    parsed.http_status = res->status;
    return parsed;
}

ModelStatus LLMClient::ping() {
    if (!isConfigured()) {
        return ModelStatus::NOT_CONFIGURED;
    }

    std::lock_guard<std::mutex> lock(impl_->ping_mutex);
    auto res = impl_->pinger->Get(impl_->settings.health_path);
    if (!res) {
        return statusForError(res.error());
    }
    return statusForHttp(res->status);
}

} // namespace gideon::llm
