/**
 * LLMClient.hpp - OpenAI-compatible chat completion client over HTTP
 */

#pragma once

#include "gideon/Config.hpp"
#include "gideon/llm/LanguageModel.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gideon::llm {

class LLMClient : public LanguageModel {
public:
    explicit LLMClient(const LanguageModelSettings& settings);
    ~LLMClient() override;

    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    bool isConfigured() const override;

    /**
     * POST {system, context turns..., user} to the chat endpoint.
     * The whole exchange is bounded by settings.timeout; cancelling the
     * token aborts the request in flight.
     */
    ModelReply complete(const std::string& prompt,
                        const std::vector<ConversationTurn>& context,
                        const core::CancellationToken* token) override;

    // GET the health path with the shorter ping timeout
    ModelStatus ping() override;

    // Request body, exposed for tests
    std::string buildRequest(const std::string& prompt,
                             const std::vector<ConversationTurn>& context) const;

    // Pull choices[0].message.content out of a response body
    static ModelReply parseResponse(const std::string& body);

    // HTTP status to ModelStatus
    static ModelStatus statusForHttp(int http_status);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gideon::llm
