/**
 * LanguageModel.hpp - Remote chat model and conversation log interfaces
 */

#pragma once

#include "gideon/Types.hpp"
#include "gideon/core/CancellationToken.hpp"

#include <string>
#include <vector>

namespace gideon::llm {

enum class ModelStatus {
    OK,
    TIMEOUT,
    NETWORK_ERROR,
    AUTH_ERROR,
    SERVER_ERROR,
    BAD_RESPONSE,
    NOT_CONFIGURED,
    CANCELLED
};

const char* toString(ModelStatus status);

/**
 * Worth retrying: the same request may succeed a moment later.
 * Authentication and configuration errors never are.
 */
bool isTransient(ModelStatus status);

struct ModelReply {
    ModelStatus status = ModelStatus::NOT_CONFIGURED;
    std::string text;
    int http_status = 0;
    std::string error;

    bool ok() const { return status == ModelStatus::OK && !text.empty(); }
};

class LanguageModel {
public:
    virtual ~LanguageModel() = default;

    // false when no credential or endpoint is available
    virtual bool isConfigured() const = 0;

    /**
     * One chat completion. Returns within the client's own timeout, or
     * CANCELLED soon after `token` is cancelled (token may be nullptr).
     */
    virtual ModelReply complete(const std::string& prompt,
                                const std::vector<ConversationTurn>& context,
                                const core::CancellationToken* token) = 0;

    // Lightweight reachability check used by the health monitor
    virtual ModelStatus ping() = 0;
};

/**
 * Write-only sink for finished turns. Failures stay inside the store.
 */
class ConversationLog {
public:
    virtual ~ConversationLog() = default;
    virtual void appendTurn(const ConversationTurn& turn) = 0;
};

} // namespace gideon::llm
