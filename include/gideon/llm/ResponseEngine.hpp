/**
 * ResponseEngine.hpp - Tiered reply generation: cache, remote model, canned fallback
 *
 * respond() always produces a reply. Remote failures are absorbed here and
 * surface only as a lower tier in the returned Reply.
 */

#pragma once

#include "gideon/Config.hpp"
#include "gideon/core/CancellationToken.hpp"
#include "gideon/core/EngineStats.hpp"
#include "gideon/llm/ConversationMemory.hpp"
#include "gideon/llm/LanguageModel.hpp"
#include "gideon/llm/ResponseCache.hpp"

#include <memory>
#include <string>

namespace gideon::llm {

enum class ReplyTier {
    CACHE,
    REMOTE,
    FALLBACK
};

const char* toString(ReplyTier tier);

struct Reply {
    std::string text;
    ReplyTier tier = ReplyTier::FALLBACK;
};

class ResponseEngine {
public:
    /**
     * @param model  remote chat model; nullptr runs fallback-only
     * @param stats  optional counters
     * @param log    optional write-only turn store
     */
    ResponseEngine(const ResponseSettings& settings,
                   LanguageModel* model,
                   core::EngineStats* stats = nullptr,
                   ConversationLog* log = nullptr);
    ~ResponseEngine();

    ResponseEngine(const ResponseEngine&) = delete;
    ResponseEngine& operator=(const ResponseEngine&) = delete;

    Reply respond(const std::string& text, const core::CancellationToken* token = nullptr);

    // While set, respond() goes straight from the cache to the fallback tier
    void setRemoteBypass(bool bypass);
    bool remoteBypassed() const;

    // Remote calls that failed after exhausting their retry budget, in a row
    int consecutiveRemoteFailures() const;
    void resetRemoteFailures();

    bool remoteConfigured() const;

    // Drop expired cache entries and release container slack
    void releaseUnused();

    /**
     * Halve cache and memory capacities, not below the given minimums.
     * @return true if anything shrank
     */
    bool shrink(std::size_t min_cache, std::size_t min_memory);
    void restoreCapacities();
    bool capacitiesReduced() const;

    ConversationMemory& memory();
    ResponseCache& cache();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gideon::llm
