/**
 * ResponseEngine.cpp - Cache -> remote model -> canned fallback
 */

#include "gideon/llm/ResponseEngine.hpp"
#include "gideon/llm/FallbackResponder.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <thread>

namespace gideon::llm {

const char* toString(ReplyTier tier) {
    switch (tier) {
        case ReplyTier::CACHE:    return "cache";
        case ReplyTier::REMOTE:   return "remote";
        case ReplyTier::FALLBACK: return "fallback";
    }
    return "unknown";
}

struct ResponseEngine::Impl {
    const ResponseSettings& settings;
    LanguageModel* model;
    core::EngineStats* stats;
    ConversationLog* log;

    ConversationMemory memory;
    ResponseCache cache;
    FallbackResponder fallback;

    std::atomic<bool> bypass{false};
    std::atomic<int> remote_failures{0};
    std::atomic<bool> reduced{false};

    Impl(const ResponseSettings& s, LanguageModel* m, core::EngineStats* st, ConversationLog* l)
        : settings(s)
        , model(m)
        , stats(st)
        , log(l)
        , memory(s.memory_capacity)
        , cache(s.cache_capacity, s.cache_ttl)
        , fallback(s.fallback_seed) {
    }

    bool backoff(const core::CancellationToken* token) {
        if (token) {
            return token->waitFor(settings.retry_backoff);
        }
        std::this_thread::sleep_for(settings.retry_backoff);
        return true;
    }

    // One remote exchange including its retry budget
    std::optional<std::string> callRemote(const std::string& text, const core::CancellationToken* token) {
        auto context = memory.recent(settings.context_turns);
        int attempts = 1 + std::max(settings.max_retries, 0);

        for (int attempt = 1; attempt <= attempts; ++attempt) {
            if (core::isCancelled(token)) {
                return std::nullopt;
            }

            ModelReply reply = model->complete(text, context, token);
            if (stats) stats->recordRemoteCall(reply.ok());

            if (reply.ok()) {
                return reply.text;
            }

            std::cerr << "[ResponseEngine] Remote attempt " << attempt << "/" << attempts
                      << " failed: " << toString(reply.status)
                      << (reply.error.empty() ? "" : " (" + reply.error + ")") << std::endl;

            if (!isTransient(reply.status) || attempt == attempts) {
                break;
            }
            if (!backoff(token)) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    void remember(const std::string& user_text, const std::string& reply) {
        ConversationTurn turn{user_text, reply, SystemClock::now()};
        memory.append(turn);
        if (log) {
            log->appendTurn(turn);
        }
    }
};

ResponseEngine::ResponseEngine(const ResponseSettings& settings,
                               LanguageModel* model,
                               core::EngineStats* stats,
                               ConversationLog* log)
    : impl_(std::make_unique<Impl>(settings, model, stats, log)) {
    std::cout << "[ResponseEngine] Remote model "
              << (remoteConfigured() ? "configured" : "not configured, fallback only") << std::endl;
}

ResponseEngine::~ResponseEngine() = default;

Reply ResponseEngine::respond(const std::string& text, const core::CancellationToken* token) {
    Reply result;
    const bool cacheable = !ResponseCache::fingerprint(text).empty();

    // Tier 1: cache
    if (cacheable) {
        auto cached = impl_->cache.lookup(text);
        if (impl_->stats) impl_->stats->recordCacheLookup(cached.has_value());
        if (cached) {
            result.text = *cached;
            result.tier = ReplyTier::CACHE;
            impl_->remember(text, result.text);
            return result;
        }
    }

    // Tier 2: remote model
    if (cacheable && remoteConfigured() && !impl_->bypass.load()) {
        auto remote = impl_->callRemote(text, token);
        if (remote) {
            impl_->remote_failures = 0;
            impl_->cache.insert(text, *remote);
            result.text = *remote;
            result.tier = ReplyTier::REMOTE;
            impl_->remember(text, result.text);
            return result;
        }
        if (!core::isCancelled(token)) {
            int failures = ++impl_->remote_failures;
            std::cerr << "[ResponseEngine] Remote model unavailable (" << failures
                      << " consecutive failures), using fallback" << std::endl;
        }
    }

    // Tier 3: canned reply, never cached
    result.text = impl_->fallback.reply(text);
    result.tier = ReplyTier::FALLBACK;
    if (impl_->stats) impl_->stats->recordFallback();
    impl_->remember(text, result.text);
    return result;
}

void ResponseEngine::setRemoteBypass(bool bypass) {
    bool was = impl_->bypass.exchange(bypass);
    if (was != bypass) {
        std::cout << "[ResponseEngine] Remote model "
                  << (bypass ? "bypassed, answering from fallback" : "restored") << std::endl;
    }
}

bool ResponseEngine::remoteBypassed() const {
    return impl_->bypass.load();
}

int ResponseEngine::consecutiveRemoteFailures() const {
    return impl_->remote_failures.load();
}

void ResponseEngine::resetRemoteFailures() {
    impl_->remote_failures = 0;
}

bool ResponseEngine::remoteConfigured() const {
    return impl_->model != nullptr && impl_->model->isConfigured();
}

void ResponseEngine::releaseUnused() {
    std::size_t purged = impl_->cache.purgeExpired();
    impl_->memory.shrinkToFit();
    if (purged > 0) {
        std::cout << "[ResponseEngine] Purged " << purged << " expired cache entries" << std::endl;
    }
}

bool ResponseEngine::shrink(std::size_t min_cache, std::size_t min_memory) {
    std::size_t cache_cap = impl_->cache.capacity();
    std::size_t memory_cap = impl_->memory.capacity();
    std::size_t new_cache = std::max(cache_cap / 2, std::max<std::size_t>(min_cache, 1));
    std::size_t new_memory = std::max(memory_cap / 2, std::max<std::size_t>(min_memory, 1));

    bool changed = false;
    if (new_cache < cache_cap) {
        impl_->cache.setCapacity(new_cache);
        changed = true;
    }
    if (new_memory < memory_cap) {
        impl_->memory.setCapacity(new_memory);
        changed = true;
    }
    if (changed) {
        impl_->reduced = true;
        std::cout << "[ResponseEngine] Capacities reduced: cache " << cache_cap << " -> " << new_cache
                  << ", memory " << memory_cap << " -> " << new_memory << std::endl;
    }
    return changed;
}

void ResponseEngine::restoreCapacities() {
    if (!impl_->reduced.exchange(false)) {
        return;
    }
    impl_->cache.setCapacity(impl_->settings.cache_capacity);
    impl_->memory.setCapacity(impl_->settings.memory_capacity);
    std::cout << "[ResponseEngine] Capacities restored" << std::endl;
}

bool ResponseEngine::capacitiesReduced() const {
    return impl_->reduced.load();
}

ConversationMemory& ResponseEngine::memory() {
    return impl_->memory;
}

ResponseCache& ResponseEngine::cache() {
    return impl_->cache;
}

} // namespace gideon::llm
