/**
 * ResponseCache.cpp - Fingerprinted LRU with optional TTL
 */

#include "gideon/llm/ResponseCache.hpp"

#include <algorithm>
#include <cctype>

namespace gideon::llm {

ResponseCache::ResponseCache(std::size_t capacity, std::chrono::milliseconds ttl)
    : capacity_(std::max<std::size_t>(capacity, 1))
    , ttl_(ttl) {
}

std::string ResponseCache::fingerprint(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty()) {
            out += ' ';
        }
        pending_space = false;
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

bool ResponseCache::expiredLocked(const CachedResponse& entry,
                                  std::chrono::steady_clock::time_point now) const {
    if (ttl_.count() <= 0) {
        return false;
    }
    return now - entry.created_at >= ttl_;
}

std::optional<std::string> ResponseCache::lookup(const std::string& text) {
    std::string key = fingerprint(text);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) {
        misses_++;
        return std::nullopt;
    }

    if (expiredLocked(it->second->second, std::chrono::steady_clock::now())) {
        lru_.erase(it->second);
        index_.erase(it);
        misses_++;
        return std::nullopt;
    }

    lru_.splice(lru_.begin(), lru_, it->second);
    hits_++;
    return it->second->second.reply;
}

void ResponseCache::insert(const std::string& text, const std::string& reply) {
    std::string key = fingerprint(text);
    if (key.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    CachedResponse value{reply, std::chrono::steady_clock::now()};

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = std::move(value);
        lru_.splice(lru_.begin(), lru_, it->second);
        return;
    }

    lru_.emplace_front(key, std::move(value));
    index_[key] = lru_.begin();
    evictLocked();
}

bool ResponseCache::contains(const std::string& text) const {
    std::string key = fingerprint(text);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    return it != index_.end() && !expiredLocked(it->second->second, std::chrono::steady_clock::now());
}

std::size_t ResponseCache::purgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    std::size_t removed = 0;
    for (auto it = lru_.begin(); it != lru_.end();) {
        if (expiredLocked(it->second, now)) {
            index_.erase(it->first);
            it = lru_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

void ResponseCache::setCapacity(std::size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = std::max<std::size_t>(capacity, 1);
    evictLocked();
}

std::size_t ResponseCache::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

std::size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
}

std::uint64_t ResponseCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::uint64_t ResponseCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

void ResponseCache::evictLocked() {
    while (lru_.size() > capacity_) {
        index_.erase(lru_.back().first);
        lru_.pop_back();
    }
}

} // namespace gideon::llm
