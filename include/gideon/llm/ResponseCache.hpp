/**
 * ResponseCache.hpp - LRU cache of generated replies keyed by input fingerprint
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace gideon::llm {

struct CachedResponse {
    std::string reply;
    std::chrono::steady_clock::time_point created_at;
};

class ResponseCache {
public:
    /**
     * @param capacity  maximum entries (at least 1)
     * @param ttl       entry lifetime; zero means entries never expire
     */
    ResponseCache(std::size_t capacity, std::chrono::milliseconds ttl);

    // Lowercase, collapse whitespace, trim
    static std::string fingerprint(const std::string& text);

    /**
     * Fresh reply for `text`, marking it most recently used.
     * Expired entries are dropped and reported as a miss.
     */
    std::optional<std::string> lookup(const std::string& text);

    // Inserts or refreshes; evicts the least recently used entry when full
    void insert(const std::string& text, const std::string& reply);

    bool contains(const std::string& text) const;

    // @return number of entries removed
    std::size_t purgeExpired();

    void setCapacity(std::size_t capacity);
    std::size_t capacity() const;
    std::size_t size() const;
    void clear();

    std::uint64_t hits() const;
    std::uint64_t misses() const;

private:
    using Entry = std::pair<std::string, CachedResponse>;

    bool expiredLocked(const CachedResponse& entry, std::chrono::steady_clock::time_point now) const;
    void evictLocked();

    mutable std::mutex mutex_;
    std::list<Entry> lru_;  // front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    std::size_t capacity_;
    std::chrono::milliseconds ttl_;
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
};

} // namespace gideon::llm
