/**
 * test_response_cache.cpp - Fingerprinted LRU cache
 */

#include "gideon/llm/ResponseCache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using gideon::llm::ResponseCache;
using namespace std::chrono_literals;

void test_fingerprint() {
    assert(ResponseCache::fingerprint("  What   TIME is\tit ") == "what time is it");
    assert(ResponseCache::fingerprint("What time is it") == ResponseCache::fingerprint("what  time is it"));
    assert(ResponseCache::fingerprint(" \n ").empty());

    std::cout << "[PASS] test_fingerprint" << std::endl;
}

void test_hit_and_miss() {
    ResponseCache cache(50, std::chrono::hours(1));
    assert(!cache.lookup("hello").has_value());

    cache.insert("Hello", "Hi!");
    auto hit = cache.lookup("  hello ");
    assert(hit && *hit == "Hi!");
    assert(cache.hits() == 1);
    assert(cache.misses() == 1);

    cache.insert("hello", "Hey!");  // refresh, not a new entry
    assert(cache.size() == 1);
    assert(*cache.lookup("hello") == "Hey!");

    cache.insert("   ", "ignored");
    assert(cache.size() == 1);

    std::cout << "[PASS] test_hit_and_miss" << std::endl;
}

void test_lru_eviction() {
    ResponseCache cache(50, std::chrono::hours(1));
    for (int i = 0; i < 50; ++i) {
        cache.insert("question " + std::to_string(i), "answer " + std::to_string(i));
    }
    assert(cache.size() == 50);

    // Touch the oldest so question 1 becomes the eviction candidate
    assert(cache.lookup("question 0").has_value());

    cache.insert("question 50", "answer 50");
    assert(cache.size() == 50);
    assert(!cache.contains("question 1"));
    assert(!cache.lookup("question 1").has_value());
    assert(cache.contains("question 0"));
    assert(cache.contains("question 50"));

    std::cout << "[PASS] test_lru_eviction" << std::endl;
}

void test_ttl_expiry() {
    ResponseCache cache(10, 30ms);
    cache.insert("weather", "Sunny");
    assert(cache.contains("weather"));

    std::this_thread::sleep_for(60ms);
    assert(!cache.contains("weather"));
    assert(!cache.lookup("weather").has_value());
    assert(cache.size() == 0);  // dropped on lookup

    cache.insert("a", "1");
    cache.insert("b", "2");
    std::this_thread::sleep_for(60ms);
    assert(cache.purgeExpired() == 2);
    assert(cache.size() == 0);

    ResponseCache forever(10, 0ms);
    forever.insert("a", "1");
    std::this_thread::sleep_for(5ms);
    assert(forever.contains("a"));
    assert(forever.purgeExpired() == 0);

    std::cout << "[PASS] test_ttl_expiry" << std::endl;
}

void test_set_capacity() {
    ResponseCache cache(10, std::chrono::hours(1));
    for (int i = 0; i < 10; ++i) {
        cache.insert("q" + std::to_string(i), "a");
    }
    cache.setCapacity(4);
    assert(cache.capacity() == 4);
    assert(cache.size() == 4);
    assert(cache.contains("q9"));
    assert(!cache.contains("q5"));

    cache.setCapacity(0);
    assert(cache.capacity() == 1);

    cache.clear();
    assert(cache.size() == 0);

    std::cout << "[PASS] test_set_capacity" << std::endl;
}

int main() {
    std::cout << "=== ResponseCache Tests ===" << std::endl;

    test_fingerprint();
    test_hit_and_miss();
    test_lru_eviction();
    test_ttl_expiry();
    test_set_capacity();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
