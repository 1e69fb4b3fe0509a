/**
 * test_fallback.cpp - Offline reply classification and pools
 */

#include "gideon/llm/FallbackResponder.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

using namespace gideon::llm;

namespace {

bool inPool(ReplyCategory category, const std::string& reply) {
    const auto& pool = replyPool(category);
    return std::find(pool.begin(), pool.end(), reply) != pool.end();
}

} // anonymous namespace

void test_classify() {
    assert(classify("hello") == ReplyCategory::GREETING);
    assert(classify("Hi there!") == ReplyCategory::GREETING);
    assert(classify("good morning") == ReplyCategory::GREETING);
    assert(classify("goodbye gideon") == ReplyCategory::FAREWELL);
    assert(classify("thank you so much") == ReplyCategory::THANKS);
    assert(classify("what time is it") == ReplyCategory::TIME);
    assert(classify("what day is it") == ReplyCategory::DATE);
    assert(classify("will it rain tomorrow") == ReplyCategory::WEATHER);
    assert(classify("who are you") == ReplyCategory::IDENTITY);
    assert(classify("help me out") == ReplyCategory::HELP);
    assert(classify("tell me a joke") == ReplyCategory::UNKNOWN);

    std::cout << "[PASS] test_classify" << std::endl;
}

void test_classify_edges() {
    assert(classify("") == ReplyCategory::ERROR);
    assert(classify("?!") == ReplyCategory::ERROR);

    // Rule order: time beats greeting
    assert(classify("hi, what time is it?") == ReplyCategory::TIME);

    // Whole tokens only: "history" is not "hi"
    assert(classify("history of rome") == ReplyCategory::UNKNOWN);

    std::cout << "[PASS] test_classify_edges" << std::endl;
}

void test_every_category_has_replies() {
    for (auto category : {ReplyCategory::GREETING, ReplyCategory::TIME, ReplyCategory::DATE,
                          ReplyCategory::WEATHER, ReplyCategory::FAREWELL, ReplyCategory::THANKS,
                          ReplyCategory::IDENTITY, ReplyCategory::HELP, ReplyCategory::UNKNOWN,
                          ReplyCategory::ERROR}) {
        assert(!replyPool(category).empty());
        assert(std::string(toString(category)) != "");
    }

    std::cout << "[PASS] test_every_category_has_replies" << std::endl;
}

void test_reply_from_pool() {
    FallbackResponder responder(42);

    assert(inPool(ReplyCategory::GREETING, responder.reply("hello")));
    assert(inPool(ReplyCategory::UNKNOWN, responder.reply("explain quantum physics")));
    assert(inPool(ReplyCategory::ERROR, responder.reply("   ")));

    std::cout << "[PASS] test_reply_from_pool" << std::endl;
}

void test_time_and_date_rendered() {
    FallbackResponder responder(7);

    std::string time_reply = responder.reply("what time is it");
    assert(time_reply.find("{time}") == std::string::npos);
    assert(time_reply.find(':') != std::string::npos);

    std::string date_reply = responder.replyFor(ReplyCategory::DATE);
    assert(date_reply.find("{date}") == std::string::npos);
    assert(date_reply.find(", ") != std::string::npos);

    assert(FallbackResponder::render("plain") == "plain");

    std::cout << "[PASS] test_time_and_date_rendered" << std::endl;
}

void test_no_immediate_repeat() {
    FallbackResponder responder(1234);
    std::string previous = responder.replyFor(ReplyCategory::GREETING);
    for (int i = 0; i < 50; ++i) {
        std::string next = responder.replyFor(ReplyCategory::GREETING);
        assert(next != previous);
        previous = next;
    }

    std::cout << "[PASS] test_no_immediate_repeat" << std::endl;
}

void test_seed_is_deterministic() {
    FallbackResponder a(99);
    FallbackResponder b(99);
    for (int i = 0; i < 10; ++i) {
        assert(a.replyFor(ReplyCategory::FAREWELL) == b.replyFor(ReplyCategory::FAREWELL));
    }

    std::cout << "[PASS] test_seed_is_deterministic" << std::endl;
}

int main() {
    std::cout << "=== FallbackResponder Tests ===" << std::endl;

    test_classify();
    test_classify_edges();
    test_every_category_has_replies();
    test_reply_from_pool();
    test_time_and_date_rendered();
    test_no_immediate_repeat();
    test_seed_is_deterministic();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
