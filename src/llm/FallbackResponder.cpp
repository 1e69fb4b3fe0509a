/**
 * FallbackResponder.cpp - Keyword classifier and reply pools
 */

#include "gideon/llm/FallbackResponder.hpp"
#include "gideon/wakeword/WakeWordMatcher.hpp"

#include <ctime>
#include <iostream>
#include <sstream>
#include <utility>

namespace gideon::llm {

namespace {

struct CategoryRule {
    ReplyCategory category;
    std::vector<std::string> keywords;  // single words match whole tokens, phrases match substrings
};

// Checked in order; first hit wins
const std::vector<CategoryRule>& rules() {
    static const std::vector<CategoryRule> table = {
        {ReplyCategory::FAREWELL, {"goodbye", "bye", "see you", "good night", "later"}},
        {ReplyCategory::THANKS, {"thanks", "thank you", "thx", "appreciate"}},
        {ReplyCategory::TIME, {"time", "clock", "hour"}},
        {ReplyCategory::DATE, {"date", "day", "today", "month", "year"}},
        {ReplyCategory::WEATHER, {"weather", "rain", "sunny", "temperature", "forecast", "cold", "hot"}},
        {ReplyCategory::IDENTITY, {"who are you", "your name", "what are you"}},
        {ReplyCategory::HELP, {"help", "what can you do", "commands"}},
        {ReplyCategory::GREETING, {"hello", "hi", "hey", "greetings", "good morning", "good evening"}},
    };
    return table;
}

bool hasKeyword(const std::string& normalized, const std::vector<std::string>& tokens,
                const std::string& keyword) {
    if (keyword.find(' ') != std::string::npos) {
        return (" " + normalized + " ").find(" " + keyword + " ") != std::string::npos;
    }
    for (const auto& t : tokens) {
        if (t == keyword) return true;
    }
    return false;
}

std::string formatNow(const char* format) {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), format, &local);
    return std::string(buf, n);
}

void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // anonymous namespace

const char* toString(ReplyCategory category) {
    switch (category) {
        case ReplyCategory::GREETING: return "greeting";
        case ReplyCategory::TIME:     return "time";
        case ReplyCategory::DATE:     return "date";
        case ReplyCategory::WEATHER:  return "weather";
        case ReplyCategory::FAREWELL: return "farewell";
        case ReplyCategory::THANKS:   return "thanks";
        case ReplyCategory::IDENTITY: return "identity";
        case ReplyCategory::HELP:     return "help";
        case ReplyCategory::UNKNOWN:  return "unknown";
        case ReplyCategory::ERROR:    return "error";
    }
    return "unknown";
}

ReplyCategory classify(const std::string& text) {
    std::string normalized = wakeword::WakeWordMatcher::normalize(text);
    if (normalized.empty()) {
        return ReplyCategory::ERROR;
    }

    std::vector<std::string> tokens;
    std::istringstream stream(normalized);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }

    for (const auto& rule : rules()) {
        for (const auto& keyword : rule.keywords) {
            if (hasKeyword(normalized, tokens, keyword)) {
                return rule.category;
            }
        }
    }
    return ReplyCategory::UNKNOWN;
}

const std::vector<std::string>& replyPool(ReplyCategory category) {
    static const std::map<ReplyCategory, std::vector<std::string>> pools = {
        {ReplyCategory::GREETING, {
            "Hello! I'm Gideon, your local AI assistant. How can I help you?",
            "Hi there! I'm running locally on your system. What can I do for you?",
            "Greetings! Your local AI assistant is ready to help.",
        }},
        {ReplyCategory::TIME, {
            "It's {time}.",
            "The time is {time}.",
            "Right now it's {time}.",
        }},
        {ReplyCategory::DATE, {
            "Today is {date}.",
            "It's {date}.",
        }},
        {ReplyCategory::WEATHER, {
            "I can't reach a weather service while I'm offline. Try again once I'm back online.",
            "Weather lookups need my online brain, and it's unavailable right now.",
        }},
        {ReplyCategory::FAREWELL, {
            "Goodbye! Call me whenever you need me.",
            "See you later!",
            "Take care!",
        }},
        {ReplyCategory::THANKS, {
            "You're welcome!",
            "Happy to help.",
            "Anytime!",
        }},
        {ReplyCategory::IDENTITY, {
            "I'm Gideon, your personal voice assistant.",
            "My name is Gideon. I run right here on your computer.",
        }},
        {ReplyCategory::HELP, {
            "I can answer questions, tell you the time or date, and chat. Just say my name first.",
            "Say 'Gideon' followed by your question. I can tell the time, the date, and more.",
        }},
        {ReplyCategory::UNKNOWN, {
            "I'm having trouble connecting to my AI processing unit right now. Let me try to help with what I know.",
            "My advanced AI capabilities are temporarily offline, but I can still assist you with basic tasks.",
            "I'm operating in limited mode right now, but I'll do my best to help you.",
        }},
        {ReplyCategory::ERROR, {
            "I encountered a technical issue processing that request. Could you try rephrasing it?",
            "Something went wrong with my processing. Please try again in a moment.",
            "I'm having difficulty with that request. Could you be more specific?",
        }},
    };
    return pools.at(category);
}

FallbackResponder::FallbackResponder(std::uint32_t seed)
    : rng_(seed != 0 ? seed : std::random_device{}()) {
}

std::string FallbackResponder::reply(const std::string& text) {
    ReplyCategory category = classify(text);
    std::string out = replyFor(category);
    std::cout << "[Fallback] " << toString(category) << ": " << out << std::endl;
    return out;
}

std::string FallbackResponder::replyFor(ReplyCategory category) {
    const auto& pool = replyPool(category);
    std::size_t pick = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pool.size() > 1) {
            std::uniform_int_distribution<std::size_t> dist(0, pool.size() - 1);
            pick = dist(rng_);
            auto last = last_pick_.find(category);
            if (last != last_pick_.end() && last->second == pick) {
                pick = (pick + 1) % pool.size();
            }
        }
        last_pick_[category] = pick;
    }
    return render(pool[pick]);
}

std::string FallbackResponder::render(const std::string& tmpl) {
    std::string out = tmpl;
    if (out.find("{time}") != std::string::npos) {
        replaceAll(out, "{time}", formatNow("%H:%M"));
    }
    if (out.find("{date}") != std::string::npos) {
        replaceAll(out, "{date}", formatNow("%A, %B %d, %Y"));
    }
    return out;
}

} // namespace gideon::llm
