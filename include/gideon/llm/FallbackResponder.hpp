/**
 * FallbackResponder.hpp - Offline canned replies by input category
 *
 * classify() and replyPool() are pure so each can be tested alone;
 * FallbackResponder adds the random pick and placeholder rendering.
 */

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace gideon::llm {

enum class ReplyCategory {
    GREETING,
    TIME,
    DATE,
    WEATHER,
    FAREWELL,
    THANKS,
    IDENTITY,
    HELP,
    UNKNOWN,
    ERROR
};

const char* toString(ReplyCategory category);

/**
 * Keyword/phrase classifier. Empty input is ERROR.
 */
ReplyCategory classify(const std::string& text);

/**
 * Canned replies for a category. May contain {time} and {date} placeholders.
 */
const std::vector<std::string>& replyPool(ReplyCategory category);

class FallbackResponder {
public:
    // seed 0: seeded from std::random_device
    explicit FallbackResponder(std::uint32_t seed = 0);

    std::string reply(const std::string& text);
    std::string replyFor(ReplyCategory category);

    // Substitute {time} / {date} with the current local time
    static std::string render(const std::string& tmpl);

private:
    std::mutex mutex_;
    std::mt19937 rng_;
    std::map<ReplyCategory, std::size_t> last_pick_;
};

} // namespace gideon::llm
