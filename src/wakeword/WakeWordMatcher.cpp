/**
 * WakeWordMatcher.cpp - Edit-distance wake phrase detection
 *
 * Whisper spells the assistant's name in creative ways ("gidean", "gideon's",
 * "hey, gideon!"), so each variant is compared against token windows of
 * nearby length rather than requiring an exact substring. The name token
 * has to carry the match on its own: "hey video" is not "hey gideon".
 */

#include "gideon/wakeword/WakeWordMatcher.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace gideon::wakeword {

namespace {

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::istringstream stream(normalized);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string join(const std::vector<std::string>& tokens, std::size_t begin, std::size_t end) {
    std::string out;
    for (std::size_t i = begin; i < end; ++i) {
        if (!out.empty()) out += ' ';
        out += tokens[i];
    }
    return out;
}

std::size_t levenshtein(const std::string& a, const std::string& b) {
    std::vector<std::size_t> prev(b.size() + 1);
    std::vector<std::size_t> curr(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (std::size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

} // anonymous namespace

WakeWordMatcher::WakeWordMatcher(std::vector<std::string> variants, float threshold)
    : threshold_(std::clamp(threshold, 0.0f, 1.0f)) {
    for (const auto& v : variants) {
        std::string norm = normalize(v);
        if (norm.empty()) {
            std::cerr << "[WakeWord] Ignoring empty variant" << std::endl;
            continue;
        }
        variants_.push_back(norm);
        variant_tokens_.push_back(tokenize(norm));
    }
    std::cout << "[WakeWord] " << variants_.size() << " variants, threshold " << threshold_ << std::endl;
}

void WakeWordMatcher::setThreshold(float threshold) {
    threshold_ = std::clamp(threshold, 0.0f, 1.0f);
}

WakeMatch WakeWordMatcher::match(const std::string& text) const {
    WakeMatch result;
    std::string norm = normalize(text);
    if (norm.empty()) {
        return result;
    }

    auto tokens = tokenize(norm);
    std::size_t best_len = 0;
    std::size_t best_pos = 0;
    std::size_t best_end = 0;

    for (std::size_t v = 0; v < variants_.size(); ++v) {
        const std::string& variant = variants_[v];
        std::size_t k = variant_tokens_[v].size();

        // Windows of k-1 tokens absorb merged words ("heygideon")
        for (std::size_t width = (k > 1 ? k - 1 : 1); width <= k; ++width) {
            if (width > tokens.size()) break;
            for (std::size_t pos = 0; pos + width <= tokens.size(); ++pos) {
                float s = similarity(variant, join(tokens, pos, pos + width));
                if (width == k) {
                    s = std::min(s, similarity(variant_tokens_[v].back(), tokens[pos + width - 1]));
                }
                bool better = s > result.score;
                bool tie = s == result.score && !result.variant.empty();
                if (tie) {
                    // Prefer the longer phrase ("hey gideon" over "gideon"), then the earlier one
                    better = variant.size() > best_len ||
                             (variant.size() == best_len && pos < best_pos);
                }
                if (better || result.variant.empty()) {
                    result.score = s;
                    result.variant = variant;
                    best_len = variant.size();
                    best_pos = pos;
                    best_end = pos + width;
                }
            }
        }
    }

    result.matched = !result.variant.empty() && result.score >= threshold_;
    if (result.matched) {
        result.command = join(tokens, best_end, tokens.size());
    }
    return result;
}

std::string WakeWordMatcher::normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;

    for (unsigned char c : text) {
        bool keep = std::isalnum(c) || c >= 128 || c == '\'';
        if (!keep) {
            pending_space = true;
            continue;
        }
        if (c == '\'') continue;  // "gideon's" -> "gideons"
        if (pending_space && !out.empty()) {
            out += ' ';
        }
        pending_space = false;
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

float WakeWordMatcher::similarity(const std::string& a, const std::string& b) {
    std::size_t longest = std::max(a.size(), b.size());
    if (longest == 0) {
        return 1.0f;
    }
    return 1.0f - static_cast<float>(levenshtein(a, b)) / static_cast<float>(longest);
}

} // namespace gideon::wakeword
