/**
 * WakeWordMatcher.hpp - Fuzzy activation-phrase matching on transcripts
 */

#pragma once

#include <string>
#include <vector>

namespace gideon::wakeword {

struct WakeMatch {
    bool matched = false;
    float score = 0.0f;
    std::string variant;  // best-scoring activation phrase
    std::string command;  // normalized text after the matched phrase
};

class WakeWordMatcher {
public:
    WakeWordMatcher(std::vector<std::string> variants, float threshold);

    bool matches(const std::string& text) const { return match(text).matched; }

    /**
     * Slide every variant over the token windows of the input and keep the
     * best similarity. A full-width window scores no higher than its last
     * token against the variant's name. matched = best score >= threshold.
     */
    WakeMatch match(const std::string& text) const;

    float score(const std::string& text) const { return match(text).score; }

    void setThreshold(float threshold);
    float threshold() const { return threshold_; }

    const std::vector<std::string>& variants() const { return variants_; }

    // Lowercase, punctuation to spaces, collapse runs of whitespace, trim
    static std::string normalize(const std::string& text);

    // 1 - levenshtein(a, b) / max(|a|, |b|)
    static float similarity(const std::string& a, const std::string& b);

private:
    std::vector<std::string> variants_;
    std::vector<std::vector<std::string>> variant_tokens_;
    float threshold_;
};

} // namespace gideon::wakeword
