#include "intent_classifier.h"
#include "utils.h"
#include <algorithm>
#include <set>
#include <vector>

namespace voxgate {

namespace {

struct KeywordRule {
    const char* label;
    std::set<std::string> keywords;
};

// Checked in order; the first family with a hit decides the label
const std::vector<KeywordRule>& keyword_rules() {
    static const std::vector<KeywordRule> rules = {
        {intent::EMAIL, {"email", "emails", "inbox", "draft"}},
        {intent::CALL, {"call", "dial", "ring"}},
        {intent::BLOG, {"blog", "publish", "post"}},
        {intent::TOOL_NEEDED, {"run", "execute", "tool"}},
    };
    return rules;
}

const std::set<std::string>& request_words() {
    static const std::set<std::string> words = {
        "what", "how", "why", "when", "where", "who", "which",
        "tell", "explain", "describe", "can", "could", "would", "please"
    };
    return words;
}

const std::set<std::string>& heavy_words() {
    static const std::set<std::string> words = {"summarize", "analyze", "compose"};
    return words;
}

constexpr float kKeywordConfidence = 0.9f;
constexpr float kMixedKeywordConfidence = 0.6f;
constexpr float kRequestChatConfidence = 0.7f;
constexpr float kVagueChatConfidence = 0.3f;
constexpr float kWordsForFullComplexity = 80.0f;

} // anonymous namespace

IntentClassifier::IntentClassifier(std::string blank_sentinel)
    : blank_sentinel_(std::move(blank_sentinel)) {}

float IntentClassifier::complexity(const std::string& transcript) {
    std::vector<std::string> words = utils::words(transcript);
    float score = std::min(1.0f, static_cast<float>(words.size()) / kWordsForFullComplexity);
    bool heavy = std::any_of(words.begin(), words.end(),
                             [](const std::string& w) { return heavy_words().count(w) > 0; });
    if (heavy) score += 0.5f;
    return std::min(1.0f, score);
}

ClassifiedIntent IntentClassifier::classify(const std::string& transcript) const {
    ClassifiedIntent result;
    if (utils::is_blank_transcript(transcript, blank_sentinel_)) {
        return result;
    }

    std::vector<std::string> words = utils::words(transcript);
    result.complexity_score = complexity(transcript);

    int families_hit = 0;
    const char* label = nullptr;
    for (const auto& rule : keyword_rules()) {
        bool hit = std::any_of(words.begin(), words.end(),
                               [&rule](const std::string& w) { return rule.keywords.count(w) > 0; });
        if (hit) {
            families_hit++;
            if (!label) label = rule.label;
        }
    }

    if (label) {
        result.label = label;
        result.confidence = families_hit == 1 ? kKeywordConfidence : kMixedKeywordConfidence;
        return result;
    }

    bool request = transcript.find('?') != std::string::npos ||
                   std::any_of(words.begin(), words.end(),
                               [](const std::string& w) { return request_words().count(w) > 0; });
    result.label = intent::CHAT;
    result.confidence = request ? kRequestChatConfidence : kVagueChatConfidence;
    return result;
}

} // namespace voxgate
