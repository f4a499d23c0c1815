#pragma once

#include <string>

namespace voxgate {

/// Intent labels produced by IntentClassifier
namespace intent {
constexpr const char* CHAT = "chat";
constexpr const char* EMAIL = "email";
constexpr const char* CALL = "call";
constexpr const char* BLOG = "blog";
constexpr const char* TOOL_NEEDED = "tool-needed";
constexpr const char* UNKNOWN = "unknown";
}

struct ClassifiedIntent {
    std::string label = intent::UNKNOWN;
    float complexity_score = 0.0f;   ///< [0, 1]
    float confidence = 0.0f;         ///< [0, 1]

    bool operator==(const ClassifiedIntent& other) const {
        return label == other.label && complexity_score == other.complexity_score &&
               confidence == other.confidence;
    }
};

/**
 * @brief Keyword intent classifier with a word-count complexity heuristic
 *
 * Pure function of the text. Blank or unintelligible transcripts yield
 * "unknown" with zero confidence instead of failing.
 */
class IntentClassifier {
public:
    explicit IntentClassifier(std::string blank_sentinel = "[BLANK_AUDIO]");

    ClassifiedIntent classify(const std::string& transcript) const;

    /// min(1, words / 80), +0.5 for summarize/analyze/compose, capped at 1
    static float complexity(const std::string& transcript);

private:
    std::string blank_sentinel_;
};

} // namespace voxgate
