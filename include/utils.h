#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>
#include <sstream>

namespace voxgate {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Lowercase, drop punctuation, collapse whitespace.
 *
 * "Open, Sesame!" -> "open sesame". Used for phrase comparison.
 */
inline std::string normalize_phrase(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool pending_space = false;
    for (unsigned char c : str) {
        if (std::isalnum(c)) {
            if (pending_space && !out.empty()) out += ' ';
            pending_space = false;
            out += static_cast<char>(std::tolower(c));
        } else if (std::isspace(c)) {
            pending_space = true;
        }
    }
    return out;
}

/**
 * @brief Split normalized text into words
 */
inline std::vector<std::string> words(const std::string& str) {
    std::vector<std::string> result;
    std::istringstream iss(normalize_phrase(str));
    std::string w;
    while (iss >> w) {
        result.push_back(w);
    }
    return result;
}

/**
 * @brief Whole-word / whole-phrase containment on normalized text
 */
inline bool contains_phrase(const std::string& haystack, const std::string& phrase) {
    std::string h = " " + normalize_phrase(haystack) + " ";
    std::string p = normalize_phrase(phrase);
    if (p.empty()) return false;
    return h.find(" " + p + " ") != std::string::npos;
}

/**
 * @brief Check if transcript text is blank (empty/whitespace, sentinel, or STT noise marker)
 * @param text Raw transcript text
 * @param blank_sentinel String to treat as blank (e.g. "[BLANK_AUDIO]"); compared after trim
 */
inline bool is_blank_transcript(const std::string& text, const std::string& blank_sentinel = "[BLANK_AUDIO]") {
    std::string t = trim_copy(text);
    if (t.empty()) return true;
    if (!blank_sentinel.empty() && t == blank_sentinel) return true;

    std::string cleaned = normalize_phrase(t);

    // Markers STT emits for static/silence
    static const std::vector<std::string> noise_patterns = {
        "static", "silence", "noise", "inaudible", "unintelligible",
        "background noise", "blank audio", "music", "no speech"
    };

    for (const auto& pattern : noise_patterns) {
        if (cleaned == pattern) {
            return true;
        }
    }

    // No alphabetic content at all
    bool has_alpha = std::any_of(cleaned.begin(), cleaned.end(),
                                 [](unsigned char c) { return std::isalpha(c); });
    return !has_alpha;
}

/**
 * @brief Lowercase hex encoding
 */
inline std::string to_hex(const unsigned char* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

} // namespace utils

} // namespace voxgate
