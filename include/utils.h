#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>
#include <sstream>

namespace holo_oracle {

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

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Normalize string to lowercase
 * @param str String to normalize (modified in place)
 * @return Reference to the normalized string
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return str;
}

inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Lower-case and collapse runs of whitespace to a single space
 *
 * Used as the synthesis cache key so "Hello  World" and "hello world" share
 * one entry.
 */
inline std::string collapse_whitespace_lower(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool pending_space = false;
    for (unsigned char c : str) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

/**
 * @brief Strip leading and trailing punctuation from a single token
 */
inline std::string strip_punctuation(const std::string& token) {
    size_t begin = 0;
    size_t end = token.size();
    while (begin < end && std::ispunct(static_cast<unsigned char>(token[begin]))) ++begin;
    while (end > begin && std::ispunct(static_cast<unsigned char>(token[end - 1]))) --end;
    return token.substr(begin, end - begin);
}

/**
 * @brief Split text into lower-cased words on whitespace
 *
 * Surrounding punctuation is stripped from each word and tokens that become
 * empty are dropped ("So, it goes." -> {"so", "it", "goes"}).
 */
inline std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(normalize_copy(text));
    std::string token;
    while (iss >> token) {
        std::string w = strip_punctuation(token);
        if (!w.empty()) words.push_back(std::move(w));
    }
    return words;
}

/**
 * @brief Check if transcript text is blank (empty/whitespace or equals blank sentinel)
 * @param text Raw transcript text
 * @param blank_sentinel String to treat as blank (e.g. "[BLANK_AUDIO]"); compared after trim
 * @return True if text is empty, whitespace-only, a bracketed annotation, or a noise word
 */
inline bool is_blank_transcript(const std::string& text, const std::string& blank_sentinel = "[BLANK_AUDIO]") {
    std::string t = trim_copy(text);
    if (t.empty()) return true;
    if (!blank_sentinel.empty() && t == blank_sentinel) return true;

    // Whisper annotations such as "[MUSIC]" or "(silence)"
    if ((t.front() == '[' && t.back() == ']') || (t.front() == '(' && t.back() == ')')) {
        return true;
    }

    std::string cleaned;
    for (char c : normalize_copy(t)) {
        if (std::isalnum(static_cast<unsigned char>(c)) || std::isspace(static_cast<unsigned char>(c))) {
            cleaned += c;
        }
    }
    cleaned = trim_copy(cleaned);

    static const std::vector<std::string> noise_patterns = {
        "silence", "noise", "inaudible", "background noise", "blank",
        "music", "applause", "static"
    };

    for (const auto& pattern : noise_patterns) {
        if (cleaned == pattern) {
            return true;
        }
    }

    return cleaned.empty();
}

} // namespace utils

} // namespace holo_oracle
