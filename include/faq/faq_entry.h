#pragma once

/**
 * @file faq_entry.h
 * @brief Canned-response table records
 */

#include <string>
#include <vector>
#include <unordered_map>

namespace holo_oracle {
namespace faq {

/// Word -> occurrences across all trigger phrases of one entry
using WordCounts = std::unordered_map<std::string, int>;

/**
 * @brief One trigger-phrase -> canned-response record
 *
 * type is free-form ("greeting", "famous_quote", "explanation",
 * "philosophical", "character", "time", "custom", ...). source is
 * "transcript", "default" or "manual".
 */
struct FaqEntry {
    int id = 0;
    std::string type;
    std::vector<std::string> trigger_phrases;
    std::string response;
    float confidence_boost = 0.0f;
    std::string source;
    std::string audio_file;  ///< Pre-rendered WAV (empty = synthesize)
    std::string created_at;  ///< ISO-8601, set on manual entries

    /// Derived from trigger_phrases; rebuilt on load, never persisted
    WordCounts trigger_words;
};

/// Result of a successful lookup
struct FaqMatch {
    std::string text;
    std::string type;
    float confidence = 0.0f;
    int entry_id = 0;
    std::string audio_file;
};

struct FaqStats {
    size_t total_entries = 0;
    std::unordered_map<std::string, size_t> types;
    std::unordered_map<std::string, size_t> sources;
    float similarity_threshold = 0.0f;
};

} // namespace faq
} // namespace holo_oracle
