#pragma once

/**
 * @file faq_extractor.h
 * @brief Building and scoring the canned-response table
 *
 * Pure functions: transcript -> candidate entries, and query -> score.
 * The router owns the table; everything here is stateless.
 */

#include "faq/faq_entry.h"
#include "core/types.h"
#include "core/constants.h"
#include <string>
#include <vector>

namespace holo_oracle {
namespace faq {

// =============================================================================
// Transcript input
// =============================================================================

/// Read a transcript file, dropping a UTF-8 BOM and surrounding whitespace
Result<std::string> read_transcript(const std::string& path);

/// At least 10 characters and an alphabetic ratio of 0.5 or more
bool validate_transcript(const std::string& content);

// =============================================================================
// Extraction
// =============================================================================

/// Split on runs of . ! ? and keep trimmed sentences with min <= length <= max
std::vector<std::string> split_sentences(const std::string& text,
                                         size_t min_chars = constants::faq::MIN_SENTENCE_CHARS,
                                         size_t max_chars = constants::faq::MAX_SENTENCE_CHARS);

/// First max_matches sentences containing phrase (case-insensitive)
std::vector<std::string> find_phrase_contexts(const std::vector<std::string>& sentences,
                                              const std::string& phrase,
                                              size_t max_matches = constants::faq::MAX_MATCHES_PER_PHRASE);

/**
 * @brief Question-style triggers for an explanatory sentence
 *
 * Concepts are the first three purely alphabetic words longer than four
 * characters; each yields "what is X", "tell me about X", "explain X" and
 * "X". At most five triggers are returned.
 */
std::vector<std::string> generate_question_triggers(const std::string& sentence);

/// Number of philosophical keywords occurring (as substrings) in the sentence
int philosophical_keyword_count(const std::string& sentence);

std::vector<FaqEntry> extract_famous_quotes(const std::vector<std::string>& sentences);
std::vector<FaqEntry> extract_explanations(const std::vector<std::string>& sentences);
std::vector<FaqEntry> extract_philosophical(const std::vector<std::string>& sentences);
std::vector<FaqEntry> extract_character_references(const std::vector<std::string>& sentences);

/// Drop repeated responses (first kept), stable-sort by boost descending, cap
std::vector<FaqEntry> dedupe_and_rank(std::vector<FaqEntry> entries,
                                      size_t max_entries = constants::faq::MAX_ENTRIES);

/**
 * @brief Full extraction pipeline over a transcript
 *
 * Famous quotes, explanations, philosophical statements and character
 * references, deduplicated and ranked. Ids are renumbered 0..n-1 and trigger
 * word counts are filled in.
 */
std::vector<FaqEntry> extract_entries(const std::string& transcript);

/// Fixed table used when no transcript is available
std::vector<FaqEntry> default_entries();

// =============================================================================
// Scoring
// =============================================================================

/// Multiset of words over all trigger phrases
WordCounts build_word_counts(const std::vector<std::string>& trigger_phrases);

/**
 * @brief Bag-of-words similarity plus boost
 *
 * Sum of trigger-word multiplicities for every query word, divided by the
 * number of query words, plus the entry's confidence boost, clamped to 1.
 * An empty query scores 0.
 */
float score_entry(const std::vector<std::string>& query_words, const FaqEntry& entry);

} // namespace faq
} // namespace holo_oracle
