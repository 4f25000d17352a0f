#include "faq/faq_extractor.h"
#include "utils.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace holo_oracle {
namespace faq {

namespace {

const std::vector<std::string> kFamousPhrases = {
    "So it goes",
    "Everything was beautiful and nothing hurt",
    "Listen:",
    "Human beings",
    "All this happened, more or less",
    "Billy Pilgrim",
    "unstuck in time"
};

const std::vector<std::string> kConnectives = {
    "because", "since", "therefore", "thus", "so"
};

const std::vector<std::string> kPhilosophicalKeywords = {
    "life", "death", "time", "existence", "meaning", "purpose",
    "reality", "truth", "human", "nature", "soul", "god",
    "war", "peace", "love", "hate", "beautiful", "ugly"
};

bool is_alpha_word(const std::string& word) {
    if (word.empty()) return false;
    return std::all_of(word.begin(), word.end(),
                       [](unsigned char c) { return std::isalpha(c); });
}

bool has_connective(const std::string& sentence) {
    std::vector<std::string> words = utils::split_words(sentence);
    for (const auto& w : words) {
        if (std::find(kConnectives.begin(), kConnectives.end(), w) != kConnectives.end()) {
            return true;
        }
    }
    return false;
}

FaqEntry make_entry(const std::string& type, std::vector<std::string> triggers,
                    const std::string& response, float boost, const std::string& source) {
    FaqEntry e;
    e.type = type;
    e.trigger_phrases = std::move(triggers);
    e.response = response;
    e.confidence_boost = boost;
    e.source = source;
    return e;
}

} // namespace

Result<std::string> read_transcript(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::failure("transcript not found: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (content.size() >= 3 &&
        static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB &&
        static_cast<unsigned char>(content[2]) == 0xBF) {
        content.erase(0, 3);
        LOG_FAQ("Removed BOM from transcript");
    }
    utils::trim(content);
    return Result<std::string>::success(std::move(content));
}

bool validate_transcript(const std::string& content) {
    if (utils::trim_copy(content).size() < 10) return false;

    size_t alpha = static_cast<size_t>(std::count_if(content.begin(), content.end(),
        [](unsigned char c) { return std::isalpha(c); }));
    double ratio = static_cast<double>(alpha) / static_cast<double>(content.size());
    if (ratio < 0.5) {
        std::ostringstream oss;
        oss << "Transcript has low alphabetic ratio: " << ratio;
        Logger::warn("[FAQ] " + oss.str());
        return false;
    }
    return true;
}

std::vector<std::string> split_sentences(const std::string& text, size_t min_chars, size_t max_chars) {
    std::vector<std::string> sentences;
    std::string current;

    auto flush = [&]() {
        std::string s = utils::trim_copy(current);
        current.clear();
        if (!s.empty() && s.size() >= min_chars && s.size() <= max_chars) {
            sentences.push_back(std::move(s));
        }
    };

    for (char c : text) {
        if (c == '.' || c == '!' || c == '?') {
            flush();
        } else {
            current += c;
        }
    }
    flush();
    return sentences;
}

std::vector<std::string> find_phrase_contexts(const std::vector<std::string>& sentences,
                                              const std::string& phrase,
                                              size_t max_matches) {
    std::vector<std::string> matches;
    std::string phrase_lower = utils::normalize_copy(phrase);
    for (const auto& sentence : sentences) {
        if (matches.size() >= max_matches) break;
        if (utils::normalize_copy(sentence).find(phrase_lower) != std::string::npos) {
            matches.push_back(utils::trim_copy(sentence));
        }
    }
    return matches;
}

std::vector<std::string> generate_question_triggers(const std::string& sentence) {
    std::istringstream iss(utils::normalize_copy(sentence));
    std::vector<std::string> concepts;
    std::string word;
    while (iss >> word && concepts.size() < 3) {
        if (word.size() > 4 && is_alpha_word(word)) {
            concepts.push_back(word);
        }
    }

    std::vector<std::string> triggers;
    for (const auto& concept_word : concepts) {
        triggers.push_back("what is " + concept_word);
        triggers.push_back("tell me about " + concept_word);
        triggers.push_back("explain " + concept_word);
        triggers.push_back(concept_word);
    }
    if (triggers.size() > constants::faq::MAX_TRIGGERS_PER_ENTRY) {
        triggers.resize(constants::faq::MAX_TRIGGERS_PER_ENTRY);
    }
    return triggers;
}

int philosophical_keyword_count(const std::string& sentence) {
    std::string lower = utils::normalize_copy(sentence);
    int count = 0;
    for (const auto& keyword : kPhilosophicalKeywords) {
        if (lower.find(keyword) != std::string::npos) ++count;
    }
    return count;
}

std::vector<FaqEntry> extract_famous_quotes(const std::vector<std::string>& sentences) {
    std::vector<FaqEntry> entries;
    for (const auto& phrase : kFamousPhrases) {
        for (const auto& match : find_phrase_contexts(sentences, phrase)) {
            entries.push_back(make_entry("famous_quote", {utils::normalize_copy(phrase)}, match,
                                         constants::faq::FAMOUS_QUOTE_BOOST, "transcript"));
        }
    }
    return entries;
}

std::vector<FaqEntry> extract_explanations(const std::vector<std::string>& sentences) {
    std::vector<FaqEntry> entries;
    for (const auto& sentence : sentences) {
        if (entries.size() >= constants::faq::MAX_EXPLANATION_ENTRIES) break;
        if (!has_connective(sentence)) continue;

        std::vector<std::string> triggers = generate_question_triggers(sentence);
        if (triggers.empty()) continue;

        entries.push_back(make_entry("explanation", std::move(triggers), sentence,
                                     constants::faq::EXPLANATION_BOOST, "transcript"));
    }
    return entries;
}

std::vector<FaqEntry> extract_philosophical(const std::vector<std::string>& sentences) {
    std::vector<FaqEntry> entries;
    for (const auto& sentence : sentences) {
        if (entries.size() >= constants::faq::MAX_PHILOSOPHICAL_ENTRIES) break;
        if (philosophical_keyword_count(sentence) < constants::faq::MIN_PHILOSOPHICAL_KEYWORDS) continue;

        std::string lower = utils::normalize_copy(sentence);
        std::vector<std::string> triggers;
        for (const auto& keyword : kPhilosophicalKeywords) {
            if (lower.find(keyword) == std::string::npos) continue;
            triggers.push_back(keyword);
            triggers.push_back("what about " + keyword);
            triggers.push_back("thoughts on " + keyword);
        }
        if (triggers.size() > constants::faq::MAX_TRIGGERS_PER_ENTRY) {
            triggers.resize(constants::faq::MAX_TRIGGERS_PER_ENTRY);
        }

        entries.push_back(make_entry("philosophical", std::move(triggers), sentence,
                                     constants::faq::PHILOSOPHICAL_BOOST, "transcript"));
    }
    return entries;
}

std::vector<FaqEntry> extract_character_references(const std::vector<std::string>& sentences) {
    static const std::vector<std::regex> patterns = {
        std::regex("Billy Pilgrim"),
        std::regex("[A-Z][a-z]+ [A-Z][a-z]+")
    };

    std::vector<FaqEntry> entries;
    for (const auto& sentence : sentences) {
        if (entries.size() >= constants::faq::MAX_CHARACTER_ENTRIES) break;

        for (const auto& pattern : patterns) {
            std::smatch m;
            if (!std::regex_search(sentence, m, pattern)) continue;

            std::string name = utils::normalize_copy(m.str(0));
            entries.push_back(make_entry("character",
                                         {name, "who is " + name, "tell me about " + name, "what about " + name},
                                         sentence, constants::faq::CHARACTER_BOOST, "transcript"));
            break;  // one entry per sentence
        }
    }
    return entries;
}

std::vector<FaqEntry> dedupe_and_rank(std::vector<FaqEntry> entries, size_t max_entries) {
    std::unordered_set<std::string> seen;
    std::vector<FaqEntry> filtered;
    filtered.reserve(entries.size());

    for (auto& entry : entries) {
        std::string key = utils::trim_copy(entry.response);
        if (seen.insert(key).second) {
            filtered.push_back(std::move(entry));
        }
    }

    std::stable_sort(filtered.begin(), filtered.end(),
                     [](const FaqEntry& a, const FaqEntry& b) {
                         return a.confidence_boost > b.confidence_boost;
                     });

    if (filtered.size() > max_entries) {
        filtered.resize(max_entries);
    }
    return filtered;
}

std::vector<FaqEntry> extract_entries(const std::string& transcript) {
    std::vector<std::string> sentences = split_sentences(transcript);

    std::vector<FaqEntry> entries = extract_famous_quotes(sentences);
    auto append = [&entries](std::vector<FaqEntry> more) {
        entries.insert(entries.end(),
                       std::make_move_iterator(more.begin()),
                       std::make_move_iterator(more.end()));
    };
    append(extract_explanations(sentences));
    append(extract_philosophical(sentences));
    append(extract_character_references(sentences));

    entries = dedupe_and_rank(std::move(entries));

    for (size_t i = 0; i < entries.size(); ++i) {
        entries[i].id = static_cast<int>(i);
        entries[i].trigger_words = build_word_counts(entries[i].trigger_phrases);
    }

    std::ostringstream oss;
    oss << "Extracted " << entries.size() << " entries from " << sentences.size() << " sentences";
    LOG_FAQ(oss.str());
    return entries;
}

std::vector<FaqEntry> default_entries() {
    std::vector<FaqEntry> entries = {
        make_entry("greeting", {"hello", "hi", "hey", "greetings"},
                   "So it goes. What brings you to speak with me today?", 0.3f, "default"),
        make_entry("famous_quote", {"so it goes", "death", "mortality"},
                   "So it goes. That is what I say about death and dying.", 0.5f, "default"),
        make_entry("philosophical", {"meaning", "purpose", "life"},
                   "Everything was beautiful and nothing hurt. That is how I choose to remember it.", 0.4f, "default"),
        make_entry("time", {"time", "past", "future", "unstuck"},
                   "Listen: Billy Pilgrim has come unstuck in time. We all have, in our own way.", 0.4f, "default"),
    };
    for (size_t i = 0; i < entries.size(); ++i) {
        entries[i].id = static_cast<int>(i);
        entries[i].trigger_words = build_word_counts(entries[i].trigger_phrases);
    }
    return entries;
}

WordCounts build_word_counts(const std::vector<std::string>& trigger_phrases) {
    WordCounts counts;
    for (const auto& phrase : trigger_phrases) {
        for (const auto& word : utils::split_words(phrase)) {
            counts[word]++;
        }
    }
    return counts;
}

float score_entry(const std::vector<std::string>& query_words, const FaqEntry& entry) {
    if (query_words.empty()) return 0.0f;

    int matches = 0;
    for (const auto& word : query_words) {
        auto it = entry.trigger_words.find(word);
        if (it != entry.trigger_words.end()) {
            matches += it->second;
        }
    }

    float similarity = static_cast<float>(matches) / static_cast<float>(query_words.size());
    return std::min(1.0f, similarity + entry.confidence_boost);
}

} // namespace faq
} // namespace holo_oracle
