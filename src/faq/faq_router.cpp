#include "faq/faq_router.h"
#include "faq/faq_extractor.h"
#include "logger.h"
#include "utils.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace holo_oracle {
namespace faq {

void to_json(json& j, const FaqEntry& e) {
    j = json{
        {"id", e.id},
        {"type", e.type},
        {"trigger_phrases", e.trigger_phrases},
        {"response", e.response},
        {"confidence_boost", e.confidence_boost},
        {"source", e.source},
        {"audio_file", e.audio_file.empty() ? json(nullptr) : json(e.audio_file)}
    };
    if (!e.created_at.empty()) {
        j["created_at"] = e.created_at;
    }
}

void from_json(const json& j, FaqEntry& e) {
    e.id = j.value("id", 0);
    e.type = j.value("type", std::string("unknown"));
    e.response = j.at("response").get<std::string>();
    e.confidence_boost = j.value("confidence_boost", 0.0f);
    e.source = j.value("source", std::string("unknown"));
    e.trigger_phrases.clear();
    if (j.contains("trigger_phrases") && j["trigger_phrases"].is_array()) {
        for (const auto& t : j["trigger_phrases"]) {
            if (t.is_string()) e.trigger_phrases.push_back(t.get<std::string>());
        }
    }
    e.audio_file.clear();
    if (j.contains("audio_file") && j["audio_file"].is_string()) {
        e.audio_file = j["audio_file"].get<std::string>();
    }
    e.created_at = j.value("created_at", std::string());
}

namespace {

/// Local time as YYYY-mm-ddTHH:MM:SS.ffffff
std::string iso_timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()) % 1000000;
    std::tm local_tm{};
    localtime_r(&t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(6) << us.count();
    return oss.str();
}

void finalize_entries(std::vector<FaqEntry>& entries) {
    for (size_t i = 0; i < entries.size(); ++i) {
        entries[i].id = static_cast<int>(i);
        entries[i].trigger_words = build_word_counts(entries[i].trigger_phrases);
    }
}

} // namespace

class FaqRouter::Impl {
public:
    explicit Impl(const FAQConfig& config) : config_(config) {}

    VoidResult initialize() {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        if (!config_.database_path.empty() && fs::exists(config_.database_path)) {
            auto loaded = load_database();
            if (loaded.ok() && !loaded.value->empty()) {
                entries_ = std::move(*loaded.value);
                LOG_FAQ("Loaded " + std::to_string(entries_.size()) + " entries from " + config_.database_path);
                return VoidResult::ok_result();
            }
            Logger::warn("[FAQ] Could not use " + config_.database_path + ": " +
                         (loaded.ok() ? std::string("no entries") : loaded.error) + ". Rebuilding.");
            if (!set_aside_database()) {
                entries_ = build_from_transcript();
                Logger::warn("[FAQ] Keeping " + config_.database_path + " untouched, rebuilt table is not saved");
                LOG_FAQ("Router ready with " + std::to_string(entries_.size()) + " entries");
                return VoidResult::ok_result();
            }
        }

        entries_ = build_from_transcript();
        auto saved = save_locked();
        if (saved.failed()) {
            Logger::warn("[FAQ] " + saved.error);
        }
        LOG_FAQ("Router ready with " + std::to_string(entries_.size()) + " entries");
        return VoidResult::ok_result();
    }

    std::optional<FaqMatch> check(const std::string& query) const {
        std::vector<std::string> words = utils::split_words(query);
        if (words.empty()) return std::nullopt;
        if (config_.min_query_words > 0 && words.size() < static_cast<size_t>(config_.min_query_words)) {
            return std::nullopt;
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);

        const FaqEntry* best = nullptr;
        float best_score = 0.0f;
        for (const auto& entry : entries_) {
            float score = score_entry(words, entry);
            if (score > best_score) {
                best_score = score;
                best = &entry;
            }
        }

        if (!best || best_score < config_.similarity_threshold) {
            return std::nullopt;
        }

        std::ostringstream oss;
        oss << "Match: " << best->type << " (score: " << std::fixed << std::setprecision(3) << best_score << ")";
        LOG_FAQ(oss.str());

        FaqMatch match;
        match.text = best->response;
        match.type = best->type;
        match.confidence = best_score;
        match.entry_id = best->id;
        match.audio_file = best->audio_file;
        return match;
    }

    Result<int> add_entry(const std::vector<std::string>& triggers,
                          const std::string& response,
                          const std::string& type) {
        std::vector<std::string> cleaned;
        for (const auto& t : triggers) {
            std::string trimmed = utils::trim_copy(t);
            if (!trimmed.empty()) cleaned.push_back(std::move(trimmed));
        }
        if (cleaned.empty()) {
            return Result<int>::failure("at least one trigger phrase is required");
        }
        if (utils::is_empty_or_whitespace(response)) {
            return Result<int>::failure("response text is required");
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);

        FaqEntry entry;
        entry.id = static_cast<int>(entries_.size());
        entry.type = type.empty() ? "custom" : type;
        entry.trigger_phrases = std::move(cleaned);
        entry.response = utils::trim_copy(response);
        entry.confidence_boost = 0.0f;
        entry.source = "manual";
        entry.created_at = iso_timestamp_now();
        entry.trigger_words = build_word_counts(entry.trigger_phrases);
        entries_.push_back(std::move(entry));

        int id = entries_.back().id;
        auto saved = save_locked();
        if (saved.failed()) {
            return Result<int>::failure(saved.error);
        }
        LOG_FAQ("Added entry " + std::to_string(id));
        return Result<int>::success(id);
    }

    void replace_entries(std::vector<FaqEntry> entries) {
        finalize_entries(entries);
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_ = std::move(entries);
    }

    VoidResult save() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return save_locked();
    }

    FaqStats stats() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        FaqStats s;
        s.total_entries = entries_.size();
        s.similarity_threshold = config_.similarity_threshold;
        for (const auto& e : entries_) {
            s.types[e.type.empty() ? "unknown" : e.type]++;
            s.sources[e.source.empty() ? "unknown" : e.source]++;
        }
        return s;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    std::vector<FaqEntry> entries() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_;
    }

private:
    Result<std::vector<FaqEntry>> load_database() const {
        std::ifstream file(config_.database_path);
        if (!file.is_open()) {
            return Result<std::vector<FaqEntry>>::failure("cannot open " + config_.database_path);
        }
        try {
            json j;
            file >> j;
            std::vector<FaqEntry> entries;
            if (j.contains("entries") && j["entries"].is_array()) {
                size_t index = 0;
                for (const auto& item : j["entries"]) {
                    if (!item.is_object() || !item.contains("response") || !item["response"].is_string()) {
                        Logger::warn("[FAQ] Skipping invalid entry at index " + std::to_string(index));
                    } else {
                        entries.push_back(item.get<FaqEntry>());
                    }
                    ++index;
                }
            }
            finalize_entries(entries);
            return Result<std::vector<FaqEntry>>::success(std::move(entries));
        } catch (const json::exception& e) {
            return Result<std::vector<FaqEntry>>::failure(std::string("parse error: ") + e.what());
        }
    }

    /// Move an unusable table file to <path>.bad so a rebuild never overwrites it
    bool set_aside_database() const {
        fs::path target(config_.database_path);
        fs::path bad = target;
        bad += ".bad";
        std::error_code ec;
        fs::rename(target, bad, ec);
        if (ec) {
            Logger::error("[FAQ] Cannot move " + target.string() + " aside: " + ec.message());
            return false;
        }
        Logger::warn("[FAQ] Moved unusable table to " + bad.string());
        return true;
    }

    std::vector<FaqEntry> build_from_transcript() const {
        if (config_.transcript_path.empty()) {
            LOG_FAQ("No transcript configured, using default table");
            return default_entries();
        }

        auto transcript = read_transcript(config_.transcript_path);
        if (transcript.failed()) {
            Logger::warn("[FAQ] " + transcript.error + ", using default table");
            return default_entries();
        }
        if (!validate_transcript(*transcript.value)) {
            Logger::warn("[FAQ] Transcript content validation failed, using default table");
            return default_entries();
        }

        LOG_FAQ("Building table from transcript: " + config_.transcript_path);
        std::vector<FaqEntry> entries = extract_entries(*transcript.value);
        if (entries.empty()) {
            Logger::warn("[FAQ] Transcript yielded no entries, using default table");
            return default_entries();
        }
        return entries;
    }

    /// Caller holds mutex_ (shared or unique)
    VoidResult save_locked() const {
        if (config_.database_path.empty()) {
            return VoidResult::ok_result();
        }

        std::lock_guard<std::mutex> write_lock(write_mutex_);

        json j;
        j["created_at"] = iso_timestamp_now();
        j["source_transcript"] = config_.transcript_path;
        j["total_entries"] = entries_.size();
        j["entries"] = entries_;

        try {
            fs::path target(config_.database_path);
            if (target.has_parent_path()) {
                fs::create_directories(target.parent_path());
            }
            fs::path tmp = target;
            tmp += ".tmp";
            {
                std::ofstream out(tmp);
                if (!out.is_open()) {
                    return VoidResult::failure("cannot write " + tmp.string());
                }
                out << j.dump(2, ' ', false, json::error_handler_t::replace);
                if (!out) {
                    return VoidResult::failure("write failed: " + tmp.string());
                }
            }
            fs::rename(tmp, target);
        } catch (const fs::filesystem_error& e) {
            return VoidResult::failure(std::string("save failed: ") + e.what());
        }

        LOG_FAQ("Saved table: " + config_.database_path);
        return VoidResult::ok_result();
    }

    FAQConfig config_;
    std::vector<FaqEntry> entries_;
    mutable std::shared_mutex mutex_;
    mutable std::mutex write_mutex_;
};

FaqRouter::FaqRouter(const FAQConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

FaqRouter::~FaqRouter() = default;

VoidResult FaqRouter::initialize() {
    return pimpl_->initialize();
}

std::optional<FaqMatch> FaqRouter::check(const std::string& query) const {
    return pimpl_->check(query);
}

Result<int> FaqRouter::add_entry(const std::vector<std::string>& triggers,
                                 const std::string& response,
                                 const std::string& type) {
    return pimpl_->add_entry(triggers, response, type);
}

void FaqRouter::replace_entries(std::vector<FaqEntry> entries) {
    pimpl_->replace_entries(std::move(entries));
}

VoidResult FaqRouter::save() const {
    return pimpl_->save();
}

FaqStats FaqRouter::stats() const {
    return pimpl_->stats();
}

size_t FaqRouter::size() const {
    return pimpl_->size();
}

std::vector<FaqEntry> FaqRouter::entries() const {
    return pimpl_->entries();
}

} // namespace faq
} // namespace holo_oracle
