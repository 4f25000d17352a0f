#pragma once

/**
 * @file faq_router.h
 * @brief Fast canned-answer lookup ahead of the generative path
 */

#include "faq/faq_entry.h"
#include "config.h"
#include "core/types.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace holo_oracle {
namespace faq {

/**
 * @brief Bag-of-words router over a persisted trigger-phrase table
 *
 * check() is safe to call from any number of session threads. add_entry()
 * is serialized against lookups and other writers, and persists the whole
 * table before returning.
 */
class FaqRouter {
public:
    explicit FaqRouter(const FAQConfig& config);
    ~FaqRouter();

    FaqRouter(const FaqRouter&) = delete;
    FaqRouter& operator=(const FaqRouter&) = delete;

    /**
     * @brief Load the table file, or build it from the transcript, or use defaults
     *
     * A freshly built table is saved. Never leaves the router empty: any load
     * or build failure falls back to the default table.
     */
    VoidResult initialize();

    /**
     * @brief Best entry for the query, if its score reaches the threshold
     *
     * Ties keep the earlier entry. Returns nullopt for a miss, an empty
     * table, or a query shorter than the configured minimum word count.
     */
    std::optional<FaqMatch> check(const std::string& query) const;

    /**
     * @brief Append a manual entry and persist the table
     * @return New entry id, or failure if the arguments are empty or the save failed
     *         (the entry stays in memory either way once validated)
     */
    Result<int> add_entry(const std::vector<std::string>& triggers,
                          const std::string& response,
                          const std::string& type = "custom");

    /// Replace the in-memory table (ids renumbered, word counts rebuilt); not persisted
    void replace_entries(std::vector<FaqEntry> entries);

    /// Write the table file
    VoidResult save() const;

    FaqStats stats() const;
    size_t size() const;
    std::vector<FaqEntry> entries() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace faq
} // namespace holo_oracle
