#pragma once

/**
 * @file conversation_history.h
 * @brief Bounded per-session conversation history
 *
 * Owned by one session; not thread-safe.
 */

#include "core/types.h"
#include "core/constants.h"
#include <deque>
#include <string>
#include <vector>

namespace holo_oracle {
namespace memory {

class ConversationHistory {
public:
    /// max_turns 0 keeps nothing
    explicit ConversationHistory(size_t max_turns = constants::session::MAX_HISTORY);

    void add_user_message(const std::string& text);
    void add_assistant_message(const std::string& text);

    /// Append a user/assistant pair, then trim oldest turns to the cap
    void add_exchange(const std::string& user_text, const std::string& assistant_text);

    /// Oldest first
    std::vector<Turn> turns() const;

    /// Most recent n turns, oldest first
    std::vector<Turn> recent(size_t n) const;

    size_t size() const { return turns_.size(); }
    size_t capacity() const { return max_turns_; }
    bool empty() const { return turns_.empty(); }
    void clear() { turns_.clear(); }

private:
    void add(MessageRole role, const std::string& text);

    size_t max_turns_;
    std::deque<Turn> turns_;
};

} // namespace memory
} // namespace holo_oracle
