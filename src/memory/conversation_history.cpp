#include "memory/conversation_history.h"

namespace holo_oracle {
namespace memory {

ConversationHistory::ConversationHistory(size_t max_turns)
    : max_turns_(max_turns) {}

void ConversationHistory::add_user_message(const std::string& text) {
    add(MessageRole::User, text);
}

void ConversationHistory::add_assistant_message(const std::string& text) {
    add(MessageRole::Assistant, text);
}

void ConversationHistory::add_exchange(const std::string& user_text, const std::string& assistant_text) {
    add(MessageRole::User, user_text);
    add(MessageRole::Assistant, assistant_text);
}

std::vector<Turn> ConversationHistory::turns() const {
    return std::vector<Turn>(turns_.begin(), turns_.end());
}

std::vector<Turn> ConversationHistory::recent(size_t n) const {
    size_t skip = turns_.size() > n ? turns_.size() - n : 0;
    return std::vector<Turn>(turns_.begin() + static_cast<std::ptrdiff_t>(skip), turns_.end());
}

void ConversationHistory::add(MessageRole role, const std::string& text) {
    turns_.push_back({role, text});
    while (turns_.size() > max_turns_) {
        turns_.pop_front();
    }
}

} // namespace memory
} // namespace holo_oracle
