#include "conversation_history.h"

using json = nlohmann::json;

namespace voxgate {

ConversationHistory::ConversationHistory(size_t max_turns) : max_turns_(max_turns) {}

void ConversationHistory::add_user_message(const std::string& content) {
    push("user", content);
}

void ConversationHistory::add_assistant_message(const std::string& content) {
    push("assistant", content);
}

void ConversationHistory::push(std::string role, const std::string& content) {
    if (max_turns_ == 0) return;
    messages_.push_back(Message{std::move(role), content});
    while (messages_.size() > max_turns_) {
        messages_.pop_front();
    }
}

json ConversationHistory::to_json() const {
    json arr = json::array();
    for (const auto& msg : messages_) {
        arr.push_back({{"role", msg.role}, {"content", msg.content}});
    }
    return arr;
}

} // namespace voxgate
