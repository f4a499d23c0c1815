#pragma once

#include <nlohmann/json.hpp>
#include <deque>
#include <string>

namespace voxgate {

/**
 * @brief Rolling user/assistant history included in each routing payload
 *
 * A turn is one user or assistant message. At most max_turns are kept and
 * the oldest drop first. The system prompt is not stored here.
 */
class ConversationHistory {
public:
    struct Message {
        std::string role;     ///< "user" | "assistant"
        std::string content;
    };

    explicit ConversationHistory(size_t max_turns = 6);

    void add_user_message(const std::string& content);
    void add_assistant_message(const std::string& content);

    void clear() { messages_.clear(); }

    size_t message_count() const { return messages_.size(); }
    bool is_empty() const { return messages_.empty(); }
    size_t max_turns() const { return max_turns_; }

    const std::deque<Message>& messages() const { return messages_; }

    /// Messages as a chat-format JSON array
    nlohmann::json to_json() const;

private:
    void push(std::string role, const std::string& content);

    size_t max_turns_;
    std::deque<Message> messages_;
};

} // namespace voxgate
