#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"

namespace sous::session {

// Ordered message history whose first element is always the system message.
// Messages are only appended, except by the explicit reset and summary
// replacement operations.
class Conversation {
public:
    explicit Conversation(std::string system_prompt);

    const std::vector<protocol::Message>& messages() const { return messages_; }
    std::size_t size() const { return messages_.size(); }
    const protocol::Message& back() const { return messages_.back(); }

    void append(protocol::Message message);

    // Adds `text` to the last message's content after a blank line.
    void append_to_last(const std::string& text);

    void set_system_prompt(std::string system_prompt);
    void reset_to_system();
    void replace_with_summary(const std::string& summary);

    // Replaces the history; a leading system message is kept or inserted.
    void restore(std::vector<protocol::Message> messages);

    // Gives every unanswered tool call a synthetic result and drops a trailing
    // empty assistant message. Returns the number of results added.
    std::size_t repair();

    // The next model query needs a trailing user or tool message.
    core::errors::Status check_ready_for_query() const;

    // Rough estimate: a quarter of the characters.
    std::int64_t estimate_tokens() const;

    static constexpr const char* kInterruptedToolResult =
        "Tool execution interrupted - no response available";

private:
    std::vector<protocol::Message> messages_;
};

}  // namespace sous::session
