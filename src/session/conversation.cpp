#include "session/conversation.hpp"

#include <set>
#include <utility>

namespace sous::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::Message;
using protocol::Role;

Conversation::Conversation(std::string system_prompt) {
    messages_.push_back(Message::system(std::move(system_prompt)));
}

void Conversation::append(Message message) {
    messages_.push_back(std::move(message));
}

void Conversation::append_to_last(const std::string& text) {
    auto& last = messages_.back();
    if (last.content.has_value() && !last.content->empty()) {
        last.content = last.content.value() + "\n\n" + text;
    } else {
        last.content = text;
    }
}

void Conversation::set_system_prompt(std::string system_prompt) {
    messages_.front() = Message::system(std::move(system_prompt));
}

void Conversation::reset_to_system() {
    messages_.resize(1);
}

void Conversation::replace_with_summary(const std::string& summary) {
    Message system = messages_.front();
    messages_.clear();
    messages_.push_back(std::move(system));
    messages_.push_back(Message::user(summary));
}

void Conversation::restore(std::vector<Message> messages) {
    Message system = messages_.front();
    messages_ = std::move(messages);
    if (messages_.empty() || messages_.front().role != Role::System) {
        messages_.insert(messages_.begin(), std::move(system));
    }
}

std::size_t Conversation::repair() {
    std::vector<Message> repaired;
    repaired.reserve(messages_.size());
    std::size_t added = 0;

    std::size_t i = 0;
    while (i < messages_.size()) {
        const Message& message = messages_[i];
        repaired.push_back(message);
        ++i;
        if (message.role != Role::Assistant || !message.has_tool_calls()) {
            continue;
        }

        std::set<std::string> answered;
        while (i < messages_.size() && messages_[i].role == Role::Tool) {
            if (messages_[i].tool_call_id.has_value()) {
                answered.insert(messages_[i].tool_call_id.value());
            }
            repaired.push_back(messages_[i]);
            ++i;
        }
        for (const auto& call : message.tool_calls.value()) {
            if (answered.count(call.id) == 0) {
                repaired.push_back(
                    Message::tool_result(call.id, call.name, kInterruptedToolResult));
                ++added;
            }
        }
    }

    if (repaired.size() > 1) {
        const Message& last = repaired.back();
        if (last.role == Role::Assistant && !last.has_tool_calls() &&
            (!last.content.has_value() || last.content->empty())) {
            repaired.pop_back();
        }
    }

    messages_ = std::move(repaired);
    return added;
}

core::errors::Status Conversation::check_ready_for_query() const {
    const Role role = messages_.back().role;
    if (role == Role::User || role == Role::Tool) {
        return core::errors::ok();
    }
    return AgentError{ErrorCategory::Desync,
                      "Conversation desynchronised: the last message has role '" +
                          protocol::to_string(role) + "', expected 'user' or 'tool'.",
                      "conversation_desync", "Run /clear to reset the conversation."};
}

std::int64_t Conversation::estimate_tokens() const {
    std::size_t chars = 0;
    for (const auto& message : messages_) {
        chars += message.content.value_or("").size();
        if (message.has_tool_calls()) {
            for (const auto& call : message.tool_calls.value()) {
                chars += call.name.size() + call.arguments.size();
            }
        }
    }
    return static_cast<std::int64_t>(chars / 4);
}

}  // namespace sous::session
