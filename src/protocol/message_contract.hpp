#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace sous::protocol {

    enum class Role {
        System,
        User,
        Assistant,
        Tool
    };

    struct Message {
        Role role = Role::User;
        std::optional<std::string> content;

        // Assistant only: the tools the model wants to run, in declared order.
        std::optional<std::vector<ToolCall>> tool_calls;

        // Tool only: id of the call this message answers, and the tool name.
        std::optional<std::string> tool_call_id;
        std::optional<std::string> name;

        static Message system(std::string text) {
            return Message{Role::System, std::move(text), std::nullopt, std::nullopt,
                           std::nullopt};
        }

        static Message user(std::string text) {
            return Message{Role::User, std::move(text), std::nullopt, std::nullopt,
                           std::nullopt};
        }

        static Message tool_result(std::string call_id, std::string tool_name,
                                   std::string text) {
            return Message{Role::Tool, std::move(text), std::nullopt, std::move(call_id),
                           std::move(tool_name)};
        }

        bool has_tool_calls() const {
            return tool_calls.has_value() && !tool_calls->empty();
        }
    };

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::System:
                return "system";
            case Role::User:
                return "user";
            case Role::Assistant:
                return "assistant";
            case Role::Tool:
                return "tool";
            default:
                return "unknown";
        }
    }

    inline std::optional<Role> parse_role(const std::string& text) {
        if (text == "system") return Role::System;
        if (text == "user") return Role::User;
        if (text == "assistant") return Role::Assistant;
        if (text == "tool") return Role::Tool;
        return std::nullopt;
    }

} // namespace sous::protocol
