#include "protocol/message_json.hpp"

namespace sous::protocol {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError malformed(const std::string& detail) {
    return AgentError{ErrorCategory::Protocol, "Malformed message: " + detail,
                      "invalid_message"};
}

}  // namespace

json message_to_json(const Message& message) {
    json node;
    node["role"] = to_string(message.role);
    node["content"] = message.content.has_value() ? json(message.content.value()) : json(nullptr);
    if (message.has_tool_calls()) {
        json calls = json::array();
        for (const auto& call : message.tool_calls.value()) {
            json entry;
            entry["id"] = call.id;
            entry["type"] = "function";
            entry["function"] = {{"name", call.name}, {"arguments", call.arguments}};
            if (call.index.has_value()) {
                entry["index"] = call.index.value();
            }
            calls.push_back(entry);
        }
        node["tool_calls"] = calls;
    }
    if (message.tool_call_id.has_value()) {
        node["tool_call_id"] = message.tool_call_id.value();
    }
    if (message.name.has_value()) {
        node["name"] = message.name.value();
    }
    return node;
}

core::errors::Result<Message> message_from_json(const json& node) {
    if (!node.is_object()) {
        return malformed("expected an object");
    }
    try {
        Message message;
        const auto role = parse_role(node.value("role", std::string{}));
        if (!role.has_value()) {
            return malformed("unknown role '" + node.value("role", std::string{}) + "'");
        }
        message.role = role.value();

        auto content = node.find("content");
        if (content != node.end() && content->is_string()) {
            message.content = content->get<std::string>();
        }

        auto calls = node.find("tool_calls");
        if (calls != node.end() && calls->is_array()) {
            std::vector<ToolCall> parsed;
            for (const auto& entry : *calls) {
                ToolCall call;
                if (entry.contains("index") && entry.at("index").is_number_integer()) {
                    call.index = entry.at("index").get<int>();
                }
                call.id = entry.value("id", std::string{});
                if (entry.contains("function")) {
                    const auto& function = entry.at("function");
                    call.name = function.value("name", std::string{});
                    call.arguments = function.value("arguments", std::string{});
                }
                parsed.push_back(std::move(call));
            }
            message.tool_calls = std::move(parsed);
        }

        if (node.contains("tool_call_id") && node.at("tool_call_id").is_string()) {
            message.tool_call_id = node.at("tool_call_id").get<std::string>();
        }
        if (node.contains("name") && node.at("name").is_string()) {
            message.name = node.at("name").get<std::string>();
        }
        return message;
    } catch (const json::exception& e) {
        return malformed(e.what());
    }
}

}  // namespace sous::protocol
