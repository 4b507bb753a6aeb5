#pragma once
#include <optional>
#include <string>

namespace sous::protocol {

    // How the model asks for a tool. During streaming, arguments arrive in
    // pieces and are concatenated per index.
    struct ToolCall {
        std::optional<int> index;
        std::string id;
        std::string name;
        std::string arguments;  // Raw JSON text of the arguments
    };

    // What a tool execution produced.
    struct ToolResult {
        std::string tool_call_id;
        bool success = false;
        std::string output;
        std::string error_message;
        double duration_ms = 0.0;
    };

    // Static allow/deny/ask verdict for one invocation, independent of mode.
    enum class ToolPermission {
        Always,
        Never,
        Ask
    };

    inline std::string to_string(const ToolPermission permission) {
        switch (permission) {
            case ToolPermission::Always:
                return "always";
            case ToolPermission::Never:
                return "never";
            case ToolPermission::Ask:
                return "ask";
            default:
                return "unknown";
        }
    }

    inline std::optional<ToolPermission> parse_tool_permission(const std::string& text) {
        if (text == "always") return ToolPermission::Always;
        if (text == "never") return ToolPermission::Never;
        if (text == "ask") return ToolPermission::Ask;
        return std::nullopt;
    }

} // namespace sous::protocol
