#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace sous::protocol {

    // Why an Act call returned
    enum class StopReason {
        Finished,        // Model produced a final answer
        MiddlewareStop,  // A turn or spend limit fired
        Cancelled        // User cancelled the turn
    };

    struct AssistantTextEvent {
        std::string content;
        std::int64_t prompt_tokens = 0;
        std::int64_t completion_tokens = 0;
        std::int64_t session_total_tokens = 0;
        bool stopped_by_middleware = false;
    };

    struct ToolCallStartedEvent {
        std::string tool_call_id;
        std::string tool_name;
        std::string arguments;
    };

    struct ToolResultEvent {
        std::string tool_call_id;
        std::string tool_name;
        std::string output;
        std::string error;
        bool skipped = false;
        std::string skip_reason;
        double duration_ms = 0.0;
    };

    struct CompactStartedEvent {
        std::int64_t current_context_tokens = 0;
        std::int64_t threshold = 0;
    };

    struct CompactEndedEvent {
        std::int64_t old_context_tokens = 0;
        std::int64_t new_context_tokens = 0;
        std::size_t summary_length = 0;
    };

    // An Act call emits a finite sequence of these.
    using AgentEvent = std::variant<
        AssistantTextEvent,
        ToolCallStartedEvent,
        ToolResultEvent,
        CompactStartedEvent,
        CompactEndedEvent
    >;

    inline std::string to_string(const StopReason reason) {
        switch (reason) {
            case StopReason::Finished:
                return "finished";
            case StopReason::MiddlewareStop:
                return "middleware_stop";
            case StopReason::Cancelled:
                return "cancelled";
            default:
                return "unknown";
        }
    }

} // namespace sous::protocol
