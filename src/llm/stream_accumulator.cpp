#include "llm/stream_accumulator.hpp"

#include <utility>
#include "core/config/ids.hpp"

namespace sous::llm {

using core::errors::AgentError;
using core::errors::ErrorCategory;

StreamAccumulator::StreamAccumulator(const std::size_t batch_size)
    : batch_size_(batch_size == 0 ? 1 : batch_size) {}

core::errors::Status StreamAccumulator::merge_tool_calls(
    const std::vector<protocol::ToolCall>& calls) {
    for (const auto& call : calls) {
        if (!call.index.has_value()) {
            return AgentError{ErrorCategory::Protocol,
                              "Streamed tool call without an index (fragment #" +
                                  std::to_string(fragment_count_) + ", tool '" +
                                  call.name + "', id '" + call.id + "').",
                              "malformed_stream_missing_index",
                              "The provider sent a malformed tool-call delta."};
        }

        const int index = call.index.value();
        auto it = tool_calls_.find(index);
        if (it == tool_calls_.end()) {
            index_order_.push_back(index);
            tool_calls_.emplace(index, call);
            continue;
        }

        auto& merged = it->second;
        if (merged.id.empty()) {
            merged.id = call.id;
        }
        if (merged.name.empty()) {
            merged.name = call.name;
        }
        merged.arguments += call.arguments;
    }
    return core::errors::ok();
}

core::errors::Result<std::optional<std::string>> StreamAccumulator::push(
    const protocol::Fragment& fragment) {
    ++fragment_count_;

    const auto& message = fragment.message;
    const bool has_text = message.content.has_value() && !message.content->empty();
    if (message.content.has_value()) {
        saw_content_ = true;
    }

    if (message.tool_calls.has_value()) {
        auto status = merge_tool_calls(message.tool_calls.value());
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
    }

    if (!finish_reason_.has_value() && fragment.finish_reason.has_value()) {
        finish_reason_ = fragment.finish_reason;
    }
    if (fragment.usage.has_value()) {
        usage_ = fragment.usage;
    }

    std::optional<std::string> emitted;

    // Text that precedes tool calls is released before the calls are shown.
    if (message.has_tool_calls() && !fragment.finish_reason.has_value()) {
        if (has_text) {
            content_ += message.content.value();
            pending_text_ += message.content.value();
        }
        emitted = flush_text();
        return emitted;
    }

    if (has_text) {
        content_ += message.content.value();
        pending_text_ += message.content.value();
        ++pending_fragments_;
    }
    if (pending_fragments_ >= batch_size_) {
        emitted = flush_text();
    }
    return emitted;
}

std::optional<std::string> StreamAccumulator::flush_text() {
    pending_fragments_ = 0;
    if (pending_text_.empty()) {
        return std::nullopt;
    }
    std::string text = std::move(pending_text_);
    pending_text_.clear();
    return text;
}

core::errors::Result<AccumulatedResponse> StreamAccumulator::finish() {
    if (fragment_count_ == 0) {
        return AgentError{ErrorCategory::Protocol, "Model returned an empty stream.",
                          "empty_stream"};
    }
    if (!usage_.has_value()) {
        return AgentError{ErrorCategory::Protocol,
                          "No usage data in any of the " +
                              std::to_string(fragment_count_) + " streamed fragments.",
                          "missing_usage",
                          "Token accounting requires the provider to report usage."};
    }

    AccumulatedResponse response;
    response.finish_reason = finish_reason_;
    response.usage = usage_.value();
    if (saw_content_) {
        response.message.content = content_;
    }
    if (!index_order_.empty()) {
        std::vector<protocol::ToolCall> calls;
        calls.reserve(index_order_.size());
        for (const int index : index_order_) {
            auto call = tool_calls_.at(index);
            if (call.id.empty()) {
                call.id = core::config::generate_call_id();
            }
            calls.push_back(std::move(call));
        }
        response.message.tool_calls = std::move(calls);
    }
    return response;
}

}  // namespace sous::llm
