#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/llm_contract.hpp"

namespace sous::llm {

struct AccumulatedResponse {
    protocol::Message message{protocol::Role::Assistant};
    std::optional<std::string> finish_reason;
    protocol::Usage usage;
};

// Rebuilds one assistant message from streamed fragments. Owned by a single
// producer; not thread-safe.
class StreamAccumulator {
public:
    // batch_size 1 emits text on every content-bearing fragment.
    explicit StreamAccumulator(std::size_t batch_size);

    // Returns coalesced text once batch_size content fragments are buffered, or
    // early when a fragment starts tool calls mid-stream.
    core::errors::Result<std::optional<std::string>> push(const protocol::Fragment& fragment);

    // Text buffered since the last emission, if any.
    std::optional<std::string> flush_text();

    core::errors::Result<AccumulatedResponse> finish();

    std::size_t fragment_count() const { return fragment_count_; }

private:
    core::errors::Status merge_tool_calls(const std::vector<protocol::ToolCall>& calls);

    std::size_t batch_size_;
    std::size_t fragment_count_ = 0;

    std::string content_;
    bool saw_content_ = false;
    std::string pending_text_;
    std::size_t pending_fragments_ = 0;

    std::vector<int> index_order_;
    std::map<int, protocol::ToolCall> tool_calls_;

    std::optional<std::string> finish_reason_;
    std::optional<protocol::Usage> usage_;
};

}  // namespace sous::llm
