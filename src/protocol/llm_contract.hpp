#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol/message_contract.hpp"

namespace sous::protocol {

    struct Usage {
        std::int64_t prompt_tokens = 0;
        std::int64_t completion_tokens = 0;
    };

    // One partial unit of a streamed response, or a whole non-streamed response.
    struct Fragment {
        Message message{Role::Assistant};
        std::optional<Usage> usage;
        std::optional<std::string> finish_reason;
    };

    struct ToolSchema {
        std::string name;
        std::string description;
        std::string parameters_json;  // JSON schema text
    };

    struct CompletionRequest {
        std::string model;
        std::vector<Message> messages;
        std::vector<ToolSchema> tools;
        double temperature = 0.2;
        std::optional<std::int64_t> max_tokens;
    };

} // namespace sous::protocol
