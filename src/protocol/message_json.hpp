#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"

namespace sous::protocol {

// Chat-completion wire shape: {"role", "content", "tool_calls": [{"id",
// "type": "function", "function": {"name", "arguments"}}], "tool_call_id", "name"}.
nlohmann::json message_to_json(const Message& message);

core::errors::Result<Message> message_from_json(const nlohmann::json& node);

}  // namespace sous::protocol
