#pragma once

#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/llm_contract.hpp"

namespace sous::llm {

// Parses one OpenAI-style chat-completion chunk ("choices[0].delta") or full
// response ("choices[0].message"). A usage-only chunk yields an empty message.
core::errors::Result<protocol::Fragment> decode_fragment(const std::string& json_text);

// Serializes a request body; `stream` also asks the provider to report usage
// on the final chunk.
core::errors::Result<std::string> encode_request(const protocol::CompletionRequest& request,
                                                 bool stream);

}  // namespace sous::llm
