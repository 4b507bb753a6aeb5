#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/llm_contract.hpp"

namespace sous::llm {

    // Called once per streamed fragment. Returning false stops the stream.
    using FragmentCallback = std::function<bool(const protocol::Fragment&)>;

    // Boundary to a chat-completion provider. Implementations classify their
    // failures with classify_provider_error().
    class ModelBackend {
    public:
        virtual ~ModelBackend() = default;

        virtual std::string provider_name() const = 0;

        virtual core::errors::Result<protocol::Fragment> complete(
            const protocol::CompletionRequest& request) = 0;

        virtual core::errors::Status complete_streaming(
            const protocol::CompletionRequest& request,
            const FragmentCallback& on_fragment) = 0;

        virtual core::errors::Result<std::int64_t> count_tokens(
            const protocol::CompletionRequest& request) = 0;
    };

} // namespace sous::llm
