#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace sous::llm {

// Raw description of a failed provider call.
struct ProviderFailure {
    std::string provider;
    std::string endpoint;
    std::string model;
    std::optional<int> http_status;  // unset when the request never got a response
    std::string body;
    bool transport_failed = false;
};

constexpr std::size_t kMaxDiagnosticBodyChars = 2000;

std::string truncate_body(const std::string& body,
                          std::size_t limit = kMaxDiagnosticBodyChars);

// Maps a failure to one of provider_auth, provider_rate_limit,
// provider_context_too_long, provider_connection or provider_generic.
core::errors::AgentError classify_provider_error(const ProviderFailure& failure);

bool is_context_too_long(const core::errors::AgentError& error);

}  // namespace sous::llm
