#include "llm/provider_errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace sous::llm {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

constexpr std::array<const char*, 8> kContextTooLongMarkers = {
    "context length", "context_length", "maximum context", "too many tokens",
    "prompt is too long", "context window", "token limit", "too long"};

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool mentions_context_limit(const std::string& body) {
    const std::string lowered = lowercase(body);
    return std::any_of(kContextTooLongMarkers.begin(), kContextTooLongMarkers.end(),
                       [&](const char* marker) {
                           return lowered.find(marker) != std::string::npos;
                       });
}

std::string describe(const ProviderFailure& failure) {
    std::string text = "API error from " + failure.provider;
    if (!failure.model.empty()) {
        text += " (model: " + failure.model + ")";
    }
    if (!failure.endpoint.empty()) {
        text += " at " + failure.endpoint;
    }
    if (failure.http_status.has_value()) {
        text += ": HTTP " + std::to_string(failure.http_status.value());
    }
    if (!failure.body.empty()) {
        text += ": " + truncate_body(failure.body);
    }
    return text;
}

}  // namespace

std::string truncate_body(const std::string& body, const std::size_t limit) {
    if (body.size() <= limit) {
        return body;
    }
    return body.substr(0, limit) + "...";
}

AgentError classify_provider_error(const ProviderFailure& failure) {
    const std::string message = describe(failure);

    if (failure.transport_failed || !failure.http_status.has_value()) {
        return AgentError{ErrorCategory::Provider, message, "provider_connection",
                          "Check network connectivity and the provider endpoint."};
    }

    const int status = failure.http_status.value();
    if (status == 401 || status == 403) {
        return AgentError{ErrorCategory::Provider, message, "provider_auth",
                          "Check the API key configured for " + failure.provider + "."};
    }
    if (status == 429) {
        return AgentError{ErrorCategory::Provider, message, "provider_rate_limit",
                          "Rate limited by the provider. Wait before retrying."};
    }
    if ((status == 400 || status == 413) && mentions_context_limit(failure.body)) {
        return AgentError{
            ErrorCategory::Provider,
            "Prompt too long for " + (failure.model.empty() ? failure.provider : failure.model) +
                ". " + message,
            "provider_context_too_long",
            "Recovery options: switch to a mode with a smaller prompt, clear the "
            "conversation with /clear, run /compact, or use a model with a larger "
            "context window."};
    }
    return AgentError{ErrorCategory::Provider, message, "provider_generic"};
}

bool is_context_too_long(const AgentError& error) {
    return error.code == "provider_context_too_long";
}

}  // namespace sous::llm
