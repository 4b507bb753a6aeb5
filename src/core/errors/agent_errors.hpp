#pragma once
#include <string>
#include <variant>

namespace sous::core::errors {

    enum class ErrorCategory {
        Input,      // Caller supplied something invalid (flag, mode name, args)
        Execution,  // A tool or shell command failed
        Provider,   // Model backend failed (auth, rate limit, transport)
        Policy,     // A safety rule rejected the operation
        Protocol,   // Model response stream was malformed
        Desync,     // Conversation is in a state that cannot be queried
        Internal    // Logic bug or OS-level failure
    };

    struct AgentError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // A Result holds either a value of type T or an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    // For operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Provider:  return "provider";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Protocol:  return "protocol";
            case ErrorCategory::Desync:    return "desync";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace sous::core::errors
