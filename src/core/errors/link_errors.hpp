#pragma once
#include <string>
#include <variant>

namespace agentlink::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., a required param is missing or has the wrong type
        Storage,    // E.g., the mailbox log could not be written or locked
        Protocol,   // E.g., a request line was not valid JSON-RPC
        Execution,  // E.g., tmux exited non-zero
        Policy,     // E.g., a workdir that must be empty is not
        Internal    // E.g., fork/pipe failure or a C++ logic bug
    };

    // The standardized error payload
    struct LinkError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a LinkError.
    template <typename T>
    using Result = std::variant<T, LinkError>;

    // Marker for operations that only succeed or fail.
    struct Ok {};

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<LinkError>(result);
    }

    template <typename T>
    const LinkError& get_error(const Result<T>& result) {
        return std::get<LinkError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Storage:
                return "storage";
            case ErrorCategory::Protocol:
                return "protocol";
            case ErrorCategory::Execution:
                return "execution";
            case ErrorCategory::Policy:
                return "policy";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace agentlink::core::errors
