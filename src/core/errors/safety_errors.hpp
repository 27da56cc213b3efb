#pragma once
#include <string>
#include <variant>

namespace saferclaw::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., malformed CLI flag or action payload
        Policy,     // E.g., request denied by the policy engine
        Execution,  // E.g., process could not be spawned
        Queue,      // E.g., job store locked or job missing
        Internal    // E.g., audit file could not be written
    };

    // The standardized error payload
    struct SafetyError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a SafetyError.
    template <typename T>
    using Result = std::variant<T, SafetyError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<SafetyError>(result);
    }

    template <typename T>
    const SafetyError& get_error(const Result<T>& result) {
        return std::get<SafetyError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Queue:     return "queue";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace saferclaw::core::errors
