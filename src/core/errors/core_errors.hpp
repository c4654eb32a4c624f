#pragma once
#include <string>
#include <variant>

namespace streamcore::core::errors {

    // Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., bad CLI flag, unreadable config or events file
        Protocol    // E.g., malformed event or usage line on the wire
    };

    // The standardized error payload
    struct CoreError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // A Result holds either a successful value of type T, OR a CoreError.
    template <typename T>
    using Result = std::variant<T, CoreError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<CoreError>(result);
    }

    template <typename T>
    const CoreError& get_error(const Result<T>& result) {
        return std::get<CoreError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Protocol: return "protocol";
            default: return "unknown";
        }
    }

} // namespace streamcore::core::errors
