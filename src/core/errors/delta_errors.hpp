#pragma once
#include <string>
#include <variant>

namespace xcdelta::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        InvalidRequest,    // E.g., malformed request or session identifier
        AlreadyExists,     // E.g., a session with this identifier is registered
        NotFound,          // E.g., unknown or already reaped session
        OperationFailed,   // E.g., the test runner crashed or timed out
        CapacityExceeded,  // E.g., too many live sessions
        Internal           // E.g., pipe/fork failure or a logic bug
    };

    // The standardized error payload
    struct DeltaError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the caller
        };

    // 2. Propagation strategy (Result Object)
    // A Result holds either a successful value of type T, OR a DeltaError.
    template <typename T>
    using Result = std::variant<T, DeltaError>;

    // --- Helpers to work with std::variant ---

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<DeltaError>(result);
    }

    template <typename T>
    const DeltaError& get_error(const Result<T>& result) {
        return std::get<DeltaError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::InvalidRequest: return "invalid_request";
            case ErrorCategory::AlreadyExists: return "already_exists";
            case ErrorCategory::NotFound: return "not_found";
            case ErrorCategory::OperationFailed: return "operation_failed";
            case ErrorCategory::CapacityExceeded: return "capacity_exceeded";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace xcdelta::core::errors
