#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace drift::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., malformed plan file or a rejected confirmation
        Policy,     // E.g., blocklisted command or a restore target outside the root
        Storage,    // E.g., snapshot backup could not be written
        Execution,  // E.g., a command could not be spawned
        Internal    // E.g., history log could not be appended
    };

    // The standardized error payload
    struct DriftError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";                       // Helpful tips for the user
        std::string rule_id = "";                    // Policy rule that fired, if any
        std::optional<std::size_t> command_index;    // Offending plan command, if any
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a DriftError.
    template <typename T>
    using Result = std::variant<T, DriftError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<DriftError>(result);
    }

    template <typename T>
    const DriftError& get_error(const Result<T>& result) {
        return std::get<DriftError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Storage:   return "storage";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace drift::core::errors
