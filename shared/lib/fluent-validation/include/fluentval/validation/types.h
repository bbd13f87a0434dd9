/**
 * @file types.h
 * @brief Common types for the fluentval validation library
 *
 * Shared enums and their string conversions used across all modules.
 */

#pragma once

#include <optional>
#include <string>

namespace fluentval::validation {

/// @brief Severity attached to a validation failure
enum class Severity {
    ERROR,
    WARNING,
    INFO
};

/// @brief How a rule proceeds after one of its validators fails
enum class CascadeMode {
    CONTINUE,  ///< Run every validator of the rule
    STOP       ///< Stop the rule at its first failure
};

/// @brief Kind of comparison performed by a comparison validator
enum class Comparison {
    EQUAL,
    NOT_EQUAL,
    LESS_THAN,
    GREATER_THAN,
    GREATER_THAN_OR_EQUAL,
    LESS_THAN_OR_EQUAL
};

inline std::string severityToString(Severity s) {
    switch (s) {
        case Severity::ERROR:   return "Error";
        case Severity::WARNING: return "Warning";
        case Severity::INFO:    return "Info";
    }
    return "Unknown";
}

inline std::string cascadeModeToString(CascadeMode m) {
    switch (m) {
        case CascadeMode::CONTINUE: return "Continue";
        case CascadeMode::STOP:     return "Stop";
    }
    return "Unknown";
}

inline std::string comparisonToString(Comparison c) {
    switch (c) {
        case Comparison::EQUAL:                 return "Equal";
        case Comparison::NOT_EQUAL:             return "NotEqual";
        case Comparison::LESS_THAN:             return "LessThan";
        case Comparison::GREATER_THAN:          return "GreaterThan";
        case Comparison::GREATER_THAN_OR_EQUAL: return "GreaterThanOrEqual";
        case Comparison::LESS_THAN_OR_EQUAL:    return "LessThanOrEqual";
    }
    return "Unknown";
}

/// @brief Parse "Error" / "Warning" / "Info" (case-insensitive)
std::optional<Severity> severityFromString(const std::string& s);

/// @brief Parse "Continue" / "Stop" (case-insensitive)
std::optional<CascadeMode> cascadeModeFromString(const std::string& s);

} // namespace fluentval::validation
