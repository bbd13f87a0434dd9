/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exception types thrown by fluentval. Ordinary validation failures are
 * reported through ValidationResult, never through these types; exceptions
 * signal misconfigured rules, bad options, or an explicit validateAndThrow().
 */

#pragma once

#include <stdexcept>
#include <string>

namespace fluentval::common {

/**
 * @brief Base exception for all fluentval exceptions
 */
class FluentValidationException : public std::runtime_error {
public:
    explicit FluentValidationException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief An argument lies outside its permitted range
 *
 * Thrown when a range validator is built with an upper bound that compares
 * below its lower bound.
 */
class ArgumentOutOfRangeException : public FluentValidationException {
public:
    ArgumentOutOfRangeException(const std::string& paramName, const std::string& message)
        : FluentValidationException(message + " (Parameter '" + paramName + "')"),
          paramName_(paramName) {}

    [[nodiscard]] const std::string& getParamName() const noexcept {
        return paramName_;
    }

private:
    std::string paramName_;
};

/**
 * @brief A rule was configured in an invalid way
 *
 * e.g. empty property name, or withMessage() before any validator was added.
 */
class RuleConfigurationException : public FluentValidationException {
public:
    explicit RuleConfigurationException(const std::string& message)
        : FluentValidationException("Rule configuration error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public FluentValidationException {
public:
    explicit ConfigException(const std::string& message)
        : FluentValidationException("Configuration error: " + message) {}
};

} // namespace fluentval::common
