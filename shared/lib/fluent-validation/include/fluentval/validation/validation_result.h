/**
 * @file validation_result.h
 * @brief Validation failure and result types
 */

#pragma once

#include <string>
#include <vector>
#include "types.h"

namespace fluentval::validation {

/// @brief A single failed check
struct ValidationFailure {
    std::string propertyName;     ///< Member name, or the overridden property name
    std::string errorMessage;     ///< Message with all placeholders substituted
    std::string attemptedValue;   ///< Rendered value that failed (empty if not renderable)
    std::string errorCode;        ///< Custom code, or the validator name by default
    Severity severity = Severity::ERROR;

    std::string toString() const { return errorMessage; }
};

/**
 * @brief Outcome of validating one instance
 *
 * Valid iff it holds no failures.
 */
class ValidationResult {
public:
    ValidationResult() = default;
    explicit ValidationResult(std::vector<ValidationFailure> errors);

    [[nodiscard]] bool isValid() const noexcept { return errors_.empty(); }

    [[nodiscard]] const std::vector<ValidationFailure>& errors() const noexcept { return errors_; }

    void addError(ValidationFailure failure);

    /// @brief Append all failures of another result
    void merge(const ValidationResult& other);

    /// @brief Error messages joined by separator
    std::string toString(const std::string& separator = "\n") const;

private:
    std::vector<ValidationFailure> errors_;
};

} // namespace fluentval::validation
