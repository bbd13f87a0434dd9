/**
 * @file validation_exception.cpp
 * @brief ValidationException implementation
 */

#include "fluentval/validation/validation_exception.h"

namespace fluentval::validation {

ValidationException::ValidationException(std::vector<ValidationFailure> errors)
    : common::FluentValidationException(buildMessage(errors)),
      errors_(std::move(errors)) {}

std::string ValidationException::buildMessage(const std::vector<ValidationFailure>& errors) {
    std::string message = "Validation failed: ";
    for (const auto& failure : errors) {
        message += "\n -- " + failure.propertyName + ": " + failure.errorMessage +
                   " Severity: " + severityToString(failure.severity);
    }
    return message;
}

} // namespace fluentval::validation
