/**
 * @file validation_exception.h
 * @brief Exception carrying the failures of validateAndThrow()
 */

#pragma once

#include <string>
#include <vector>
#include "validation_result.h"
#include "exception/exceptions.h"

namespace fluentval::validation {

class ValidationException : public common::FluentValidationException {
public:
    explicit ValidationException(std::vector<ValidationFailure> errors);

    [[nodiscard]] const std::vector<ValidationFailure>& errors() const noexcept { return errors_; }

private:
    /// "Validation failed: \n -- Prop: message Severity: Error" per failure
    static std::string buildMessage(const std::vector<ValidationFailure>& errors);

    std::vector<ValidationFailure> errors_;
};

} // namespace fluentval::validation
