/**
 * @file validation_result.cpp
 * @brief ValidationResult and enum parsing implementation
 */

#include "fluentval/validation/validation_result.h"
#include "fluentval/utils/string_utils.h"

namespace fluentval::validation {

std::optional<Severity> severityFromString(const std::string& s) {
    std::string lower = utils::toLower(utils::trim(s));
    if (lower == "error") return Severity::ERROR;
    if (lower == "warning") return Severity::WARNING;
    if (lower == "info") return Severity::INFO;
    return std::nullopt;
}

std::optional<CascadeMode> cascadeModeFromString(const std::string& s) {
    std::string lower = utils::toLower(utils::trim(s));
    if (lower == "continue") return CascadeMode::CONTINUE;
    if (lower == "stop") return CascadeMode::STOP;
    return std::nullopt;
}

ValidationResult::ValidationResult(std::vector<ValidationFailure> errors)
    : errors_(std::move(errors)) {}

void ValidationResult::addError(ValidationFailure failure) {
    errors_.push_back(std::move(failure));
}

void ValidationResult::merge(const ValidationResult& other) {
    errors_.insert(errors_.end(), other.errors_.begin(), other.errors_.end());
}

std::string ValidationResult::toString(const std::string& separator) const {
    std::vector<std::string> messages;
    messages.reserve(errors_.size());
    for (const auto& failure : errors_) {
        messages.push_back(failure.errorMessage);
    }
    return utils::join(messages, separator);
}

} // namespace fluentval::validation
