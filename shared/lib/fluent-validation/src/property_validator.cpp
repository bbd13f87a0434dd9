/**
 * @file property_validator.cpp
 * @brief Default message lookup for property validators
 */

#include "fluentval/validation/property_validator.h"
#include "fluentval/validation/validator_options.h"

namespace fluentval::validation {

std::string IPropertyValidator::defaultMessageTemplate() const {
    return ValidatorOptions::global().languageManager().getString(name());
}

} // namespace fluentval::validation
