/**
 * @file abstract_validator.h
 * @brief Base class for validators of T
 *
 * Derive and declare rules in the constructor:
 * @code
 *   class PersonValidator : public AbstractValidator<Person> {
 *   public:
 *       PersonValidator() {
 *           ruleFor("Id", &Person::id).inclusiveBetween(1, 10);
 *           ruleFor("Surname", &Person::surname).notEqual(property("Forename", &Person::forename));
 *       }
 *   };
 * @endcode
 *
 * Validators are immutable once built and may be shared across threads as long
 * as the global ValidatorOptions are not modified concurrently.
 */

#pragma once

#include <memory>
#include <string>
#include <typeinfo>
#include <vector>
#include <spdlog/spdlog.h>
#include "member_info.h"
#include "property_rule.h"
#include "rule_builder.h"
#include "validation_context.h"
#include "validation_exception.h"
#include "validation_result.h"
#include "validator_descriptor.h"

namespace fluentval::validation {

template <typename T>
class AbstractValidator {
public:
    AbstractValidator() = default;
    virtual ~AbstractValidator() = default;

    AbstractValidator(const AbstractValidator&) = delete;
    AbstractValidator& operator=(const AbstractValidator&) = delete;

    /// @brief Start a rule for a data member
    template <typename P>
    RuleBuilder<T, P> ruleFor(const std::string& name, P T::*field) {
        return ruleFor(property(name, field));
    }

    /// @brief Start a rule for any named accessor
    template <typename P>
    RuleBuilder<T, P> ruleFor(Property<T, P> target) {
        auto rule = std::make_unique<PropertyRule<T, P>>(std::move(target));
        PropertyRule<T, P>& ref = *rule;
        rules_.push_back(std::move(rule));
        return RuleBuilder<T, P>(ref);
    }

    ValidationResult validate(const T& instance) const {
        spdlog::debug("Validating {} against {} rule(s)", typeid(T).name(), rules_.size());

        ValidationContext<T> context(instance);
        std::vector<ValidationFailure> failures;
        for (const auto& rule : rules_) {
            rule->validate(context, failures);
        }

        if (!failures.empty()) {
            spdlog::debug("Validation of {} produced {} failure(s)", typeid(T).name(), failures.size());
        }
        return ValidationResult(std::move(failures));
    }

    /// @throws ValidationException if the instance is not valid
    void validateAndThrow(const T& instance) const {
        ValidationResult result = validate(instance);
        if (!result.isValid()) {
            throw ValidationException(result.errors());
        }
    }

    ValidatorDescriptor<T> createDescriptor() const {
        return ValidatorDescriptor<T>(rules_);
    }

    [[nodiscard]] size_t ruleCount() const noexcept { return rules_.size(); }

private:
    std::vector<std::unique_ptr<IValidationRule<T>>> rules_;
};

} // namespace fluentval::validation
