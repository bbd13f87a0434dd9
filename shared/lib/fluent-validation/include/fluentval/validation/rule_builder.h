/**
 * @file rule_builder.h
 * @brief Fluent configuration of a PropertyRule
 *
 * @code
 *   ruleFor("Surname", &Person::surname)
 *       .equal(property("Forename", &Person::forename), StringComparer::ordinalIgnoreCase())
 *       .withMessage("{PropertyName} must match {ComparisonProperty}")
 *       .when([](const Person& p) { return p.id > 0; });
 * @endcode
 *
 * Message, error code and severity modifiers apply to the validator added last;
 * when() / unless() apply to every validator added before them.
 */

#pragma once

#include <memory>
#include <string>
#include "comparers.h"
#include "comparison_validators.h"
#include "member_info.h"
#include "property_rule.h"
#include "range_validators.h"

namespace fluentval::validation {

template <typename T, typename P>
class RuleBuilder {
public:
    using ValueType = UnderlyingType<P>;
    using Condition = typename RuleComponent<T, P>::Condition;

    explicit RuleBuilder(PropertyRule<T, P>& rule) : rule_(&rule) {}

    RuleBuilder& setValidator(std::unique_ptr<PropertyValidator<T, P>> validator) {
        rule_->addComponent(std::move(validator));
        return *this;
    }

    // --- Equality ---

    RuleBuilder& equal(const ValueType& value, EqualityComparer<ValueType> comparer = nullptr) {
        return setValidator(std::make_unique<EqualValidator<T, P>>(value, std::move(comparer)));
    }

    RuleBuilder& equal(const ValueType& value, const StringComparer& comparer) {
        return equal(value, comparer.asEqualityComparer());
    }

    RuleBuilder& equal(const Property<T, P>& other, EqualityComparer<ValueType> comparer = nullptr) {
        return setValidator(std::make_unique<EqualValidator<T, P>>(other, std::move(comparer)));
    }

    RuleBuilder& equal(const Property<T, P>& other, const StringComparer& comparer) {
        return equal(other, comparer.asEqualityComparer());
    }

    RuleBuilder& notEqual(const ValueType& value, EqualityComparer<ValueType> comparer = nullptr) {
        return setValidator(std::make_unique<NotEqualValidator<T, P>>(value, std::move(comparer)));
    }

    RuleBuilder& notEqual(const ValueType& value, const StringComparer& comparer) {
        return notEqual(value, comparer.asEqualityComparer());
    }

    RuleBuilder& notEqual(const Property<T, P>& other, EqualityComparer<ValueType> comparer = nullptr) {
        return setValidator(std::make_unique<NotEqualValidator<T, P>>(other, std::move(comparer)));
    }

    RuleBuilder& notEqual(const Property<T, P>& other, const StringComparer& comparer) {
        return notEqual(other, comparer.asEqualityComparer());
    }

    // --- Ordering ---

    RuleBuilder& lessThan(const ValueType& value, ThreeWayComparer<ValueType> comparer = nullptr) {
        return setValidator(std::make_unique<LessThanValidator<T, P>>(value, std::move(comparer)));
    }

    RuleBuilder& lessThan(const ValueType& value, const StringComparer& comparer) {
        return lessThan(value, comparer.asComparer());
    }

    RuleBuilder& lessThan(const Property<T, P>& other, ThreeWayComparer<ValueType> comparer = nullptr) {
        return setValidator(std::make_unique<LessThanValidator<T, P>>(other, std::move(comparer)));
    }

    RuleBuilder& lessThan(const Property<T, P>& other, const StringComparer& comparer) {
        return lessThan(other, comparer.asComparer());
    }

    RuleBuilder& lessThanOrEqualTo(const ValueType& value, ThreeWayComparer<ValueType> comparer = nullptr) {
        return setValidator(std::make_unique<LessThanOrEqualValidator<T, P>>(value, std::move(comparer)));
    }

    RuleBuilder& lessThanOrEqualTo(const ValueType& value, const StringComparer& comparer) {
        return lessThanOrEqualTo(value, comparer.asComparer());
    }

    RuleBuilder& lessThanOrEqualTo(const Property<T, P>& other, ThreeWayComparer<ValueType> comparer = nullptr) {
        return setValidator(std::make_unique<LessThanOrEqualValidator<T, P>>(other, std::move(comparer)));
    }

    RuleBuilder& lessThanOrEqualTo(const Property<T, P>& other, const StringComparer& comparer) {
        return lessThanOrEqualTo(other, comparer.asComparer());
    }

    RuleBuilder& greaterThan(const ValueType& value, ThreeWayComparer<ValueType> comparer = nullptr) {
        return setValidator(std::make_unique<GreaterThanValidator<T, P>>(value, std::move(comparer)));
    }

    RuleBuilder& greaterThan(const ValueType& value, const StringComparer& comparer) {
        return greaterThan(value, comparer.asComparer());
    }

    RuleBuilder& greaterThan(const Property<T, P>& other, ThreeWayComparer<ValueType> comparer = nullptr) {
        return setValidator(std::make_unique<GreaterThanValidator<T, P>>(other, std::move(comparer)));
    }

    RuleBuilder& greaterThan(const Property<T, P>& other, const StringComparer& comparer) {
        return greaterThan(other, comparer.asComparer());
    }

    RuleBuilder& greaterThanOrEqualTo(const ValueType& value, ThreeWayComparer<ValueType> comparer = nullptr) {
        return setValidator(std::make_unique<GreaterThanOrEqualValidator<T, P>>(value, std::move(comparer)));
    }

    RuleBuilder& greaterThanOrEqualTo(const ValueType& value, const StringComparer& comparer) {
        return greaterThanOrEqualTo(value, comparer.asComparer());
    }

    RuleBuilder& greaterThanOrEqualTo(const Property<T, P>& other, ThreeWayComparer<ValueType> comparer = nullptr) {
        return setValidator(std::make_unique<GreaterThanOrEqualValidator<T, P>>(other, std::move(comparer)));
    }

    RuleBuilder& greaterThanOrEqualTo(const Property<T, P>& other, const StringComparer& comparer) {
        return greaterThanOrEqualTo(other, comparer.asComparer());
    }

    // --- Ranges ---

    /// @throws common::ArgumentOutOfRangeException if to compares below from
    RuleBuilder& inclusiveBetween(const ValueType& from, const ValueType& to,
                                  ThreeWayComparer<ValueType> comparer = nullptr) {
        return setValidator(RangeValidatorFactory::createInclusiveBetween<T, P>(from, to, std::move(comparer)));
    }

    RuleBuilder& inclusiveBetween(const ValueType& from, const ValueType& to, const StringComparer& comparer) {
        return inclusiveBetween(from, to, comparer.asComparer());
    }

    /// @throws common::ArgumentOutOfRangeException if to compares below from
    RuleBuilder& exclusiveBetween(const ValueType& from, const ValueType& to,
                                  ThreeWayComparer<ValueType> comparer = nullptr) {
        return setValidator(RangeValidatorFactory::createExclusiveBetween<T, P>(from, to, std::move(comparer)));
    }

    RuleBuilder& exclusiveBetween(const ValueType& from, const ValueType& to, const StringComparer& comparer) {
        return exclusiveBetween(from, to, comparer.asComparer());
    }

    // --- Modifiers ---

    RuleBuilder& withMessage(const std::string& messageTemplate) {
        rule_->lastComponent().setMessage(messageTemplate);
        return *this;
    }

    RuleBuilder& withErrorCode(const std::string& code) {
        rule_->lastComponent().setErrorCode(code);
        return *this;
    }

    RuleBuilder& withSeverity(Severity severity) {
        rule_->lastComponent().setSeverity(severity);
        return *this;
    }

    /// @brief Override {PropertyName} for this rule
    RuleBuilder& withName(const std::string& displayName) {
        rule_->setDisplayName(displayName);
        return *this;
    }

    /// @brief Override ValidationFailure::propertyName for this rule
    RuleBuilder& overridePropertyName(const std::string& propertyName) {
        rule_->setPropertyName(propertyName);
        return *this;
    }

    RuleBuilder& cascade(CascadeMode mode) {
        rule_->setCascadeMode(mode);
        return *this;
    }

    RuleBuilder& when(Condition predicate) {
        rule_->applyCondition(predicate);
        return *this;
    }

    RuleBuilder& unless(Condition predicate) {
        return when([predicate](const T& instance) { return !predicate(instance); });
    }

private:
    PropertyRule<T, P>* rule_;
};

} // namespace fluentval::validation
