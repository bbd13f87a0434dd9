/**
 * @file comparison_validators.h
 * @brief Equality and ordering validators
 *
 * Equal / NotEqual treat two empty optionals as equal and an empty optional as
 * different from any value. Ordering validators pass when the property value is
 * empty and fail when the comparison value is empty. A NaN on either side
 * fails every ordering validator.
 */

#pragma once

#include <optional>
#include <string>
#include "comparers.h"
#include "comparison_target.h"
#include "property_validator.h"
#include "value_traits.h"

namespace fluentval::validation {

// ============================================================================
// Equality
// ============================================================================

template <typename T, typename P>
class AbstractEqualityValidator : public PropertyValidator<T, P>, public IComparisonValidator {
public:
    using ValueType = UnderlyingType<P>;
    using Comparer = EqualityComparer<ValueType>;

    explicit AbstractEqualityValidator(ValueType valueToCompare, Comparer comparer = nullptr)
        : target_(std::move(valueToCompare)), comparer_(comparerFor(std::move(comparer))) {}

    explicit AbstractEqualityValidator(Property<T, P> memberToCompare, Comparer comparer = nullptr)
        : target_(std::move(memberToCompare)), comparer_(comparerFor(std::move(comparer))) {}

    const std::optional<MemberInfo>& memberToCompare() const override { return target_.member(); }

    bool hasValueToCompare() const override { return target_.value().has_value(); }

    [[nodiscard]] const std::optional<ValueType>& valueToCompare() const noexcept { return target_.value(); }

    bool isValid(ValidationContext<T>& context, const P& value) const override {
        std::optional<ValueType> comparisonValue = target_.resolve(context.instanceToValidate());
        target_.describe(context.messageFormatter(), comparisonValue);

        bool equal = areEqual(toOptional(value), comparisonValue);
        return this->comparison() == Comparison::EQUAL ? equal : !equal;
    }

protected:
    bool areEqual(const std::optional<ValueType>& a, const std::optional<ValueType>& b) const {
        if (!a || !b) {
            return !a && !b;
        }
        return comparer_(*a, *b);
    }

private:
    static Comparer comparerFor(Comparer comparer) {
        return equalityComparerOrDefault<ValueType>(std::move(comparer));
    }

    ComparisonTarget<T, P> target_;
    Comparer comparer_;
};

template <typename T, typename P>
class EqualValidator : public AbstractEqualityValidator<T, P> {
public:
    using AbstractEqualityValidator<T, P>::AbstractEqualityValidator;

    std::string name() const override { return "EqualValidator"; }
    Comparison comparison() const override { return Comparison::EQUAL; }
};

template <typename T, typename P>
class NotEqualValidator : public AbstractEqualityValidator<T, P> {
public:
    using AbstractEqualityValidator<T, P>::AbstractEqualityValidator;

    std::string name() const override { return "NotEqualValidator"; }
    Comparison comparison() const override { return Comparison::NOT_EQUAL; }
};

// ============================================================================
// Ordering
// ============================================================================

template <typename T, typename P>
class AbstractComparisonValidator : public PropertyValidator<T, P>, public IComparisonValidator {
public:
    using ValueType = UnderlyingType<P>;
    using Comparer = ThreeWayComparer<ValueType>;

    explicit AbstractComparisonValidator(ValueType valueToCompare, Comparer comparer = nullptr)
        : target_(std::move(valueToCompare)), comparer_(comparerFor(std::move(comparer))) {}

    explicit AbstractComparisonValidator(Property<T, P> memberToCompare, Comparer comparer = nullptr)
        : target_(std::move(memberToCompare)), comparer_(comparerFor(std::move(comparer))) {}

    const std::optional<MemberInfo>& memberToCompare() const override { return target_.member(); }

    bool hasValueToCompare() const override { return target_.value().has_value(); }

    [[nodiscard]] const std::optional<ValueType>& valueToCompare() const noexcept { return target_.value(); }

    bool isValid(ValidationContext<T>& context, const P& value) const override {
        if (!NullableTraits<P>::hasValue(value)) {
            return true;
        }

        std::optional<ValueType> comparisonValue = target_.resolve(context.instanceToValidate());
        target_.describe(context.messageFormatter(), comparisonValue);
        if (!comparisonValue) {
            return false;
        }

        const ValueType& actual = NullableTraits<P>::value(value);
        if (isUnordered(actual) || isUnordered(*comparisonValue)) {
            return false;
        }
        return isSatisfiedBy(comparer_(actual, *comparisonValue));
    }

protected:
    /// @param result three-way result of (property value, comparison value)
    virtual bool isSatisfiedBy(int result) const = 0;

private:
    static Comparer comparerFor(Comparer comparer) {
        return comparerOrDefault<ValueType>(std::move(comparer));
    }

    ComparisonTarget<T, P> target_;
    Comparer comparer_;
};

template <typename T, typename P>
class LessThanValidator : public AbstractComparisonValidator<T, P> {
public:
    using AbstractComparisonValidator<T, P>::AbstractComparisonValidator;

    std::string name() const override { return "LessThanValidator"; }
    Comparison comparison() const override { return Comparison::LESS_THAN; }

protected:
    bool isSatisfiedBy(int result) const override { return result < 0; }
};

template <typename T, typename P>
class LessThanOrEqualValidator : public AbstractComparisonValidator<T, P> {
public:
    using AbstractComparisonValidator<T, P>::AbstractComparisonValidator;

    std::string name() const override { return "LessThanOrEqualValidator"; }
    Comparison comparison() const override { return Comparison::LESS_THAN_OR_EQUAL; }

protected:
    bool isSatisfiedBy(int result) const override { return result <= 0; }
};

template <typename T, typename P>
class GreaterThanValidator : public AbstractComparisonValidator<T, P> {
public:
    using AbstractComparisonValidator<T, P>::AbstractComparisonValidator;

    std::string name() const override { return "GreaterThanValidator"; }
    Comparison comparison() const override { return Comparison::GREATER_THAN; }

protected:
    bool isSatisfiedBy(int result) const override { return result > 0; }
};

template <typename T, typename P>
class GreaterThanOrEqualValidator : public AbstractComparisonValidator<T, P> {
public:
    using AbstractComparisonValidator<T, P>::AbstractComparisonValidator;

    std::string name() const override { return "GreaterThanOrEqualValidator"; }
    Comparison comparison() const override { return Comparison::GREATER_THAN_OR_EQUAL; }

protected:
    bool isSatisfiedBy(int result) const override { return result >= 0; }
};

} // namespace fluentval::validation
