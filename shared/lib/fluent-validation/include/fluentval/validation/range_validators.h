/**
 * @file range_validators.h
 * @brief Inclusive and exclusive range validators
 *
 * Bounds are checked when the validator is built: a range whose upper bound
 * compares below its lower bound throws ArgumentOutOfRangeException, so a
 * malformed rule never reaches validate(). A NaN bound is rejected the same
 * way and a NaN value is never in range. Empty optionals pass.
 */

#pragma once

#include <memory>
#include <string>
#include "comparers.h"
#include "message_formatter.h"
#include "property_validator.h"
#include "value_traits.h"
#include "exception/exceptions.h"

namespace fluentval::validation {

template <typename T, typename P>
class RangeValidator : public PropertyValidator<T, P> {
public:
    using ValueType = UnderlyingType<P>;
    using Comparer = ThreeWayComparer<ValueType>;

    RangeValidator(ValueType from, ValueType to, Comparer comparer = nullptr)
        : from_(std::move(from)), to_(std::move(to)),
          comparer_(comparerOrDefault<ValueType>(std::move(comparer))) {
        if (isUnordered(from_)) {
            throw common::ArgumentOutOfRangeException("from", "From should be a number.");
        }
        if (isUnordered(to_)) {
            throw common::ArgumentOutOfRangeException("to", "To should be a number.");
        }
        if (comparer_(to_, from_) < 0) {
            throw common::ArgumentOutOfRangeException("to", "To should be larger than from.");
        }
    }

    [[nodiscard]] const ValueType& from() const noexcept { return from_; }
    [[nodiscard]] const ValueType& to() const noexcept { return to_; }

    bool isValid(ValidationContext<T>& context, const P& value) const override {
        if (!NullableTraits<P>::hasValue(value)) {
            return true;
        }

        const ValueType& actual = NullableTraits<P>::value(value);
        if (isUnordered(actual) || hasError(actual)) {
            context.messageFormatter()
                .appendArgument(MessageFormatter::FROM, renderValue(from_))
                .appendArgument(MessageFormatter::TO, renderValue(to_));
            return false;
        }
        return true;
    }

protected:
    virtual bool hasError(const ValueType& value) const = 0;

    int compare(const ValueType& a, const ValueType& b) const { return comparer_(a, b); }

private:
    ValueType from_;
    ValueType to_;
    Comparer comparer_;
};

/// @brief Passes when from <= value <= to
template <typename T, typename P>
class InclusiveBetweenValidator : public RangeValidator<T, P> {
public:
    using RangeValidator<T, P>::RangeValidator;

    std::string name() const override { return "InclusiveBetweenValidator"; }

protected:
    bool hasError(const typename RangeValidator<T, P>::ValueType& value) const override {
        return this->compare(value, this->from()) < 0 || this->compare(value, this->to()) > 0;
    }
};

/// @brief Passes when from < value < to
template <typename T, typename P>
class ExclusiveBetweenValidator : public RangeValidator<T, P> {
public:
    using RangeValidator<T, P>::RangeValidator;

    std::string name() const override { return "ExclusiveBetweenValidator"; }

protected:
    bool hasError(const typename RangeValidator<T, P>::ValueType& value) const override {
        return this->compare(value, this->from()) <= 0 || this->compare(value, this->to()) >= 0;
    }
};

/**
 * @brief Standalone construction of range validators
 */
class RangeValidatorFactory {
public:
    template <typename T, typename P>
    static std::unique_ptr<InclusiveBetweenValidator<T, P>> createInclusiveBetween(
        UnderlyingType<P> from, UnderlyingType<P> to,
        ThreeWayComparer<UnderlyingType<P>> comparer = nullptr) {
        return std::make_unique<InclusiveBetweenValidator<T, P>>(
            std::move(from), std::move(to), std::move(comparer));
    }

    template <typename T, typename P>
    static std::unique_ptr<ExclusiveBetweenValidator<T, P>> createExclusiveBetween(
        UnderlyingType<P> from, UnderlyingType<P> to,
        ThreeWayComparer<UnderlyingType<P>> comparer = nullptr) {
        return std::make_unique<ExclusiveBetweenValidator<T, P>>(
            std::move(from), std::move(to), std::move(comparer));
    }
};

} // namespace fluentval::validation
