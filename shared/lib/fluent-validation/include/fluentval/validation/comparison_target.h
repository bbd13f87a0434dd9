/**
 * @file comparison_target.h
 * @brief What a comparison validator compares against
 *
 * Either a fixed value or another property of the same instance.
 */

#pragma once

#include <optional>
#include <string>
#include <typeinfo>
#include "member_info.h"
#include "message_formatter.h"
#include "validator_options.h"
#include "value_traits.h"

namespace fluentval::validation {

template <typename T, typename P>
class ComparisonTarget {
public:
    using ValueType = UnderlyingType<P>;

    explicit ComparisonTarget(ValueType value) : value_(std::move(value)) {}

    explicit ComparisonTarget(Property<T, P> property)
        : property_(std::move(property)), member_(property_->member()) {}

    /// @brief Value to compare against for this instance (empty if the property is empty)
    std::optional<ValueType> resolve(const T& instance) const {
        if (property_) {
            return toOptional(property_->get(instance));
        }
        return value_;
    }

    /// @brief Append {ComparisonValue} and {ComparisonProperty}
    void describe(MessageFormatter& formatter, const std::optional<ValueType>& resolved) const {
        formatter.appendArgument(MessageFormatter::COMPARISON_VALUE, renderValue(resolved));
        formatter.appendArgument(MessageFormatter::COMPARISON_PROPERTY,
            member_ ? ValidatorOptions::global().resolveDisplayName(typeid(T), *member_) : std::string());
    }

    [[nodiscard]] const std::optional<MemberInfo>& member() const noexcept { return member_; }
    [[nodiscard]] const std::optional<ValueType>& value() const noexcept { return value_; }

private:
    std::optional<ValueType> value_;
    std::optional<Property<T, P>> property_;
    std::optional<MemberInfo> member_;
};

} // namespace fluentval::validation
