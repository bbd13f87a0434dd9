/**
 * @file comparers.h
 * @brief Equality and ordering comparers used by comparison validators
 */

#pragma once

#include <cmath>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include "exception/exceptions.h"

namespace fluentval::validation {

/// @brief Returns true when both values are considered equal
template <typename V>
using EqualityComparer = std::function<bool(const V&, const V&)>;

/// @brief Returns negative, zero or positive like strcmp
template <typename V>
using ThreeWayComparer = std::function<int(const V&, const V&)>;

/// @brief True for floating-point NaN, which has no place in an ordering
template <typename V>
bool isUnordered(const V& value) {
    if constexpr (std::is_floating_point_v<V>) {
        return std::isnan(value);
    } else {
        return false;
    }
}

/**
 * @brief operator== based equality
 *
 * Floating-point NaN equals NaN, so equal(NaN) accepts a NaN value.
 */
template <typename V>
bool defaultEquals(const V& a, const V& b) {
    if constexpr (std::is_floating_point_v<V>) {
        if (isUnordered(a) || isUnordered(b)) {
            return isUnordered(a) && isUnordered(b);
        }
    }
    return a == b;
}

/**
 * @brief operator< based three-way comparison
 *
 * Floating-point NaN sorts below every number and compares equal to NaN,
 * which keeps the order total. Ordering and range validators reject NaN
 * before consulting a comparer.
 */
template <typename V>
int defaultCompare(const V& a, const V& b) {
    if constexpr (std::is_floating_point_v<V>) {
        if (isUnordered(a) || isUnordered(b)) {
            return isUnordered(a) ? (isUnordered(b) ? 0 : -1) : 1;
        }
    }
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

namespace detail {

template <typename V, typename = void>
struct HasEqualTo : std::false_type {};

template <typename V>
struct HasEqualTo<V, std::void_t<decltype(std::declval<const V&>() == std::declval<const V&>())>>
    : std::true_type {};

template <typename V, typename = void>
struct HasLessThan : std::false_type {};

template <typename V>
struct HasLessThan<V, std::void_t<decltype(std::declval<const V&>() < std::declval<const V&>())>>
    : std::true_type {};

} // namespace detail

/**
 * @brief The given comparer, or operator== when none is given
 * @throws common::RuleConfigurationException if V has no operator== and no comparer is given
 */
template <typename V>
EqualityComparer<V> equalityComparerOrDefault(EqualityComparer<V> comparer) {
    if (comparer) {
        return comparer;
    }
    if constexpr (detail::HasEqualTo<V>::value) {
        return [](const V& a, const V& b) { return defaultEquals(a, b); };
    } else {
        throw common::RuleConfigurationException("values without operator== need an explicit comparer");
    }
}

/**
 * @brief The given comparer, or operator< when none is given
 * @throws common::RuleConfigurationException if V has no operator< and no comparer is given
 */
template <typename V>
ThreeWayComparer<V> comparerOrDefault(ThreeWayComparer<V> comparer) {
    if (comparer) {
        return comparer;
    }
    if constexpr (detail::HasLessThan<V>::value) {
        return [](const V& a, const V& b) { return defaultCompare(a, b); };
    } else {
        throw common::RuleConfigurationException("values without operator< need an explicit comparer");
    }
}

/**
 * @brief String comparison strategy
 *
 * ordinal() compares bytes; ordinalIgnoreCase() folds ASCII letters first.
 * Validators use ordinal comparison unless given another comparer.
 */
class StringComparer {
public:
    static StringComparer ordinal() { return StringComparer(false); }
    static StringComparer ordinalIgnoreCase() { return StringComparer(true); }

    bool equals(const std::string& a, const std::string& b) const;
    int compare(const std::string& a, const std::string& b) const;

    [[nodiscard]] bool ignoresCase() const noexcept { return ignoreCase_; }

    EqualityComparer<std::string> asEqualityComparer() const;
    ThreeWayComparer<std::string> asComparer() const;

private:
    explicit StringComparer(bool ignoreCase) : ignoreCase_(ignoreCase) {}

    bool ignoreCase_;
};

} // namespace fluentval::validation
