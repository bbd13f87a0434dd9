/**
 * @file value_traits.h
 * @brief Nullable unwrapping and value rendering for messages
 */

#pragma once

#include <locale>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace fluentval::validation {

/**
 * @brief Uniform access to possibly-empty property values
 *
 * Plain types always hold a value; std::optional<V> is unwrapped to V.
 */
template <typename P>
struct NullableTraits {
    using ValueType = P;
    static constexpr bool nullable = false;

    static bool hasValue(const P&) noexcept { return true; }
    static const P& value(const P& p) noexcept { return p; }
};

template <typename V>
struct NullableTraits<std::optional<V>> {
    using ValueType = V;
    static constexpr bool nullable = true;

    static bool hasValue(const std::optional<V>& p) noexcept { return p.has_value(); }
    static const V& value(const std::optional<V>& p) { return *p; }
};

/// @brief Value type a validator compares against for property type P
template <typename P>
using UnderlyingType = typename NullableTraits<P>::ValueType;

/// @brief P as an optional of its underlying type
template <typename P>
std::optional<UnderlyingType<P>> toOptional(const P& value) {
    if (!NullableTraits<P>::hasValue(value)) {
        return std::nullopt;
    }
    return NullableTraits<P>::value(value);
}

namespace detail {

template <typename V, typename = void>
struct IsStreamable : std::false_type {};

template <typename V>
struct IsStreamable<V, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const V&>())>>
    : std::true_type {};

template <typename V>
struct IsOptional : std::false_type {};

template <typename V>
struct IsOptional<std::optional<V>> : std::true_type {};

} // namespace detail

/**
 * @brief Render a value for message placeholders
 *
 * Empty optionals and types without operator<< render as "".
 * Numbers use the shortest round-trip form, independent of the global locale.
 */
template <typename V>
std::string renderValue(const V& value) {
    if constexpr (detail::IsOptional<V>::value) {
        return value.has_value() ? renderValue(*value) : std::string();
    } else if constexpr (std::is_same_v<V, std::string>) {
        return value;
    } else if constexpr (std::is_same_v<V, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<V>) {
        return fmt::format("{}", value);
    } else if constexpr (detail::IsStreamable<V>::value) {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << value;
        return oss.str();
    } else {
        return std::string();
    }
}

} // namespace fluentval::validation
