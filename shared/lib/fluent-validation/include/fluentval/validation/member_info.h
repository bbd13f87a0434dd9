/**
 * @file member_info.h
 * @brief Explicit member descriptors
 *
 * A rule targets a member of T through a Property<T, P>: a name plus an
 * accessor. Names are supplied by the caller; nothing is discovered at runtime.
 *
 * @code
 *   auto surname = property("Surname", &Person::surname);
 *   auto age = property<Person, int>("Age", [](const Person& p) { return p.age(); });
 * @endcode
 */

#pragma once

#include <functional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include "exception/exceptions.h"

namespace fluentval::validation {

/// @brief Identity of a member: its name and declaring type
struct MemberInfo {
    std::string name;
    std::type_index declaringType;

    bool operator==(const MemberInfo& other) const {
        return name == other.name && declaringType == other.declaringType;
    }
    bool operator!=(const MemberInfo& other) const {
        return !(*this == other);
    }
};

/// @brief MemberInfo for member `name` of T
template <typename T>
MemberInfo memberOf(const std::string& name) {
    return MemberInfo{name, std::type_index(typeid(T))};
}

/**
 * @brief Named accessor for a member of T with value type P
 */
template <typename T, typename P>
class Property {
public:
    using Getter = std::function<P(const T&)>;

    Property(const std::string& name, Getter getter)
        : member_(memberOf<T>(name)), getter_(std::move(getter)) {
        if (name.empty()) {
            throw common::RuleConfigurationException("property name must not be empty");
        }
        if (!getter_) {
            throw common::RuleConfigurationException("property '" + name + "' has no accessor");
        }
    }

    [[nodiscard]] const MemberInfo& member() const noexcept { return member_; }
    [[nodiscard]] const std::string& name() const noexcept { return member_.name; }

    P get(const T& instance) const { return getter_(instance); }

private:
    MemberInfo member_;
    Getter getter_;
};

/// @brief Property from a pointer to data member (T and P deduced)
template <typename T, typename P>
Property<T, P> property(const std::string& name, P T::*field) {
    return Property<T, P>(name, [field](const T& instance) { return instance.*field; });
}

/// @brief Property from any accessor callable (T and P explicit)
template <typename T, typename P>
Property<T, P> property(const std::string& name, typename Property<T, P>::Getter getter) {
    return Property<T, P>(name, std::move(getter));
}

} // namespace fluentval::validation
