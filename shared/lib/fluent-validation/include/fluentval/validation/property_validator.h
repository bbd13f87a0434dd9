/**
 * @file property_validator.h
 * @brief Validator interfaces
 *
 * IPropertyValidator is the type-erased view used by descriptors and
 * message lookup. PropertyValidator<T, P> adds the typed check.
 * IComparisonValidator exposes comparison metadata for introspection.
 */

#pragma once

#include <optional>
#include <string>
#include "types.h"
#include "member_info.h"
#include "validation_context.h"

namespace fluentval::validation {

class IPropertyValidator {
public:
    virtual ~IPropertyValidator() = default;

    /// @brief Validator name, also the key of its default message template
    virtual std::string name() const = 0;

    /// @brief Template registered for name() in the global LanguageManager
    virtual std::string defaultMessageTemplate() const;
};

template <typename T, typename P>
class PropertyValidator : public IPropertyValidator {
public:
    /**
     * @brief Check one property value
     *
     * May append placeholder arguments to context.messageFormatter().
     * @return true if the value passes
     */
    virtual bool isValid(ValidationContext<T>& context, const P& value) const = 0;
};

class IComparisonValidator {
public:
    virtual ~IComparisonValidator() = default;

    virtual Comparison comparison() const = 0;

    /// @brief Compared member, set only when comparing against another property
    virtual const std::optional<MemberInfo>& memberToCompare() const = 0;

    /// @brief True when comparing against a fixed value
    virtual bool hasValueToCompare() const = 0;
};

} // namespace fluentval::validation
