/**
 * @file message_formatter.h
 * @brief Placeholder substitution for error message templates
 *
 * Templates reference arguments as {Name}. Names are case-sensitive;
 * placeholders without a matching argument are left in the output verbatim.
 */

#pragma once

#include <map>
#include <string>

namespace fluentval::validation {

class MessageFormatter {
public:
    static constexpr const char* PROPERTY_NAME = "PropertyName";
    static constexpr const char* PROPERTY_VALUE = "PropertyValue";
    static constexpr const char* COMPARISON_VALUE = "ComparisonValue";
    static constexpr const char* COMPARISON_PROPERTY = "ComparisonProperty";
    static constexpr const char* FROM = "From";
    static constexpr const char* TO = "To";

    /// @brief Add or replace an argument
    MessageFormatter& appendArgument(const std::string& name, const std::string& value);

    MessageFormatter& appendPropertyName(const std::string& name) {
        return appendArgument(PROPERTY_NAME, name);
    }

    MessageFormatter& appendPropertyValue(const std::string& value) {
        return appendArgument(PROPERTY_VALUE, value);
    }

    /// @brief Substitute every known {Name} in the template
    std::string buildMessage(const std::string& messageTemplate) const;

    /// @brief Drop all arguments
    void reset() { placeholderValues_.clear(); }

    [[nodiscard]] const std::map<std::string, std::string>& placeholderValues() const noexcept {
        return placeholderValues_;
    }

private:
    std::map<std::string, std::string> placeholderValues_;
};

} // namespace fluentval::validation
