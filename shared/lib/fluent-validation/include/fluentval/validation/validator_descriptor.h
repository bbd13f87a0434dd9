/**
 * @file validator_descriptor.h
 * @brief Read-only introspection of a validator's rules
 */

#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include "property_rule.h"

namespace fluentval::validation {

/**
 * @brief Describes which validators apply to which members
 *
 * Non-owning: the descriptor must not outlive the validator that created it.
 */
template <typename T>
class ValidatorDescriptor {
public:
    using RuleList = std::vector<std::unique_ptr<IValidationRule<T>>>;

    explicit ValidatorDescriptor(const RuleList& rules) : rules_(&rules) {}

    /// @brief Distinct member names with at least one rule, in declaration order
    std::vector<std::string> getMembersWithValidators() const {
        std::vector<std::string> names;
        for (const auto& rule : *rules_) {
            const std::string& name = rule->member().name;
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(name);
            }
        }
        return names;
    }

    /// @brief Components of every rule targeting the member
    std::vector<const IRuleComponent*> getValidatorsForMember(const std::string& name) const {
        std::vector<const IRuleComponent*> result;
        for (const auto& rule : *rules_) {
            if (rule->member().name != name) {
                continue;
            }
            for (const IRuleComponent* component : rule->components()) {
                result.push_back(component);
            }
        }
        return result;
    }

    /// @brief Display name of the first rule for the member, or "" if none
    std::string getName(const std::string& name) const {
        for (const auto& rule : *rules_) {
            if (rule->member().name == name) {
                return rule->displayName();
            }
        }
        return "";
    }

private:
    const RuleList* rules_;
};

} // namespace fluentval::validation
