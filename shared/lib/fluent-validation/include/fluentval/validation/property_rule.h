/**
 * @file property_rule.h
 * @brief A rule: one property plus the validators attached to it
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeinfo>
#include <vector>
#include "member_info.h"
#include "property_validator.h"
#include "validation_context.h"
#include "validation_result.h"
#include "validator_options.h"
#include "value_traits.h"
#include "exception/exceptions.h"

namespace fluentval::validation {

/**
 * @brief Type-erased view of one validator inside a rule
 */
class IRuleComponent {
public:
    virtual ~IRuleComponent() = default;

    virtual const IPropertyValidator& validator() const = 0;

    /// @brief withMessage() template, or the validator's default template
    virtual std::string messageTemplate() const = 0;

    /// @brief withErrorCode() code, or the validator name
    virtual std::string errorCode() const = 0;

    /// @brief withSeverity() severity, or the global default
    virtual Severity severity() const = 0;

    virtual bool hasCondition() const = 0;
};

/**
 * @brief A validator plus its per-use customizations
 */
template <typename T, typename P>
class RuleComponent : public IRuleComponent {
public:
    using Condition = std::function<bool(const T&)>;

    explicit RuleComponent(std::unique_ptr<PropertyValidator<T, P>> validator)
        : validator_(std::move(validator)) {
        if (!validator_) {
            throw common::RuleConfigurationException("validator must not be null");
        }
    }

    const IPropertyValidator& validator() const override { return *validator_; }

    std::string messageTemplate() const override {
        return customMessage_ ? *customMessage_ : validator_->defaultMessageTemplate();
    }

    std::string errorCode() const override {
        return errorCode_ ? *errorCode_ : validator_->name();
    }

    Severity severity() const override {
        return severity_ ? *severity_ : ValidatorOptions::global().defaultSeverity();
    }

    bool hasCondition() const override { return !conditions_.empty(); }

    void setMessage(std::string messageTemplate) { customMessage_ = std::move(messageTemplate); }
    void setErrorCode(std::string code) { errorCode_ = std::move(code); }
    void setSeverity(Severity severity) { severity_ = severity; }
    void addCondition(Condition condition) { conditions_.push_back(std::move(condition)); }

    /// @brief All conditions hold for this instance
    bool shouldValidate(const T& instance) const {
        for (const auto& condition : conditions_) {
            if (!condition(instance)) {
                return false;
            }
        }
        return true;
    }

    bool invoke(ValidationContext<T>& context, const P& value) const {
        return validator_->isValid(context, value);
    }

private:
    std::unique_ptr<PropertyValidator<T, P>> validator_;
    std::optional<std::string> customMessage_;
    std::optional<std::string> errorCode_;
    std::optional<Severity> severity_;
    std::vector<Condition> conditions_;
};

/**
 * @brief Rule interface seen by AbstractValidator and descriptors
 */
template <typename T>
class IValidationRule {
public:
    virtual ~IValidationRule() = default;

    virtual const MemberInfo& member() const = 0;

    /// @brief Name used for {PropertyName}
    virtual std::string displayName() const = 0;

    virtual std::vector<const IRuleComponent*> components() const = 0;

    /// @brief Run the rule and append its failures
    virtual void validate(ValidationContext<T>& context, std::vector<ValidationFailure>& failures) const = 0;
};

template <typename T, typename P>
class PropertyRule : public IValidationRule<T> {
public:
    explicit PropertyRule(Property<T, P> property) : property_(std::move(property)) {}

    const MemberInfo& member() const override { return property_.member(); }

    std::string displayName() const override {
        if (displayNameOverride_) {
            return *displayNameOverride_;
        }
        return ValidatorOptions::global().resolveDisplayName(typeid(T), property_.member());
    }

    std::vector<const IRuleComponent*> components() const override {
        std::vector<const IRuleComponent*> result;
        result.reserve(components_.size());
        for (const auto& component : components_) {
            result.push_back(component.get());
        }
        return result;
    }

    void validate(ValidationContext<T>& context, std::vector<ValidationFailure>& failures) const override {
        if (components_.empty()) {
            return;
        }

        const T& instance = context.instanceToValidate();
        const P value = property_.get(instance);
        const std::string renderedValue = renderValue(value);
        const std::string name = displayName();
        const std::string propertyName = propertyNameOverride_ ? *propertyNameOverride_ : property_.name();
        const CascadeMode cascade = cascadeMode_ ? *cascadeMode_ : ValidatorOptions::global().defaultCascadeMode();

        for (const auto& component : components_) {
            if (!component->shouldValidate(instance)) {
                continue;
            }

            MessageFormatter& formatter = context.messageFormatter();
            formatter.reset();
            formatter.appendPropertyName(name).appendPropertyValue(renderedValue);

            if (component->invoke(context, value)) {
                continue;
            }

            ValidationFailure failure;
            failure.propertyName = propertyName;
            failure.errorMessage = formatter.buildMessage(component->messageTemplate());
            failure.attemptedValue = renderedValue;
            failure.errorCode = component->errorCode();
            failure.severity = component->severity();
            failures.push_back(std::move(failure));

            if (cascade == CascadeMode::STOP) {
                break;
            }
        }
    }

    RuleComponent<T, P>& addComponent(std::unique_ptr<PropertyValidator<T, P>> validator) {
        components_.push_back(std::make_unique<RuleComponent<T, P>>(std::move(validator)));
        return *components_.back();
    }

    /// @throws common::RuleConfigurationException if no validator was added yet
    RuleComponent<T, P>& lastComponent() {
        if (components_.empty()) {
            throw common::RuleConfigurationException(
                "rule for '" + property_.name() + "' has no validator to configure");
        }
        return *components_.back();
    }

    /// @brief Attach a condition to every component added so far
    void applyCondition(const typename RuleComponent<T, P>::Condition& condition) {
        for (auto& component : components_) {
            component->addCondition(condition);
        }
    }

    void setDisplayName(std::string name) { displayNameOverride_ = std::move(name); }
    void setPropertyName(std::string name) { propertyNameOverride_ = std::move(name); }
    void setCascadeMode(CascadeMode mode) { cascadeMode_ = mode; }

private:
    Property<T, P> property_;
    std::vector<std::unique_ptr<RuleComponent<T, P>>> components_;
    std::optional<std::string> displayNameOverride_;
    std::optional<std::string> propertyNameOverride_;
    std::optional<CascadeMode> cascadeMode_;
};

} // namespace fluentval::validation
