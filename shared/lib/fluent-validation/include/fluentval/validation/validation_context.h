/**
 * @file validation_context.h
 * @brief Per-call state handed to property validators
 */

#pragma once

#include "message_formatter.h"

namespace fluentval::validation {

/**
 * @brief Instance under validation plus the message arguments collected so far
 *
 * Non-owning: the instance must outlive the context.
 */
template <typename T>
class ValidationContext {
public:
    explicit ValidationContext(const T& instance) : instance_(&instance) {}

    [[nodiscard]] const T& instanceToValidate() const noexcept { return *instance_; }

    MessageFormatter& messageFormatter() noexcept { return formatter_; }

private:
    const T* instance_;
    MessageFormatter formatter_;
};

} // namespace fluentval::validation
