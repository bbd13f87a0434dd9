/**
 * @file validator_options.h
 * @brief Process-wide validator options
 *
 * Holds the display name resolver, default cascade mode and severity, and the
 * message templates. Values are read at validation time, so changes apply to
 * validators built earlier as well.
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include "types.h"
#include "member_info.h"
#include "language_manager.h"

namespace fluentval::common {
class ConfigManager;
}

namespace fluentval::validation {

/**
 * @brief Maps (declaring type, member) to a display name
 *
 * An empty return value means "no opinion": the default display name is used.
 */
using DisplayNameResolver = std::function<std::string(const std::type_index&, const MemberInfo&)>;

/**
 * @brief Global validator options (Singleton)
 */
class ValidatorOptions {
public:
    static ValidatorOptions& global();

    ValidatorOptions(const ValidatorOptions&) = delete;
    ValidatorOptions& operator=(const ValidatorOptions&) = delete;

    DisplayNameResolver displayNameResolver() const;
    void setDisplayNameResolver(DisplayNameResolver resolver);

    CascadeMode defaultCascadeMode() const;
    void setDefaultCascadeMode(CascadeMode mode);

    Severity defaultSeverity() const;
    void setDefaultSeverity(Severity severity);

    LanguageManager& languageManager() noexcept { return languageManager_; }

    /**
     * @brief Display name of a member
     *
     * The resolver's answer when it returns a non-empty name,
     * otherwise the member name split on PascalCase boundaries.
     */
    std::string resolveDisplayName(const std::type_index& type, const MemberInfo& member) const;

    /**
     * @brief Apply FLUENTVAL_* keys from configuration
     *
     * Reads cascade mode, default severity and log level. Unrecognized values are
     * logged and skipped, or rejected with ConfigException when strict is set.
     */
    void loadFromConfig(const common::ConfigManager& config, bool strict = false);

    /// @brief Restore defaults: no resolver, CONTINUE, ERROR, built-in templates
    void reset();

private:
    ValidatorOptions() = default;

    DisplayNameResolver displayNameResolver_;
    CascadeMode cascadeMode_ = CascadeMode::CONTINUE;
    Severity severity_ = Severity::ERROR;
    LanguageManager languageManager_;
    mutable std::mutex mutex_;
};

/**
 * @brief Installs a display name resolver for the lifetime of the scope
 *
 * The previous resolver is restored on destruction, also during unwinding.
 */
class DisplayNameResolverScope {
public:
    explicit DisplayNameResolverScope(DisplayNameResolver resolver);
    ~DisplayNameResolverScope();

    DisplayNameResolverScope(const DisplayNameResolverScope&) = delete;
    DisplayNameResolverScope& operator=(const DisplayNameResolverScope&) = delete;

private:
    DisplayNameResolver previous_;
};

} // namespace fluentval::validation
