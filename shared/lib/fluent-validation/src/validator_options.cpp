/**
 * @file validator_options.cpp
 * @brief ValidatorOptions implementation
 */

#include "fluentval/validation/validator_options.h"
#include "fluentval/utils/string_utils.h"
#include "config/config_manager.h"
#include "exception/exceptions.h"
#include "logging/logger.h"
#include <spdlog/spdlog.h>

namespace fluentval::validation {

ValidatorOptions& ValidatorOptions::global() {
    static ValidatorOptions instance;
    return instance;
}

DisplayNameResolver ValidatorOptions::displayNameResolver() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return displayNameResolver_;
}

void ValidatorOptions::setDisplayNameResolver(DisplayNameResolver resolver) {
    std::lock_guard<std::mutex> lock(mutex_);
    displayNameResolver_ = std::move(resolver);
}

CascadeMode ValidatorOptions::defaultCascadeMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cascadeMode_;
}

void ValidatorOptions::setDefaultCascadeMode(CascadeMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    cascadeMode_ = mode;
}

Severity ValidatorOptions::defaultSeverity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return severity_;
}

void ValidatorOptions::setDefaultSeverity(Severity severity) {
    std::lock_guard<std::mutex> lock(mutex_);
    severity_ = severity;
}

std::string ValidatorOptions::resolveDisplayName(const std::type_index& type, const MemberInfo& member) const {
    // Copy so the resolver runs without holding the lock
    DisplayNameResolver resolver = displayNameResolver();
    if (resolver) {
        std::string name = resolver(type, member);
        if (!name.empty()) {
            return name;
        }
    }
    return utils::splitPascalCase(member.name);
}

void ValidatorOptions::loadFromConfig(const common::ConfigManager& config, bool strict) {
    using common::ConfigManager;

    std::string cascade = config.getString(ConfigManager::CASCADE_MODE);
    if (!cascade.empty()) {
        if (auto mode = cascadeModeFromString(cascade)) {
            setDefaultCascadeMode(*mode);
            spdlog::info("Default cascade mode: {}", cascadeModeToString(*mode));
        } else if (strict) {
            throw common::ConfigException(std::string(ConfigManager::CASCADE_MODE) + "=" + cascade);
        } else {
            spdlog::warn("Ignoring invalid {}: {}", ConfigManager::CASCADE_MODE, cascade);
        }
    }

    std::string severity = config.getString(ConfigManager::DEFAULT_SEVERITY);
    if (!severity.empty()) {
        if (auto parsed = severityFromString(severity)) {
            setDefaultSeverity(*parsed);
            spdlog::info("Default severity: {}", severityToString(*parsed));
        } else if (strict) {
            throw common::ConfigException(std::string(ConfigManager::DEFAULT_SEVERITY) + "=" + severity);
        } else {
            spdlog::warn("Ignoring invalid {}: {}", ConfigManager::DEFAULT_SEVERITY, severity);
        }
    }

    std::string logLevel = config.getString(ConfigManager::LOG_LEVEL);
    if (!logLevel.empty()) {
        if (!common::Logger::isKnownLevel(logLevel) && strict) {
            throw common::ConfigException(std::string(ConfigManager::LOG_LEVEL) + "=" + logLevel);
        }
        common::Logger::setLevel(logLevel);
    }
}

void ValidatorOptions::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        displayNameResolver_ = nullptr;
        cascadeMode_ = CascadeMode::CONTINUE;
        severity_ = Severity::ERROR;
    }
    languageManager_.reset();
}

DisplayNameResolverScope::DisplayNameResolverScope(DisplayNameResolver resolver)
    : previous_(ValidatorOptions::global().displayNameResolver()) {
    ValidatorOptions::global().setDisplayNameResolver(std::move(resolver));
}

DisplayNameResolverScope::~DisplayNameResolverScope() {
    ValidatorOptions::global().setDisplayNameResolver(std::move(previous_));
}

} // namespace fluentval::validation
