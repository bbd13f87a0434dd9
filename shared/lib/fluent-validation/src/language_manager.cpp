/**
 * @file language_manager.cpp
 * @brief LanguageManager implementation
 */

#include "fluentval/validation/language_manager.h"
#include <spdlog/spdlog.h>

namespace fluentval::validation {

std::map<std::string, std::string> LanguageManager::builtInTemplates() {
    return {
        {"EqualValidator", "'{PropertyName}' must be equal to '{ComparisonValue}'."},
        {"NotEqualValidator", "'{PropertyName}' must not be equal to '{ComparisonValue}'."},
        {"LessThanValidator", "'{PropertyName}' must be less than '{ComparisonValue}'."},
        {"LessThanOrEqualValidator", "'{PropertyName}' must be less than or equal to '{ComparisonValue}'."},
        {"GreaterThanValidator", "'{PropertyName}' must be greater than '{ComparisonValue}'."},
        {"GreaterThanOrEqualValidator", "'{PropertyName}' must be greater than or equal to '{ComparisonValue}'."},
        {"InclusiveBetweenValidator",
         "'{PropertyName}' must be between {From} and {To}. You entered {PropertyValue}."},
        {"ExclusiveBetweenValidator",
         "'{PropertyName}' must be between {From} and {To} (exclusive). You entered {PropertyValue}."},
    };
}

LanguageManager::LanguageManager() : templates_(builtInTemplates()) {}

std::string LanguageManager::getString(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = templates_.find(key);
    if (it == templates_.end()) {
        spdlog::warn("No message template registered for '{}'", key);
        return "";
    }
    return it->second;
}

bool LanguageManager::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return templates_.find(key) != templates_.end();
}

void LanguageManager::addTemplate(const std::string& key, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    templates_[key] = text;
    spdlog::debug("Message template overridden: {}", key);
}

void LanguageManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    templates_ = builtInTemplates();
}

} // namespace fluentval::validation
