/**
 * @file language_manager.h
 * @brief Default message templates keyed by validator name
 */

#pragma once

#include <map>
#include <mutex>
#include <string>

namespace fluentval::validation {

/**
 * @brief Registry of message templates
 *
 * Starts with the built-in English templates. Applications may override a
 * template per validator name; reset() restores the built-ins.
 * Thread-safe.
 */
class LanguageManager {
public:
    LanguageManager();

    LanguageManager(const LanguageManager&) = delete;
    LanguageManager& operator=(const LanguageManager&) = delete;

    /**
     * @brief Template for a validator
     * @param key Validator name (e.g., "EqualValidator")
     * @return Template text, or empty string if unknown
     */
    std::string getString(const std::string& key) const;

    bool has(const std::string& key) const;

    /// @brief Add or override a template
    void addTemplate(const std::string& key, const std::string& text);

    /// @brief Restore the built-in templates
    void reset();

private:
    static std::map<std::string, std::string> builtInTemplates();

    std::map<std::string, std::string> templates_;
    mutable std::mutex mutex_;
};

} // namespace fluentval::validation
