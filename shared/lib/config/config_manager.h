/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Resolves FLUENTVAL_* settings from three places:
 * - explicit overrides (set(), or loaded from a KEY=VALUE file)
 * - the process environment
 * - the caller's default
 *
 * Later loads overwrite earlier ones; the environment is consulted live
 * for keys that were never stored.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fluentval::common {

/// @brief Where a configuration value came from
enum class ConfigSource {
    NONE,
    OVERRIDE,
    FILE,
    ENVIRONMENT
};

std::string configSourceToString(ConfigSource source);

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    struct Entry {
        std::string value;
        ConfigSource source;
    };

    std::map<std::string, Entry> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

    void store(const std::string& key, const std::string& value, ConfigSource source);
    std::optional<Entry> lookup(const std::string& key) const;

public:
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Returned when the key is neither stored nor in the environment
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * The whole value must be a base-10 integer ("42", "-3");
     * anything else logs a warning and yields the default.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    bool has(const std::string& key) const;

    /// @brief Origin of the value getString() would return
    ConfigSource source(const std::string& key) const;

    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove a stored value
     *
     * The environment is untouched, so an exported variable becomes visible again.
     */
    void remove(const std::string& key);

    /// @brief Stored keys, sorted
    std::vector<std::string> keys() const;

    /**
     * @brief Store the predefined keys found in the environment
     *
     * If FLUENTVAL_CONFIG_FILE is set, that file is loaded afterwards.
     */
    void loadFromEnvironment();

    /**
     * @brief Load KEY=VALUE lines from a file
     *
     * Blank lines and lines starting with '#' are skipped; keys and values are
     * trimmed. Lines without '=' are logged and skipped.
     *
     * @return Number of keys loaded
     * @throws ConfigException if the file cannot be opened
     */
    size_t loadFromFile(const std::string& path);

    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys

    static constexpr const char* LOG_LEVEL = "FLUENTVAL_LOG_LEVEL";
    static constexpr const char* LOG_FILE = "FLUENTVAL_LOG_FILE";
    static constexpr const char* CASCADE_MODE = "FLUENTVAL_CASCADE_MODE";
    static constexpr const char* DEFAULT_SEVERITY = "FLUENTVAL_DEFAULT_SEVERITY";
    static constexpr const char* CONFIG_FILE = "FLUENTVAL_CONFIG_FILE";
};

} // namespace fluentval::common
