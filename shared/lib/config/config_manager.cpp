/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "config_manager.h"
#include "exception/exceptions.h"
#include <fluentval/utils/string_utils.h>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace fluentval::common {

std::string configSourceToString(ConfigSource source) {
    switch (source) {
        case ConfigSource::NONE:        return "none";
        case ConfigSource::OVERRIDE:    return "override";
        case ConfigSource::FILE:        return "file";
        case ConfigSource::ENVIRONMENT: return "environment";
    }
    return "unknown";
}

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

void ConfigManager::store(const std::string& key, const std::string& value, ConfigSource source) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = Entry{value, source};
}

std::optional<ConfigManager::Entry> ConfigManager::lookup(const std::string& key) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = config_.find(key);
        if (it != config_.end()) {
            return it->second;
        }
    }

    if (const char* env = std::getenv(key.c_str())) {
        return Entry{env, ConfigSource::ENVIRONMENT};
    }
    return std::nullopt;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    auto entry = lookup(key);
    return entry ? entry->value : defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    std::string value = utils::trim(getString(key));
    if (value.empty()) {
        return defaultValue;
    }

    int parsed = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc() || ptr != last) {
        spdlog::warn("Invalid integer config '{}': {} (using default: {})", key, value, defaultValue);
        return defaultValue;
    }
    return parsed;
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::string value = utils::toLower(utils::trim(getString(key)));
    if (value.empty()) {
        return defaultValue;
    }

    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }

    spdlog::warn("Invalid boolean config '{}': {} (using default: {})", key, value, defaultValue);
    return defaultValue;
}

bool ConfigManager::has(const std::string& key) const {
    return lookup(key).has_value();
}

ConfigSource ConfigManager::source(const std::string& key) const {
    auto entry = lookup(key);
    return entry ? entry->source : ConfigSource::NONE;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    store(key, value, ConfigSource::OVERRIDE);
    spdlog::debug("Config set: {} = {}", key, value);
}

void ConfigManager::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.erase(key);
}

std::vector<std::string> ConfigManager::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(config_.size());
    for (const auto& [key, entry] : config_) {
        result.push_back(key);
    }
    return result;
}

void ConfigManager::loadFromEnvironment() {
    for (const char* key : {LOG_LEVEL, LOG_FILE, CASCADE_MODE, DEFAULT_SEVERITY}) {
        if (const char* env = std::getenv(key)) {
            store(key, env, ConfigSource::ENVIRONMENT);
        }
    }

    if (const char* file = std::getenv(CONFIG_FILE)) {
        try {
            loadFromFile(file);
        } catch (const ConfigException& e) {
            spdlog::warn("{}", e.what());
        }
    }
}

size_t ConfigManager::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigException("cannot open config file " + path);
    }

    size_t loaded = 0;
    size_t lineNumber = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++lineNumber;
        std::string trimmed = utils::trim(line);
        if (trimmed.empty() || utils::startsWith(trimmed, "#")) {
            continue;
        }

        size_t eq = trimmed.find('=');
        if (eq == std::string::npos) {
            spdlog::warn("{}:{}: expected KEY=VALUE", path, lineNumber);
            continue;
        }

        std::string key = utils::trim(trimmed.substr(0, eq));
        if (key.empty()) {
            spdlog::warn("{}:{}: empty key", path, lineNumber);
            continue;
        }
        store(key, utils::trim(trimmed.substr(eq + 1)), ConfigSource::FILE);
        ++loaded;
    }

    spdlog::info("Loaded {} config key(s) from {}", loaded, path);
    return loaded;
}

std::string ConfigManager::getEnv(const std::string& key, const std::string& defaultValue) {
    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : defaultValue;
}

} // namespace fluentval::common
