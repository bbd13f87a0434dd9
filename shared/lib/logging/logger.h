/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Provides a consistent logging setup for applications embedding fluentval.
 * Wraps spdlog with standardized configuration. The validation library itself
 * logs through spdlog's default logger, so whatever is installed here receives
 * its traces.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include "config/config_manager.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fluentval::common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Initialize the default logger
     * @param loggerName Logger name shown in every line (e.g., "fluentval")
     * @param logLevel Log level (trace, debug, info, warn, error, critical)
     * @param logToFile Enable file logging
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& loggerName,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::info("Logger initialized: name={}, level={}, file={}",
                         loggerName, logLevel, logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Initialize from FLUENTVAL_LOG_LEVEL and FLUENTVAL_LOG_FILE
     *
     * A file sink is added only when FLUENTVAL_LOG_FILE is non-empty.
     * An unknown level falls back to info with a warning.
     */
    static void initializeFromConfig(const std::string& loggerName, const ConfigManager& config) {
        std::string level = config.getString(ConfigManager::LOG_LEVEL, "info");
        std::string file = config.getString(ConfigManager::LOG_FILE);
        initialize(loggerName, level, !file.empty(), file);
        if (!isKnownLevel(level)) {
            spdlog::warn("Unknown log level '{}' in {}, using info", level, ConfigManager::LOG_LEVEL);
        }
    }

    /**
     * @brief Set log level at runtime
     * @return false if the level name is not recognized (level unchanged)
     */
    static bool setLevel(const std::string& level) {
        if (!isKnownLevel(level)) {
            spdlog::warn("Unknown log level '{}' ignored", level);
            return false;
        }
        spdlog::set_level(parseLevel(level));
        spdlog::info("Log level changed to: {}", level);
        return true;
    }

    /**
     * @brief Flush the default logger
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }

    static bool isKnownLevel(const std::string& level) {
        return level == "trace" || level == "debug" || level == "info" ||
               level == "warn" || level == "error" || level == "critical";
    }

private:
    // Unknown names fall back to info
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") {
            return spdlog::level::trace;
        } else if (level == "debug") {
            return spdlog::level::debug;
        } else if (level == "warn") {
            return spdlog::level::warn;
        } else if (level == "error") {
            return spdlog::level::err;
        } else if (level == "critical") {
            return spdlog::level::critical;
        }
        return spdlog::level::info;
    }
};

} // namespace fluentval::common
