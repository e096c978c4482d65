/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with the standard console/file configuration used by
 * applications embedding the ZAID validation library.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <string>
#include <memory>
#include <vector>

#include "config_manager.h"

namespace common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Initialize the default logger
     * @param loggerName Logger name shown in every line (e.g., "zaid")
     * @param logLevel Log level (trace, debug, info, warn, error, critical)
     * @param logToFile Enable file logging
     * @param logFile Log file path
     * @param maxFileSizeMb Rotation threshold per file
     * @param maxFiles Number of rotated files kept
     */
    static void initialize(
        const std::string& loggerName,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = "",
        int maxFileSizeMb = 10,
        int maxFiles = 3
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            // Console sink (colored)
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile,
                    static_cast<size_t>(maxFileSizeMb) * 1024 * 1024,
                    static_cast<size_t>(maxFiles)
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
     * @brief Initialize the default logger from ConfigManager keys
     *
     * Reads LOG_LEVEL, LOG_TO_FILE, LOG_FILE, LOG_FILE_MAX_SIZE_MB and
     * LOG_FILE_MAX_FILES.
     */
    static void initializeFromConfig(
        const std::string& loggerName,
        const std::string& defaultLevel = "info"
    ) {
        const auto& config = ConfigManager::getInstance();
        initialize(
            loggerName,
            config.getString(ConfigManager::LOG_LEVEL, defaultLevel),
            config.getBool(ConfigManager::LOG_TO_FILE, false),
            config.getString(ConfigManager::LOG_FILE),
            config.getInt(ConfigManager::LOG_FILE_MAX_SIZE_MB, 10),
            config.getInt(ConfigManager::LOG_FILE_MAX_FILES, 3)
        );
    }

    /**
     * @brief Map a level name to spdlog level (unknown names map to info)
     */
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") {
            return spdlog::level::trace;
        } else if (level == "debug") {
            return spdlog::level::debug;
        } else if (level == "info") {
            return spdlog::level::info;
        } else if (level == "warn") {
            return spdlog::level::warn;
        } else if (level == "error") {
            return spdlog::level::err;
        } else if (level == "critical") {
            return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    /**
     * @brief Set log level at runtime
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
        spdlog::info("Log level changed to: {}", level);
    }

    /**
     * @brief Flush all loggers
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace common
