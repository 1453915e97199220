/**
 * @file Logger.hpp
 * @brief spdlog setup shared by the service and its tools
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace shared::logging {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Map a level name to an spdlog level (unknown names map to info)
     */
    static spdlog::level::level_enum parseLevel(const std::string& logLevel) {
        if (logLevel == "trace") return spdlog::level::trace;
        if (logLevel == "debug") return spdlog::level::debug;
        if (logLevel == "warn") return spdlog::level::warn;
        if (logLevel == "error") return spdlog::level::err;
        if (logLevel == "critical") return spdlog::level::critical;
        return spdlog::level::info;
    }

    /**
     * @brief Install the default logger
     * @param serviceName Logger name shown in every line
     * @param logLevel trace, debug, info, warn, error or critical
     * @param logFile Rotating file path, file logging disabled when empty
     */
    static void initialize(
        const std::string& serviceName,
        const std::string& logLevel = "info",
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (!logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(serviceName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::info("Logger initialized: service={}, level={}, file={}",
                         serviceName, logLevel, logFile.empty() ? "none" : logFile);

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }
};

} // namespace shared::logging
