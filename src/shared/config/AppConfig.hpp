#pragma once

/**
 * @file AppConfig.hpp
 * @brief Music box NFC service configuration
 *
 * Loaded from environment variables at startup.
 */

#include <string>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace shared::config {

struct AppConfig {
    int serverPort = 8080;
    int threadNum = 2;
    std::string logLevel = "info";
    std::string logFile;

    int sessionTimeoutSeconds = 60;
    int maxSessionTimeoutSeconds = 600;
    int cleanupIntervalSeconds = 30;
    int sessionHistoryLimit = 256;
    std::string hardware = "mock";

    std::string storageBackend = "memory";
    std::string dbHost = "postgres";
    int dbPort = 5432;
    std::string dbName = "musicbox";
    std::string dbUser = "musicbox";
    std::string dbPassword;

    static AppConfig fromEnvironment() {
        AppConfig config;

        if (auto val = std::getenv("SERVER_PORT")) config.serverPort = parseInt("SERVER_PORT", val);
        if (auto val = std::getenv("THREAD_NUM")) config.threadNum = parseInt("THREAD_NUM", val);
        if (auto val = std::getenv("LOG_LEVEL")) config.logLevel = val;
        if (auto val = std::getenv("LOG_FILE")) config.logFile = val;

        if (auto val = std::getenv("NFC_SESSION_TIMEOUT_SECONDS"))
            config.sessionTimeoutSeconds = parseInt("NFC_SESSION_TIMEOUT_SECONDS", val);
        if (auto val = std::getenv("NFC_MAX_SESSION_TIMEOUT_SECONDS"))
            config.maxSessionTimeoutSeconds = parseInt("NFC_MAX_SESSION_TIMEOUT_SECONDS", val);
        if (auto val = std::getenv("NFC_CLEANUP_INTERVAL_SECONDS"))
            config.cleanupIntervalSeconds = parseInt("NFC_CLEANUP_INTERVAL_SECONDS", val);
        if (auto val = std::getenv("NFC_SESSION_HISTORY_LIMIT"))
            config.sessionHistoryLimit = parseInt("NFC_SESSION_HISTORY_LIMIT", val);
        if (auto val = std::getenv("NFC_HARDWARE")) config.hardware = val;

        if (auto val = std::getenv("STORAGE_BACKEND")) config.storageBackend = val;
        if (auto val = std::getenv("DB_HOST")) config.dbHost = val;
        if (auto val = std::getenv("DB_PORT")) config.dbPort = parseInt("DB_PORT", val);
        if (auto val = std::getenv("DB_NAME")) config.dbName = val;
        if (auto val = std::getenv("DB_USER")) config.dbUser = val;
        if (auto val = std::getenv("DB_PASSWORD")) config.dbPassword = val;

        return config;
    }

    /**
     * @brief Reject values the service cannot run with
     * @throws std::runtime_error describing the first invalid setting
     */
    void validate() const {
        if (serverPort <= 0 || serverPort > 65535) {
            throw std::runtime_error("Invalid SERVER_PORT: " + std::to_string(serverPort));
        }
        if (threadNum <= 0) {
            throw std::runtime_error("THREAD_NUM must be positive");
        }
        if (sessionTimeoutSeconds <= 0) {
            throw std::runtime_error("NFC_SESSION_TIMEOUT_SECONDS must be positive");
        }
        if (maxSessionTimeoutSeconds < sessionTimeoutSeconds) {
            throw std::runtime_error(
                "NFC_MAX_SESSION_TIMEOUT_SECONDS must not be lower than NFC_SESSION_TIMEOUT_SECONDS");
        }
        if (cleanupIntervalSeconds <= 0) {
            throw std::runtime_error("NFC_CLEANUP_INTERVAL_SECONDS must be positive");
        }
        if (sessionHistoryLimit < 1) {
            throw std::runtime_error("NFC_SESSION_HISTORY_LIMIT must be at least 1");
        }
        if (hardware != "mock") {
            throw std::runtime_error("Unsupported NFC_HARDWARE: " + hardware);
        }
        if (storageBackend != "memory" && storageBackend != "postgres") {
            throw std::runtime_error("Unsupported STORAGE_BACKEND: " + storageBackend);
        }
        if (storageBackend == "postgres" && dbPassword.empty()) {
            throw std::runtime_error("FATAL: DB_PASSWORD environment variable not set");
        }
        spdlog::info("Configuration validated (storage={}, hardware={})", storageBackend, hardware);
    }

private:
    static int parseInt(const char* name, const char* value) {
        try {
            return std::stoi(value);
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("Invalid integer for ") + name + ": " + value);
        }
    }
};

} // namespace shared::config
