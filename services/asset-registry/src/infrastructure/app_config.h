#pragma once

/**
 * @file app_config.h
 * @brief Application configuration loaded from environment variables
 *
 * Built once in main() and passed by const reference.
 */

#include <string>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include "exceptions.h"

struct AppConfig {
    std::string dbHost = "postgres";
    int dbPort = 5432;
    std::string dbName = "assetregistry";
    std::string dbUser = "assetregistry";
    std::string dbPassword;  // Must be set via environment variable

    // Connection pool
    int dbPoolMin = 2;
    int dbPoolMax = 10;
    int dbPoolTimeoutSec = 5;

    int serverPort = 8090;
    int threadNum = 4;

    std::string logLevel = "info";
    std::string logFile;          // File sink enabled when set
    std::string environment = "local";

    // Streams stop reading once the storage offset reaches this value
    int64_t streamMaxOffset = 9999999;

    // Safe environment variable integer parser with range clamping
    static int envStoi(const char* val, int defaultVal, int minVal, int maxVal) {
        try {
            int v = std::stoi(val);
            return std::clamp(v, minVal, maxVal);
        } catch (const std::exception&) {
            spdlog::warn("Invalid integer env value '{}', using default {}", val, defaultVal);
            return defaultVal;
        }
    }

    static AppConfig fromEnvironment() {
        AppConfig config;

        if (auto val = std::getenv("DB_HOST")) config.dbHost = val;
        if (auto val = std::getenv("DB_PORT")) config.dbPort = envStoi(val, 5432, 1, 65535);
        if (auto val = std::getenv("DB_NAME")) config.dbName = val;
        if (auto val = std::getenv("DB_USER")) config.dbUser = val;
        if (auto val = std::getenv("DB_PASSWORD")) config.dbPassword = val;

        if (auto val = std::getenv("DB_POOL_MIN")) config.dbPoolMin = envStoi(val, 2, 0, 64);
        if (auto val = std::getenv("DB_POOL_MAX")) config.dbPoolMax = envStoi(val, 10, 1, 256);
        if (auto val = std::getenv("DB_POOL_TIMEOUT_SEC")) config.dbPoolTimeoutSec = envStoi(val, 5, 1, 300);
        if (config.dbPoolMin > config.dbPoolMax) {
            spdlog::warn("DB_POOL_MIN ({}) exceeds DB_POOL_MAX ({}), using {}",
                         config.dbPoolMin, config.dbPoolMax, config.dbPoolMax);
            config.dbPoolMin = config.dbPoolMax;
        }

        if (auto val = std::getenv("SERVER_PORT")) config.serverPort = envStoi(val, 8090, 1, 65535);
        if (auto val = std::getenv("THREAD_NUM")) config.threadNum = envStoi(val, 4, 1, 128);

        if (auto val = std::getenv("LOG_LEVEL")) config.logLevel = val;
        if (auto val = std::getenv("LOG_FILE")) config.logFile = val;
        if (auto val = std::getenv("XRF_ENV")) config.environment = val;

        if (auto val = std::getenv("STREAM_MAX_OFFSET")) {
            config.streamMaxOffset = envStoi(val, 9999999, 1, 999999999);
        }

        return config;
    }

    // Validate required credentials are set
    void validateRequiredCredentials() const {
        if (dbPassword.empty()) {
            throw common::ConfigException("DB_PASSWORD environment variable not set");
        }
        spdlog::info("All required credentials loaded from environment");
    }
};
