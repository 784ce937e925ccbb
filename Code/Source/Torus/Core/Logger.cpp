/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file Logger.cpp
 * @brief Message formatting and environment-driven logger setup
 */

#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>

namespace torus {

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        level = LogLevel::INFO;
    } else if (upper == "WARNING" || upper == "WARN") {
        level = LogLevel::WARNING;
    } else if (upper == "ERROR") {
        level = LogLevel::ERROR;
    } else if (upper == "CRITICAL" || upper == "CRIT") {
        level = LogLevel::CRITICAL;
    } else if (upper == "OFF") {
        level = LogLevel::OFF;
    } else {
        return false;
    }
    return true;
}

std::string Logger::format_message(const LogMessage& msg) const {
    std::ostringstream oss;

    if (show_timestamp_) {
        auto time_t = std::chrono::system_clock::to_time_t(msg.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            msg.timestamp.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);
        oss << "[" << std::put_time(&local_tm, "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    oss << "[" << log_level_to_string(msg.level) << "] ";
    oss << msg.message;

    // Source location in debug mode
    #if TORUS_DEBUG_MODE
    if (msg.level >= LogLevel::WARNING && !msg.file.empty()) {
        oss << " (" << msg.file << ":" << msg.line;
        if (!msg.function.empty()) {
            oss << " in " << msg.function << "()";
        }
        oss << ")";
    }
    #endif

    oss << "\n";
    return oss.str();
}

// ============================================================================
// Logger Initialization
// ============================================================================

namespace {

bool env_flag(const char* value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower != "false" && lower != "0" && lower != "off";
}

/**
 * @brief Initialize logger from environment variables
 */
class LoggerInitializer {
public:
    LoggerInitializer() {
        auto& logger = Logger::instance();

        if (const char* env_level = std::getenv("TORUS_LOG_LEVEL")) {
            LogLevel level = LogLevel::INFO;
            if (parse_log_level(env_level, level)) {
                logger.set_level(level);
            } else {
                std::cerr << "Ignoring unknown TORUS_LOG_LEVEL: " << env_level << std::endl;
            }
        }

        if (const char* env_file = std::getenv("TORUS_LOG_FILE")) {
            logger.set_file_output(env_file);
        }

        if (const char* env_console = std::getenv("TORUS_LOG_CONSOLE")) {
            logger.set_console_output(env_flag(env_console));
        }

        if (const char* env_time = std::getenv("TORUS_LOG_SHOW_TIME")) {
            logger.set_show_timestamp(env_flag(env_time));
        }
    }
};

static LoggerInitializer logger_init;

} // anonymous namespace

} // namespace torus
