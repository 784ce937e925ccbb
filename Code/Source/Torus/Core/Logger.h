/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_CORE_LOGGER_H
#define TORUS_CORE_LOGGER_H

/**
 * @file Logger.h
 * @brief Logging infrastructure for the torus triangulation library
 *
 * Thread-safe singleton logger with severity levels, console/file sinks,
 * custom handlers and scoped timing. Configured at startup from the
 * TORUS_LOG_* environment variables (see Logger.cpp).
 */

#include "TorusConfig.h"
#include <chrono>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace torus {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : int {
    DEBUG    = 0,
    INFO     = 1,
    WARNING  = 2,
    ERROR    = 3,
    CRITICAL = 4,
    OFF      = 5
};

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default:                 return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name (case-insensitive); returns false if unknown
 */
bool parse_log_level(const std::string& name, LogLevel& level);

// ============================================================================
// Timer Class for Performance Logging
// ============================================================================

class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::duration<double>;

    void start() {
        start_time_ = Clock::now();
        is_running_ = true;
    }

    void stop() {
        if (is_running_) {
            end_time_ = Clock::now();
            is_running_ = false;
        }
    }

    /**
     * @brief Elapsed time in seconds
     */
    double elapsed() const {
        TimePoint end = is_running_ ? Clock::now() : end_time_;
        Duration diff = end - start_time_;
        return diff.count();
    }

private:
    TimePoint start_time_;
    TimePoint end_time_;
    bool is_running_ = false;
};

// ============================================================================
// Log Message Structure
// ============================================================================

struct LogMessage {
    LogLevel level;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Logger Class
// ============================================================================

class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void set_console_output(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_output_ = enabled;
    }

    /**
     * @brief Append log output to a file; an empty name closes the file sink
     */
    void set_file_output(const std::string& filename) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (file_stream_.is_open()) {
            file_stream_.close();
        }

        if (!filename.empty()) {
            file_stream_.open(filename, std::ios::app);
            if (!file_stream_.is_open()) {
                std::cerr << "Failed to open log file: " << filename << std::endl;
            }
        }
    }

    void set_show_timestamp(bool show) {
        std::lock_guard<std::mutex> lock(mutex_);
        show_timestamp_ = show;
    }

    bool enabled(LogLevel level) const {
        #if !TORUS_DEBUG_MODE
        if (level == LogLevel::DEBUG) return false;
        #endif
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= min_level_ && min_level_ != LogLevel::OFF;
    }

    void log(LogLevel level,
             const std::string& message,
             const char* file = "",
             int line = 0,
             const char* function = "") {
        if (!enabled(level)) return;

        LogMessage msg;
        msg.level = level;
        msg.message = message;
        msg.file = file;
        msg.line = line;
        msg.function = function;
        msg.timestamp = std::chrono::system_clock::now();

        std::string formatted = format_message(msg);

        std::lock_guard<std::mutex> lock(mutex_);

        if (console_output_) {
            if (level >= LogLevel::WARNING) {
                std::cerr << formatted << std::flush;
            } else {
                std::cout << formatted << std::flush;
            }
        }

        if (file_stream_.is_open()) {
            file_stream_ << formatted << std::flush;
        }

        for (const auto& handler : handlers_) {
            handler(msg);
        }
    }

    void log_timed(LogLevel level,
                   const std::string& message,
                   double elapsed_seconds) {
        std::ostringstream oss;
        oss << message << " (elapsed: " << std::fixed << std::setprecision(3)
            << elapsed_seconds << "s)";
        log(level, oss.str());
    }

    using LogHandler = std::function<void(const LogMessage&)>;
    void add_handler(LogHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.push_back(std::move(handler));
    }

    void clear_handlers() {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.clear();
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
        if (file_stream_.is_open()) {
            file_stream_.flush();
        }
    }

private:
    Logger() : min_level_(LogLevel::INFO),
               console_output_(true),
               show_timestamp_(true) {}

    ~Logger() {
        if (file_stream_.is_open()) {
            file_stream_.close();
        }
    }

    std::string format_message(const LogMessage& msg) const;

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool console_output_;
    bool show_timestamp_;
    std::ofstream file_stream_;
    std::vector<LogHandler> handlers_;
};

// ============================================================================
// Scoped Timer for RAII-based Timing
// ============================================================================

class ScopedTimer {
public:
    ScopedTimer(const std::string& name,
                LogLevel level = LogLevel::INFO)
        : name_(name), level_(level) {
        timer_.start();
        Logger::instance().log(level_, "Starting: " + name_);
    }

    ~ScopedTimer() {
        timer_.stop();
        Logger::instance().log_timed(level_, "Completed: " + name_, timer_.elapsed());
    }

private:
    std::string name_;
    LogLevel level_;
    Timer timer_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define TORUS_LOG(level, message) \
    torus::Logger::instance().log(level, message, __FILE__, __LINE__, __FUNCTION__)

#if TORUS_DEBUG_MODE
    #define TORUS_LOG_DEBUG(message) \
        do { \
            if (torus::Logger::instance().enabled(torus::LogLevel::DEBUG)) { \
                TORUS_LOG(torus::LogLevel::DEBUG, message); \
            } \
        } while (0)
#else
    #define TORUS_LOG_DEBUG(message) ((void)0)
#endif

#define TORUS_LOG_INFO(message) TORUS_LOG(torus::LogLevel::INFO, message)
#define TORUS_LOG_WARNING(message) TORUS_LOG(torus::LogLevel::WARNING, message)
#define TORUS_LOG_ERROR(message) TORUS_LOG(torus::LogLevel::ERROR, message)

#define TORUS_TIMED_SCOPE(name) \
    torus::ScopedTimer _scoped_timer_##__LINE__(name, torus::LogLevel::DEBUG)

// ============================================================================
// Stream-based Logging Interface
// ============================================================================

class LogStream {
public:
    explicit LogStream(LogLevel level) : level_(level) {}

    ~LogStream() {
        Logger::instance().log(level_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::ostringstream stream_;
};

inline LogStream log_stream(LogLevel level) {
    return LogStream(level);
}

#define TORUS_INFO() torus::log_stream(torus::LogLevel::INFO)

} // namespace torus

#endif // TORUS_CORE_LOGGER_H
