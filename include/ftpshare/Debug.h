/**
 * @file Debug.h
 * @brief Console logging utilities with timestamps
 *
 * (c) 2026 FtpShare Project
 * Licensed under MIT License
 */

#pragma once

#include "ftpshare/ThreadSafeLog.h"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <mutex>

namespace FtpShare {

/**
 * @brief Log severity, ordered from most to least verbose
 */
enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

// Note: One mutex for the whole process so lines from the serving thread,
// session threads and the console never interleave on std::cerr
inline std::mutex g_logMutex;

/// Console output switch. Interactive mode turns it off so the menu stays readable.
inline std::atomic<bool> g_logOutputEnabled{true};

/// Lines below this level are dropped.
inline std::atomic<int> g_logMinLevel{static_cast<int>(LogLevel::Info)};

inline void setLogOutputEnabled(bool enabled) {
    g_logOutputEnabled.store(enabled);
}

inline bool isLogOutputEnabled() {
    return g_logOutputEnabled.load();
}

inline void setLogLevel(LogLevel level) {
    g_logMinLevel.store(static_cast<int>(level));
}

inline bool shouldLog(LogLevel level) {
    return static_cast<int>(level) >= g_logMinLevel.load();
}

/**
 * @brief Get current timestamp as formatted string
 * @return Timestamp in format [HH:MM:SS.mmm]
 */
inline std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm;
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << "[" << std::setfill('0') << std::setw(2) << tm.tm_hour
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_min
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_sec
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    return oss.str();
}

/**
 * @brief Emit one formatted line to the enabled sinks
 *
 * The console sink honours the output switch; the file sink (ThreadSafeLog)
 * receives every line at or above the minimum level once it is initialized.
 */
inline void logLine(LogLevel level, const char* tag, const std::string& message) {
    if (!shouldLog(level)) {
        return;
    }
    if (g_logOutputEnabled.load()) {
        std::lock_guard<std::mutex> lock(g_logMutex);
        std::cerr << getTimestamp() << " [" << tag << "] " << message << std::endl;
    }
    ThreadSafeLog::log(std::string("[") + tag + "] " + message);
}

/**
 * @brief Thread-safe logging macros with timestamp
 *
 * Usage: LOG_INFO("Listening on " << host << ":" << port);
 */
#define FTPSHARE_LOG_AT(level, tag, msg) \
    do { \
        if (FtpShare::shouldLog(level)) { \
            std::ostringstream ftpshare_log_oss_; \
            ftpshare_log_oss_ << msg; \
            FtpShare::logLine(level, tag, ftpshare_log_oss_.str()); \
        } \
    } while(0)

#define LOG_INFO(msg) FTPSHARE_LOG_AT(FtpShare::LogLevel::Info, "INFO", msg)

#define LOG_DEBUG(msg) FTPSHARE_LOG_AT(FtpShare::LogLevel::Debug, "DEBUG", msg)

#define LOG_ERROR(msg) FTPSHARE_LOG_AT(FtpShare::LogLevel::Error, "ERROR", msg)

#define LOG_WARNING(msg) FTPSHARE_LOG_AT(FtpShare::LogLevel::Warning, "WARNING", msg)

} // namespace FtpShare
