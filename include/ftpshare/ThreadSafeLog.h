/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe file logging
 *
 * (c) 2026 FtpShare Project
 * Licensed under MIT License
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace FtpShare {

/**
 * @brief Thread-safe append-only log file with single-step rotation
 *
 * Every LOG_* macro forwards its line here in addition to the console.
 * Until initialize() is called (the --log-file option) log() is a no-op.
 *
 * Uses a global static mutex to synchronize file access across:
 * - the operator console (main thread)
 * - the FTP serving thread
 * - FTP session threads
 *
 * When the file grows beyond the configured size it is renamed to
 * "<file>.1" (replacing any previous one) and a fresh file is started.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Set the log path (call from the main thread before serving starts)
     * @param logPath Path to the log file; an empty path disables file logging
     * @param maxBytes Rotation threshold in bytes
     */
    static void initialize(const std::filesystem::path& logPath, uint64_t maxBytes);

    /**
     * @brief Log a std::string message
     * @param message Message to log
     *
     * Thread-safe: locks global mutex before writing to file.
     */
    static void log(const std::string& message);

    /**
     * @brief Log a const char* message
     *
     * This overload prevents ambiguity when passing string literals.
     */
    static void log(const char* message);

    /**
     * @brief Whether a log path has been configured
     */
    static bool isInitialized();

private:
    static void rotateIfNeeded();

    /// Global mutex for synchronizing file access across all threads
    static std::mutex s_mutex;

    /// Log file path (empty = disabled)
    static std::filesystem::path s_logPath;

    /// Rotation threshold
    static uint64_t s_maxBytes;
};

} // namespace FtpShare
