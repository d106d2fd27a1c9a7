/**
 * @file ThreadSafeLog.cpp
 * @brief Thread-safe file logging implementation
 *
 * (c) 2026 FtpShare Project
 * Licensed under MIT License
 */

#include "ftpshare/ThreadSafeLog.h"
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace FtpShare {

// Static member definitions
std::mutex ThreadSafeLog::s_mutex;
std::filesystem::path ThreadSafeLog::s_logPath;
uint64_t ThreadSafeLog::s_maxBytes = 0;

void ThreadSafeLog::initialize(const std::filesystem::path& logPath, uint64_t maxBytes) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_logPath = logPath;
    s_maxBytes = maxBytes;

    if (!s_logPath.empty() && s_logPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(s_logPath.parent_path(), ec);
    }
}

bool ThreadSafeLog::isInitialized() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_logPath.empty();
}

void ThreadSafeLog::rotateIfNeeded() {
    // Caller holds s_mutex
    if (s_maxBytes == 0) {
        return;
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(s_logPath, ec);
    if (ec || size < s_maxBytes) {
        return;
    }

    std::filesystem::path rotated = s_logPath;
    rotated += ".1";
    std::filesystem::remove(rotated, ec);
    ec.clear();
    std::filesystem::rename(s_logPath, rotated, ec);
}

void ThreadSafeLog::log(const std::string& message) {
    std::lock_guard<std::mutex> lock(s_mutex);

    if (s_logPath.empty()) {
        return;  // Not initialized - file logging disabled
    }

    auto now = std::chrono::system_clock::now();
    auto now_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << " " << message << "\n";

    rotateIfNeeded();

    std::ofstream file(s_logPath, std::ios::app);
    if (file.is_open()) {
        file << oss.str();
        file.flush();
    }
}

void ThreadSafeLog::log(const char* message) {
    log(std::string(message ? message : ""));
}

} // namespace FtpShare
