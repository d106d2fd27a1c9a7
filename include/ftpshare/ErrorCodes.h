/**
 * @file ErrorCodes.h
 * @brief Stable, user-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

namespace FtpShare {
namespace ErrorCodes {

// Configuration input
inline constexpr const char* CONFIG_EMPTY_USERNAME = "FTPS-CFG-1000";
inline constexpr const char* CONFIG_EMPTY_PASSWORD = "FTPS-CFG-1001";
inline constexpr const char* CONFIG_INVALID_PORT = "FTPS-CFG-1002";
inline constexpr const char* CONFIG_INVALID_HOST = "FTPS-CFG-1003";

// Shared root directory
inline constexpr const char* DIRECTORY_EMPTY_PATH = "FTPS-DIR-1000";
inline constexpr const char* DIRECTORY_CREATE_FAILED = "FTPS-DIR-1001";
inline constexpr const char* DIRECTORY_NOT_A_DIRECTORY = "FTPS-DIR-1002";

// Listener
inline constexpr const char* BIND_FAILED = "FTPS-NET-1000";
inline constexpr const char* LISTEN_FAILED = "FTPS-NET-1001";
inline constexpr const char* LISTENER_EXITED = "FTPS-NET-1002";

// Settings persistence
inline constexpr const char* PERSIST_READ_FAILED = "FTPS-STORE-1000";
inline constexpr const char* PERSIST_WRITE_FAILED = "FTPS-STORE-1001";
inline constexpr const char* PERSIST_CORRUPT = "FTPS-STORE-1002";

// Credentials
inline constexpr const char* PASSWORD_GENERATION_FAILED = "FTPS-CRED-1000";

}  // namespace ErrorCodes
}  // namespace FtpShare
