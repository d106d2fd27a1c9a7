/**
 * @file ServiceConfig.h
 * @brief Listener configuration value and its validation rules
 */

#pragma once

#include "ftpshare/config.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace FtpShare {

/**
 * @brief Everything needed to construct one TransferService.
 *
 * A config that reaches the supervisor's start() has passed validateConfig():
 * all fields set, port in range, shared root an existing directory.
 */
struct ServiceConfig {
    std::string host = DEFAULT_BIND_HOST;
    uint16_t port = DEFAULT_PORT;
    std::string username = DEFAULT_USERNAME;
    std::string password = DEFAULT_PASSWORD;
    std::filesystem::path sharedRoot;

    bool operator==(const ServiceConfig& other) const {
        return host == other.host && port == other.port &&
               username == other.username && password == other.password &&
               sharedRoot == other.sharedRoot;
    }
    bool operator!=(const ServiceConfig& other) const { return !(*this == other); }
};

/**
 * @brief Individually changeable fields (one menu entry each)
 */
enum class ConfigField {
    Username,
    Password,
    Port,
    SharedRoot
};

/**
 * @brief Convert field to display/settings name ("username", "password", "port", "folder")
 */
const char* configFieldName(ConfigField field);

namespace ConfigValidation {

/**
 * @brief Strip leading/trailing whitespace (operator input is line based)
 */
std::string trim(const std::string& value);

/**
 * @brief Validate a username
 * @return Trimmed username
 * @throws ValidationError if empty
 */
std::string validateUsername(const std::string& value);

/**
 * @brief Validate a password
 * @return Trimmed password
 * @throws ValidationError if empty
 */
std::string validatePassword(const std::string& value);

/**
 * @brief Parse a port given as text
 *
 * Only plain decimal digits are accepted (no sign, no whitespace inside).
 *
 * @throws ValidationError if not a number in 1-65535
 */
uint16_t parsePort(const std::string& value);

/**
 * @brief Make a shared root absolute and ensure it exists
 *
 * Missing directories (including parents) are created.
 *
 * @return Absolute, lexically normalized path
 * @throws DirectoryError if the path is empty, cannot be created or is not a directory
 */
std::filesystem::path prepareSharedRoot(const std::filesystem::path& value);

/**
 * @brief Check every field of a complete config
 *
 * The shared root is created if missing.
 *
 * @throws ValidationError / DirectoryError naming the first offending field
 */
void validateConfig(const ServiceConfig& config);

}  // namespace ConfigValidation

}  // namespace FtpShare
