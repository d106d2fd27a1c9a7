/**
 * @file ServiceConfig.cpp
 * @brief Configuration validation rules
 */

#include "ftpshare/ServiceConfig.h"
#include "ftpshare/ErrorCodes.h"
#include "ftpshare/Errors.h"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace FtpShare {

const char* configFieldName(ConfigField field) {
    switch (field) {
        case ConfigField::Username:   return KEY_USERNAME;
        case ConfigField::Password:   return KEY_PASSWORD;
        case ConfigField::Port:       return KEY_PORT;
        case ConfigField::SharedRoot: return KEY_FOLDER_LEGACY;
        default:                      return "unknown";
    }
}

namespace ConfigValidation {

std::string trim(const std::string& value) {
    const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };

    auto begin = std::find_if_not(value.begin(), value.end(), isSpace);
    auto end = std::find_if_not(value.rbegin(), value.rend(), isSpace).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string validateUsername(const std::string& value) {
    std::string out = trim(value);
    if (out.empty()) {
        throw ValidationError(ErrorCodes::CONFIG_EMPTY_USERNAME, "Username must not be empty");
    }
    return out;
}

std::string validatePassword(const std::string& value) {
    std::string out = trim(value);
    if (out.empty()) {
        throw ValidationError(ErrorCodes::CONFIG_EMPTY_PASSWORD, "Password must not be empty");
    }
    return out;
}

uint16_t parsePort(const std::string& value) {
    const std::string text = trim(value);

    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ValidationError(ErrorCodes::CONFIG_INVALID_PORT, "Invalid port: '" + text + "'");
    }

    const unsigned long port = std::stoul(text);
    if (port < 1 || port > 65535) {
        throw ValidationError(ErrorCodes::CONFIG_INVALID_PORT,
                              "Port out of range (1-65535): " + text);
    }
    return static_cast<uint16_t>(port);
}

std::filesystem::path prepareSharedRoot(const std::filesystem::path& value) {
    if (value.empty()) {
        throw DirectoryError(ErrorCodes::DIRECTORY_EMPTY_PATH, "Folder path must not be empty");
    }

    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(value, ec);
    if (ec) {
        throw DirectoryError(ErrorCodes::DIRECTORY_CREATE_FAILED,
                             "Cannot resolve folder " + value.string() + ": " + ec.message());
    }
    absolute = absolute.lexically_normal();
    // "/srv/share/" normalizes to "/srv/share/" - drop the empty filename
    if (!absolute.has_filename() && absolute.has_parent_path() && absolute != absolute.root_path()) {
        absolute = absolute.parent_path();
    }

    if (std::filesystem::exists(absolute, ec)) {
        if (!std::filesystem::is_directory(absolute, ec)) {
            throw DirectoryError(ErrorCodes::DIRECTORY_NOT_A_DIRECTORY,
                                 "Not a directory: " + absolute.string());
        }
        return absolute;
    }

    ec.clear();
    std::filesystem::create_directories(absolute, ec);
    if (ec) {
        throw DirectoryError(ErrorCodes::DIRECTORY_CREATE_FAILED,
                             "Failed to create folder " + absolute.string() + ": " + ec.message());
    }
    return absolute;
}

void validateConfig(const ServiceConfig& config) {
    in_addr addr{};
    if (inet_pton(AF_INET, config.host.c_str(), &addr) != 1) {
        throw ValidationError(ErrorCodes::CONFIG_INVALID_HOST, "Invalid bind address: '" + config.host + "'");
    }
    if (config.port == 0) {
        throw ValidationError(ErrorCodes::CONFIG_INVALID_PORT, "Port out of range (1-65535): 0");
    }
    (void)validateUsername(config.username);
    (void)validatePassword(config.password);

    if (!config.sharedRoot.is_absolute()) {
        throw DirectoryError(ErrorCodes::DIRECTORY_EMPTY_PATH,
                             "Folder must be an absolute path: '" + config.sharedRoot.string() + "'");
    }
    (void)prepareSharedRoot(config.sharedRoot);
}

}  // namespace ConfigValidation

}  // namespace FtpShare
