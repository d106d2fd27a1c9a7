/**
 * @file AppPaths.cpp
 * @brief Canonical storage paths for FtpShare.
 */

#include "ftpshare/AppPaths.h"
#include "ftpshare/config.h"

#include <cstdlib>
#include <string>

namespace FtpShare {

static std::filesystem::path envPath(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return {};
    }
    return std::filesystem::path(value);
}

std::filesystem::path AppPaths::userConfigRoot() {
    const auto xdg = envPath("XDG_CONFIG_HOME");
    if (!xdg.empty() && xdg.is_absolute()) {
        return xdg;
    }

    const auto home = envPath("HOME");
    if (home.empty()) {
        return {};
    }
    return home / ".config";
}

std::filesystem::path AppPaths::appConfigDir() {
    const auto root = userConfigRoot();
    if (root.empty()) {
        return {};
    }
    return root / APP_DIR_NAME;
}

std::filesystem::path AppPaths::settingsJsonPath() {
    const auto overridePath = envPath("FTPSHARE_CONFIG");
    if (!overridePath.empty()) {
        return overridePath;
    }

    const auto dir = appConfigDir();
    if (dir.empty()) {
        return std::filesystem::path(std::string(APP_DIR_NAME) + "_" + SETTINGS_FILE_NAME);
    }
    return dir / SETTINGS_FILE_NAME;
}

}  // namespace FtpShare
