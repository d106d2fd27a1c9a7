/**
 * @file AppPaths.h
 * @brief Canonical storage paths for FtpShare (XDG layout).
 *
 * Path contract:
 * - Settings: $XDG_CONFIG_HOME/ftpshare/settings.json
 *             (or $HOME/.config/ftpshare/settings.json)
 *
 * $FTPSHARE_CONFIG overrides the settings file location (dev/tests);
 * the --config command line option overrides both.
 */

#pragma once

#include <filesystem>

namespace FtpShare {

class AppPaths {
public:
    /**
     * @brief Returns $XDG_CONFIG_HOME, else $HOME/.config, else an empty path.
     */
    static std::filesystem::path userConfigRoot();

    /**
     * @brief Returns the FtpShare directory under userConfigRoot().
     * @return $XDG_CONFIG_HOME/ftpshare
     */
    static std::filesystem::path appConfigDir();

    /**
     * @brief Returns the settings file path, honouring $FTPSHARE_CONFIG.
     *
     * Falls back to ./ftpshare_settings.json when no home directory is known.
     */
    static std::filesystem::path settingsJsonPath();
};

}  // namespace FtpShare
