/**
 * @file Startup.h
 * @brief Startup config assembly and the non-interactive service run
 */

#pragma once

#include "ftpshare/CliArgs.h"
#include "ftpshare/ConfigStore.h"
#include "ftpshare/ServiceConfig.h"
#include "ftpshare/ServiceSupervisor.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace FtpShare {

/**
 * @brief Process exit codes of the ftpshare executable
 */
enum ExitCode : int {
    EXIT_CODE_OK = 0,
    EXIT_CODE_FAILURE = 1,   ///< Folder, config, bind or listener failure
    EXIT_CODE_USAGE = 2      ///< Bad command line
};

/**
 * @brief Read a stored setting, falling back to the default if the store is unusable
 */
std::string loadSetting(const ConfigStore& store, const std::string& key, const std::string& defaultValue);

/**
 * @brief Stored port, or DEFAULT_PORT if absent, unreadable or invalid
 */
uint16_t loadPort(const ConfigStore& store);

/**
 * @brief host, username, password and port from the store (shared root left empty)
 *
 * Missing or unreadable values take the built-in defaults.
 */
ServiceConfig loadStoredConfig(const ConfigStore& store);

/**
 * @brief Full config for --noninteractive
 *
 * - Folder argument, else @p workingDir, created if missing
 * - Port argument when it is all digits, else the stored port
 *
 * @throws DirectoryError if the folder cannot be created
 * @throws ValidationError if an all-digits port argument is out of range
 */
ServiceConfig buildNonInteractiveConfig(const CliArgs& args,
                                        const ConfigStore& store,
                                        const std::filesystem::path& workingDir);

/**
 * @brief Start the supervisor and serve until @p stopRequested or the listener dies
 *
 * Prints the connection block to @p out once the listener is up.
 *
 * @return EXIT_CODE_OK after an orderly stop, EXIT_CODE_FAILURE if the start
 *         failed or the listener exited on its own
 */
int serveUntilStopped(ServiceSupervisor& supervisor,
                      std::ostream& out,
                      const std::atomic<bool>& stopRequested,
                      std::chrono::milliseconds pollInterval);

}  // namespace FtpShare
