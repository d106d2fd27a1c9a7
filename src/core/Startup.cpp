/**
 * @file Startup.cpp
 * @brief Startup config assembly and the non-interactive service run
 */

#include "ftpshare/Startup.h"
#include "ftpshare/Debug.h"
#include "ftpshare/Errors.h"
#include "ftpshare/OperatorConsole.h"
#include "ftpshare/config.h"

#include <algorithm>
#include <cctype>
#include <thread>

namespace FtpShare {

namespace {

bool allDigits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

//=============================================================================
// Settings
//=============================================================================

std::string loadSetting(const ConfigStore& store, const std::string& key, const std::string& defaultValue) {
    try {
        return store.get(key, defaultValue);
    } catch (const PersistenceError& e) {
        LOG_WARNING("Using default for '" << key << "': " << e.what());
        return defaultValue;
    }
}

uint16_t loadPort(const ConfigStore& store) {
    const std::string stored = loadSetting(store, KEY_PORT, std::to_string(DEFAULT_PORT));
    try {
        return ConfigValidation::parsePort(stored);
    } catch (const ValidationError& e) {
        LOG_WARNING("Ignoring stored port: " << e.what());
        return DEFAULT_PORT;
    }
}

ServiceConfig loadStoredConfig(const ConfigStore& store) {
    ServiceConfig config;
    config.host = DEFAULT_BIND_HOST;
    config.username = loadSetting(store, KEY_USERNAME, DEFAULT_USERNAME);
    config.password = loadSetting(store, KEY_PASSWORD, DEFAULT_PASSWORD);
    config.port = loadPort(store);
    return config;
}

ServiceConfig buildNonInteractiveConfig(const CliArgs& args,
                                        const ConfigStore& store,
                                        const std::filesystem::path& workingDir) {
    ServiceConfig config = loadStoredConfig(store);

    if (args.portText && allDigits(*args.portText)) {
        config.port = ConfigValidation::parsePort(*args.portText);
    } else if (args.portText) {
        LOG_WARNING("Ignoring port argument '" << *args.portText << "'; using " << config.port);
    }

    const std::filesystem::path folder = args.folder ? std::filesystem::path(*args.folder) : workingDir;
    config.sharedRoot = ConfigValidation::prepareSharedRoot(folder);
    return config;
}

//=============================================================================
// Non-interactive run
//=============================================================================

int serveUntilStopped(ServiceSupervisor& supervisor,
                      std::ostream& out,
                      const std::atomic<bool>& stopRequested,
                      std::chrono::milliseconds pollInterval) {
    TransitionResult result;
    try {
        result = supervisor.start(supervisor.currentConfig());
    } catch (const ValidationError& e) {
        LOG_ERROR(e.what());
        return EXIT_CODE_FAILURE;
    }
    if (!result.ok) {
        return EXIT_CODE_FAILURE;
    }

    const SupervisorSnapshot& s = result.snapshot;
    LOG_INFO("FTP server configured to bind " << s.config.host << ":" << s.config.port);
    LOG_INFO("Recommended access (on this host): ftp://" << s.primaryAddress << ":" << s.config.port);
    LOG_INFO("Sharing folder: " << s.config.sharedRoot.string());
    LOG_INFO("Username: " << s.config.username);
    printConnectionInfo(out, s);

    while (!stopRequested.load()) {
        if (!supervisor.isRunning()) {
            LOG_ERROR("Listener is no longer running; exiting");
            supervisor.stop();
            return EXIT_CODE_FAILURE;
        }
        std::this_thread::sleep_for(pollInterval);
    }

    LOG_INFO("Stop requested");
    supervisor.stop();
    return EXIT_CODE_OK;
}

}  // namespace FtpShare
