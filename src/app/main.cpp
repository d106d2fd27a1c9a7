/**
 * @file main.cpp
 * @brief ftpshare entry point: interactive menu or signal-driven service
 */

#include "ftpshare/AppPaths.h"
#include "ftpshare/CliArgs.h"
#include "ftpshare/ConfigStore.h"
#include "ftpshare/Debug.h"
#include "ftpshare/Errors.h"
#include "ftpshare/NetworkInfo.h"
#include "ftpshare/OperatorConsole.h"
#include "ftpshare/ServiceSupervisor.h"
#include "ftpshare/Startup.h"
#include "ftpshare/ThreadSafeLog.h"
#include "ftpshare/config.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>

using namespace FtpShare;

//=============================================================================
// Signal Handling
//=============================================================================

static std::atomic<bool> g_stopRequested(false);

extern "C" void signalHandler(int signal) {
    (void)signal;
    g_stopRequested.store(true);
}

//=============================================================================
// Helpers
//=============================================================================

namespace {

int runNonInteractive(const CliArgs& args, JsonConfigStore& store, const NetworkInfo& network) {
    LOG_INFO("Starting in non-interactive mode (settings: " << store.path().string() << ")");

    ServiceConfig config;
    try {
        config = buildNonInteractiveConfig(args, store, std::filesystem::current_path());
    } catch (const DirectoryError& e) {
        LOG_ERROR("Failed to create shared folder: " << e.what());
        return EXIT_CODE_FAILURE;
    } catch (const ValidationError& e) {
        LOG_ERROR(e.what());
        return EXIT_CODE_FAILURE;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    ServiceSupervisor supervisor(store, network, makeFtpServiceFactory(), config);
    return serveUntilStopped(supervisor, std::cout, g_stopRequested,
                             std::chrono::milliseconds(SIGNAL_POLL_INTERVAL_MS));
}

int runInteractive(JsonConfigStore& store, const NetworkInfo& network) {
    const std::string folder = promptWithDefault(std::cin, std::cout, "\nFolder to share",
                                                 std::filesystem::current_path().string());

    ServiceConfig config = loadStoredConfig(store);
    config.sharedRoot = std::filesystem::absolute(folder).lexically_normal();

    ServiceSupervisor supervisor(store, network, makeFtpServiceFactory(), config);
    OperatorConsole console(supervisor, std::cin, std::cout);

    if (supervisor.generatedPassword()) {
        std::cout << "Generated password: " << *supervisor.generatedPassword() << std::endl;
    }

    try {
        console.reportStartup(supervisor.start(supervisor.currentConfig()));
    } catch (const ValidationError& e) {
        console.reportStartupError(e.what());
    }

    console.run();
    return EXIT_CODE_OK;
}

}  // namespace

//=============================================================================
// Main
//=============================================================================

int main(int argc, char* argv[]) {
    CliArgs args;
    try {
        args = CliArgs::parseOrThrow(argc, argv);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n\n" << CliArgs::usage(argv[0]);
        return EXIT_CODE_USAGE;
    }

    if (args.showHelp) {
        std::cout << CliArgs::usage(argv[0]);
        return EXIT_CODE_OK;
    }

    if (args.logFile) {
        ThreadSafeLog::initialize(*args.logFile, LOG_FILE_MAX_BYTES);
    }

    // The menu owns the terminal; console logging only when asked for
    setLogOutputEnabled(args.nonInteractive || args.logFile.has_value());

    const std::filesystem::path settingsPath =
        args.configPath ? std::filesystem::path(*args.configPath) : AppPaths::settingsJsonPath();

    JsonConfigStore store(settingsPath);
    try {
        store.initialize();
    } catch (const PersistenceError& e) {
        LOG_WARNING("Settings unavailable, using defaults: " << e.what());
    }

    SystemNetworkInfo network;

    try {
        if (args.nonInteractive) {
            return runNonInteractive(args, store, network);
        }
        return runInteractive(store, network);
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: " << e.what());
        std::cerr << "Fatal: " << e.what() << std::endl;
        return EXIT_CODE_FAILURE;
    }
}
