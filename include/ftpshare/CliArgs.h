/**
 * @file CliArgs.h
 * @brief Command line parsing for the ftpshare executable.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace FtpShare {

struct CliArgs {
    bool showHelp = false;
    bool nonInteractive = false;

    /// First positional argument
    std::optional<std::string> folder;

    /// Second positional argument, kept verbatim; only used when all digits
    std::optional<std::string> portText;

    std::optional<std::string> configPath;
    std::optional<std::string> logFile;

    static CliArgs parseOrThrow(int argc, const char* const* argv);

    static std::string usage(const std::string& programName);
};

}  // namespace FtpShare
