/**
 * @file CliArgs.cpp
 * @brief Command line parsing for the ftpshare executable.
 */

#include "ftpshare/CliArgs.h"

#include <sstream>

namespace FtpShare {

CliArgs CliArgs::parseOrThrow(int argc, const char* const* argv) {
    CliArgs out;

    auto requireValue = [argc, argv](int& i, const std::string& flag) {
        if (i + 1 >= argc || !argv[i + 1]) {
            throw std::runtime_error("Missing value for " + flag);
        }
        return std::string(argv[++i]);
    };

    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? std::string(argv[i]) : std::string();

        if (a == "--help" || a == "-h") {
            out.showHelp = true;
            continue;
        }

        if (a == "--noninteractive" || a == "--non-interactive") {
            out.nonInteractive = true;
            continue;
        }

        if (a == "--config") {
            out.configPath = requireValue(i, a);
            continue;
        }

        if (a == "--log-file") {
            out.logFile = requireValue(i, a);
            continue;
        }

        if (a.size() > 1 && a[0] == '-' && a[1] == '-') {
            throw std::runtime_error("Unknown argument: " + a);
        }

        if (positional == 0) {
            out.folder = a;
        } else if (positional == 1) {
            out.portText = a;
        } else {
            throw std::runtime_error("Unexpected argument: " + a);
        }
        ++positional;
    }

    return out;
}

std::string CliArgs::usage(const std::string& programName) {
    std::ostringstream oss;
    oss << "Usage: " << programName << " [folder] [port] [options]\n"
        << "\n"
        << "Share a folder over FTP. Credentials and port can be changed while\n"
        << "the server runs from the interactive menu.\n"
        << "\n"
        << "Options:\n"
        << "  --noninteractive   Serve until SIGINT/SIGTERM without the menu\n"
        << "  --config PATH      Settings file (default: per-user config dir)\n"
        << "  --log-file PATH    Also append log lines to PATH\n"
        << "  -h, --help         Show this help\n";
    return oss.str();
}

}  // namespace FtpShare
