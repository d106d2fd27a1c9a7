/**
 * @file AtomicFile.cpp
 * @brief Atomic file helpers implementation.
 */

#include "ftpshare/AtomicFile.h"

#include <fstream>
#include <system_error>

namespace FtpShare {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath)
{
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += ".part";
    return out;
}

bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& content,
                         std::string& errorMsg)
{
    errorMsg.clear();

    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath);
    std::error_code ec;

    const auto dir = finalPath.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            errorMsg = "Failed to create directory " + dir.string() + ": " + ec.message();
            return false;
        }
    }

    {
        std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            errorMsg = "Failed to open temp file " + paths.tempPath.string();
            return false;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(paths.tempPath, ec);
            errorMsg = "Failed to write temp file " + paths.tempPath.string();
            return false;
        }
    }

    std::filesystem::rename(paths.tempPath, paths.finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        std::error_code removeEc;
        std::filesystem::remove(paths.tempPath, removeEc);
        return false;
    }

    return true;
}

}  // namespace FtpShare
