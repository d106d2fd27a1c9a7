/**
 * @file AtomicFile.h
 * @brief Small helpers for atomic file writes (write temp, then rename).
 */

#pragma once

#include <filesystem>
#include <string>

namespace FtpShare {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;
};

/**
 * @brief Compute a temp path next to finalPath for atomic writes.
 *
 * The temp path is derived deterministically from finalPath so callers can
 * clean up partial files on error.
 */
AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath);

/**
 * @brief Write content to finalPath so readers see either the old or the new file.
 *
 * Writes the temp file, flushes it, then renames it over finalPath (replacing
 * an existing file). The parent directory is created if missing. On failure the
 * temp file is removed and finalPath is untouched.
 */
bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& content,
                         std::string& errorMsg);

}  // namespace FtpShare
