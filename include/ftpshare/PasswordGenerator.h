/**
 * @file PasswordGenerator.h
 * @brief Random replacement password (CSPRNG bytes + base64url encoding).
 *
 * Used when the supervisor is constructed with an empty password so the
 * listener never starts with empty credentials.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace FtpShare {

class PasswordGenerator {
public:
    /**
     * @brief Generate a URL-safe password from sourceBytes of CSPRNG output.
     * @param sourceBytes Random bytes to draw (at least 12)
     * @param out Output password (base64url, no padding)
     * @param errorMsg Output error message on failure.
     * @return true on success.
     */
    static bool generate(size_t sourceBytes, std::string& out, std::string& errorMsg);

    /**
     * @brief Encode bytes as base64url without '=' padding.
     */
    static std::string toBase64Url(const std::vector<uint8_t>& bytes);
};

}  // namespace FtpShare
