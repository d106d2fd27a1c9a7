/**
 * @file PasswordGenerator.cpp
 * @brief PasswordGenerator implementation.
 */

#include "ftpshare/PasswordGenerator.h"
#include "ftpshare/config.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>

namespace FtpShare {

namespace {

static std::string opensslLastErrorString() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "Unknown error";
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

}  // namespace

std::string PasswordGenerator::toBase64Url(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return {};
    }

    // EVP_EncodeBlock writes 4 chars per 3 input bytes plus a NUL
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                        bytes.data(),
                                        static_cast<int>(bytes.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);

    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

bool PasswordGenerator::generate(size_t sourceBytes, std::string& out, std::string& errorMsg) {
    out.clear();
    errorMsg.clear();

    if (sourceBytes < GENERATED_PASSWORD_BYTES) {
        errorMsg = "At least " + std::to_string(GENERATED_PASSWORD_BYTES) + " random bytes are required";
        return false;
    }

    std::vector<uint8_t> raw(sourceBytes);
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        errorMsg = "RAND_bytes failed: " + opensslLastErrorString();
        std::fill(raw.begin(), raw.end(), 0);
        return false;
    }

    out = toBase64Url(raw);
    std::fill(raw.begin(), raw.end(), 0);
    return true;
}

}  // namespace FtpShare
