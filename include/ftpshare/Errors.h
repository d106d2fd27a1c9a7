/**
 * @file Errors.h
 * @brief Exception types shared by the supervisor and its collaborators
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace FtpShare {

/**
 * @brief Bad operator input for a configuration field.
 *
 * Reported to the operator; never changes supervisor state.
 */
class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& code, const std::string& message)
        : std::runtime_error(code + ": " + message)
        , m_code(code) {}

    const std::string& code() const { return m_code; }

private:
    std::string m_code;
};

/**
 * @brief Shared root cannot be created or is not a directory.
 *
 * Fatal at startup in non-interactive mode, recoverable from the menu otherwise.
 */
class DirectoryError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

/**
 * @brief The listener could not reserve host:port.
 *
 * Only fails the attempt that raised it.
 */
class BindError : public std::runtime_error {
public:
    BindError(std::string host, uint16_t port, std::string cause)
        : std::runtime_error("Failed to bind server to " + host + ":" +
                             std::to_string(port) + " -- " + cause)
        , m_host(std::move(host))
        , m_port(port)
        , m_cause(std::move(cause)) {}

    const std::string& host() const { return m_host; }
    uint16_t port() const { return m_port; }
    const std::string& cause() const { return m_cause; }

private:
    std::string m_host;
    uint16_t m_port;
    std::string m_cause;
};

/**
 * @brief Settings store unreachable or corrupt.
 *
 * Logged by the supervisor; never unwinds the change that triggered the write.
 */
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace FtpShare
