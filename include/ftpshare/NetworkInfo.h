/**
 * @file NetworkInfo.h
 * @brief Best-effort discovery of local addresses for display
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace FtpShare {

/**
 * @brief Reachability capability used for status display only.
 *
 * Both queries never fail the caller: every error inside a strategy is
 * absorbed and the strategy contributes nothing.
 */
class NetworkInfo {
public:
    virtual ~NetworkInfo() = default;

    /**
     * @brief The address of the interface used for outbound traffic
     * @return Dotted IPv4 address, or "127.0.0.1" if nothing was found
     */
    virtual std::string primaryAddress() const noexcept = 0;

    /**
     * @brief Sorted, de-duplicated non-loopback IPv4 addresses of this host
     * @return Never empty: {"127.0.0.1"} if nothing else was found
     */
    virtual std::vector<std::string> reachableAddresses() const noexcept = 0;
};

/**
 * @brief NetworkInfo over POSIX sockets.
 *
 * Strategy (in order, results unioned):
 * 1. UDP connect to a well-known external address, read the local name
 *    (no packet is sent).
 * 2. getifaddrs() interface enumeration.
 * 3. gethostbyname()/getaddrinfo() on the host name.
 */
class SystemNetworkInfo : public NetworkInfo {
public:
    std::string primaryAddress() const noexcept override;
    std::vector<std::string> reachableAddresses() const noexcept override;

    /// Strategy 1. Empty on failure.
    static std::optional<std::string> probeOutboundAddress() noexcept;

    /// Strategy 2. Empty on failure.
    static std::vector<std::string> enumerateInterfaceAddresses() noexcept;

    /// Strategy 3. Empty on failure.
    static std::vector<std::string> resolveHostnameAddresses() noexcept;

    /**
     * @brief Drop loopback/empty entries, sort, de-duplicate, fall back to 127.0.0.1
     */
    static std::vector<std::string> normalizeAddresses(std::vector<std::string> addresses);
};

}  // namespace FtpShare
