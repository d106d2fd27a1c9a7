/**
 * @file NetworkInfo.cpp
 * @brief Local address discovery over POSIX sockets
 */

#include "ftpshare/NetworkInfo.h"
#include "ftpshare/Debug.h"
#include "ftpshare/config.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace FtpShare {

namespace {

bool isLoopback(const std::string& ip) {
    return ip.compare(0, 4, "127.") == 0;
}

std::string ntop(const in_addr& addr) {
    char buf[INET_ADDRSTRLEN] = {};
    if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf))) {
        return {};
    }
    return std::string(buf);
}

std::string localHostname() {
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        return {};
    }
    return std::string(hostname);
}

}  // namespace

std::optional<std::string> SystemNetworkInfo::probeOutboundAddress() noexcept {
    int sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock < 0) {
        LOG_DEBUG("Outbound probe: socket() failed: " << std::strerror(errno));
        return std::nullopt;
    }

    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(PROBE_TARGET_PORT);
    if (inet_pton(AF_INET, PROBE_TARGET_IP, &target.sin_addr) != 1) {
        close(sock);
        return std::nullopt;
    }

    // connect() on a datagram socket only selects a route; nothing is sent
    if (connect(sock, reinterpret_cast<sockaddr*>(&target), sizeof(target)) != 0) {
        LOG_DEBUG("Outbound probe: no route: " << std::strerror(errno));
        close(sock);
        return std::nullopt;
    }

    sockaddr_in local{};
    socklen_t len = sizeof(local);
    const int rc = getsockname(sock, reinterpret_cast<sockaddr*>(&local), &len);
    close(sock);
    if (rc != 0) {
        return std::nullopt;
    }

    std::string ip = ntop(local.sin_addr);
    if (ip.empty() || ip == "0.0.0.0") {
        return std::nullopt;
    }
    return ip;
}

std::vector<std::string> SystemNetworkInfo::enumerateInterfaceAddresses() noexcept {
    std::vector<std::string> out;

    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        LOG_DEBUG("getifaddrs failed: " << std::strerror(errno));
        return out;
    }

    try {
        for (ifaddrs* it = list; it; it = it->ifa_next) {
            if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
                continue;
            }
            if ((it->ifa_flags & IFF_UP) == 0) {
                continue;
            }
            const auto* addr = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
            std::string ip = ntop(addr->sin_addr);
            if (!ip.empty()) {
                out.push_back(std::move(ip));
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Interface enumeration aborted: " << e.what());
    }

    freeifaddrs(list);
    return out;
}

std::vector<std::string> SystemNetworkInfo::resolveHostnameAddresses() noexcept {
    std::vector<std::string> out;

    try {
        const std::string hostname = localHostname();
        if (hostname.empty()) {
            return out;
        }

        // getaddrinfo rather than gethostbyname: status() may run on several threads
        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* res = nullptr;
        const int rc = getaddrinfo(hostname.c_str(), nullptr, &hints, &res);
        if (rc != 0) {
            LOG_DEBUG("getaddrinfo(" << hostname << ") failed: " << gai_strerror(rc));
            return out;
        }

        for (addrinfo* it = res; it; it = it->ai_next) {
            if (it->ai_family != AF_INET || !it->ai_addr) {
                continue;
            }
            const auto* addr = reinterpret_cast<const sockaddr_in*>(it->ai_addr);
            std::string ip = ntop(addr->sin_addr);
            if (!ip.empty()) {
                out.push_back(std::move(ip));
            }
        }
        freeaddrinfo(res);
    } catch (const std::exception& e) {
        LOG_DEBUG("Hostname resolution aborted: " << e.what());
    }

    return out;
}

std::vector<std::string> SystemNetworkInfo::normalizeAddresses(std::vector<std::string> addresses) {
    addresses.erase(std::remove_if(addresses.begin(), addresses.end(),
                                   [](const std::string& ip) { return ip.empty() || isLoopback(ip); }),
                    addresses.end());
    std::sort(addresses.begin(), addresses.end());
    addresses.erase(std::unique(addresses.begin(), addresses.end()), addresses.end());

    if (addresses.empty()) {
        addresses.push_back(LOCALHOST_IP);
    }
    return addresses;
}

std::string SystemNetworkInfo::primaryAddress() const noexcept {
    try {
        if (auto probed = probeOutboundAddress()) {
            return *probed;
        }

        // Fall back to whatever the host name resolves to
        const auto resolved = resolveHostnameAddresses();
        for (const auto& ip : resolved) {
            if (!isLoopback(ip)) {
                return ip;
            }
        }
        if (!resolved.empty()) {
            return resolved.front();
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Primary address discovery failed: " << e.what());
    }
    return LOCALHOST_IP;
}

std::vector<std::string> SystemNetworkInfo::reachableAddresses() const noexcept {
    try {
        std::vector<std::string> all;

        if (auto probed = probeOutboundAddress()) {
            all.push_back(*probed);
        }

        auto interfaces = enumerateInterfaceAddresses();
        all.insert(all.end(), interfaces.begin(), interfaces.end());

        auto resolved = resolveHostnameAddresses();
        all.insert(all.end(), resolved.begin(), resolved.end());

        return normalizeAddresses(std::move(all));
    } catch (const std::exception& e) {
        LOG_DEBUG("Address discovery failed: " << e.what());
    }

    return {LOCALHOST_IP};
}

}  // namespace FtpShare
