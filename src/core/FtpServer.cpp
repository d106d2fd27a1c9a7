/**
 * @file FtpServer.cpp
 * @brief FTP listener implementation
 */

#include "ftpshare/FtpServer.h"
#include "ftpshare/Debug.h"
#include "ftpshare/ErrorCodes.h"
#include "ftpshare/Errors.h"
#include "ftpshare/config.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace FtpShare {

//=============================================================================
// FtpServer: Constructor
//=============================================================================

FtpServer::FtpServer(const ServiceConfig& config, FtpAccount account)
    : m_host(config.host)
    , m_boundPort(0)
    , m_account(std::move(account))
    , m_listenFd(-1)
    , m_stopRequested(false)
    , m_activeSessionCount(0)
{
    // Sessions compare canonical paths against the root
    std::error_code ec;
    m_root = std::filesystem::canonical(config.sharedRoot, ec);
    if (ec) {
        m_root = config.sharedRoot;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config.port);
    if (inet_pton(AF_INET, m_host.c_str(), &addr.sin_addr) != 1) {
        throw BindError(m_host, config.port, "invalid IPv4 address");
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw BindError(m_host, config.port, std::strerror(errno));
    }

    // Lets a restart on the same port succeed while old connections sit in TIME_WAIT
    int reuse = 1;
    (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        const std::string cause = std::strerror(errno);
        ::close(fd);
        throw BindError(m_host, config.port, cause);
    }
    if (::listen(fd, LISTEN_BACKLOG) != 0) {
        const std::string cause = std::strerror(errno);
        LOG_ERROR(ErrorCodes::LISTEN_FAILED << ": listen() on port " << config.port << " failed: " << cause);
        ::close(fd);
        throw BindError(m_host, config.port, cause);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        m_boundPort = ntohs(bound.sin_port);
    } else {
        m_boundPort = config.port;
    }

    m_listenFd = fd;
    LOG_DEBUG("FTP listener bound to " << m_host << ":" << m_boundPort
              << " serving " << m_root.string());
}

//=============================================================================
// FtpServer: Destructor
//=============================================================================

FtpServer::~FtpServer() {
    stop();
    joinAllSessions();
    closeListenSocket();
}

//=============================================================================
// FtpServer: serveForever()
//=============================================================================

void FtpServer::serveForever() {
    LOG_INFO("Serving FTP on " << m_host << ":" << m_boundPort);

    while (!m_stopRequested.load()) {
        int fd;
        {
            std::lock_guard<std::mutex> lock(m_listenMutex);
            fd = m_listenFd;
        }
        if (fd < 0) {
            break;
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, ACCEPT_POLL_INTERVAL_MS);

        reapFinishedSessions();

        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("poll() on listen socket failed: " << std::strerror(errno));
            break;
        }
        if (ready == 0 || m_stopRequested.load()) {
            continue;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            break;
        }

        acceptOne();
    }

    closeListenSocket();
    abortAllSessions();
    joinAllSessions();

    LOG_INFO("FTP listener on port " << m_boundPort << " closed");
}

//=============================================================================
// FtpServer: stop()
//=============================================================================

void FtpServer::stop() {
    if (m_stopRequested.exchange(true)) {
        return;
    }

    {
        // Wakes a poll() in progress on Linux; the poll timeout covers the rest
        std::lock_guard<std::mutex> lock(m_listenMutex);
        if (m_listenFd >= 0) {
            (void)::shutdown(m_listenFd, SHUT_RDWR);
        }
    }

    abortAllSessions();
}

//=============================================================================
// FtpServer: connection handling
//=============================================================================

void FtpServer::acceptOne() {
    int listenFd;
    {
        std::lock_guard<std::mutex> lock(m_listenMutex);
        listenFd = m_listenFd;
    }
    if (listenFd < 0) {
        return;
    }

    sockaddr_in clientAddr{};
    socklen_t addrLen = sizeof(clientAddr);
    const int clientFd = ::accept(listenFd, reinterpret_cast<sockaddr*>(&clientAddr), &addrLen);
    if (clientFd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR && !m_stopRequested.load()) {
            LOG_WARNING("accept() failed: " << std::strerror(errno));
        }
        return;
    }

    char ipStr[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &clientAddr.sin_addr, ipStr, sizeof(ipStr));
    const std::string clientIp(ipStr);

    if (m_activeSessionCount.load() >= MAX_FTP_SESSIONS) {
        static const char busy[] = "421 Too many connections. Service temporarily unavailable.\r\n";
        (void)::send(clientFd, busy, sizeof(busy) - 1, MSG_NOSIGNAL);
        ::close(clientFd);
        LOG_WARNING("Rejected " << clientIp << ": session limit reached");
        return;
    }

    auto session = std::make_shared<FtpSession>(clientFd, clientIp, m_account, m_root);

    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    if (m_stopRequested.load()) {
        // stop() has already swept the list; this session would be missed
        return;
    }
    m_sessions.emplace_back();
    SessionSlot* slot = &m_sessions.back();
    slot->session = session;
    m_activeSessionCount.fetch_add(1);

    slot->thread = std::thread([this, slot]() {
        try {
            slot->session->run();
        } catch (const std::exception& e) {
            LOG_ERROR("FTP session for " << slot->session->clientIp()
                      << " ended with exception: " << e.what());
        }
        m_activeSessionCount.fetch_sub(1);
        slot->done.store(true);
    });
}

void FtpServer::reapFinishedSessions() {
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    for (auto it = m_sessions.begin(); it != m_sessions.end();) {
        if (it->done.load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = m_sessions.erase(it);
        } else {
            ++it;
        }
    }
}

void FtpServer::abortAllSessions() {
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    for (auto& slot : m_sessions) {
        if (slot.session) {
            slot.session->abort();
        }
    }
}

void FtpServer::joinAllSessions() {
    std::list<SessionSlot> finished;
    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        finished.splice(finished.end(), m_sessions);
    }

    for (auto& slot : finished) {
        if (slot.thread.joinable()) {
            slot.thread.join();
        }
    }
}

void FtpServer::closeListenSocket() {
    std::lock_guard<std::mutex> lock(m_listenMutex);
    if (m_listenFd >= 0) {
        ::close(m_listenFd);
        m_listenFd = -1;
    }
}

//=============================================================================
// Factory
//=============================================================================

TransferServiceFactory makeFtpServiceFactory() {
    return [](const ServiceConfig& config) -> std::unique_ptr<TransferService> {
        FtpAccount account{config.username, config.password, FULL_PERMISSIONS};
        return std::make_unique<FtpServer>(config, std::move(account));
    };
}

}  // namespace FtpShare
