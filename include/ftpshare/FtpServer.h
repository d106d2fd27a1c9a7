/**
 * @file FtpServer.h
 * @brief Multi-threaded FTP listener serving one shared root
 */

#pragma once

#include "ftpshare/FtpSession.h"
#include "ftpshare/ServiceConfig.h"
#include "ftpshare/TransferService.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace FtpShare {

/**
 * @class FtpServer
 * @brief TCP listener that accepts FTP control connections
 *
 * The listening socket is bound in the constructor, so a constructed server
 * owns its port until it is destroyed. serveForever() accepts connections and
 * runs one FtpSession per client on its own thread.
 *
 * Architecture:
 * - serveForever() polls the listen socket so stop() is noticed promptly
 * - One thread per control connection, at most MAX_FTP_SESSIONS
 * - Finished session threads are reaped on each accept loop iteration
 *
 * Thread Safety:
 * - stop() and activeSessionCount() are safe from any thread
 * - serveForever() must be called at most once
 *
 * Usage:
 * @code
 * ServiceConfig cfg;
 * cfg.sharedRoot = "/srv/share";
 * FtpServer server(cfg, FtpAccount{cfg.username, cfg.password, FULL_PERMISSIONS});
 * std::thread t([&] { server.serveForever(); });
 * // ...
 * server.stop();
 * t.join();
 * @endcode
 */
class FtpServer : public TransferService {
public:
    /**
     * @brief Bind host:port and start listening
     * @throws BindError if the socket cannot be bound or listened on
     */
    FtpServer(const ServiceConfig& config, FtpAccount account);

    /**
     * @brief Destructor
     *
     * Stops the server and joins any session threads still running.
     */
    ~FtpServer() override;

    // Prevent copying
    FtpServer(const FtpServer&) = delete;
    FtpServer& operator=(const FtpServer&) = delete;

    void serveForever() override;
    void stop() override;
    uint16_t boundPort() const override { return m_boundPort; }

    /**
     * @brief Number of control connections currently being served
     */
    size_t activeSessionCount() const { return m_activeSessionCount.load(); }

private:
    struct SessionSlot {
        std::shared_ptr<FtpSession> session;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void acceptOne();
    void reapFinishedSessions();
    void abortAllSessions();
    void joinAllSessions();
    void closeListenSocket();

    std::string m_host;
    uint16_t m_boundPort;
    FtpAccount m_account;
    std::filesystem::path m_root;

    std::mutex m_listenMutex;
    int m_listenFd;

    std::atomic<bool> m_stopRequested;
    std::atomic<size_t> m_activeSessionCount;

    std::mutex m_sessionsMutex;
    std::list<SessionSlot> m_sessions;
};

}  // namespace FtpShare
