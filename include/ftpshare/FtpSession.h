/**
 * @file FtpSession.h
 * @brief One FTP control connection (login, navigation, transfers)
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace FtpShare {

/**
 * @brief The single account served by an FtpServer
 */
struct FtpAccount {
    std::string username;
    std::string password;
    std::string permissions;  ///< Letters from "elradfmwMT"

    bool hasPermission(char perm) const {
        return permissions.find(perm) != std::string::npos;
    }
};

/**
 * @class FtpSession
 * @brief Serves one client on an accepted control socket
 *
 * Supports passive (PASV/EPSV) and active (PORT, client address only) data
 * connections. Every path the client names is a virtual path rooted at "/"
 * that maps onto the shared root; it can never leave the root.
 *
 * Thread Safety:
 * - run() executes on the session's own thread
 * - abort() may be called from any thread to unblock run()
 */
class FtpSession {
public:
    /**
     * @param controlFd Connected control socket (ownership transferred)
     * @param clientIp Peer address, used for logging and PORT validation
     * @param account Account allowed to log in
     * @param root Canonical shared root directory
     */
    FtpSession(int controlFd, std::string clientIp, FtpAccount account, std::filesystem::path root);
    ~FtpSession();

    FtpSession(const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    /**
     * @brief Greet the client and process commands until QUIT, disconnect or abort()
     */
    void run();

    /**
     * @brief Shut down the control and data sockets so run() returns promptly
     */
    void abort();

    const std::string& clientIp() const { return m_clientIp; }

    /**
     * @brief Resolve a client supplied path against a virtual working directory
     *
     * Handles absolute and relative forms, "." and "..". Climbing above "/"
     * stays at "/".
     *
     * @return Normalized virtual path, always starting with '/'
     */
    static std::string resolveVirtualPath(const std::string& cwd, const std::string& arg);

    /**
     * @brief Format one LIST line in "ls -l" style
     */
    static std::string formatListLine(const std::filesystem::directory_entry& entry);

private:
    using Handler = void (FtpSession::*)(const std::string& arg);

    struct CommandSpec {
        Handler handler;
        bool requiresLogin;
        char permission;  ///< '\0' if none needed
    };

    static const std::unordered_map<std::string, CommandSpec>& commandTable();

    // Control channel
    bool readLine(std::string& line);
    void reply(int code, const std::string& text);
    void replyRaw(const std::string& text);
    void dispatch(const std::string& line);

    // Data channel
    void closeDataListener();
    bool openPassiveListener(uint32_t& hostIp, uint16_t& port);
    int openDataConnection();
    void closeDataConnection(int fd);
    bool sendAllOn(int fd, const char* data, size_t len);

    // Paths
    std::filesystem::path toRealPath(const std::string& virtualPath) const;
    bool isInsideRoot(const std::filesystem::path& realPath) const;

    // Commands
    void cmdUser(const std::string& arg);
    void cmdPass(const std::string& arg);
    void cmdQuit(const std::string& arg);
    void cmdNoop(const std::string& arg);
    void cmdSyst(const std::string& arg);
    void cmdFeat(const std::string& arg);
    void cmdOpts(const std::string& arg);
    void cmdType(const std::string& arg);
    void cmdMode(const std::string& arg);
    void cmdStru(const std::string& arg);
    void cmdPwd(const std::string& arg);
    void cmdCwd(const std::string& arg);
    void cmdCdup(const std::string& arg);
    void cmdPasv(const std::string& arg);
    void cmdEpsv(const std::string& arg);
    void cmdPort(const std::string& arg);
    void cmdList(const std::string& arg);
    void cmdNlst(const std::string& arg);
    void cmdRest(const std::string& arg);
    void cmdRetr(const std::string& arg);
    void cmdStor(const std::string& arg);
    void cmdAppe(const std::string& arg);
    void cmdDele(const std::string& arg);
    void cmdMkd(const std::string& arg);
    void cmdRmd(const std::string& arg);
    void cmdRnfr(const std::string& arg);
    void cmdRnto(const std::string& arg);
    void cmdSize(const std::string& arg);
    void cmdMdtm(const std::string& arg);
    void cmdMfmt(const std::string& arg);
    void cmdSite(const std::string& arg);

    void sendListing(const std::string& arg, bool namesOnly);
    void receiveFile(const std::string& arg, bool append);

    // Socket state (guarded by m_socketMutex so abort() can reach it)
    mutable std::mutex m_socketMutex;
    int m_controlFd;
    int m_dataListenFd;
    int m_dataFd;
    std::atomic<bool> m_aborted;

    // Active mode target (set by PORT)
    std::string m_activeIp;
    uint16_t m_activePort;

    std::string m_clientIp;
    FtpAccount m_account;
    std::filesystem::path m_root;

    // Session state
    std::string m_pendingUser;
    bool m_loggedIn;
    int m_failedLogins;
    std::string m_cwd;
    std::string m_renameFrom;
    uint64_t m_restOffset;
    bool m_quit;

    std::string m_recvBuffer;
};

}  // namespace FtpShare
