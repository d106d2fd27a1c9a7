/**
 * @file FtpSession.cpp
 * @brief One FTP control connection
 */

#include "ftpshare/FtpSession.h"
#include "ftpshare/Debug.h"
#include "ftpshare/config.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace FtpShare {

namespace {

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

/// Double embedded quotes as RFC 959 asks for 257 replies
std::string quotePath(const std::string& path) {
    std::string out;
    out.reserve(path.size() + 2);
    out.push_back('"');
    for (char c : path) {
        out.push_back(c);
        if (c == '"') {
            out.push_back('"');
        }
    }
    out.push_back('"');
    return out;
}

std::string formatUtcTimestamp(time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d%H%M%S", &tm);
    return std::string(buf);
}

bool parseUtcTimestamp(const std::string& text, time_t& out) {
    if (text.size() < 14 ||
        !std::all_of(text.begin(), text.begin() + 14, [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    std::tm tm{};
    tm.tm_year = std::stoi(text.substr(0, 4)) - 1900;
    tm.tm_mon = std::stoi(text.substr(4, 2)) - 1;
    tm.tm_mday = std::stoi(text.substr(6, 2));
    tm.tm_hour = std::stoi(text.substr(8, 2));
    tm.tm_min = std::stoi(text.substr(10, 2));
    tm.tm_sec = std::stoi(text.substr(12, 2));
    out = timegm(&tm);
    return out != static_cast<time_t>(-1);
}

/// LIST/NLST accept "ls" style flags ("-la") before the path; drop them
std::string stripListFlags(const std::string& arg) {
    std::string rest = arg;
    while (!rest.empty() && rest[0] == '-') {
        const auto space = rest.find(' ');
        if (space == std::string::npos) {
            return {};
        }
        rest = rest.substr(space + 1);
    }
    return rest;
}

char fileTypeChar(mode_t mode) {
    if (S_ISDIR(mode)) return 'd';
    if (S_ISLNK(mode)) return 'l';
    return '-';
}

std::string permissionString(mode_t mode) {
    std::string out;
    out.push_back(fileTypeChar(mode));
    const mode_t bits[] = {S_IRUSR, S_IWUSR, S_IXUSR, S_IRGRP, S_IWGRP, S_IXGRP, S_IROTH, S_IWOTH, S_IXOTH};
    const char letters[] = {'r', 'w', 'x', 'r', 'w', 'x', 'r', 'w', 'x'};
    for (size_t i = 0; i < 9; ++i) {
        out.push_back((mode & bits[i]) ? letters[i] : '-');
    }
    return out;
}

void shutdownIfValid(int fd) {
    if (fd >= 0) {
        (void)::shutdown(fd, SHUT_RDWR);
    }
}

}  // namespace

//=============================================================================
// Construction
//=============================================================================

FtpSession::FtpSession(int controlFd, std::string clientIp, FtpAccount account, std::filesystem::path root)
    : m_controlFd(controlFd)
    , m_dataListenFd(-1)
    , m_dataFd(-1)
    , m_aborted(false)
    , m_activePort(0)
    , m_clientIp(std::move(clientIp))
    , m_account(std::move(account))
    , m_root(std::move(root))
    , m_loggedIn(false)
    , m_failedLogins(0)
    , m_cwd("/")
    , m_restOffset(0)
    , m_quit(false)
{
}

FtpSession::~FtpSession() {
    std::lock_guard<std::mutex> lock(m_socketMutex);
    if (m_dataFd >= 0) {
        ::close(m_dataFd);
        m_dataFd = -1;
    }
    if (m_dataListenFd >= 0) {
        ::close(m_dataListenFd);
        m_dataListenFd = -1;
    }
    if (m_controlFd >= 0) {
        ::close(m_controlFd);
        m_controlFd = -1;
    }
}

void FtpSession::abort() {
    m_aborted.store(true);

    std::lock_guard<std::mutex> lock(m_socketMutex);
    shutdownIfValid(m_controlFd);
    shutdownIfValid(m_dataListenFd);
    shutdownIfValid(m_dataFd);
}

//=============================================================================
// Main loop
//=============================================================================

void FtpSession::run() {
    LOG_INFO(m_clientIp << " connected");
    reply(220, "FtpShare ready.");

    std::string line;
    while (!m_quit && !m_aborted.load() && readLine(line)) {
        if (line.empty()) {
            continue;
        }
        dispatch(line);
    }

    closeDataListener();
    {
        // The fd itself is closed by the destructor once the server reaps us
        std::lock_guard<std::mutex> lock(m_socketMutex);
        shutdownIfValid(m_controlFd);
    }
    LOG_INFO(m_clientIp << " disconnected"
             << (m_loggedIn ? " (user " + m_account.username + ")" : std::string()));
}

bool FtpSession::readLine(std::string& line) {
    for (;;) {
        const auto eol = m_recvBuffer.find('\n');
        if (eol != std::string::npos) {
            line = m_recvBuffer.substr(0, eol);
            m_recvBuffer.erase(0, eol + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }

        if (m_recvBuffer.size() > MAX_COMMAND_LINE) {
            reply(500, "Command too long.");
            return false;
        }

        pollfd pfd{};
        pfd.fd = m_controlFd;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, CONTROL_IDLE_TIMEOUT_MS);
        if (ready == 0) {
            reply(421, "Control connection timed out.");
            return false;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }

        char buf[1024];
        const ssize_t n = ::recv(m_controlFd, buf, sizeof(buf), 0);
        if (n <= 0) {
            return false;
        }
        m_recvBuffer.append(buf, static_cast<size_t>(n));
    }
}

void FtpSession::replyRaw(const std::string& text) {
    (void)sendAllOn(m_controlFd, text.data(), text.size());
}

void FtpSession::reply(int code, const std::string& text) {
    replyRaw(std::to_string(code) + " " + text + "\r\n");
}

bool FtpSession::sendAllOn(int fd, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        const ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

const std::unordered_map<std::string, FtpSession::CommandSpec>& FtpSession::commandTable() {
    static const std::unordered_map<std::string, CommandSpec> table = {
        {"USER", {&FtpSession::cmdUser, false, '\0'}},
        {"PASS", {&FtpSession::cmdPass, false, '\0'}},
        {"QUIT", {&FtpSession::cmdQuit, false, '\0'}},
        {"NOOP", {&FtpSession::cmdNoop, false, '\0'}},
        {"SYST", {&FtpSession::cmdSyst, false, '\0'}},
        {"FEAT", {&FtpSession::cmdFeat, false, '\0'}},
        {"OPTS", {&FtpSession::cmdOpts, false, '\0'}},
        {"TYPE", {&FtpSession::cmdType, true, '\0'}},
        {"MODE", {&FtpSession::cmdMode, true, '\0'}},
        {"STRU", {&FtpSession::cmdStru, true, '\0'}},
        {"PWD",  {&FtpSession::cmdPwd, true, '\0'}},
        {"XPWD", {&FtpSession::cmdPwd, true, '\0'}},
        {"CWD",  {&FtpSession::cmdCwd, true, 'e'}},
        {"XCWD", {&FtpSession::cmdCwd, true, 'e'}},
        {"CDUP", {&FtpSession::cmdCdup, true, 'e'}},
        {"PASV", {&FtpSession::cmdPasv, true, '\0'}},
        {"EPSV", {&FtpSession::cmdEpsv, true, '\0'}},
        {"PORT", {&FtpSession::cmdPort, true, '\0'}},
        {"LIST", {&FtpSession::cmdList, true, 'l'}},
        {"NLST", {&FtpSession::cmdNlst, true, 'l'}},
        {"REST", {&FtpSession::cmdRest, true, '\0'}},
        {"RETR", {&FtpSession::cmdRetr, true, 'r'}},
        {"STOR", {&FtpSession::cmdStor, true, 'w'}},
        {"APPE", {&FtpSession::cmdAppe, true, 'a'}},
        {"DELE", {&FtpSession::cmdDele, true, 'd'}},
        {"MKD",  {&FtpSession::cmdMkd, true, 'm'}},
        {"XMKD", {&FtpSession::cmdMkd, true, 'm'}},
        {"RMD",  {&FtpSession::cmdRmd, true, 'd'}},
        {"XRMD", {&FtpSession::cmdRmd, true, 'd'}},
        {"RNFR", {&FtpSession::cmdRnfr, true, 'f'}},
        {"RNTO", {&FtpSession::cmdRnto, true, 'f'}},
        {"SIZE", {&FtpSession::cmdSize, true, 'l'}},
        {"MDTM", {&FtpSession::cmdMdtm, true, 'l'}},
        {"MFMT", {&FtpSession::cmdMfmt, true, 'T'}},
        {"SITE", {&FtpSession::cmdSite, true, '\0'}},
    };
    return table;
}

void FtpSession::dispatch(const std::string& line) {
    const auto space = line.find(' ');
    const std::string verb = toUpper(line.substr(0, space));
    const std::string arg = (space == std::string::npos) ? std::string() : line.substr(space + 1);

    LOG_DEBUG(m_clientIp << " <- " << (verb == "PASS" ? std::string("PASS ******") : line));

    // REST only applies to the transfer right after it
    if (verb != "REST" && verb != "RETR" && verb != "STOR" && verb != "APPE") {
        m_restOffset = 0;
    }
    if (verb != "RNTO" && verb != "RNFR") {
        m_renameFrom.clear();
    }

    const auto& table = commandTable();
    auto it = table.find(verb);
    if (it == table.end()) {
        reply(502, "Command \"" + verb + "\" not implemented.");
        return;
    }

    const CommandSpec& spec = it->second;
    if (spec.requiresLogin && !m_loggedIn) {
        reply(530, "Log in with USER and PASS first.");
        return;
    }
    if (spec.permission != '\0' && !m_account.hasPermission(spec.permission)) {
        reply(550, "Not enough privileges.");
        return;
    }

    try {
        (this->*spec.handler)(arg);
    } catch (const std::exception& e) {
        LOG_ERROR(m_clientIp << " " << verb << " failed: " << e.what());
        reply(451, "Requested action aborted: local error in processing.");
    }
}

//=============================================================================
// Paths
//=============================================================================

std::string FtpSession::resolveVirtualPath(const std::string& cwd, const std::string& arg) {
    std::string combined;
    if (!arg.empty() && arg[0] == '/') {
        combined = arg;
    } else {
        combined = cwd;
        if (combined.empty() || combined.back() != '/') {
            combined.push_back('/');
        }
        combined += arg;
    }

    std::vector<std::string> parts;
    std::istringstream iss(combined);
    std::string part;
    while (std::getline(iss, part, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (!parts.empty()) {
                parts.pop_back();
            }
            continue;
        }
        parts.push_back(part);
    }

    std::string out = "/";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.push_back('/');
        }
        out += parts[i];
    }
    return out;
}

std::filesystem::path FtpSession::toRealPath(const std::string& virtualPath) const {
    if (virtualPath.size() <= 1) {
        return m_root;
    }
    return m_root / virtualPath.substr(1);
}

bool FtpSession::isInsideRoot(const std::filesystem::path& realPath) const {
    // Symlinks inside the share may point anywhere; follow them before comparing
    std::error_code ec;
    const auto canonical = std::filesystem::weakly_canonical(realPath, ec);
    if (ec) {
        return false;
    }

    auto rootIt = m_root.begin();
    auto pathIt = canonical.begin();
    for (; rootIt != m_root.end(); ++rootIt, ++pathIt) {
        if (rootIt->empty()) {
            // trailing separator component
            continue;
        }
        if (pathIt == canonical.end() || *pathIt != *rootIt) {
            return false;
        }
    }
    return true;
}

//=============================================================================
// Data channel
//=============================================================================

void FtpSession::closeDataListener() {
    std::lock_guard<std::mutex> lock(m_socketMutex);
    if (m_dataListenFd >= 0) {
        ::close(m_dataListenFd);
        m_dataListenFd = -1;
    }
}

int FtpSession::openDataConnection() {
    int listenFd;
    {
        std::lock_guard<std::mutex> lock(m_socketMutex);
        listenFd = m_dataListenFd;
    }

    if (listenFd >= 0) {
        pollfd pfd{};
        pfd.fd = listenFd;
        pfd.events = POLLIN;
        int ready;
        do {
            ready = ::poll(&pfd, 1, DATA_CONNECT_TIMEOUT_MS);
        } while (ready < 0 && errno == EINTR);

        int fd = -1;
        if (ready > 0 && !m_aborted.load()) {
            fd = ::accept(listenFd, nullptr, nullptr);
        }
        closeDataListener();
        if (fd < 0) {
            return -1;
        }

        std::lock_guard<std::mutex> lock(m_socketMutex);
        m_dataFd = fd;
        return fd;
    }

    if (m_activeIp.empty()) {
        return -1;
    }

    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(m_activePort);
    if (inet_pton(AF_INET, m_activeIp.c_str(), &target.sin_addr) != 1) {
        return -1;
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    {
        // Published before connect() so abort() can interrupt it
        std::lock_guard<std::mutex> lock(m_socketMutex);
        m_dataFd = fd;
    }
    m_activeIp.clear();

    if (::connect(fd, reinterpret_cast<sockaddr*>(&target), sizeof(target)) != 0) {
        closeDataConnection(fd);
        return -1;
    }
    return fd;
}

void FtpSession::closeDataConnection(int fd) {
    std::lock_guard<std::mutex> lock(m_socketMutex);
    if (fd >= 0) {
        ::close(fd);
    }
    if (m_dataFd == fd) {
        m_dataFd = -1;
    }
}

//=============================================================================
// Commands: login & misc
//=============================================================================

void FtpSession::cmdUser(const std::string& arg) {
    m_loggedIn = false;
    m_pendingUser = arg;
    reply(331, "Username ok, send password.");
}

void FtpSession::cmdPass(const std::string& arg) {
    if (m_loggedIn) {
        reply(503, "User already authenticated.");
        return;
    }
    if (m_pendingUser.empty()) {
        reply(503, "Login with USER first.");
        return;
    }

    if (m_pendingUser == m_account.username && arg == m_account.password) {
        m_loggedIn = true;
        m_cwd = "/";
        reply(230, "Login successful.");
        LOG_INFO(m_clientIp << " USER '" << m_pendingUser << "' logged in.");
        return;
    }

    ++m_failedLogins;
    LOG_WARNING(m_clientIp << " USER '" << m_pendingUser << "' failed login.");
    m_pendingUser.clear();
    if (m_failedLogins >= 3) {
        reply(421, "Too many connections. Service temporarily unavailable.");
        m_quit = true;
        return;
    }
    reply(530, "Authentication failed.");
}

void FtpSession::cmdQuit(const std::string&) {
    reply(221, "Goodbye.");
    m_quit = true;
}

void FtpSession::cmdNoop(const std::string&) {
    reply(200, "NOOP ok.");
}

void FtpSession::cmdSyst(const std::string&) {
    reply(215, "UNIX Type: L8");
}

void FtpSession::cmdFeat(const std::string&) {
    replyRaw("211-Features supported:\r\n"
             " EPSV\r\n"
             " MDTM\r\n"
             " MFMT\r\n"
             " PASV\r\n"
             " REST STREAM\r\n"
             " SIZE\r\n"
             " UTF8\r\n"
             "211 End FEAT.\r\n");
}

void FtpSession::cmdOpts(const std::string& arg) {
    if (toUpper(arg) == "UTF8 ON") {
        reply(200, "Always in UTF8 mode.");
        return;
    }
    reply(501, "Invalid OPTS argument.");
}

void FtpSession::cmdType(const std::string& arg) {
    const std::string t = toUpper(arg);
    if (t == "I" || t == "L8" || t == "L 8") {
        reply(200, "Type set to: Binary.");
    } else if (t == "A" || t == "A N") {
        reply(200, "Type set to: ASCII.");
    } else {
        reply(504, "Unsupported type \"" + arg + "\".");
    }
}

void FtpSession::cmdMode(const std::string& arg) {
    if (toUpper(arg) == "S") {
        reply(200, "Transfer mode set to: S");
    } else {
        reply(504, "Unimplemented MODE type.");
    }
}

void FtpSession::cmdStru(const std::string& arg) {
    if (toUpper(arg) == "F") {
        reply(200, "File transfer structure set to: F.");
    } else {
        reply(504, "Unimplemented STRU type.");
    }
}

//=============================================================================
// Commands: navigation
//=============================================================================

void FtpSession::cmdPwd(const std::string&) {
    reply(257, quotePath(m_cwd) + " is the current directory.");
}

void FtpSession::cmdCwd(const std::string& arg) {
    const std::string target = resolveVirtualPath(m_cwd, arg.empty() ? "/" : arg);
    const auto real = toRealPath(target);

    std::error_code ec;
    if (!isInsideRoot(real) || !std::filesystem::is_directory(real, ec)) {
        reply(550, "No such file or directory.");
        return;
    }

    m_cwd = target;
    reply(250, quotePath(m_cwd) + " is the current directory.");
}

void FtpSession::cmdCdup(const std::string&) {
    cmdCwd("..");
}

//=============================================================================
// Commands: data connection setup
//=============================================================================

bool FtpSession::openPassiveListener(uint32_t& hostIp, uint16_t& port) {
    closeDataListener();
    m_activeIp.clear();

    // Listen on the address the client already reached us on
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (::getsockname(m_controlFd, reinterpret_cast<sockaddr*>(&local), &len) != 0) {
        return false;
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return false;
    }

    sockaddr_in bindAddr = local;
    bindAddr.sin_port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&bindAddr), sizeof(bindAddr)) != 0 ||
        ::listen(fd, 1) != 0) {
        ::close(fd);
        return false;
    }

    sockaddr_in bound{};
    len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
        ::close(fd);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_socketMutex);
        m_dataListenFd = fd;
    }
    hostIp = ntohl(local.sin_addr.s_addr);
    port = ntohs(bound.sin_port);
    return true;
}

void FtpSession::cmdPasv(const std::string&) {
    uint32_t ip = 0;
    uint16_t port = 0;
    if (!openPassiveListener(ip, port)) {
        reply(425, "Can't open passive connection.");
        return;
    }

    std::ostringstream oss;
    oss << "Entering passive mode ("
        << ((ip >> 24) & 0xFF) << "," << ((ip >> 16) & 0xFF) << ","
        << ((ip >> 8) & 0xFF) << "," << (ip & 0xFF) << ","
        << (port >> 8) << "," << (port & 0xFF) << ").";
    reply(227, oss.str());
}

void FtpSession::cmdEpsv(const std::string& arg) {
    if (toUpper(arg) == "ALL") {
        reply(200, "EPSV ALL command successful.");
        return;
    }
    if (!arg.empty() && arg != "1") {
        reply(522, "Network protocol not supported (use 1).");
        return;
    }

    uint32_t ip = 0;
    uint16_t port = 0;
    if (!openPassiveListener(ip, port)) {
        reply(425, "Can't open passive connection.");
        return;
    }
    reply(229, "Entering extended passive mode (|||" + std::to_string(port) + "|).");
}

void FtpSession::cmdPort(const std::string& arg) {
    unsigned a0, a1, a2, a3, p0, p1;
    if (std::sscanf(arg.c_str(), "%u,%u,%u,%u,%u,%u", &a0, &a1, &a2, &a3, &p0, &p1) != 6 ||
        a0 > 255 || a1 > 255 || a2 > 255 || a3 > 255 || p0 > 255 || p1 > 255) {
        reply(501, "Invalid PORT format.");
        return;
    }

    const std::string ip = std::to_string(a0) + "." + std::to_string(a1) + "." +
                           std::to_string(a2) + "." + std::to_string(a3);
    const uint16_t port = static_cast<uint16_t>((p0 << 8) | p1);

    if (ip != m_clientIp) {
        LOG_WARNING(m_clientIp << " PORT to foreign address " << ip << " rejected");
        reply(501, "Rejected data connection to foreign address " + ip + ":" + std::to_string(port) + ".");
        return;
    }
    if (port < 1024) {
        reply(501, "PORT against the privileged port \"" + std::to_string(port) + "\" refused.");
        return;
    }

    closeDataListener();
    m_activeIp = ip;
    m_activePort = port;
    reply(200, "Active data connection established.");
}

//=============================================================================
// Commands: listing
//=============================================================================

std::string FtpSession::formatListLine(const std::filesystem::directory_entry& entry) {
    struct stat st{};
    if (::lstat(entry.path().c_str(), &st) != 0) {
        return {};
    }

    char date[32];
    std::tm tm{};
    localtime_r(&st.st_mtime, &tm);
    const time_t now = std::time(nullptr);
    const double ageSeconds = std::difftime(now, st.st_mtime);
    if (ageSeconds > 180.0 * 24 * 3600 || ageSeconds < 0) {
        std::strftime(date, sizeof(date), "%b %d  %Y", &tm);
    } else {
        std::strftime(date, sizeof(date), "%b %d %H:%M", &tm);
    }

    std::ostringstream oss;
    oss << permissionString(st.st_mode) << " "
        << st.st_nlink << " owner group "
        << st.st_size << " "
        << date << " "
        << entry.path().filename().string() << "\r\n";
    return oss.str();
}

void FtpSession::sendListing(const std::string& arg, bool namesOnly) {
    const std::string target = resolveVirtualPath(m_cwd, stripListFlags(arg));
    const auto real = toRealPath(target);

    std::error_code ec;
    if (!isInsideRoot(real) || !std::filesystem::exists(real, ec)) {
        reply(550, "No such file or directory.");
        return;
    }

    std::string payload;
    if (std::filesystem::is_directory(real, ec)) {
        std::vector<std::filesystem::directory_entry> entries;
        for (std::filesystem::directory_iterator it(real, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(*it);
        }
        if (ec) {
            reply(550, "Cannot list directory: " + ec.message());
            return;
        }
        std::sort(entries.begin(), entries.end(),
                  [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });
        for (const auto& entry : entries) {
            payload += namesOnly ? entry.path().filename().string() + "\r\n" : formatListLine(entry);
        }
    } else {
        std::filesystem::directory_entry entry(real, ec);
        payload = namesOnly ? real.filename().string() + "\r\n" : formatListLine(entry);
    }

    const int fd = openDataConnection();
    if (fd < 0) {
        reply(425, "Can't open data connection.");
        return;
    }

    reply(150, "File status okay. About to open data connection.");
    const bool ok = sendAllOn(fd, payload.data(), payload.size());
    closeDataConnection(fd);

    if (ok) {
        reply(226, "Transfer complete.");
    } else {
        reply(426, "Connection closed; transfer aborted.");
    }
}

void FtpSession::cmdList(const std::string& arg) {
    sendListing(arg, false);
}

void FtpSession::cmdNlst(const std::string& arg) {
    sendListing(arg, true);
}

//=============================================================================
// Commands: transfers
//=============================================================================

void FtpSession::cmdRest(const std::string& arg) {
    if (arg.empty() ||
        !std::all_of(arg.begin(), arg.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        reply(501, "Invalid REST parameter.");
        return;
    }
    m_restOffset = std::stoull(arg);
    reply(350, "Restarting at position " + arg + ".");
}

void FtpSession::cmdRetr(const std::string& arg) {
    const uint64_t offset = m_restOffset;
    m_restOffset = 0;

    const std::string target = resolveVirtualPath(m_cwd, arg);
    const auto real = toRealPath(target);

    std::error_code ec;
    if (arg.empty() || !isInsideRoot(real) || !std::filesystem::is_regular_file(real, ec)) {
        reply(550, "No such file or directory.");
        return;
    }

    std::ifstream in(real, std::ios::binary);
    if (!in.is_open()) {
        reply(550, "Can't open file.");
        return;
    }
    if (offset > 0) {
        const auto size = std::filesystem::file_size(real, ec);
        if (ec || offset > size) {
            reply(554, "Invalid REST parameter.");
            return;
        }
        in.seekg(static_cast<std::streamoff>(offset));
    }

    const int fd = openDataConnection();
    if (fd < 0) {
        reply(425, "Can't open data connection.");
        return;
    }
    reply(150, "File status okay. About to open data connection.");

    std::vector<char> buffer(BUFFER_SIZE);
    uint64_t total = 0;
    bool ok = true;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        if (!sendAllOn(fd, buffer.data(), static_cast<size_t>(got))) {
            ok = false;
            break;
        }
        total += static_cast<uint64_t>(got);
    }
    closeDataConnection(fd);

    LOG_INFO(m_clientIp << " RETR " << target << " completed=" << (ok ? 1 : 0) << " bytes=" << total);
    if (ok) {
        reply(226, "Transfer complete.");
    } else {
        reply(426, "Transfer aborted.");
    }
}

void FtpSession::receiveFile(const std::string& arg, bool append) {
    const uint64_t offset = m_restOffset;
    m_restOffset = 0;

    if (arg.empty()) {
        reply(501, "Syntax error: command needs an argument.");
        return;
    }

    const std::string target = resolveVirtualPath(m_cwd, arg);
    const auto real = toRealPath(target);

    std::error_code ec;
    if (target == "/" || !isInsideRoot(real) || !std::filesystem::is_directory(real.parent_path(), ec) ||
        std::filesystem::is_directory(real, ec)) {
        reply(550, "No such file or directory.");
        return;
    }

    std::ios::openmode mode = std::ios::binary | std::ios::out;
    if (append) {
        mode |= std::ios::app;
    } else if (offset > 0) {
        mode |= std::ios::in;  // keep existing bytes before the offset
    } else {
        mode |= std::ios::trunc;
    }

    std::fstream out(real, mode);
    if (!out.is_open()) {
        reply(550, "Can't open file for writing.");
        return;
    }
    if (!append && offset > 0) {
        out.seekp(static_cast<std::streamoff>(offset));
    }

    const int fd = openDataConnection();
    if (fd < 0) {
        reply(425, "Can't open data connection.");
        return;
    }
    reply(150, "File status okay. About to open data connection.");

    std::vector<char> buffer(BUFFER_SIZE);
    uint64_t total = 0;
    bool ok = true;
    for (;;) {
        const ssize_t n = ::recv(fd, buffer.data(), buffer.size(), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n == 0) {
            break;
        }
        if (n < 0 || m_aborted.load()) {
            ok = false;
            break;
        }
        out.write(buffer.data(), n);
        if (!out) {
            ok = false;
            break;
        }
        total += static_cast<uint64_t>(n);
    }
    closeDataConnection(fd);
    out.close();

    LOG_INFO(m_clientIp << (append ? " APPE " : " STOR ") << target
             << " completed=" << (ok ? 1 : 0) << " bytes=" << total);
    if (ok) {
        reply(226, "Transfer complete.");
    } else {
        reply(426, "Transfer aborted.");
    }
}

void FtpSession::cmdStor(const std::string& arg) {
    receiveFile(arg, false);
}

void FtpSession::cmdAppe(const std::string& arg) {
    receiveFile(arg, true);
}

//=============================================================================
// Commands: filesystem changes
//=============================================================================

void FtpSession::cmdDele(const std::string& arg) {
    const auto real = toRealPath(resolveVirtualPath(m_cwd, arg));

    std::error_code ec;
    if (arg.empty() || !isInsideRoot(real) || !std::filesystem::is_regular_file(real, ec)) {
        reply(550, "No such file or directory.");
        return;
    }
    if (!std::filesystem::remove(real, ec) || ec) {
        reply(550, "Delete failed: " + ec.message());
        return;
    }
    reply(250, "File removed.");
}

void FtpSession::cmdMkd(const std::string& arg) {
    const std::string target = resolveVirtualPath(m_cwd, arg);
    const auto real = toRealPath(target);

    std::error_code ec;
    if (arg.empty() || !isInsideRoot(real) || std::filesystem::exists(real, ec)) {
        reply(550, "Can't create directory.");
        return;
    }
    if (!std::filesystem::create_directory(real, ec) || ec) {
        reply(550, "Can't create directory: " + ec.message());
        return;
    }
    reply(257, quotePath(target) + " directory created.");
}

void FtpSession::cmdRmd(const std::string& arg) {
    const std::string target = resolveVirtualPath(m_cwd, arg);
    const auto real = toRealPath(target);

    if (target == "/") {
        reply(550, "Can't remove root directory.");
        return;
    }

    std::error_code ec;
    if (arg.empty() || !isInsideRoot(real) || !std::filesystem::is_directory(real, ec)) {
        reply(550, "No such directory.");
        return;
    }
    if (!std::filesystem::remove(real, ec) || ec) {
        reply(550, "Can't remove directory: " + (ec ? ec.message() : std::string("not empty")));
        return;
    }
    reply(250, "Directory removed.");
}

void FtpSession::cmdRnfr(const std::string& arg) {
    const std::string target = resolveVirtualPath(m_cwd, arg);
    const auto real = toRealPath(target);

    std::error_code ec;
    if (arg.empty() || target == "/" || !isInsideRoot(real) || !std::filesystem::exists(real, ec)) {
        reply(550, "No such file or directory.");
        return;
    }
    m_renameFrom = target;
    reply(350, "Ready for destination name.");
}

void FtpSession::cmdRnto(const std::string& arg) {
    if (m_renameFrom.empty()) {
        reply(503, "Bad sequence of commands: use RNFR first.");
        return;
    }

    const auto from = toRealPath(m_renameFrom);
    const std::string target = resolveVirtualPath(m_cwd, arg);
    const auto to = toRealPath(target);
    m_renameFrom.clear();

    if (arg.empty() || target == "/" || !isInsideRoot(to)) {
        reply(550, "Invalid destination.");
        return;
    }

    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        reply(550, "Rename failed: " + ec.message());
        return;
    }
    reply(250, "Renaming ok.");
}

//=============================================================================
// Commands: metadata
//=============================================================================

void FtpSession::cmdSize(const std::string& arg) {
    const auto real = toRealPath(resolveVirtualPath(m_cwd, arg));

    std::error_code ec;
    if (arg.empty() || !isInsideRoot(real) || !std::filesystem::is_regular_file(real, ec)) {
        reply(550, arg + " is not retrievable.");
        return;
    }
    const auto size = std::filesystem::file_size(real, ec);
    if (ec) {
        reply(550, arg + " is not retrievable.");
        return;
    }
    reply(213, std::to_string(size));
}

void FtpSession::cmdMdtm(const std::string& arg) {
    const auto real = toRealPath(resolveVirtualPath(m_cwd, arg));

    struct stat st{};
    if (arg.empty() || !isInsideRoot(real) || ::stat(real.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        reply(550, arg + " is not retrievable.");
        return;
    }
    reply(213, formatUtcTimestamp(st.st_mtime));
}

void FtpSession::cmdMfmt(const std::string& arg) {
    const auto space = arg.find(' ');
    if (space == std::string::npos) {
        reply(501, "Invalid MFMT parameter.");
        return;
    }

    time_t when = 0;
    if (!parseUtcTimestamp(arg.substr(0, space), when)) {
        reply(501, "Invalid time format.");
        return;
    }

    const std::string pathArg = arg.substr(space + 1);
    const auto real = toRealPath(resolveVirtualPath(m_cwd, pathArg));

    struct stat st{};
    if (!isInsideRoot(real) || ::stat(real.c_str(), &st) != 0) {
        reply(550, "No such file or directory.");
        return;
    }

    timeval times[2];
    times[0].tv_sec = st.st_atime;
    times[0].tv_usec = 0;
    times[1].tv_sec = when;
    times[1].tv_usec = 0;
    if (::utimes(real.c_str(), times) != 0) {
        reply(550, std::string("Can't set modification time: ") + std::strerror(errno));
        return;
    }
    reply(213, "Modify=" + formatUtcTimestamp(when) + "; " + pathArg + ".");
}

void FtpSession::cmdSite(const std::string& arg) {
    std::istringstream iss(arg);
    std::string sub;
    iss >> sub;
    sub = toUpper(sub);

    if (sub == "HELP") {
        reply(214, "SITE CHMOD <mode> <path>");
        return;
    }
    if (sub != "CHMOD") {
        reply(501, "Unknown SITE command.");
        return;
    }
    if (!m_account.hasPermission('M')) {
        reply(550, "Not enough privileges.");
        return;
    }

    std::string modeText;
    iss >> modeText;
    std::string pathArg;
    std::getline(iss >> std::ws, pathArg);

    if (modeText.empty() || pathArg.empty() || modeText.size() > 4 ||
        !std::all_of(modeText.begin(), modeText.end(), [](char c) { return c >= '0' && c <= '7'; })) {
        reply(501, "Invalid SITE CHMOD format.");
        return;
    }

    const auto real = toRealPath(resolveVirtualPath(m_cwd, pathArg));
    std::error_code ec;
    if (!isInsideRoot(real) || !std::filesystem::exists(real, ec)) {
        reply(550, "No such file or directory.");
        return;
    }

    const mode_t mode = static_cast<mode_t>(std::stoul(modeText, nullptr, 8));
    if (::chmod(real.c_str(), mode) != 0) {
        reply(550, std::string("SITE CHMOD failed: ") + std::strerror(errno));
        return;
    }
    reply(200, "SITE CHMOD successful.");
}

}  // namespace FtpShare
