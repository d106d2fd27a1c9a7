/**
 * @file config.h
 * @brief Configuration constants for FtpShare
 *
 * This file contains all compile-time configuration constants used throughout
 * the FtpShare application: built-in defaults for the persisted settings,
 * supervisor timing, FTP listener limits and reachability probing.
 *
 * Runtime settings (username, password, port) live in the JSON settings file
 * managed by JsonConfigStore. These values are only the fallbacks.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace FtpShare
 * @brief FtpShare namespace containing all public APIs
 */
namespace FtpShare {

//=========================================================================
// Defaults
//=========================================================================

/** @defgroup Defaults Built-in Defaults
 * @brief Values used when the settings file has no entry for a key
 * @{
 */

/**
 * @brief Bind address for the listener.
 *
 * FtpShare always listens on every interface.
 */
constexpr const char* DEFAULT_BIND_HOST = "0.0.0.0";

/** @brief Default FTP control port */
constexpr uint16_t DEFAULT_PORT = 2121;

/** @brief Default FTP username */
constexpr const char* DEFAULT_USERNAME = "user";

/** @brief Default FTP password */
constexpr const char* DEFAULT_PASSWORD = "12345";

/**
 * @brief Permission string granted to the configured user on the shared root.
 *
 * e = change directory, l = list, r = retrieve, a = append,
 * d = delete, f = rename, m = make directory, w = store,
 * M = change mode, T = change modification time.
 */
constexpr const char* FULL_PERMISSIONS = "elradfmwMT";

/** @} */ // end of Defaults

//=========================================================================
// Settings Keys
//=========================================================================

/** @defgroup SettingsKeys Settings Store Keys
 * @{
 */

constexpr const char* KEY_USERNAME = "username";
constexpr const char* KEY_PASSWORD = "password";
constexpr const char* KEY_PORT = "port";

/**
 * @brief Legacy key. Removed from the store on every initialization and
 *        never written again; the shared folder is process-local.
 */
constexpr const char* KEY_FOLDER_LEGACY = "folder";

/** @} */ // end of SettingsKeys

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Timeouts used by the supervisor and the FTP listener (milliseconds)
 * @{
 */

/**
 * @brief Grace period for the serving thread to exit after stop() is requested.
 *
 * After this the handle is discarded regardless and the thread is detached.
 */
constexpr uint32_t SERVICE_STOP_GRACE_MS = 2000;

/**
 * @brief Poll interval of the accept loop.
 *
 * The listen socket is polled with this timeout so a stop request is noticed
 * even on platforms where closing a socket does not wake a blocked accept().
 */
constexpr int ACCEPT_POLL_INTERVAL_MS = 200;

/** @brief How long a PASV data listener waits for the client to connect */
constexpr int DATA_CONNECT_TIMEOUT_MS = 15000;

/** @brief Idle timeout on a control connection before it is dropped */
constexpr int CONTROL_IDLE_TIMEOUT_MS = 300000;

/** @brief Poll interval of the non-interactive main loop waiting for a signal */
constexpr uint32_t SIGNAL_POLL_INTERVAL_MS = 200;

/** @} */ // end of Timing

//=========================================================================
// FTP Listener Limits
//=========================================================================

/** @defgroup FtpLimits FTP Listener Limits
 * @{
 */

/** @brief Maximum simultaneous control connections */
constexpr size_t MAX_FTP_SESSIONS = 64;

/** @brief listen() backlog for the control socket */
constexpr int LISTEN_BACKLOG = 16;

/** @brief Maximum accepted length of one control command line */
constexpr size_t MAX_COMMAND_LINE = 4096;

/**
 * @brief File transfer buffer size
 *
 * RETR and STOR stream files in chunks of this size.
 */
constexpr size_t BUFFER_SIZE = 65536;  // 64 KB

/** @} */ // end of FtpLimits

//=========================================================================
// Reachability
//=========================================================================

/** @defgroup Reachability Reachability Probing
 * @brief Constants for the connect-without-send primary address probe
 * @{
 */

/**
 * @brief Well-known external address used to pick the outbound interface.
 *
 * A UDP socket is connect()ed to it; no packet is ever sent.
 */
constexpr const char* PROBE_TARGET_IP = "8.8.8.8";
constexpr uint16_t PROBE_TARGET_PORT = 80;

/** @brief Shown when no other address could be discovered */
constexpr const char* LOCALHOST_IP = "127.0.0.1";

/** @} */ // end of Reachability

//=========================================================================
// Credentials
//=========================================================================

/**
 * @brief Bytes of CSPRNG output behind a generated password.
 *
 * Encoded base64url without padding this yields a 16-character password.
 */
constexpr size_t GENERATED_PASSWORD_BYTES = 12;

//=========================================================================
// Logging
//=========================================================================

/** @brief Optional log file is rotated to "<file>.1" past this size */
constexpr uint64_t LOG_FILE_MAX_BYTES = 10ULL * 1024ULL * 1024ULL;  // 10 MB

/** @brief Settings file name inside the per-user config directory */
constexpr const char* SETTINGS_FILE_NAME = "settings.json";

/** @brief Application directory name used under XDG config locations */
constexpr const char* APP_DIR_NAME = "ftpshare";

}  // namespace FtpShare
