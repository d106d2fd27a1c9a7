/**
 * @file TransferService.h
 * @brief Listener capability driven by the service supervisor
 */

#pragma once

#include "ftpshare/ServiceConfig.h"

#include <cstdint>
#include <functional>
#include <memory>

namespace FtpShare {

/**
 * @class TransferService
 * @brief One bound file-transfer listener
 *
 * Construction binds the listening socket (throwing BindError when the port
 * is unavailable), so an existing instance always owns its port.
 *
 * Thread Safety:
 * - serveForever() runs on exactly one background thread
 * - stop() may be called from any thread, any number of times
 */
class TransferService {
public:
    virtual ~TransferService() = default;

    /**
     * @brief Run the accept/serve loop
     *
     * Blocks until stop() is requested. Returns after active sessions have
     * been closed and the listening socket released.
     */
    virtual void serveForever() = 0;

    /**
     * @brief Request shutdown
     *
     * Unblocks serveForever() and terminates active sessions. Idempotent,
     * does not wait.
     */
    virtual void stop() = 0;

    /**
     * @brief The port actually bound (differs from the config only for port 0)
     */
    virtual uint16_t boundPort() const = 0;
};

/**
 * @brief Builds (and thereby binds) a TransferService for a validated config
 * @throws BindError if host:port cannot be reserved
 */
using TransferServiceFactory =
    std::function<std::unique_ptr<TransferService>(const ServiceConfig& config)>;

/**
 * @brief Factory producing FtpServer instances granting FULL_PERMISSIONS
 */
TransferServiceFactory makeFtpServiceFactory();

}  // namespace FtpShare
