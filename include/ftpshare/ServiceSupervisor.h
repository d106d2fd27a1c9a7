/**
 * @file ServiceSupervisor.h
 * @brief Owns the FTP listener lifecycle and applies live reconfiguration
 *
 * (c) 2026 FtpShare Project
 * Licensed under MIT License
 */

#pragma once

#include "ftpshare/ConfigStore.h"
#include "ftpshare/Errors.h"
#include "ftpshare/NetworkInfo.h"
#include "ftpshare/ServiceConfig.h"
#include "ftpshare/TransferService.h"
#include "ftpshare/config.h"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace FtpShare {

//=============================================================================
// ServiceHandle
//=============================================================================

/**
 * @class ServiceHandle
 * @brief One live TransferService plus the thread running serveForever()
 *
 * The service is shared with its thread, so a thread that outlives the grace
 * period in stop() keeps the service alive until it finally returns.
 */
class ServiceHandle {
public:
    /**
     * @brief Build a service through the factory and start serving it
     * @throws BindError if the factory cannot bind
     */
    static std::unique_ptr<ServiceHandle> launch(const TransferServiceFactory& factory,
                                                 const ServiceConfig& config);

    ~ServiceHandle();

    ServiceHandle(const ServiceHandle&) = delete;
    ServiceHandle& operator=(const ServiceHandle&) = delete;

    /**
     * @brief Ask the service to stop and wait for its thread
     *
     * Idempotent. If the thread has not exited within @p grace it is detached.
     *
     * @return true if the serving thread exited in time (or was already stopped)
     */
    bool stop(std::chrono::milliseconds grace);

    /**
     * @brief false once serveForever() has returned or thrown
     */
    bool alive() const;

    /**
     * @brief Becomes ready when the serving thread finishes, for whatever reason
     */
    std::shared_future<void> finished() const { return m_finished; }

    uint16_t boundPort() const { return m_service->boundPort(); }

private:
    explicit ServiceHandle(std::shared_ptr<TransferService> service);

    std::shared_ptr<TransferService> m_service;
    std::thread m_thread;
    std::shared_future<void> m_finished;
    std::shared_ptr<std::atomic<bool>> m_stopRequested;   ///< Shared with the serving thread
    bool m_stopped;
};

//=============================================================================
// Results
//=============================================================================

/**
 * @brief Point-in-time view of the supervisor
 *
 * running and config always come from the same committed state. running is
 * false as soon as the listener thread has exited, even if nobody called stop().
 */
struct SupervisorSnapshot {
    bool running = false;
    ServiceConfig config;
    std::string primaryAddress;
    std::vector<std::string> reachableAddresses;
};

/**
 * @brief Outcome of start / restart
 */
struct TransitionResult {
    bool ok = false;
    SupervisorSnapshot snapshot;
    std::optional<BindError> bindError;   ///< Set when ok is false
    std::string persistenceWarning;        ///< Non-empty if settings could not be saved
};

enum class FieldUpdateOutcome {
    Applied,
    ValidationFailed,
    BindFailed
};

/**
 * @brief Outcome of applyField()
 */
struct FieldUpdateResult {
    FieldUpdateOutcome outcome = FieldUpdateOutcome::ValidationFailed;
    std::string message;                   ///< Operator-facing explanation on failure
    std::optional<BindError> bindError;
    std::string persistenceWarning;
    SupervisorSnapshot snapshot;

    bool ok() const { return outcome == FieldUpdateOutcome::Applied; }
};

//=============================================================================
// ServiceSupervisor
//=============================================================================

/**
 * @class ServiceSupervisor
 * @brief Serializes every listener transition and publishes consistent status
 *
 * States: Stopped, Running and a transient Transitioning held entirely inside
 * m_transitionMutex. At most one listener exists at any time. A failed
 * restart leaves the supervisor stopped with the previous config; nothing
 * retries automatically.
 *
 * Thread Safety:
 * - All public methods are safe from any thread
 * - Transitions (start, stop, restart, applyField) are totally ordered
 * - status() never blocks on a transition and never sees a half-applied one
 * - A listener that dies on its own is reported as stopped by status() and
 *   isRunning(); the config stays as it was
 */
class ServiceSupervisor {
public:
    /**
     * @param store Settings persistence (username, password, port)
     * @param network Address discovery used for status display
     * @param factory Builds the listener for a config
     * @param initialConfig Starting config; an empty password is replaced by a
     *        generated one
     * @param stopGrace How long stop() waits for the serving thread
     * @throws ValidationError if a password had to be generated and the CSPRNG failed
     */
    ServiceSupervisor(ConfigStore& store,
                      const NetworkInfo& network,
                      TransferServiceFactory factory,
                      ServiceConfig initialConfig,
                      std::chrono::milliseconds stopGrace =
                          std::chrono::milliseconds(SERVICE_STOP_GRACE_MS));

    /**
     * @brief Stops the listener if it is still running
     */
    ~ServiceSupervisor();

    ServiceSupervisor(const ServiceSupervisor&) = delete;
    ServiceSupervisor& operator=(const ServiceSupervisor&) = delete;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Bind and start serving @p config
     *
     * A running listener is stopped first.
     *
     * @throws ValidationError if @p config is not valid
     */
    TransitionResult start(const ServiceConfig& config);

    /**
     * @brief Stop the listener (no-op when stopped)
     */
    void stop();

    /**
     * @brief stop() then start(newConfig) as one transition
     * @throws ValidationError if @p newConfig is not valid
     */
    TransitionResult restart(const ServiceConfig& newConfig);

    /**
     * @brief Restart with the current config, persisting the port on success
     */
    TransitionResult restartCurrent();

    /**
     * @brief Validate one field, restart with it and persist it on success
     *
     * The shared root is applied but never persisted.
     */
    FieldUpdateResult applyField(ConfigField field, const std::string& value);

    //=========================================================================
    // Queries
    //=========================================================================

    /**
     * @brief Running flag, config and discovered addresses
     */
    SupervisorSnapshot status() const;

    ServiceConfig currentConfig() const;
    bool isRunning() const;

    /**
     * @brief Password generated at construction, if the initial one was empty
     */
    const std::optional<std::string>& generatedPassword() const { return m_generatedPassword; }

private:
    /// Requires m_transitionMutex
    TransitionResult transitionLocked(const ServiceConfig& config);
    /// Requires m_transitionMutex
    void stopHandleLocked();

    void publish(bool running, const ServiceConfig& config,
                 std::shared_future<void> listenerFinished = {});
    /// Requires m_stateMutex (shared or exclusive)
    bool runningLocked() const;
    void addDiscovery(SupervisorSnapshot& snapshot) const;

    /// Writes key=value, returning a warning instead of throwing
    std::string persist(const std::string& key, const std::string& value);

    ConfigStore& m_store;
    const NetworkInfo& m_network;
    TransferServiceFactory m_factory;
    std::chrono::milliseconds m_stopGrace;
    std::optional<std::string> m_generatedPassword;

    std::mutex m_transitionMutex;
    std::unique_ptr<ServiceHandle> m_handle;   ///< Guarded by m_transitionMutex

    mutable std::shared_mutex m_stateMutex;
    bool m_running;                            ///< Guarded by m_stateMutex
    ServiceConfig m_config;                    ///< Guarded by m_stateMutex
    std::shared_future<void> m_listenerFinished; ///< Guarded by m_stateMutex
};

}  // namespace FtpShare
