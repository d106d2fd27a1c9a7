/**
 * @file ServiceSupervisor.cpp
 * @brief Listener lifecycle and live reconfiguration
 *
 * (c) 2026 FtpShare Project
 * Licensed under MIT License
 */

#include "ftpshare/ServiceSupervisor.h"
#include "ftpshare/Debug.h"
#include "ftpshare/ErrorCodes.h"
#include "ftpshare/PasswordGenerator.h"

#include <utility>

namespace FtpShare {

//=============================================================================
// ServiceHandle
//=============================================================================

ServiceHandle::ServiceHandle(std::shared_ptr<TransferService> service)
    : m_service(std::move(service))
    , m_stopRequested(std::make_shared<std::atomic<bool>>(false))
    , m_stopped(false)
{
}

std::unique_ptr<ServiceHandle> ServiceHandle::launch(const TransferServiceFactory& factory,
                                                     const ServiceConfig& config) {
    // Binds; a BindError leaves nothing behind
    std::shared_ptr<TransferService> service = factory(config);

    std::unique_ptr<ServiceHandle> handle(new ServiceHandle(service));

    std::promise<void> finished;
    handle->m_finished = finished.get_future().share();
    handle->m_thread = std::thread([service, stopRequested = handle->m_stopRequested,
                                    finished = std::move(finished)]() mutable {
        try {
            service->serveForever();
            if (!stopRequested->load()) {
                LOG_ERROR(ErrorCodes::LISTENER_EXITED << ": listener on port "
                          << service->boundPort() << " stopped serving without a stop request");
            }
        } catch (const std::exception& e) {
            LOG_ERROR(ErrorCodes::LISTENER_EXITED << ": listener thread terminated unexpectedly: "
                      << e.what());
        }
        finished.set_value();
    });

    return handle;
}

bool ServiceHandle::alive() const {
    return m_finished.valid() &&
           m_finished.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready;
}

ServiceHandle::~ServiceHandle() {
    stop(std::chrono::milliseconds(SERVICE_STOP_GRACE_MS));
}

bool ServiceHandle::stop(std::chrono::milliseconds grace) {
    if (m_stopped) {
        return true;
    }
    m_stopped = true;

    m_stopRequested->store(true);
    m_service->stop();

    if (m_finished.valid() &&
        m_finished.wait_for(grace) != std::future_status::ready) {
        LOG_WARNING("Listener thread did not exit within " << grace.count()
                    << " ms; detaching it");
        if (m_thread.joinable()) {
            m_thread.detach();
        }
        return false;
    }

    if (m_thread.joinable()) {
        m_thread.join();
    }
    return true;
}

//=============================================================================
// ServiceSupervisor: Construction
//=============================================================================

ServiceSupervisor::ServiceSupervisor(ConfigStore& store,
                                     const NetworkInfo& network,
                                     TransferServiceFactory factory,
                                     ServiceConfig initialConfig,
                                     std::chrono::milliseconds stopGrace)
    : m_store(store)
    , m_network(network)
    , m_factory(std::move(factory))
    , m_stopGrace(stopGrace)
    , m_running(false)
    , m_config(std::move(initialConfig))
{
    if (m_config.password.empty()) {
        std::string generated;
        std::string errorMsg;
        if (!PasswordGenerator::generate(GENERATED_PASSWORD_BYTES, generated, errorMsg)) {
            throw ValidationError(ErrorCodes::PASSWORD_GENERATION_FAILED, errorMsg);
        }
        m_config.password = generated;
        m_generatedPassword = generated;
        LOG_WARNING("No password configured for user '" << m_config.username
                    << "'; generated password: " << generated);
    }
}

ServiceSupervisor::~ServiceSupervisor() {
    std::lock_guard<std::mutex> lock(m_transitionMutex);
    stopHandleLocked();
}

//=============================================================================
// ServiceSupervisor: Lifecycle
//=============================================================================

TransitionResult ServiceSupervisor::start(const ServiceConfig& config) {
    TransitionResult result;
    {
        std::lock_guard<std::mutex> lock(m_transitionMutex);
        result = transitionLocked(config);
    }
    if (result.ok) {
        addDiscovery(result.snapshot);
    }
    return result;
}

void ServiceSupervisor::stop() {
    std::lock_guard<std::mutex> lock(m_transitionMutex);
    if (!m_handle) {
        return;
    }

    if (!m_handle->alive()) {
        LOG_WARNING("Listener had already exited; releasing it");
    } else {
        LOG_INFO("Shutting down server");
    }
    stopHandleLocked();
    publish(false, currentConfig());
}

TransitionResult ServiceSupervisor::restart(const ServiceConfig& newConfig) {
    return start(newConfig);
}

TransitionResult ServiceSupervisor::restartCurrent() {
    TransitionResult result;
    {
        std::lock_guard<std::mutex> lock(m_transitionMutex);
        result = transitionLocked(currentConfig());
        if (result.ok) {
            result.persistenceWarning =
                persist(KEY_PORT, std::to_string(result.snapshot.config.port));
        }
    }
    if (result.ok) {
        addDiscovery(result.snapshot);
    }
    return result;
}

TransitionResult ServiceSupervisor::transitionLocked(const ServiceConfig& config) {
    ConfigValidation::validateConfig(config);

    const ServiceConfig previous = currentConfig();

    // Never two listeners: the old one is gone before the new one binds
    stopHandleLocked();

    TransitionResult result;
    try {
        m_handle = ServiceHandle::launch(m_factory, config);
    } catch (const BindError& e) {
        LOG_ERROR(ErrorCodes::BIND_FAILED << ": " << e.what());
        publish(false, previous);
        result.ok = false;
        result.bindError = e;
        result.snapshot.running = false;
        result.snapshot.config = previous;
        return result;
    }

    publish(true, config, m_handle->finished());
    LOG_INFO("Server started on " << config.host << ":" << m_handle->boundPort()
             << ", user '" << config.username << "', sharing " << config.sharedRoot.string());

    result.ok = true;
    result.snapshot.running = true;
    result.snapshot.config = config;
    return result;
}

void ServiceSupervisor::stopHandleLocked() {
    if (!m_handle) {
        return;
    }
    m_handle->stop(m_stopGrace);
    m_handle.reset();
}

//=============================================================================
// ServiceSupervisor: Field updates
//=============================================================================

FieldUpdateResult ServiceSupervisor::applyField(ConfigField field, const std::string& value) {
    FieldUpdateResult result;

    {
        std::lock_guard<std::mutex> lock(m_transitionMutex);

        ServiceConfig candidate = currentConfig();
        std::string persistedValue;
        try {
            switch (field) {
            case ConfigField::Username:
                candidate.username = ConfigValidation::validateUsername(value);
                persistedValue = candidate.username;
                break;
            case ConfigField::Password:
                candidate.password = ConfigValidation::validatePassword(value);
                persistedValue = candidate.password;
                break;
            case ConfigField::Port:
                candidate.port = ConfigValidation::parsePort(value);
                persistedValue = std::to_string(candidate.port);
                break;
            case ConfigField::SharedRoot:
                candidate.sharedRoot = ConfigValidation::prepareSharedRoot(value);
                break;
            }
            // A previously broken field is reported here, before any listener work
            ConfigValidation::validateConfig(candidate);
        } catch (const ValidationError& e) {
            LOG_WARNING("Rejected " << configFieldName(field) << " update: " << e.what());
            result.outcome = FieldUpdateOutcome::ValidationFailed;
            result.message = e.what();
            result.snapshot.running = isRunning();
            result.snapshot.config = currentConfig();
            return result;
        }

        TransitionResult transition = transitionLocked(candidate);
        result.snapshot = transition.snapshot;

        if (!transition.ok) {
            result.outcome = FieldUpdateOutcome::BindFailed;
            result.bindError = transition.bindError;
            result.message = transition.bindError ? transition.bindError->what() : "Restart failed";
            return result;
        }

        result.outcome = FieldUpdateOutcome::Applied;
        if (field != ConfigField::SharedRoot) {
            result.persistenceWarning = persist(configFieldName(field), persistedValue);
        }
    }

    addDiscovery(result.snapshot);
    return result;
}

std::string ServiceSupervisor::persist(const std::string& key, const std::string& value) {
    try {
        m_store.set(key, value);
    } catch (const PersistenceError& e) {
        LOG_WARNING(ErrorCodes::PERSIST_WRITE_FAILED << ": could not save '" << key
                    << "': " << e.what());
        return std::string("Could not save ") + key + ": " + e.what();
    }
    return {};
}

//=============================================================================
// ServiceSupervisor: Queries
//=============================================================================

void ServiceSupervisor::publish(bool running, const ServiceConfig& config,
                                std::shared_future<void> listenerFinished) {
    std::unique_lock<std::shared_mutex> lock(m_stateMutex);
    m_running = running;
    m_config = config;
    m_listenerFinished = std::move(listenerFinished);
}

bool ServiceSupervisor::runningLocked() const {
    if (!m_running) {
        return false;
    }
    // A listener that crashed or returned early counts as stopped
    return !m_listenerFinished.valid() ||
           m_listenerFinished.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready;
}

SupervisorSnapshot ServiceSupervisor::status() const {
    SupervisorSnapshot snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(m_stateMutex);
        snapshot.running = runningLocked();
        snapshot.config = m_config;
    }
    addDiscovery(snapshot);
    return snapshot;
}

ServiceConfig ServiceSupervisor::currentConfig() const {
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);
    return m_config;
}

bool ServiceSupervisor::isRunning() const {
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);
    return runningLocked();
}

void ServiceSupervisor::addDiscovery(SupervisorSnapshot& snapshot) const {
    snapshot.primaryAddress = m_network.primaryAddress();
    snapshot.reachableAddresses = m_network.reachableAddresses();
}

}  // namespace FtpShare
