/**
 * @file service_supervisor_test.cpp
 * @brief Lifecycle, reconfiguration and persistence rules of ServiceSupervisor
 *
 * The listener is replaced by an in-memory fake that models port ownership,
 * so bind conflicts and slow transitions can be staged deterministically.
 *
 * (c) 2026 FtpShare Project
 * Licensed under MIT License
 */

#include <gtest/gtest.h>

#include "ftpshare/Errors.h"
#include "ftpshare/ServiceSupervisor.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace FtpShare;
using namespace std::chrono_literals;

namespace {

//=============================================================================
// Fakes
//=============================================================================

/// Which ports are taken, by whom, and how often services were built
struct PortRegistry {
    std::mutex mutex;
    std::set<uint16_t> occupiedElsewhere;
    std::set<uint16_t> live;
    size_t maxLive = 0;
    size_t constructed = 0;
    std::chrono::milliseconds bindDelay{0};
    std::chrono::milliseconds ignoreStopFor{0};
    bool throwOnServe = false;
    bool returnOnServe = false;

    size_t liveCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return live.size();
    }
};

class FakeService : public TransferService {
public:
    FakeService(std::shared_ptr<PortRegistry> registry, const ServiceConfig& config)
        : m_registry(std::move(registry))
        , m_port(config.port)
    {
        std::this_thread::sleep_for(m_registry->bindDelay);

        std::lock_guard<std::mutex> lock(m_registry->mutex);
        if (m_registry->occupiedElsewhere.count(m_port) || m_registry->live.count(m_port)) {
            throw BindError(config.host, m_port, m_port < 1024 ? "Permission denied" : "Address already in use");
        }
        m_registry->live.insert(m_port);
        m_registry->maxLive = std::max(m_registry->maxLive, m_registry->live.size());
        ++m_registry->constructed;
    }

    ~FakeService() override {
        std::lock_guard<std::mutex> lock(m_registry->mutex);
        m_registry->live.erase(m_port);
    }

    void serveForever() override {
        if (m_registry->throwOnServe) {
            throw std::runtime_error("accept loop failed");
        }
        if (m_registry->returnOnServe) {
            return;
        }
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this]() { return m_stopped; });
        lock.unlock();
        std::this_thread::sleep_for(m_registry->ignoreStopFor);
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopped = true;
        m_cv.notify_all();
    }

    uint16_t boundPort() const override { return m_port; }

private:
    std::shared_ptr<PortRegistry> m_registry;
    uint16_t m_port;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopped = false;
};

class FakeStore : public ConfigStore {
public:
    std::string get(const std::string& key, const std::string& defaultValue) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_values.find(key);
        return it == m_values.end() ? defaultValue : it->second;
    }

    void set(const std::string& key, const std::string& value) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (failWrites) {
            throw PersistenceError("disk full");
        }
        m_values[key] = value;
        writes.push_back(key);
    }

    void remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_values.erase(key);
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_values.count(key) != 0;
    }

    bool failWrites = false;
    std::vector<std::string> writes;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_values;
};

class FakeNetwork : public NetworkInfo {
public:
    std::string primaryAddress() const noexcept override { return "192.168.1.50"; }
    std::vector<std::string> reachableAddresses() const noexcept override {
        return {"10.0.0.7", "192.168.1.50"};
    }
};

}  // namespace

//=============================================================================
// Test Fixture
//=============================================================================

class ServiceSupervisorTest : public ::testing::Test {
protected:
    std::shared_ptr<PortRegistry> registry = std::make_shared<PortRegistry>();
    FakeStore store;
    FakeNetwork network;
    std::filesystem::path root;

    void SetUp() override {
        root = std::filesystem::temp_directory_path() / "ftpshare_supervisor_test_root";
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        std::filesystem::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    TransferServiceFactory factory() {
        auto reg = registry;
        return [reg](const ServiceConfig& config) -> std::unique_ptr<TransferService> {
            return std::make_unique<FakeService>(reg, config);
        };
    }

    ServiceConfig baseConfig(uint16_t port = 2121) {
        ServiceConfig config;
        config.port = port;
        config.username = "user";
        config.password = "12345";
        config.sharedRoot = root;
        return config;
    }

    std::unique_ptr<ServiceSupervisor> makeSupervisor(const ServiceConfig& config,
                                                      std::chrono::milliseconds grace = 2000ms) {
        return std::make_unique<ServiceSupervisor>(store, network, factory(), config, grace);
    }
};

//=============================================================================
// Lifecycle
//=============================================================================

TEST_F(ServiceSupervisorTest, StartReportsRunningWithExactConfig) {
    auto supervisor = makeSupervisor(baseConfig());
    const auto result = supervisor->start(baseConfig());

    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(result.bindError.has_value());
    EXPECT_EQ(result.snapshot.primaryAddress, "192.168.1.50");

    const auto status = supervisor->status();
    EXPECT_TRUE(status.running);
    EXPECT_EQ(status.config, baseConfig());
    EXPECT_EQ(status.reachableAddresses.size(), 2u);
    EXPECT_EQ(registry->liveCount(), 1u);
}

TEST_F(ServiceSupervisorTest, StopIsIdempotentAndSafeBeforeStart) {
    auto supervisor = makeSupervisor(baseConfig());
    supervisor->stop();
    EXPECT_FALSE(supervisor->isRunning());

    ASSERT_TRUE(supervisor->start(baseConfig()).ok);
    supervisor->stop();
    supervisor->stop();

    EXPECT_FALSE(supervisor->isRunning());
    EXPECT_EQ(registry->liveCount(), 0u);
    EXPECT_EQ(supervisor->currentConfig(), baseConfig());
}

TEST_F(ServiceSupervisorTest, InvalidConfigThrowsWithoutTouchingListener) {
    auto supervisor = makeSupervisor(baseConfig());
    ASSERT_TRUE(supervisor->start(baseConfig()).ok);

    ServiceConfig bad = baseConfig();
    bad.username = "  ";
    EXPECT_THROW((void)supervisor->restart(bad), ValidationError);

    EXPECT_TRUE(supervisor->isRunning());
    EXPECT_EQ(registry->constructed, 1u);
}

TEST_F(ServiceSupervisorTest, PrivilegedPortFailsThenDefaultPortSucceeds) {
    registry->occupiedElsewhere.insert(80);
    auto supervisor = makeSupervisor(baseConfig(80));

    const auto failed = supervisor->start(baseConfig(80));
    ASSERT_FALSE(failed.ok);
    ASSERT_TRUE(failed.bindError.has_value());
    EXPECT_EQ(failed.bindError->port(), 80);
    EXPECT_EQ(failed.bindError->host(), "0.0.0.0");
    EXPECT_FALSE(supervisor->isRunning());
    EXPECT_EQ(registry->liveCount(), 0u);

    const auto ok = supervisor->start(baseConfig(2121));
    ASSERT_TRUE(ok.ok);
    EXPECT_TRUE(supervisor->status().running);
    EXPECT_EQ(supervisor->status().config.port, 2121);
}

TEST_F(ServiceSupervisorTest, SamePortRestartSucceeds) {
    auto supervisor = makeSupervisor(baseConfig());
    ASSERT_TRUE(supervisor->start(baseConfig()).ok);

    const auto result = supervisor->restart(baseConfig());
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(registry->constructed, 2u);
    EXPECT_EQ(registry->maxLive, 1u);
    EXPECT_EQ(registry->liveCount(), 1u);
}

TEST_F(ServiceSupervisorTest, RestartOnOccupiedPortLeavesNoListenerAndKeepsConfig) {
    registry->occupiedElsewhere.insert(2200);
    auto supervisor = makeSupervisor(baseConfig());
    ASSERT_TRUE(supervisor->start(baseConfig()).ok);

    const auto result = supervisor->restart(baseConfig(2200));
    ASSERT_FALSE(result.ok);
    ASSERT_TRUE(result.bindError.has_value());
    EXPECT_EQ(result.bindError->port(), 2200);

    EXPECT_FALSE(supervisor->isRunning());
    EXPECT_EQ(supervisor->currentConfig().port, 2121);
    EXPECT_EQ(registry->liveCount(), 0u);

    // The operator retries; the old port is free again
    EXPECT_TRUE(supervisor->restartCurrent().ok);
    EXPECT_TRUE(supervisor->isRunning());
}

TEST_F(ServiceSupervisorTest, StuckListenerIsAbandonedAfterGracePeriod) {
    registry->ignoreStopFor = 600ms;
    auto supervisor = makeSupervisor(baseConfig(), 50ms);
    ASSERT_TRUE(supervisor->start(baseConfig()).ok);

    const auto begin = std::chrono::steady_clock::now();
    supervisor->stop();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_FALSE(supervisor->isRunning());
    EXPECT_LT(elapsed, 500ms);

    // Let the detached thread finish before the registry assertions of other tests
    std::this_thread::sleep_for(700ms);
    EXPECT_EQ(registry->liveCount(), 0u);
}

TEST_F(ServiceSupervisorTest, ListenerThatThrowsIsReportedStopped) {
    registry->throwOnServe = true;
    auto supervisor = makeSupervisor(baseConfig());
    ASSERT_TRUE(supervisor->start(baseConfig()).ok);

    std::this_thread::sleep_for(300ms);

    const auto status = supervisor->status();
    EXPECT_FALSE(status.running);
    EXPECT_FALSE(supervisor->isRunning());
    EXPECT_EQ(status.config, baseConfig());

    // The dead listener is released and the operator can restart
    supervisor->stop();
    EXPECT_EQ(registry->liveCount(), 0u);
    registry->throwOnServe = false;
    ASSERT_TRUE(supervisor->restartCurrent().ok);
    EXPECT_TRUE(supervisor->isRunning());
}

TEST_F(ServiceSupervisorTest, ListenerThatReturnsEarlyIsReportedStopped) {
    registry->returnOnServe = true;
    auto supervisor = makeSupervisor(baseConfig());
    ASSERT_TRUE(supervisor->start(baseConfig()).ok);

    std::this_thread::sleep_for(300ms);

    EXPECT_FALSE(supervisor->status().running);
    EXPECT_EQ(supervisor->currentConfig().port, 2121);
}

TEST(ServiceHandleTest, AliveUntilStopped) {
    auto registry = std::make_shared<PortRegistry>();
    ServiceConfig config;
    config.port = 2600;
    auto handle = ServiceHandle::launch(
        [registry](const ServiceConfig& c) -> std::unique_ptr<TransferService> {
            return std::make_unique<FakeService>(registry, c);
        },
        config);

    EXPECT_TRUE(handle->alive());
    EXPECT_EQ(handle->boundPort(), 2600);
    EXPECT_TRUE(handle->stop(std::chrono::milliseconds(2000)));
    EXPECT_FALSE(handle->alive());
    EXPECT_TRUE(handle->stop(std::chrono::milliseconds(2000)));
}

//=============================================================================
// Field updates & persistence
//=============================================================================

TEST_F(ServiceSupervisorTest, UsernameChangeRestartsAndPersists) {
    auto supervisor = makeSupervisor(baseConfig());
    ASSERT_TRUE(supervisor->start(baseConfig()).ok);

    const auto result = supervisor->applyField(ConfigField::Username, "  bob ");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.snapshot.config.username, "bob");
    EXPECT_TRUE(result.persistenceWarning.empty());
    EXPECT_EQ(store.get("username", ""), "bob");
    EXPECT_EQ(registry->constructed, 2u);
    EXPECT_EQ(registry->maxLive, 1u);
}

TEST_F(ServiceSupervisorTest, InvalidFieldChangesNothing) {
    auto supervisor = makeSupervisor(baseConfig());
    ASSERT_TRUE(supervisor->start(baseConfig()).ok);

    const auto result = supervisor->applyField(ConfigField::Port, "21x");
    EXPECT_EQ(result.outcome, FieldUpdateOutcome::ValidationFailed);
    EXPECT_FALSE(result.message.empty());

    EXPECT_TRUE(supervisor->isRunning());
    EXPECT_EQ(supervisor->currentConfig().port, 2121);
    EXPECT_EQ(registry->constructed, 1u);
    EXPECT_TRUE(store.writes.empty());
}

TEST_F(ServiceSupervisorTest, PortPersistedOnlyAfterSuccessfulRestart) {
    registry->occupiedElsewhere.insert(2200);
    auto supervisor = makeSupervisor(baseConfig());
    ASSERT_TRUE(supervisor->start(baseConfig()).ok);

    const auto failed = supervisor->applyField(ConfigField::Port, "2200");
    EXPECT_EQ(failed.outcome, FieldUpdateOutcome::BindFailed);
    EXPECT_FALSE(store.has("port"));
    EXPECT_EQ(supervisor->currentConfig().port, 2121);
    EXPECT_FALSE(supervisor->isRunning());

    const auto applied = supervisor->applyField(ConfigField::Port, "2300");
    ASSERT_TRUE(applied.ok());
    EXPECT_EQ(store.get("port", ""), "2300");
    EXPECT_EQ(supervisor->status().config.port, 2300);
}

TEST_F(ServiceSupervisorTest, FolderChangeIsAppliedButNeverPersisted) {
    auto supervisor = makeSupervisor(baseConfig());
    ASSERT_TRUE(supervisor->start(baseConfig()).ok);

    const auto newRoot = root / "nested" / "share";
    const auto result = supervisor->applyField(ConfigField::SharedRoot, newRoot.string());
    ASSERT_TRUE(result.ok());

    EXPECT_TRUE(std::filesystem::is_directory(newRoot));
    EXPECT_EQ(supervisor->currentConfig().sharedRoot, newRoot);
    EXPECT_FALSE(store.has("folder"));
    EXPECT_TRUE(store.writes.empty());
}

TEST_F(ServiceSupervisorTest, RestartCurrentPersistsPort) {
    auto supervisor = makeSupervisor(baseConfig(2400));
    ASSERT_TRUE(supervisor->start(baseConfig(2400)).ok);

    const auto result = supervisor->restartCurrent();
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(store.get("port", ""), "2400");
}

TEST_F(ServiceSupervisorTest, PersistenceFailureDoesNotUndoChange) {
    store.failWrites = true;
    auto supervisor = makeSupervisor(baseConfig());
    ASSERT_TRUE(supervisor->start(baseConfig()).ok);

    const auto result = supervisor->applyField(ConfigField::Password, "newpass");
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.persistenceWarning.empty());
    EXPECT_TRUE(supervisor->isRunning());
    EXPECT_EQ(supervisor->currentConfig().password, "newpass");
}

TEST_F(ServiceSupervisorTest, EmptyPasswordIsReplacedButNotPersisted) {
    ServiceConfig config = baseConfig();
    config.password.clear();
    auto supervisor = makeSupervisor(config);

    ASSERT_TRUE(supervisor->generatedPassword().has_value());
    const std::string generated = *supervisor->generatedPassword();
    EXPECT_EQ(generated.size(), 16u);
    EXPECT_EQ(supervisor->currentConfig().password, generated);

    ASSERT_TRUE(supervisor->start(supervisor->currentConfig()).ok);
    EXPECT_FALSE(store.has("password"));

    ServiceConfig other = baseConfig();
    other.password.clear();
    auto second = makeSupervisor(other);
    ASSERT_TRUE(second->generatedPassword().has_value());
    EXPECT_NE(*second->generatedPassword(), generated);
}

//=============================================================================
// Concurrency
//=============================================================================

TEST_F(ServiceSupervisorTest, StatusDuringSlowRestartIsNeverTorn) {
    auto supervisor = makeSupervisor(baseConfig(2121));
    ASSERT_TRUE(supervisor->start(baseConfig(2121)).ok);

    registry->bindDelay = 300ms;

    std::atomic<bool> done{false};
    std::thread restarter([&]() {
        EXPECT_TRUE(supervisor->restart(baseConfig(2500)).ok);
        done.store(true);
    });

    size_t observations = 0;
    while (!done.load()) {
        const auto s = supervisor->status();
        const bool before = s.running && s.config.port == 2121;
        const bool after = s.running && s.config.port == 2500;
        EXPECT_TRUE(before || after) << "running=" << s.running << " port=" << s.config.port;
        ++observations;
        std::this_thread::sleep_for(5ms);
    }
    restarter.join();

    EXPECT_GT(observations, 0u);
    const auto final = supervisor->status();
    EXPECT_TRUE(final.running);
    EXPECT_EQ(final.config.port, 2500);
    EXPECT_EQ(registry->maxLive, 1u);
}

TEST_F(ServiceSupervisorTest, ConcurrentFieldUpdatesAreSerialized) {
    auto supervisor = makeSupervisor(baseConfig());
    ASSERT_TRUE(supervisor->start(baseConfig()).ok);

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&supervisor, i]() {
            (void)supervisor->applyField(ConfigField::Username, "user" + std::to_string(i));
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_TRUE(supervisor->isRunning());
    EXPECT_EQ(registry->maxLive, 1u);
    EXPECT_EQ(registry->constructed, 5u);
    EXPECT_EQ(store.get("username", ""), supervisor->currentConfig().username);
}
