/**
 * @file operator_console_test.cpp
 * @brief Menu handling of OperatorConsole over string streams
 */

#include <gtest/gtest.h>

#include "ftpshare/Errors.h"
#include "ftpshare/OperatorConsole.h"

#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>

using namespace FtpShare;

namespace {

/// Listener that binds nothing and serves until stopped
class IdleService : public TransferService {
public:
    explicit IdleService(uint16_t port) : m_port(port) {}

    void serveForever() override {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this]() { return m_stopped; });
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopped = true;
        m_cv.notify_all();
    }

    uint16_t boundPort() const override { return m_port; }

private:
    uint16_t m_port;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopped = false;
};

class MemoryStore : public ConfigStore {
public:
    std::string get(const std::string& key, const std::string& defaultValue) const override {
        auto it = values.find(key);
        return it == values.end() ? defaultValue : it->second;
    }
    void set(const std::string& key, const std::string& value) override {
        if (failWrites) {
            throw PersistenceError("read-only filesystem");
        }
        values[key] = value;
    }
    void remove(const std::string& key) override { values.erase(key); }

    std::map<std::string, std::string> values;
    bool failWrites = false;
};

class StaticNetwork : public NetworkInfo {
public:
    std::string primaryAddress() const noexcept override { return "192.168.0.20"; }
    std::vector<std::string> reachableAddresses() const noexcept override {
        return {"192.168.0.20"};
    }
};

}  // namespace

//=============================================================================
// Test Fixture
//=============================================================================

class OperatorConsoleTest : public ::testing::Test {
protected:
    MemoryStore store;
    StaticNetwork network;
    std::set<uint16_t> busyPorts;
    std::filesystem::path root;
    std::unique_ptr<ServiceSupervisor> supervisor;

    void SetUp() override {
        root = std::filesystem::temp_directory_path() / "ftpshare_console_test_root";
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        std::filesystem::create_directories(root);

        ServiceConfig config;
        config.port = 2121;
        config.username = "user";
        config.password = "12345";
        config.sharedRoot = root;

        auto busy = &busyPorts;
        TransferServiceFactory factory = [busy](const ServiceConfig& c) -> std::unique_ptr<TransferService> {
            if (busy->count(c.port)) {
                throw BindError(c.host, c.port, "Address already in use");
            }
            return std::make_unique<IdleService>(c.port);
        };

        supervisor = std::make_unique<ServiceSupervisor>(store, network, factory, config);
        ASSERT_TRUE(supervisor->start(config).ok);
    }

    void TearDown() override {
        supervisor.reset();
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    /// Feed @p input to a fresh console and return everything it printed
    std::string runConsole(const std::string& input) {
        std::istringstream in(input);
        std::ostringstream out;
        OperatorConsole console(*supervisor, in, out);
        console.run();
        return out.str();
    }
};

//=============================================================================
// Menu
//=============================================================================

TEST_F(OperatorConsoleTest, EndOfInputStopsServer) {
    const std::string output = runConsole("");

    EXPECT_NE(output.find("7) Stop server and exit"), std::string::npos);
    EXPECT_NE(output.find("Stopping server and exiting..."), std::string::npos);
    EXPECT_FALSE(supervisor->isRunning());
}

TEST_F(OperatorConsoleTest, ShowCredentials) {
    const std::string output = runConsole("6\n7\n");

    EXPECT_NE(output.find("ip: 192.168.0.20\n"), std::string::npos);
    EXPECT_NE(output.find("port: 2121\n"), std::string::npos);
    EXPECT_NE(output.find("username: user\n"), std::string::npos);
    EXPECT_NE(output.find("password: 12345\n"), std::string::npos);
    EXPECT_NE(output.find("running: yes"), std::string::npos);
}

TEST_F(OperatorConsoleTest, UnknownSelectionKeepsRunning) {
    const std::string output = runConsole("9\n7\n");

    EXPECT_NE(output.find("Unknown selection"), std::string::npos);
    EXPECT_NE(output.find("Stopping server and exiting..."), std::string::npos);
}

TEST_F(OperatorConsoleTest, ChangeUsernameRestartsServer) {
    const std::string output = runConsole("1\nalice\n7\n");

    EXPECT_NE(output.find("Username changed to: alice"), std::string::npos);
    EXPECT_NE(output.find("Server restarted on 0.0.0.0:2121 (user: alice)"), std::string::npos);
    EXPECT_EQ(store.values["username"], "alice");
}

TEST_F(OperatorConsoleTest, InvalidPortIsRejectedWithoutRestart) {
    const std::string output = runConsole("3\n99999\n6\n7\n");

    EXPECT_NE(output.find("Port out of range"), std::string::npos);
    EXPECT_EQ(output.find("Server restarted"), std::string::npos);
    EXPECT_NE(output.find("running: yes"), std::string::npos);
    EXPECT_EQ(store.values.count("port"), 0u);
}

TEST_F(OperatorConsoleTest, PortConflictLeavesServerStopped) {
    busyPorts.insert(2200);
    const std::string output = runConsole("3\n2200\n6\n7\n");

    EXPECT_NE(output.find("Failed to restart server on the new port. Check for port conflicts and try again."),
              std::string::npos);
    EXPECT_NE(output.find("port: 2121\n"), std::string::npos);
    EXPECT_NE(output.find("running: no"), std::string::npos);
}

TEST_F(OperatorConsoleTest, RestartAfterFailureRecovers) {
    busyPorts.insert(2200);
    const std::string output = runConsole("3\n2200\n5\n7\n");

    EXPECT_NE(output.find("Restarting server with current settings..."), std::string::npos);
    EXPECT_NE(output.find("Server restarted on 0.0.0.0:2121"), std::string::npos);
    EXPECT_EQ(store.values["port"], "2121");
}

TEST_F(OperatorConsoleTest, PersistenceWarningIsShown) {
    store.failWrites = true;
    const std::string output = runConsole("2\nsecret\n7\n");

    EXPECT_NE(output.find("Password updated"), std::string::npos);
    EXPECT_NE(output.find("Warning: Could not save password"), std::string::npos);
}

TEST_F(OperatorConsoleTest, EndOfInputDuringPromptExits) {
    const std::string output = runConsole("1\n");

    EXPECT_NE(output.find("Stopping server and exiting..."), std::string::npos);
    EXPECT_FALSE(supervisor->isRunning());
}

//=============================================================================
// Free helpers
//=============================================================================

TEST(PromptWithDefaultTest, EmptyInputUsesDefault) {
    std::istringstream in("\n");
    std::ostringstream out;
    EXPECT_EQ(promptWithDefault(in, out, "Folder to share", "/srv"), "/srv");
    EXPECT_EQ(out.str(), "Folder to share [/srv]: ");
}

TEST(PromptWithDefaultTest, InputIsTrimmed) {
    std::istringstream in("  /data  \n");
    std::ostringstream out;
    EXPECT_EQ(promptWithDefault(in, out, "Folder", "/srv"), "/data");
}

TEST(PromptWithDefaultTest, EndOfInputUsesDefault) {
    std::istringstream in("");
    std::ostringstream out;
    EXPECT_EQ(promptWithDefault(in, out, "Folder", "/srv"), "/srv");
}

TEST(PrintConnectionInfoTest, WritesCopyPasteBlock) {
    SupervisorSnapshot snapshot;
    snapshot.running = true;
    snapshot.config.port = 2121;
    snapshot.config.username = "user";
    snapshot.config.password = "pw";
    snapshot.primaryAddress = "10.0.0.5";
    snapshot.reachableAddresses = {"10.0.0.5", "172.16.0.9"};

    std::ostringstream out;
    printConnectionInfo(out, snapshot);

    EXPECT_EQ(out.str(),
              "ip: 10.0.0.5\n"
              "port: 2121\n"
              "username: user\n"
              "password: pw\n"
              "all_ips: 10.0.0.5, 172.16.0.9\n");
}
