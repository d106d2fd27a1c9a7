/**
 * @file thread_safe_log_test.cpp
 * @brief File sink and console switch of the logging layer
 */

#include <gtest/gtest.h>

#include "ftpshare/Debug.h"
#include "ftpshare/ThreadSafeLog.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

using namespace FtpShare;

namespace {

std::string readAll(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

class ThreadSafeLogTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "ftpshare_log_test";
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void TearDown() override {
        ThreadSafeLog::initialize({}, 0);
        setLogOutputEnabled(true);
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

}  // namespace

TEST_F(ThreadSafeLogTest, DisabledUntilInitialized) {
    ThreadSafeLog::initialize({}, 0);
    EXPECT_FALSE(ThreadSafeLog::isInitialized());
    ThreadSafeLog::log("dropped");
}

TEST_F(ThreadSafeLogTest, LogMacrosReachFileEvenWhenConsoleIsOff) {
    const auto path = dir / "ftpshare.log";
    ThreadSafeLog::initialize(path, 0);
    setLogOutputEnabled(false);

    LOG_WARNING("disk " << 42 << " nearly full");

    const std::string text = readAll(path);
    EXPECT_NE(text.find("[WARNING] disk 42 nearly full"), std::string::npos);
}

TEST_F(ThreadSafeLogTest, RotatesPastSizeLimit) {
    const auto path = dir / "rotate.log";
    ThreadSafeLog::initialize(path, 64);

    for (int i = 0; i < 10; ++i) {
        ThreadSafeLog::log("line number " + std::to_string(i) + " with some padding");
    }

    std::filesystem::path rotated = path;
    rotated += ".1";
    EXPECT_TRUE(std::filesystem::exists(rotated));
    EXPECT_LE(std::filesystem::file_size(path), 128u);
}

TEST_F(ThreadSafeLogTest, ConcurrentWritersProduceWholeLines) {
    const auto path = dir / "concurrent.log";
    ThreadSafeLog::initialize(path, 0);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < 50; ++i) {
                ThreadSafeLog::log("writer " + std::to_string(t));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::ifstream in(path);
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        EXPECT_NE(line.find(" writer "), std::string::npos) << line;
        ++count;
    }
    EXPECT_EQ(count, 200);
}
