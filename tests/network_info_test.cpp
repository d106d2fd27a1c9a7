/**
 * @file network_info_test.cpp
 * @brief Reachable address normalization and live discovery smoke test
 */

#include <gtest/gtest.h>

#include "ftpshare/NetworkInfo.h"

using namespace FtpShare;

TEST(NetworkInfoTest, NormalizeDropsLoopbackAndDuplicatesAndSorts) {
    const auto out = SystemNetworkInfo::normalizeAddresses(
        {"192.168.1.20", "", "127.0.0.1", "10.0.0.5", "192.168.1.20", "127.0.1.1"});

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], "10.0.0.5");
    EXPECT_EQ(out[1], "192.168.1.20");
}

TEST(NetworkInfoTest, NormalizeFallsBackToLocalhost) {
    const auto out = SystemNetworkInfo::normalizeAddresses({"127.0.0.1", ""});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], "127.0.0.1");
}

TEST(NetworkInfoTest, LiveDiscoveryNeverReturnsEmpty) {
    SystemNetworkInfo info;
    EXPECT_FALSE(info.primaryAddress().empty());

    const auto all = info.reachableAddresses();
    ASSERT_FALSE(all.empty());
    for (const auto& ip : all) {
        EXPECT_FALSE(ip.empty());
    }
}
