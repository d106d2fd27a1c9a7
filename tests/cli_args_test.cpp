/**
 * @file cli_args_test.cpp
 * @brief Tests for ftpshare command line parsing.
 */

#include "ftpshare/CliArgs.h"

#include <gtest/gtest.h>

using namespace FtpShare;

TEST(CliArgsTest, NoArgumentsMeansInteractive) {
    const char* argv[] = {"ftpshare"};
    CliArgs a = CliArgs::parseOrThrow(1, argv);
    EXPECT_FALSE(a.nonInteractive);
    EXPECT_FALSE(a.showHelp);
    EXPECT_FALSE(a.folder.has_value());
    EXPECT_FALSE(a.portText.has_value());
}

TEST(CliArgsTest, PositionalFolderAndPortAroundFlag) {
    const char* argv[] = {"ftpshare", "/srv/share", "--noninteractive", "2222"};
    CliArgs a = CliArgs::parseOrThrow(4, argv);
    EXPECT_TRUE(a.nonInteractive);
    ASSERT_TRUE(a.folder.has_value());
    EXPECT_EQ(*a.folder, "/srv/share");
    ASSERT_TRUE(a.portText.has_value());
    EXPECT_EQ(*a.portText, "2222");
}

TEST(CliArgsTest, PortTextIsKeptVerbatim) {
    const char* argv[] = {"ftpshare", "--noninteractive", "share", "abc"};
    CliArgs a = CliArgs::parseOrThrow(4, argv);
    ASSERT_TRUE(a.portText.has_value());
    EXPECT_EQ(*a.portText, "abc");
}

TEST(CliArgsTest, ConfigAndLogFileTakeValues) {
    const char* argv[] = {"ftpshare", "--config", "/tmp/s.json", "--log-file", "/tmp/ftp.log"};
    CliArgs a = CliArgs::parseOrThrow(5, argv);
    ASSERT_TRUE(a.configPath.has_value());
    EXPECT_EQ(*a.configPath, "/tmp/s.json");
    ASSERT_TRUE(a.logFile.has_value());
    EXPECT_EQ(*a.logFile, "/tmp/ftp.log");
}

TEST(CliArgsTest, MissingFlagValueThrows) {
    const char* argv[] = {"ftpshare", "--config"};
    EXPECT_THROW((void)CliArgs::parseOrThrow(2, argv), std::runtime_error);
}

TEST(CliArgsTest, UnknownFlagThrows) {
    const char* argv[] = {"ftpshare", "--tls"};
    EXPECT_THROW((void)CliArgs::parseOrThrow(2, argv), std::runtime_error);
}

TEST(CliArgsTest, ThirdPositionalThrows) {
    const char* argv[] = {"ftpshare", "a", "2121", "extra"};
    EXPECT_THROW((void)CliArgs::parseOrThrow(4, argv), std::runtime_error);
}

TEST(CliArgsTest, HelpFlagSetsShowHelp) {
    const char* argv[] = {"ftpshare", "-h"};
    CliArgs a = CliArgs::parseOrThrow(2, argv);
    EXPECT_TRUE(a.showHelp);
    EXPECT_NE(CliArgs::usage("ftpshare").find("--noninteractive"), std::string::npos);
}
