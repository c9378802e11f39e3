#include "hb/Config.hpp"
#include "hb/util/Config.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>

using namespace hb;

TEST(ConfigTest, ConstantsMatchProtocolDefaults) {
    EXPECT_EQ(Config::OutputHistoryMax, 1000u);
    EXPECT_EQ(Config::DefaultPort, 9485);
    EXPECT_EQ(Config::DefaultOutputLines, 100u);
    EXPECT_EQ(Config::MaxRequestBytes, 1024u * 1024u);
    EXPECT_EQ(Config::HostWorkers, 1u);
}

TEST(ConfigTest, RuntimeDefaults) {
    util::Config cfg;
    EXPECT_EQ(cfg.bindAddress, "127.0.0.1");
    EXPECT_EQ(cfg.port, Config::DefaultPort);
    EXPECT_EQ(cfg.webhookTimeoutMs, 5000u);
    EXPECT_EQ(cfg.logFormat, "plain");
    EXPECT_EQ(cfg.metricsIntervalSeconds, 0u);
}

TEST(ConfigTest, ApplyRejectsBadValues) {
    util::Config cfg;
    EXPECT_FALSE(cfg.apply("port", "70000"));
    EXPECT_FALSE(cfg.apply("port", "-1"));
    EXPECT_FALSE(cfg.apply("port", "abc"));
    EXPECT_FALSE(cfg.apply("logFormat", "xml"));
    EXPECT_FALSE(cfg.apply("maxRequestBytes", "0"));
    EXPECT_FALSE(cfg.apply("nonsense", "1"));
    EXPECT_EQ(cfg.port, Config::DefaultPort);
}

TEST(ConfigTest, HostWorkersNeverZero) {
    util::Config cfg;
    EXPECT_TRUE(cfg.apply("hostWorkers", "0"));
    EXPECT_EQ(cfg.hostWorkers, 1u);
    EXPECT_TRUE(cfg.apply("hostWorkers", "3"));
    EXPECT_EQ(cfg.hostWorkers, 3u);
}

TEST(ConfigTest, LoadFromFileSkipsCommentsAndUnknownKeys) {
    const std::string path = ::testing::TempDir() + "hb_config_test.cfg";
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "; another\n"
            << "port = 9999\n"
            << "bindAddress=0.0.0.0\r\n"
            << "logLevel = debug\n"
            << "mystery = 1\n"
            << "workspaceRoot = /tmp/ws\n";
    }
    util::Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.port, 9999);
    EXPECT_EQ(cfg.bindAddress, "0.0.0.0");
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.registryPath(), "/tmp/ws/.hostbridge-configs.json");
    std::remove(path.c_str());
}

TEST(ConfigTest, MissingFileReportsFailure) {
    util::Config cfg;
    EXPECT_FALSE(cfg.loadFromFile("/nonexistent/hostbridge.cfg"));
}

TEST(ConfigTest, ExplicitRegistryFileWins) {
    util::Config cfg;
    cfg.workspaceRoot = "/srv/ws/";
    EXPECT_EQ(cfg.registryPath(), "/srv/ws/.hostbridge-configs.json");
    cfg.configRegistryFile = "/etc/hb/configs.json";
    EXPECT_EQ(cfg.registryPath(), "/etc/hb/configs.json");
}
