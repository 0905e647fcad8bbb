#include "config_store.h"
#include "test_support.h"

#include <gtest/gtest.h>
#include <cstdlib>

using namespace test_support;
using json = nlohmann::json;

class ConfigStoreTest : public ::testing::Test {
protected:
    TempDir dir_{"config_store"};

    DaemonConfig sampleConfig() const {
        DaemonConfig config;
        config.serverUrl = "https://usage.example.com";
        config.deviceApiKey = "key-123";
        config.watchRoot = "/home/dev/.claude";
        config.pushIntervalMs = 15000;
        return config;
    }
};

TEST_F(ConfigStoreTest, FileLayoutLivesInConfigDir) {
    ConfigStore store(dir_.str());
    EXPECT_EQ(store.getConfigPath(), (dir_.path() / "config.json").string());
    EXPECT_EQ(store.getStatePath(), (dir_.path() / "state.json").string());
    EXPECT_EQ(store.getPidPath(), (dir_.path() / "daemon.pid").string());
    EXPECT_EQ(store.getLogPath(), (dir_.path() / "daemon.log").string());
    EXPECT_EQ(store.getErrorLogPath(), (dir_.path() / "daemon.error.log").string());
}

TEST_F(ConfigStoreTest, SaveThenLoad) {
    ConfigStore store(dir_.str());
    EXPECT_FALSE(store.exists());
    EXPECT_FALSE(store.load().has_value());

    store.save(sampleConfig());
    EXPECT_TRUE(store.exists());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->serverUrl, "https://usage.example.com");
    EXPECT_EQ(loaded->deviceApiKey, "key-123");
    EXPECT_EQ(loaded->watchRoot, "/home/dev/.claude");
    EXPECT_EQ(loaded->pushIntervalMs, 15000);
    EXPECT_EQ(loaded->projectsDir(), "/home/dev/.claude/projects");
}

TEST_F(ConfigStoreTest, TrailingSlashIsStripped) {
    auto config = json::parse(R"({"serverUrl":"http://localhost:3000/","deviceApiKey":"k",
                                  "watchRoot":"/w","pushIntervalMs":1000})").get<DaemonConfig>();
    EXPECT_EQ(config.serverUrl, "http://localhost:3000");
}

TEST_F(ConfigStoreTest, AcceptsLegacyClaudeDirKey) {
    auto config = json::parse(R"({"serverUrl":"http://localhost:3000","deviceApiKey":"k",
                                  "claudeDir":"/legacy","pushIntervalMs":1000})").get<DaemonConfig>();
    EXPECT_EQ(config.watchRoot, "/legacy");
}

TEST_F(ConfigStoreTest, RejectsInvalidValues) {
    EXPECT_THROW(json::parse(R"({"serverUrl":"ftp://x","deviceApiKey":"k","watchRoot":"/w",
                                 "pushIntervalMs":1000})").get<DaemonConfig>(), std::exception);
    EXPECT_THROW(json::parse(R"({"serverUrl":"http://x","deviceApiKey":"k","watchRoot":"/w",
                                 "pushIntervalMs":0})").get<DaemonConfig>(), std::exception);
    EXPECT_THROW(json::parse(R"({"serverUrl":"http://x","deviceApiKey":"k","watchRoot":"/w",
                                 "pushIntervalMs":9223372036854775807})").get<DaemonConfig>(), std::exception);
    EXPECT_THROW(json::parse(R"({"serverUrl":"http://x","deviceApiKey":"k","watchRoot":"",
                                 "pushIntervalMs":1000})").get<DaemonConfig>(), std::exception);
    EXPECT_THROW(json::parse(R"({"serverUrl":"http://x","watchRoot":"/w",
                                 "pushIntervalMs":1000})").get<DaemonConfig>(), std::exception);
}

TEST_F(ConfigStoreTest, PushIntervalUpToOneDayIsAccepted) {
    auto config = json::parse(R"({"serverUrl":"http://x","deviceApiKey":"k","watchRoot":"/w",
                                  "pushIntervalMs":86400000})").get<DaemonConfig>();
    EXPECT_EQ(config.pushIntervalMs, 86400000);
    EXPECT_THROW(json::parse(R"({"serverUrl":"http://x","deviceApiKey":"k","watchRoot":"/w",
                                 "pushIntervalMs":86400001})").get<DaemonConfig>(), std::exception);
}

TEST_F(ConfigStoreTest, InvalidFileLoadsAsUnconfigured) {
    writeFile(dir_.path() / "config.json", R"({"serverUrl":"http://x","deviceApiKey":"k",
                                               "watchRoot":"/w","pushIntervalMs":-1})");
    ConfigStore store(dir_.str());
    EXPECT_TRUE(store.exists());
    EXPECT_FALSE(store.load().has_value());
}

TEST_F(ConfigStoreTest, RemoveDeletesOnlyConfig) {
    ConfigStore store(dir_.str());
    store.save(sampleConfig());
    writeFile(dir_.path() / "state.json", "{}");

    store.remove();
    EXPECT_FALSE(store.exists());
    EXPECT_TRUE(std::filesystem::exists(dir_.path() / "state.json"));

    store.removeAll();
    EXPECT_FALSE(std::filesystem::exists(dir_.path()));
}

TEST_F(ConfigStoreTest, HomeOverrideTakesPrecedence) {
    const char* previous = std::getenv("USAGE_DAEMON_HOME");
    std::string saved = previous ? previous : "";

    setenv("USAGE_DAEMON_HOME", dir_.str().c_str(), 1);
    EXPECT_EQ(ConfigStore::defaultConfigDir(), dir_.str());
    EXPECT_EQ(ConfigStore().getConfigDir(), dir_.str());

    if (previous) {
        setenv("USAGE_DAEMON_HOME", saved.c_str(), 1);
    } else {
        unsetenv("USAGE_DAEMON_HOME");
    }
}
