#include "application/config/ConfigManager.hpp"
#include "core/types/Error.hpp"
#include "TestSupport.hpp"

#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>

using core::config::ConfigManager;
using core::profile::DriverBackend;
using core::profile::SlicerBackend;

namespace {

    bool hasErrorContaining(const ConfigManager::ValidationResult &result, const std::string &fragment) {
        for (const auto &error: result.errors) {
            if (error.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

}

class ConfigManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("CONVEYOR_SERVER_MAXCOMPLETEDJOBS");
        unsetenv("CONVEYOR_CLIENT_DEVICE");
        unsetenv("CONVEYOR_NOT_A_SETTING");
    }

    ConfigManager manager_;
    testing_support::TempDirectory dir_;
};

TEST_F(ConfigManagerTest, DefaultsBuildWithSynthesizedProfiles) {
    auto config = manager_.build();

    EXPECT_EQ(config.address.kind, connector::address::AddressKind::PIPE);
    EXPECT_EQ(config.address.path, "/tmp/conveyord.socket");
    EXPECT_EQ(config.server.maxCompletedJobs, 100u);
    EXPECT_FALSE(config.kafka.enabled);

    ASSERT_EQ(config.slicerProfiles.size(), 2u);
    EXPECT_EQ(config.slicerProfiles[0].name, "MiracleGrue");
    EXPECT_EQ(config.slicerProfiles[0].backend, SlicerBackend::MIRACLE_GRUE);
    EXPECT_EQ(config.slicerProfiles[1].backend, SlicerBackend::SKEINFORGE);

    ASSERT_EQ(config.driverProfiles.size(), 2u);
    EXPECT_EQ(config.driverProfiles[0].name, "MakerBotDriver");
    EXPECT_EQ(config.driverProfiles[0].baudrate, 115200u);
    EXPECT_EQ(config.driverProfiles[0].temperaturePollMs, 5000);
    EXPECT_EQ(config.driverProfiles[1].backend, DriverBackend::PRINT_TO_FILE);
    EXPECT_TRUE(config.devices.empty());
}

TEST_F(ConfigManagerTest, JsonSectionsAreFlattened) {
    manager_.loadFromJson(nlohmann::json::parse(R"({
        "common": {"address": "tcp:127.0.0.1:9999"},
        "server": {"maxCompletedJobs": 5, "logging": {"level": "debug"}},
        "makerbot": {"baudrate": 57600, "defaultProfile": "Replicator"}
    })"));

    EXPECT_EQ(manager_.get<int>("server.maxCompletedJobs", 0), 5);
    EXPECT_TRUE(manager_.contains("server.logging.level"));

    auto config = manager_.build();
    EXPECT_EQ(config.address.kind, connector::address::AddressKind::TCP);
    EXPECT_EQ(config.address.port, 9999);
    EXPECT_EQ(config.server.logging.level, LogLevel::Debug);
    EXPECT_EQ(config.driverProfiles[0].name, "Replicator");
    EXPECT_EQ(config.driverProfiles[0].baudrate, 57600u);
}

TEST_F(ConfigManagerTest, ExplicitProfilesAndDevicesReplaceDefaults) {
    manager_.loadFromJson(nlohmann::json::parse(R"({
        "slicerProfiles": [{"name": "Fine", "backend": "Skeinforge", "settings": {"layerHeight": 0.1}}],
        "driverProfiles": [{"name": "Bot", "backend": "MakerBot", "baudrate": 9600}],
        "devices": [{"id": "bot-1", "port": "/dev/ttyUSB0"}, {"id": "bot-2"}]
    })"));

    auto config = manager_.build();
    ASSERT_EQ(config.slicerProfiles.size(), 1u);
    EXPECT_EQ(config.slicerProfiles[0].name, "Fine");
    EXPECT_DOUBLE_EQ(config.slicerProfiles[0].settings.layerHeight, 0.1);
    ASSERT_EQ(config.driverProfiles.size(), 1u);
    EXPECT_EQ(config.driverProfiles[0].baudrate, 9600u);

    ASSERT_EQ(config.devices.size(), 2u);
    EXPECT_EQ(config.devices[0].port, "/dev/ttyUSB0");
    EXPECT_EQ(config.devices[1].port, "bot-2");
    EXPECT_EQ(config.devices[1].baudrate, 0u);
}

TEST_F(ConfigManagerTest, EnvironmentOverridesKnownKeys) {
    setenv("CONVEYOR_SERVER_MAXCOMPLETEDJOBS", "7", 1);
    setenv("CONVEYOR_CLIENT_DEVICE", "/dev/ttyUSB3", 1);
    setenv("CONVEYOR_NOT_A_SETTING", "x", 1);

    EXPECT_EQ(manager_.loadFromEnv(), 2);

    auto config = manager_.build();
    EXPECT_EQ(config.server.maxCompletedJobs, 7u);
    EXPECT_EQ(config.client.device, "/dev/ttyUSB3");
    EXPECT_FALSE(manager_.contains("not.a.setting"));
}

TEST_F(ConfigManagerTest, ValidateCollectsEveryError) {
    manager_.set("common.address", "udp:somewhere");
    manager_.set("server.eventThreads", "zero");
    manager_.set("server.maxCompletedJobs", "0");
    manager_.set("server.logging.level", "LOUD");

    auto result = manager_.validate();
    EXPECT_FALSE(result.isValid);
    EXPECT_TRUE(hasErrorContaining(result, "common.address"));
    EXPECT_TRUE(hasErrorContaining(result, "server.eventThreads must be an integer"));
    EXPECT_TRUE(hasErrorContaining(result, "server.maxCompletedJobs must be >= 1"));
    EXPECT_TRUE(hasErrorContaining(result, "unknown log level 'LOUD'"));

    EXPECT_THROW(manager_.build(), core::types::ConfigurationException);
}

TEST_F(ConfigManagerTest, RejectsDuplicateNamesAndBadEntries) {
    manager_.loadFromJson(nlohmann::json::parse(R"({
        "slicerProfiles": [
            {"name": "Same", "backend": "MiracleGrue"},
            {"name": "Same", "backend": "Skeinforge"},
            {"name": "Other", "backend": "Cura"}
        ],
        "driverProfiles": {"name": "NotAnArray"},
        "devices": [{"id": "bot-1"}, {"id": "bot-1"}, {"port": "/dev/ttyACM1"}]
    })"));

    auto result = manager_.validate();
    EXPECT_FALSE(result.isValid);
    EXPECT_TRUE(hasErrorContaining(result, "duplicate slicer profile name: Same"));
    EXPECT_TRUE(hasErrorContaining(result, "unknown backend: Cura"));
    EXPECT_TRUE(hasErrorContaining(result, "driverProfiles must be an array"));
    EXPECT_TRUE(hasErrorContaining(result, "duplicate device id: bot-1"));
    EXPECT_TRUE(hasErrorContaining(result, "devices[2]"));
}

TEST_F(ConfigManagerTest, LoadsFromFile) {
    std::string path = dir_.file("conveyor.json");
    {
        std::ofstream out(path);
        out << R"({"client": {"slicer": "Skeinforge", "driver": "File"}})";
    }

    EXPECT_TRUE(manager_.loadFromFile(path));
    EXPECT_EQ(manager_.configPath(), path);

    auto config = manager_.build();
    EXPECT_EQ(config.client.slicer, "Skeinforge");
    EXPECT_EQ(config.client.driver, "File");
}

TEST_F(ConfigManagerTest, MissingFileKeepsDefaults) {
    EXPECT_FALSE(manager_.loadFromFile(dir_.file("absent.json")));
    EXPECT_EQ(manager_.build().client.slicer, "MiracleGrue");
}

TEST_F(ConfigManagerTest, MalformedFileThrows) {
    std::string path = dir_.file("broken.json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(manager_.loadFromFile(path), core::types::ConfigurationException);
}
