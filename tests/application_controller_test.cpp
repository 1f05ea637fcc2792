#include "TestSupport.hpp"
#include "application/controllers/ApplicationController.hpp"
#include "connector/rpc/RpcClient.hpp"
#include "fakes/FakeBackends.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using connector::address::Address;
using testing_support::waitUntil;

class ApplicationControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::profile::SlicerProfile slicerProfile;
        slicerProfile.name = "MiracleGrue";
        core::profile::DriverProfile driverProfile;
        driverProfile.name = "MakerBotDriver";

        config.address = Address::pipe(dir.file("conveyord.socket"));
        config.workDirectory = dir.file("work");
        config.server.eventThreads = 2;
        config.server.rpcThreads = 1;
        config.slicerProfiles = {slicerProfile};
        config.driverProfiles = {driverProfile};
        config.devices = {{"bot-1", "/dev/ttyACM0", 0}};
    }

    std::unique_ptr<ApplicationController> makeController() {
        return std::make_unique<ApplicationController>(
                config,
                std::make_shared<fakes::FakeSlicerFactory>(slicer),
                std::make_shared<fakes::FakeDriverFactory>(driver));
    }

    testing_support::TempDirectory dir;
    core::config::ConveyorConfig config;
    std::shared_ptr<fakes::FakeSlicer> slicer = std::make_shared<fakes::FakeSlicer>();
    std::shared_ptr<fakes::FakeDriver> driver = std::make_shared<fakes::FakeDriver>();
};

TEST_F(ApplicationControllerTest, RunsJobThroughGateway) {
    auto controller = makeController();
    ASSERT_TRUE(controller->initialize());
    EXPECT_TRUE(controller->isRunning());
    ASSERT_TRUE(controller->gateway());
    EXPECT_TRUE(std::filesystem::exists(config.address.path));

    connector::rpc::RpcClient client(config.address);
    client.connect();
    auto job = client.call("submit", {{"model", "part.stl"}, {"slicer", "MiracleGrue"},
                                      {"driver", "MakerBotDriver"}, {"device", "bot-1"}});
    auto jobId = job["id"].get<int64_t>();

    EXPECT_TRUE(waitUntil([&] {
        return client.call("status", {{"id", jobId}})["state"] == "Completed";
    }));
    EXPECT_EQ(slicer->calls.load(), 1);
    EXPECT_EQ(driver->printedJobs().size(), 1u);
    client.close();

    controller->shutdown();
    EXPECT_FALSE(controller->isRunning());
    EXPECT_FALSE(std::filesystem::exists(config.address.path));
}

TEST_F(ApplicationControllerTest, DuplicateProfilesFailInitialization) {
    config.slicerProfiles.push_back(config.slicerProfiles.front());

    auto controller = makeController();
    EXPECT_FALSE(controller->initialize());
    EXPECT_FALSE(controller->isRunning());
}

TEST_F(ApplicationControllerTest, UnusableAddressFailsInitialization) {
    config.address = Address::pipe(dir.file("missing/dir/conveyord.socket"));

    auto controller = makeController();
    EXPECT_FALSE(controller->initialize());
    controller->shutdown();
    EXPECT_FALSE(controller->isRunning());
}
