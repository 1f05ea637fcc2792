#include "TestSupport.hpp"
#include "connector/controllers/JobController.hpp"
#include "connector/models/rpc/RpcMessage.hpp"
#include "connector/rpc/RpcClient.hpp"
#include "connector/rpc/RpcGateway.hpp"
#include "core/types/Error.hpp"
#include "fakes/FakeBackends.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using connector::address::Address;
using connector::rpc::RpcClient;
using connector::rpc::RpcGateway;
using testing_support::waitUntil;

class RpcGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::profile::SlicerProfile slicerProfile;
        slicerProfile.name = "MiracleGrue";
        core::profile::DriverProfile driverProfile;
        driverProfile.name = "MakerBotDriver";
        auto profiles = std::make_shared<core::profile::ProfileRegistry>(
                std::vector<core::profile::SlicerProfile>{slicerProfile},
                std::vector<core::profile::DriverProfile>{driverProfile});

        eventBus = std::make_shared<core::events::EventBus>();
        eventBus->start();

        core::orchestrator::OrchestratorConfig config;
        config.workDirectory = dir.file("work");
        orchestrator = std::make_shared<core::orchestrator::JobOrchestrator>(
                config, profiles,
                std::make_shared<fakes::FakeSlicerFactory>(std::make_shared<fakes::FakeSlicer>()),
                std::make_shared<fakes::FakeDriverFactory>(std::make_shared<fakes::FakeDriver>()),
                std::make_shared<core::device::DeviceRegistry>(), eventBus);
        ASSERT_TRUE(orchestrator->start());

        dispatcher = std::make_shared<connector::RpcDispatcher>();
        controller = std::make_unique<connector::controllers::JobController>(orchestrator);
        controller->registerMethods(*dispatcher);
    }

    void TearDown() override {
        if (gateway) {
            gateway->stop();
        }
        orchestrator->stop();
        eventBus->stop();
    }

    void startGateway(const Address &address) {
        gateway = std::make_unique<RpcGateway>(address, dispatcher, eventBus, 2);
        gateway->start();
    }

    Address tcpAddress() const {
        return Address::tcp("127.0.0.1", gateway->boundPort());
    }

    testing_support::TempDirectory dir;
    std::shared_ptr<core::events::EventBus> eventBus;
    std::shared_ptr<core::orchestrator::JobOrchestrator> orchestrator;
    std::shared_ptr<connector::RpcDispatcher> dispatcher;
    std::unique_ptr<connector::controllers::JobController> controller;
    std::unique_ptr<RpcGateway> gateway;
};

TEST_F(RpcGatewayTest, ServesRequestsOverTcp) {
    startGateway(Address::tcp("127.0.0.1", 0));
    ASSERT_NE(gateway->boundPort(), 0);

    RpcClient client(tcpAddress());
    client.connect();
    auto hello = client.call("hello");
    EXPECT_EQ(hello["server"], "conveyord");
    EXPECT_TRUE(waitUntil([&] { return gateway->connectionCount() == 1; }));

    client.close();
    EXPECT_TRUE(waitUntil([&] { return gateway->connectionCount() == 0; }));
}

TEST_F(RpcGatewayTest, ServesRequestsOverPipe) {
    std::string socketPath = dir.file("conveyord.socket");
    startGateway(Address::pipe(socketPath));
    EXPECT_EQ(gateway->boundPort(), 0);
    EXPECT_TRUE(std::filesystem::exists(socketPath));

    RpcClient client(Address::pipe(socketPath));
    client.connect();
    EXPECT_TRUE(client.call("listProfiles").contains("slicers"));
    client.close();

    gateway->stop();
    EXPECT_FALSE(std::filesystem::exists(socketPath));
}

TEST_F(RpcGatewayTest, ErrorResponsesBecomeExceptions) {
    startGateway(Address::tcp("127.0.0.1", 0));
    RpcClient client(tcpAddress());
    client.connect();

    try {
        client.call("status", {{"id", 404}});
        FAIL() << "expected RpcException";
    } catch (const connector::RpcException &e) {
        EXPECT_EQ(e.code(), connector::models::rpc::ErrorCode::JOB_NOT_FOUND);
    }

    try {
        client.call("frobnicate");
        FAIL() << "expected RpcException";
    } catch (const connector::RpcException &e) {
        EXPECT_EQ(e.code(), connector::models::rpc::ErrorCode::METHOD_NOT_FOUND);
    }
    EXPECT_TRUE(client.isConnected());
}

TEST_F(RpcGatewayTest, SubscribersReceiveJobEventsInOrder) {
    startGateway(Address::tcp("127.0.0.1", 0));
    RpcClient watcher(tcpAddress());
    watcher.connect();
    watcher.call("subscribe");

    RpcClient submitter(tcpAddress());
    submitter.connect();
    auto job = submitter.call("submit", {{"model", "part.stl"}, {"slicer", "MiracleGrue"},
                                         {"driver", "MakerBotDriver"}, {"device", "bot-1"}});
    auto jobId = job["id"].get<int64_t>();

    std::vector<std::string> states;
    uint64_t lastSequence = 0;
    for (int i = 0; i < 200 && (states.empty() || states.back() != "Completed"); ++i) {
        auto notification = watcher.readNotification();
        ASSERT_TRUE(notification.has_value());
        EXPECT_EQ((*notification)["method"], "jobchanged");

        const auto &params = (*notification)["params"];
        EXPECT_EQ(params["jobId"], jobId);
        auto sequence = params["sequence"].get<uint64_t>();
        EXPECT_GT(sequence, lastSequence);
        lastSequence = sequence;

        if (params["type"] == "stateChanged") {
            states.push_back(params["newState"].get<std::string>());
        }
    }

    EXPECT_EQ(states, (std::vector<std::string>{"Created", "Slicing", "Queued", "Printing", "Completed"}));
}

TEST_F(RpcGatewayTest, UnsubscribedClientsGetNoNotifications) {
    startGateway(Address::tcp("127.0.0.1", 0));
    RpcClient client(tcpAddress());
    client.connect();

    auto job = client.call("submit", {{"model", "part.stl"}, {"slicer", "MiracleGrue"},
                                      {"driver", "MakerBotDriver"}, {"device", "bot-1"}});
    ASSERT_TRUE(waitUntil([&] {
        return client.call("status", {{"id", job["id"]}})["state"] == "Completed";
    }));

    gateway->stop();
    EXPECT_FALSE(client.readNotification().has_value());
}

TEST_F(RpcGatewayTest, ConnectFailsWithoutServer) {
    RpcClient client(Address::pipe(dir.file("nobody-listens.socket")));
    EXPECT_THROW(client.connect(), core::types::ConveyorException);
    EXPECT_FALSE(client.isConnected());
}

TEST_F(RpcGatewayTest, BindFailureIsReported) {
    startGateway(Address::tcp("127.0.0.1", 0));
    RpcGateway second(tcpAddress(), dispatcher, eventBus, 1);
    EXPECT_THROW(second.start(), core::types::ConveyorException);
}
