#include "connector/models/rpc/RpcMessage.hpp"
#include "connector/registry/RpcDispatcher.hpp"

#include <gtest/gtest.h>

using connector::RpcDispatcher;
using connector::RpcException;
using connector::RpcSession;
namespace ErrorCode = connector::models::rpc::ErrorCode;

namespace {
    class FakeSession : public RpcSession {
    public:
        void setSubscribed(bool subscribed) override { subscribed_ = subscribed; }

        bool isSubscribed() const override { return subscribed_; }

        std::string peer() const override { return "test"; }

    private:
        bool subscribed_ = false;
    };
}

class RpcDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        dispatcher.registerHandler("echo", [](const nlohmann::json &params, RpcSession &) {
            return params;
        });
        dispatcher.registerHandler("fail", [](const nlohmann::json &, RpcSession &) -> nlohmann::json {
            throw RpcException(-32001, "Job not found: 9", {{"id", 9}});
        });
        dispatcher.registerHandler("typed", [](const nlohmann::json &params, RpcSession &) -> nlohmann::json {
            return params.at("count").get<int>() * 2;
        });
        dispatcher.registerHandler("crash", [](const nlohmann::json &, RpcSession &) -> nlohmann::json {
            throw std::runtime_error("boom");
        });
    }

    RpcDispatcher dispatcher;
    FakeSession session;
};

TEST_F(RpcDispatcherTest, ReturnsResultWithRequestId) {
    auto response = dispatcher.handle(std::string(R"({"jsonrpc":"2.0","id":7,"method":"echo","params":{"a":1}})"), session);
    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 7);
    EXPECT_EQ(response["result"]["a"], 1);
}

TEST_F(RpcDispatcherTest, StringIdsArePreserved) {
    auto response = dispatcher.handle(std::string(R"({"jsonrpc":"2.0","id":"abc","method":"echo","params":[1,2]})"), session);
    EXPECT_EQ(response["id"], "abc");
    EXPECT_EQ(response["result"], nlohmann::json::array({1, 2}));
}

TEST_F(RpcDispatcherTest, MalformedJsonIsParseError) {
    auto response = dispatcher.handle(std::string("{not json"), session);
    EXPECT_EQ(response["error"]["code"], ErrorCode::PARSE_ERROR);
    EXPECT_TRUE(response["id"].is_null());
}

TEST_F(RpcDispatcherTest, MissingMethodIsInvalidRequest) {
    auto response = dispatcher.handle(std::string(R"({"jsonrpc":"2.0","id":1})"), session);
    EXPECT_EQ(response["error"]["code"], ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(response["id"], 1);

    response = dispatcher.handle(std::string(R"({"jsonrpc":"2.0","id":2,"method":"echo","params":"text"})"), session);
    EXPECT_EQ(response["error"]["code"], ErrorCode::INVALID_REQUEST);

    response = dispatcher.handle(std::string("[1,2,3]"), session);
    EXPECT_EQ(response["error"]["code"], ErrorCode::INVALID_REQUEST);
}

TEST_F(RpcDispatcherTest, UnknownMethod) {
    auto response = dispatcher.handle(std::string(R"({"jsonrpc":"2.0","id":3,"method":"nope"})"), session);
    EXPECT_EQ(response["error"]["code"], ErrorCode::METHOD_NOT_FOUND);

    EXPECT_TRUE(dispatcher.handle(std::string(R"({"jsonrpc":"2.0","method":"nope"})"), session).is_null());
}

TEST_F(RpcDispatcherTest, HandlerErrorsCarryCodeAndData) {
    auto response = dispatcher.handle(std::string(R"({"jsonrpc":"2.0","id":4,"method":"fail"})"), session);
    EXPECT_EQ(response["error"]["code"], -32001);
    EXPECT_EQ(response["error"]["message"], "Job not found: 9");
    EXPECT_EQ(response["error"]["data"]["id"], 9);
    EXPECT_FALSE(response.contains("result"));
}

TEST_F(RpcDispatcherTest, BadParameterTypesAreInvalidParams) {
    auto response = dispatcher.handle(std::string(R"({"jsonrpc":"2.0","id":5,"method":"typed","params":{"count":"x"}})"),
                                      session);
    EXPECT_EQ(response["error"]["code"], ErrorCode::INVALID_PARAMS);

    response = dispatcher.handle(std::string(R"({"jsonrpc":"2.0","id":6,"method":"typed","params":{"count":21}})"), session);
    EXPECT_EQ(response["result"], 42);
}

TEST_F(RpcDispatcherTest, UnexpectedExceptionIsInternalError) {
    auto response = dispatcher.handle(std::string(R"({"jsonrpc":"2.0","id":8,"method":"crash"})"), session);
    EXPECT_EQ(response["error"]["code"], ErrorCode::INTERNAL_ERROR);
}

TEST_F(RpcDispatcherTest, NotificationsGetNoResponse) {
    EXPECT_TRUE(dispatcher.handle(std::string(R"({"jsonrpc":"2.0","method":"echo","params":{}})"), session).is_null());
    EXPECT_TRUE(dispatcher.handle(std::string(R"({"jsonrpc":"2.0","method":"fail"})"), session).is_null());
}

TEST_F(RpcDispatcherTest, ListsMethodsSorted) {
    EXPECT_EQ(dispatcher.methods(), (std::vector<std::string>{"crash", "echo", "fail", "typed"}));
    EXPECT_TRUE(dispatcher.hasMethod("echo"));
    EXPECT_FALSE(dispatcher.hasMethod("Echo"));
}
