/**
 * @file test_rpc_connection.cpp
 * @brief Tests for value decoding and node lookup on the RPC gateway
 * @author DR Logger Test Team
 * @date 2026-10-19
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mock_collaborators.hpp"
#include "../cpp/include/rpc_connection.hpp"
#include "../cpp/include/http_client.hpp"
#include "../cpp/include/exceptions.hpp"

using namespace drLogger;
using namespace drLogger::testing_support;
using namespace testing;
using json = nlohmann::json;

// ============================================================================
// VALUE DECODING
// ============================================================================

TEST(QuantityFromJsonTest, PlainNumber_HasNoUnit) {
    Quantity q = quantityFromJson(json(4.2));

    EXPECT_DOUBLE_EQ(q.value, 4.2);
    EXPECT_EQ(q.unit, "");
}

TEST(QuantityFromJsonTest, ValueUnitObject) {
    Quantity q = quantityFromJson(json{{"value", 1.5e-6}, {"unit", "mbar"}});

    EXPECT_DOUBLE_EQ(q.value, 1.5e-6);
    EXPECT_EQ(q.unit, "mbar");
}

TEST(QuantityFromJsonTest, TimestampedTuple_TakesFirstElement) {
    Quantity q = quantityFromJson(json::array({json{{"value", 0.012}, {"unit", "K"}}, 1760000000.0}));

    EXPECT_DOUBLE_EQ(q.value, 0.012);
    EXPECT_EQ(q.unit, "K");
}

TEST(QuantityFromJsonTest, NotAQuantity_ThrowsRpcException) {
    EXPECT_THROW(quantityFromJson(json("4.2 K")), RpcException);
    EXPECT_THROW(quantityFromJson(json::array()), RpcException);
    EXPECT_THROW(quantityFromJson(json{{"unit", "K"}}), RpcException);
}

TEST(ReadingFromJsonTest, ListOfQuantities) {
    Reading reading = readingFromJson(json::array({1.0, json{{"value", 2.0}, {"unit", "K"}}}));

    ASSERT_EQ(reading.size(), 2u);
    EXPECT_DOUBLE_EQ(reading[0].value, 1.0);
    EXPECT_EQ(reading[1].unit, "K");
}

TEST(ReadingFromJsonTest, NonArray_ThrowsRpcException) {
    EXPECT_THROW(readingFromJson(json{{"value", 1.0}}), RpcException);
}

TEST(QuantityToJsonTest, WritesValueAndUnit) {
    EXPECT_EQ(quantityToJson(Quantity(24.7, "umol/s")), (json{{"value", 24.7}, {"unit", "umol/s"}}));
}

TEST(HttpResponseTest, Json_ParsesBodyOrThrowsRpcException) {
    HttpResponse ok;
    ok.status_code = 200;
    ok.body = R"(["node_dr", "lakeshore_diodes"])";
    EXPECT_EQ(ok.json().size(), 2u);
    EXPECT_TRUE(ok.isSuccess());

    HttpResponse broken;
    broken.status_code = 502;
    broken.body = "<html>Bad Gateway</html>";
    EXPECT_FALSE(broken.isSuccess());
    EXPECT_THROW(broken.json(), RpcException);
}

// ============================================================================
// NODE LOOKUP
// ============================================================================

class NodeLookupTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(directory_, listServers())
            .WillByDefault(Return(std::vector<std::string>{"manager", "node_dr", "lakeshore_diodes"}));
    }

    NiceMock<MockServerDirectory> directory_;
};

TEST_F(NodeLookupTest, RunningNode_MatchesCaseInsensitively) {
    EXPECT_TRUE(directory_.isNodeRunning("DR"));
    EXPECT_TRUE(directory_.isNodeRunning("dr"));
}

TEST_F(NodeLookupTest, AbsentNode_NotRunning) {
    EXPECT_FALSE(directory_.isNodeRunning("Jules"));
}

TEST_F(NodeLookupTest, DirectoryFailure_Propagates) {
    EXPECT_CALL(directory_, listServers()).WillOnce(Throw(HttpException("connection refused")));

    EXPECT_THROW(directory_.isNodeRunning("DR"), HttpException);
}
