/**
 * json_rpc_test.cpp - JSON-RPC encoding and message classification tests
 *
 * Tests:
 * - Call encoding (params present / omitted)
 * - Decoding rejects malformed and non-object lines
 * - Id and event tag extraction
 * - Classification: response, event, event with unknown id, anomaly
 */

#include <gtest/gtest.h>

#include <set>

#include "rpc/json_rpc.hpp"
#include "rpc/message_classifier.hpp"

using namespace guidelink::rpc;
using nlohmann::json;

// ============================================================================
// Encoding / decoding
// ============================================================================

TEST(JsonRpcTest, EncodeCallWithParams) {
    auto line = encode_call(7, "set_paused", json::array({true}));
    auto msg = json::parse(line);

    EXPECT_EQ(msg["jsonrpc"], "2.0");
    EXPECT_EQ(msg["method"], "set_paused");
    EXPECT_EQ(msg["params"], json::array({true}));
    EXPECT_EQ(msg["id"], 7);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(JsonRpcTest, EncodeCallOmitsNullParams) {
    auto msg = json::parse(encode_call(1, "get_app_state", nullptr));

    EXPECT_FALSE(msg.contains("params"));
    EXPECT_EQ(msg["id"], 1);
}

TEST(JsonRpcTest, DecodeRejectsMalformedJson) {
    json out;
    std::string error;

    EXPECT_FALSE(decode_message("{\"Event\":", out, error));
    EXPECT_NE(error.find("Invalid JSON"), std::string::npos);
}

TEST(JsonRpcTest, DecodeRejectsNonObject) {
    json out;
    std::string error;

    EXPECT_FALSE(decode_message("[1,2,3]", out, error));
    EXPECT_EQ(error, "Message is not a JSON object");
}

TEST(JsonRpcTest, MessageIdAcceptsOnlyNonNegativeIntegers) {
    EXPECT_EQ(message_id(json{{"id", 42}}), 42u);
    EXPECT_FALSE(message_id(json{{"id", -1}}).has_value());
    EXPECT_FALSE(message_id(json{{"id", "42"}}).has_value());
    EXPECT_FALSE(message_id(json{{"result", 0}}).has_value());
}

TEST(JsonRpcTest, EventNameRequiresStringTag) {
    EXPECT_EQ(event_name(json{{"Event", "StarLost"}}), "StarLost");
    EXPECT_FALSE(event_name(json{{"Event", 3}}).has_value());
    EXPECT_FALSE(event_name(json{{"jsonrpc", "2.0"}}).has_value());
}

// ============================================================================
// Classification
// ============================================================================

class MessageClassifierTest : public ::testing::Test {
protected:
    std::set<uint64_t> outstanding_;
    MessageClassifier classifier_{[this](uint64_t id) { return outstanding_.count(id) > 0; }};
};

TEST_F(MessageClassifierTest, OutstandingIdIsResponse) {
    outstanding_.insert(5);
    auto c = classifier_.classify(json{{"jsonrpc", "2.0"}, {"result", 0}, {"id", 5}});

    EXPECT_EQ(c.kind, MessageKind::RESPONSE);
    EXPECT_EQ(c.id, 5u);
    EXPECT_FALSE(c.unknown_id);
}

TEST_F(MessageClassifierTest, TaggedMessageIsEvent) {
    auto c = classifier_.classify(json{{"Event", "GuideStep"}, {"Frame", 1}});

    EXPECT_EQ(c.kind, MessageKind::EVENT);
    EXPECT_EQ(c.event, "GuideStep");
    EXPECT_FALSE(c.id.has_value());
}

TEST_F(MessageClassifierTest, OutstandingIdWinsOverEventTag) {
    outstanding_.insert(9);
    auto c = classifier_.classify(json{{"Event", "Alert"}, {"id", 9}});

    EXPECT_EQ(c.kind, MessageKind::RESPONSE);
}

TEST_F(MessageClassifierTest, TaggedMessageWithUnknownIdIsFlaggedEvent) {
    auto c = classifier_.classify(json{{"Event", "Alert"}, {"id", 99}});

    EXPECT_EQ(c.kind, MessageKind::EVENT);
    EXPECT_TRUE(c.unknown_id);
}

TEST_F(MessageClassifierTest, LateResponseIsAnomaly) {
    auto c = classifier_.classify(json{{"jsonrpc", "2.0"}, {"result", 0}, {"id", 3}});

    EXPECT_EQ(c.kind, MessageKind::ANOMALY);
    EXPECT_TRUE(c.unknown_id);
    EXPECT_STREQ(message_kind_to_string(c.kind), "ANOMALY");
}

TEST_F(MessageClassifierTest, UntaggedMessageWithoutIdIsAnomaly) {
    auto c = classifier_.classify(json{{"hello", "world"}});

    EXPECT_EQ(c.kind, MessageKind::ANOMALY);
    EXPECT_FALSE(c.id.has_value());
}
