#include "realtime/Protocol.h"

#include <boost/json.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace json = boost::json;
using namespace livestate;
using namespace livestate::realtime;

TEST(ProtocolTest, ParsesSubscribeAndUnsubscribe) {
    std::string error;
    auto sub = parse_client_frame(R"({"type":"subscribe","resource":"cart-42"})", error);
    ASSERT_TRUE(sub);
    EXPECT_EQ(sub->type, FrameType::Subscribe);
    EXPECT_EQ(sub->resource, "cart-42");

    auto unsub = parse_client_frame(R"({"resource":"cart-42","type":"unsubscribe"})", error);
    ASSERT_TRUE(unsub);
    EXPECT_EQ(unsub->type, FrameType::Unsubscribe);
    EXPECT_EQ(unsub->resource, "cart-42");
}

TEST(ProtocolTest, ParsesHeartbeatWithoutResource) {
    std::string error;
    auto hb = parse_client_frame(R"({"type":"heartbeat"})", error);
    ASSERT_TRUE(hb);
    EXPECT_EQ(hb->type, FrameType::Heartbeat);
    EXPECT_TRUE(hb->resource.empty());
}

TEST(ProtocolTest, RejectsMalformedFrames) {
    std::string error;
    EXPECT_FALSE(parse_client_frame("{not json", error));
    EXPECT_EQ(error, "invalid json");

    EXPECT_FALSE(parse_client_frame(R"(["subscribe"])", error));
    EXPECT_EQ(error, "missing type");

    EXPECT_FALSE(parse_client_frame(R"({"type":7})", error));
    EXPECT_EQ(error, "missing type");

    EXPECT_FALSE(parse_client_frame(R"({"type":"publish","resource":"a"})", error));
    EXPECT_EQ(error, "unknown type");

    EXPECT_FALSE(parse_client_frame(R"({"type":"subscribe"})", error));
    EXPECT_EQ(error, "missing resource");

    EXPECT_FALSE(parse_client_frame(R"({"type":"unsubscribe","resource":42})", error));
    EXPECT_EQ(error, "missing resource");
}

TEST(ProtocolTest, EncodesEventWithMillisecondTimestamp) {
    notify::ChangeEvent ev;
    ev.resource = "cart-42";
    ev.revision = 7;
    ev.payload = json::object{{"items", 2}};
    ev.timestamp = notify::ChangeEvent::Clock::time_point(std::chrono::milliseconds(1700000000123));

    json::value v = json::parse(encode_event(ev));
    const json::object& o = v.as_object();
    EXPECT_EQ(json::value_to<std::string>(o.at("type")), "event");
    EXPECT_EQ(json::value_to<std::string>(o.at("resource")), "cart-42");
    EXPECT_EQ(json::value_to<std::uint64_t>(o.at("revision")), 7u);
    EXPECT_EQ(o.at("payload"), (json::value(json::object{{"items", 2}})));
    EXPECT_EQ(json::value_to<std::int64_t>(o.at("timestamp")), 1700000000123);
}

TEST(ProtocolTest, EncodesControlFrames) {
    EXPECT_EQ(json::parse(encode_welcome("conn-1")), json::parse(R"({"type":"welcome","session":"conn-1"})"));
    EXPECT_EQ(json::parse(encode_subscribed("a")), json::parse(R"({"type":"subscribed","resource":"a"})"));
    EXPECT_EQ(json::parse(encode_unsubscribed("a")), json::parse(R"({"type":"unsubscribed","resource":"a"})"));
    EXPECT_EQ(json::parse(encode_heartbeat()), json::parse(R"({"type":"heartbeat"})"));
    EXPECT_EQ(json::parse(encode_error("invalid resource")),
              json::parse(R"({"type":"error","text":"invalid resource"})"));
}

TEST(ProtocolTest, EncodesSnapshot) {
    store::StoredDocument doc{"cart-42", 3, json::object{{"total", 10}}};
    EXPECT_EQ(json::parse(encode_snapshot(doc)),
              json::parse(R"({"type":"snapshot","resource":"cart-42","revision":3,"payload":{"total":10}})"));
}
