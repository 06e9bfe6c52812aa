#include "protocol/MessageCodec.hpp"

#include <gtest/gtest.h>

using uai::protocol::MessageCodec;

TEST(MessageCodecTest, RequestCarriesIdMethodAndParams) {
    auto line = MessageCodec::makeRequest(3, "move.to", {{"targetID", "4"}, {"position", 50}});
    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["id"], 3);
    EXPECT_EQ(j["method"], "move.to");
    EXPECT_EQ(j["params"]["targetID"], "4");
    EXPECT_EQ(j["params"]["position"], 50);
    EXPECT_EQ(line.find('\r'), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(MessageCodecTest, NullParamsBecomeEmptyObject) {
    auto j = nlohmann::json::parse(MessageCodec::makeRequest(1, "status.info", nullptr));
    EXPECT_TRUE(j["params"].is_object());
    EXPECT_TRUE(j["params"].empty());
}

TEST(MessageCodecTest, ParsesResultAndError) {
    auto ok = MessageCodec::parse("{\"id\":1,\"result\":{\"name\":\"Kitchen\"}}");
    ASSERT_TRUE(ok.valid);
    EXPECT_EQ(ok.id, 1);
    EXPECT_FALSE(ok.isError);
    EXPECT_EQ(ok.payload["name"], "Kitchen");

    auto err = MessageCodec::parse("{\"id\":7,\"error\":\"busy\"}");
    ASSERT_TRUE(err.valid);
    EXPECT_EQ(err.id, 7);
    EXPECT_TRUE(err.isError);
    EXPECT_EQ(err.payload, "busy");
}

TEST(MessageCodecTest, NullResultIsStillAResult) {
    auto r = MessageCodec::parse("{\"id\":2,\"result\":null}");
    ASSERT_TRUE(r.valid);
    EXPECT_FALSE(r.isError);
    EXPECT_TRUE(r.payload.is_null());
}

TEST(MessageCodecTest, RejectsLinesOfNeitherShape) {
    EXPECT_FALSE(MessageCodec::parse("").valid);
    EXPECT_FALSE(MessageCodec::parse("not json").valid);
    EXPECT_FALSE(MessageCodec::parse("[1,2]").valid);
    EXPECT_FALSE(MessageCodec::parse("{\"result\":1}").valid);
    EXPECT_FALSE(MessageCodec::parse("{\"id\":\"1\",\"result\":1}").valid);
    EXPECT_FALSE(MessageCodec::parse("{\"id\":1}").valid);
    EXPECT_FALSE(MessageCodec::parse("{\"id\":1.5,\"result\":1}").valid);

    auto r = MessageCodec::parse("garbage");
    EXPECT_EQ(r.raw, "garbage");
}
