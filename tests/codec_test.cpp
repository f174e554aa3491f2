#include "shardline/gateway/codec.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace shardline;
using namespace shardline::gateway;
using namespace shardline::test;

TEST(CodecTest, DecodesDispatchEnvelope) {
  auto frame = decode_frame(
      R"({"op":0,"s":42,"t":"MESSAGE_CREATE","d":{"id":"1","content":"hi"}})");
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->op, Opcode::Dispatch);
  EXPECT_EQ(frame->sequence, 42);
  EXPECT_EQ(frame->event_name, "MESSAGE_CREATE");
  ASSERT_NE(frame->data, nullptr);
  EXPECT_EQ(json::get_string(*frame->data, "content"), "hi");
}

TEST(CodecTest, DecodesControlFrames) {
  auto hello = decode_frame(R"({"op":10,"d":{"heartbeat_interval":41250}})");
  ASSERT_TRUE(hello.has_value());
  EXPECT_EQ(hello->op, Opcode::Hello);
  EXPECT_FALSE(hello->sequence.has_value());
  EXPECT_EQ(json::get_int(*hello->data, "heartbeat_interval"), 41250);

  auto invalid = decode_frame(R"({"op":9,"d":true,"s":null,"t":null})");
  ASSERT_TRUE(invalid.has_value());
  EXPECT_EQ(invalid->op, Opcode::InvalidSession);
  EXPECT_FALSE(invalid->event_name.has_value());
  ASSERT_NE(std::get_if<bool>(&invalid->data->data), nullptr);
  EXPECT_TRUE(std::get<bool>(invalid->data->data));

  auto ack = decode_frame(R"({"op":11})");
  ASSERT_TRUE(ack.has_value());
  EXPECT_EQ(ack->op, Opcode::HeartbeatAck);
  EXPECT_TRUE(ack->data->is_null());
}

TEST(CodecTest, RejectsMalformedFrames) {
  EXPECT_EQ(decode_frame("not json").error(), Error::ParseError);
  EXPECT_EQ(decode_frame("[1,2]").error(), Error::ProtocolError);
  EXPECT_EQ(decode_frame(R"({"d":{}})").error(), Error::ProtocolError);
  EXPECT_EQ(decode_frame(R"({"op":5})").error(), Error::ProtocolError);
}

TEST(CodecTest, EncodesIdentify) {
  auto text = encode(Identify{.token = "secret",
                              .shard = {.id = 1, .count = 4},
                              .intents = 513,
                              .large_threshold = 100},
                     ClientProperties{.os = "linux"});
  ASSERT_TRUE(text.has_value());
  auto v = json_of(*text);
  EXPECT_EQ(json::get_int(v, "op"), 2);
  const auto *d = json::get_object(v, "d");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(json::get_string(*d, "token"), "secret");
  EXPECT_EQ(json::get_int(*d, "intents"), 513);
  EXPECT_EQ(json::get_int(*d, "large_threshold"), 100);
  const auto *shard = json::get_array(*d, "shard");
  ASSERT_NE(shard, nullptr);
  ASSERT_EQ(shard->size(), 2u);
  EXPECT_EQ(json::as_int((*shard)[0]), 1);
  EXPECT_EQ(json::as_int((*shard)[1]), 4);
  const auto *props = json::get_object(*d, "properties");
  ASSERT_NE(props, nullptr);
  EXPECT_EQ(json::get_string(*props, "os"), "linux");
}

TEST(CodecTest, EncodesResume) {
  auto text = encode(Resume{.token = "t", .session_id = "abc", .sequence = 7});
  ASSERT_TRUE(text.has_value());
  auto v = json_of(*text);
  EXPECT_EQ(json::get_int(v, "op"), 6);
  const auto *d = json::get_object(v, "d");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(json::get_string(*d, "session_id"), "abc");
  EXPECT_EQ(json::get_int(*d, "seq"), 7);
}

TEST(CodecTest, HeartbeatCarriesNullBeforeFirstDispatch) {
  auto first = encode(Heartbeat{});
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, R"({"op":1,"d":null})");

  auto later = encode(Heartbeat{std::int64_t{12}});
  ASSERT_TRUE(later.has_value());
  EXPECT_EQ(*later, R"({"op":1,"d":12})");
}

TEST(CodecTest, EncodesMemberRequestWithStringIds) {
  MemberChunkRequest req{.guild_id = Snowflake{81384788765712384}};
  req.user_ids = {Snowflake{1}, Snowflake{2}};
  req.nonce = "n1";
  auto text = encode(req);
  ASSERT_TRUE(text.has_value());
  auto v = json_of(*text);
  EXPECT_EQ(json::get_int(v, "op"), 8);
  const auto *d = json::get_object(v, "d");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(json::get_string(*d, "guild_id"), "81384788765712384");
  const auto *ids = json::get_array(*d, "user_ids");
  ASSERT_NE(ids, nullptr);
  ASSERT_EQ(ids->size(), 2u);
  EXPECT_EQ(std::get<std::string>((*ids)[1].data), "2");
  EXPECT_EQ(json::get_string(*d, "nonce"), "n1");
}

TEST(CodecTest, MemberRequestValidation) {
  MemberChunkRequest empty{.guild_id = Snowflake{1}};
  EXPECT_EQ(encode(empty).error(), Error::InvalidArgument);

  MemberChunkRequest no_limit{.guild_id = Snowflake{1}, .query = "ab"};
  EXPECT_EQ(no_limit.validate().error(), Error::InvalidArgument);

  MemberChunkRequest long_nonce{.guild_id = Snowflake{1}, .query = "", .limit = 0};
  long_nonce.nonce = std::string(33, 'x');
  EXPECT_FALSE(long_nonce.validate().has_value());

  MemberChunkRequest all{.guild_id = Snowflake{1}, .query = "", .limit = 0};
  EXPECT_TRUE(all.validate().has_value());
}

TEST(CodecTest, CallerMayOnlySubmitMemberRequests) {
  EXPECT_FALSE(validate_user_event(Identify{}).has_value());
  EXPECT_FALSE(validate_user_event(Resume{}).has_value());
  EXPECT_FALSE(validate_user_event(Heartbeat{}).has_value());
  EXPECT_TRUE(validate_user_event(MemberChunkRequest{
                  .guild_id = Snowflake{1}, .query = "", .limit = 0})
                  .has_value());
}
