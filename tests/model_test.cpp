#include "shardline/models/factory.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace shardline;
using namespace shardline::models;
using namespace shardline::test;

TEST(ModelFactoryTest, ParsesUserWithDefaults) {
  ModelFactory factory;
  auto user = factory.parse_user(
      json_of(R"({"id":"80351110224678912","username":"nelly","bot":true})"));
  ASSERT_TRUE(user.has_value());
  EXPECT_EQ(user->id, Snowflake{80351110224678912});
  EXPECT_EQ(user->discriminator, "0");
  EXPECT_TRUE(user->bot);
  EXPECT_EQ(user->display_name(), "nelly");

  auto named = factory.parse_user(
      json_of(R"({"id":"1","username":"n","global_name":"Nelly"})"));
  ASSERT_TRUE(named.has_value());
  EXPECT_EQ(named->display_name(), "Nelly");

  EXPECT_FALSE(factory.parse_user(json_of(R"({"username":"x"})")).has_value());
  EXPECT_FALSE(factory.parse_user(json_of(R"({"id":"abc","username":"x"})"))
                   .has_value());
}

TEST(ModelFactoryTest, SnowflakesAcceptStringsAndNumbers) {
  EXPECT_EQ(parse_snowflake(json_of(R"("42")")), Snowflake{42});
  EXPECT_EQ(parse_snowflake(json_of("42")), Snowflake{42});
  EXPECT_FALSE(parse_snowflake(json_of("-1")).has_value());
  EXPECT_FALSE(parse_snowflake(json_of("true")).has_value());

  auto ids = get_snowflakes(json_of(R"({"roles":["1","x","3"]})"), "roles");
  EXPECT_EQ(ids, (std::vector<Snowflake>{Snowflake{1}, Snowflake{3}}));
}

TEST(ModelFactoryTest, ChannelKindsFromWireType) {
  ModelFactory factory;
  struct Case {
    const char *json;
    ChannelKind kind;
  };
  const Case cases[] = {
      {R"({"id":"1","type":0,"topic":"t","nsfw":true,"parent_id":"9"})",
       ChannelKind::Text},
      {R"({"id":"2","type":5})", ChannelKind::Text},
      {R"({"id":"3","type":2,"bitrate":96000,"user_limit":5})",
       ChannelKind::Voice},
      {R"({"id":"4","type":4,"name":"cat"})", ChannelKind::Category},
      {R"({"id":"5","type":1,"recipients":[{"id":"7","username":"u"}]})",
       ChannelKind::Direct},
      {R"({"id":"6","type":15})", ChannelKind::Unsupported},
  };
  for (const auto &c : cases) {
    auto channel = factory.parse_channel(json_of(c.json));
    ASSERT_TRUE(channel.has_value()) << c.json;
    EXPECT_EQ(channel->kind, c.kind) << c.json;
  }

  auto text = factory.parse_channel(json_of(cases[0].json));
  const auto &payload = std::get<TextChannel>(text->payload);
  EXPECT_EQ(payload.topic, "t");
  EXPECT_TRUE(payload.nsfw);
  EXPECT_EQ(text->parent_id(), Snowflake{9});
  EXPECT_TRUE(text->is_textual());

  auto dm = factory.parse_channel(json_of(cases[4].json));
  EXPECT_EQ(std::get<DirectChannel>(dm->payload).recipients.size(), 1u);
  EXPECT_TRUE(dm->is_textual());

  auto unsupported = factory.parse_channel(json_of(cases[5].json));
  EXPECT_EQ(std::get<UnsupportedChannel>(unsupported->payload).raw_type, 15);
  EXPECT_FALSE(unsupported->is_textual());

  EXPECT_FALSE(factory.parse_channel(json_of(R"({"id":"1"})")).has_value());
}

TEST(ModelFactoryTest, UnavailableGuildIsAStub) {
  ModelFactory factory;
  auto stub =
      factory.parse_guild(json_of(R"({"id":"100","unavailable":true})"));
  ASSERT_TRUE(stub.has_value());
  EXPECT_TRUE(stub->unavailable);
  EXPECT_TRUE(stub->name.empty());

  EXPECT_FALSE(factory.parse_guild(json_of(R"({"id":"100"})")).has_value());
}

TEST(ModelFactoryTest, GuildKeepsChannelIdsAndMembers) {
  ModelFactory factory;
  auto body = json_of(
      R"({"id":"1","name":"g","large":true,"member_count":3,"channels":[{"id":"10","type":0},{"id":"11","type":2}],"members":[{"user":{"id":"5","username":"a"},"nick":"A"},{"nick":"broken"}],"emojis":[{"id":"20","name":"e"},{"id":null,"name":"unicode"}]})");
  auto guild = factory.parse_guild(body);
  ASSERT_TRUE(guild.has_value());
  EXPECT_TRUE(guild->large);
  EXPECT_EQ(guild->channel_ids,
            (std::vector<Snowflake>{Snowflake{10}, Snowflake{11}}));
  ASSERT_EQ(guild->members.size(), 1u);
  ASSERT_NE(guild->find_member(Snowflake{5}), nullptr);
  EXPECT_EQ(guild->find_member(Snowflake{5})->display_name(), "A");
  EXPECT_EQ(guild->find_member(Snowflake{5})->guild_id, Snowflake{1});
  EXPECT_EQ(guild->emojis, (std::vector<CustomEmoji>{
                               CustomEmoji{.id = Snowflake{20}, .name = "e"}}));

  auto channels = factory.parse_guild_channels(body, guild->id);
  ASSERT_EQ(channels.size(), 2u);
  EXPECT_EQ(channels[1].guild_id, Snowflake{1});
}

TEST(ModelFactoryTest, UpgradeWrapsSharedSnapshot) {
  ModelFactory factory;
  auto user = factory.upgrade(User{.id = Snowflake{3}, .username = "x"});
  ASSERT_TRUE(static_cast<bool>(user));
  EXPECT_EQ(user.id(), Snowflake{3});
  EXPECT_EQ(user.client(), nullptr);

  auto copy = user;
  EXPECT_EQ(copy.snapshot().get(), user.snapshot().get());
  EXPECT_FALSE(static_cast<bool>(StatefulUser{}));
}
