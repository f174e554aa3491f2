#include "shardline/event/parser.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <format>
#include <memory>
#include <string>

using namespace shardline;
using namespace shardline::event;
using namespace shardline::test;

namespace {

class ParserTest : public ::testing::Test {
protected:
  auto parse(std::string_view name, std::string_view payload,
             gateway::shard_id shard = 0) -> std::vector<DispatchedEvent> {
    gateway::GatewayDispatch dispatch{
        .shard = shard,
        .event_name = std::string(name),
        .sequence = ++seq_,
        .payload = std::make_shared<const JsonValue>(json_of(payload))};
    return parser_.parse(dispatch);
  }

  static auto guild_json(std::uint64_t id, std::string_view extra = "")
      -> std::string {
    return std::format(
        R"({{"id":"{}","name":"g{}","member_count":1,"channels":[{{"id":"{}","type":0,"name":"general"}}],"members":[{{"user":{{"id":"7","username":"alice"}},"nick":"al","roles":[]}}]{}}})",
        id, id, id * 10, extra);
  }

  cache::ObjectCache cache_;
  models::ModelFactory factory_;
  EventParser parser_{cache_, factory_};
  std::int64_t seq_{0};
};


} // namespace

TEST_F(ParserTest, ReadyStartsStreamingAndGuildsFinishIt) {
  auto ready = parse(
      "READY",
      R"({"session_id":"s","user":{"id":"1","username":"bot"},"guilds":[{"id":"100","unavailable":true},{"id":"200","unavailable":true}]})");
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<Connected>(ready[0]));
  EXPECT_EQ(cache_.guild_count(), 2u);
  EXPECT_TRUE(cache_.has_guild(Snowflake{100}));
  EXPECT_FALSE(cache_.available_guild(Snowflake{100}).has_value());
  EXPECT_TRUE(cache_.user(Snowflake{1}).has_value());

  auto first = parse("GUILD_CREATE", guild_json(100));
  ASSERT_EQ(first.size(), 1u);
  ASSERT_TRUE(std::holds_alternative<GuildStreamed>(first[0]));
  EXPECT_EQ(std::get<GuildStreamed>(first[0]).guild->name, "g100");

  auto second = parse("GUILD_CREATE", guild_json(200));
  ASSERT_EQ(second.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<GuildStreamed>(second[0]));
  EXPECT_TRUE(std::holds_alternative<ShardReady>(second[1]));
  EXPECT_TRUE(cache_.startup_done(0));

  // Channels and members land in the cache.
  auto channel = cache_.channel(Snowflake{2000});
  ASSERT_TRUE(channel.has_value());
  EXPECT_EQ((*channel)->guild_id, Snowflake{200});
  EXPECT_TRUE(cache_.user(Snowflake{7}).has_value());
}

TEST_F(ParserTest, GuildInOutageAtStartupStillCompletesStreaming) {
  (void)parse(
      "READY",
      R"({"session_id":"s","guilds":[{"id":"110","unavailable":true},{"id":"120","unavailable":true}]})");

  auto streamed = parse("GUILD_CREATE", guild_json(110));
  ASSERT_EQ(streamed.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<GuildStreamed>(streamed[0]));

  auto outage =
      parse("GUILD_CREATE", R"({"id":"120","unavailable":true})");
  ASSERT_EQ(outage.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<ShardReady>(outage[0]));
  EXPECT_TRUE(cache_.startup_done(0));
  EXPECT_TRUE(cache_.has_guild(Snowflake{120}));
  EXPECT_FALSE(cache_.available_guild(Snowflake{120}).has_value());

  // The guild's return after startup reads as it coming back online.
  auto back = parse("GUILD_CREATE", guild_json(120));
  ASSERT_EQ(back.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<GuildAvailable>(back[0]));
}

TEST_F(ParserTest, ReadyWithoutGuildsIsImmediatelyReady) {
  auto ready = parse("READY", R"({"session_id":"s","guilds":[]})", 3);
  ASSERT_EQ(ready.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<Connected>(ready[0]));
  EXPECT_TRUE(std::holds_alternative<ShardReady>(ready[1]));
  EXPECT_TRUE(cache_.startup_done(3));

  // A second READY after a fresh identify does not repeat ShardReady.
  auto again = parse("READY", R"({"session_id":"t","guilds":[]})", 3);
  ASSERT_EQ(again.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<Connected>(again[0]));
}

TEST_F(ParserTest, JoinedAvailableAndOutage) {
  (void)parse("READY", R"({"session_id":"s","guilds":[]})");

  auto joined = parse("GUILD_CREATE", guild_json(300));
  ASSERT_EQ(joined.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<GuildJoined>(joined[0]));

  auto outage = parse("GUILD_DELETE", R"({"id":"300","unavailable":true})");
  EXPECT_TRUE(outage.empty());
  EXPECT_TRUE(cache_.has_guild(Snowflake{300}));
  EXPECT_FALSE(cache_.available_guild(Snowflake{300}).has_value());

  auto back = parse("GUILD_CREATE", guild_json(300));
  ASSERT_EQ(back.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<GuildAvailable>(back[0]));

  auto left = parse("GUILD_DELETE", R"({"id":"300"})");
  EXPECT_TRUE(left.empty());
  EXPECT_FALSE(cache_.has_guild(Snowflake{300}));
  EXPECT_FALSE(cache_.channel(Snowflake{3000}).has_value());
}

TEST_F(ParserTest, HeldSnapshotIsNotMutatedByLaterUpdates) {
  (void)parse("READY", R"({"session_id":"s","guilds":[]})");
  auto joined = parse("GUILD_CREATE", guild_json(400));
  ASSERT_EQ(joined.size(), 1u);
  auto held = std::get<GuildJoined>(joined[0]).guild;
  EXPECT_EQ(held->members.size(), 1u);

  auto added = parse(
      "GUILD_MEMBER_ADD",
      R"({"guild_id":"400","user":{"id":"8","username":"bob"},"roles":[]})");
  ASSERT_EQ(added.size(), 1u);
  const auto &add = std::get<GuildMemberAdd>(added[0]);
  EXPECT_EQ(add.member.display_name(), "bob");
  EXPECT_EQ(add.guild->members.size(), 2u);
  EXPECT_EQ(add.guild->member_count, 2);

  EXPECT_EQ(held->members.size(), 1u);
  EXPECT_EQ(held->member_count, 1);
  EXPECT_EQ((*cache_.guild(Snowflake{400}))->members.size(), 2u);
}

TEST_F(ParserTest, MemberUpdateAndRemoveReportCachedState) {
  (void)parse("READY", R"({"session_id":"s","guilds":[]})");
  (void)parse("GUILD_CREATE", guild_json(500));

  auto updated = parse(
      "GUILD_MEMBER_UPDATE",
      R"({"guild_id":"500","user":{"id":"7","username":"alice"},"nick":"ally","roles":["9"]})");
  ASSERT_EQ(updated.size(), 1u);
  const auto &upd = std::get<GuildMemberUpdate>(updated[0]);
  ASSERT_TRUE(upd.old_member.has_value());
  EXPECT_EQ(upd.old_member->nick, "al");
  EXPECT_EQ(upd.member.nick, "ally");
  EXPECT_EQ(upd.member.roles, std::vector<Snowflake>{Snowflake{9}});

  auto removed = parse(
      "GUILD_MEMBER_REMOVE",
      R"({"guild_id":"500","user":{"id":"7","username":"alice"}})");
  ASSERT_EQ(removed.size(), 1u);
  const auto &rem = std::get<GuildMemberRemove>(removed[0]);
  ASSERT_TRUE(rem.cached_member.has_value());
  EXPECT_EQ(rem.cached_member->nick, "ally");
  ASSERT_TRUE(rem.guild.has_value());
  EXPECT_EQ((*rem.guild)->find_member(Snowflake{7}), nullptr);
}

TEST_F(ParserTest, MessagesResolveCachedChannel) {
  (void)parse("READY", R"({"session_id":"s","guilds":[]})");
  (void)parse("GUILD_CREATE", guild_json(600));

  auto created = parse(
      "MESSAGE_CREATE",
      R"({"id":"1","channel_id":"6000","guild_id":"600","author":{"id":"7","username":"alice"},"content":"hello","member":{"nick":"al","roles":[]},"mentions":[{"id":"8","username":"bob"}]})");
  ASSERT_EQ(created.size(), 1u);
  const auto &msg = std::get<MessageCreate>(created[0]);
  EXPECT_EQ(msg.message->content, "hello");
  ASSERT_TRUE(msg.message->member.has_value());
  EXPECT_EQ(msg.message->member->display_name(), "al");
  EXPECT_EQ(msg.message->mention_ids, std::vector<Snowflake>{Snowflake{8}});
  ASSERT_TRUE(msg.channel.has_value());
  EXPECT_EQ((*msg.channel)->name, "general");

  auto dm = parse(
      "MESSAGE_CREATE",
      R"({"id":"2","channel_id":"999","author":{"id":"7","username":"alice"},"content":"psst"})");
  ASSERT_EQ(dm.size(), 1u);
  EXPECT_FALSE(std::get<MessageCreate>(dm[0]).channel.has_value());
}

TEST_F(ParserTest, BulkDeleteIsOneEventInPayloadOrder) {
  auto events = parse("MESSAGE_DELETE_BULK",
                      R"({"ids":["3","1","2"],"channel_id":"10"})");
  ASSERT_EQ(events.size(), 1u);
  const auto &bulk = std::get<MessageBulkDelete>(events[0]);
  EXPECT_EQ(bulk.messages,
            (std::vector<Snowflake>{Snowflake{3}, Snowflake{1}, Snowflake{2}}));
  EXPECT_EQ(bulk.channel_id, Snowflake{10});

  auto singles = bulk.as_single_events();
  ASSERT_EQ(singles.size(), 3u);
  EXPECT_EQ(singles[0].message_id, Snowflake{3});
  EXPECT_EQ(singles[2].channel_id, Snowflake{10});
}

TEST_F(ParserTest, ChannelLifecycleKeepsGuildIndexInSync) {
  (void)parse("READY", R"({"session_id":"s","guilds":[]})");
  (void)parse("GUILD_CREATE", guild_json(700));

  auto created = parse(
      "CHANNEL_CREATE",
      R"({"id":"71","type":2,"guild_id":"700","name":"voice","bitrate":64000})");
  ASSERT_EQ(created.size(), 1u);
  EXPECT_EQ(std::get<ChannelCreate>(created[0]).channel->kind,
            models::ChannelKind::Voice);
  auto ids = (*cache_.guild(Snowflake{700}))->channel_ids;
  EXPECT_NE(std::ranges::find(ids, Snowflake{71}), ids.end());

  auto updated = parse(
      "CHANNEL_UPDATE",
      R"({"id":"71","type":2,"guild_id":"700","name":"loud"})");
  ASSERT_EQ(updated.size(), 1u);
  const auto &upd = std::get<ChannelUpdate>(updated[0]);
  ASSERT_TRUE(upd.old_channel.has_value());
  EXPECT_EQ((*upd.old_channel)->name, "voice");
  EXPECT_EQ(upd.new_channel->name, "loud");

  auto deleted =
      parse("CHANNEL_DELETE", R"({"id":"71","type":2,"guild_id":"700"})");
  ASSERT_EQ(deleted.size(), 1u);
  EXPECT_EQ(std::get<ChannelDelete>(deleted[0]).channel->name, "loud");
  EXPECT_FALSE(cache_.channel(Snowflake{71}).has_value());
  ids = (*cache_.guild(Snowflake{700}))->channel_ids;
  EXPECT_EQ(std::ranges::find(ids, Snowflake{71}), ids.end());
}

TEST_F(ParserTest, MemberChunkForUnknownGuild) {
  auto events = parse(
      "GUILD_MEMBERS_CHUNK",
      R"({"guild_id":"800","members":[],"chunk_index":0,"chunk_count":1})");
  ASSERT_EQ(events.size(), 1u);
  ASSERT_TRUE(std::holds_alternative<InvalidGuildChunk>(events[0]));
  EXPECT_EQ(std::get<InvalidGuildChunk>(events[0]).guild_id, Snowflake{800});
}

TEST_F(ParserTest, MemberChunkMergesMembers) {
  (void)parse("READY", R"({"session_id":"s","guilds":[]})");
  (void)parse("GUILD_CREATE", guild_json(900));
  auto events = parse(
      "GUILD_MEMBERS_CHUNK",
      R"({"guild_id":"900","members":[{"user":{"id":"11","username":"c"}},{"user":{"id":"12","username":"d"}}],"chunk_index":0,"chunk_count":2,"nonce":"n"})");
  ASSERT_EQ(events.size(), 1u);
  const auto &chunk = std::get<GuildMemberChunk>(events[0]);
  EXPECT_EQ(chunk.members.size(), 2u);
  EXPECT_EQ(chunk.chunk_count, 2);
  EXPECT_EQ(chunk.nonce, "n");
  EXPECT_EQ(chunk.guild->members.size(), 3u);
  EXPECT_TRUE(cache_.user(Snowflake{12}).has_value());
}

TEST_F(ParserTest, EmojiUpdateReportsPreviousSet) {
  (void)parse("READY", R"({"session_id":"s","guilds":[]})");
  (void)parse("GUILD_CREATE",
              guild_json(1000, R"(,"emojis":[{"id":"5","name":"old"}])"));
  auto events = parse(
      "GUILD_EMOJIS_UPDATE",
      R"({"guild_id":"1000","emojis":[{"id":"6","name":"new","animated":true}]})");
  ASSERT_EQ(events.size(), 1u);
  const auto &upd = std::get<GuildEmojiUpdate>(events[0]);
  ASSERT_EQ(upd.previous_emojis.size(), 1u);
  EXPECT_EQ(upd.previous_emojis[0].name, "old");
  ASSERT_EQ(upd.new_emojis.size(), 1u);
  EXPECT_TRUE(upd.new_emojis[0].animated);
}

TEST_F(ParserTest, UnknownAndMalformedDispatchesProduceNothing) {
  EXPECT_FALSE(EventParser::is_known("TYPING_START"));
  EXPECT_TRUE(parse("TYPING_START", R"({"channel_id":"1"})").empty());

  EXPECT_TRUE(parse("MESSAGE_CREATE", R"({"id":"1"})").empty());
  EXPECT_TRUE(parse("GUILD_CREATE", R"({"name":"no id"})").empty());
  EXPECT_EQ(cache_.guild_count(), 0u);

  // A member add for a guild the cache never saw.
  EXPECT_TRUE(parse("GUILD_MEMBER_ADD",
                    R"({"guild_id":"1","user":{"id":"2","username":"x"}})")
                  .empty());
}
