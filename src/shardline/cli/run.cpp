#include "shardline/cli/commands.hpp"
#include "shardline/client/client.hpp"
#include "shardline/config/config.hpp"
#include "shardline/core/runtime.hpp"
#include "shardline/util/log.hpp"
#include "shardline/util/signals.hpp"

#include <boost/asio/use_future.hpp>

#include <format>
#include <print>
#include <string>
#include <utility>
#include <variant>

namespace shardline::cli {
namespace {

constexpr std::size_t kPreviewLength = 80;

auto preview(std::string_view text) -> std::string {
  if (text.size() <= kPreviewLength) {
    return std::string(text);
  }
  return std::format("{}...", text.substr(0, kPreviewLength));
}

auto guild_name(const models::StatefulGuild &guild) -> std::string {
  return guild ? std::format("{} ({})", guild->name, guild.id()) : "?";
}

template <typename E> auto describe(const E &) -> std::string { return {}; }

auto describe(const event::GuildStreamed &e) -> std::string {
  return guild_name(e.guild);
}
auto describe(const event::GuildJoined &e) -> std::string {
  return guild_name(e.guild);
}
auto describe(const event::GuildAvailable &e) -> std::string {
  return guild_name(e.guild);
}
auto describe(const event::InvalidGuildChunk &e) -> std::string {
  return std::format("guild {}", e.guild_id);
}
auto describe(const event::GuildMemberChunk &e) -> std::string {
  return std::format("{} chunk {}/{} with {} member(s)", guild_name(e.guild),
                     e.chunk_index + 1, e.chunk_count, e.members.size());
}
auto describe(const event::GuildMemberAdd &e) -> std::string {
  return std::format("{} joined {}", e.member.display_name(),
                     guild_name(e.guild));
}
auto describe(const event::GuildMemberRemove &e) -> std::string {
  return std::format("{} left guild {}", e.user.display_name(), e.guild_id);
}
auto describe(const event::MessageCreate &e) -> std::string {
  return std::format("{} in {}: {}", e.message->author.display_name(),
                     e.message->channel_id, preview(e.message->content));
}
auto describe(const event::MessageDelete &e) -> std::string {
  return std::format("{} in {}", e.message_id, e.channel_id);
}
auto describe(const event::MessageBulkDelete &e) -> std::string {
  return std::format("{} message(s) in {}", e.messages.size(), e.channel_id);
}
auto describe(const event::ChannelCreate &e) -> std::string {
  return std::format("{} ({})", e.channel->name.value_or(""), e.channel.id());
}
auto describe(const event::ChannelDelete &e) -> std::string {
  return std::format("{} ({})", e.channel->name.value_or(""), e.channel.id());
}

template <std::size_t... I>
auto register_summaries(dispatch::EventDispatcher &dispatcher,
                        std::size_t capacity, std::index_sequence<I...>)
    -> void {
  (dispatcher.on<std::variant_alternative_t<I, event::DispatchedEvent>>(
       "summary",
       [](const dispatch::EventContext &ctx, const auto &evt) -> task<void> {
         log::info("[shard {}] {} {}", ctx.shard_id, event::kEventNames[I],
                   describe(evt));
         co_return;
       },
       capacity),
   ...);
}

auto supervise(Client &client, gateway::ShardCollection &collection,
               dispatch::EventDispatcher &dispatcher) -> task<Result<void>> {
  auto result = co_await client.run(collection, dispatcher);
  request_shutdown();
  co_return result;
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.log_level) {
    config.log.level = *opts.log_level;
  }
  if (opts.shards) {
    config.gateway.shard_count = *opts.shards;
  }
  if (opts.dispatcher) {
    if (!util::is_enum_name<DispatcherMode>(*opts.dispatcher)) {
      std::println(stderr, "Error: unknown dispatcher '{}'", *opts.dispatcher);
      return 1;
    }
    config.dispatcher.mode = parse<DispatcherMode>(*opts.dispatcher);
  }
  if (auto valid = ConfigLoader::validate(config); !valid) {
    std::println(stderr, "Error: {}", valid.error().message());
    return 1;
  }

  if (!config.log.file.empty() && !log::set_output_file(config.log.file)) {
    std::println(stderr, "Error: Failed to open log file: {}",
                 config.log.file);
    return 1;
  }
  log::set_level(config.log.level);
  log::start();
  setup_signal_handlers();

  Runtime runtime(opts.workers);
  if (auto r = runtime.start(); !r) {
    log::error("Failed to start runtime: {}", r.error().message());
    log::stop();
    return 1;
  }
  auto home = runtime.executor_for(0);
  Client client(home, config);

  auto info = co_spawn(home, client.connect(), boost::asio::use_future).get();
  if (!info) {
    runtime.stop();
    log::stop();
    return 1;
  }

  auto collection = client.make_collection(
      gateway::make_websocket_factory(),
      [&runtime] { return runtime.next_executor(); });
  if (!collection) {
    runtime.stop();
    log::stop();
    return 1;
  }
  auto dispatcher = client.make_dispatcher();
  register_summaries(
      *dispatcher, config.dispatcher.channel_capacity,
      std::make_index_sequence<std::variant_size_v<event::DispatchedEvent>>{});

  log::info("Connecting {} shard(s) with the {} dispatcher",
            (*collection)->shard_count(),
            to_string_view(config.dispatcher.mode));
  auto done = co_spawn(home, supervise(client, **collection, *dispatcher),
                       boost::asio::use_future);

  wait_for_shutdown();
  log::info("Shutting down");
  (*collection)->stop();
  dispatcher->stop();
  auto result = done.get();

  runtime.stop();
  if (!result) {
    log::error("Gateway stopped: {}", result.error().message());
  } else {
    log::info("Gateway stopped");
  }
  log::stop();
  return result ? 0 : 1;
}

} // namespace shardline::cli
