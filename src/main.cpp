#include "shardline/cli/commands.hpp"
#include "shardline/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("SHARDLINE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_config_option(CLI::App *cmd, std::string &target,
                       const std::string &env_config) -> void {
  target = env_config;
  auto *opt = cmd->add_option("-c,--config", target, "Client config file")
                  ->check(CLI::ExistingFile);
  if (env_config.empty())
    opt->required();
}
} // namespace

int main(int argc, char *argv[]) {
  shardline::log::set_output_stderr();
  shardline::log::set_level(shardline::log::Level::Warn);

  CLI::App app{"shardline", "Sharded gateway client"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  shardline run -c shardline.toml\n"
             "  shardline run -c shardline.toml --shards 4 --dispatcher "
             "channel\n"
             "  shardline gateway-info -c shardline.toml\n"
             "\nTip: Set SHARDLINE_CONFIG=shardline.toml to skip -c on "
             "every command.");

  const std::string env_config = default_config();

  shardline::cli::RunOptions run_opts;
  auto *run = app.add_subcommand("run", "Connect every shard and log events");
  add_config_option(run, run_opts.config_file, env_config);
  run->add_option("--log-level", run_opts.log_level,
                  "Log level override: trace|debug|info|warn|error")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
  run->add_option("--shards", run_opts.shards,
                  "Shard count (default: config, then recommendation)")
      ->check(CLI::PositiveNumber);
  run->add_option("--dispatcher", run_opts.dispatcher,
                  "Dispatcher: task|channel")
      ->check(CLI::IsMember({"task", "channel"}, CLI::ignore_case));
  run->add_option("--workers", run_opts.workers,
                  "Worker threads (default: CPU count)");
  run->callback(
      [&run_opts]() { std::exit(shardline::cli::cmd_run(run_opts)); });

  shardline::cli::CheckConfigOptions check_opts;
  auto *check = app.add_subcommand(
      "check-config", "Validate a config file and print effective values");
  add_config_option(check, check_opts.config_file, env_config);
  check->callback([&check_opts]() {
    std::exit(shardline::cli::cmd_check_config(check_opts));
  });

  shardline::cli::GatewayInfoOptions info_opts;
  auto *info = app.add_subcommand(
      "gateway-info", "Show the recommended shard count and start limits");
  add_config_option(info, info_opts.config_file, env_config);
  info->callback([&info_opts]() {
    std::exit(shardline::cli::cmd_gateway_info(info_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
