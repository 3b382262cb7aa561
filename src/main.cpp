#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "parley/config.hpp"
#include "parley/framework.hpp"
#include "parley/gateway.hpp"
#include "parley/help.hpp"
#include "parley/metrics.hpp"
#include "parley/rest_platform.hpp"

namespace {

using namespace parley;

struct BotData {
  std::string bot_name;
  Timestamp started_at{};
};

void print_usage() {
  std::cout << "parley - command dispatch for chat bots\n\n"
            << "Usage:\n"
            << "  parley run [--config PATH]   dispatch gateway frames read from stdin\n"
            << "  parley config                print the default config\n"
            << "  parley onboard               write the default config to ~/.parley/config.json\n"
            << "  parley --version\n";
}

std::string get_flag_value(const std::vector<std::string>& args, const std::string& flag,
                           const std::string& fallback = "") {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      return args[i + 1];
    }
  }
  return fallback;
}

std::string format_uptime(std::chrono::seconds s) {
  const auto h = s.count() / 3600;
  const auto m = (s.count() % 3600) / 60;
  const auto sec = s.count() % 60;
  return std::to_string(h) + "h " + std::to_string(m) + "m " + std::to_string(sec) + "s";
}

std::vector<Command<BotData>> demo_commands() {
  Command<BotData> ping;
  ping.name = "ping";
  ping.options.inline_help = "Replies with pong";
  ping.action = [](const PrefixContext<BotData>& ctx, const std::string&) {
    CreateReply reply;
    reply.content = "Pong!";
    reply.reply_to_trigger = true;
    ctx.send_reply(reply);
  };

  Command<BotData> echo;
  echo.name = "echo";
  echo.aliases = {"say"};
  echo.options.inline_help = "Repeats the arguments; follows edits";
  echo.options.track_edits = true;
  echo.action = [](const PrefixContext<BotData>& ctx, const std::string& args) {
    ctx.say(args.empty() ? std::string("(nothing to echo)") : args);
  };

  Command<BotData> uptime;
  uptime.name = "uptime";
  uptime.options.inline_help = "How long the bot has been running";
  uptime.action = [](const PrefixContext<BotData>& ctx, const std::string&) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - ctx.data.started_at);
    ctx.say("Up for " + format_uptime(elapsed));
  };

  Command<BotData> help;
  help.name = "help";
  help.options.inline_help = "Lists commands, or explains one";
  help.options.multiline_help = []() {
    return std::string("Usage: help [command]\nWithout an argument, lists every command.");
  };
  help.options.track_edits = true;
  help.action = [](const PrefixContext<BotData>& ctx, const std::string& args) {
    const auto& prefix_options = ctx.options.prefix_options;
    const std::string shown = prefix_options.prefix.empty() ? std::string("!") : prefix_options.prefix;
    ctx.say(render_help(prefix_options.commands, shown, args, prefix_options.case_insensitive_commands));
  };

  Command<BotData> counters;
  counters.name = "debug-counters";
  counters.options.hide_in_help = true;
  counters.options.owners_only = true;
  counters.action = [](const PrefixContext<BotData>& ctx, const std::string&) {
    ctx.say(metrics().to_json().dump());
  };

  Command<BotData> about;
  about.name = "about";
  about.category = "Meta";
  about.options.inline_help = "Information about the bot";
  about.action = [](const PrefixContext<BotData>& ctx, const std::string&) {
    CreateReply reply;
    reply.embed = json{{"title", ctx.data.bot_name}, {"description", std::string("Built on parley ") + kVersion}};
    ctx.send_reply(reply);
  };
  about.subcommands.push_back(std::move(uptime));

  std::vector<Command<BotData>> out;
  out.push_back(std::move(ping));
  out.push_back(std::move(echo));
  out.push_back(std::move(about));
  out.push_back(std::move(help));
  out.push_back(std::move(counters));
  return out;
}

std::vector<SlashCommand<BotData>> demo_slash_commands() {
  SlashCommand<BotData> ping;
  ping.name = "ping";
  ping.options.description = "Replies with pong";
  ping.options.ephemeral = true;
  ping.action = [](const SlashContext<BotData>& ctx, const std::vector<CommandDataOption>&) { ctx.say("Pong!"); };
  return {ping};
}

int run_config() {
  std::cout << default_config_json().dump(2) << "\n";
  return 0;
}

int run_onboard() {
  const fs::path path = get_config_path();
  if (fs::exists(path)) {
    std::cout << "Config already exists at " << path.string() << "\n";
    return 0;
  }
  if (!save_default_config(path)) {
    std::cerr << "Failed to write " << path.string() << "\n";
    return 1;
  }
  std::cout << "Wrote " << path.string() << "\n";
  return 0;
}

int run_bot(const std::vector<std::string>& args) {
  const std::string config_path = get_flag_value(args, "--config");
  const Config cfg = config_path.empty() ? load_config() : load_config(expand_user_path(config_path));
  apply_logging_config(cfg.framework);

  RestPlatform platform(cfg.discord);

  FrameworkOptions<BotData> options;
  apply_config(cfg.framework, options);
  options.prefix_options.commands = demo_commands();
  options.slash_options.commands = demo_slash_commands();
  options.allowed_mentions = AllowedMentions{};

  Framework<BotData> framework(
      platform, std::move(options),
      [](const Ready& ready, Platform&) { return BotData{ready.user.name, Clock::now()}; },
      static_cast<std::size_t>((std::max)(1, cfg.framework.worker_threads)));
  framework.start();
  Logger::log(Logger::Level::kInfo, "Reading gateway frames from stdin");

  std::string line;
  while (std::getline(std::cin, line)) {
    if (auto event = decode_frame(line)) {
      framework.enqueue(std::move(*event));
    }
  }

  framework.wait_idle();
  framework.stop();
  Logger::log(Logger::Level::kInfo, "Input closed, counters: " + metrics().to_json().dump());
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  {
    const char* v = std::getenv("PARLEY_LOG_JSON");
    if (v && *v && std::string(v) != "0") {
      Logger::set_json(true);
    }
  }

  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (args.size() <= 1) {
    print_usage();
    return 0;
  }

  const std::string command = args[1];
  if (command == "--version" || command == "-v") {
    std::cout << "parley v" << kVersion << "\n";
    return 0;
  }
  if (command == "config") {
    return run_config();
  }
  if (command == "onboard") {
    return run_onboard();
  }
  if (command == "run") {
    std::vector<std::string> sub(args.begin() + 2, args.end());
    return run_bot(sub);
  }

  print_usage();
  return 1;
}
