#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "parley/common.hpp"
#include "parley/context.hpp"
#include "parley/permissions.hpp"

namespace parley {

template <typename Data>
struct PrefixCommandErrorContext;
template <typename Data>
struct SlashCommandErrorContext;

// Whether to show a typing indicator while a command runs. With a delay,
// typing starts once the handler has been running that long; zero means
// immediately.
struct BroadcastTypingBehavior {
  std::optional<std::chrono::milliseconds> delay;

  static BroadcastTypingBehavior none() { return {}; }
  static BroadcastTypingBehavior with_delay(std::chrono::milliseconds d) { return {d}; }

  bool enabled() const { return delay.has_value(); }
};

// Per-command settings. Unset optionals fall back to the framework-wide
// value at dispatch time.
template <typename Data>
struct CommandOptions {
  std::string inline_help;
  std::function<std::string()> multiline_help;
  std::function<void(std::exception_ptr, const PrefixCommandErrorContext<Data>&)> on_error;
  // Replaces the framework-wide command check for this command.
  std::function<bool(const PrefixContext<Data>&)> check;
  std::optional<bool> track_edits;
  std::optional<BroadcastTypingBehavior> broadcast_typing;
  bool hide_in_help{false};
  std::optional<Permissions> required_permissions;
  std::optional<bool> owners_only;
};

template <typename Data>
struct Command {
  using Action = std::function<void(const PrefixContext<Data>&, const std::string& args)>;

  std::string name;
  std::vector<std::string> aliases;
  Action action;
  CommandOptions<Data> options{};
  std::string category;
  std::vector<Command> subcommands;

  bool matches(std::string_view token, bool case_insensitive) const {
    const auto eq = [&](const std::string& candidate) {
      return case_insensitive ? equals_ignore_case(candidate, token) : candidate == token;
    };
    if (eq(name)) {
      return true;
    }
    return std::any_of(aliases.begin(), aliases.end(), eq);
  }
};

template <typename Data>
struct CommandMatch {
  const Command<Data>* command;
  std::string args;
};

// Resolves the first word of `text` against `commands`, then keeps descending
// into subcommands while the next word names one. Registration order decides
// between commands that share a name.
template <typename Data>
std::optional<CommandMatch<Data>> find_command(const std::vector<Command<Data>>& commands, std::string_view text,
                                               bool case_insensitive) {
  const auto [token, rest] = split_first_token(text);
  if (token.empty()) {
    return std::nullopt;
  }
  for (const auto& command : commands) {
    if (!command.matches(token, case_insensitive)) {
      continue;
    }
    if (auto sub = find_command(command.subcommands, rest, case_insensitive)) {
      return sub;
    }
    return CommandMatch<Data>{&command, std::string(rest)};
  }
  return std::nullopt;
}

template <typename Data>
struct SlashCommandOptions {
  std::string description;
  std::function<void(std::exception_ptr, const SlashCommandErrorContext<Data>&)> on_error;
  std::function<bool(const SlashContext<Data>&)> check;
  bool ephemeral{false};
  std::optional<Permissions> required_permissions;
  std::optional<bool> owners_only;
};

// An application command. Arguments arrive already parsed by the platform.
template <typename Data>
struct SlashCommand {
  using Action = std::function<void(const SlashContext<Data>&, const std::vector<CommandDataOption>& args)>;

  std::string name;
  Action action;
  SlashCommandOptions<Data> options{};
  std::vector<SlashCommand> subcommands;
};

template <typename Data>
struct SlashCommandMatch {
  const SlashCommand<Data>* command;
  std::vector<CommandDataOption> args;
};

// Interaction names are matched exactly. A subcommand (group) option selects
// the child of the same name and carries its arguments.
template <typename Data>
std::optional<SlashCommandMatch<Data>> find_slash_command(const std::vector<SlashCommand<Data>>& commands,
                                                          const std::string& name,
                                                          const std::vector<CommandDataOption>& options) {
  for (const auto& command : commands) {
    if (command.name != name) {
      continue;
    }
    for (const auto& opt : options) {
      if (opt.is_subcommand()) {
        if (auto sub = find_slash_command(command.subcommands, opt.name, opt.options)) {
          return sub;
        }
      }
    }
    return SlashCommandMatch<Data>{&command, options};
  }
  return std::nullopt;
}

}  // namespace parley
