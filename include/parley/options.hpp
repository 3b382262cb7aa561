#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

#include "parley/command.hpp"
#include "parley/config.hpp"
#include "parley/edit_tracker.hpp"
#include "parley/error.hpp"
#include "parley/events.hpp"
#include "parley/platform.hpp"
#include "parley/prefix.hpp"

namespace parley {

template <typename Data>
struct PrefixFrameworkOptions {
  // Tried before the additional prefixes. Empty means no primary prefix.
  std::string prefix;
  std::vector<Command<Data>> commands;
  std::vector<Prefix> additional_prefixes;
  // Returns the message text with the prefix removed, or nothing if the
  // message is not addressed to the bot.
  std::function<std::optional<std::string>(const Message&, const Data&)> dynamic_prefix;
  bool mention_as_prefix{true};
  // Default admission check for commands that do not set their own.
  std::function<bool(const PrefixContext<Data>&)> command_check;
  // Edit tracking is off unless a tracker is set.
  std::shared_ptr<EditTracker> edit_tracker;
  bool track_edits_by_default{false};
  BroadcastTypingBehavior broadcast_typing{};
  bool execute_self_messages{false};
  bool case_insensitive_commands{true};
};

template <typename Data>
struct SlashFrameworkOptions {
  std::vector<SlashCommand<Data>> commands;
  std::function<bool(const SlashContext<Data>&)> command_check;
};

template <typename Data>
struct FrameworkOptions {
  std::function<void(std::exception_ptr, const ErrorContext<Data>&)> on_error{default_error_handler<Data>};
  // Called for every event after the framework's own handling.
  std::function<void(const Event&, Platform&, const Data&)> listener;
  std::unordered_set<UserId> owners;
  // Applied to every newly sent prefix reply.
  std::optional<AllowedMentions> allowed_mentions;
  Permissions required_permissions;
  bool owners_only{false};
  PrefixFrameworkOptions<Data> prefix_options{};
  SlashFrameworkOptions<Data> slash_options{};
};

// Effective per-command settings. Evaluated on every dispatch so that later
// changes to the framework-wide values reach commands that did not override
// them.

template <typename Data>
bool effective_track_edits(const Command<Data>& command, const FrameworkOptions<Data>& options) {
  return command.options.track_edits.value_or(options.prefix_options.track_edits_by_default);
}

template <typename Data>
BroadcastTypingBehavior effective_broadcast_typing(const Command<Data>& command,
                                                   const FrameworkOptions<Data>& options) {
  return command.options.broadcast_typing.value_or(options.prefix_options.broadcast_typing);
}

template <typename Data>
Permissions effective_required_permissions(const Command<Data>& command, const FrameworkOptions<Data>& options) {
  return command.options.required_permissions.value_or(options.required_permissions);
}

template <typename Data>
Permissions effective_required_permissions(const SlashCommand<Data>& command, const FrameworkOptions<Data>& options) {
  return command.options.required_permissions.value_or(options.required_permissions);
}

template <typename Data>
bool effective_owners_only(const Command<Data>& command, const FrameworkOptions<Data>& options) {
  return command.options.owners_only.value_or(options.owners_only);
}

template <typename Data>
bool effective_owners_only(const SlashCommand<Data>& command, const FrameworkOptions<Data>& options) {
  return command.options.owners_only.value_or(options.owners_only);
}

// Copies the framework section of a loaded config into `options`. Commands,
// callbacks and anything the config does not mention are left alone.
template <typename Data>
void apply_config(const FrameworkConfig& config, FrameworkOptions<Data>& options) {
  auto& prefix = options.prefix_options;
  prefix.prefix = config.prefix;
  prefix.additional_prefixes.clear();
  for (const auto& p : config.additional_prefixes) {
    prefix.additional_prefixes.push_back(Prefix::literal(p));
  }
  for (const auto& pattern : config.regex_prefixes) {
    try {
      prefix.additional_prefixes.push_back(Prefix::regex(pattern));
    } catch (const std::regex_error& e) {
      Logger::log(Logger::Level::kWarn, "Skipping invalid regex prefix '" + pattern + "': " + e.what());
    }
  }
  prefix.mention_as_prefix = config.mention_as_prefix;
  prefix.case_insensitive_commands = config.case_insensitive_commands;
  prefix.execute_self_messages = config.execute_self_messages;
  prefix.track_edits_by_default = config.track_edits_by_default;
  if (config.edit_tracking.enabled) {
    prefix.edit_tracker = EditTracker::for_timespan(std::chrono::seconds(config.edit_tracking.max_age_seconds));
  } else {
    prefix.edit_tracker.reset();
  }
  prefix.broadcast_typing = config.typing_delay_ms < 0
                                ? BroadcastTypingBehavior::none()
                                : BroadcastTypingBehavior::with_delay(std::chrono::milliseconds(config.typing_delay_ms));

  options.owners.clear();
  options.owners.insert(config.owners.begin(), config.owners.end());
  std::vector<std::string> unknown;
  options.required_permissions = parse_permissions(config.required_permissions, &unknown);
  for (const auto& name : unknown) {
    Logger::log(Logger::Level::kWarn, "Ignoring unknown permission in config: " + name);
  }
  options.owners_only = config.owners_only;
}

}  // namespace parley
