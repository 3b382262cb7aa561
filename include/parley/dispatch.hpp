#pragma once

#include <exception>
#include <optional>
#include <string>

#include "parley/command.hpp"
#include "parley/context.hpp"
#include "parley/error.hpp"
#include "parley/metrics.hpp"
#include "parley/options.hpp"
#include "parley/permission_gate.hpp"
#include "parley/prefix.hpp"
#include "parley/reply.hpp"
#include "parley/typing.hpp"

namespace parley {

enum class DispatchOutcome {
  kNotApplicable,  // no prefix matched, or the event is not a command
  kNoCommand,      // prefix matched but no registered command did
  kSkippedEdit,    // edit of a message whose command does not track edits
  kUnauthorized,   // owners-only or permission gate denied
  kCheckFailed,    // admission check returned false
  kExecuted,
  kFailed,         // check or handler threw; the error has been reported
};

inline const char* outcome_name(DispatchOutcome outcome) {
  switch (outcome) {
    case DispatchOutcome::kNotApplicable:
      return "not_applicable";
    case DispatchOutcome::kNoCommand:
      return "no_command";
    case DispatchOutcome::kSkippedEdit:
      return "skipped_edit";
    case DispatchOutcome::kUnauthorized:
      return "unauthorized";
    case DispatchOutcome::kCheckFailed:
      return "check_failed";
    case DispatchOutcome::kExecuted:
      return "executed";
    case DispatchOutcome::kFailed:
    default:
      return "failed";
  }
}

// Returns the text after the trigger with leading whitespace removed, or
// nothing if the message does not address the bot. Rules are tried in
// order: primary prefix, additional prefixes, bot mention, dynamic prefix.
template <typename Data>
std::optional<std::string> resolve_prefix(const Message& msg, const PrefixFrameworkOptions<Data>& options,
                                          std::optional<UserId> bot_id, const Data& data) {
  if (!options.execute_self_messages && bot_id && msg.author.id == *bot_id) {
    return std::nullopt;
  }

  const std::string_view content = msg.content;
  const auto done = [](std::string_view rest) { return std::string(trim_start(rest)); };

  if (!options.prefix.empty() && content.substr(0, options.prefix.size()) == options.prefix) {
    return done(content.substr(options.prefix.size()));
  }
  for (const auto& prefix : options.additional_prefixes) {
    if (auto rest = prefix.strip(content)) {
      return done(*rest);
    }
  }
  if (options.mention_as_prefix && bot_id) {
    if (auto rest = strip_mention(content, *bot_id)) {
      return done(*rest);
    }
  }
  if (options.dynamic_prefix) {
    if (auto rest = options.dynamic_prefix(msg, data)) {
      return done(*rest);
    }
  }
  return std::nullopt;
}

// Hands an error to the framework-wide handler. A handler that throws is
// logged; the error goes no further.
template <typename Data>
void report_error(const FrameworkOptions<Data>& options, std::exception_ptr error, const ErrorContext<Data>& ctx) {
  try {
    if (options.on_error) {
      options.on_error(error, ctx);
    } else {
      default_error_handler<Data>(error, ctx);
    }
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kError, "Error handler for " + describe_context<Data>(ctx) + " threw: " + e.what());
  } catch (...) {
    Logger::log(Logger::Level::kError,
                "Error handler for " + describe_context<Data>(ctx) + " threw a non-standard exception");
  }
}

// Routes a command failure to the command's own handler when it has one,
// otherwise to the framework-wide handler.
template <typename Data>
void report_command_error(const FrameworkOptions<Data>& options, std::exception_ptr error,
                          const PrefixCommandErrorContext<Data>& ctx) {
  if (!ctx.command.options.on_error) {
    report_error(options, error, ErrorContext<Data>(CommandErrorContext<Data>(ctx)));
    return;
  }
  try {
    ctx.command.options.on_error(error, ctx);
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kError, "Error handler of command '" + ctx.command.name + "' threw: " + e.what());
  } catch (...) {
    Logger::log(Logger::Level::kError,
                "Error handler of command '" + ctx.command.name + "' threw a non-standard exception");
  }
}

template <typename Data>
void report_command_error(const FrameworkOptions<Data>& options, std::exception_ptr error,
                          const SlashCommandErrorContext<Data>& ctx) {
  if (!ctx.command.options.on_error) {
    report_error(options, error, ErrorContext<Data>(CommandErrorContext<Data>(ctx)));
    return;
  }
  try {
    ctx.command.options.on_error(error, ctx);
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kError,
                "Error handler of slash command '" + ctx.command.name + "' threw: " + e.what());
  } catch (...) {
    Logger::log(Logger::Level::kError,
                "Error handler of slash command '" + ctx.command.name + "' threw a non-standard exception");
  }
}

// Runs one message through prefix resolution, routing, the permission gate,
// the admission check and finally the command handler. Command errors are
// reported before returning.
template <typename Data>
DispatchOutcome dispatch_message(Platform& platform, const FrameworkOptions<Data>& options, const Message& msg,
                                 bool triggered_by_edit, std::optional<UserId> bot_id, const Data& data) {
  const auto& prefix_options = options.prefix_options;
  const std::optional<std::string> text = resolve_prefix(msg, prefix_options, bot_id, data);
  if (!text) {
    return DispatchOutcome::kNotApplicable;
  }

  const auto match = find_command(prefix_options.commands, *text, prefix_options.case_insensitive_commands);
  if (!match) {
    Logger::log(Logger::Level::kDebug, "No command matches message " + std::to_string(msg.id));
    return DispatchOutcome::kNoCommand;
  }
  const Command<Data>& command = *match->command;

  if (triggered_by_edit && !effective_track_edits(command, options)) {
    return DispatchOutcome::kSkippedEdit;
  }

  const PrefixContext<Data> ctx{platform, msg, options, &command, data, triggered_by_edit, bot_id};

  const InvocationScope scope{msg.author.id, msg.guild_id, msg.channel_id};
  if (!authorize(platform, scope, options.owners, effective_required_permissions(command, options),
                 effective_owners_only(command, options))) {
    metrics().inc("dispatch.unauthorized");
    Logger::log(Logger::Level::kDebug, "User " + std::to_string(msg.author.id) + " may not run '" + command.name + "'");
    return DispatchOutcome::kUnauthorized;
  }

  const auto& check = command.options.check ? command.options.check : prefix_options.command_check;
  if (check) {
    bool allowed = false;
    try {
      allowed = check(ctx);
    } catch (...) {
      metrics().inc("dispatch.failed");
      report_command_error(options, std::current_exception(), PrefixCommandErrorContext<Data>{true, command, ctx});
      return DispatchOutcome::kFailed;
    }
    if (!allowed) {
      return DispatchOutcome::kCheckFailed;
    }
  }

  std::exception_ptr error;
  {
    std::optional<TypingBroadcaster> typing;
    const BroadcastTypingBehavior typing_behavior = effective_broadcast_typing(command, options);
    if (typing_behavior.enabled()) {
      typing.emplace(platform, msg.channel_id, *typing_behavior.delay);
    }
    try {
      if (command.action) {
        command.action(ctx, match->args);
      }
    } catch (...) {
      error = std::current_exception();
    }
  }

  if (error) {
    metrics().inc("dispatch.failed");
    report_command_error(options, error, PrefixCommandErrorContext<Data>{false, command, ctx});
    return DispatchOutcome::kFailed;
  }
  metrics().inc("dispatch.executed");
  return DispatchOutcome::kExecuted;
}

// Application command counterpart of dispatch_message.
template <typename Data>
DispatchOutcome dispatch_interaction(Platform& platform, const FrameworkOptions<Data>& options,
                                     const Interaction& interaction, const Data& data) {
  const auto match = find_slash_command(options.slash_options.commands, interaction.command_name, interaction.options);
  if (!match) {
    Logger::log(Logger::Level::kWarn, "Received unknown application command '" + interaction.command_name + "'");
    return DispatchOutcome::kNoCommand;
  }
  const SlashCommand<Data>& command = *match->command;
  const SlashContext<Data> ctx{platform, interaction, options, &command, data};

  const InvocationScope scope{interaction.user.id, interaction.guild_id, interaction.channel_id};
  if (!authorize(platform, scope, options.owners, effective_required_permissions(command, options),
                 effective_owners_only(command, options))) {
    metrics().inc("dispatch.unauthorized");
    return DispatchOutcome::kUnauthorized;
  }

  const auto& check = command.options.check ? command.options.check : options.slash_options.command_check;
  if (check) {
    bool allowed = false;
    try {
      allowed = check(ctx);
    } catch (...) {
      metrics().inc("dispatch.failed");
      report_command_error(options, std::current_exception(), SlashCommandErrorContext<Data>{true, command, ctx});
      return DispatchOutcome::kFailed;
    }
    if (!allowed) {
      return DispatchOutcome::kCheckFailed;
    }
  }

  try {
    if (command.action) {
      command.action(ctx, match->args);
    }
  } catch (...) {
    metrics().inc("dispatch.failed");
    report_command_error(options, std::current_exception(), SlashCommandErrorContext<Data>{false, command, ctx});
    return DispatchOutcome::kFailed;
  }
  metrics().inc("dispatch.executed");
  return DispatchOutcome::kExecuted;
}

}  // namespace parley
