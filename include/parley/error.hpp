#pragma once

#include <exception>
#include <string>
#include <variant>

#include "parley/command.hpp"
#include "parley/context.hpp"
#include "parley/events.hpp"

namespace parley {

// The user data setup callback failed on the first ready event.
struct SetupErrorContext {
  const Ready& ready;
};

// The listener callback failed while handling `event`.
struct ListenerErrorContext {
  const Event& event;
};

template <typename Data>
struct PrefixCommandErrorContext {
  // True when the failure came from an admission check, not the handler.
  bool while_checking;
  const Command<Data>& command;
  PrefixContext<Data> ctx;
};

template <typename Data>
struct SlashCommandErrorContext {
  bool while_checking;
  const SlashCommand<Data>& command;
  SlashContext<Data> ctx;
};

template <typename Data>
using CommandErrorContext = std::variant<PrefixCommandErrorContext<Data>, SlashCommandErrorContext<Data>>;

template <typename Data>
using ErrorContext = std::variant<SetupErrorContext, ListenerErrorContext, CommandErrorContext<Data>>;

inline std::string describe_error(std::exception_ptr error) {
  if (!error) {
    return "no error";
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

template <typename Data>
std::string describe_command_context(const CommandErrorContext<Data>& ctx) {
  struct Describer {
    std::string operator()(const PrefixCommandErrorContext<Data>& c) const {
      return "prefix command '" + c.command.name + "'" + (c.while_checking ? " while checking" : "");
    }
    std::string operator()(const SlashCommandErrorContext<Data>& c) const {
      return "slash command '" + c.command.name + "'" + (c.while_checking ? " while checking" : "");
    }
  };
  return std::visit(Describer{}, ctx);
}

template <typename Data>
std::string describe_context(const ErrorContext<Data>& ctx) {
  struct Describer {
    std::string operator()(const SetupErrorContext&) const { return "user data setup"; }
    std::string operator()(const ListenerErrorContext& c) const { return "listener (" + event_name(c.event) + ")"; }
    std::string operator()(const CommandErrorContext<Data>& c) const { return describe_command_context<Data>(c); }
  };
  return std::visit(Describer{}, ctx);
}

// Framework-wide fallback. Errors are logged, never shown to users.
template <typename Data>
void default_error_handler(std::exception_ptr error, const ErrorContext<Data>& ctx) {
  Logger::log(Logger::Level::kError, "Unhandled error in " + describe_context<Data>(ctx) + ": " + describe_error(error));
}

}  // namespace parley
