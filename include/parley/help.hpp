#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "parley/command.hpp"

namespace parley {

namespace detail {

template <typename Data>
void append_command_line(std::string& out, const Command<Data>& command, const std::string& prefix) {
  out += "  " + prefix + command.name;
  if (!command.options.inline_help.empty()) {
    out += " - " + command.options.inline_help;
  }
  out += "\n";
}

}  // namespace detail

// Help text for a command list. Without a query every command not hidden
// from help is listed under its category, in registration order. With a
// query the matching command's multiline help (or its inline help) is shown
// together with its visible subcommands.
template <typename Data>
std::string render_help(const std::vector<Command<Data>>& commands, const std::string& prefix,
                        std::string_view query = {}, bool case_insensitive = true) {
  if (!trim_start(query).empty()) {
    const auto match = find_command(commands, trim_start(query), case_insensitive);
    if (!match) {
      return "No command named `" + std::string(trim_start(query)) + "`";
    }
    const Command<Data>& command = *match->command;
    std::string out;
    if (command.options.multiline_help) {
      out = command.options.multiline_help();
    } else if (!command.options.inline_help.empty()) {
      out = command.options.inline_help;
    } else {
      out = "No help available for `" + command.name + "`";
    }
    out += "\n";
    bool header = false;
    for (const auto& sub : command.subcommands) {
      if (sub.options.hide_in_help) {
        continue;
      }
      if (!header) {
        out += "Subcommands:\n";
        header = true;
      }
      detail::append_command_line(out, sub, prefix + command.name + " ");
    }
    return out;
  }

  std::vector<std::string> categories;
  for (const auto& command : commands) {
    if (command.options.hide_in_help) {
      continue;
    }
    const std::string category = command.category.empty() ? "Commands" : command.category;
    if (std::find(categories.begin(), categories.end(), category) == categories.end()) {
      categories.push_back(category);
    }
  }

  std::string out;
  for (const auto& category : categories) {
    out += category + ":\n";
    for (const auto& command : commands) {
      const std::string own = command.category.empty() ? "Commands" : command.category;
      if (!command.options.hide_in_help && own == category) {
        detail::append_command_line(out, command, prefix);
      }
    }
  }
  out += "Type " + prefix + "help <command> for more.";
  return out;
}

}  // namespace parley
