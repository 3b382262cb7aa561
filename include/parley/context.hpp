#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "parley/model.hpp"
#include "parley/platform.hpp"

namespace parley {

template <typename Data>
struct Command;
template <typename Data>
struct SlashCommand;
template <typename Data>
struct FrameworkOptions;

// Everything a prefix command handler gets to see. Lives for one invocation.
//
// `command` is null when the context is built outside of a command, for
// example by a listener that wants to reply through the edit tracker.
template <typename Data>
struct PrefixContext {
  Platform& platform;
  const Message& msg;
  const FrameworkOptions<Data>& options;
  const Command<Data>* command;
  const Data& data;
  bool triggered_by_edit{false};
  std::optional<UserId> bot_id;

  const User& author() const { return msg.author; }
  ChannelId channel_id() const { return msg.channel_id; }
  std::optional<GuildId> guild_id() const { return msg.guild_id; }

  // Sends a reply, or edits the previous reply when this invocation is
  // edit-tracked and a response is already recorded for the trigger.
  void send_reply(const CreateReply& reply) const;
  void say(std::string text) const;
};

template <typename Data>
struct SlashContext {
  Platform& platform;
  const Interaction& interaction;
  const FrameworkOptions<Data>& options;
  const SlashCommand<Data>* command;
  const Data& data;
  // Shared between copies so that the first reply of an invocation is sent
  // as the interaction response and later ones as follow-ups.
  std::shared_ptr<std::atomic<bool>> has_sent_initial_response{std::make_shared<std::atomic<bool>>(false)};

  const User& author() const { return interaction.user; }
  ChannelId channel_id() const { return interaction.channel_id; }
  std::optional<GuildId> guild_id() const { return interaction.guild_id; }

  void send_reply(const CreateReply& reply) const;
  void say(std::string text) const;
};

}  // namespace parley
