#pragma once

#include <string>

#include "parley/context.hpp"
#include "parley/options.hpp"

namespace parley {

template <typename Data>
void PrefixContext<Data>::send_reply(const CreateReply& reply) const {
  EditTracker* tracker = options.prefix_options.edit_tracker.get();
  if (command && !effective_track_edits(*command, options)) {
    tracker = nullptr;
  }

  const std::optional<Message> existing = tracker ? tracker->find_response(msg.id) : std::nullopt;
  if (existing) {
    EditMessage edit;
    // An edit without content clears the old text, e.g. when the new
    // reply is embed-only.
    edit.content = reply.content.value_or("");
    if (reply.embed) {
      edit.embeds.push_back(*reply.embed);
    }
    edit.attachments = reply.attachments;
    Message updated = platform.edit_message(existing->channel_id, existing->id, edit);

    // The trigger may have been deleted while the edit was in flight.
    tracker->update_response(msg.id, [&updated](Message& response) { response = std::move(updated); });
    return;
  }

  CreateMessage create;
  create.content = reply.content;
  create.embed = reply.embed;
  create.attachments = reply.attachments;
  create.allowed_mentions = options.allowed_mentions;
  if (reply.reply_to_trigger) {
    create.reference = msg.id;
  }
  Message response = platform.send_message(msg.channel_id, create);
  if (tracker) {
    tracker->record(msg, std::move(response));
  }
}

template <typename Data>
void PrefixContext<Data>::say(std::string text) const {
  CreateReply reply;
  reply.content = std::move(text);
  send_reply(reply);
}

template <typename Data>
void SlashContext<Data>::send_reply(const CreateReply& reply) const {
  CreateReply effective = reply;
  if (command && command->options.ephemeral) {
    effective.ephemeral = true;
  }
  if (!has_sent_initial_response->exchange(true)) {
    try {
      platform.create_interaction_response(interaction, effective);
    } catch (...) {
      has_sent_initial_response->store(false);
      throw;
    }
    return;
  }
  platform.create_followup_message(interaction, effective);
}

template <typename Data>
void SlashContext<Data>::say(std::string text) const {
  CreateReply reply;
  reply.content = std::move(text);
  send_reply(reply);
}

}  // namespace parley
