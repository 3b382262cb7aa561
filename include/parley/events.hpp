#pragma once

#include <string>
#include <variant>

#include "parley/model.hpp"

namespace parley {

struct ReadyEvent {
  Ready ready;
};

struct GuildCreateEvent {
  Guild guild;
};

struct MessageCreateEvent {
  Message message;
};

struct MessageUpdateEvent {
  MessageUpdate update;
};

struct MessageDeleteEvent {
  ChannelId channel_id{0};
  MessageId message_id{0};
  std::optional<GuildId> guild_id;
};

struct InteractionCreateEvent {
  Interaction interaction;
};

// Dispatches the framework has no handling for. They still reach the listener.
struct UnknownEvent {
  std::string name;
  json payload;
};

using Event = std::variant<ReadyEvent, GuildCreateEvent, MessageCreateEvent, MessageUpdateEvent, MessageDeleteEvent,
                           InteractionCreateEvent, UnknownEvent>;

inline std::string event_name(const Event& event) {
  struct Namer {
    std::string operator()(const ReadyEvent&) const { return "ready"; }
    std::string operator()(const GuildCreateEvent&) const { return "guild_create"; }
    std::string operator()(const MessageCreateEvent&) const { return "message_create"; }
    std::string operator()(const MessageUpdateEvent&) const { return "message_update"; }
    std::string operator()(const MessageDeleteEvent&) const { return "message_delete"; }
    std::string operator()(const InteractionCreateEvent&) const { return "interaction_create"; }
    std::string operator()(const UnknownEvent& e) const { return to_lower(e.name); }
  };
  return std::visit(Namer{}, event);
}

}  // namespace parley
