#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "parley/common.hpp"
#include "parley/events.hpp"
#include "parley/model.hpp"

namespace parley {

struct AttachmentFile {
  std::string filename;
  std::string data;
  std::string content_type;
};

// Mention categories a sent message is allowed to ping.
struct AllowedMentions {
  bool everyone{false};
  bool users{true};
  bool roles{true};
  bool replied_user{false};

  json to_json() const {
    json parse = json::array();
    if (everyone) {
      parse.push_back("everyone");
    }
    if (users) {
      parse.push_back("users");
    }
    if (roles) {
      parse.push_back("roles");
    }
    return json{{"parse", parse}, {"replied_user", replied_user}};
  }
};

// What a command handler hands to `send_reply`.
struct CreateReply {
  std::optional<std::string> content;
  std::optional<json> embed;
  std::vector<AttachmentFile> attachments;
  bool ephemeral{false};
  // Prefix replies only: send as a reply to the trigger message.
  bool reply_to_trigger{false};
};

struct CreateMessage {
  std::optional<std::string> content;
  std::optional<json> embed;
  std::vector<AttachmentFile> attachments;
  std::optional<AllowedMentions> allowed_mentions;
  std::optional<MessageId> reference;
};

// Edits replace everything they name. Content defaults to empty, embeds to
// none and attachments to none.
struct EditMessage {
  std::string content;
  std::vector<json> embeds;
  std::vector<AttachmentFile> attachments;
};

// Everything the dispatch core needs from the chat platform. All calls may
// block on the network and throw PlatformError on failure.
class Platform {
 public:
  virtual ~Platform() = default;

  // Guild from the local cache, or nullptr when it is not cached.
  virtual std::shared_ptr<const Guild> cached_guild(GuildId id) const = 0;
  virtual Member fetch_member(GuildId guild_id, UserId user_id) = 0;
  virtual Permissions permissions_in(const Guild& guild, const Channel& channel, const Member& member) {
    return guild.member_permissions_in(channel, member);
  }

  virtual Message send_message(ChannelId channel_id, const CreateMessage& msg) = 0;
  virtual Message edit_message(ChannelId channel_id, MessageId message_id, const EditMessage& edit) = 0;
  virtual void delete_message(ChannelId channel_id, MessageId message_id) = 0;
  virtual void broadcast_typing(ChannelId channel_id) = 0;

  virtual void create_interaction_response(const Interaction& interaction, const CreateReply& reply) = 0;
  virtual Message create_followup_message(const Interaction& interaction, const CreateReply& reply) = 0;

  // Every incoming event passes through here before dispatch, so
  // implementations can keep their caches current.
  virtual void observe(const Event&) {}
};

}  // namespace parley
