#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "parley/common.hpp"
#include "parley/permissions.hpp"

namespace parley {

using Snowflake = std::uint64_t;
using UserId = Snowflake;
using ChannelId = Snowflake;
using GuildId = Snowflake;
using RoleId = Snowflake;
using MessageId = Snowflake;

// Failure of a platform call (cache miss that must be fatal, HTTP error,
// malformed payload). Carries the HTTP status when there was a response.
class PlatformError : public std::runtime_error {
 public:
  explicit PlatformError(const std::string& what, long status = 0) : std::runtime_error(what), status_(status) {}

  long status() const { return status_; }

 private:
  long status_;
};

struct User {
  UserId id{0};
  std::string name;
  std::string discriminator;
  bool bot{false};

  std::string mention() const { return "<@" + std::to_string(id) + ">"; }
};

struct Attachment {
  Snowflake id{0};
  std::string filename;
  std::string url;
  std::uint64_t size{0};
  std::string content_type;
};

struct Message {
  MessageId id{0};
  ChannelId channel_id{0};
  std::optional<GuildId> guild_id;
  int kind{0};
  std::string content;
  bool tts{false};
  bool pinned{false};
  Timestamp timestamp{};
  std::optional<Timestamp> edited_timestamp;
  User author;
  bool mention_everyone{false};
  std::vector<User> mentions;
  std::vector<RoleId> mention_roles;
  std::vector<Attachment> attachments;
  std::vector<json> embeds;

  Timestamp last_update() const { return edited_timestamp.value_or(timestamp); }
};

// Partial message as delivered by MESSAGE_UPDATE. id/channel/guild are always
// present; every other field is only set when the platform sent it.
struct MessageUpdate {
  MessageId id{0};
  ChannelId channel_id{0};
  std::optional<GuildId> guild_id;
  std::optional<int> kind;
  std::optional<std::string> content;
  std::optional<bool> tts;
  std::optional<bool> pinned;
  std::optional<Timestamp> timestamp;
  std::optional<Timestamp> edited_timestamp;
  std::optional<User> author;
  std::optional<bool> mention_everyone;
  std::optional<std::vector<User>> mentions;
  std::optional<std::vector<RoleId>> mention_roles;
  std::optional<std::vector<Attachment>> attachments;
  std::optional<std::vector<json>> embeds;
};

struct Role {
  RoleId id{0};
  std::string name;
  Permissions permissions;
  int position{0};
};

struct Member {
  User user;
  std::string nick;
  std::vector<RoleId> roles;
};

enum class ChannelKind {
  kGuildText = 0,
  kDirect = 1,
  kGuildVoice = 2,
  kGroupDirect = 3,
  kGuildCategory = 4,
  kGuildNews = 5,
  kGuildStore = 6,
  kNewsThread = 10,
  kPublicThread = 11,
  kPrivateThread = 12,
  kGuildStageVoice = 13,
};

struct PermissionOverwrite {
  enum class Target { kRole = 0, kMember = 1 };

  Snowflake id{0};
  Target target{Target::kRole};
  Permissions allow;
  Permissions deny;
};

struct Channel {
  ChannelId id{0};
  ChannelKind kind{ChannelKind::kGuildText};
  std::optional<GuildId> guild_id;
  std::string name;
  std::vector<PermissionOverwrite> overwrites;

  // Categories and private channels are not places a command can be sent in.
  bool is_guild_channel() const {
    return kind != ChannelKind::kDirect && kind != ChannelKind::kGroupDirect && kind != ChannelKind::kGuildCategory;
  }
};

struct Guild {
  GuildId id{0};
  UserId owner_id{0};
  std::string name;
  std::unordered_map<RoleId, Role> roles;
  std::unordered_map<ChannelId, Channel> channels;
  std::unordered_map<UserId, Member> members;

  Permissions member_permissions(const Member& member) const {
    if (member.user.id == owner_id) {
      return Permissions::all();
    }
    const auto everyone = roles.find(id);
    if (everyone == roles.end()) {
      throw PlatformError("guild " + std::to_string(id) + " has no @everyone role in cache");
    }
    Permissions perms = everyone->second.permissions;
    for (const RoleId role_id : member.roles) {
      const auto it = roles.find(role_id);
      if (it != roles.end()) {
        perms |= it->second.permissions;
      }
    }
    if (perms.contains(permission::kAdministrator)) {
      return Permissions::all();
    }
    return perms;
  }

  Permissions member_permissions_in(const Channel& channel, const Member& member) const {
    Permissions perms = member_permissions(member);
    if (perms == Permissions::all()) {
      return perms;
    }

    for (const auto& ow : channel.overwrites) {
      if (ow.target == PermissionOverwrite::Target::kRole && ow.id == id) {
        perms &= ~ow.deny;
        perms |= ow.allow;
        break;
      }
    }

    Permissions role_allow;
    Permissions role_deny;
    for (const auto& ow : channel.overwrites) {
      if (ow.target != PermissionOverwrite::Target::kRole || ow.id == id) {
        continue;
      }
      if (std::find(member.roles.begin(), member.roles.end(), ow.id) != member.roles.end()) {
        role_allow |= ow.allow;
        role_deny |= ow.deny;
      }
    }
    perms &= ~role_deny;
    perms |= role_allow;

    for (const auto& ow : channel.overwrites) {
      if (ow.target == PermissionOverwrite::Target::kMember && ow.id == member.user.id) {
        perms &= ~ow.deny;
        perms |= ow.allow;
        break;
      }
    }
    return perms;
  }
};

struct Ready {
  User user;
  std::string session_id;
  std::vector<GuildId> guilds;
  Snowflake application_id{0};
};

struct CommandDataOption {
  std::string name;
  int kind{0};
  json value;
  std::vector<CommandDataOption> options;

  bool is_subcommand() const { return kind == 1 || kind == 2; }
};

enum class InteractionKind { kPing = 1, kApplicationCommand = 2, kMessageComponent = 3 };

struct Interaction {
  Snowflake id{0};
  Snowflake application_id{0};
  InteractionKind kind{InteractionKind::kApplicationCommand};
  std::string token;
  std::optional<GuildId> guild_id;
  ChannelId channel_id{0};
  User user;
  std::optional<Member> member;
  Snowflake command_id{0};
  std::string command_name;
  std::vector<CommandDataOption> options;
};

}  // namespace parley
