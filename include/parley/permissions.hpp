#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "parley/common.hpp"

namespace parley {

class Permissions {
 public:
  constexpr Permissions() = default;
  constexpr explicit Permissions(std::uint64_t bits) : bits_(bits) {}

  static constexpr Permissions none() { return Permissions(); }
  static constexpr Permissions all() { return Permissions(~std::uint64_t{0}); }

  constexpr std::uint64_t bits() const { return bits_; }
  constexpr bool empty() const { return bits_ == 0; }
  constexpr bool contains(Permissions other) const { return (bits_ & other.bits_) == other.bits_; }

  constexpr Permissions operator|(Permissions o) const { return Permissions(bits_ | o.bits_); }
  constexpr Permissions operator&(Permissions o) const { return Permissions(bits_ & o.bits_); }
  constexpr Permissions operator~() const { return Permissions(~bits_); }
  constexpr Permissions& operator|=(Permissions o) {
    bits_ |= o.bits_;
    return *this;
  }
  constexpr Permissions& operator&=(Permissions o) {
    bits_ &= o.bits_;
    return *this;
  }
  constexpr bool operator==(const Permissions&) const = default;

 private:
  std::uint64_t bits_{0};
};

namespace permission {

inline constexpr Permissions kCreateInstantInvite{std::uint64_t{1} << 0};
inline constexpr Permissions kKickMembers{std::uint64_t{1} << 1};
inline constexpr Permissions kBanMembers{std::uint64_t{1} << 2};
inline constexpr Permissions kAdministrator{std::uint64_t{1} << 3};
inline constexpr Permissions kManageChannels{std::uint64_t{1} << 4};
inline constexpr Permissions kManageGuild{std::uint64_t{1} << 5};
inline constexpr Permissions kAddReactions{std::uint64_t{1} << 6};
inline constexpr Permissions kViewAuditLog{std::uint64_t{1} << 7};
inline constexpr Permissions kPrioritySpeaker{std::uint64_t{1} << 8};
inline constexpr Permissions kStream{std::uint64_t{1} << 9};
inline constexpr Permissions kViewChannel{std::uint64_t{1} << 10};
inline constexpr Permissions kSendMessages{std::uint64_t{1} << 11};
inline constexpr Permissions kSendTtsMessages{std::uint64_t{1} << 12};
inline constexpr Permissions kManageMessages{std::uint64_t{1} << 13};
inline constexpr Permissions kEmbedLinks{std::uint64_t{1} << 14};
inline constexpr Permissions kAttachFiles{std::uint64_t{1} << 15};
inline constexpr Permissions kReadMessageHistory{std::uint64_t{1} << 16};
inline constexpr Permissions kMentionEveryone{std::uint64_t{1} << 17};
inline constexpr Permissions kUseExternalEmojis{std::uint64_t{1} << 18};
inline constexpr Permissions kViewGuildInsights{std::uint64_t{1} << 19};
inline constexpr Permissions kConnect{std::uint64_t{1} << 20};
inline constexpr Permissions kSpeak{std::uint64_t{1} << 21};
inline constexpr Permissions kMuteMembers{std::uint64_t{1} << 22};
inline constexpr Permissions kDeafenMembers{std::uint64_t{1} << 23};
inline constexpr Permissions kMoveMembers{std::uint64_t{1} << 24};
inline constexpr Permissions kUseVad{std::uint64_t{1} << 25};
inline constexpr Permissions kChangeNickname{std::uint64_t{1} << 26};
inline constexpr Permissions kManageNicknames{std::uint64_t{1} << 27};
inline constexpr Permissions kManageRoles{std::uint64_t{1} << 28};
inline constexpr Permissions kManageWebhooks{std::uint64_t{1} << 29};
inline constexpr Permissions kManageEmojis{std::uint64_t{1} << 30};
inline constexpr Permissions kUseSlashCommands{std::uint64_t{1} << 31};

inline constexpr std::array<std::pair<const char*, Permissions>, 32> kNamed{{
    {"CREATE_INSTANT_INVITE", kCreateInstantInvite},
    {"KICK_MEMBERS", kKickMembers},
    {"BAN_MEMBERS", kBanMembers},
    {"ADMINISTRATOR", kAdministrator},
    {"MANAGE_CHANNELS", kManageChannels},
    {"MANAGE_GUILD", kManageGuild},
    {"ADD_REACTIONS", kAddReactions},
    {"VIEW_AUDIT_LOG", kViewAuditLog},
    {"PRIORITY_SPEAKER", kPrioritySpeaker},
    {"STREAM", kStream},
    {"VIEW_CHANNEL", kViewChannel},
    {"SEND_MESSAGES", kSendMessages},
    {"SEND_TTS_MESSAGES", kSendTtsMessages},
    {"MANAGE_MESSAGES", kManageMessages},
    {"EMBED_LINKS", kEmbedLinks},
    {"ATTACH_FILES", kAttachFiles},
    {"READ_MESSAGE_HISTORY", kReadMessageHistory},
    {"MENTION_EVERYONE", kMentionEveryone},
    {"USE_EXTERNAL_EMOJIS", kUseExternalEmojis},
    {"VIEW_GUILD_INSIGHTS", kViewGuildInsights},
    {"CONNECT", kConnect},
    {"SPEAK", kSpeak},
    {"MUTE_MEMBERS", kMuteMembers},
    {"DEAFEN_MEMBERS", kDeafenMembers},
    {"MOVE_MEMBERS", kMoveMembers},
    {"USE_VAD", kUseVad},
    {"CHANGE_NICKNAME", kChangeNickname},
    {"MANAGE_NICKNAMES", kManageNicknames},
    {"MANAGE_ROLES", kManageRoles},
    {"MANAGE_WEBHOOKS", kManageWebhooks},
    {"MANAGE_EMOJIS", kManageEmojis},
    {"USE_SLASH_COMMANDS", kUseSlashCommands},
}};

}  // namespace permission

inline std::optional<Permissions> permission_from_name(const std::string& name) {
  std::string upper = trim(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  for (const auto& [n, p] : permission::kNamed) {
    if (upper == n) {
      return p;
    }
  }
  return std::nullopt;
}

// Unknown names are reported through `unknown` and contribute no bits.
inline Permissions parse_permissions(const std::vector<std::string>& names,
                                     std::vector<std::string>* unknown = nullptr) {
  Permissions out;
  for (const auto& name : names) {
    if (auto p = permission_from_name(name)) {
      out |= *p;
    } else if (unknown) {
      unknown->push_back(name);
    }
  }
  return out;
}

inline std::vector<std::string> permission_names(Permissions perms) {
  std::vector<std::string> out;
  for (const auto& [n, p] : permission::kNamed) {
    if (perms.contains(p)) {
      out.emplace_back(n);
    }
  }
  return out;
}

}  // namespace parley
