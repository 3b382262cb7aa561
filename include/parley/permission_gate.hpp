#pragma once

#include <optional>
#include <string>
#include <unordered_set>

#include "parley/common.hpp"
#include "parley/model.hpp"
#include "parley/platform.hpp"

namespace parley {

// Where an invocation happened and who made it.
struct InvocationScope {
  UserId author_id{0};
  std::optional<GuildId> guild_id;
  ChannelId channel_id{0};
};

// Whether the invoking member holds `required` in the invocation channel.
// Every failure to establish that denies; nothing is thrown.
inline bool check_permissions(Platform& platform, const InvocationScope& scope, Permissions required) {
  if (required.empty()) {
    return true;
  }
  // Direct messages have no permission concept.
  if (!scope.guild_id) {
    return true;
  }

  const std::shared_ptr<const Guild> guild = platform.cached_guild(*scope.guild_id);
  if (!guild) {
    Logger::log(Logger::Level::kDebug,
                "Guild " + std::to_string(*scope.guild_id) + " not in cache, denying invocation");
    return false;
  }

  const auto channel = guild->channels.find(scope.channel_id);
  if (channel == guild->channels.end()) {
    Logger::log(Logger::Level::kDebug,
                "Channel " + std::to_string(scope.channel_id) + " not in guild cache, denying invocation");
    return false;
  }
  if (!channel->second.is_guild_channel()) {
    Logger::log(Logger::Level::kWarn,
                "Guild message was supposedly sent in a non-guild channel, denying invocation");
    return false;
  }

  Member member;
  const auto cached = guild->members.find(scope.author_id);
  if (cached != guild->members.end()) {
    member = cached->second;
  } else {
    try {
      member = platform.fetch_member(*scope.guild_id, scope.author_id);
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kDebug, std::string("Member lookup failed, denying invocation: ") + e.what());
      return false;
    }
  }

  try {
    return platform.permissions_in(*guild, channel->second, member).contains(required);
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kDebug, std::string("Permission computation failed, denying invocation: ") + e.what());
    return false;
  }
}

// Owners-only is decided first; the permission lookup only runs for
// invocations that pass it.
inline bool authorize(Platform& platform, const InvocationScope& scope, const std::unordered_set<UserId>& owners,
                      Permissions required, bool owners_only) {
  if (owners_only && owners.count(scope.author_id) == 0) {
    return false;
  }
  return check_permissions(platform, scope, required);
}

}  // namespace parley
