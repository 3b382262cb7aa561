#pragma once

#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "parley/common.hpp"
#include "parley/events.hpp"
#include "parley/model.hpp"

namespace parley {

// Snowflakes arrive as decimal strings; some fixtures use plain numbers.
inline std::optional<Snowflake> parse_snowflake(const json& v) {
  if (v.is_number_unsigned()) {
    return v.get<std::uint64_t>();
  }
  if (v.is_number_integer()) {
    const auto n = v.get<long long>();
    return n >= 0 ? std::optional<Snowflake>(static_cast<Snowflake>(n)) : std::nullopt;
  }
  if (!v.is_string()) {
    return std::nullopt;
  }
  try {
    std::size_t used = 0;
    const std::string s = v.get<std::string>();
    const auto n = std::stoull(s, &used);
    if (used != s.size()) {
      return std::nullopt;
    }
    return n;
  } catch (...) {
    return std::nullopt;
  }
}

inline Snowflake snowflake_field(const json& obj, const char* key) {
  if (!obj.contains(key)) {
    return 0;
  }
  return parse_snowflake(obj[key]).value_or(0);
}

inline std::optional<Snowflake> optional_snowflake_field(const json& obj, const char* key) {
  if (!obj.contains(key) || obj[key].is_null()) {
    return std::nullopt;
  }
  return parse_snowflake(obj[key]);
}

// Accepts "2021-05-01T12:34:56", optional fraction and a "Z" or "+hh:mm"
// suffix.
inline std::optional<Timestamp> parse_timestamp(const std::string& text) {
  int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &y, &mo, &d, &h, &mi, &s, &consumed) != 6) {
    return std::nullopt;
  }
  using namespace std::chrono;
  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  std::size_t pos = static_cast<std::size_t>(consumed);
  microseconds fraction{0};
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    long long value = 0;
    int digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 6) {
        value = value * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    while (digits < 6) {
      value *= 10;
      ++digits;
    }
    fraction = microseconds{value};
  }

  minutes offset{0};
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    const int sign = text[pos] == '-' ? -1 : 1;
    int oh = 0, om = 0;
    if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
      return std::nullopt;
    }
    offset = minutes{sign * (oh * 60 + om)};
  }

  const sys_days days{ymd};
  const auto tp = days + hours{h} + minutes{mi} + seconds{s} + fraction - offset;
  return time_point_cast<Clock::duration>(tp);
}

inline User parse_user(const json& j) {
  User u;
  u.id = snowflake_field(j, "id");
  u.name = j.value("username", "");
  u.discriminator = j.value("discriminator", "");
  u.bot = j.value("bot", false);
  return u;
}

inline std::vector<User> parse_users(const json& arr) {
  std::vector<User> out;
  if (!arr.is_array()) {
    return out;
  }
  for (const auto& item : arr) {
    if (item.is_object()) {
      out.push_back(parse_user(item));
    }
  }
  return out;
}

inline std::vector<Snowflake> parse_snowflakes(const json& arr) {
  std::vector<Snowflake> out;
  if (!arr.is_array()) {
    return out;
  }
  for (const auto& item : arr) {
    if (auto id = parse_snowflake(item)) {
      out.push_back(*id);
    }
  }
  return out;
}

inline Attachment parse_attachment(const json& j) {
  Attachment a;
  a.id = snowflake_field(j, "id");
  a.filename = j.value("filename", "");
  a.url = j.value("url", "");
  a.size = j.value("size", std::uint64_t{0});
  a.content_type = j.value("content_type", "");
  return a;
}

inline std::vector<Attachment> parse_attachments(const json& arr) {
  std::vector<Attachment> out;
  if (!arr.is_array()) {
    return out;
  }
  for (const auto& item : arr) {
    if (item.is_object()) {
      out.push_back(parse_attachment(item));
    }
  }
  return out;
}

inline std::vector<json> parse_embeds(const json& arr) {
  std::vector<json> out;
  if (!arr.is_array()) {
    return out;
  }
  for (const auto& item : arr) {
    out.push_back(item);
  }
  return out;
}

inline std::optional<Timestamp> timestamp_field(const json& obj, const char* key) {
  if (!obj.contains(key) || !obj[key].is_string()) {
    return std::nullopt;
  }
  return parse_timestamp(obj[key].get<std::string>());
}

inline Message parse_message(const json& j) {
  Message m;
  m.id = snowflake_field(j, "id");
  m.channel_id = snowflake_field(j, "channel_id");
  m.guild_id = optional_snowflake_field(j, "guild_id");
  m.kind = j.value("type", 0);
  m.content = j.value("content", "");
  m.tts = j.value("tts", false);
  m.pinned = j.value("pinned", false);
  m.timestamp = timestamp_field(j, "timestamp").value_or(Timestamp{});
  m.edited_timestamp = timestamp_field(j, "edited_timestamp");
  if (j.contains("author") && j["author"].is_object()) {
    m.author = parse_user(j["author"]);
  }
  m.mention_everyone = j.value("mention_everyone", false);
  if (j.contains("mentions")) {
    m.mentions = parse_users(j["mentions"]);
  }
  if (j.contains("mention_roles")) {
    m.mention_roles = parse_snowflakes(j["mention_roles"]);
  }
  if (j.contains("attachments")) {
    m.attachments = parse_attachments(j["attachments"]);
  }
  if (j.contains("embeds")) {
    m.embeds = parse_embeds(j["embeds"]);
  }
  return m;
}

// Only keys present in the payload become set fields. A null
// edited_timestamp counts as absent.
inline MessageUpdate parse_message_update(const json& j) {
  MessageUpdate u;
  u.id = snowflake_field(j, "id");
  u.channel_id = snowflake_field(j, "channel_id");
  u.guild_id = optional_snowflake_field(j, "guild_id");
  if (j.contains("type") && j["type"].is_number_integer()) {
    u.kind = j["type"].get<int>();
  }
  if (j.contains("content") && j["content"].is_string()) {
    u.content = j["content"].get<std::string>();
  }
  if (j.contains("tts") && j["tts"].is_boolean()) {
    u.tts = j["tts"].get<bool>();
  }
  if (j.contains("pinned") && j["pinned"].is_boolean()) {
    u.pinned = j["pinned"].get<bool>();
  }
  u.timestamp = timestamp_field(j, "timestamp");
  u.edited_timestamp = timestamp_field(j, "edited_timestamp");
  if (j.contains("author") && j["author"].is_object()) {
    u.author = parse_user(j["author"]);
  }
  if (j.contains("mention_everyone") && j["mention_everyone"].is_boolean()) {
    u.mention_everyone = j["mention_everyone"].get<bool>();
  }
  if (j.contains("mentions") && j["mentions"].is_array()) {
    u.mentions = parse_users(j["mentions"]);
  }
  if (j.contains("mention_roles") && j["mention_roles"].is_array()) {
    u.mention_roles = parse_snowflakes(j["mention_roles"]);
  }
  if (j.contains("attachments") && j["attachments"].is_array()) {
    u.attachments = parse_attachments(j["attachments"]);
  }
  if (j.contains("embeds") && j["embeds"].is_array()) {
    u.embeds = parse_embeds(j["embeds"]);
  }
  return u;
}

inline Permissions permissions_field(const json& obj, const char* key) {
  if (!obj.contains(key)) {
    return Permissions();
  }
  return Permissions(parse_snowflake(obj[key]).value_or(0));
}

inline Role parse_role(const json& j) {
  Role r;
  r.id = snowflake_field(j, "id");
  r.name = j.value("name", "");
  r.permissions = permissions_field(j, "permissions");
  r.position = j.value("position", 0);
  return r;
}

inline Member parse_member(const json& j) {
  Member m;
  if (j.contains("user") && j["user"].is_object()) {
    m.user = parse_user(j["user"]);
  }
  if (j.contains("nick") && j["nick"].is_string()) {
    m.nick = j["nick"].get<std::string>();
  }
  if (j.contains("roles")) {
    m.roles = parse_snowflakes(j["roles"]);
  }
  return m;
}

inline Channel parse_channel(const json& j) {
  Channel c;
  c.id = snowflake_field(j, "id");
  c.kind = static_cast<ChannelKind>(j.value("type", 0));
  c.guild_id = optional_snowflake_field(j, "guild_id");
  c.name = j.value("name", "");
  if (j.contains("permission_overwrites") && j["permission_overwrites"].is_array()) {
    for (const auto& o : j["permission_overwrites"]) {
      if (!o.is_object()) {
        continue;
      }
      PermissionOverwrite ow;
      ow.id = snowflake_field(o, "id");
      ow.target = o.value("type", 0) == 1 ? PermissionOverwrite::Target::kMember : PermissionOverwrite::Target::kRole;
      ow.allow = permissions_field(o, "allow");
      ow.deny = permissions_field(o, "deny");
      c.overwrites.push_back(ow);
    }
  }
  return c;
}

inline Guild parse_guild(const json& j) {
  Guild g;
  g.id = snowflake_field(j, "id");
  g.owner_id = snowflake_field(j, "owner_id");
  g.name = j.value("name", "");
  if (j.contains("roles") && j["roles"].is_array()) {
    for (const auto& r : j["roles"]) {
      Role role = parse_role(r);
      g.roles[role.id] = std::move(role);
    }
  }
  if (j.contains("channels") && j["channels"].is_array()) {
    for (const auto& c : j["channels"]) {
      Channel channel = parse_channel(c);
      if (!channel.guild_id) {
        channel.guild_id = g.id;
      }
      g.channels[channel.id] = std::move(channel);
    }
  }
  if (j.contains("members") && j["members"].is_array()) {
    for (const auto& m : j["members"]) {
      Member member = parse_member(m);
      g.members[member.user.id] = std::move(member);
    }
  }
  return g;
}

inline std::vector<CommandDataOption> parse_command_options(const json& arr) {
  std::vector<CommandDataOption> out;
  if (!arr.is_array()) {
    return out;
  }
  for (const auto& o : arr) {
    if (!o.is_object()) {
      continue;
    }
    CommandDataOption opt;
    opt.name = o.value("name", "");
    opt.kind = o.value("type", 0);
    if (o.contains("value")) {
      opt.value = o["value"];
    }
    if (o.contains("options")) {
      opt.options = parse_command_options(o["options"]);
    }
    out.push_back(std::move(opt));
  }
  return out;
}

inline Interaction parse_interaction(const json& j) {
  Interaction i;
  i.id = snowflake_field(j, "id");
  i.application_id = snowflake_field(j, "application_id");
  i.kind = static_cast<InteractionKind>(j.value("type", 2));
  i.token = j.value("token", "");
  i.guild_id = optional_snowflake_field(j, "guild_id");
  i.channel_id = snowflake_field(j, "channel_id");
  if (j.contains("member") && j["member"].is_object()) {
    i.member = parse_member(j["member"]);
    i.user = i.member->user;
  } else if (j.contains("user") && j["user"].is_object()) {
    i.user = parse_user(j["user"]);
  }
  if (j.contains("data") && j["data"].is_object()) {
    const auto& data = j["data"];
    i.command_id = snowflake_field(data, "id");
    i.command_name = data.value("name", "");
    if (data.contains("options")) {
      i.options = parse_command_options(data["options"]);
    }
  }
  return i;
}

inline Ready parse_ready(const json& j) {
  Ready r;
  if (j.contains("user") && j["user"].is_object()) {
    r.user = parse_user(j["user"]);
  }
  r.session_id = j.value("session_id", "");
  if (j.contains("guilds") && j["guilds"].is_array()) {
    for (const auto& g : j["guilds"]) {
      if (g.is_object()) {
        r.guilds.push_back(snowflake_field(g, "id"));
      }
    }
  }
  if (j.contains("application") && j["application"].is_object()) {
    r.application_id = snowflake_field(j["application"], "id");
  }
  return r;
}

// Decodes the `d` payload of a dispatch named `type`. Throws on payloads that
// are not objects.
inline Event decode_dispatch(const std::string& type, const json& d) {
  if (!d.is_object()) {
    throw PlatformError("dispatch " + type + " has no object payload");
  }
  if (type == "READY") {
    return ReadyEvent{parse_ready(d)};
  }
  if (type == "GUILD_CREATE") {
    return GuildCreateEvent{parse_guild(d)};
  }
  if (type == "MESSAGE_CREATE") {
    return MessageCreateEvent{parse_message(d)};
  }
  if (type == "MESSAGE_UPDATE") {
    return MessageUpdateEvent{parse_message_update(d)};
  }
  if (type == "MESSAGE_DELETE") {
    return MessageDeleteEvent{snowflake_field(d, "channel_id"), snowflake_field(d, "id"),
                              optional_snowflake_field(d, "guild_id")};
  }
  if (type == "INTERACTION_CREATE") {
    return InteractionCreateEvent{parse_interaction(d)};
  }
  return UnknownEvent{type, d};
}

// One gateway frame per line. Non-dispatch frames (heartbeat acks, hello)
// yield nothing.
inline std::optional<Event> decode_frame(const std::string& line) {
  const std::string text = trim(line);
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    const json frame = json::parse(text);
    if (!frame.is_object() || frame.value("op", 0) != 0 || !frame.contains("t") || !frame["t"].is_string()) {
      return std::nullopt;
    }
    return decode_dispatch(frame["t"].get<std::string>(), frame.value("d", json::object()));
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kWarn, std::string("Gateway frame decode error: ") + e.what());
    return std::nullopt;
  }
}

}  // namespace parley
