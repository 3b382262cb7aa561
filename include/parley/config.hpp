#pragma once

#include <optional>
#include <string>
#include <vector>

#include "parley/common.hpp"
#include "parley/gateway.hpp"
#include "parley/permissions.hpp"

namespace parley {

struct DiscordConfig {
  std::string token;
  std::string api_base{"https://discord.com/api/v10"};
  int timeout_seconds{30};
};

struct EditTrackingConfig {
  bool enabled{true};
  int max_age_seconds{3600};
};

struct FrameworkConfig {
  std::string prefix{"!"};
  std::vector<std::string> additional_prefixes;
  std::vector<std::string> regex_prefixes;
  bool mention_as_prefix{true};
  bool case_insensitive_commands{true};
  bool execute_self_messages{false};
  EditTrackingConfig edit_tracking{};
  bool track_edits_by_default{false};
  // Negative disables the typing indicator.
  int typing_delay_ms{-1};
  std::vector<UserId> owners;
  std::vector<std::string> required_permissions;
  bool owners_only{false};
  int worker_threads{4};
  std::string log_level{"info"};
  bool log_json{false};
};

struct Config {
  DiscordConfig discord{};
  FrameworkConfig framework{};
};

inline std::string resolve_env_ref(const std::string& value) {
  if (value.empty()) {
    return "";
  }

  // Supports "$ENV_NAME" and "${ENV_NAME}".
  if (value[0] != '$') {
    return value;
  }

  std::string env_name = value.substr(1);
  if (!env_name.empty() && env_name.front() == '{' && env_name.back() == '}') {
    env_name = env_name.substr(1, env_name.size() - 2);
  }
  if (env_name.empty()) {
    return value;
  }

  const char* v = std::getenv(env_name.c_str());
  return (v && *v) ? std::string(v) : "";
}

inline fs::path get_data_dir() {
  return expand_user_path("~/.parley");
}

inline fs::path get_config_path() {
  return get_data_dir() / "config.json";
}

inline json default_config_json() {
  return json{
      {"discord", {{"token", "$DISCORD_TOKEN"}, {"apiBase", "https://discord.com/api/v10"}, {"timeoutSeconds", 30}}},
      {"framework",
       {
           {"prefix", "!"},
           {"additionalPrefixes", json::array()},
           {"regexPrefixes", json::array()},
           {"mentionAsPrefix", true},
           {"caseInsensitiveCommands", true},
           {"executeSelfMessages", false},
           {"editTracking", {{"enabled", true}, {"maxAgeSeconds", 3600}}},
           {"trackEditsByDefault", false},
           {"typingDelayMs", -1},
           {"owners", json::array()},
           {"requiredPermissions", json::array()},
           {"ownersOnly", false},
           {"workerThreads", 4},
           {"logLevel", "info"},
           {"logJson", false},
       }},
  };
}

inline std::vector<std::string> string_list(const json& arr) {
  std::vector<std::string> out;
  if (!arr.is_array()) {
    return out;
  }
  for (const auto& item : arr) {
    if (item.is_string()) {
      out.push_back(item.get<std::string>());
    }
  }
  return out;
}

// Reads a config document. Keys that are absent keep their defaults.
inline Config parse_config(const json& root) {
  Config cfg{};
  if (!root.is_object()) {
    return cfg;
  }

  if (root.contains("discord") && root["discord"].is_object()) {
    const auto& d = root["discord"];
    cfg.discord.token = resolve_env_ref(d.value("token", cfg.discord.token));
    cfg.discord.api_base = d.value("apiBase", cfg.discord.api_base);
    cfg.discord.timeout_seconds = d.value("timeoutSeconds", cfg.discord.timeout_seconds);
  }

  if (root.contains("framework") && root["framework"].is_object()) {
    const auto& f = root["framework"];
    auto& fw = cfg.framework;
    fw.prefix = f.value("prefix", fw.prefix);
    if (f.contains("additionalPrefixes")) {
      fw.additional_prefixes = string_list(f["additionalPrefixes"]);
    }
    if (f.contains("regexPrefixes")) {
      fw.regex_prefixes = string_list(f["regexPrefixes"]);
    }
    fw.mention_as_prefix = f.value("mentionAsPrefix", fw.mention_as_prefix);
    fw.case_insensitive_commands = f.value("caseInsensitiveCommands", fw.case_insensitive_commands);
    fw.execute_self_messages = f.value("executeSelfMessages", fw.execute_self_messages);
    if (f.contains("editTracking") && f["editTracking"].is_object()) {
      const auto& et = f["editTracking"];
      fw.edit_tracking.enabled = et.value("enabled", fw.edit_tracking.enabled);
      fw.edit_tracking.max_age_seconds = et.value("maxAgeSeconds", fw.edit_tracking.max_age_seconds);
    }
    fw.track_edits_by_default = f.value("trackEditsByDefault", fw.track_edits_by_default);
    fw.typing_delay_ms = f.value("typingDelayMs", fw.typing_delay_ms);
    if (f.contains("owners") && f["owners"].is_array()) {
      fw.owners.clear();
      for (const auto& item : f["owners"]) {
        if (auto id = parse_snowflake(item)) {
          fw.owners.push_back(*id);
        } else {
          Logger::log(Logger::Level::kWarn, "Ignoring invalid owner id in config: " + item.dump());
        }
      }
    }
    if (f.contains("requiredPermissions")) {
      fw.required_permissions = string_list(f["requiredPermissions"]);
    }
    fw.owners_only = f.value("ownersOnly", fw.owners_only);
    fw.worker_threads = f.value("workerThreads", fw.worker_threads);
    fw.log_level = f.value("logLevel", fw.log_level);
    fw.log_json = f.value("logJson", fw.log_json);
  }
  return cfg;
}

inline Config load_config(const fs::path& path = get_config_path()) {
  const std::string raw = read_text_file(path);
  if (raw.empty()) {
    return Config{};
  }
  try {
    return parse_config(json::parse(raw));
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kWarn, std::string("Failed to parse config: ") + e.what());
  }
  return Config{};
}

inline bool save_default_config(const fs::path& path = get_config_path()) {
  return write_text_file(path, default_config_json().dump(2));
}

// Applies the logging keys to the process-wide logger.
inline void apply_logging_config(const FrameworkConfig& fw) {
  if (auto level = Logger::parse_level(fw.log_level)) {
    Logger::set_min_level(*level);
  } else {
    Logger::log(Logger::Level::kWarn, "Unknown log level in config: " + fw.log_level);
  }
  const char* env = std::getenv("PARLEY_LOG_JSON");
  Logger::set_json(fw.log_json || (env && *env && std::string(env) != "0"));
}

}  // namespace parley
