#pragma once

#include <chrono>
#include <cstdlib>
#include <memory>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "parley/common.hpp"
#include "parley/config.hpp"
#include "parley/gateway.hpp"
#include "parley/http.hpp"
#include "parley/platform.hpp"

namespace parley {

// Platform over the Discord REST API. Guilds are cached from the
// GUILD_CREATE events passed to observe().
class RestPlatform : public Platform {
 public:
  explicit RestPlatform(DiscordConfig config)
      : config_(std::move(config)),
        api_base_(trim(config_.api_base).empty() ? "https://discord.com/api/v10" : trim(config_.api_base)) {
    while (!api_base_.empty() && api_base_.back() == '/') {
      api_base_.pop_back();
    }
  }

  void observe(const Event& event) override {
    if (const auto* guild = std::get_if<GuildCreateEvent>(&event)) {
      auto copy = std::make_shared<const Guild>(guild->guild);
      std::unique_lock lock(cache_mu_);
      guilds_[copy->id] = std::move(copy);
    } else if (const auto* ready = std::get_if<ReadyEvent>(&event)) {
      std::unique_lock lock(cache_mu_);
      application_id_ = ready->ready.application_id;
    }
  }

  std::shared_ptr<const Guild> cached_guild(GuildId id) const override {
    std::shared_lock lock(cache_mu_);
    const auto it = guilds_.find(id);
    return it == guilds_.end() ? nullptr : it->second;
  }

  Member fetch_member(GuildId guild_id, UserId user_id) override {
    const json j = call("GET", "/guilds/" + std::to_string(guild_id) + "/members/" + std::to_string(user_id));
    return parse_member(j);
  }

  Message send_message(ChannelId channel_id, const CreateMessage& msg) override {
    json payload = json::object();
    if (msg.content) {
      payload["content"] = *msg.content;
    }
    if (msg.embed) {
      payload["embeds"] = json::array({*msg.embed});
    }
    if (msg.allowed_mentions) {
      payload["allowed_mentions"] = msg.allowed_mentions->to_json();
    }
    if (msg.reference) {
      payload["message_reference"] = {{"message_id", std::to_string(*msg.reference)}};
    }
    return parse_message(call("POST", "/channels/" + std::to_string(channel_id) + "/messages", payload,
                              msg.attachments));
  }

  Message edit_message(ChannelId channel_id, MessageId message_id, const EditMessage& edit) override {
    json payload = {{"content", edit.content}, {"embeds", edit.embeds}, {"attachments", json::array()}};
    return parse_message(call("PATCH",
                              "/channels/" + std::to_string(channel_id) + "/messages/" + std::to_string(message_id),
                              payload, edit.attachments));
  }

  void delete_message(ChannelId channel_id, MessageId message_id) override {
    call("DELETE", "/channels/" + std::to_string(channel_id) + "/messages/" + std::to_string(message_id));
  }

  void broadcast_typing(ChannelId channel_id) override {
    call("POST", "/channels/" + std::to_string(channel_id) + "/typing", json::object());
  }

  void create_interaction_response(const Interaction& interaction, const CreateReply& reply) override {
    const json payload = {{"type", 4}, {"data", reply_payload(reply)}};
    call("POST", "/interactions/" + std::to_string(interaction.id) + "/" + interaction.token + "/callback", payload,
         reply.attachments);
  }

  Message create_followup_message(const Interaction& interaction, const CreateReply& reply) override {
    Snowflake app = interaction.application_id;
    if (app == 0) {
      std::shared_lock lock(cache_mu_);
      app = application_id_;
    }
    return parse_message(call("POST", "/webhooks/" + std::to_string(app) + "/" + interaction.token,
                              reply_payload(reply), reply.attachments));
  }

 private:
  static constexpr int kMaxAttempts = 3;

  static json reply_payload(const CreateReply& reply) {
    json data = json::object();
    if (reply.content) {
      data["content"] = *reply.content;
    }
    if (reply.embed) {
      data["embeds"] = json::array({*reply.embed});
    }
    if (reply.ephemeral) {
      data["flags"] = 64;
    }
    return data;
  }

  // Performs one API call, retrying rate-limited attempts. Returns the parsed
  // body, or null for empty responses. Throws PlatformError on failure.
  json call(const std::string& method, const std::string& path, const std::optional<json>& payload = std::nullopt,
            const std::vector<AttachmentFile>& files = {}) {
    if (trim(config_.token).empty()) {
      throw PlatformError("no Discord token configured");
    }
    thread_local HttpClient client;
    const std::string url = api_base_ + path;
    const std::map<std::string, std::string> auth = {{"Authorization", "Bot " + config_.token}};

    for (int attempt = 1;; ++attempt) {
      HttpResponse resp;
      if (!files.empty()) {
        std::vector<MultipartPart> parts;
        parts.push_back(MultipartPart{"payload_json", payload.value_or(json::object()).dump(), "", "application/json"});
        for (std::size_t i = 0; i < files.size(); ++i) {
          parts.push_back(MultipartPart{"files[" + std::to_string(i) + "]", files[i].data, files[i].filename,
                                        files[i].content_type});
        }
        resp = client.request_multipart(method, url, auth, parts, config_.timeout_seconds);
      } else {
        std::map<std::string, std::string> headers = auth;
        std::string body;
        if (payload) {
          headers["Content-Type"] = "application/json";
          body = payload->dump();
        }
        resp = client.request(method, url, body, headers, config_.timeout_seconds);
      }

      if (resp.status == 429 && attempt < kMaxAttempts) {
        const auto it = resp.headers.find("retry-after");
        const double wait_s = it == resp.headers.end() ? 1.0 : std::atof(it->second.c_str());
        Logger::log(Logger::Level::kDebug, "Rate limited on " + method + " " + path + ", retrying");
        std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<long long>((std::max)(0.1, wait_s) * 1000)));
        continue;
      }
      if (!resp.ok()) {
        throw PlatformError(method + " " + path + " failed: " +
                                (!resp.error.empty() ? resp.error : ("HTTP " + std::to_string(resp.status))),
                            resp.status);
      }
      if (trim(resp.body).empty()) {
        return json();
      }
      try {
        return json::parse(resp.body);
      } catch (const json::parse_error& e) {
        throw PlatformError(method + " " + path + " returned malformed JSON: " + e.what(), resp.status);
      }
    }
  }

  DiscordConfig config_;
  std::string api_base_;
  mutable std::shared_mutex cache_mu_;
  std::unordered_map<GuildId, std::shared_ptr<const Guild>> guilds_;
  Snowflake application_id_{0};
};

}  // namespace parley
