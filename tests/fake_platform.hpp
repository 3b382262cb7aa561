#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "parley/platform.hpp"

namespace parley::testing {

// In-memory Platform that records every outgoing call.
class FakePlatform : public Platform {
 public:
  struct Sent {
    ChannelId channel_id;
    CreateMessage message;
  };
  struct Edited {
    ChannelId channel_id;
    MessageId message_id;
    EditMessage edit;
  };
  struct Deleted {
    ChannelId channel_id;
    MessageId message_id;
  };

  void add_guild(Guild guild) {
    std::lock_guard<std::mutex> lock(mu_);
    guilds_[guild.id] = std::make_shared<const Guild>(std::move(guild));
  }

  void add_remote_member(GuildId guild_id, Member member) {
    std::lock_guard<std::mutex> lock(mu_);
    remote_members_[guild_id][member.user.id] = std::move(member);
  }

  std::shared_ptr<const Guild> cached_guild(GuildId id) const override {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = guilds_.find(id);
    return it == guilds_.end() ? nullptr : it->second;
  }

  Member fetch_member(GuildId guild_id, UserId user_id) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++member_fetches;
    const auto g = remote_members_.find(guild_id);
    if (g != remote_members_.end()) {
      const auto m = g->second.find(user_id);
      if (m != g->second.end()) {
        return m->second;
      }
    }
    throw PlatformError("Unknown Member", 404);
  }

  Message send_message(ChannelId channel_id, const CreateMessage& msg) override {
    std::lock_guard<std::mutex> lock(mu_);
    if (fail_sends) {
      throw PlatformError("send refused", 403);
    }
    sent.push_back(Sent{channel_id, msg});
    Message m;
    m.id = next_id_++;
    m.channel_id = channel_id;
    m.content = msg.content.value_or("");
    m.author.id = bot_user_id;
    m.author.bot = true;
    m.timestamp = Clock::now();
    if (msg.embed) {
      m.embeds.push_back(*msg.embed);
    }
    return m;
  }

  Message edit_message(ChannelId channel_id, MessageId message_id, const EditMessage& edit) override {
    std::lock_guard<std::mutex> lock(mu_);
    edited.push_back(Edited{channel_id, message_id, edit});
    Message m;
    m.id = message_id;
    m.channel_id = channel_id;
    m.content = edit.content;
    m.embeds = edit.embeds;
    m.author.id = bot_user_id;
    m.author.bot = true;
    m.timestamp = Clock::now();
    m.edited_timestamp = Clock::now();
    return m;
  }

  void delete_message(ChannelId channel_id, MessageId message_id) override {
    std::lock_guard<std::mutex> lock(mu_);
    deleted.push_back(Deleted{channel_id, message_id});
    if (fail_deletes) {
      throw PlatformError("Missing Access", 403);
    }
  }

  void broadcast_typing(ChannelId channel_id) override {
    std::lock_guard<std::mutex> lock(mu_);
    typing.push_back(channel_id);
  }

  void create_interaction_response(const Interaction& interaction, const CreateReply& reply) override {
    std::lock_guard<std::mutex> lock(mu_);
    interaction_responses.emplace_back(interaction.id, reply);
  }

  Message create_followup_message(const Interaction& interaction, const CreateReply& reply) override {
    std::lock_guard<std::mutex> lock(mu_);
    followups.emplace_back(interaction.id, reply);
    Message m;
    m.id = next_id_++;
    m.channel_id = interaction.channel_id;
    m.content = reply.content.value_or("");
    return m;
  }

  void observe(const Event& event) override {
    std::lock_guard<std::mutex> lock(mu_);
    observed.push_back(event_name(event));
  }

  std::size_t typing_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return typing.size();
  }

  UserId bot_user_id{1000};
  bool fail_sends{false};
  bool fail_deletes{false};
  int member_fetches{0};

  std::vector<Sent> sent;
  std::vector<Edited> edited;
  std::vector<Deleted> deleted;
  std::vector<ChannelId> typing;
  std::vector<std::pair<Snowflake, CreateReply>> interaction_responses;
  std::vector<std::pair<Snowflake, CreateReply>> followups;
  std::vector<std::string> observed;

 private:
  mutable std::mutex mu_;
  std::unordered_map<GuildId, std::shared_ptr<const Guild>> guilds_;
  std::unordered_map<GuildId, std::unordered_map<UserId, Member>> remote_members_;
  MessageId next_id_{900000};
};

}  // namespace parley::testing
