#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "parley/common.hpp"
#include "parley/model.hpp"

namespace parley {

// Applies the fields present in `update` to `message`. Identity fields are
// always taken from the update.
//
// Embeds are left untouched: partial updates are not trusted to carry the
// full embed list.
inline void merge_update(Message& message, const MessageUpdate& update) {
  message.id = update.id;
  message.channel_id = update.channel_id;
  message.guild_id = update.guild_id;

  if (update.kind) {
    message.kind = *update.kind;
  }
  if (update.content) {
    message.content = *update.content;
  }
  if (update.tts) {
    message.tts = *update.tts;
  }
  if (update.pinned) {
    message.pinned = *update.pinned;
  }
  if (update.timestamp) {
    message.timestamp = *update.timestamp;
  }
  if (update.edited_timestamp) {
    message.edited_timestamp = update.edited_timestamp;
  }
  if (update.author) {
    message.author = *update.author;
  }
  if (update.mention_everyone) {
    message.mention_everyone = *update.mention_everyone;
  }
  if (update.mentions) {
    message.mentions = *update.mentions;
  }
  if (update.mention_roles) {
    message.mention_roles = *update.mention_roles;
  }
  if (update.attachments) {
    message.attachments = *update.attachments;
  }
}

struct TrackedExchange {
  Message trigger;
  Message response;
};

// Remembers which bot response belongs to which user message, so that the
// response can follow edits and deletions of the user message. Entries age
// out after `max_age`, measured from the trigger's last edit.
class EditTracker {
 public:
  explicit EditTracker(std::chrono::seconds max_age) : max_age_(max_age) {}

  static std::shared_ptr<EditTracker> for_timespan(std::chrono::seconds max_age) {
    return std::make_shared<EditTracker>(max_age);
  }

  std::chrono::seconds max_age() const { return max_age_; }

  // No uniqueness check. Lookups return the earliest entry for a trigger.
  void record(Message trigger, Message response) {
    std::unique_lock lock(mu_);
    entries_.push_back(TrackedExchange{std::move(trigger), std::move(response)});
  }

  // Returns the merged copy of the tracked trigger, or a message built from
  // the update alone when the trigger is not tracked.
  Message apply_update(const MessageUpdate& update) {
    std::unique_lock lock(mu_);
    if (TrackedExchange* entry = find_locked(update.id)) {
      merge_update(entry->trigger, update);
      return entry->trigger;
    }
    Message synthesized;
    merge_update(synthesized, update);
    return synthesized;
  }

  std::optional<Message> find_response(MessageId trigger_id) const {
    std::shared_lock lock(mu_);
    const auto it = std::find_if(entries_.begin(), entries_.end(),
                                 [trigger_id](const TrackedExchange& e) { return e.trigger.id == trigger_id; });
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->response;
  }

  std::optional<Message> find_trigger(MessageId trigger_id) const {
    std::shared_lock lock(mu_);
    const auto it = std::find_if(entries_.begin(), entries_.end(),
                                 [trigger_id](const TrackedExchange& e) { return e.trigger.id == trigger_id; });
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->trigger;
  }

  // Runs `fn` on the tracked response under the write lock. Returns false if
  // the trigger is no longer tracked.
  bool update_response(MessageId trigger_id, const std::function<void(Message&)>& fn) {
    std::unique_lock lock(mu_);
    TrackedExchange* entry = find_locked(trigger_id);
    if (!entry) {
      return false;
    }
    fn(entry->response);
    return true;
  }

  // Removes the exchange for `trigger_id` and hands back its response.
  std::optional<Message> take_response(MessageId trigger_id) {
    std::unique_lock lock(mu_);
    const auto it = std::find_if(entries_.begin(), entries_.end(),
                                 [trigger_id](const TrackedExchange& e) { return e.trigger.id == trigger_id; });
    if (it == entries_.end()) {
      return std::nullopt;
    }
    Message response = std::move(it->response);
    entries_.erase(it);
    return response;
  }

  // Drops every exchange whose age is at least max_age. A trigger dated in
  // the future has no meaningful age and is dropped as well.
  std::size_t purge(Timestamp now = Clock::now()) {
    std::unique_lock lock(mu_);
    const auto before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const TrackedExchange& e) {
                                    const auto age = now - e.trigger.last_update();
                                    return age < Clock::duration::zero() || age >= max_age_;
                                  }),
                   entries_.end());
    return before - entries_.size();
  }

  std::size_t size() const {
    std::shared_lock lock(mu_);
    return entries_.size();
  }

 private:
  TrackedExchange* find_locked(MessageId trigger_id) {
    const auto it = std::find_if(entries_.begin(), entries_.end(),
                                 [trigger_id](const TrackedExchange& e) { return e.trigger.id == trigger_id; });
    return it == entries_.end() ? nullptr : &*it;
  }

  std::chrono::seconds max_age_;
  mutable std::shared_mutex mu_;
  std::vector<TrackedExchange> entries_;
};

}  // namespace parley
