#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "parley/common.hpp"
#include "parley/platform.hpp"

namespace parley {

// The platform shows a typing indicator for about ten seconds per broadcast.
inline constexpr std::chrono::seconds kTypingRenewInterval{7};

// Shows "bot is typing" in a channel while it is alive. Nothing is broadcast
// if the object is destroyed before `delay` has passed.
class TypingBroadcaster {
 public:
  TypingBroadcaster(Platform& platform, ChannelId channel_id, std::chrono::milliseconds delay,
                    std::chrono::milliseconds renew = kTypingRenewInterval)
      : platform_(platform), channel_id_(channel_id) {
    worker_ = std::thread([this, delay, renew]() { loop(delay, renew); });
  }

  ~TypingBroadcaster() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      done_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  TypingBroadcaster(const TypingBroadcaster&) = delete;
  TypingBroadcaster& operator=(const TypingBroadcaster&) = delete;

 private:
  void loop(std::chrono::milliseconds delay, std::chrono::milliseconds renew) {
    std::unique_lock<std::mutex> lock(mu_);
    if (cv_.wait_for(lock, delay, [this]() { return done_; })) {
      return;
    }
    while (true) {
      lock.unlock();
      try {
        platform_.broadcast_typing(channel_id_);
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kWarn, std::string("Typing broadcast failed: ") + e.what());
      }
      lock.lock();
      if (cv_.wait_for(lock, renew, [this]() { return done_; })) {
        return;
      }
    }
  }

  Platform& platform_;
  ChannelId channel_id_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool done_{false};
  std::thread worker_;
};

}  // namespace parley
