#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "parley/common.hpp"
#include "parley/edit_tracker.hpp"
#include "parley/metrics.hpp"

namespace parley {

inline constexpr std::chrono::seconds kEditTrackerPurgeInterval{60};

// Runs a callback on a background thread every `interval` until stopped.
// stop() interrupts the wait between cycles; a cycle already running is
// allowed to finish.
class PeriodicTask {
 public:
  using Callback = std::function<void()>;

  PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback cb)
      : name_(std::move(name)), interval_(interval), cb_(std::move(cb)) {}

  ~PeriodicTask() { stop(); }

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ = std::thread([this]() { loop(); });
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(wait_mu_);
      if (!running_.exchange(false)) {
        return;
      }
    }
    cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  bool running() const { return running_.load(); }

 private:
  void loop() {
    while (running_.load()) {
      try {
        if (cb_) {
          cb_();
        }
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, name_ + " failed: " + e.what());
      }

      std::unique_lock<std::mutex> lock(wait_mu_);
      const bool stopped = cv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
      if (stopped) {
        break;
      }
    }
  }

  std::string name_;
  std::chrono::milliseconds interval_;
  Callback cb_;
  std::atomic<bool> running_{false};
  std::thread worker_;
  std::mutex wait_mu_;
  std::condition_variable cv_;
};

inline std::unique_ptr<PeriodicTask> make_purge_task(std::shared_ptr<EditTracker> tracker,
                                                     std::chrono::milliseconds interval = kEditTrackerPurgeInterval) {
  return std::make_unique<PeriodicTask>("Edit tracker purge", interval, [tracker]() {
    const std::size_t removed = tracker->purge();
    if (removed > 0) {
      metrics().inc("edit_tracker.purged", removed);
    }
    Logger::log(Logger::Level::kDebug, "Edit tracker purge removed " + std::to_string(removed) + " entries, " +
                                           std::to_string(tracker->size()) + " remain");
  });
}

}  // namespace parley
