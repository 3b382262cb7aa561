#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "parley/common.hpp"

namespace parley {

// Fixed set of workers draining a FIFO of tasks. Tasks run in no particular
// order relative to each other once more than one worker exists.
class ThreadPool {
 public:
  explicit ThreadPool(std::size_t num_threads = 4) {
    if (num_threads == 0) {
      num_threads = 1;
    }
    for (std::size_t i = 0; i < num_threads; ++i) {
      threads_.emplace_back([this]() { worker(); });
    }
    Logger::log(Logger::Level::kDebug, "Thread pool started with " + std::to_string(num_threads) + " workers");
  }

  ~ThreadPool() { shutdown(); }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Returns false once the pool is shutting down.
  bool enqueue(std::function<void()> task) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stop_) {
        Logger::log(Logger::Level::kWarn, "Cannot enqueue task: thread pool is stopped");
        return false;
      }
      tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
  }

  std::size_t size() const { return threads_.size(); }

  // Blocks until the queue is empty and no task is running.
  void wait_idle() {
    std::unique_lock<std::mutex> lock(mu_);
    idle_cv_.wait(lock, [this]() { return tasks_.empty() && active_ == 0; });
  }

  // Runs what is already queued, then joins the workers.
  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stop_) {
        return;
      }
      stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    Logger::log(Logger::Level::kDebug, "Thread pool shutdown complete");
  }

 private:
  void worker() {
    while (true) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });
        if (stop_ && tasks_.empty()) {
          return;
        }
        task = std::move(tasks_.front());
        tasks_.pop();
        ++active_;
      }

      try {
        task();
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, std::string("Thread pool task threw: ") + e.what());
      } catch (...) {
        Logger::log(Logger::Level::kError, "Thread pool task threw a non-standard exception");
      }

      {
        std::lock_guard<std::mutex> lock(mu_);
        --active_;
      }
      idle_cv_.notify_all();
    }
  }

  std::vector<std::thread> threads_;
  std::queue<std::function<void()>> tasks_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::size_t active_{0};
  bool stop_{false};
};

}  // namespace parley
