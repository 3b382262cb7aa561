#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>

namespace parley {

// Write-once value with blocking readers. Readers that arrive before the
// value is set sleep until set() or close() is called.
template <typename T>
class WriteOnceCell {
 public:
  // Returns false if a value was already stored or the cell is closed.
  bool set(T value) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (value_ || closed_) {
        return false;
      }
      value_.emplace(std::move(value));
    }
    cv_.notify_all();
    return true;
  }

  // Releases waiting readers without a value. A later set() is refused.
  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  // Blocks until the value is set or the cell is closed. The pointer stays
  // valid for the lifetime of the cell.
  const T* wait() const {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this]() { return value_.has_value() || closed_; });
    return value_ ? &*value_ : nullptr;
  }

  const T* get() const {
    std::lock_guard<std::mutex> lock(mu_);
    return value_ ? &*value_ : nullptr;
  }

 private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  std::optional<T> value_;
  bool closed_{false};
};

}  // namespace parley
