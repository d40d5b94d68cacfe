#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

// One-shot broadcast cancellation shared by every worker of a pull job.
// close() may be called any number of times; only the first reason sticks.
class AbortSignal {
public:
  void close(const std::string& reason = "aborted") {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(closed_.load(std::memory_order_relaxed)) return;
      reason_ = reason;
      closed_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  bool closed() const {
    return closed_.load(std::memory_order_acquire);
  }

  // Waits up to timeout; returns true if the signal is closed.
  bool wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]{ return closed(); });
  }

  std::string reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
  }

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<bool> closed_{false};
  std::string reason_;
};
