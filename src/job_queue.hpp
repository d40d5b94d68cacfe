#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Bounded blocking FIFO. push() waits while the queue is full, pop() while it
// is empty; both give up once the queue is closed (pop still drains what is
// left).
template<typename T>
class JobQueue {
public:
  explicit JobQueue(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

  bool push(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [&]{ return closed_ || items_.size() < capacity_; });
    if(closed_) return false;
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [&]{ return closed_ || !items_.empty(); });
    if(items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  std::size_t capacity() const { return capacity_; }

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<T> items_;
  bool closed_ = false;
};

// Fixed set of threads draining one JobQueue.
template<typename T>
class WorkerPool {
public:
  using Handler = std::function<void(T&)>;

  WorkerPool(std::size_t workers, Handler handler)
    : queue_(workers ? workers : 1),
      handler_(std::move(handler)) {
    const std::size_t count = workers ? workers : 1;
    threads_.reserve(count);
    for(std::size_t i = 0; i < count; ++i) {
      threads_.emplace_back([this]{ run(); });
    }
  }

  ~WorkerPool() { stop(); }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  bool submit(T item) { return queue_.push(std::move(item)); }

  void stop() {
    queue_.close();
    for(auto& thread : threads_) {
      if(thread.joinable()) thread.join();
    }
    threads_.clear();
  }

  std::size_t size() const { return queue_.capacity(); }

private:
  void run() {
    while(auto item = queue_.pop()) {
      handler_(*item);
    }
  }

  JobQueue<T> queue_;
  Handler handler_;
  std::vector<std::thread> threads_;
};
