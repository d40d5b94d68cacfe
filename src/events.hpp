#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

enum class FolderState { Idle, Scanning, Syncing, Error };

const char* to_string(FolderState state);

struct FolderError {
  std::string folder;
  std::string name;   // empty for folder-wide errors
  std::string error;
};

struct LocalIndexUpdated {
  std::string folder;
  std::vector<std::string> names;
};

struct RemoteIndexUpdated {
  std::string folder;
  std::string device;
  std::size_t files = 0;
  bool full = false;
};

struct ItemFinished {
  std::string folder;
  std::string name;
  std::string action; // "update", "delete", "metadata"
  std::string error;  // empty on success
};

struct StateChanged {
  std::string folder;
  FolderState from = FolderState::Idle;
  FolderState to = FolderState::Idle;
  std::string error;
};

using Event = std::variant<FolderError,
                           LocalIndexUpdated,
                           RemoteIndexUpdated,
                           ItemFinished,
                           StateChanged>;

// Synchronous fan-out of events to subscribers. Handlers run on the
// publishing thread and must not block.
class EventSink {
  struct Registry;

public:
  using Handler = std::function<void(const Event&)>;

  // Unsubscribes when destroyed. Safe to outlive the sink.
  class Subscription {
  public:
    Subscription() = default;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    ~Subscription();

    void reset();
    bool active() const { return id_ != 0 && !registry_.expired(); }

  private:
    friend class EventSink;
    Subscription(std::weak_ptr<Registry> registry, std::size_t id)
      : registry_(std::move(registry)), id_(id) {}

    std::weak_ptr<Registry> registry_;
    std::size_t id_ = 0;
  };

  EventSink();

  [[nodiscard]] Subscription subscribe(Handler handler);
  void publish(const Event& event) const;

private:
  struct Registry {
    std::mutex mutex;
    std::unordered_map<std::size_t, Handler> handlers;
    std::atomic<std::size_t> next_id{1};
  };

  std::shared_ptr<Registry> registry_;
};
