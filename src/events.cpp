#include "events.hpp"

const char* to_string(FolderState state) {
  switch(state) {
    case FolderState::Idle: return "idle";
    case FolderState::Scanning: return "scanning";
    case FolderState::Syncing: return "syncing";
    case FolderState::Error: return "error";
  }
  return "unknown";
}

EventSink::Subscription::Subscription(Subscription&& other) noexcept
  : registry_(std::move(other.registry_)), id_(other.id_) {
  other.id_ = 0;
}

EventSink::Subscription& EventSink::Subscription::operator=(Subscription&& other) noexcept {
  if(this != &other) {
    reset();
    registry_ = std::move(other.registry_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

EventSink::Subscription::~Subscription() {
  reset();
}

void EventSink::Subscription::reset() {
  if(id_ == 0) return;
  if(auto registry = registry_.lock()) {
    std::lock_guard<std::mutex> lock(registry->mutex);
    registry->handlers.erase(id_);
  }
  registry_.reset();
  id_ = 0;
}

EventSink::EventSink() : registry_(std::make_shared<Registry>()) {}

EventSink::Subscription EventSink::subscribe(Handler handler) {
  if(!handler) return Subscription();
  std::lock_guard<std::mutex> lock(registry_->mutex);
  const auto id = registry_->next_id++;
  registry_->handlers.emplace(id, std::move(handler));
  return Subscription(registry_, id);
}

void EventSink::publish(const Event& event) const {
  std::vector<Handler> snapshot;
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    snapshot.reserve(registry_->handlers.size());
    for(const auto& entry : registry_->handlers) {
      snapshot.push_back(entry.second);
    }
  }
  for(auto& handler : snapshot) {
    handler(event);
  }
}
