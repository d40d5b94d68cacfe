#include "version_vector.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

#include "utils.hpp"

const char* to_string(Ordering ordering) {
  switch(ordering) {
    case Ordering::Equal: return "equal";
    case Ordering::Older: return "older";
    case Ordering::Newer: return "newer";
    case Ordering::Concurrent: return "concurrent";
  }
  return "unknown";
}

uint64_t VersionVector::counter(const std::string& device) const {
  auto it = counters_.find(device);
  return it == counters_.end() ? 0 : it->second;
}

VersionVector VersionVector::updated(const std::string& device, uint64_t now_seconds) const {
  VersionVector out = *this;
  auto next = std::max(counter(device) + 1, now_seconds);
  out.counters_[device] = next;
  return out;
}

VersionVector VersionVector::updated(const std::string& device) const {
  auto now = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  return updated(device, static_cast<uint64_t>(now));
}

VersionVector VersionVector::merged(const VersionVector& other) const {
  VersionVector out = *this;
  for(const auto& kv : other.counters_) {
    auto& slot = out.counters_[kv.first];
    slot = std::max(slot, kv.second);
  }
  return out;
}

void VersionVector::set(const std::string& device, uint64_t value) {
  if(value == 0) {
    counters_.erase(device);
  } else {
    counters_[device] = value;
  }
}

Ordering VersionVector::compare(const VersionVector& other) const {
  bool some_greater = false;
  bool some_lesser = false;

  // Both maps are sorted by device; walk them together.
  auto a = counters_.begin();
  auto b = other.counters_.begin();
  while(a != counters_.end() || b != other.counters_.end()) {
    uint64_t left = 0;
    uint64_t right = 0;
    if(b == other.counters_.end() || (a != counters_.end() && a->first < b->first)) {
      left = a->second;
      ++a;
    } else if(a == counters_.end() || b->first < a->first) {
      right = b->second;
      ++b;
    } else {
      left = a->second;
      right = b->second;
      ++a;
      ++b;
    }
    if(left > right) some_greater = true;
    if(left < right) some_lesser = true;
    if(some_greater && some_lesser) return Ordering::Concurrent;
  }

  if(some_greater) return Ordering::Newer;
  if(some_lesser) return Ordering::Older;
  return Ordering::Equal;
}

bool VersionVector::dominates_or_equals(const VersionVector& other) const {
  auto ordering = compare(other);
  return ordering == Ordering::Equal || ordering == Ordering::Newer;
}

std::string VersionVector::to_string() const {
  std::ostringstream oss;
  oss << "{";
  bool first = true;
  for(const auto& kv : counters_) {
    if(!first) oss << ",";
    oss << kv.first << ":" << kv.second;
    first = false;
  }
  oss << "}";
  return oss.str();
}

std::string VersionVector::fingerprint() const {
  return sha256_hex(to_string()).substr(0, 16);
}

nlohmann::json VersionVector::to_json() const {
  nlohmann::json j = nlohmann::json::object();
  for(const auto& kv : counters_) {
    j[kv.first] = kv.second;
  }
  return j;
}

VersionVector VersionVector::from_json(const nlohmann::json& j) {
  VersionVector out;
  if(!j.is_object()) return out;
  for(const auto& item : j.items()) {
    if(!item.value().is_number_unsigned()) continue;
    out.set(item.key(), item.value().get<uint64_t>());
  }
  return out;
}
