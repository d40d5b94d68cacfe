#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>

// How the left-hand vector relates to the right-hand one.
enum class Ordering {
  Equal,
  Older,      // strictly dominated
  Newer,      // strictly dominates
  Concurrent  // neither dominates
};

const char* to_string(Ordering ordering);

// Per-device edit counters. Missing devices count as zero, so a vector never
// stores zero entries.
class VersionVector {
public:
  VersionVector() = default;

  uint64_t counter(const std::string& device) const;
  bool empty() const { return counters_.empty(); }
  const std::map<std::string, uint64_t>& counters() const { return counters_; }

  // Bumps the device's counter to max(previous + 1, now_seconds).
  VersionVector updated(const std::string& device, uint64_t now_seconds) const;
  VersionVector updated(const std::string& device) const;

  // Element-wise maximum.
  VersionVector merged(const VersionVector& other) const;

  void set(const std::string& device, uint64_t value);

  Ordering compare(const VersionVector& other) const;
  bool dominates_or_equals(const VersionVector& other) const;
  bool concurrent_with(const VersionVector& other) const {
    return compare(other) == Ordering::Concurrent;
  }

  bool operator==(const VersionVector& other) const { return counters_ == other.counters_; }
  bool operator!=(const VersionVector& other) const { return counters_ != other.counters_; }

  std::string to_string() const;
  // Short hex tag, stable for equal vectors; used in temp file names.
  std::string fingerprint() const;

  nlohmann::json to_json() const;
  static VersionVector from_json(const nlohmann::json& j);

private:
  std::map<std::string, uint64_t> counters_;
};
