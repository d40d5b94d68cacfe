#include "versioner.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <vector>

#include "filesystem.hpp"

namespace {

int64_t unix_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

bool all_digits(const std::string& value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
}

} // namespace

std::string versions_dir() {
  return std::string(kInternalDirName) + "/versions";
}

TrashcanVersioner::TrashcanVersioner(Filesystem& fs) : fs_(fs) {}

void TrashcanVersioner::archive(const std::string& name, std::error_code& ec) {
  auto destination = versions_dir() + "/" + name;
  make_parents(fs_, destination, ec);
  if(ec) return;
  std::error_code remove_ec;
  fs_.remove(destination, remove_ec); // previous copy, if any
  fs_.rename(name, destination, ec);
}

SimpleVersioner::SimpleVersioner(Filesystem& fs, int keep)
  : fs_(fs), keep_(std::max(1, keep)) {}

void SimpleVersioner::archive(const std::string& name, std::error_code& ec) {
  auto base = versions_dir() + "/" + name + "." + std::to_string(unix_seconds());
  make_parents(fs_, base, ec);
  if(ec) return;

  // Several archives within the same second get a counter.
  std::string destination = base;
  for(int n = 1; ; ++n) {
    std::error_code stat_ec;
    if(!fs_.lstat(destination, stat_ec)) break;
    destination = base + "-" + std::to_string(n);
  }
  fs_.rename(name, destination, ec);
  if(ec) return;
  prune(name);
}

void SimpleVersioner::prune(const std::string& archived_name) {
  auto dir = parent_name(versions_dir() + "/" + archived_name);
  auto prefix = base_name(archived_name) + ".";

  std::error_code ec;
  auto entries = fs_.read_dir(dir, ec);
  if(ec) return;

  std::vector<std::string> versions;
  for(const auto& entry : entries) {
    if(entry.rfind(prefix, 0) != 0) continue;
    auto suffix = entry.substr(prefix.size());
    auto dash = suffix.find('-');
    if(!all_digits(suffix.substr(0, dash))) continue;
    versions.push_back(entry);
  }
  if(versions.size() <= static_cast<std::size_t>(keep_)) return;

  // Same-width timestamps sort lexically; counters sort after their base.
  std::sort(versions.begin(), versions.end());
  const auto excess = versions.size() - static_cast<std::size_t>(keep_);
  for(std::size_t i = 0; i < excess; ++i) {
    std::error_code remove_ec;
    fs_.remove(dir + "/" + versions[i], remove_ec);
  }
}

std::unique_ptr<Versioner> make_versioner(const std::string& type, Filesystem& fs, int keep) {
  if(type.empty() || type == "none") return nullptr;
  if(type == "trashcan") return std::make_unique<TrashcanVersioner>(fs);
  if(type == "simple") return std::make_unique<SimpleVersioner>(fs, keep);
  throw std::runtime_error("Unknown versioning type '" + type + "'");
}
