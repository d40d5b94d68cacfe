#include "version_resolver.hpp"

#include <iomanip>
#include <sstream>

#include "filesystem.hpp"

namespace {
constexpr const char* kConflictMarker = ".sync-conflict-";
}

const char* to_string(Resolution resolution) {
  switch(resolution) {
    case Resolution::KeepLocal: return "keep-local";
    case Resolution::TakeRemote: return "take-remote";
    case Resolution::Merge: return "merge";
    case Resolution::ConflictRemoteWins: return "conflict-remote-wins";
    case Resolution::ConflictLocalWins: return "conflict-local-wins";
  }
  return "unknown";
}

bool wins_conflict(const FileInfo& a, const FileInfo& b) {
  if(a.is_unusable() != b.is_unusable()) return !a.is_unusable();
  if(a.deleted != b.deleted) return !a.deleted;
  if(a.modified_s != b.modified_s) return a.modified_s > b.modified_s;
  if(a.modified_ns != b.modified_ns) return a.modified_ns > b.modified_ns;
  if(a.modified_by != b.modified_by) return a.modified_by > b.modified_by;
  // Only reachable for records that differ in nothing we rank by.
  return a.version.to_string() > b.version.to_string();
}

Resolution resolve(const std::optional<FileInfo>& local, const FileInfo& remote) {
  if(!local) return Resolution::TakeRemote;
  switch(remote.version.compare(local->version)) {
    case Ordering::Equal:
    case Ordering::Older:
      return Resolution::KeepLocal;
    case Ordering::Newer:
      return Resolution::TakeRemote;
    case Ordering::Concurrent:
      break;
  }
  if(local->same_content(remote)) return Resolution::Merge;
  // A local tombstone against a live remote file is not worth a conflict copy.
  if(local->deleted) return Resolution::TakeRemote;
  return wins_conflict(remote, *local) ? Resolution::ConflictRemoteWins
                                       : Resolution::ConflictLocalWins;
}

std::string conflict_name(const std::string& name, const std::string& device, std::time_t when) {
  std::tm tm{};
  gmtime_r(&when, &tm);
  std::ostringstream stamp;
  stamp << std::put_time(&tm, "%Y%m%d-%H%M%S");

  auto dir = parent_name(name);
  auto base = base_name(name);
  std::string stem = base;
  std::string ext;
  auto dot = base.rfind('.');
  if(dot != std::string::npos && dot != 0) {
    stem = base.substr(0, dot);
    ext = base.substr(dot);
  }
  std::string out = stem + kConflictMarker + stamp.str() + "-" + device + ext;
  return dir.empty() ? out : dir + "/" + out;
}

bool is_conflict_name(const std::string& name) {
  return base_name(name).find(kConflictMarker) != std::string::npos;
}

std::optional<FileInfo> find_rename_source(const std::vector<FileInfo>& candidates,
                                           const FileInfo& target) {
  if(!target.is_file() || target.blocks.empty()) return std::nullopt;
  for(const auto& candidate : candidates) {
    if(candidate.name == target.name || !candidate.is_file() || candidate.deleted || candidate.is_unusable()) continue;
    if(candidate.size == target.size && blocks_equal(candidate.blocks, target.blocks)) {
      return candidate;
    }
  }
  return std::nullopt;
}
