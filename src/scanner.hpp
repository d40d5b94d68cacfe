#pragma once

#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "file_info.hpp"
#include "log.hpp"

class AbortSignal;
class FileIndex;
class Filesystem;
class IgnoreMatcher;
struct FileStat;

// True if the entry on disk still looks like what the index recorded for it
// (type, size, permissions, modification time).
bool unchanged_since_scan(const FileInfo& recorded, const FileStat& st);

// Compares the folder on disk with the local index and produces the records
// to commit: new and changed entries with the local counter bumped, and
// tombstones for entries that vanished. Symlinks are recorded, never
// followed. Temporary and internal names are skipped. Ignored names are not
// walked; an indexed entry that became ignored is recorded as ignored, and
// one that stopped being ignored starts over with a local-only version.
class Scanner {
public:
  Scanner(std::string folder,
          Filesystem& fs,
          const IgnoreMatcher& ignores,
          const FileIndex& index,
          std::shared_ptr<Logger> logger);

  std::vector<FileInfo> scan(std::error_code& ec, const AbortSignal* abort = nullptr);
  // Rescans only the given names, not what lies below them.
  std::vector<FileInfo> scan_names(const std::vector<std::string>& names, std::error_code& ec);

private:
  std::optional<FileInfo> scan_entry(const std::string& name,
                                     const FileStat& st,
                                     const std::optional<FileInfo>& existing);
  FileInfo tombstone(const FileInfo& existing) const;
  FileInfo ignored_record(const FileInfo& existing) const;
  bool excluded(const std::string& name) const;

  std::string folder_;
  Filesystem& fs_;
  const IgnoreMatcher& ignores_;
  const FileIndex& index_;
  std::shared_ptr<Logger> logger_;
};
