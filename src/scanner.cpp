#include "scanner.hpp"

#include <set>

#include "abort_signal.hpp"
#include "blocks.hpp"
#include "file_index.hpp"
#include "filesystem.hpp"
#include "ignore_matcher.hpp"

bool unchanged_since_scan(const FileInfo& recorded, const FileStat& st) {
  if(recorded.deleted || recorded.type != st.type) return false;
  switch(st.type) {
    case FileType::File:
      return recorded.size == st.size &&
             recorded.modified_s == st.modified_s &&
             recorded.modified_ns == st.modified_ns &&
             (recorded.permissions & 0777) == (st.permissions & 0777);
    case FileType::Directory:
      return (recorded.permissions & 0777) == (st.permissions & 0777);
    case FileType::Symlink:
      return true;
  }
  return false;
}

Scanner::Scanner(std::string folder,
                 Filesystem& fs,
                 const IgnoreMatcher& ignores,
                 const FileIndex& index,
                 std::shared_ptr<Logger> logger)
  : folder_(std::move(folder)),
    fs_(fs),
    ignores_(ignores),
    index_(index),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("scanner")) {}

bool Scanner::excluded(const std::string& name) const {
  return is_temporary(name) || is_internal(name);
}

std::vector<FileInfo> Scanner::scan(std::error_code& ec, const AbortSignal* abort) {
  ec.clear();
  const auto& local = index_.local_device();
  std::vector<FileInfo> changed;
  std::set<std::string> seen;

  fs_.walk([&](const std::string& name, const FileStat& st){
    if(abort && abort->closed()) return false;
    if(excluded(name) || ignores_.is_ignored(name)) return false;
    seen.insert(name);
    auto existing = index_.get(folder_, local, name);
    if(auto updated = scan_entry(name, st, existing)) {
      changed.push_back(std::move(*updated));
    }
    return true;
  }, ec);
  if(ec) return {};
  if(abort && abort->closed()) {
    ec = std::make_error_code(std::errc::operation_canceled);
    return {};
  }

  index_.for_each(folder_, local, [&](const FileInfo& existing){
    if(seen.count(existing.name) || excluded(existing.name)) return;
    if(ignores_.is_ignored(existing.name)) {
      if(!existing.ignored && !existing.deleted) changed.push_back(ignored_record(existing));
      return;
    }
    if(existing.deleted) return;
    changed.push_back(tombstone(existing));
  });

  if(!changed.empty()) {
    logger_->debug("Scan of {} found {} changes", folder_, changed.size());
  }
  return changed;
}

std::vector<FileInfo> Scanner::scan_names(const std::vector<std::string>& names, std::error_code& ec) {
  ec.clear();
  const auto& local = index_.local_device();
  std::vector<FileInfo> changed;
  for(const auto& name : names) {
    if(excluded(name)) continue;
    auto existing = index_.get(folder_, local, name);
    if(ignores_.is_ignored(name)) {
      if(existing && !existing->ignored && !existing->deleted) changed.push_back(ignored_record(*existing));
      continue;
    }
    std::error_code stat_ec;
    auto st = fs_.lstat(name, stat_ec);
    if(!st) {
      if(stat_ec != std::errc::no_such_file_or_directory) {
        logger_->warn("Cannot stat {}: {}", name, stat_ec.message());
        continue;
      }
      if(existing && !existing->deleted) changed.push_back(tombstone(*existing));
      continue;
    }
    if(auto updated = scan_entry(name, *st, existing)) {
      changed.push_back(std::move(*updated));
    }
  }
  return changed;
}

std::optional<FileInfo> Scanner::scan_entry(const std::string& name,
                                            const FileStat& st,
                                            const std::optional<FileInfo>& existing) {
  // No longer ignored: a new local history, concurrent with whatever peers have.
  if(existing && existing->ignored) return scan_entry(name, st, std::nullopt);

  FileInfo f;
  f.name = name;
  f.type = st.type;
  f.permissions = st.permissions & 0777;
  f.modified_s = st.modified_s;
  f.modified_ns = st.modified_ns;
  f.modified_by = index_.local_device();

  std::error_code ec;
  switch(st.type) {
    case FileType::Directory:
      if(existing && unchanged_since_scan(*existing, st)) return std::nullopt;
      break;

    case FileType::Symlink:
      f.symlink_target = fs_.read_symlink(name, ec);
      if(ec) {
        logger_->warn("Cannot read symlink {}: {}", name, ec.message());
        return std::nullopt;
      }
      if(existing && !existing->deleted && existing->is_symlink() &&
         existing->symlink_target == f.symlink_target) {
        return std::nullopt;
      }
      f.permissions = 0;
      break;

    case FileType::File: {
      if(existing && unchanged_since_scan(*existing, st)) return std::nullopt;
      auto file = fs_.open(name, ec);
      if(!file) {
        logger_->warn("Cannot open {} for hashing: {}", name, ec.message());
        return std::nullopt;
      }
      f.size = st.size;
      f.blocks = hash_blocks(*file, st.size, block_size_for(st.size), ec);
      if(ec) {
        logger_->warn("Cannot hash {}: {}", name, ec.message());
        return std::nullopt;
      }
      break;
    }
  }

  f.version = (existing ? existing->version : VersionVector()).updated(index_.local_device());
  return f;
}

FileInfo Scanner::tombstone(const FileInfo& existing) const {
  FileInfo f = existing;
  f.deleted = true;
  f.ignored = false;
  f.blocks.clear();
  f.size = 0;
  f.symlink_target.clear();
  f.modified_by = index_.local_device();
  const auto& base = existing.ignored ? VersionVector() : existing.version;
  f.version = base.updated(index_.local_device());
  return f;
}

FileInfo Scanner::ignored_record(const FileInfo& existing) const {
  FileInfo f = existing;
  f.ignored = true;
  f.blocks.clear();
  f.modified_by = index_.local_device();
  f.version = existing.version.updated(index_.local_device());
  return f;
}
