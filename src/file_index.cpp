#include "file_index.hpp"

#include <mutex>
#include <set>

#include "version_resolver.hpp"

FileIndex::FileIndex(std::string local_device)
  : local_device_(std::move(local_device)) {}

void FileIndex::update(const std::string& folder,
                       const std::string& device,
                       std::vector<FileInfo> files,
                       std::error_code& ec) {
  ec.clear();
  std::unique_lock lg(m_);
  if(closed_) {
    ec = std::make_error_code(std::errc::operation_canceled);
    return;
  }
  merge_locked(folders_[folder], device, std::move(files));
}

void FileIndex::replace(const std::string& folder,
                        const std::string& device,
                        std::vector<FileInfo> files,
                        std::error_code& ec) {
  ec.clear();
  std::unique_lock lg(m_);
  if(closed_) {
    ec = std::make_error_code(std::errc::operation_canceled);
    return;
  }
  auto& data = folders_[folder];
  data.by_device.erase(device);
  merge_locked(data, device, std::move(files));
}

void FileIndex::drop_device(const std::string& folder, const std::string& device) {
  std::unique_lock lg(m_);
  auto it = folders_.find(folder);
  if(it == folders_.end()) return;
  if(it->second.by_device.erase(device) > 0) ++it->second.sequence;
}

void FileIndex::merge_locked(FolderData& data, const std::string& device, std::vector<FileInfo> files) {
  auto& names = data.by_device[device];
  for(auto& file : files) {
    ++data.sequence;
    if(device == local_device_) file.sequence = data.sequence;
    names[file.name] = std::move(file);
  }
  if(files.empty()) ++data.sequence;
}

const FileIndex::FolderData* FileIndex::folder_locked(const std::string& folder) const {
  auto it = folders_.find(folder);
  return it == folders_.end() ? nullptr : &it->second;
}

std::optional<FileInfo> FileIndex::get(const std::string& folder,
                                       const std::string& device,
                                       const std::string& name) const {
  std::shared_lock lg(m_);
  const auto* data = folder_locked(folder);
  if(!data) return std::nullopt;
  auto dev = data->by_device.find(device);
  if(dev == data->by_device.end()) return std::nullopt;
  auto it = dev->second.find(name);
  if(it == dev->second.end()) return std::nullopt;
  return it->second;
}

std::optional<FileInfo> FileIndex::get_global(const std::string& folder, const std::string& name) const {
  std::shared_lock lg(m_);
  const auto* data = folder_locked(folder);
  if(!data) return std::nullopt;
  return global_locked(*data, name);
}

std::optional<FileInfo> FileIndex::global_locked(const FolderData& data, const std::string& name) const {
  const FileInfo* best = nullptr;
  for(const auto& dev : data.by_device) {
    auto it = dev.second.find(name);
    if(it == dev.second.end()) continue;
    const FileInfo& candidate = it->second;
    if(!best) {
      best = &candidate;
      continue;
    }
    // Unusable records only win when nothing usable exists.
    if(best->is_unusable() != candidate.is_unusable()) {
      if(best->is_unusable()) best = &candidate;
      continue;
    }
    switch(candidate.version.compare(best->version)) {
      case Ordering::Newer:
        best = &candidate;
        break;
      case Ordering::Concurrent:
        if(wins_conflict(candidate, *best)) best = &candidate;
        break;
      case Ordering::Equal:
      case Ordering::Older:
        break;
    }
  }
  if(!best) return std::nullopt;
  return *best;
}

std::vector<FileInfo> FileIndex::files(const std::string& folder, const std::string& device) const {
  std::vector<FileInfo> out;
  for_each(folder, device, [&](const FileInfo& f){ out.push_back(f); });
  return out;
}

void FileIndex::for_each(const std::string& folder,
                         const std::string& device,
                         const std::function<void(const FileInfo&)>& fn) const {
  std::shared_lock lg(m_);
  const auto* data = folder_locked(folder);
  if(!data) return;
  auto dev = data->by_device.find(device);
  if(dev == data->by_device.end()) return;
  for(const auto& kv : dev->second) fn(kv.second);
}

std::vector<FileInfo> FileIndex::need(const std::string& folder, std::size_t limit) const {
  std::shared_lock lg(m_);
  std::vector<FileInfo> out;
  const auto* data = folder_locked(folder);
  if(!data) return out;

  std::set<std::string> names;
  for(const auto& dev : data->by_device) {
    if(dev.first == local_device_) continue;
    for(const auto& kv : dev.second) names.insert(kv.first);
  }

  const NameMap* local = nullptr;
  auto local_it = data->by_device.find(local_device_);
  if(local_it != data->by_device.end()) local = &local_it->second;

  for(const auto& name : names) {
    auto global = global_locked(*data, name);
    if(!global || global->is_unusable()) continue;

    const FileInfo* have = nullptr;
    if(local) {
      auto it = local->find(name);
      if(it != local->end()) have = &it->second;
    }
    if(have) {
      if(have->version == global->version) continue;
      if(have->is_unusable()) continue;
    } else if(global->deleted) {
      continue; // nothing to delete
    }
    out.push_back(std::move(*global));
    if(limit && out.size() >= limit) break;
  }
  return out;
}

std::vector<std::string> FileIndex::availability(const std::string& folder,
                                                 const std::string& name,
                                                 const VersionVector& version) const {
  std::shared_lock lg(m_);
  std::vector<std::string> out;
  const auto* data = folder_locked(folder);
  if(!data) return out;
  for(const auto& dev : data->by_device) {
    if(dev.first == local_device_) continue;
    auto it = dev.second.find(name);
    if(it == dev.second.end()) continue;
    const auto& f = it->second;
    if(f.version == version && !f.deleted && !f.is_unusable()) out.push_back(dev.first);
  }
  return out;
}

std::vector<std::string> FileIndex::devices(const std::string& folder) const {
  std::shared_lock lg(m_);
  std::vector<std::string> out;
  const auto* data = folder_locked(folder);
  if(!data) return out;
  for(const auto& dev : data->by_device) out.push_back(dev.first);
  return out;
}

int64_t FileIndex::sequence(const std::string& folder) const {
  std::shared_lock lg(m_);
  const auto* data = folder_locked(folder);
  return data ? data->sequence : 0;
}

void FileIndex::close() {
  std::unique_lock lg(m_);
  closed_ = true;
}

bool FileIndex::closed() const {
  std::shared_lock lg(m_);
  return closed_;
}
