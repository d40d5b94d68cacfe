#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <vector>

#include "file_info.hpp"

// FileInfo records keyed by (folder, device, name). The local device's
// records get a fresh per-folder sequence number on every write; any write
// bumps the folder's change sequence.
class FileIndex {
public:
  explicit FileIndex(std::string local_device);

  const std::string& local_device() const { return local_device_; }

  // Merges records for device. Fails only once the index is closed.
  void update(const std::string& folder,
              const std::string& device,
              std::vector<FileInfo> files,
              std::error_code& ec);
  // Drops everything known from device for folder, then merges files.
  void replace(const std::string& folder,
               const std::string& device,
               std::vector<FileInfo> files,
               std::error_code& ec);
  void drop_device(const std::string& folder, const std::string& device);

  std::optional<FileInfo> get(const std::string& folder,
                              const std::string& device,
                              const std::string& name) const;
  // The record every device should converge on: the dominating version, or
  // the conflict winner among concurrent ones.
  std::optional<FileInfo> get_global(const std::string& folder, const std::string& name) const;

  std::vector<FileInfo> files(const std::string& folder, const std::string& device) const;
  void for_each(const std::string& folder,
                const std::string& device,
                const std::function<void(const FileInfo&)>& fn) const;

  // Global records whose version differs from the local one, up to limit
  // (0 = all), in name order.
  std::vector<FileInfo> need(const std::string& folder, std::size_t limit = 0) const;
  // Remote devices holding exactly this version of name in usable form.
  std::vector<std::string> availability(const std::string& folder,
                                        const std::string& name,
                                        const VersionVector& version) const;
  std::vector<std::string> devices(const std::string& folder) const;

  int64_t sequence(const std::string& folder) const;

  void close();
  bool closed() const;

private:
  using NameMap = std::map<std::string, FileInfo>;
  struct FolderData {
    std::map<std::string, NameMap> by_device;
    int64_t sequence = 0;
  };

  void merge_locked(FolderData& data, const std::string& device, std::vector<FileInfo> files);
  std::optional<FileInfo> global_locked(const FolderData& data, const std::string& name) const;
  const FolderData* folder_locked(const std::string& folder) const;

  std::string local_device_;
  mutable std::shared_mutex m_;
  std::map<std::string, FolderData> folders_;
  bool closed_ = false;
};
