#pragma once

#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "events.hpp"
#include "file_info.hpp"

class FileIndex;
class Filesystem;
class IgnoreMatcher;
class PeerConnection;
class Versioner;
struct PullJob;

// What the pipeline stages of one folder need from the folder they work for.
class FolderContext {
public:
  virtual ~FolderContext() = default;

  virtual const std::string& folder_id() const = 0;
  virtual const std::string& local_device() const = 0;
  virtual Filesystem& filesystem() = 0;
  virtual const FileIndex& index() const = 0;
  virtual const IgnoreMatcher& ignores() const = 0;
  virtual Versioner* versioner() = 0;
  virtual EventSink& events() = 0;

  // The single write path to the local index; announces to peers.
  virtual void commit(std::vector<FileInfo> files, std::error_code& ec) = 0;
  // Like commit, but only if the local record is still expected_local.
  virtual void commit_pulled(const FileInfo& file,
                             const std::optional<FileInfo>& expected_local,
                             std::error_code& ec) = 0;

  // Rescans name before the next pull cycle.
  virtual void request_rescan(const std::string& name) = 0;
  // Rescans the names and commits the result right away.
  virtual void scan_names(const std::vector<std::string>& names) = 0;
  // Runs the rescans queued by request_rescan.
  virtual void process_pending_scans() = 0;

  // Connected devices that announced exactly this version of the file.
  virtual std::vector<std::shared_ptr<PeerConnection>> sources_for(const FileInfo& target) = 0;

  virtual void set_state(FolderState state, const std::string& error = std::string()) = 0;
  virtual void report_error(const std::string& name, const std::string& error) = 0;
  virtual void job_finished(const std::shared_ptr<PullJob>& job, bool success) = 0;
};
