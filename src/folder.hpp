#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "events.hpp"
#include "folder_context.hpp"
#include "ignore_matcher.hpp"
#include "log.hpp"
#include "peer_connection.hpp"

class Copier;
class FileIndex;
class Filesystem;
class Finisher;
class PullScheduler;
class Puller;
class RequestHandler;

struct FolderConfig {
  std::string id = "default";
  std::filesystem::path path;
  std::string device_id;
  std::chrono::milliseconds pull_interval{10000};
  std::chrono::milliseconds scan_interval{60000}; // 0 disables periodic scans
  std::size_t pull_batch_size = 1000;
  std::size_t copier_concurrency = 1;
  std::size_t puller_concurrency = 4;
  std::chrono::milliseconds request_timeout{30000};
  std::string versioning = "none";
  int versioning_keep = 5;
};

// One shared folder: its scanner, its pull pipeline and its request handler.
// All writes to the folder's local index records go through commit().
class Folder : public FolderContext {
public:
  Folder(FolderConfig config,
         FileIndex& index,
         EventSink& events,
         PeerSet& peers,
         std::shared_ptr<Logger> logger,
         std::shared_ptr<Filesystem> fs = nullptr);
  ~Folder() override;

  // Initial scan, then the pull loop.
  void start();
  void stop();

  // Full scan of the folder, committed. Returns false if the root is not
  // accessible.
  bool scan(std::error_code& ec);
  // One pull cycle on the calling thread.
  bool pull_once();

  void handle_index(const std::string& device, std::vector<FileInfo> files, bool full);
  RequestResponse serve(const std::string& device, const BlockRequest& request);
  std::vector<FileInfo> local_files() const;

  const FolderConfig& config() const { return config_; }
  FolderState state() const;
  std::string state_error() const;
  IgnoreMatcher& ignore_matcher() { return ignores_; }
  PullScheduler& scheduler() { return *scheduler_; }
  uint64_t requests_sent() const;
  uint64_t requests_served() const;

  // FolderContext
  const std::string& folder_id() const override { return config_.id; }
  const std::string& local_device() const override { return config_.device_id; }
  Filesystem& filesystem() override { return *fs_; }
  const FileIndex& index() const override { return index_; }
  const IgnoreMatcher& ignores() const override { return ignores_; }
  Versioner* versioner() override { return versioner_.get(); }
  EventSink& events() override { return events_; }

  void commit(std::vector<FileInfo> files, std::error_code& ec) override;
  void commit_pulled(const FileInfo& file,
                     const std::optional<FileInfo>& expected_local,
                     std::error_code& ec) override;

  void request_rescan(const std::string& name) override;
  void scan_names(const std::vector<std::string>& names) override;
  void process_pending_scans() override;

  std::vector<std::shared_ptr<PeerConnection>> sources_for(const FileInfo& target) override;

  void set_state(FolderState state, const std::string& error = std::string()) override;
  void report_error(const std::string& name, const std::string& error) override;
  void job_finished(const std::shared_ptr<PullJob>& job, bool success) override;

private:
  void commit_locked(std::vector<FileInfo> files, std::error_code& ec);

  FolderConfig config_;
  FileIndex& index_;
  EventSink& events_;
  PeerSet& peers_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Filesystem> fs_;
  IgnoreMatcher ignores_;
  std::unique_ptr<Versioner> versioner_;

  std::mutex commit_mutex_;

  std::mutex pending_m_;
  std::set<std::string> pending_rescans_;
  std::chrono::steady_clock::time_point last_scan_;

  mutable std::mutex state_m_;
  FolderState state_ = FolderState::Idle;
  std::string state_error_;
  bool started_ = false;

  // Declared last so they go first; they call back into the members above.
  std::unique_ptr<RequestHandler> request_handler_;
  std::unique_ptr<Finisher> finisher_;
  std::unique_ptr<Puller> puller_;
  std::unique_ptr<Copier> copier_;
  std::unique_ptr<PullScheduler> scheduler_;
};
