#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "pull_job.hpp"

class Copier;
class FolderContext;
class Puller;

// Per folder loop that turns "needed" index entries into work: directories
// and symlinks applied directly, files turned into copy + pull jobs,
// deletions applied once every job of the cycle has finished.
class PullScheduler {
public:
  struct Options {
    std::chrono::milliseconds interval{10000};
    std::size_t batch_size = 1000;
  };

  PullScheduler(FolderContext& folder,
                Options options,
                Copier& copier,
                Puller& puller,
                std::shared_ptr<Logger> logger);
  ~PullScheduler();

  void start();
  void stop();
  // Wakes the loop before the interval elapses.
  void notify();

  // One full cycle on the calling thread. Returns false if it was skipped
  // because nothing changed since the previous one.
  bool run_cycle();

  void job_finished(const std::shared_ptr<PullJob>& job, bool success);
  // Aborts the in-flight job for name unless it targets version.
  void abort_superseded(const std::string& name, const VersionVector& version);
  // Temp file name of the in-flight job for name, if any.
  std::optional<std::string> in_flight_temp(const std::string& name) const;

  std::size_t in_flight() const;
  uint64_t cycles() const { return cycles_.load(); }

private:
  void loop();
  void wait_for_jobs();

  bool apply_directory(const FileInfo& target);
  bool apply_symlink(const FileInfo& target);
  bool apply_deletion(const FileInfo& target);
  // Returns false on failure; a dispatched job counts as success here.
  bool handle_file(const FileInfo& target, const std::shared_ptr<const WeakHashIndex>& weak_index);
  bool dispatch(const std::shared_ptr<PullJob>& job);

  // Shared checks for every kind of entry. Returns false if the entry must
  // be skipped; sets failed when that is an error.
  bool admissible(const FileInfo& target, bool& failed);
  // Stores target as our own ignored record so peers see it as invalid here.
  void record_ignored(const FileInfo& target);
  bool commit_one(const FileInfo& file, const std::string& action);
  bool fail(const FileInfo& target, const std::string& action, const std::string& error);

  FolderContext& folder_;
  Options options_;
  Copier& copier_;
  Puller& puller_;
  std::shared_ptr<Logger> logger_;

  std::thread thread_;
  mutable std::mutex m_;
  std::condition_variable wake_cv_;
  std::condition_variable jobs_cv_;
  bool running_ = false;
  bool stopping_ = false;
  bool notified_ = false;
  std::map<std::string, std::shared_ptr<PullJob>> in_flight_;
  bool cycle_failed_ = false;

  int64_t last_sequence_ = -1;
  bool retry_pending_ = false;
  std::atomic<uint64_t> cycles_{0};
};
