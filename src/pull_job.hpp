#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "abort_signal.hpp"
#include "blocks.hpp"
#include "file_info.hpp"
#include "filesystem.hpp"
#include "version_resolver.hpp"

// One file in flight. Shared by the copier, the puller workers and the
// finisher; each worker writes only its own segments of temp_file.
struct PullJob {
  FileInfo target;
  std::optional<FileInfo> local; // local record when the job was built
  Resolution resolution = Resolution::TakeRemote;
  std::string temp;
  std::shared_ptr<File> temp_file;
  std::vector<Segment> copy;
  std::vector<Segment> pull;
  // A local file with exactly the target's blocks, read at the same offsets.
  std::string rename_source;
  std::shared_ptr<const WeakHashIndex> weak_index;
  std::shared_ptr<AbortSignal> abort = std::make_shared<AbortSignal>();

  // Parts that still have to report to the finisher. Starts at two (copy
  // side and pull side); the copier adds one for every fallback it hands to
  // the puller before reporting its own part.
  std::atomic<int> parts_remaining{2};
  std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();

  void fail(const std::string& reason) {
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      if(error_.empty()) error_ = reason;
    }
    abort->close(reason);
  }

  std::string error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_;
  }

private:
  mutable std::mutex error_mutex_;
  std::string error_;
};

// A completed part of a job, consumed by the finisher.
struct PullResult {
  std::shared_ptr<PullJob> job;
  std::string error; // empty on success
};

inline constexpr const char* kAbortFolderStopped = "folder stopped";
inline constexpr const char* kAbortSuperseded = "superseded by a newer version";
