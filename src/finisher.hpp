#pragma once

#include <memory>
#include <string>

#include "job_queue.hpp"
#include "log.hpp"
#include "pull_job.hpp"

class FolderContext;
struct FileStat;

// Moves the entry on disk at name out of the way of an incoming one. A
// file the remote side won a conflict against becomes a conflict copy,
// other files go to the versioner or are removed. Symlinks and empty
// directories are removed; a directory with children is refused.
bool displace_entry(FolderContext& folder,
                    const std::string& name,
                    const FileStat& st,
                    Resolution resolution,
                    Logger& logger,
                    std::string& error);

// Collects the part results of each job and, once every part has reported,
// verifies the temp file and moves it into place.
class Finisher {
public:
  Finisher(FolderContext& folder, std::shared_ptr<Logger> logger);
  ~Finisher();

  bool submit(PullResult result);
  void stop();

private:
  void process(PullResult& result);
  void finalize(const std::shared_ptr<PullJob>& job);
  bool verify_temp(PullJob& job, std::string& error);
  void fail(const std::shared_ptr<PullJob>& job, const std::string& error, bool keep_temp);
  void remove_temp(const PullJob& job);

  FolderContext& folder_;
  std::shared_ptr<Logger> logger_;
  WorkerPool<PullResult> pool_;
};
