#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "job_queue.hpp"
#include "log.hpp"
#include "pull_job.hpp"

class Filesystem;

// Fills the copy segments of a job from data already on this device: the
// temp file itself (resume), the current version of the same file at the
// same offset, then any weak hash candidate. Segments nothing local can
// supply are handed to the puller.
class Copier {
public:
  using ResultSink = std::function<void(PullResult)>;
  using FallbackSink = std::function<void(const std::shared_ptr<PullJob>&, std::vector<Segment>)>;

  Copier(Filesystem& fs,
         std::size_t concurrency,
         ResultSink results,
         FallbackSink fallback,
         std::shared_ptr<Logger> logger);
  ~Copier();

  bool submit(std::shared_ptr<PullJob> job);
  void stop();

private:
  enum class Outcome { Copied, Fallback, Aborted, Failed };
  using SourceCache = std::map<std::string, std::shared_ptr<File>>;

  void process(std::shared_ptr<PullJob>& job);
  Outcome copy_segment(PullJob& job, const Segment& segment, SourceCache& sources, std::string& error);
  bool read_verified(File& file, int64_t offset, const Segment& segment, std::vector<char>& buffer);
  std::shared_ptr<File> source(SourceCache& sources, const std::string& name);

  Filesystem& fs_;
  ResultSink results_;
  FallbackSink fallback_;
  std::shared_ptr<Logger> logger_;
  WorkerPool<std::shared_ptr<PullJob>> pool_;
};
