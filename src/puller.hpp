#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "job_queue.hpp"
#include "log.hpp"
#include "peer_connection.hpp"
#include "pull_job.hpp"

// Fetches segments from connected devices. Each part handed to submit() is
// split into one task per segment so a file's blocks download in parallel;
// the part reports to the finisher once all of its segments are done.
class Puller {
public:
  struct Options {
    std::size_t concurrency = 4;
    std::chrono::milliseconds request_timeout{30000};
  };

  using ResultSink = std::function<void(PullResult)>;
  using SourceFinder = std::function<std::vector<std::shared_ptr<PeerConnection>>(const FileInfo& target)>;

  Puller(std::string folder,
         Options options,
         SourceFinder sources,
         ResultSink results,
         std::shared_ptr<Logger> logger);
  ~Puller();

  // Always produces exactly one PullResult for the part, even when stopped.
  void submit(const std::shared_ptr<PullJob>& job, std::vector<Segment> segments);
  void stop();

  uint64_t requests_sent() const { return requests_sent_.load(); }

private:
  struct Part {
    std::shared_ptr<PullJob> job;
    std::atomic<std::size_t> remaining{0};
    std::mutex mutex;
    std::string error;
  };

  struct SegmentTask {
    std::shared_ptr<Part> part;
    Segment segment;
  };

  void process(SegmentTask& task);
  void finish_segment(const std::shared_ptr<Part>& part, const std::string& error);
  RequestResponse fetch(PeerConnection& connection, const BlockRequest& request, const AbortSignal& abort);

  std::string folder_;
  Options options_;
  SourceFinder sources_;
  ResultSink results_;
  std::shared_ptr<Logger> logger_;
  std::atomic<uint64_t> requests_sent_{0};
  WorkerPool<SegmentTask> pool_;
};
