#include "puller.hpp"

#include <algorithm>
#include <future>

namespace {
constexpr std::chrono::milliseconds kAbortPollInterval{100};
}

Puller::Puller(std::string folder,
               Options options,
               SourceFinder sources,
               ResultSink results,
               std::shared_ptr<Logger> logger)
  : folder_(std::move(folder)),
    options_(options),
    sources_(std::move(sources)),
    results_(std::move(results)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("puller")),
    pool_(options.concurrency, [this](SegmentTask& task){ process(task); }) {}

Puller::~Puller() {
  stop();
}

void Puller::stop() {
  pool_.stop();
}

void Puller::submit(const std::shared_ptr<PullJob>& job, std::vector<Segment> segments) {
  if(segments.empty()) {
    results_(PullResult{job, ""});
    return;
  }
  auto part = std::make_shared<Part>();
  part->job = job;
  part->remaining = segments.size();
  for(auto& segment : segments) {
    if(!pool_.submit(SegmentTask{part, segment})) {
      finish_segment(part, "cancelled: " + std::string(kAbortFolderStopped));
    }
  }
}

void Puller::process(SegmentTask& task) {
  auto& job = *task.part->job;
  const auto& segment = task.segment;
  if(job.abort->closed()) {
    finish_segment(task.part, "cancelled: " + job.abort->reason());
    return;
  }

  auto sources = sources_(job.target);
  if(!sources.empty()) {
    // Spread the segments of one file over the devices that have it.
    auto first = static_cast<std::size_t>(segment.offset / std::max<int32_t>(segment.size, 1)) % sources.size();
    std::rotate(sources.begin(), sources.begin() + static_cast<std::ptrdiff_t>(first), sources.end());
  }

  std::string last_error = "no connected device has " + job.target.name;
  for(const auto& connection : sources) {
    if(job.abort->closed()) break;

    BlockRequest request;
    request.folder = folder_;
    request.name = job.target.name;
    request.offset = segment.offset;
    request.size = segment.size;
    request.hash = segment.hash;
    request.weak_hash = segment.weak_hash;

    auto response = fetch(*connection, request, *job.abort);
    if(job.abort->closed()) break;
    if(!response.ok()) {
      last_error = connection->device_id() + ": " + response.message;
      logger_->debug("Request {}@{} from {} failed: {}", job.target.name, segment.offset,
                     connection->device_id(), response.message);
      continue;
    }
    if(!verify_block(response.data.data(), response.data.size(), segment)) {
      last_error = "hash mismatch in data from " + connection->device_id();
      logger_->warn("{}@{}: {}", job.target.name, segment.offset, last_error);
      continue;
    }

    std::error_code ec;
    job.temp_file->write_at(response.data.data(), response.data.size(), segment.offset, ec);
    if(ec) {
      auto error = "writing " + job.temp + ": " + ec.message();
      job.fail(error);
      finish_segment(task.part, error);
      return;
    }
    finish_segment(task.part, "");
    return;
  }

  if(job.abort->closed()) {
    finish_segment(task.part, "cancelled: " + job.abort->reason());
    return;
  }
  job.fail(last_error);
  finish_segment(task.part, last_error);
}

void Puller::finish_segment(const std::shared_ptr<Part>& part, const std::string& error) {
  if(!error.empty()) {
    std::lock_guard<std::mutex> lock(part->mutex);
    if(part->error.empty()) part->error = error;
  }
  if(--part->remaining == 0) {
    std::string result_error;
    {
      std::lock_guard<std::mutex> lock(part->mutex);
      result_error = part->error;
    }
    results_(PullResult{part->job, result_error});
  }
}

RequestResponse Puller::fetch(PeerConnection& connection, const BlockRequest& request, const AbortSignal& abort) {
  auto promise = std::make_shared<std::promise<RequestResponse>>();
  auto future = promise->get_future();
  auto id = connection.send_request(request,
    [promise](const RequestResponse& response){
      try {
        promise->set_value(response);
      } catch(const std::future_error&) {
        // already satisfied
      }
    });
  if(!id) {
    return RequestResponse::failure(RequestError::Generic, "device unavailable");
  }
  ++requests_sent_;

  auto deadline = std::chrono::steady_clock::now() + options_.request_timeout;
  while(future.wait_for(kAbortPollInterval) != std::future_status::ready) {
    if(abort.closed()) {
      connection.cancel_request(*id);
      return RequestResponse::failure(RequestError::Generic, "cancelled");
    }
    if(std::chrono::steady_clock::now() >= deadline) {
      connection.cancel_request(*id);
      return RequestResponse::failure(RequestError::Generic, "timeout waiting for response");
    }
  }
  return future.get();
}
