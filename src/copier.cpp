#include "copier.hpp"

#include "filesystem.hpp"

Copier::Copier(Filesystem& fs,
               std::size_t concurrency,
               ResultSink results,
               FallbackSink fallback,
               std::shared_ptr<Logger> logger)
  : fs_(fs),
    results_(std::move(results)),
    fallback_(std::move(fallback)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("copier")),
    pool_(concurrency, [this](std::shared_ptr<PullJob>& job){ process(job); }) {}

Copier::~Copier() {
  stop();
}

bool Copier::submit(std::shared_ptr<PullJob> job) {
  return pool_.submit(std::move(job));
}

void Copier::stop() {
  pool_.stop();
}

void Copier::process(std::shared_ptr<PullJob>& job) {
  SourceCache sources;
  std::vector<Segment> fallback;
  std::string error;
  std::size_t copied = 0;

  for(const auto& segment : job->copy) {
    if(job->abort->closed()) {
      error = "cancelled: " + job->abort->reason();
      break;
    }
    auto outcome = copy_segment(*job, segment, sources, error);
    if(outcome == Outcome::Copied) {
      ++copied;
    } else if(outcome == Outcome::Fallback) {
      fallback.push_back(segment);
    } else if(outcome == Outcome::Failed) {
      job->fail(error);
      break;
    } else {
      error = "cancelled: " + job->abort->reason();
      break;
    }
  }

  if(error.empty() && !fallback.empty()) {
    logger_->debug("{}: {} of {} segments not available locally, pulling",
                   job->target.name, fallback.size(), job->copy.size());
    ++job->parts_remaining;
    fallback_(job, std::move(fallback));
  } else if(error.empty() && copied > 0) {
    logger_->debug("{}: copied {} segments locally", job->target.name, copied);
  }
  results_(PullResult{job, error});
}

Copier::Outcome Copier::copy_segment(PullJob& job,
                                     const Segment& segment,
                                     SourceCache& sources,
                                     std::string& error) {
  std::vector<char> buffer(static_cast<std::size_t>(segment.size));

  // Left over from an earlier attempt at the same version.
  if(job.temp_file && read_verified(*job.temp_file, segment.offset, segment, buffer)) {
    return Outcome::Copied;
  }

  bool found = false;
  if(auto same = source(sources, job.target.name)) {
    found = read_verified(*same, segment.offset, segment, buffer);
  }

  if(!found && !job.rename_source.empty()) {
    if(auto renamed = source(sources, job.rename_source)) {
      found = read_verified(*renamed, segment.offset, segment, buffer);
    }
  }
  if(!found && job.weak_index) {
    for(const auto& candidate : job.weak_index->find(segment)) {
      if(job.abort->closed()) return Outcome::Aborted;
      auto file = source(sources, candidate.name);
      if(file && read_verified(*file, candidate.offset, segment, buffer)) {
        found = true;
        break;
      }
    }
  }
  if(!found) return Outcome::Fallback;
  if(job.abort->closed()) return Outcome::Aborted;

  std::error_code ec;
  job.temp_file->write_at(buffer.data(), buffer.size(), segment.offset, ec);
  if(ec) {
    error = "writing " + job.temp + ": " + ec.message();
    return Outcome::Failed;
  }
  return Outcome::Copied;
}

bool Copier::read_verified(File& file, int64_t offset, const Segment& segment, std::vector<char>& buffer) {
  std::error_code ec;
  auto n = file.read_at(buffer.data(), buffer.size(), offset, ec);
  if(ec || n != buffer.size()) return false;
  return verify_block(buffer.data(), n, segment);
}

std::shared_ptr<File> Copier::source(SourceCache& sources, const std::string& name) {
  auto it = sources.find(name);
  if(it != sources.end()) return it->second;
  std::error_code ec;
  auto file = fs_.open(name, ec); // nullptr is cached too
  sources.emplace(name, file);
  return file;
}
