#include "folder.hpp"

#include "copier.hpp"
#include "file_index.hpp"
#include "filesystem.hpp"
#include "finisher.hpp"
#include "pull_scheduler.hpp"
#include "puller.hpp"
#include "request_handler.hpp"
#include "scanner.hpp"
#include "versioner.hpp"

Folder::Folder(FolderConfig config,
               FileIndex& index,
               EventSink& events,
               PeerSet& peers,
               std::shared_ptr<Logger> logger,
               std::shared_ptr<Filesystem> fs)
  : config_(std::move(config)),
    index_(index),
    events_(events),
    peers_(peers),
    logger_(logger ? logger->child(config_.id) : std::make_shared<Logger>(config_.id)),
    fs_(fs ? std::move(fs) : std::make_shared<BasicFilesystem>(config_.path)) {
  if(config_.device_id.empty()) config_.device_id = index_.local_device();
  versioner_ = make_versioner(config_.versioning, *fs_, config_.versioning_keep);

  finisher_ = std::make_unique<Finisher>(*this, logger_->child("finisher"));

  auto to_finisher = [this](PullResult result){
    if(!finisher_->submit(std::move(result))) {
      logger_->debug("Finisher stopped, dropping result");
    }
  };

  Puller::Options puller_options;
  puller_options.concurrency = config_.puller_concurrency;
  puller_options.request_timeout = config_.request_timeout;
  puller_ = std::make_unique<Puller>(config_.id,
                                     puller_options,
                                     [this](const FileInfo& target){ return sources_for(target); },
                                     to_finisher,
                                     logger_->child("puller"));

  copier_ = std::make_unique<Copier>(*fs_,
                                     config_.copier_concurrency,
                                     to_finisher,
                                     [this](const std::shared_ptr<PullJob>& job, std::vector<Segment> segments){
                                       puller_->submit(job, std::move(segments));
                                     },
                                     logger_->child("copier"));

  PullScheduler::Options scheduler_options;
  scheduler_options.interval = config_.pull_interval;
  scheduler_options.batch_size = config_.pull_batch_size;
  scheduler_ = std::make_unique<PullScheduler>(*this, scheduler_options, *copier_, *puller_, logger_);

  request_handler_ = std::make_unique<RequestHandler>(*this,
                                                      [this](const std::string& name){
                                                        return scheduler_->in_flight_temp(name);
                                                      },
                                                      logger_->child("requests"));
}

Folder::~Folder() {
  stop();
}

void Folder::start() {
  if(started_) return;
  started_ = true;
  std::error_code ec;
  if(!scan(ec)) {
    logger_->error("Initial scan of {} failed: {}", fs_->root().string(), ec.message());
  }
  scheduler_->start();
}

void Folder::stop() {
  // Upstream first, so every stage drains into one that is still running.
  scheduler_->stop();
  copier_->stop();
  puller_->stop();
  finisher_->stop();
  started_ = false;
}

bool Folder::scan(std::error_code& ec) {
  set_state(FolderState::Scanning);
  ignores_.load(*fs_, ec);
  if(ec) {
    logger_->warn("Cannot read ignore patterns: {}", ec.message());
  }

  std::vector<FileInfo> changes;
  {
    std::lock_guard lg(commit_mutex_);
    Scanner scanner(config_.id, *fs_, ignores_, index_, logger_->child("scanner"));
    changes = scanner.scan(ec);
    if(!ec && !changes.empty()) commit_locked(std::move(changes), ec);
  }
  {
    std::lock_guard lg(pending_m_);
    last_scan_ = std::chrono::steady_clock::now();
  }
  if(ec) {
    set_state(FolderState::Error, "scanning " + fs_->root().string() + ": " + ec.message());
    return false;
  }
  set_state(FolderState::Idle);
  return true;
}

bool Folder::pull_once() {
  return scheduler_->run_cycle();
}

void Folder::handle_index(const std::string& device, std::vector<FileInfo> files, bool full) {
  std::vector<FileInfo> accepted;
  accepted.reserve(files.size());
  for(auto& file : files) {
    auto name = canonical_name(file.name);
    if(!name) {
      logger_->warn("Dropping entry with invalid name '{}' from {}", file.name, device);
      continue;
    }
    file.name = *name;
    // Another device's half-written files are never worth pulling.
    if(is_temporary(file.name) || is_internal(file.name)) file.invalid = true;
    accepted.push_back(std::move(file));
  }

  std::vector<std::string> names;
  names.reserve(accepted.size());
  for(const auto& file : accepted) names.push_back(file.name);
  const auto count = accepted.size();

  std::error_code ec;
  if(full) {
    index_.replace(config_.id, device, std::move(accepted), ec);
  } else {
    index_.update(config_.id, device, std::move(accepted), ec);
  }
  if(ec) {
    logger_->warn("Cannot store index from {}: {}", device, ec.message());
    return;
  }
  logger_->debug("{} index from {}: {} entries", full ? "Full" : "Partial", device, count);

  for(const auto& name : names) {
    if(auto global = index_.get_global(config_.id, name)) {
      scheduler_->abort_superseded(name, global->version);
    }
  }
  events_.publish(RemoteIndexUpdated{config_.id, device, count, full});
  scheduler_->notify();
}

RequestResponse Folder::serve(const std::string& device, const BlockRequest& request) {
  return request_handler_->serve(device, request);
}

std::vector<FileInfo> Folder::local_files() const {
  return index_.files(config_.id, config_.device_id);
}

FolderState Folder::state() const {
  std::lock_guard lg(state_m_);
  return state_;
}

std::string Folder::state_error() const {
  std::lock_guard lg(state_m_);
  return state_error_;
}

uint64_t Folder::requests_sent() const {
  return puller_->requests_sent();
}

uint64_t Folder::requests_served() const {
  return request_handler_->served();
}

void Folder::commit(std::vector<FileInfo> files, std::error_code& ec) {
  std::lock_guard lg(commit_mutex_);
  commit_locked(std::move(files), ec);
}

void Folder::commit_pulled(const FileInfo& file,
                           const std::optional<FileInfo>& expected_local,
                           std::error_code& ec) {
  std::lock_guard lg(commit_mutex_);
  auto current = index_.get(config_.id, config_.device_id, file.name);
  bool unchanged = current.has_value() == expected_local.has_value() &&
                   (!current || current->sequence == expected_local->sequence);
  if(!unchanged) {
    ec = std::make_error_code(std::errc::device_or_resource_busy);
    return;
  }
  commit_locked({file}, ec);
}

void Folder::commit_locked(std::vector<FileInfo> files, std::error_code& ec) {
  std::vector<std::string> names;
  names.reserve(files.size());
  for(const auto& f : files) names.push_back(f.name);

  index_.update(config_.id, config_.device_id, std::move(files), ec);
  if(ec) return;

  // Announce what was stored, with the sequence numbers the index assigned.
  std::vector<FileInfo> committed;
  committed.reserve(names.size());
  for(const auto& name : names) {
    if(auto f = index_.get(config_.id, config_.device_id, name)) committed.push_back(std::move(*f));
  }
  events_.publish(LocalIndexUpdated{config_.id, names});
  for(const auto& connection : peers_.connections()) {
    if(connection && connection->connected()) connection->send_index_update(config_.id, committed);
  }
}

void Folder::request_rescan(const std::string& name) {
  {
    std::lock_guard lg(pending_m_);
    pending_rescans_.insert(name);
  }
  scheduler_->notify();
}

void Folder::scan_names(const std::vector<std::string>& names) {
  std::error_code ec;
  std::lock_guard lg(commit_mutex_);
  Scanner scanner(config_.id, *fs_, ignores_, index_, logger_->child("scanner"));
  auto changes = scanner.scan_names(names, ec);
  if(ec) {
    logger_->warn("Rescan failed: {}", ec.message());
    return;
  }
  if(changes.empty()) return;
  commit_locked(std::move(changes), ec);
  if(ec) logger_->warn("Cannot store rescan results: {}", ec.message());
}

void Folder::process_pending_scans() {
  std::vector<std::string> names;
  bool full_scan = false;
  {
    std::lock_guard lg(pending_m_);
    names.assign(pending_rescans_.begin(), pending_rescans_.end());
    pending_rescans_.clear();
    full_scan = config_.scan_interval.count() > 0 &&
                std::chrono::steady_clock::now() - last_scan_ >= config_.scan_interval;
  }
  if(full_scan) {
    std::error_code ec;
    scan(ec);
    return;
  }
  if(!names.empty()) scan_names(names);
}

std::vector<std::shared_ptr<PeerConnection>> Folder::sources_for(const FileInfo& target) {
  std::vector<std::shared_ptr<PeerConnection>> sources;
  for(const auto& device : index_.availability(config_.id, target.name, target.version)) {
    auto connection = peers_.connection(device);
    if(connection && connection->connected()) sources.push_back(std::move(connection));
  }
  return sources;
}

void Folder::set_state(FolderState state, const std::string& error) {
  FolderState from;
  {
    std::lock_guard lg(state_m_);
    if(state_ == state && state_error_ == error) return;
    from = state_;
    state_ = state;
    state_error_ = error;
  }
  if(state == FolderState::Error) {
    logger_->error("Folder {} stopped syncing: {}", config_.id, error);
  } else {
    logger_->debug("Folder {}: {} -> {}", config_.id, to_string(from), to_string(state));
  }
  events_.publish(StateChanged{config_.id, from, state, error});
}

void Folder::report_error(const std::string& name, const std::string& error) {
  events_.publish(FolderError{config_.id, name, error});
}

void Folder::job_finished(const std::shared_ptr<PullJob>& job, bool success) {
  scheduler_->job_finished(job, success);
}
