#include "pull_scheduler.hpp"

#include <algorithm>
#include <random>

#include "copier.hpp"
#include "file_index.hpp"
#include "filesystem.hpp"
#include "finisher.hpp"
#include "folder_context.hpp"
#include "ignore_matcher.hpp"
#include "puller.hpp"
#include "scanner.hpp"
#include "versioner.hpp"

PullScheduler::PullScheduler(FolderContext& folder,
                             Options options,
                             Copier& copier,
                             Puller& puller,
                             std::shared_ptr<Logger> logger)
  : folder_(folder),
    options_(options),
    copier_(copier),
    puller_(puller),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("scheduler")) {
  if(options_.interval.count() <= 0) {
    options_.interval = std::chrono::milliseconds(10000);
  }
}

PullScheduler::~PullScheduler() {
  stop();
}

void PullScheduler::start() {
  std::lock_guard lg(m_);
  if(running_) return;
  running_ = true;
  stopping_ = false;
  notified_ = true; // first cycle right away
  thread_ = std::thread([this]{ loop(); });
}

void PullScheduler::stop() {
  {
    std::lock_guard lg(m_);
    running_ = false;
    stopping_ = true;
    for(auto& kv : in_flight_) {
      kv.second->abort->close(kAbortFolderStopped);
    }
  }
  wake_cv_.notify_all();
  jobs_cv_.notify_all();
  if(thread_.joinable()) thread_.join();
}

void PullScheduler::notify() {
  {
    std::lock_guard lg(m_);
    notified_ = true;
  }
  wake_cv_.notify_all();
}

void PullScheduler::loop() {
  while(true) {
    {
      std::unique_lock<std::mutex> lock(m_);
      wake_cv_.wait_for(lock, options_.interval, [this]{ return !running_ || notified_; });
      if(!running_) return;
      notified_ = false;
    }
    run_cycle();
  }
}

bool PullScheduler::run_cycle() {
  folder_.process_pending_scans();

  auto& fs = folder_.filesystem();
  std::error_code ec;
  auto root = fs.lstat("", ec);
  if(!root || root->type != FileType::Directory) {
    auto reason = ec ? ec.message() : std::string("not a directory");
    folder_.set_state(FolderState::Error, "folder root " + fs.root().string() + ": " + reason);
    return false;
  }

  const auto& index = folder_.index();
  const auto sequence = index.sequence(folder_.folder_id());
  {
    std::lock_guard lg(m_);
    if(sequence == last_sequence_ && !retry_pending_) return false;
    cycle_failed_ = false;
  }
  ++cycles_;

  auto needed = index.need(folder_.folder_id(), options_.batch_size);
  bool failed = false;
  if(!needed.empty()) {
    folder_.set_state(FolderState::Syncing);
    logger_->debug("Pull cycle: {} needed items", needed.size());

    std::vector<FileInfo> directories, symlinks, files, deletions;
    for(auto& f : needed) {
      if(f.deleted) {
        deletions.push_back(std::move(f));
      } else if(f.is_directory()) {
        directories.push_back(std::move(f));
      } else if(f.is_symlink()) {
        symlinks.push_back(std::move(f));
      } else {
        files.push_back(std::move(f));
      }
    }

    // need() is in name order, so parents come before their children.
    for(const auto& d : directories) {
      if(!apply_directory(d)) failed = true;
    }
    for(const auto& s : symlinks) {
      if(!apply_symlink(s)) failed = true;
    }

    auto weak_index = std::make_shared<WeakHashIndex>();
    index.for_each(folder_.folder_id(), folder_.local_device(),
                   [&](const FileInfo& f){ weak_index->add_file(f); });

    std::mt19937 rng(std::random_device{}());
    std::shuffle(files.begin(), files.end(), rng);
    for(const auto& f : files) {
      if(!handle_file(f, weak_index)) failed = true;
    }
    wait_for_jobs();

    // Children before parents; files renamed away in this cycle are still
    // on disk until now so the copier could use them.
    std::reverse(deletions.begin(), deletions.end());
    for(const auto& d : deletions) {
      if(!apply_deletion(d)) failed = true;
    }
  }

  {
    std::lock_guard lg(m_);
    last_sequence_ = sequence;
    retry_pending_ = failed || cycle_failed_;
  }
  folder_.set_state(FolderState::Idle);
  return true;
}

void PullScheduler::wait_for_jobs() {
  std::unique_lock<std::mutex> lock(m_);
  jobs_cv_.wait(lock, [this]{ return stopping_ || in_flight_.empty(); });
}

bool PullScheduler::admissible(const FileInfo& target, bool& failed) {
  failed = false;
  const auto& name = target.name;
  if(is_temporary(name) || is_internal(name)) return false;

  std::error_code ec;
  if(has_symlink_ancestor(folder_.filesystem(), name, ec)) {
    failed = true;
    fail(target, "update", "refusing to sync " + name + ": a parent directory is a symlink");
    return false;
  }
  if(ec) {
    failed = true;
    fail(target, "update", "checking parents of " + name + ": " + ec.message());
    return false;
  }
  if(folder_.ignores().is_ignored(name)) {
    logger_->debug("Skipping ignored {}", name);
    record_ignored(target);
    return false;
  }
  std::lock_guard lg(m_);
  return in_flight_.count(name) == 0;
}

void PullScheduler::record_ignored(const FileInfo& target) {
  if(target.deleted) return;
  auto local = folder_.index().get(folder_.folder_id(), folder_.local_device(), target.name);
  if(local && local->ignored && local->version == target.version) return;

  FileInfo record = target;
  record.ignored = true;
  record.invalid = false;
  record.blocks.clear();
  record.sequence = 0;
  std::error_code ec;
  folder_.commit({record}, ec);
  if(ec) logger_->warn("{}: recording as ignored: {}", target.name, ec.message());
}

bool PullScheduler::handle_file(const FileInfo& target, const std::shared_ptr<const WeakHashIndex>& weak_index) {
  bool failed = false;
  if(!admissible(target, failed)) return !failed;

  auto& fs = folder_.filesystem();
  const auto& name = target.name;
  auto local = folder_.index().get(folder_.folder_id(), folder_.local_device(), name);
  auto resolution = resolve(local, target);

  switch(resolution) {
    case Resolution::KeepLocal:
    case Resolution::ConflictLocalWins:
      return true;
    case Resolution::Merge:
    case Resolution::TakeRemote:
    case Resolution::ConflictRemoteWins:
      break;
  }

  std::error_code ec;
  const bool same_content = resolution == Resolution::Merge ||
                            (resolution == Resolution::TakeRemote && local && local->is_file() &&
                             !local->deleted && local->same_content(target));
  if(same_content) {
    auto st = fs.lstat(name, ec);
    if(st && unchanged_since_scan(*local, *st)) {
      fs.chmod(name, target.permissions & 0777, ec);
      if(!ec) fs.set_modified(name, target.modified_s, target.modified_ns, ec);
      if(ec) return fail(target, "metadata", "updating metadata of " + name + ": " + ec.message());
      return commit_one(target, "metadata");
    }
    if(resolution == Resolution::Merge) {
      folder_.request_rescan(name);
      return fail(target, "metadata", "file modified since last scan");
    }
  }

  auto job = std::make_shared<PullJob>();
  job->target = target;
  job->local = local;
  job->resolution = resolution;
  job->temp = temp_name(name, target.version);
  if(auto source = find_rename_source(folder_.index().files(folder_.folder_id(), folder_.local_device()), target)) {
    job->rename_source = source->name;
  } else {
    job->weak_index = weak_index;
  }

  const bool resume = fs.lstat(job->temp, ec).has_value();
  job->temp_file = fs.open_write(job->temp, 0600, ec);
  if(!job->temp_file) {
    return fail(target, "update", "creating " + job->temp + ": " + ec.message());
  }
  job->temp_file->truncate(target.size, ec);
  if(ec) {
    job->temp_file.reset();
    return fail(target, "update", "sizing " + job->temp + ": " + ec.message());
  }

  std::vector<BlockInfo> have;
  if(local && local->is_file() && !local->deleted) have = local->blocks;
  auto diff = diff_blocks(have, target.blocks);
  job->copy = std::move(diff.copy);
  for(auto& block : diff.pull) {
    if(resume || !job->rename_source.empty() || !weak_index->find(block).empty()) {
      job->copy.push_back(std::move(block));
    } else {
      job->pull.push_back(std::move(block));
    }
  }

  if(!job->rename_source.empty()) {
    logger_->info("{} has the content of {}, copying locally", name, job->rename_source);
  }
  logger_->debug("Queued {}: {} copy, {} pull segments ({})", name, job->copy.size(),
                 job->pull.size(), to_string(resolution));
  return dispatch(job);
}

bool PullScheduler::dispatch(const std::shared_ptr<PullJob>& job) {
  {
    std::lock_guard lg(m_);
    if(stopping_) return false;
    in_flight_[job->target.name] = job;
  }
  if(!copier_.submit(job)) {
    std::lock_guard lg(m_);
    in_flight_.erase(job->target.name);
    job->temp_file.reset();
    return false;
  }
  puller_.submit(job, job->pull);
  return true;
}

bool PullScheduler::apply_directory(const FileInfo& target) {
  bool failed = false;
  if(!admissible(target, failed)) return !failed;

  auto& fs = folder_.filesystem();
  const auto& name = target.name;
  const auto permissions = target.permissions & 0777;
  std::error_code ec;
  auto st = fs.lstat(name, ec);
  if(st && st->type != FileType::Directory) {
    auto local = folder_.index().get(folder_.folder_id(), folder_.local_device(), name);
    if(!local || !unchanged_since_scan(*local, *st)) {
      folder_.request_rescan(name);
      return fail(target, "update", "file modified since last scan");
    }
    auto resolution = resolve(local, target);
    if(resolution == Resolution::KeepLocal || resolution == Resolution::ConflictLocalWins) return true;
    std::string error;
    if(!displace_entry(folder_, name, *st, resolution, *logger_, error)) {
      return fail(target, "update", error);
    }
    st.reset();
  }
  if(st) {
    fs.chmod(name, permissions, ec);
  } else {
    make_parents(fs, name, ec);
    if(!ec) fs.mkdir(name, permissions ? permissions : 0755, ec);
    // mkdir is subject to the umask.
    if(!ec && permissions) fs.chmod(name, permissions, ec);
  }
  if(ec) return fail(target, "update", "creating directory " + name + ": " + ec.message());
  return commit_one(target, "update");
}

bool PullScheduler::apply_symlink(const FileInfo& target) {
  bool failed = false;
  if(!admissible(target, failed)) return !failed;

  auto& fs = folder_.filesystem();
  const auto& name = target.name;
  auto local = folder_.index().get(folder_.folder_id(), folder_.local_device(), name);
  auto resolution = resolve(local, target);
  switch(resolution) {
    case Resolution::KeepLocal:
    case Resolution::ConflictLocalWins:
      return true;
    case Resolution::Merge:
      return commit_one(target, "metadata");
    case Resolution::TakeRemote:
    case Resolution::ConflictRemoteWins:
      break;
  }

  std::error_code ec;
  auto st = fs.lstat(name, ec);
  if(st) {
    if(st->type == FileType::Symlink && fs.read_symlink(name, ec) == target.symlink_target && !ec) {
      return commit_one(target, "metadata");
    }
    if(!local || !unchanged_since_scan(*local, *st)) {
      folder_.request_rescan(name);
      return fail(target, "update", "file modified since last scan");
    }
    std::string error;
    if(!displace_entry(folder_, name, *st, resolution, *logger_, error)) {
      return fail(target, "update", error);
    }
  }
  make_parents(fs, name, ec);
  if(!ec) fs.create_symlink(target.symlink_target, name, ec);
  if(ec) return fail(target, "update", "creating symlink " + name + ": " + ec.message());
  return commit_one(target, "update");
}

bool PullScheduler::apply_deletion(const FileInfo& target) {
  bool failed = false;
  if(!admissible(target, failed)) return !failed;

  auto& fs = folder_.filesystem();
  const auto& name = target.name;
  std::error_code ec;
  auto st = fs.lstat(name, ec);
  if(!st) {
    if(ec != std::errc::no_such_file_or_directory) {
      return fail(target, "delete", "stat " + name + ": " + ec.message());
    }
    return commit_one(target, "delete");
  }

  auto local = folder_.index().get(folder_.folder_id(), folder_.local_device(), name);
  if(!local || !unchanged_since_scan(*local, *st)) {
    folder_.request_rescan(name);
    return fail(target, "delete", "file modified since last scan");
  }

  auto* versioner = folder_.versioner();
  if(versioner && st->type == FileType::File) {
    versioner->archive(name, ec);
  } else {
    fs.remove(name, ec);
  }
  if(ec) return fail(target, "delete", "deleting " + name + ": " + ec.message());
  return commit_one(target, "delete");
}

bool PullScheduler::commit_one(const FileInfo& file, const std::string& action) {
  std::error_code ec;
  folder_.commit({file}, ec);
  if(ec) return fail(file, action, "updating index: " + ec.message());
  folder_.events().publish(ItemFinished{folder_.folder_id(), file.name, action, ""});
  return true;
}

bool PullScheduler::fail(const FileInfo& target, const std::string& action, const std::string& error) {
  logger_->warn("{}: {}", target.name, error);
  folder_.report_error(target.name, error);
  folder_.events().publish(ItemFinished{folder_.folder_id(), target.name, action, error});
  return false;
}

void PullScheduler::job_finished(const std::shared_ptr<PullJob>& job, bool success) {
  {
    std::lock_guard lg(m_);
    auto it = in_flight_.find(job->target.name);
    if(it != in_flight_.end() && it->second == job) in_flight_.erase(it);
    if(!success) cycle_failed_ = true;
  }
  jobs_cv_.notify_all();
}

void PullScheduler::abort_superseded(const std::string& name, const VersionVector& version) {
  std::lock_guard lg(m_);
  auto it = in_flight_.find(name);
  if(it == in_flight_.end()) return;
  if(it->second->target.version != version) {
    it->second->abort->close(kAbortSuperseded);
  }
}

std::optional<std::string> PullScheduler::in_flight_temp(const std::string& name) const {
  std::lock_guard lg(m_);
  auto it = in_flight_.find(name);
  if(it == in_flight_.end()) return std::nullopt;
  return it->second->temp;
}

std::size_t PullScheduler::in_flight() const {
  std::lock_guard lg(m_);
  return in_flight_.size();
}
