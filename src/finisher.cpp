#include "finisher.hpp"

#include <ctime>

#include "file_index.hpp"
#include "filesystem.hpp"
#include "folder_context.hpp"
#include "scanner.hpp"
#include "versioner.hpp"

bool displace_entry(FolderContext& folder,
                    const std::string& name,
                    const FileStat& st,
                    Resolution resolution,
                    Logger& logger,
                    std::string& error) {
  auto& fs = folder.filesystem();
  std::error_code ec;

  switch(st.type) {
    case FileType::Directory: {
      auto children = fs.read_dir(name, ec);
      if(!ec && !children.empty()) {
        error = "cannot replace directory " + name + ": directory not empty";
        return false;
      }
      if(!ec) fs.remove(name, ec);
      if(ec) {
        error = "removing directory " + name + ": " + ec.message();
        return false;
      }
      return true;
    }
    case FileType::Symlink:
      fs.remove(name, ec);
      if(ec) {
        error = "removing symlink " + name + ": " + ec.message();
        return false;
      }
      return true;
    case FileType::File:
      break;
  }

  if(resolution == Resolution::ConflictRemoteWins) {
    auto conflict = conflict_name(name, folder.local_device(), std::time(nullptr));
    fs.rename(name, conflict, ec);
    if(ec) {
      error = "creating conflict copy " + conflict + ": " + ec.message();
      return false;
    }
    logger.info("Conflict on {}: local version kept as {}", name, conflict);
    folder.scan_names({conflict});
    return true;
  }

  if(auto* versioner = folder.versioner()) {
    versioner->archive(name, ec);
    if(ec) {
      error = "archiving " + name + ": " + ec.message();
      return false;
    }
    return true;
  }
  fs.remove(name, ec);
  if(ec) {
    error = "removing " + name + ": " + ec.message();
    return false;
  }
  return true;
}

Finisher::Finisher(FolderContext& folder, std::shared_ptr<Logger> logger)
  : folder_(folder),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("finisher")),
    pool_(1, [this](PullResult& result){ process(result); }) {}

Finisher::~Finisher() {
  stop();
}

bool Finisher::submit(PullResult result) {
  return pool_.submit(std::move(result));
}

void Finisher::stop() {
  pool_.stop();
}

void Finisher::process(PullResult& result) {
  auto job = result.job;
  if(!job) return;
  if(!result.error.empty() && !job->abort->closed()) job->fail(result.error);
  if(--job->parts_remaining > 0) return;
  finalize(job);
}

void Finisher::finalize(const std::shared_ptr<PullJob>& job) {
  const auto& name = job->target.name;

  if(job->abort->closed()) {
    auto reason = job->abort->reason();
    if(reason == kAbortFolderStopped || reason == kAbortSuperseded) {
      logger_->debug("{}: {}", name, reason);
      job->temp_file.reset();
      // A stopped folder resumes from the temp file; a superseded one never will.
      if(reason == kAbortSuperseded) remove_temp(*job);
      folder_.job_finished(job, false);
      return;
    }
    auto error = job->error();
    fail(job, error.empty() ? reason : error, false);
    return;
  }

  std::string error;
  if(!verify_temp(*job, error)) {
    fail(job, error, false);
    return;
  }
  job->temp_file.reset();

  auto& fs = folder_.filesystem();
  const auto& index = folder_.index();
  std::error_code ec;

  auto recorded = index.get(folder_.folder_id(), folder_.local_device(), name);
  bool local_changed = recorded.has_value() != job->local.has_value() ||
                       (recorded && recorded->sequence != job->local->sequence);
  auto st = fs.lstat(name, ec);
  if(st && (!recorded || !unchanged_since_scan(*recorded, *st))) local_changed = true;
  if(local_changed) {
    // Never overwrite changes we have not seen; scan them and decide again.
    logger_->info("{} changed locally since the last scan, rescanning before replacing it", name);
    folder_.request_rescan(name);
    fail(job, "file modified since last scan", true);
    return;
  }

  // rename() replaces a plain file in one step.
  const bool overwrite = st && st->type == FileType::File &&
                         job->resolution != Resolution::ConflictRemoteWins && !folder_.versioner();
  if(st && !overwrite && !displace_entry(folder_, name, *st, job->resolution, *logger_, error)) {
    fail(job, error, false);
    return;
  }

  fs.chmod(job->temp, job->target.permissions & 0777, ec);
  if(!ec) fs.set_modified(job->temp, job->target.modified_s, job->target.modified_ns, ec);
  if(ec) {
    fail(job, "setting metadata on " + job->temp + ": " + ec.message(), false);
    return;
  }
  fs.rename(job->temp, name, ec);
  if(ec) {
    fail(job, "renaming " + job->temp + ": " + ec.message(), false);
    return;
  }

  folder_.commit_pulled(job->target, job->local, ec);
  if(ec) {
    // Keep the content under the temp name so the next cycle can reuse it.
    std::error_code back_ec;
    fs.rename(name, job->temp, back_ec);
    if(back_ec) {
      logger_->error("Cannot move {} back to {}: {}", name, job->temp, back_ec.message());
    }
    fail(job, "updating index: " + ec.message(), true);
    return;
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - job->started);
  logger_->info("Synced {} ({}, {} ms)", name, format_size(static_cast<uint64_t>(job->target.size)), elapsed.count());
  folder_.events().publish(ItemFinished{folder_.folder_id(), name, "update", ""});
  folder_.job_finished(job, true);
}

bool Finisher::verify_temp(PullJob& job, std::string& error) {
  if(!job.temp_file) {
    error = "temp file not open";
    return false;
  }
  std::error_code ec;
  job.temp_file->truncate(job.target.size, ec);
  if(ec) {
    error = "truncating " + job.temp + ": " + ec.message();
    return false;
  }
  std::vector<char> buffer;
  for(const auto& block : job.target.blocks) {
    buffer.resize(static_cast<std::size_t>(block.size));
    auto n = job.temp_file->read_at(buffer.data(), buffer.size(), block.offset, ec);
    if(ec || n != buffer.size() || !verify_block(buffer.data(), n, block)) {
      error = "verifying " + job.temp + " at offset " + std::to_string(block.offset) +
              (ec ? ": " + ec.message() : ": hash mismatch");
      return false;
    }
  }
  job.temp_file->sync(ec);
  if(ec) {
    error = "syncing " + job.temp + ": " + ec.message();
    return false;
  }
  return true;
}

void Finisher::fail(const std::shared_ptr<PullJob>& job, const std::string& error, bool keep_temp) {
  job->temp_file.reset();
  if(!keep_temp) remove_temp(*job);
  logger_->warn("Failed to sync {}: {}", job->target.name, error);
  folder_.report_error(job->target.name, error);
  folder_.events().publish(ItemFinished{folder_.folder_id(), job->target.name, "update", error});
  folder_.job_finished(job, false);
}

void Finisher::remove_temp(const PullJob& job) {
  std::error_code ec;
  folder_.filesystem().remove(job.temp, ec);
  if(ec && ec != std::errc::no_such_file_or_directory) {
    logger_->warn("Cannot remove {}: {}", job.temp, ec.message());
  }
}
