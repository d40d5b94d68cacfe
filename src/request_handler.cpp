#include "request_handler.hpp"

#include "blocks.hpp"
#include "file_index.hpp"
#include "filesystem.hpp"
#include "folder_context.hpp"
#include "ignore_matcher.hpp"

namespace {

bool has_hashes(const BlockRequest& request) {
  return !request.hash.empty();
}

BlockInfo as_block(const BlockRequest& request) {
  BlockInfo block;
  block.offset = request.offset;
  block.size = request.size;
  block.hash = request.hash;
  block.weak_hash = request.weak_hash;
  return block;
}

} // namespace

RequestHandler::RequestHandler(FolderContext& folder, TempLookup in_flight_temp, std::shared_ptr<Logger> logger)
  : folder_(folder),
    in_flight_temp_(std::move(in_flight_temp)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("requests")) {}

RequestResponse RequestHandler::serve(const std::string& device, const BlockRequest& request) {
  if(request.folder != folder_.folder_id()) {
    return RequestResponse::failure(RequestError::NotAvailable, "unknown folder " + request.folder);
  }
  auto name = canonical_name(request.name);
  if(!name || *name != request.name || is_internal(*name) || is_temporary(*name)) {
    logger_->debug("{} requested invalid name '{}'", device, request.name);
    return RequestResponse::failure(RequestError::InvalidFile, "invalid name");
  }
  if(request.offset < 0 || request.size <= 0 || request.size > kMaxBlockSize) {
    return RequestResponse::failure(RequestError::InvalidFile, "invalid range");
  }

  auto& fs = folder_.filesystem();
  std::error_code ec;
  if(has_symlink_ancestor(fs, *name, ec)) {
    logger_->warn("{} requested {} through a symlinked directory, possible traversal attempt", device, *name);
    return RequestResponse::failure(RequestError::PermissionDenied, "symlink in path");
  }
  if(ec) {
    return RequestResponse::failure(RequestError::InvalidFile, ec.message());
  }

  if(folder_.ignores().is_ignored(*name)) {
    logger_->debug("{} requested ignored file {}", device, *name);
    return RequestResponse::failure(RequestError::NotAvailable, "ignored");
  }
  const auto& index = folder_.index();
  auto local = index.get(folder_.folder_id(), folder_.local_device(), *name);
  if(local && (local->ignored || local->invalid)) {
    logger_->debug("{} requested {}, which is not shared", device, *name);
    return RequestResponse::failure(RequestError::NotAvailable, "not shared");
  }

  if(request.from_temporary) {
    if(auto data = read_temporary(request)) {
      ++served_;
      RequestResponse response;
      response.data = std::move(*data);
      return response;
    }
  }

  if(!local || local->deleted || !local->is_file()) {
    logger_->debug("{} requested {}, which we do not have", device, *name);
    return RequestResponse::failure(RequestError::NotAvailable, "no such file");
  }
  auto st = fs.lstat(*name, ec);
  if(!st || st->type != FileType::File) {
    folder_.request_rescan(*name);
    return RequestResponse::failure(RequestError::NotAvailable, "no such file");
  }

  auto response = read_verified(*name, request);
  if(response.ok()) {
    ++served_;
  } else if(response.error == RequestError::InvalidContent) {
    logger_->info("{}@{} no longer matches the index, rescanning", *name, request.offset);
    folder_.request_rescan(*name);
  }
  return response;
}

std::optional<std::vector<char>> RequestHandler::read_temporary(const BlockRequest& request) {
  // Unverified temp data is never served.
  if(!has_hashes(request)) return std::nullopt;

  std::vector<std::string> candidates;
  if(in_flight_temp_) {
    if(auto temp = in_flight_temp_(request.name)) candidates.push_back(*temp);
  }
  if(auto global = folder_.index().get_global(folder_.folder_id(), request.name)) {
    auto temp = temp_name(request.name, global->version);
    if(candidates.empty() || candidates.front() != temp) candidates.push_back(temp);
  }

  for(const auto& temp : candidates) {
    auto response = read_verified(temp, request);
    if(response.ok()) return std::move(response.data);
    logger_->debug("Cannot serve {}@{} from {}: {}", request.name, request.offset, temp, response.message);
  }
  return std::nullopt;
}

RequestResponse RequestHandler::read_verified(const std::string& path, const BlockRequest& request) {
  auto& fs = folder_.filesystem();
  std::error_code ec;
  auto file = fs.open(path, ec);
  if(!file) {
    return RequestResponse::failure(RequestError::NotAvailable, ec.message());
  }

  RequestResponse response;
  response.data.resize(static_cast<std::size_t>(request.size));
  auto n = file->read_at(response.data.data(), response.data.size(), request.offset, ec);
  if(ec) {
    return RequestResponse::failure(RequestError::InvalidFile, ec.message());
  }
  if(n != response.data.size()) {
    if(has_hashes(request)) {
      return RequestResponse::failure(RequestError::InvalidContent, "short read");
    }
    return RequestResponse::failure(RequestError::InvalidFile, "range beyond end of file");
  }

  if(has_hashes(request) && !verify_block(response.data.data(), n, as_block(request))) {
    return RequestResponse::failure(RequestError::InvalidContent, "content changed");
  }
  return response;
}
