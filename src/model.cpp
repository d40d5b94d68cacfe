#include "model.hpp"

#include "folder.hpp"

Model::Model(std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("model")) {}

Model::~Model() {
  stop();
}

void Model::add_folder(std::unique_ptr<Folder> folder) {
  std::lock_guard lg(m_);
  auto id = folder->folder_id();
  folders_[id] = std::move(folder);
}

Folder* Model::folder(const std::string& id) const {
  std::lock_guard lg(m_);
  auto it = folders_.find(id);
  return it == folders_.end() ? nullptr : it->second.get();
}

std::vector<Folder*> Model::folders() const {
  std::lock_guard lg(m_);
  std::vector<Folder*> out;
  for(const auto& kv : folders_) out.push_back(kv.second.get());
  return out;
}

void Model::start() {
  for(auto* f : folders()) f->start();
}

void Model::stop() {
  for(auto* f : folders()) f->stop();
}

void Model::on_connected(const std::shared_ptr<PeerConnection>& connection) {
  logger_->info("Device {} connected", connection->device_id());
  for(auto* f : folders()) {
    connection->send_index(f->folder_id(), f->local_files());
  }
}

void Model::on_disconnected(const std::string& device) {
  logger_->info("Device {} disconnected", device);
}

void Model::on_index(const std::string& device,
                     const std::string& folder,
                     std::vector<FileInfo> files,
                     bool full) {
  auto* f = this->folder(folder);
  if(!f) {
    logger_->debug("{} sent an index for unknown folder {}", device, folder);
    return;
  }
  f->handle_index(device, std::move(files), full);
}

RequestResponse Model::on_request(const std::string& device, const BlockRequest& request) {
  auto* f = folder(request.folder);
  if(!f) {
    return RequestResponse::failure(RequestError::NotAvailable, "unknown folder " + request.folder);
  }
  return f->serve(device, request);
}
