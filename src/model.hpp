#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "log.hpp"
#include "peer_connection.hpp"

class Folder;

// Routes transport traffic to the folders it concerns.
class Model : public MessageHandler {
public:
  explicit Model(std::shared_ptr<Logger> logger);
  ~Model() override;

  void add_folder(std::unique_ptr<Folder> folder);
  Folder* folder(const std::string& id) const;
  std::vector<Folder*> folders() const;

  void start();
  void stop();

  void on_connected(const std::shared_ptr<PeerConnection>& connection) override;
  void on_disconnected(const std::string& device) override;
  void on_index(const std::string& device,
                const std::string& folder,
                std::vector<FileInfo> files,
                bool full) override;
  RequestResponse on_request(const std::string& device, const BlockRequest& request) override;

private:
  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::map<std::string, std::unique_ptr<Folder>> folders_;
};
