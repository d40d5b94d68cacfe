#pragma once

#include "fake_peer.hpp"
#include "file_index.hpp"
#include "filesystem.hpp"
#include "folder.hpp"
#include "test_runner_utils.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace replisync::test {

// A folder of the local device, unstarted, with one fake remote device
// connected. The folder root is a subdirectory so that ".." still lies
// inside the temp dir.
class FolderHarness {
public:
  static constexpr const char* kFolder = "default";
  static constexpr const char* kLocalDevice = "local-device";
  static constexpr const char* kRemoteDevice = "remote-device";

  explicit FolderHarness(TestContext& ctx, const std::string& versioning = "none")
    : index(kLocalDevice),
      connection(std::make_shared<FakeConnection>(kRemoteDevice)),
      remote(connection) {
    std::error_code ec;
    std::filesystem::create_directories(root(), ec);
    peers.add(connection);

    FolderConfig config;
    config.id = kFolder;
    config.path = root();
    config.device_id = kLocalDevice;
    config.scan_interval = std::chrono::milliseconds(0);
    config.request_timeout = std::chrono::milliseconds(2000);
    config.versioning = versioning;
    auto logger = std::make_shared<Logger>("test");
    ctx.logs.attach(logger);
    folder = std::make_unique<Folder>(config, index, events, peers, logger);
  }

  ~FolderHarness() {
    if(folder) folder->stop();
  }

  std::filesystem::path root() const { return dir.path() / "root"; }
  std::filesystem::path path(const std::string& name) const { return root() / name; }

  bool scan() {
    std::error_code ec;
    return folder->scan(ec);
  }

  // Hands the remote's pending changes to the folder as an index update.
  void send_update() {
    folder->handle_index(kRemoteDevice, remote.take_update(), false);
  }

  std::optional<FileInfo> local(const std::string& name) const {
    return index.get(kFolder, kLocalDevice, name);
  }

  bool exists(const std::string& name) const {
    std::error_code ec;
    return std::filesystem::symlink_status(path(name), ec).type() != std::filesystem::file_type::not_found;
  }

  std::vector<std::string> temp_files() const {
    std::vector<std::string> out;
    std::error_code ec;
    for(auto it = std::filesystem::recursive_directory_iterator(root(), ec);
        it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
      if(ec) break;
      auto name = it->path().filename().string();
      if(is_temporary(name)) out.push_back(name);
    }
    return out;
  }

  RequestResponse request(const std::string& name, int64_t offset, int32_t size,
                          const Bytes& hash = Bytes(), uint32_t weak = 0, bool from_temporary = false) {
    BlockRequest r;
    r.folder = kFolder;
    r.name = name;
    r.offset = offset;
    r.size = size;
    r.hash = hash;
    r.weak_hash = weak;
    r.from_temporary = from_temporary;
    return folder->serve(kRemoteDevice, r);
  }

  TempDir dir;
  FileIndex index;
  EventSink events;
  EventRecorder recorder{events};
  FakePeers peers;
  std::shared_ptr<FakeConnection> connection;
  FakeRemote remote;
  std::unique_ptr<Folder> folder;
};

} // namespace replisync::test
