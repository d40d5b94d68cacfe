#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "events.hpp"
#include "folder.hpp"
#include "log.hpp"

class ConnectionManager;
class FileIndex;
class Model;
class SettingsManager;

// Folder settings for this device, with folder_path resolved against the
// workspace root when relative.
FolderConfig folder_config_from_settings(const SettingsManager& settings,
                                         const std::filesystem::path& workspace_root,
                                         const std::string& device_id);

// One device: the index, the folder, the listener and the outbound dialer,
// all driven by one io_context.
class SyncEngine {
public:
  struct Options {
    bool enable_connect_timer = true;
    std::chrono::milliseconds connect_interval{2000};
    std::filesystem::path workspace_root = std::filesystem::current_path();
  };

  SyncEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~SyncEngine();

  void start();
  void run();
  void start_background();
  void stop();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  struct Stats {
    std::size_t connected_peers = 0;
    std::size_t configured_peers = 0;
    std::size_t local_files = 0;
    std::size_t needed_files = 0;
    uint64_t requests_sent = 0;
    uint64_t requests_served = 0;
  };

  Stats stats() const;

  uint16_t listen_port() const { return listen_port_; }
  const std::string& device_id() const { return device_id_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

  // Valid after start().
  Folder& folder();
  FileIndex& index() { return *index_; }
  EventSink& events() { return events_; }

  LogListenerHandle add_log_listener(Logger::Listener listener);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

private:
  using tcp = asio::ip::tcp;

  void start_accept();
  void schedule_connect_tick();
  void ensure_workspace() const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  EventSink events_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<asio::steady_timer> connect_timer_;
  std::unique_ptr<FileIndex> index_;
  std::unique_ptr<Model> model_;
  std::shared_ptr<ConnectionManager> connections_;
  Folder* folder_ = nullptr;
  bool started_ = false;
  std::string device_id_;
  std::string listen_ip_;
  uint16_t listen_port_ = 0;
};
