#include "sync_engine.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

#include "connection.hpp"
#include "connection_manager.hpp"
#include "file_index.hpp"
#include "model.hpp"
#include "settings_manager.hpp"

namespace {

std::string random_device_id() {
  std::random_device rd;
  std::uniform_int_distribution<uint32_t> dist;
  std::ostringstream out;
  out << std::hex << std::setfill('0')
      << std::setw(8) << dist(rd) << std::setw(8) << dist(rd);
  return out.str();
}

} // namespace

FolderConfig folder_config_from_settings(const SettingsManager& settings,
                                         const std::filesystem::path& workspace_root,
                                         const std::string& device_id) {
  FolderConfig config;
  config.id = settings.get<std::string>("folder_id");
  std::filesystem::path path = settings.get<std::string>("folder_path");
  config.path = path.is_absolute() ? path : workspace_root / path;
  config.device_id = device_id;
  config.pull_interval = std::chrono::milliseconds(settings.get<int64_t>("pull_interval_ms"));
  config.scan_interval = std::chrono::milliseconds(settings.get<int64_t>("scan_interval_ms"));
  config.pull_batch_size = settings.get<std::size_t>("pull_batch_size");
  config.copier_concurrency = settings.get<std::size_t>("copier_concurrency");
  config.puller_concurrency = settings.get<std::size_t>("puller_concurrency");
  config.request_timeout = std::chrono::milliseconds(settings.get<int64_t>("request_timeout_ms"));
  config.versioning = settings.get<std::string>("versioning");
  config.versioning_keep = settings.get<int>("versioning_keep");
  return config;
}

SyncEngine::SyncEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("replisync")) {
  if(options_.connect_interval.count() <= 0) {
    options_.connect_interval = std::chrono::milliseconds(2000);
  }
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

SyncEngine::~SyncEngine() {
  stop();
}

void SyncEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
  if(ec) {
    throw std::runtime_error("Cannot create workspace " + options_.workspace_root.string() + ": " + ec.message());
  }
}

void SyncEngine::start() {
  if(started_) return;
  started_ = true;

  ensure_workspace();
  init(settings_->get<bool>("verbose"));

  device_id_ = settings_->get<std::string>("device_id");
  if(device_id_.empty()) {
    device_id_ = random_device_id();
  }
  logger_ = logger_->child(device_id_);

  listen_ip_ = settings_->get<std::string>("listen_ip");
  listen_port_ = static_cast<uint16_t>(settings_->get<int>("listen_port"));

  auto config = folder_config_from_settings(*settings_, options_.workspace_root, device_id_);
  std::error_code ec;
  std::filesystem::create_directories(config.path, ec);
  if(ec) {
    throw std::runtime_error("Cannot create folder " + config.path.string() + ": " + ec.message());
  }

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(listen_ip_);
  } catch(const std::system_error& e) {
    logger_->error("Invalid listen_ip '{}': {}", listen_ip_, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, listen_port_);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  if(listen_port_ == 0) {
    listen_port_ = acceptor_->local_endpoint().port();
  }
  logger_->info("Device {} listening on {}:{}", device_id_, listen_ip_, listen_port_);

  index_ = std::make_unique<FileIndex>(device_id_);
  model_ = std::make_unique<Model>(logger_);
  connections_ = std::make_shared<ConnectionManager>(io_, device_id_, *model_, logger_->child("net"));
  connections_->set_peers(SettingsManager::split_list(settings_->get<std::string>("peers")));

  auto folder = std::make_unique<Folder>(config, *index_, events_, *connections_, logger_);
  folder_ = folder.get();
  model_->add_folder(std::move(folder));
  model_->start();

  start_accept();
  connections_->attempt_connect_more();
  if(options_.enable_connect_timer) {
    connect_timer_ = std::make_unique<asio::steady_timer>(io_);
    schedule_connect_tick();
  }
}

void SyncEngine::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          logger_->error("Accept error: {}", ec.message());
        }
      } else if(connections_) {
        std::error_code remote_ec;
        auto remote = socket.remote_endpoint(remote_ec);
        logger_->debug("Accepted connection from {}", remote_ec ? std::string("?") : remote.address().to_string());
        Connection::create(io_, std::move(socket), connections_);
      }
      if(started_ && acceptor_ && acceptor_->is_open()) {
        start_accept();
      }
    });
}

void SyncEngine::schedule_connect_tick() {
  if(!connect_timer_) return;
  connect_timer_->expires_after(options_.connect_interval);
  connect_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    if(connections_) {
      connections_->attempt_connect_more();
    }
    schedule_connect_tick();
  });
}

void SyncEngine::run() {
  if(!started_) start();
  io_.run();
}

void SyncEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void SyncEngine::stop() {
  if(!started_) return;
  started_ = false;

  // Folders first: their pullers may be waiting on responses.
  if(model_) model_->stop();

  if(connect_timer_) {
    std::error_code ec;
    connect_timer_->cancel(ec);
  }
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  if(connections_) connections_->close_all();
  connect_timer_.reset();
  acceptor_.reset();
  if(index_) index_->close();
  io_.restart();
}

Folder& SyncEngine::folder() {
  if(!folder_) throw std::logic_error("SyncEngine::folder() before start()");
  return *folder_;
}

SyncEngine::Stats SyncEngine::stats() const {
  Stats s;
  if(connections_) {
    s.connected_peers = connections_->connected_count();
    s.configured_peers = connections_->peers().size();
  }
  if(folder_ && index_) {
    s.local_files = index_->files(folder_->folder_id(), device_id_).size();
    s.needed_files = index_->need(folder_->folder_id()).size();
    s.requests_sent = folder_->requests_sent();
    s.requests_served = folder_->requests_served();
  }
  return s;
}

LogListenerHandle SyncEngine::add_log_listener(Logger::Listener listener) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener));
}

void SyncEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

void SyncEngine::clear_log_listeners() {
  if(logger_) {
    logger_->clear_listeners();
  }
}
