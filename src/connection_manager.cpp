#include "connection_manager.hpp"
#include "connection.hpp"
#include <stdexcept>

ConnectionManager::ConnectionManager(asio::io_context& io,
                                     std::string local_device,
                                     MessageHandler& handler,
                                     std::shared_ptr<Logger> logger)
    : io_(io),
      local_device_(std::move(local_device)),
      handler_(handler),
      logger_(logger ? std::move(logger) : std::make_shared<Logger>("connections"))
{
}

void ConnectionManager::set_peers(std::vector<std::string> addresses){
    std::lock_guard lg(m_);
    peers_ = std::move(addresses);
}

std::vector<std::string> ConnectionManager::peers() const {
    std::lock_guard lg(m_);
    return peers_;
}

void ConnectionManager::attempt_connect_more(){
    std::lock_guard lg(m_);
    for(const auto& address : peers_){
        if(dialing_.count(address)) continue;
        auto known = address_device_.find(address);
        if(known != address_device_.end() &&
           (known->second == local_device_ || connections_.count(known->second))) continue;

        auto pos = address.rfind(':');
        if(pos == std::string::npos){
            logger_->warn("Peer address must be host:port (got '{}')", address);
            continue;
        }
        std::string host = address.substr(0, pos);
        int value = 0;
        try {
            value = std::stoi(address.substr(pos + 1));
        } catch(const std::logic_error&){
            value = 0;
        }
        if(value <= 0 || value > 65535){
            logger_->warn("Invalid port in peer address '{}'", address);
            continue;
        }
        auto port = static_cast<unsigned short>(value);

        dialing_.insert(address);
        asio::post(io_, [host, port, self = shared_from_this()](){
            Connection::connect_outgoing(self->io(), host, port, self);
        });
    }
}

void ConnectionManager::on_connect_failed(const std::string& address){
    std::lock_guard lg(m_);
    dialing_.erase(address);
}

bool ConnectionManager::preferred(const Connection& conn) const {
    // The smaller id dials; so an outbound link wins iff we are smaller.
    return conn.outbound() == (local_device_ < conn.device_id());
}

bool ConnectionManager::on_hello(const std::shared_ptr<Connection>& conn){
    const auto device = conn->device_id();
    std::shared_ptr<Connection> replaced;
    {
        std::lock_guard lg(m_);
        if(conn->outbound()){
            dialing_.erase(conn->dialed_address());
            address_device_[conn->dialed_address()] = device;
        }
        if(device == local_device_){
            logger_->warn("Connected to ourselves at {}, dropping", conn->dialed_address());
            return false;
        }
        auto it = connections_.find(device);
        if(it != connections_.end() && it->second != conn){
            if(!preferred(*conn)){
                logger_->debug("Already connected to {}, dropping duplicate", device);
                return false;
            }
            replaced = it->second;
        }
        connections_[device] = conn;
    }
    if(replaced){
        logger_->debug("Replacing duplicate connection to {}", device);
        replaced->close();
    }
    logger_->info("Device {} says hello", device);
    handler_.on_connected(conn);
    return true;
}

void ConnectionManager::on_closed(const std::shared_ptr<Connection>& conn){
    const auto device = conn->device_id();
    bool was_current = false;
    {
        std::lock_guard lg(m_);
        if(conn->outbound()) dialing_.erase(conn->dialed_address());
        auto it = connections_.find(device);
        if(it != connections_.end() && it->second == conn){
            connections_.erase(it);
            was_current = true;
        }
    }
    if(was_current) handler_.on_disconnected(device);
}

void ConnectionManager::on_index(const std::string& device,
                                 const std::string& folder,
                                 std::vector<FileInfo> files,
                                 bool full){
    handler_.on_index(device, folder, std::move(files), full);
}

RequestResponse ConnectionManager::on_request(const std::string& device, const BlockRequest& request){
    return handler_.on_request(device, request);
}

void ConnectionManager::close_all(){
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections;
    {
        std::lock_guard lg(m_);
        connections.swap(connections_);
        dialing_.clear();
    }
    for(auto& kv : connections){
        kv.second->close();
    }
}

std::shared_ptr<PeerConnection> ConnectionManager::connection(const std::string& device) const {
    std::lock_guard lg(m_);
    auto it = connections_.find(device);
    if(it == connections_.end()) return nullptr;
    return it->second;
}

std::vector<std::shared_ptr<PeerConnection>> ConnectionManager::connections() const {
    std::lock_guard lg(m_);
    std::vector<std::shared_ptr<PeerConnection>> out;
    out.reserve(connections_.size());
    for(const auto& kv : connections_){
        out.push_back(kv.second);
    }
    return out;
}

std::size_t ConnectionManager::connected_count() const {
    std::lock_guard lg(m_);
    return connections_.size();
}
