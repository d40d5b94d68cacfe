#include "connection.hpp"
#include "connection_manager.hpp"
#include "protocol.hpp"
#include "log.hpp"

namespace {
// A block of kMaxBlockSize as base64 plus the JSON around it.
constexpr std::size_t kMaxLineLength = 24u << 20;
}

std::shared_ptr<Connection> Connection::create(asio::io_context& io,
                                               asio::ip::tcp::socket sock,
                                               std::shared_ptr<ConnectionManager> manager,
                                               std::string dialed_address)
{
    auto c = std::shared_ptr<Connection>(new Connection(io, std::move(sock), std::move(manager),
                                                        std::move(dialed_address)));
    c->start();
    return c;
}

Connection::Connection(asio::io_context& io,
                       asio::ip::tcp::socket sock,
                       std::shared_ptr<ConnectionManager> manager,
                       std::string dialed_address)
: io_(io), socket_(std::move(sock)), manager_(std::move(manager)),
  dialed_address_(std::move(dialed_address)), read_buf_(kMaxLineLength)
{
}

Connection::~Connection(){
    std::error_code ec;
    socket_.close(ec);
}

void Connection::start(){
    send_json(make_hello(manager_->local_device()));
    do_read();
}

std::string Connection::device_id() const {
    std::lock_guard lg(m_);
    return device_id_;
}

void Connection::do_read(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\n",
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                if(open_.load()){
                    manager_->logger()->debug("Connection to {} closed: {}", device_id(), ec.message());
                }
                close();
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if(!line.empty()){
                handle_line(line);
            }
            if(open_.load()) do_read();
        });
}

void Connection::handle_line(const std::string& line){
    nlohmann::json j;
    try{
        j = nlohmann::json::parse(line);
    } catch(const nlohmann::json::parse_error& ex){
        manager_->logger()->warn("Failed to parse message from {}: {}", device_id(), ex.what());
        return;
    }
    const std::string type = j.value("type", "");

    if(type == "hello"){
        handle_hello(j);
        return;
    }
    if(!hello_received_.load()){
        manager_->logger()->warn("Dropping '{}' received before hello", type);
        return;
    }
    const auto device = device_id();

    std::string error;
    if(type == "index" || type == "index_update"){
        auto files = parse_files(j, error);
        if(!files){
            manager_->logger()->warn("Bad {} from {}: {}", type, device, error);
            return;
        }
        manager_->on_index(device, j.value("folder", ""), std::move(*files), type == "index");
    } else if(type == "request"){
        auto request = parse_request(j, error);
        if(!request){
            manager_->logger()->warn("Bad request from {}: {}", device, error);
            return;
        }
        auto response = manager_->on_request(device, *request);
        send_json(make_response(request->id, response));
    } else if(type == "response"){
        handle_response(j);
    } else {
        manager_->logger()->debug("Unknown message type '{}' from {}", type, device);
    }
}

void Connection::handle_hello(const nlohmann::json& j){
    if(hello_received_.load()) return;
    auto device = j.value("device_id", "");
    if(device.empty()){
        manager_->logger()->warn("Hello without device id, closing");
        close();
        return;
    }
    {
        std::lock_guard lg(m_);
        device_id_ = device;
    }
    hello_received_ = true;
    if(!manager_->on_hello(shared_from_this())){
        close();
    }
}

void Connection::handle_response(const nlohmann::json& j){
    uint64_t id = j.value("id", uint64_t{0});
    ResponseHandler handler;
    {
        std::lock_guard lg(m_);
        auto it = pending_.find(id);
        if(it == pending_.end()) return; // cancelled or timed out
        handler = std::move(it->second);
        pending_.erase(it);
    }
    std::string error;
    auto response = parse_response(j, error);
    if(!response){
        handler(RequestResponse::failure(RequestError::Generic, error));
        return;
    }
    handler(*response);
}

void Connection::send_json(const nlohmann::json& j){
    auto s = j.dump() + "\n";
    auto self = shared_from_this();
    asio::post(io_, [this, self, s = std::move(s)]() mutable {
        if(!open_.load()) return;
        write_queue_.push_back(std::move(s));
        if(!writing_){
            do_write();
        }
    });
}

void Connection::do_write(){
    if(write_queue_.empty()) return;
    writing_ = true;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                manager_->logger()->debug("Write to {} failed: {}", device_id(), ec.message());
                writing_ = false;
                close();
                return;
            }
            write_queue_.pop_front();
            if(!write_queue_.empty()){
                do_write();
            } else {
                writing_ = false;
            }
        });
}

std::optional<uint64_t> Connection::send_request(const BlockRequest& request, ResponseHandler handler){
    if(!connected() || !handler) return std::nullopt;
    BlockRequest numbered = request;
    numbered.id = next_request_id_++;
    {
        std::lock_guard lg(m_);
        pending_[numbered.id] = std::move(handler);
    }
    send_json(make_request(numbered));
    return numbered.id;
}

bool Connection::cancel_request(uint64_t id){
    std::lock_guard lg(m_);
    return pending_.erase(id) > 0;
}

void Connection::send_index(const std::string& folder, const std::vector<FileInfo>& files){
    send_json(make_index(folder, files));
}

void Connection::send_index_update(const std::string& folder, const std::vector<FileInfo>& files){
    send_json(make_index_update(folder, files));
}

void Connection::fail_pending(const std::string& reason){
    std::unordered_map<uint64_t, ResponseHandler> pending;
    {
        std::lock_guard lg(m_);
        pending.swap(pending_);
    }
    for(auto& kv : pending){
        kv.second(RequestResponse::failure(RequestError::Generic, reason));
    }
}

void Connection::close(){
    if(!open_.exchange(false)) return;
    std::error_code ec;
    socket_.close(ec);
    write_queue_.clear();
    fail_pending("connection closed");
    manager_->on_closed(shared_from_this());
}

void Connection::connect_outgoing(asio::io_context& io,
                                  const std::string& host,
                                  unsigned short port,
                                  std::shared_ptr<ConnectionManager> manager)
{
    auto address = host + ":" + std::to_string(port);
    auto resolver = std::make_shared<asio::ip::tcp::resolver>(io);
    resolver->async_resolve(host, std::to_string(port),
        [resolver, &io, manager, address](std::error_code ec, asio::ip::tcp::resolver::results_type results){
            if(ec){
                manager->logger()->debug("Resolve failed for {}: {}", address, ec.message());
                manager->on_connect_failed(address);
                return;
            }
            auto sock = std::make_shared<asio::ip::tcp::socket>(io);
            asio::async_connect(*sock, results,
                [sock, &io, manager, address](std::error_code ec, const asio::ip::tcp::endpoint&){
                    if(ec){
                        manager->logger()->debug("Connect to {} failed: {}", address, ec.message());
                        manager->on_connect_failed(address);
                        return;
                    }
                    manager->logger()->info("Connected to {}", address);
                    Connection::create(io, std::move(*sock), manager, address);
                });
        });
}
