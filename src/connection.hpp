#pragma once
#include <asio.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "peer_connection.hpp"

class ConnectionManager;

// One TCP link to a remote device. Newline-delimited JSON in both
// directions; the first message each side sends is its hello.
class Connection : public PeerConnection,
                   public std::enable_shared_from_this<Connection> {
public:
    // For an accepted socket, or one connect_outgoing() established.
    static std::shared_ptr<Connection> create(asio::io_context& io,
                                              asio::ip::tcp::socket sock,
                                              std::shared_ptr<ConnectionManager> manager,
                                              std::string dialed_address = {});

    // Resolves and connects, then creates the connection.
    static void connect_outgoing(asio::io_context& io,
                                 const std::string& host,
                                 unsigned short port,
                                 std::shared_ptr<ConnectionManager> manager);

    ~Connection() override;

    void start(); // send hello and start the read loop
    // Closes the socket and fails pending requests. Must run on the io
    // thread, or after it has stopped.
    void close();

    // Thread safe.
    void send_json(const nlohmann::json& j);

    // Address we dialed, empty for accepted connections.
    const std::string& dialed_address() const { return dialed_address_; }
    bool outbound() const { return !dialed_address_.empty(); }

    // PeerConnection
    std::string device_id() const override;
    bool connected() const override { return open_.load() && hello_received_.load(); }
    std::optional<uint64_t> send_request(const BlockRequest& request, ResponseHandler handler) override;
    bool cancel_request(uint64_t id) override;
    void send_index(const std::string& folder, const std::vector<FileInfo>& files) override;
    void send_index_update(const std::string& folder, const std::vector<FileInfo>& files) override;

private:
    Connection(asio::io_context& io,
               asio::ip::tcp::socket sock,
               std::shared_ptr<ConnectionManager> manager,
               std::string dialed_address);
    void do_read();
    void handle_line(const std::string& line);
    void handle_hello(const nlohmann::json& j);
    void handle_response(const nlohmann::json& j);
    void do_write();
    void fail_pending(const std::string& reason);

    asio::io_context& io_;
    asio::ip::tcp::socket socket_;
    std::shared_ptr<ConnectionManager> manager_;
    std::string dialed_address_;
    asio::streambuf read_buf_;
    std::deque<std::string> write_queue_; // io thread only
    bool writing_ = false;

    mutable std::mutex m_;
    std::string device_id_;
    std::unordered_map<uint64_t, ResponseHandler> pending_;
    std::atomic<uint64_t> next_request_id_{1};
    std::atomic<bool> open_{true};
    std::atomic<bool> hello_received_{false};
};
