#pragma once
#include <asio.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "log.hpp"
#include "peer_connection.hpp"

class Connection;

// Keeps at most one live connection per remote device, dials the configured
// peer addresses, and hands inbound traffic to the MessageHandler.
class ConnectionManager : public PeerSet,
                          public std::enable_shared_from_this<ConnectionManager> {
public:
    ConnectionManager(asio::io_context& io,
                      std::string local_device,
                      MessageHandler& handler,
                      std::shared_ptr<Logger> logger);

    // host:port addresses to keep connected.
    void set_peers(std::vector<std::string> addresses);
    std::vector<std::string> peers() const;

    // Dials every configured address without a live connection.
    void attempt_connect_more();
    void on_connect_failed(const std::string& address);

    // Called once the remote hello arrived. Returns false if the connection
    // must be closed (our own device, or a duplicate that loses).
    bool on_hello(const std::shared_ptr<Connection>& conn);
    void on_closed(const std::shared_ptr<Connection>& conn);
    void on_index(const std::string& device,
                  const std::string& folder,
                  std::vector<FileInfo> files,
                  bool full);
    RequestResponse on_request(const std::string& device, const BlockRequest& request);

    // Closes everything. Call with the io_context stopped.
    void close_all();

    // PeerSet
    std::shared_ptr<PeerConnection> connection(const std::string& device) const override;
    std::vector<std::shared_ptr<PeerConnection>> connections() const override;

    std::size_t connected_count() const;
    asio::io_context& io() { return io_; }
    const std::string& local_device() const { return local_device_; }
    std::shared_ptr<Logger> logger() const { return logger_; }

private:
    // Between two devices dialing each other, keep the link dialed by the
    // smaller device id.
    bool preferred(const Connection& conn) const;

    asio::io_context& io_;
    std::string local_device_;
    MessageHandler& handler_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex m_;
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections_; // device -> connection
    std::vector<std::string> peers_;
    std::set<std::string> dialing_;                  // addresses with a connect in flight
    std::map<std::string, std::string> address_device_; // dialed address -> device seen there
};
