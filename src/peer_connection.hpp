#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "file_info.hpp"

enum class RequestError {
  None,
  Generic,
  PermissionDenied, // symlink in the path
  NotAvailable,     // ignored, invalid, deleted or unknown here
  InvalidFile,      // bad name, bad range, unreadable
  InvalidContent    // bytes on disk no longer match the requested hashes
};

const char* to_string(RequestError error);
RequestError request_error_from_string(const std::string& value);

struct BlockRequest {
  uint64_t id = 0;
  std::string folder;
  std::string name;
  int64_t offset = 0;
  int32_t size = 0;
  Bytes hash;             // empty when the requester has none
  uint32_t weak_hash = 0; // 0 when the requester has none
  bool from_temporary = false;
};

struct RequestResponse {
  RequestError error = RequestError::None;
  std::vector<char> data;
  std::string message;

  bool ok() const { return error == RequestError::None; }

  static RequestResponse failure(RequestError error, std::string message) {
    RequestResponse r;
    r.error = error;
    r.message = std::move(message);
    return r;
  }
};

// One connected remote device, as seen by the sync engine.
class PeerConnection {
public:
  using ResponseHandler = std::function<void(const RequestResponse&)>;

  virtual ~PeerConnection() = default;

  virtual std::string device_id() const = 0;
  virtual bool connected() const = 0;

  // Returns the request id, or nullopt if the request could not be sent. The
  // handler runs at most once, on the transport's thread.
  virtual std::optional<uint64_t> send_request(const BlockRequest& request, ResponseHandler handler) = 0;
  virtual bool cancel_request(uint64_t id) = 0;

  virtual void send_index(const std::string& folder, const std::vector<FileInfo>& files) = 0;
  virtual void send_index_update(const std::string& folder, const std::vector<FileInfo>& files) = 0;
};

// Inbound side of the transport.
class MessageHandler {
public:
  virtual ~MessageHandler() = default;

  virtual void on_connected(const std::shared_ptr<PeerConnection>& connection) = 0;
  virtual void on_disconnected(const std::string& device) = 0;
  virtual void on_index(const std::string& device,
                        const std::string& folder,
                        std::vector<FileInfo> files,
                        bool full) = 0;
  virtual RequestResponse on_request(const std::string& device, const BlockRequest& request) = 0;
};

// Lookup of live connections by device id.
class PeerSet {
public:
  virtual ~PeerSet() = default;

  virtual std::shared_ptr<PeerConnection> connection(const std::string& device) const = 0;
  virtual std::vector<std::shared_ptr<PeerConnection>> connections() const = 0;
};
