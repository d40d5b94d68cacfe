#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "peer_connection.hpp"

class FolderContext;

// Answers block requests from remote devices for one folder. Runs on the
// transport thread, concurrently with the pull pipeline; it only reads the
// index and the disk.
class RequestHandler {
public:
  // Temp file of an in-progress pull for name, if there is one.
  using TempLookup = std::function<std::optional<std::string>(const std::string& name)>;

  RequestHandler(FolderContext& folder, TempLookup in_flight_temp, std::shared_ptr<Logger> logger);

  RequestResponse serve(const std::string& device, const BlockRequest& request);

  uint64_t served() const { return served_.load(); }

private:
  std::optional<std::vector<char>> read_temporary(const BlockRequest& request);
  RequestResponse read_verified(const std::string& path, const BlockRequest& request);

  FolderContext& folder_;
  TempLookup in_flight_temp_;
  std::shared_ptr<Logger> logger_;
  std::atomic<uint64_t> served_{0};
};
