#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "file_info.hpp"
#include "peer_connection.hpp"

using json = nlohmann::json;

// protocol.hpp
// One JSON object per line. Every message carries "type".
inline constexpr const char* kClientName = "replisync";

json make_hello(const std::string& device_id, const std::string& client = kClientName);
json make_index(const std::string& folder, const std::vector<FileInfo>& files);
json make_index_update(const std::string& folder, const std::vector<FileInfo>& files);
json make_request(const BlockRequest& request);
json make_response(uint64_t id, const RequestResponse& response);

// Parsers return nullopt (and set error) for malformed messages.
std::optional<BlockRequest> parse_request(const json& j, std::string& error);
std::optional<RequestResponse> parse_response(const json& j, std::string& error);
std::optional<std::vector<FileInfo>> parse_files(const json& j, std::string& error);
