#include "protocol.hpp"

#include "utils.hpp"

namespace {

json make_file_list(const char* type, const std::string& folder, const std::vector<FileInfo>& files) {
    json j;
    j["type"] = type;
    j["folder"] = folder;
    json arr = json::array();
    for(const auto& f : files){
        arr.push_back(f.to_json());
    }
    j["files"] = std::move(arr);
    return j;
}

} // namespace

const char* to_string(RequestError error) {
    switch(error){
        case RequestError::None: return "none";
        case RequestError::Generic: return "generic";
        case RequestError::PermissionDenied: return "permission_denied";
        case RequestError::NotAvailable: return "not_available";
        case RequestError::InvalidFile: return "invalid_file";
        case RequestError::InvalidContent: return "invalid_content";
    }
    return "generic";
}

RequestError request_error_from_string(const std::string& value) {
    if(value == "none") return RequestError::None;
    if(value == "permission_denied") return RequestError::PermissionDenied;
    if(value == "not_available") return RequestError::NotAvailable;
    if(value == "invalid_file") return RequestError::InvalidFile;
    if(value == "invalid_content") return RequestError::InvalidContent;
    return RequestError::Generic;
}

json make_hello(const std::string& device_id, const std::string& client) {
    json j;
    j["type"] = "hello";
    j["device_id"] = device_id;
    j["client"] = client;
    return j;
}

json make_index(const std::string& folder, const std::vector<FileInfo>& files) {
    return make_file_list("index", folder, files);
}

json make_index_update(const std::string& folder, const std::vector<FileInfo>& files) {
    return make_file_list("index_update", folder, files);
}

json make_request(const BlockRequest& request) {
    json j;
    j["type"] = "request";
    j["id"] = request.id;
    j["folder"] = request.folder;
    j["name"] = request.name;
    j["offset"] = request.offset;
    j["size"] = request.size;
    j["hash"] = hex_from_bytes(request.hash);
    j["weak_hash"] = request.weak_hash;
    j["from_temporary"] = request.from_temporary;
    return j;
}

json make_response(uint64_t id, const RequestResponse& response) {
    json j;
    j["type"] = "response";
    j["id"] = id;
    if(response.ok()){
        j["data"] = base64_encode(response.data.data(), response.data.size());
    } else {
        j["code"] = to_string(response.error);
        j["error"] = response.message;
    }
    return j;
}

std::optional<BlockRequest> parse_request(const json& j, std::string& error) {
    BlockRequest r;
    try {
        r.id = j.at("id").get<uint64_t>();
        r.folder = j.value("folder", "");
        r.name = j.value("name", "");
        r.offset = j.value("offset", int64_t{0});
        r.size = j.value("size", 0);
        r.weak_hash = j.value("weak_hash", 0u);
        r.from_temporary = j.value("from_temporary", false);
        auto hash = bytes_from_hex(j.value("hash", ""));
        if(!hash){
            error = "bad hash in request " + std::to_string(r.id);
            return std::nullopt;
        }
        r.hash = std::move(*hash);
    } catch(const json::exception& e){
        error = std::string("malformed request: ") + e.what();
        return std::nullopt;
    }
    return r;
}

std::optional<RequestResponse> parse_response(const json& j, std::string& error) {
    RequestResponse r;
    try {
        if(j.contains("code")){
            r.error = request_error_from_string(j.value("code", "generic"));
            if(r.error == RequestError::None) r.error = RequestError::Generic;
            r.message = j.value("error", "");
            return r;
        }
        auto data = base64_decode(j.value("data", ""));
        if(!data){
            error = "bad base64 payload";
            return std::nullopt;
        }
        r.data = std::move(*data);
    } catch(const json::exception& e){
        error = std::string("malformed response: ") + e.what();
        return std::nullopt;
    }
    return r;
}

std::optional<std::vector<FileInfo>> parse_files(const json& j, std::string& error) {
    auto it = j.find("files");
    if(it == j.end() || !it->is_array()){
        error = "index without file list";
        return std::nullopt;
    }
    std::vector<FileInfo> files;
    files.reserve(it->size());
    for(const auto& entry : *it){
        auto f = FileInfo::from_json(entry, error);
        if(!f) return std::nullopt;
        files.push_back(std::move(*f));
    }
    return files;
}
