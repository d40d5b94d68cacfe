#include "file_info.hpp"

const char* to_string(FileType type) {
  switch(type) {
    case FileType::File: return "file";
    case FileType::Directory: return "directory";
    case FileType::Symlink: return "symlink";
  }
  return "file";
}

std::optional<FileType> file_type_from_string(const std::string& value) {
  if(value == "file") return FileType::File;
  if(value == "directory") return FileType::Directory;
  if(value == "symlink") return FileType::Symlink;
  return std::nullopt;
}

bool blocks_equal(const std::vector<BlockInfo>& a, const std::vector<BlockInfo>& b) {
  if(a.size() != b.size()) return false;
  for(std::size_t i = 0; i < a.size(); ++i) {
    if(a[i].offset != b[i].offset || !a[i].same_content(b[i])) return false;
  }
  return true;
}

bool FileInfo::same_content(const FileInfo& other) const {
  if(type != other.type || deleted != other.deleted) return false;
  switch(type) {
    case FileType::File:
      return size == other.size && blocks_equal(blocks, other.blocks);
    case FileType::Symlink:
      return symlink_target == other.symlink_target;
    case FileType::Directory:
      return true;
  }
  return false;
}

bool FileInfo::same_metadata(const FileInfo& other) const {
  if(!same_content(other)) return false;
  if(type == FileType::Symlink) return true;
  return (permissions & 0777) == (other.permissions & 0777);
}

nlohmann::json FileInfo::to_json() const {
  nlohmann::json j;
  j["name"] = name;
  j["type"] = ::to_string(type);
  j["version"] = version.to_json();
  j["size"] = size;
  j["permissions"] = permissions;
  j["modified_s"] = modified_s;
  j["modified_ns"] = modified_ns;
  j["modified_by"] = modified_by;
  j["deleted"] = deleted;
  j["invalid"] = invalid || ignored;
  j["sequence"] = sequence;
  if(type == FileType::Symlink) j["symlink_target"] = symlink_target;

  nlohmann::json arr = nlohmann::json::array();
  for(const auto& block : blocks) {
    nlohmann::json b;
    b["offset"] = block.offset;
    b["size"] = block.size;
    b["hash"] = hex_from_bytes(block.hash);
    b["weak_hash"] = block.weak_hash;
    arr.push_back(b);
  }
  j["blocks"] = arr;
  return j;
}

std::optional<FileInfo> FileInfo::from_json(const nlohmann::json& j, std::string& error) {
  if(!j.is_object()) {
    error = "file entry is not an object";
    return std::nullopt;
  }
  FileInfo f;
  try {
    f.name = j.value("name", "");
    if(f.name.empty()) {
      error = "file entry without name";
      return std::nullopt;
    }
    auto type = file_type_from_string(j.value("type", "file"));
    if(!type) {
      error = "unknown file type for " + f.name;
      return std::nullopt;
    }
    f.type = *type;
    f.version = VersionVector::from_json(j.value("version", nlohmann::json::object()));
    f.size = j.value("size", int64_t{0});
    f.permissions = j.value("permissions", 0644u);
    f.modified_s = j.value("modified_s", int64_t{0});
    f.modified_ns = j.value("modified_ns", 0);
    f.modified_by = j.value("modified_by", "");
    f.deleted = j.value("deleted", false);
    f.invalid = j.value("invalid", false);
    f.sequence = j.value("sequence", int64_t{0});
    f.symlink_target = j.value("symlink_target", "");

    int64_t expected_offset = 0;
    for(const auto& b : j.value("blocks", nlohmann::json::array())) {
      BlockInfo block;
      block.offset = b.value("offset", int64_t{0});
      block.size = b.value("size", 0);
      block.weak_hash = b.value("weak_hash", 0u);
      auto hash = bytes_from_hex(b.value("hash", ""));
      if(!hash || block.size <= 0 || block.offset != expected_offset) {
        error = "malformed block list for " + f.name;
        return std::nullopt;
      }
      block.hash = std::move(*hash);
      expected_offset += block.size;
      f.blocks.push_back(std::move(block));
    }
    if(f.is_file() && !f.deleted && !f.invalid && expected_offset != f.size) {
      error = "block list does not cover " + f.name;
      return std::nullopt;
    }
  } catch(const nlohmann::json::exception& e) {
    error = e.what();
    return std::nullopt;
  }
  return f;
}
