#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "utils.hpp"
#include "version_vector.hpp"

struct BlockInfo {
  int64_t offset = 0;
  int32_t size = 0;
  Bytes hash;             // SHA-256 of the block
  uint32_t weak_hash = 0; // Adler-32 of the block

  bool same_content(const BlockInfo& other) const {
    return size == other.size && hash == other.hash;
  }
};

// A block-aligned byte range of a target file, with the hashes its bytes
// must have once written.
using Segment = BlockInfo;

enum class FileType { File, Directory, Symlink };

const char* to_string(FileType type);
std::optional<FileType> file_type_from_string(const std::string& value);

struct FileInfo {
  std::string name;  // slash separated, relative to the folder root
  FileType type = FileType::File;
  VersionVector version;
  std::vector<BlockInfo> blocks;
  int64_t size = 0;
  uint32_t permissions = 0644;
  int64_t modified_s = 0;
  int32_t modified_ns = 0;
  std::string symlink_target;
  std::string modified_by; // device that produced this version
  bool deleted = false;
  bool invalid = false;    // announced but unusable as a source
  bool ignored = false;    // local flag: matched by the ignore patterns
  int64_t sequence = 0;    // per folder, assigned on local commit

  bool is_file() const { return type == FileType::File; }
  bool is_directory() const { return type == FileType::Directory; }
  bool is_symlink() const { return type == FileType::Symlink; }
  bool is_unusable() const { return invalid || ignored; }

  // Same type and, for files, the same block hash sequence.
  bool same_content(const FileInfo& other) const;
  // Content plus the metadata we apply to disk.
  bool same_metadata(const FileInfo& other) const;

  nlohmann::json to_json() const;
  static std::optional<FileInfo> from_json(const nlohmann::json& j, std::string& error);
};

bool blocks_equal(const std::vector<BlockInfo>& a, const std::vector<BlockInfo>& b);
