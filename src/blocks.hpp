#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "file_info.hpp"

class AbortSignal;
class File;

inline constexpr int32_t kMinBlockSize = 128 << 10;
inline constexpr int32_t kMaxBlockSize = 16 << 20;
inline constexpr int64_t kDesiredBlocksPerFile = 2000;

// Smallest power of two in [128 KiB, 16 MiB] that keeps the file at or
// below 2000 blocks.
int32_t block_size_for(int64_t file_size);

// Hashes size bytes of file in block_size pieces. Stops with
// operation_canceled if abort is closed while hashing.
std::vector<BlockInfo> hash_blocks(File& file,
                                   int64_t size,
                                   int32_t block_size,
                                   std::error_code& ec,
                                   const AbortSignal* abort = nullptr);

std::vector<BlockInfo> hash_buffer(const std::string& data, int32_t block_size);

// Weak hash first (when the block carries one), then SHA-256.
bool verify_block(const char* data, std::size_t size, const BlockInfo& block);

struct BlockDiff {
  std::vector<BlockInfo> copy; // already present at the same offset
  std::vector<BlockInfo> pull; // everything else
};

BlockDiff diff_blocks(const std::vector<BlockInfo>& have, const std::vector<BlockInfo>& want);

struct BlockLocation {
  std::string name;
  int64_t offset = 0;
  int32_t size = 0;
  Bytes hash;
};

// Weak hash -> places in local files where a block with that checksum lives.
// Candidates are only hints; callers re-verify the strong hash of what they
// actually read.
class WeakHashIndex {
public:
  void add_file(const FileInfo& file);
  void remove_file(const std::string& name);

  std::vector<BlockLocation> candidates(uint32_t weak_hash) const;
  // Candidates whose recorded size and strong hash also match.
  std::vector<BlockLocation> find(const BlockInfo& block) const;
  // True if every block has at least one strong match.
  bool covers(const std::vector<BlockInfo>& blocks) const;

  std::size_t size() const { return locations_.size(); }
  bool empty() const { return locations_.empty(); }

private:
  std::unordered_multimap<uint32_t, BlockLocation> locations_;
};
