#include "blocks.hpp"

#include <algorithm>
#include <map>

#include "abort_signal.hpp"
#include "filesystem.hpp"
#include "utils.hpp"

int32_t block_size_for(int64_t file_size) {
  int64_t block_size = kMinBlockSize;
  while(block_size < kMaxBlockSize) {
    if(file_size <= block_size * kDesiredBlocksPerFile) break;
    block_size *= 2;
  }
  return static_cast<int32_t>(block_size);
}

std::vector<BlockInfo> hash_blocks(File& file,
                                   int64_t size,
                                   int32_t block_size,
                                   std::error_code& ec,
                                   const AbortSignal* abort) {
  ec.clear();
  std::vector<BlockInfo> blocks;
  if(size <= 0 || block_size <= 0) return blocks;
  blocks.reserve(static_cast<std::size_t>((size + block_size - 1) / block_size));

  std::vector<char> buffer(static_cast<std::size_t>(std::min<int64_t>(block_size, size)));
  for(int64_t offset = 0; offset < size; offset += block_size) {
    if(abort && abort->closed()) {
      ec = std::make_error_code(std::errc::operation_canceled);
      return {};
    }
    auto length = static_cast<std::size_t>(std::min<int64_t>(block_size, size - offset));
    auto n = file.read_at(buffer.data(), length, offset, ec);
    if(ec) return {};
    if(n != length) {
      // File shrank under us.
      ec = std::make_error_code(std::errc::io_error);
      return {};
    }
    BlockInfo block;
    block.offset = offset;
    block.size = static_cast<int32_t>(length);
    block.hash = sha256_bytes(buffer.data(), length);
    block.weak_hash = weak_hash(buffer.data(), length);
    blocks.push_back(std::move(block));
  }
  return blocks;
}

std::vector<BlockInfo> hash_buffer(const std::string& data, int32_t block_size) {
  std::vector<BlockInfo> blocks;
  const auto size = static_cast<int64_t>(data.size());
  for(int64_t offset = 0; offset < size; offset += block_size) {
    auto length = static_cast<std::size_t>(std::min<int64_t>(block_size, size - offset));
    BlockInfo block;
    block.offset = offset;
    block.size = static_cast<int32_t>(length);
    block.hash = sha256_bytes(data.data() + offset, length);
    block.weak_hash = weak_hash(data.data() + offset, length);
    blocks.push_back(std::move(block));
  }
  return blocks;
}

bool verify_block(const char* data, std::size_t size, const BlockInfo& block) {
  if(size != static_cast<std::size_t>(block.size)) return false;
  if(block.weak_hash != 0 && weak_hash(data, size) != block.weak_hash) return false;
  return sha256_bytes(data, size) == block.hash;
}

BlockDiff diff_blocks(const std::vector<BlockInfo>& have, const std::vector<BlockInfo>& want) {
  std::map<int64_t, const BlockInfo*> by_offset;
  for(const auto& block : have) {
    by_offset[block.offset] = &block;
  }

  BlockDiff diff;
  for(const auto& block : want) {
    auto it = by_offset.find(block.offset);
    if(it != by_offset.end() && it->second->same_content(block)) {
      diff.copy.push_back(block);
    } else {
      diff.pull.push_back(block);
    }
  }
  return diff;
}

void WeakHashIndex::add_file(const FileInfo& file) {
  if(!file.is_file() || file.deleted || file.is_unusable()) return;
  for(const auto& block : file.blocks) {
    BlockLocation loc;
    loc.name = file.name;
    loc.offset = block.offset;
    loc.size = block.size;
    loc.hash = block.hash;
    locations_.emplace(block.weak_hash, std::move(loc));
  }
}

void WeakHashIndex::remove_file(const std::string& name) {
  for(auto it = locations_.begin(); it != locations_.end();) {
    if(it->second.name == name) {
      it = locations_.erase(it);
    } else {
      ++it;
    }
  }
}

std::vector<BlockLocation> WeakHashIndex::candidates(uint32_t weak_hash) const {
  std::vector<BlockLocation> out;
  auto range = locations_.equal_range(weak_hash);
  for(auto it = range.first; it != range.second; ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::vector<BlockLocation> WeakHashIndex::find(const BlockInfo& block) const {
  std::vector<BlockLocation> out;
  auto range = locations_.equal_range(block.weak_hash);
  for(auto it = range.first; it != range.second; ++it) {
    if(it->second.size == block.size && it->second.hash == block.hash) {
      out.push_back(it->second);
    }
  }
  return out;
}

bool WeakHashIndex::covers(const std::vector<BlockInfo>& blocks) const {
  return std::all_of(blocks.begin(), blocks.end(),
    [this](const BlockInfo& block){ return !find(block).empty(); });
}
