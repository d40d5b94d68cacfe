#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using Bytes = std::vector<uint8_t>;

std::string hex_from_bytes(const Bytes&);
std::optional<Bytes> bytes_from_hex(const std::string& hex);

Bytes sha256_bytes(const char* data, std::size_t size);
Bytes sha256_bytes(const std::string& data);
std::string sha256_hex(const std::string& data);

// Adler-32 of the buffer, the cheap "weak" block checksum.
uint32_t weak_hash(const char* data, std::size_t size);

std::string base64_encode(const char* data, std::size_t size);
std::optional<std::vector<char>> base64_decode(const std::string& encoded);

std::string format_size(uint64_t bytes);
