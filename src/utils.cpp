#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <zlib.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const Bytes& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::optional<Bytes> bytes_from_hex(const std::string& hex){
    if(hex.size() % 2 != 0) return std::nullopt;
    auto nibble = [](char c) -> int {
        if(c >= '0' && c <= '9') return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };
    Bytes out;
    out.reserve(hex.size() / 2);
    for(std::size_t i = 0; i < hex.size(); i += 2){
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if(hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

Bytes sha256_bytes(const char* data, std::size_t size){
    Bytes out(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data), size, out.data());
    return out;
}

Bytes sha256_bytes(const std::string &data){
    return sha256_bytes(data.data(), data.size());
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

uint32_t weak_hash(const char* data, std::size_t size){
    uLong adler = adler32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large buffers in pieces.
    constexpr std::size_t kStep = 1u << 30;
    while(size > 0){
        auto n = static_cast<uInt>(std::min(size, kStep));
        adler = adler32(adler, reinterpret_cast<const Bytef*>(data), n);
        data += n;
        size -= n;
    }
    return static_cast<uint32_t>(adler);
}

std::string base64_encode(const char* data, std::size_t size){
    if(size == 0) return "";
    std::string out(4 * ((size + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data),
                                  static_cast<int>(size));
    out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
    return out;
}

std::optional<std::vector<char>> base64_decode(const std::string& encoded){
    if(encoded.empty()) return std::vector<char>{};
    if(encoded.size() % 4 != 0) return std::nullopt;
    std::vector<char> out(3 * encoded.size() / 4);
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if(written < 0) return std::nullopt;
    // EVP_DecodeBlock counts the padding as zero bytes.
    std::size_t padding = 0;
    if(encoded[encoded.size() - 1] == '=') ++padding;
    if(encoded[encoded.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

std::string format_size(uint64_t bytes){
    static const std::array<const char*, 5> units = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(value >= 1024.0 && unit + 1 < units.size()){
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if(unit == 0) oss << bytes << " " << units[unit];
    else oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    return oss.str();
}
