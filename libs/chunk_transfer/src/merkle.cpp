#include "merkle.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace edgesync {

namespace {

constexpr char kLeafPrefix = '\x00';
constexpr char kNodePrefix = '\x01';

using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

/// Raw SHA-256 over the concatenation of parts
std::string sha256_raw(std::initializer_list<const std::string*> parts) {
    DigestCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 init failed");
    }
    for (const auto* part : parts) {
        if (EVP_DigestUpdate(ctx.get(), part->data(), part->size()) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw std::runtime_error("SHA-256 final failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), len);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string hex_encode(const std::string& bytes) {
    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        result += hex[(b >> 4) & 0xF];
        result += hex[b & 0xF];
    }
    return result;
}

std::string hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Odd-length hex string");
    }
    std::string bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex digit in '" + hex + "'");
        }
        bytes += static_cast<char>((hi << 4) | lo);
    }
    return bytes;
}

std::string sha256_hex(const std::string& data) {
    return hex_encode(sha256_raw({&data}));
}

std::string merkle_root(const std::vector<std::string>& chunk_checksums) {
    if (chunk_checksums.empty()) {
        throw std::invalid_argument("Merkle root of zero chunks");
    }

    const std::string leaf_prefix(1, kLeafPrefix);
    const std::string node_prefix(1, kNodePrefix);

    std::vector<std::string> level;
    level.reserve(chunk_checksums.size());
    for (const auto& checksum : chunk_checksums) {
        if (checksum.empty()) {
            throw std::invalid_argument("Chunk without checksum");
        }
        std::string raw = hex_decode(checksum);
        level.push_back(sha256_raw({&leaf_prefix, &raw}));
    }

    while (level.size() > 1) {
        std::vector<std::string> next;
        next.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i + 1 < level.size(); i += 2) {
            next.push_back(sha256_raw({&node_prefix, &level[i], &level[i + 1]}));
        }
        if (level.size() % 2 == 1) {
            next.push_back(level.back());
        }
        level.swap(next);
    }
    return hex_encode(level.front());
}

}  // namespace edgesync
