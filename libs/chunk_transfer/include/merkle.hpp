#pragma once

#include <string>
#include <vector>

namespace edgesync {

/// Lower-case hex SHA-256 of a byte string
std::string sha256_hex(const std::string& data);

/// Hex to raw bytes; throws std::invalid_argument on malformed input
std::string hex_decode(const std::string& hex);
std::string hex_encode(const std::string& bytes);

/**
 * Merkle root over ordered chunk checksums (hex SHA-256 strings)
 *
 * leaf   = SHA-256(0x00 || checksum bytes)
 * parent = SHA-256(0x01 || left || right)
 * An odd node at the end of a level is promoted unchanged.
 *
 * Returns the hex root. Throws std::invalid_argument on an empty list or
 * malformed checksum.
 */
std::string merkle_root(const std::vector<std::string>& chunk_checksums);

}  // namespace edgesync
