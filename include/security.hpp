#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace security {

// MD5 of the raw bytes as 32 lowercase hex digits (wire checksum)
std::string md5_hex(const std::vector<uint8_t>& data);
std::string md5_hex(const std::string& data);

// Hash (origin, packet id, content) using libsodium crypto_generichash (BLAKE2b)
// Returns a 16-byte digest as a hex string
std::string fingerprint(const std::string& origin, uint32_t packet_id, const std::string& content);

// Random 32-bit transport packet id, never 0
uint32_t generate_packet_id();

// Meshtastic-style node id: "!" + 8 hex digits
std::string generate_node_id();

} // namespace security
