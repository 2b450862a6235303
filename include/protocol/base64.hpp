#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <optional>

namespace protocol {

std::string base64_encode(const std::vector<uint8_t>& data);

// nullopt if the text is not padded, canonical-alphabet base64
std::optional<std::vector<uint8_t>> base64_decode(const std::string& text);

// Length of base64_encode() output for size raw bytes
inline std::size_t base64_encoded_length(std::size_t size) {
    return ((size + 2) / 3) * 4;
}

} // namespace protocol
