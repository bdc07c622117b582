#pragma once

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace cl {

using Bytes = std::vector<std::uint8_t>;

std::string bytesToHex(const unsigned char* data, std::size_t len);
std::string bytesToHex(const Bytes& bytes);
Bytes hexToBytes(const std::string& hex);

// SHA-256 of the raw input, lower-case hex.
std::string sha256Hex(const std::string& data);

// <len>:<value>; framing so adjacent fields cannot be re-split into a colliding preimage.
void appendLengthPrefixed(std::ostringstream& oss, const std::string& value);

} // namespace cl
