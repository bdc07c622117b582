#pragma once

#include "encoding.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace cl {

constexpr std::size_t kAbiWordBytes = 32;

// One 32-byte big-endian word, as the host ABI encodes a uint256.
Bytes encodeUintWord(std::uint64_t value);

// nullopt unless the input is exactly one word whose value fits in 64 bits.
std::optional<std::uint64_t> decodeUint64Word(const Bytes& word);

} // namespace cl
