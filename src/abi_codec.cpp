#include "abi_codec.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <limits>

namespace mp = boost::multiprecision;

namespace cl {

Bytes encodeUintWord(std::uint64_t value) {
    Bytes out(kAbiWordBytes, 0);
    for (std::size_t i = 0; i < 8; ++i) {
        out[kAbiWordBytes - 1 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF);
    }
    return out;
}

std::optional<std::uint64_t> decodeUint64Word(const Bytes& word) {
    if (word.size() != kAbiWordBytes) {
        return std::nullopt;
    }
    mp::uint256_t value;
    mp::import_bits(value, word.begin(), word.end(), 8, true);
    if (value > std::numeric_limits<std::uint64_t>::max()) {
        return std::nullopt;
    }
    return value.convert_to<std::uint64_t>();
}

} // namespace cl
