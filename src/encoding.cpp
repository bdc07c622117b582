#include "encoding.hpp"

#include "picosha2.h"

#include <cctype>
#include <iomanip>
#include <stdexcept>

namespace cl {

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string bytesToHex(const Bytes& bytes) {
    return bytesToHex(bytes.data(), bytes.size());
}

Bytes hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }

    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        if (std::isxdigit(static_cast<unsigned char>(hex[i])) == 0 ||
            std::isxdigit(static_cast<unsigned char>(hex[i + 1])) == 0) {
            throw std::invalid_argument("hex string contains a non-hex character");
        }
        std::string byteString = hex.substr(i, 2);
        unsigned int byte = 0;
        std::istringstream iss(byteString);
        iss >> std::hex >> byte;
        out.push_back(static_cast<std::uint8_t>(byte));
    }
    return out;
}

std::string sha256Hex(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

void appendLengthPrefixed(std::ostringstream& oss, const std::string& value) {
    oss << value.size() << ':';
    oss.write(value.data(), static_cast<std::streamsize>(value.size()));
    oss << ';';
}

} // namespace cl
