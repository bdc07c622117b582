#pragma once

#include "encoding.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <sodium.h>

namespace cl {

// Oracle signing key material. Move-only; the buffer is wiped with sodium_memzero on
// destruction, on reassignment and when moved from.
class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(std::size_t count) : bytes_(count) {}

    SecretBytes(const SecretBytes&) = delete;
    SecretBytes& operator=(const SecretBytes&) = delete;

    SecretBytes(SecretBytes&& other) noexcept : bytes_(std::move(other.bytes_)) { wipe(other.bytes_); }

    SecretBytes& operator=(SecretBytes&& other) noexcept {
        if (this != &other) {
            wipe(bytes_);
            bytes_ = std::move(other.bytes_);
            wipe(other.bytes_);
        }
        return *this;
    }

    ~SecretBytes() { wipe(bytes_); }

    // Decodes a hex key that must be exactly expectedSize bytes. The decoded scratch copy is
    // wiped whether or not the key is accepted.
    static SecretBytes fromHex(const std::string& hex, std::size_t expectedSize) {
        Bytes decoded = hexToBytes(hex);
        if (decoded.size() != expectedSize) {
            std::size_t got = decoded.size();
            wipe(decoded);
            throw std::invalid_argument("secret key must be " + std::to_string(expectedSize) +
                                        " bytes, got " + std::to_string(got));
        }
        SecretBytes key(decoded.size());
        std::copy(decoded.begin(), decoded.end(), key.bytes_.begin());
        wipe(decoded);
        return key;
    }

    std::string toHex() const { return bytesToHex(bytes_.data(), bytes_.size()); }

    std::size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }
    unsigned char* data() { return bytes_.data(); }
    const unsigned char* data() const { return bytes_.data(); }

private:
    template <typename Buffer>
    static void wipe(Buffer& buffer) {
        if (!buffer.empty()) {
            sodium_memzero(buffer.data(), buffer.size() * sizeof(typename Buffer::value_type));
        }
        buffer.clear();
    }

    std::vector<unsigned char> bytes_;
};

} // namespace cl
