#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace cl {

// Reference to a ciphertext held by the encrypted-computation service. The id is opaque; the
// pool copies and hashes it but never reads the value behind it.
struct EncryptedHandle {
    std::string id;
    bool initialized = false;

    bool operator==(const EncryptedHandle& other) const {
        return id == other.id && initialized == other.initialized;
    }
    bool operator!=(const EncryptedHandle& other) const { return !(*this == other); }
};

// Encrypted 64-bit unsigned integer arithmetic. Every operation returns a fresh handle.
class EncryptedArithmetic {
public:
    virtual ~EncryptedArithmetic() = default;

    virtual EncryptedHandle add(const EncryptedHandle& lhs, const EncryptedHandle& rhs) = 0;
    virtual EncryptedHandle sub(const EncryptedHandle& lhs, const EncryptedHandle& rhs) = 0;
    virtual EncryptedHandle mul(const EncryptedHandle& lhs, const EncryptedHandle& rhs) = 0;
    virtual EncryptedHandle zero() = 0;
    virtual EncryptedHandle trivialEncrypt(std::uint64_t value) = 0;

    virtual bool isInitialized(const EncryptedHandle& handle) const { return handle.initialized; }
};

using ArithmeticPtr = std::shared_ptr<EncryptedArithmetic>;

} // namespace cl
