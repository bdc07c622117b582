#pragma once

#include "encoding.hpp"
#include "encrypted_arithmetic.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cl {

using RequestId = std::uint64_t;

// What the oracle hands back to the callback: ABI-encoded cleartexts and its proof of
// authenticity over (requestId, cleartext).
struct DecryptionResponse {
    RequestId requestId = 0;
    Bytes cleartext;
    Bytes proof;
};

class DecryptionOracle {
public:
    virtual ~DecryptionOracle() = default;

    // Queues decryption of the ciphertext set and returns the id that the eventual callback
    // will carry. callbackRef names the entry point to invoke.
    virtual RequestId requestDecryption(const std::vector<EncryptedHandle>& ciphertexts,
                                        const std::string& callbackRef) = 0;

    virtual bool checkSignatures(RequestId requestId,
                                 const Bytes& cleartext,
                                 const Bytes& proof) const = 0;
};

using OraclePtr = std::shared_ptr<DecryptionOracle>;

} // namespace cl
