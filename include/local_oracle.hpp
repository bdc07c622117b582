#pragma once

#include "decryption_oracle.hpp"
#include "secure_memory.hpp"
#include "test_arithmetic.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cl {

struct OracleKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

OracleKeyPair generateOracleKeypair();

// Single-signer decryption service running in-process. It "decrypts" by reading the
// InsecureTestArithmetic table and signs (domain, requestId, cleartext) with Ed25519.
// Delivery is left to the caller: fulfill() builds a response that can be handed to the
// pool's callback once, several times, late, or not at all.
class LocalDecryptionOracle : public DecryptionOracle {
public:
    struct PendingRequest {
        RequestId requestId = 0;
        std::vector<EncryptedHandle> ciphertexts;
        std::string callbackRef;
    };

    explicit LocalDecryptionOracle(std::shared_ptr<InsecureTestArithmetic> arithmetic);
    LocalDecryptionOracle(std::shared_ptr<InsecureTestArithmetic> arithmetic,
                          const std::string& secretKeyHex);

    RequestId requestDecryption(const std::vector<EncryptedHandle>& ciphertexts,
                                const std::string& callbackRef) override;
    bool checkSignatures(RequestId requestId,
                         const Bytes& cleartext,
                         const Bytes& proof) const override;

    // Throws std::runtime_error for unknown ids or handles the backend cannot resolve.
    DecryptionResponse fulfill(RequestId requestId) const;

    std::vector<PendingRequest> pendingRequests() const;
    const std::string& publicKeyHex() const { return publicKeyHex_; }

    static std::string signingMessage(RequestId requestId, const Bytes& cleartext);
    static bool verifyResponse(const std::string& publicKeyHex, const DecryptionResponse& response);

private:
    Bytes sign(RequestId requestId, const Bytes& cleartext) const;

    std::shared_ptr<InsecureTestArithmetic> arithmetic_;
    SecretBytes secretKey_;
    std::vector<unsigned char> publicKey_;
    std::string publicKeyHex_;
    RequestId nextRequestId_ = 1;
    std::map<RequestId, PendingRequest> requests_;
};

} // namespace cl
