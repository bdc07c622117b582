#include "local_oracle.hpp"

#include "abi_codec.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <sodium.h>

namespace cl {

namespace {

constexpr const char* kSigningDomain = "cipherloan:oracle-response:v1";

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

} // namespace

OracleKeyPair generateOracleKeypair() {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    std::vector<unsigned char> publicKey(crypto_sign_PUBLICKEYBYTES);
    SecretBytes secretKey(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_keypair(publicKey.data(), secretKey.data()) != 0) {
        throw std::runtime_error("Ed25519 keypair generation failed");
    }
    return OracleKeyPair{ bytesToHex(publicKey.data(), publicKey.size()), secretKey.toHex() };
}

LocalDecryptionOracle::LocalDecryptionOracle(std::shared_ptr<InsecureTestArithmetic> arithmetic)
    : LocalDecryptionOracle(std::move(arithmetic), generateOracleKeypair().secretKeyHex) {}

LocalDecryptionOracle::LocalDecryptionOracle(std::shared_ptr<InsecureTestArithmetic> arithmetic,
                                             const std::string& secretKeyHex)
    : arithmetic_(std::move(arithmetic))
    , publicKey_(crypto_sign_PUBLICKEYBYTES) {
    if (!arithmetic_) {
        throw std::invalid_argument("LocalDecryptionOracle requires an arithmetic backend");
    }
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }

    secretKey_ = SecretBytes::fromHex(secretKeyHex, crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_ed25519_sk_to_pk(publicKey_.data(), secretKey_.data()) != 0) {
        throw std::invalid_argument("Unable to derive oracle public key from secret key");
    }
    publicKeyHex_ = bytesToHex(publicKey_.data(), publicKey_.size());
}

RequestId LocalDecryptionOracle::requestDecryption(const std::vector<EncryptedHandle>& ciphertexts,
                                                   const std::string& callbackRef) {
    if (ciphertexts.empty()) {
        throw std::invalid_argument("decryption request needs at least one ciphertext");
    }
    RequestId id = nextRequestId_++;
    requests_[id] = PendingRequest{ id, ciphertexts, callbackRef };
    return id;
}

bool LocalDecryptionOracle::checkSignatures(RequestId requestId,
                                            const Bytes& cleartext,
                                            const Bytes& proof) const {
    if (proof.size() != crypto_sign_BYTES) {
        return false;
    }
    std::string message = signingMessage(requestId, cleartext);
    return crypto_sign_verify_detached(proof.data(),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       publicKey_.data()) == 0;
}

DecryptionResponse LocalDecryptionOracle::fulfill(RequestId requestId) const {
    auto it = requests_.find(requestId);
    if (it == requests_.end()) {
        throw std::runtime_error("unknown decryption request " + std::to_string(requestId));
    }

    DecryptionResponse response;
    response.requestId = requestId;
    for (const auto& handle : it->second.ciphertexts) {
        auto value = arithmetic_->plaintextOf(handle);
        if (!value) {
            throw std::runtime_error("ciphertext " + handle.id + " cannot be decrypted");
        }
        Bytes word = encodeUintWord(*value);
        response.cleartext.insert(response.cleartext.end(), word.begin(), word.end());
    }
    response.proof = sign(requestId, response.cleartext);
    return response;
}

std::vector<LocalDecryptionOracle::PendingRequest> LocalDecryptionOracle::pendingRequests() const {
    std::vector<PendingRequest> out;
    out.reserve(requests_.size());
    for (const auto& entry : requests_) {
        out.push_back(entry.second);
    }
    return out;
}

std::string LocalDecryptionOracle::signingMessage(RequestId requestId, const Bytes& cleartext) {
    std::ostringstream oss;
    oss << kSigningDomain << ':' << requestId << ':' << bytesToHex(cleartext);
    return oss.str();
}

bool LocalDecryptionOracle::verifyResponse(const std::string& publicKeyHex,
                                           const DecryptionResponse& response) {
    if (!ensureSodiumReady()) {
        return false;
    }
    Bytes publicKey;
    try {
        publicKey = hexToBytes(publicKeyHex);
    } catch (const std::invalid_argument&) {
        return false;
    }
    if (publicKey.size() != crypto_sign_PUBLICKEYBYTES || response.proof.size() != crypto_sign_BYTES) {
        return false;
    }
    std::string message = signingMessage(response.requestId, response.cleartext);
    return crypto_sign_verify_detached(response.proof.data(),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       publicKey.data()) == 0;
}

Bytes LocalDecryptionOracle::sign(RequestId requestId, const Bytes& cleartext) const {
    std::string message = signingMessage(requestId, cleartext);
    Bytes signature(crypto_sign_BYTES);
    unsigned long long sigLen = 0;
    if (crypto_sign_detached(signature.data(),
                             &sigLen,
                             reinterpret_cast<const unsigned char*>(message.data()),
                             message.size(),
                             secretKey_.data()) != 0) {
        throw std::runtime_error("oracle signing failed");
    }
    signature.resize(static_cast<std::size_t>(sigLen));
    return signature;
}

} // namespace cl
