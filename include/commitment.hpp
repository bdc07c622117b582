#pragma once

#include "encrypted_arithmetic.hpp"

#include <string>
#include <vector>

namespace cl {

// Binds a ciphertext set to the deployment that asked for its decryption. The same handles
// committed under a different identity, in a different order, or with a handle added or
// removed, give a different hash.
std::string computeStateHash(const std::vector<EncryptedHandle>& ciphertexts,
                             const std::string& selfIdentity);

} // namespace cl
