#include "commitment.hpp"

#include "encoding.hpp"

#include <sstream>
#include <stdexcept>

namespace cl {

namespace {

constexpr const char* kStateHashDomain = "cipherloan:state-hash:v1";

} // namespace

std::string computeStateHash(const std::vector<EncryptedHandle>& ciphertexts,
                             const std::string& selfIdentity) {
    if (selfIdentity.empty()) {
        throw std::invalid_argument("state hash requires the pool identity");
    }
    std::ostringstream oss;
    oss << kStateHashDomain << '|';
    oss << "cts:" << ciphertexts.size() << ';';
    for (const auto& handle : ciphertexts) {
        appendLengthPrefixed(oss, handle.id);
        oss << (handle.initialized ? '1' : '0');
    }
    oss << "self:";
    appendLengthPrefixed(oss, selfIdentity);
    return sha256Hex(oss.str());
}

} // namespace cl
