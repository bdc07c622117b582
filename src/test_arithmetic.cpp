#include "test_arithmetic.hpp"

#include "encoding.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace cl {

InsecureTestArithmetic::InsecureTestArithmetic(std::string domain)
    : domain_(std::move(domain)) {
    if (domain_.empty()) {
        throw std::invalid_argument("InsecureTestArithmetic requires a domain label");
    }
}

EncryptedHandle InsecureTestArithmetic::add(const EncryptedHandle& lhs, const EncryptedHandle& rhs) {
    std::uint64_t value = load(lhs, "add") + load(rhs, "add");
    return mint("add", lhs.id, rhs.id, value);
}

EncryptedHandle InsecureTestArithmetic::sub(const EncryptedHandle& lhs, const EncryptedHandle& rhs) {
    // Unsigned wrap-around, as with the host's euint64.
    std::uint64_t value = load(lhs, "sub") - load(rhs, "sub");
    return mint("sub", lhs.id, rhs.id, value);
}

EncryptedHandle InsecureTestArithmetic::mul(const EncryptedHandle& lhs, const EncryptedHandle& rhs) {
    std::uint64_t value = load(lhs, "mul") * load(rhs, "mul");
    return mint("mul", lhs.id, rhs.id, value);
}

EncryptedHandle InsecureTestArithmetic::zero() {
    std::ostringstream oss;
    oss << domain_ << "|zero";
    EncryptedHandle handle{ sha256Hex(oss.str()), true };
    values_[handle.id] = 0;
    return handle;
}

EncryptedHandle InsecureTestArithmetic::trivialEncrypt(std::uint64_t value) {
    return mint("trivial", std::to_string(value), "", value);
}

std::optional<std::uint64_t> InsecureTestArithmetic::plaintextOf(const EncryptedHandle& handle) const {
    if (!handle.initialized) {
        return std::nullopt;
    }
    auto it = values_.find(handle.id);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::uint64_t InsecureTestArithmetic::load(const EncryptedHandle& handle, const char* op) const {
    if (!handle.initialized) {
        throw std::invalid_argument(std::string("uninitialized operand passed to ") + op);
    }
    auto it = values_.find(handle.id);
    if (it == values_.end()) {
        throw std::invalid_argument(std::string("unknown handle passed to ") + op);
    }
    return it->second;
}

EncryptedHandle InsecureTestArithmetic::mint(const std::string& op,
                                             const std::string& lhs,
                                             const std::string& rhs,
                                             std::uint64_t value) {
    std::ostringstream oss;
    oss << domain_ << '|';
    appendLengthPrefixed(oss, op);
    appendLengthPrefixed(oss, lhs);
    appendLengthPrefixed(oss, rhs);
    EncryptedHandle handle{ sha256Hex(oss.str()), true };
    values_[handle.id] = value;
    return handle;
}

} // namespace cl
