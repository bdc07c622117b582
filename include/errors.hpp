#pragma once

#include <stdexcept>
#include <string>

namespace cl {

enum class ErrorKind {
    Unauthorized,
    Paused,
    CooldownActive,
    BatchClosed,
    BatchAlreadyOpen,
    BatchAlreadyClosed,
    NotInitialized,
    ReplayAttempt,
    StateMismatch,
    InvalidProof,
    InvalidArgument
};

const char* errorKindName(ErrorKind kind);

// Raised by every entry point that rejects a call. Nothing is committed when one of these
// escapes, apart from a cooldown stamp taken before the failure.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

[[noreturn]] void raise(ErrorKind kind, const std::string& message);

} // namespace cl
