#include "errors.hpp"

namespace cl {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Unauthorized:
        return "Unauthorized";
    case ErrorKind::Paused:
        return "Paused";
    case ErrorKind::CooldownActive:
        return "CooldownActive";
    case ErrorKind::BatchClosed:
        return "BatchClosed";
    case ErrorKind::BatchAlreadyOpen:
        return "BatchAlreadyOpen";
    case ErrorKind::BatchAlreadyClosed:
        return "BatchAlreadyClosed";
    case ErrorKind::NotInitialized:
        return "NotInitialized";
    case ErrorKind::ReplayAttempt:
        return "ReplayAttempt";
    case ErrorKind::StateMismatch:
        return "StateMismatch";
    case ErrorKind::InvalidProof:
        return "InvalidProof";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    }
    return "Unknown";
}

ProtocolError::ProtocolError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(errorKindName(kind)) + ": " + message)
    , kind_(kind) {}

void raise(ErrorKind kind, const std::string& message) {
    throw ProtocolError(kind, message);
}

} // namespace cl
