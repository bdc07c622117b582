#include "cooldown_gate.hpp"

#include "errors.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cl {

namespace {

std::uint64_t saturatingAdd(std::uint64_t a, std::uint64_t b) {
    if (std::numeric_limits<std::uint64_t>::max() - a < b) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return a + b;
}

} // namespace

const char* actionClassName(ActionClass action) {
    switch (action) {
    case ActionClass::SubmitParams:
        return "submit-params";
    case ActionClass::RequestDecryption:
        return "request-decryption";
    }
    return "unknown";
}

CooldownGate::CooldownGate(std::uint64_t cooldownSeconds, EventJournal& journal)
    : cooldownSeconds_(cooldownSeconds)
    , journal_(journal) {
    if (cooldownSeconds_ == 0) {
        throw std::invalid_argument("CooldownGate requires a positive cooldown");
    }
}

void CooldownGate::checkAndStamp(const Principal& principal,
                                 ActionClass action,
                                 std::uint64_t now) {
    if (isCoolingDown(principal, action, now)) {
        std::ostringstream oss;
        oss << actionClassName(action) << " for '" << principal << "' available at "
            << saturatingAdd(*lastAction(principal, action), cooldownSeconds_);
        raise(ErrorKind::CooldownActive, oss.str());
    }
    lastAction_[{ principal, action }] = now;
}

void CooldownGate::setCooldownSeconds(const CallContext& ctx, std::uint64_t seconds) {
    if (seconds == 0) {
        raise(ErrorKind::InvalidArgument, "cooldown must be greater than zero");
    }
    std::uint64_t previous = cooldownSeconds_;
    cooldownSeconds_ = seconds;

    Event event;
    event.kind = EventKind::CooldownChanged;
    event.timestamp = ctx.timestamp;
    event.with("previous", std::to_string(previous)).with("seconds", std::to_string(seconds));
    journal_.emit(std::move(event));
}

std::optional<std::uint64_t> CooldownGate::lastAction(const Principal& principal,
                                                      ActionClass action) const {
    auto it = lastAction_.find({ principal, action });
    if (it == lastAction_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CooldownGate::isCoolingDown(const Principal& principal,
                                 ActionClass action,
                                 std::uint64_t now) const {
    auto last = lastAction(principal, action);
    if (!last) {
        return false;
    }
    return now < saturatingAdd(*last, cooldownSeconds_);
}

} // namespace cl
