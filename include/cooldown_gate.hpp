#pragma once

#include "access_control.hpp"
#include "event_journal.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <utility>

namespace cl {

enum class ActionClass { SubmitParams, RequestDecryption };

const char* actionClassName(ActionClass action);

// Per-principal rate limiter. Each action class keeps its own clock, so a submission never
// delays a decryption request from the same provider and vice versa.
class CooldownGate {
public:
    CooldownGate(std::uint64_t cooldownSeconds, EventJournal& journal);

    // Throws CooldownActive while now < last + cooldown; otherwise stamps now. The stamp is
    // kept even if the guarded operation fails afterwards.
    void checkAndStamp(const Principal& principal, ActionClass action, std::uint64_t now);

    void setCooldownSeconds(const CallContext& ctx, std::uint64_t seconds);
    std::uint64_t cooldownSeconds() const { return cooldownSeconds_; }

    std::optional<std::uint64_t> lastAction(const Principal& principal, ActionClass action) const;
    bool isCoolingDown(const Principal& principal, ActionClass action, std::uint64_t now) const;

private:
    std::uint64_t cooldownSeconds_;
    std::map<std::pair<Principal, ActionClass>, std::uint64_t> lastAction_;
    EventJournal& journal_;
};

} // namespace cl
