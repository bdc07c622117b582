#pragma once

#include "event_journal.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>

namespace cl {

using Principal = std::string;

// Caller identity and time of an entry-point invocation.
struct CallContext {
    Principal caller;
    std::uint64_t timestamp = 0;
};

class AccessControl {
public:
    AccessControl(Principal owner, EventJournal& journal);

    void transferOwnership(const CallContext& ctx, const Principal& newOwner);
    void addProvider(const CallContext& ctx, const Principal& provider);
    void removeProvider(const CallContext& ctx, const Principal& provider);
    void setPaused(const CallContext& ctx, bool paused);

    void requireOwner(const Principal& caller) const;
    void requireProvider(const Principal& caller) const;
    void requireNotPaused() const;

    const Principal& owner() const { return owner_; }
    bool isOwner(const Principal& principal) const { return principal == owner_; }
    bool isProvider(const Principal& principal) const { return providers_.count(principal) != 0; }
    bool isPaused() const { return paused_; }
    std::size_t providerCount() const { return providers_.size(); }

private:
    Principal owner_;
    std::unordered_set<Principal> providers_;
    bool paused_ = false;
    EventJournal& journal_;
};

} // namespace cl
