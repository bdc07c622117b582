#include "access_control.hpp"

#include "errors.hpp"

#include <stdexcept>
#include <utility>

namespace cl {

AccessControl::AccessControl(Principal owner, EventJournal& journal)
    : owner_(std::move(owner))
    , journal_(journal) {
    if (owner_.empty()) {
        throw std::invalid_argument("AccessControl requires a non-empty owner");
    }
    providers_.insert(owner_);
}

void AccessControl::transferOwnership(const CallContext& ctx, const Principal& newOwner) {
    requireOwner(ctx.caller);
    requireNotPaused();
    if (newOwner.empty()) {
        raise(ErrorKind::InvalidArgument, "new owner must not be empty");
    }

    Principal previous = owner_;
    owner_ = newOwner;

    Event event;
    event.kind = EventKind::OwnershipTransferred;
    event.timestamp = ctx.timestamp;
    event.with("previousOwner", previous).with("newOwner", newOwner);
    journal_.emit(std::move(event));
}

void AccessControl::addProvider(const CallContext& ctx, const Principal& provider) {
    requireOwner(ctx.caller);
    requireNotPaused();
    if (provider.empty()) {
        raise(ErrorKind::InvalidArgument, "provider must not be empty");
    }
    if (!providers_.insert(provider).second) {
        return;
    }

    Event event;
    event.kind = EventKind::ProviderAdded;
    event.timestamp = ctx.timestamp;
    event.with("provider", provider);
    journal_.emit(std::move(event));
}

void AccessControl::removeProvider(const CallContext& ctx, const Principal& provider) {
    requireOwner(ctx.caller);
    requireNotPaused();
    if (providers_.erase(provider) == 0) {
        return;
    }

    Event event;
    event.kind = EventKind::ProviderRemoved;
    event.timestamp = ctx.timestamp;
    event.with("provider", provider);
    journal_.emit(std::move(event));
}

void AccessControl::setPaused(const CallContext& ctx, bool paused) {
    requireOwner(ctx.caller);
    paused_ = paused;

    Event event;
    event.kind = EventKind::PauseToggled;
    event.timestamp = ctx.timestamp;
    event.with("paused", paused ? "true" : "false").with("by", ctx.caller);
    journal_.emit(std::move(event));
}

void AccessControl::requireOwner(const Principal& caller) const {
    if (caller != owner_) {
        raise(ErrorKind::Unauthorized, "caller '" + caller + "' is not the owner");
    }
}

void AccessControl::requireProvider(const Principal& caller) const {
    if (providers_.count(caller) == 0) {
        raise(ErrorKind::Unauthorized, "caller '" + caller + "' is not a provider");
    }
}

void AccessControl::requireNotPaused() const {
    if (paused_) {
        raise(ErrorKind::Paused, "pool is paused");
    }
}

} // namespace cl
