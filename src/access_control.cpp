#include "access_control.hpp"

#include "ledger_error.hpp"

#include <stdexcept>
#include <utility>

namespace fl {

AccessControl::AccessControl(ActorId owner)
    : owner_(std::move(owner)) {
    if (owner_.empty()) {
        throw std::invalid_argument("ledger owner must not be empty");
    }
}

void AccessControl::requireOwner(const ActorId& caller) const {
    if (caller != owner_) {
        throw LedgerError(ErrorCode::NotOwner, caller);
    }
}

void AccessControl::requireProvider(const ActorId& caller) const {
    if (!isProvider(caller)) {
        throw LedgerError(ErrorCode::NotProvider, caller);
    }
}

void AccessControl::requireNotPaused() const {
    if (paused_) {
        throw LedgerError(ErrorCode::Paused);
    }
}

bool AccessControl::addProvider(const ActorId& caller, const ActorId& provider) {
    requireOwner(caller);
    if (provider.empty()) {
        throw std::invalid_argument("provider id must not be empty");
    }
    return providers_.insert(provider).second;
}

bool AccessControl::removeProvider(const ActorId& caller, const ActorId& provider) {
    requireOwner(caller);
    return providers_.erase(provider) != 0;
}

void AccessControl::pause(const ActorId& caller) {
    requireOwner(caller);
    if (paused_) {
        throw LedgerError(ErrorCode::AlreadyPaused);
    }
    paused_ = true;
}

void AccessControl::unpause(const ActorId& caller) {
    requireOwner(caller);
    if (!paused_) {
        throw LedgerError(ErrorCode::NotPaused);
    }
    paused_ = false;
}

void AccessControl::transferOwnership(const ActorId& caller, const ActorId& newOwner) {
    requireOwner(caller);
    if (newOwner.empty()) {
        throw std::invalid_argument("new owner must not be empty");
    }
    owner_ = newOwner;
}

} // namespace fl
