#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>

namespace fl {

using ActorId = std::string;

// Owner, provider allowlist and the global pause switch. Mutators report
// whether state actually changed so the caller can decide what to emit.
class AccessControl {
public:
    explicit AccessControl(ActorId owner);

    void requireOwner(const ActorId& caller) const;
    void requireProvider(const ActorId& caller) const;
    void requireNotPaused() const;

    bool addProvider(const ActorId& caller, const ActorId& provider);
    bool removeProvider(const ActorId& caller, const ActorId& provider);
    void pause(const ActorId& caller);
    void unpause(const ActorId& caller);
    void transferOwnership(const ActorId& caller, const ActorId& newOwner);

    const ActorId& owner() const { return owner_; }
    bool isProvider(const ActorId& actor) const { return providers_.count(actor) != 0; }
    bool isPaused() const { return paused_; }
    std::size_t providerCount() const { return providers_.size(); }

private:
    ActorId owner_;
    std::unordered_set<ActorId> providers_;
    bool paused_ = false;
};

} // namespace fl
