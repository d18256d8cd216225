#pragma once

#include "access_control.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>

namespace fl {

// Seconds since an arbitrary epoch. Injected so tests can drive time.
using Clock = std::function<std::uint64_t()>;

Clock systemClock();

// Protocol floor; an interval below this would effectively disable throttling.
constexpr std::uint64_t kMinCooldownInterval = 1;
constexpr std::uint64_t kDefaultCooldownInterval = 60;

// Per-actor throttle. An actor with no recorded action is always admitted.
class CooldownGate {
public:
    CooldownGate(Clock clock, std::uint64_t interval);

    // Read-only admission check at `now`; throws CooldownActive on rejection.
    // Callers pass the same `now` to record() so the stored timestamp is the
    // one the admission was checked against.
    void ensureReady(const ActorId& actor, std::uint64_t now) const;
    void record(const ActorId& actor, std::uint64_t now);
    void checkAndRecord(const ActorId& actor);

    void setCooldownInterval(std::uint64_t interval);

    std::uint64_t interval() const { return interval_; }
    std::uint64_t now() const { return clock_(); }
    std::optional<std::uint64_t> lastAction(const ActorId& actor) const;

private:
    Clock clock_;
    std::uint64_t interval_;
    std::unordered_map<ActorId, std::uint64_t> lastAction_;
};

} // namespace fl
