#include "cooldown_gate.hpp"

#include "ledger_error.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace fl {

Clock systemClock() {
    return []() {
        auto since = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(since).count());
    };
}

CooldownGate::CooldownGate(Clock clock, std::uint64_t interval)
    : clock_(std::move(clock))
    , interval_(interval) {
    if (!clock_) {
        throw std::invalid_argument("cooldown gate requires a clock");
    }
    if (interval_ < kMinCooldownInterval) {
        throw LedgerError(ErrorCode::InvalidCooldown, std::to_string(interval_));
    }
}

void CooldownGate::ensureReady(const ActorId& actor, std::uint64_t now) const {
    auto it = lastAction_.find(actor);
    if (it == lastAction_.end()) {
        return;
    }
    // A clock that runs backwards never reopens the gate early.
    if (now < it->second || now - it->second < interval_) {
        throw LedgerError(ErrorCode::CooldownActive, actor);
    }
}

void CooldownGate::record(const ActorId& actor, std::uint64_t now) {
    lastAction_[actor] = now;
}

void CooldownGate::checkAndRecord(const ActorId& actor) {
    std::uint64_t current = clock_();
    ensureReady(actor, current);
    record(actor, current);
}

void CooldownGate::setCooldownInterval(std::uint64_t interval) {
    if (interval < kMinCooldownInterval) {
        throw LedgerError(ErrorCode::InvalidCooldown, std::to_string(interval));
    }
    interval_ = interval;
}

std::optional<std::uint64_t> CooldownGate::lastAction(const ActorId& actor) const {
    auto it = lastAction_.find(actor);
    if (it == lastAction_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace fl
