#include "ledger_events.hpp"

#include <utility>

namespace fl {

const char* eventKindName(EventKind kind) {
    switch (kind) {
    case EventKind::ProviderAdded:
        return "ProviderAdded";
    case EventKind::ProviderRemoved:
        return "ProviderRemoved";
    case EventKind::Paused:
        return "Paused";
    case EventKind::Unpaused:
        return "Unpaused";
    case EventKind::CooldownUpdated:
        return "CooldownUpdated";
    case EventKind::BatchOpened:
        return "BatchOpened";
    case EventKind::BatchClosed:
        return "BatchClosed";
    case EventKind::CargoSubmitted:
        return "CargoSubmitted";
    case EventKind::DecryptionRequested:
        return "DecryptionRequested";
    case EventKind::DecryptionCompleted:
        return "DecryptionCompleted";
    case EventKind::ModelVersionBumped:
        return "ModelVersionBumped";
    case EventKind::OwnershipTransferred:
        return "OwnershipTransferred";
    }
    return "Unknown";
}

std::string encodeEvent(const LedgerEvent& event) {
    // | kind u64 | sequence u64 | timestamp u64 | batchId u64 | requestId u64 |
    // | modelVersion u64 | value u64 | actor | subject | handle count u64 |
    // | handles (32 bytes each) | stateHash flag + 32 bytes | aggregates flag + 3 x i64 |
    std::string out;
    out.reserve(128);
    appendU64(out, static_cast<std::uint64_t>(event.kind));
    appendU64(out, event.sequence);
    appendU64(out, event.timestamp);
    appendU64(out, event.batchId);
    appendU64(out, event.requestId);
    appendU64(out, event.modelVersion);
    appendU64(out, event.value);
    appendLengthPrefixed(out, event.actor);
    appendLengthPrefixed(out, event.subject);
    appendU64(out, static_cast<std::uint64_t>(event.handles.size()));
    for (const auto& handle : event.handles) {
        out += handle.toCommitmentBytes();
    }
    if (event.stateHash) {
        out.push_back('\x01');
        out.append(reinterpret_cast<const char*>(event.stateHash->data()), event.stateHash->size());
    } else {
        out.push_back('\x00');
    }
    if (event.aggregates) {
        out.push_back('\x01');
        appendI64(out, event.aggregates->demand);
        appendI64(out, event.aggregates->supply);
        appendI64(out, event.aggregates->profit);
    } else {
        out.push_back('\x00');
    }
    return out;
}

const LedgerEvent& EventLog::emit(LedgerEvent event) {
    event.sequence = static_cast<std::uint64_t>(events_.size()) + 1;
    transcript_.append(encodeEvent(event));
    events_.push_back(std::move(event));
    const LedgerEvent& stored = events_.back();
    for (const auto& listener : listeners_) {
        listener(stored);
    }
    return stored;
}

void EventLog::subscribe(EventListener listener) {
    if (listener) {
        listeners_.push_back(std::move(listener));
    }
}

std::vector<LedgerEvent> EventLog::eventsOfKind(EventKind kind) const {
    std::vector<LedgerEvent> out;
    for (const auto& event : events_) {
        if (event.kind == kind) {
            out.push_back(event);
        }
    }
    return out;
}

} // namespace fl
