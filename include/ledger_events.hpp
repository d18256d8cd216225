#pragma once

#include "access_control.hpp"
#include "ciphertext.hpp"
#include "decryption_protocol.hpp"
#include "encoding.hpp"
#include "transcript_log.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fl {

enum class EventKind {
    ProviderAdded,
    ProviderRemoved,
    Paused,
    Unpaused,
    CooldownUpdated,
    BatchOpened,
    BatchClosed,
    CargoSubmitted,
    DecryptionRequested,
    DecryptionCompleted,
    ModelVersionBumped,
    OwnershipTransferred
};

const char* eventKindName(EventKind kind);

// Immutable record of a committed state transition. Fields that do not apply
// to a kind stay at their defaults. CargoSubmitted carries handle references
// only; DecryptionCompleted is the sole event carrying plaintext.
struct LedgerEvent {
    EventKind kind = EventKind::BatchOpened;
    std::uint64_t sequence = 0;
    std::uint64_t timestamp = 0;
    ActorId actor;
    ActorId subject;
    std::uint64_t batchId = 0;
    std::uint64_t requestId = 0;
    std::uint64_t modelVersion = 0;
    std::uint64_t value = 0;
    std::vector<CiphertextHandle> handles;
    std::optional<Digest> stateHash;
    std::optional<BatchAggregates> aggregates;
};

// Canonical little-endian encoding hashed into the transcript.
std::string encodeEvent(const LedgerEvent& event);

using EventListener = std::function<void(const LedgerEvent&)>;

class EventLog {
public:
    // Assigns the sequence number, records the event, extends the transcript
    // and notifies listeners in registration order. Listeners must not throw.
    const LedgerEvent& emit(LedgerEvent event);

    void subscribe(EventListener listener);

    const std::vector<LedgerEvent>& events() const { return events_; }
    std::vector<LedgerEvent> eventsOfKind(EventKind kind) const;
    const TranscriptLog& transcript() const { return transcript_; }
    std::string transcriptRoot() const { return transcript_.merkleRoot(); }
    std::size_t size() const { return events_.size(); }

private:
    std::vector<LedgerEvent> events_;
    TranscriptLog transcript_;
    std::vector<EventListener> listeners_;
};

} // namespace fl
