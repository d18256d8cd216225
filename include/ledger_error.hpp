#pragma once

#include <stdexcept>
#include <string>

namespace fl {

enum class ErrorCode {
    NotOwner,
    NotProvider,
    Paused,
    AlreadyPaused,
    NotPaused,
    CooldownActive,
    InvalidCooldown,
    BatchClosed,
    BatchStillOpen,
    InvalidBatch,
    Uninitialized,
    InvalidCleartext,
    InvalidProof,
    DuplicateSubmission,
    ReplayAttempt,
    StaleWrite,
    InvalidStateHash,
    UnknownRequest
};

enum class ErrorCategory {
    Authorization,
    Throttling,
    Lifecycle,
    Integrity,
    Replay,
    Staleness,
    StateDrift,
    Lookup
};

const char* errorCodeName(ErrorCode code);
ErrorCategory errorCategory(ErrorCode code);

// Only throttling and a bad proof can succeed on an identical retry.
bool isRetryable(ErrorCode code);

// Protocol rejection raised by every ledger entry point. what() reads
// "<CodeName>" or "<CodeName>:<tag>", e.g. "Uninitialized:supply".
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(ErrorCode code, std::string tag = {});

    ErrorCode code() const { return code_; }
    ErrorCategory category() const { return errorCategory(code_); }
    const std::string& tag() const { return tag_; }

private:
    ErrorCode code_;
    std::string tag_;
};

} // namespace fl
