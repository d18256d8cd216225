#include "ledger_error.hpp"

#include <string>
#include <utility>

namespace fl {
namespace {

std::string formatMessage(ErrorCode code, const std::string& tag) {
    std::string message = errorCodeName(code);
    if (!tag.empty()) {
        message += ":" + tag;
    }
    return message;
}

} // namespace

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::NotOwner:
        return "NotOwner";
    case ErrorCode::NotProvider:
        return "NotProvider";
    case ErrorCode::Paused:
        return "Paused";
    case ErrorCode::AlreadyPaused:
        return "AlreadyPaused";
    case ErrorCode::NotPaused:
        return "NotPaused";
    case ErrorCode::CooldownActive:
        return "CooldownActive";
    case ErrorCode::InvalidCooldown:
        return "InvalidCooldown";
    case ErrorCode::BatchClosed:
        return "BatchClosed";
    case ErrorCode::BatchStillOpen:
        return "BatchStillOpen";
    case ErrorCode::InvalidBatch:
        return "InvalidBatch";
    case ErrorCode::Uninitialized:
        return "Uninitialized";
    case ErrorCode::InvalidCleartext:
        return "InvalidCleartext";
    case ErrorCode::InvalidProof:
        return "InvalidProof";
    case ErrorCode::DuplicateSubmission:
        return "DuplicateSubmission";
    case ErrorCode::ReplayAttempt:
        return "ReplayAttempt";
    case ErrorCode::StaleWrite:
        return "StaleWrite";
    case ErrorCode::InvalidStateHash:
        return "InvalidStateHash";
    case ErrorCode::UnknownRequest:
        return "UnknownRequest";
    }
    return "Unknown";
}

ErrorCategory errorCategory(ErrorCode code) {
    switch (code) {
    case ErrorCode::NotOwner:
    case ErrorCode::NotProvider:
    case ErrorCode::Paused:
    case ErrorCode::AlreadyPaused:
    case ErrorCode::NotPaused:
        return ErrorCategory::Authorization;
    case ErrorCode::CooldownActive:
    case ErrorCode::InvalidCooldown:
        return ErrorCategory::Throttling;
    case ErrorCode::BatchClosed:
    case ErrorCode::BatchStillOpen:
    case ErrorCode::InvalidBatch:
        return ErrorCategory::Lifecycle;
    case ErrorCode::Uninitialized:
    case ErrorCode::InvalidCleartext:
    case ErrorCode::InvalidProof:
        return ErrorCategory::Integrity;
    case ErrorCode::DuplicateSubmission:
    case ErrorCode::ReplayAttempt:
        return ErrorCategory::Replay;
    case ErrorCode::StaleWrite:
        return ErrorCategory::Staleness;
    case ErrorCode::InvalidStateHash:
        return ErrorCategory::StateDrift;
    case ErrorCode::UnknownRequest:
        return ErrorCategory::Lookup;
    }
    return ErrorCategory::Lookup;
}

bool isRetryable(ErrorCode code) {
    return code == ErrorCode::CooldownActive || code == ErrorCode::InvalidProof;
}

LedgerError::LedgerError(ErrorCode code, std::string tag)
    : std::runtime_error(formatMessage(code, tag))
    , code_(code)
    , tag_(std::move(tag)) {}

} // namespace fl
