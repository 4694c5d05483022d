// AGORA - Status Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/core/status.h"

namespace agora {

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Validation: return "Validation";
        case ErrorCategory::StateConflict: return "StateConflict";
        case ErrorCategory::Resource: return "Resource";
        case ErrorCategory::Authorization: return "Authorization";
        case ErrorCategory::Storage: return "Storage";
        default: return "Unknown";
    }
}

ErrorCategory Status::category() const {
    switch (code_) {
        case OK:
            return ErrorCategory::None;
        case INVALID_AMOUNT:
        case INSUFFICIENT_DEPOSIT:
        case INSUFFICIENT_STAKE:
        case INSUFFICIENT_BALANCE:
        case INVALID_POLL:
        case INVALID_CONFIG:
        case INVALID_HEIGHT:
            return ErrorCategory::Validation;
        case ALREADY_VOTED:
        case POLL_NOT_IN_PROGRESS:
        case ALREADY_EXECUTED:
        case NOT_PASSED:
        case VOTING_PERIOD_NOT_OVER:
        case TIMELOCK_NOT_EXPIRED:
        case EXECUTION_WINDOW_OPEN:
        case EXECUTION_WINDOW_CLOSED:
        case LOCKED_BY_ACTIVE_POLL:
            return ErrorCategory::StateConflict;
        case NO_STAKERS:
        case NOTHING_TO_CLAIM:
        case NO_STAKE:
        case POLL_NOT_FOUND:
        case NOT_FOUND:
            return ErrorCategory::Resource;
        case UNAUTHORIZED:
            return ErrorCategory::Authorization;
        case CORRUPTION:
        case IO_ERROR:
        case NOT_SUPPORTED:
            return ErrorCategory::Storage;
    }
    return ErrorCategory::None;
}

const char* Status::CodeToString(Code code) {
    switch (code) {
        case OK: return "OK";
        case INVALID_AMOUNT: return "InvalidAmount";
        case INSUFFICIENT_DEPOSIT: return "InsufficientDeposit";
        case INSUFFICIENT_STAKE: return "InsufficientStake";
        case INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case INVALID_POLL: return "InvalidPoll";
        case INVALID_CONFIG: return "InvalidConfig";
        case INVALID_HEIGHT: return "InvalidHeight";
        case ALREADY_VOTED: return "AlreadyVoted";
        case POLL_NOT_IN_PROGRESS: return "PollNotInProgress";
        case ALREADY_EXECUTED: return "AlreadyExecuted";
        case NOT_PASSED: return "NotPassed";
        case VOTING_PERIOD_NOT_OVER: return "VotingPeriodNotOver";
        case TIMELOCK_NOT_EXPIRED: return "TimelockNotExpired";
        case EXECUTION_WINDOW_OPEN: return "ExecutionWindowOpen";
        case EXECUTION_WINDOW_CLOSED: return "ExecutionWindowClosed";
        case LOCKED_BY_ACTIVE_POLL: return "LockedByActivePoll";
        case NO_STAKERS: return "NoStakers";
        case NOTHING_TO_CLAIM: return "NothingToClaim";
        case NO_STAKE: return "NoStake";
        case POLL_NOT_FOUND: return "PollNotFound";
        case NOT_FOUND: return "NotFound";
        case UNAUTHORIZED: return "Unauthorized";
        case CORRUPTION: return "Corruption";
        case IO_ERROR: return "IOError";
        case NOT_SUPPORTED: return "NotSupported";
    }
    return "Unknown";
}

} // namespace agora
