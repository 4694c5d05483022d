// AGORA - Status
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Result of every state-mutating call and every storage operation.
// A non-OK status guarantees the call left governance state untouched.

#ifndef AGORA_CORE_STATUS_H
#define AGORA_CORE_STATUS_H

#include <string>

namespace agora {

/// Broad grouping of error codes, used by callers deciding whether to retry
enum class ErrorCategory {
    None,
    Validation,
    StateConflict,
    Resource,
    Authorization,
    Storage,
};

/// Get error category name
const char* ErrorCategoryToString(ErrorCategory category);

/**
 * Status returned by ledger, poll, execution and database operations.
 */
class Status {
public:
    enum Code {
        OK = 0,
        
        // Validation
        INVALID_AMOUNT,
        INSUFFICIENT_DEPOSIT,
        INSUFFICIENT_STAKE,
        INSUFFICIENT_BALANCE,
        INVALID_POLL,
        INVALID_CONFIG,
        INVALID_HEIGHT,
        
        // State conflict
        ALREADY_VOTED,
        POLL_NOT_IN_PROGRESS,
        ALREADY_EXECUTED,
        NOT_PASSED,
        VOTING_PERIOD_NOT_OVER,
        TIMELOCK_NOT_EXPIRED,
        EXECUTION_WINDOW_OPEN,
        EXECUTION_WINDOW_CLOSED,
        LOCKED_BY_ACTIVE_POLL,
        
        // Resource
        NO_STAKERS,
        NOTHING_TO_CLAIM,
        NO_STAKE,
        POLL_NOT_FOUND,
        NOT_FOUND,
        
        // Authorization
        UNAUTHORIZED,
        
        // Storage
        CORRUPTION,
        IO_ERROR,
        NOT_SUPPORTED,
    };
    
private:
    Code code_;
    std::string message_;
    
public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}
    
    static Status Ok() { return Status(); }
    
    static Status InvalidAmount(const std::string& msg = "") { return Status(INVALID_AMOUNT, msg); }
    static Status InsufficientDeposit(const std::string& msg = "") { return Status(INSUFFICIENT_DEPOSIT, msg); }
    static Status InsufficientStake(const std::string& msg = "") { return Status(INSUFFICIENT_STAKE, msg); }
    static Status InsufficientBalance(const std::string& msg = "") { return Status(INSUFFICIENT_BALANCE, msg); }
    static Status InvalidPoll(const std::string& msg = "") { return Status(INVALID_POLL, msg); }
    static Status InvalidConfig(const std::string& msg = "") { return Status(INVALID_CONFIG, msg); }
    static Status InvalidHeight(const std::string& msg = "") { return Status(INVALID_HEIGHT, msg); }
    
    static Status AlreadyVoted(const std::string& msg = "") { return Status(ALREADY_VOTED, msg); }
    static Status PollNotInProgress(const std::string& msg = "") { return Status(POLL_NOT_IN_PROGRESS, msg); }
    static Status AlreadyExecuted(const std::string& msg = "") { return Status(ALREADY_EXECUTED, msg); }
    static Status NotPassed(const std::string& msg = "") { return Status(NOT_PASSED, msg); }
    static Status VotingPeriodNotOver(const std::string& msg = "") { return Status(VOTING_PERIOD_NOT_OVER, msg); }
    static Status TimelockNotExpired(const std::string& msg = "") { return Status(TIMELOCK_NOT_EXPIRED, msg); }
    static Status ExecutionWindowOpen(const std::string& msg = "") { return Status(EXECUTION_WINDOW_OPEN, msg); }
    static Status ExecutionWindowClosed(const std::string& msg = "") { return Status(EXECUTION_WINDOW_CLOSED, msg); }
    static Status LockedByActivePoll(const std::string& msg = "") { return Status(LOCKED_BY_ACTIVE_POLL, msg); }
    
    static Status NoStakers(const std::string& msg = "") { return Status(NO_STAKERS, msg); }
    static Status NothingToClaim(const std::string& msg = "") { return Status(NOTHING_TO_CLAIM, msg); }
    static Status NoStake(const std::string& msg = "") { return Status(NO_STAKE, msg); }
    static Status PollNotFound(const std::string& msg = "") { return Status(POLL_NOT_FOUND, msg); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    
    static Status Unauthorized(const std::string& msg = "") { return Status(UNAUTHORIZED, msg); }
    
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    
    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }
    
    Code code() const { return code_; }
    const std::string& message() const { return message_; }
    
    ErrorCategory category() const;
    
    /// Name of the code, e.g. "AlreadyVoted"
    static const char* CodeToString(Code code);
    
    std::string ToString() const {
        if (ok()) return "OK";
        std::string result = CodeToString(code_);
        if (!message_.empty()) {
            result += ": " + message_;
        }
        return result;
    }
    
    bool operator==(Code code) const { return code_ == code; }
    bool operator!=(Code code) const { return code_ != code; }
};

} // namespace agora

#endif // AGORA_CORE_STATUS_H
