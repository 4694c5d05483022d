// AGORA - Execution Engine
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Runs the message list of a passed poll exactly once. Messages are
// dispatched in order inside one host batch; any failure rolls the
// batch back and marks the poll Failed.

#ifndef AGORA_GOVERNANCE_EXECUTION_ENGINE_H
#define AGORA_GOVERNANCE_EXECUTION_ENGINE_H

#include "agora/core/status.h"
#include "agora/core/types.h"
#include "agora/governance/params.h"
#include "agora/governance/poll.h"
#include "agora/governance/poll_registry.h"

#include <optional>
#include <string>

namespace agora {
namespace governance {

// ============================================================================
// Execution Host
// ============================================================================

/**
 * Receiver of messages addressed to contracts the governance owns.
 *
 * Dispatch reports success or failure only. Effects of a batch become
 * visible on CommitBatch and are discarded on RollbackBatch.
 */
class IExecutionHost {
public:
    virtual ~IExecutionHost() = default;
    
    virtual void BeginBatch() = 0;
    virtual bool Dispatch(const PollMessage& message) = 0;
    virtual void CommitBatch() = 0;
    virtual void RollbackBatch() = 0;
};

// ============================================================================
// Execution Engine
// ============================================================================

struct ExecutionResult {
    /// Executed or Failed
    PollStatus status{PollStatus::Passed};
    
    /// Set when status is Failed
    std::optional<uint32_t> failedIndex;
    
    /// Messages that ran before the batch ended
    uint32_t dispatched{0};
    
    std::string ToString() const;
};

class ExecutionEngine {
public:
    /// host may be null; polls carrying external messages then fail
    ExecutionEngine(PollRegistry& registry, IExecutionHost* host);
    
    /**
     * Execute a passed poll.
     *
     * Config updates are staged on a copy of params and written back only
     * when every message succeeds. A failing message is not a call error:
     * the poll becomes Failed and the result carries the failing index.
     */
    Status Execute(PollId pollId, Height height, GovernanceParams& params,
                   ExecutionResult* result = nullptr);
    
    void SetHost(IExecutionHost* host) { host_ = host; }

private:
    /// Dispatch one message; false on failure
    bool RunMessage(const PollMessage& message, GovernanceParams& staged);
    
    PollRegistry& registry_;
    IExecutionHost* host_;
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_EXECUTION_ENGINE_H
