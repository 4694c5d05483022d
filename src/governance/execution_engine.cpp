// AGORA - Execution Engine Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/execution_engine.h"
#include "agora/util/logging.h"

#include <exception>
#include <sstream>

namespace agora {
namespace governance {

std::string ExecutionResult::ToString() const {
    std::ostringstream ss;
    ss << "ExecutionResult { status: " << PollStatusToString(status)
       << ", dispatched: " << dispatched;
    if (failedIndex) {
        ss << ", failed at: " << *failedIndex;
    }
    ss << " }";
    return ss.str();
}

ExecutionEngine::ExecutionEngine(PollRegistry& registry, IExecutionHost* host)
    : registry_(registry), host_(host) {}

Status ExecutionEngine::Execute(PollId pollId, Height height, GovernanceParams& params,
                                ExecutionResult* result) {
    const Poll* poll = registry_.FindPoll(pollId);
    if (!poll) {
        return Status::PollNotFound("poll " + std::to_string(pollId));
    }
    if (poll->status == PollStatus::Executed || poll->status == PollStatus::Failed) {
        return Status::AlreadyExecuted("poll " + std::to_string(pollId) + " is " +
                                       PollStatusToString(poll->status));
    }
    if (poll->status != PollStatus::Passed) {
        return Status::NotPassed("poll " + std::to_string(pollId) + " is " +
                                 PollStatusToString(poll->status));
    }
    
    Height from = poll->ExecutableFrom(params.timelockPeriod);
    if (height < from) {
        return Status::TimelockNotExpired("executable from " + std::to_string(from));
    }
    Height until = poll->ExecutableUntil(params.timelockPeriod, params.expirationPeriod);
    if (height > until) {
        return Status::ExecutionWindowClosed("execution window ended at " +
                                             std::to_string(until));
    }
    
    util::ScopedLogTimer timer(util::LogCategory::EXEC, "poll " + std::to_string(pollId));
    
    GovernanceParams staged = params;
    ExecutionResult outcome;
    
    if (host_) {
        host_->BeginBatch();
    }
    
    const auto& messages = poll->messages;
    for (uint32_t i = 0; i < messages.size(); ++i) {
        if (!RunMessage(messages[i], staged)) {
            outcome.failedIndex = i;
            break;
        }
        ++outcome.dispatched;
    }
    
    if (outcome.failedIndex) {
        if (host_) {
            host_->RollbackBatch();
        }
        Status s = registry_.MarkFailed(pollId, height, *outcome.failedIndex);
        if (!s.ok()) {
            return s;
        }
        outcome.status = PollStatus::Failed;
        LOG_WARN(util::LogCategory::EXEC) << "Poll " << pollId << " failed at message "
                                          << *outcome.failedIndex << " ("
                                          << PollMessageTypeName(messages[*outcome.failedIndex])
                                          << "), batch rolled back";
    } else {
        if (host_) {
            host_->CommitBatch();
        }
        Status s = registry_.MarkExecuted(pollId, height);
        if (!s.ok()) {
            return s;
        }
        params = staged;
        outcome.status = PollStatus::Executed;
        LOG_INFO(util::LogCategory::EXEC) << "Poll " << pollId << " executed "
                                          << outcome.dispatched << " messages";
    }
    
    if (result) {
        *result = outcome;
    }
    return Status::Ok();
}

bool ExecutionEngine::RunMessage(const PollMessage& message, GovernanceParams& staged) {
    if (const auto* update = std::get_if<UpdateConfigMessage>(&message)) {
        GovernanceParams candidate = staged;
        candidate.ApplyUpdate(*update);
        Status s = candidate.Validate();
        if (!s.ok()) {
            LOG_DEBUG(util::LogCategory::EXEC) << "Config update rejected: " << s.message();
            return false;
        }
        staged = candidate;
        return true;
    }
    
    if (!host_) {
        LOG_DEBUG(util::LogCategory::EXEC) << "No host for " << PollMessageTypeName(message);
        return false;
    }
    
    try {
        return host_->Dispatch(message);
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::EXEC) << PollMessageTypeName(message)
                                           << " dispatch threw: " << e.what();
        return false;
    }
}

} // namespace governance
} // namespace agora
