// AGORA - Polls
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Poll, vote and message records shared by the registry, the vote
// snapshot and the execution engine.

#ifndef AGORA_GOVERNANCE_POLL_H
#define AGORA_GOVERNANCE_POLL_H

#include "agora/core/serialize.h"
#include "agora/core/status.h"
#include "agora/core/types.h"
#include "agora/governance/params.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agora {
namespace governance {

// ============================================================================
// Constants
// ============================================================================

constexpr size_t MIN_TITLE_LENGTH = 4;
constexpr size_t MAX_TITLE_LENGTH = 64;
constexpr size_t MIN_DESCRIPTION_LENGTH = 4;
constexpr size_t MAX_DESCRIPTION_LENGTH = 1024;
constexpr size_t MIN_LINK_LENGTH = 12;
constexpr size_t MAX_LINK_LENGTH = 128;

/// Page size limits for list queries
constexpr size_t DEFAULT_PAGE_LIMIT = 10;
constexpr size_t MAX_PAGE_LIMIT = 30;

// ============================================================================
// Governance Types
// ============================================================================

/// Sequential poll identifier, starting at 1
using PollId = uint64_t;

/// Poll lifecycle status. Transitions are one-way:
/// InProgress -> Passed | Rejected, Passed -> Executed | Failed | Expired
enum class PollStatus : uint8_t {
    InProgress = 0,
    Passed = 1,
    Rejected = 2,
    Executed = 3,
    Expired = 4,
    Failed = 5,
};

const char* PollStatusToString(PollStatus status);
std::optional<PollStatus> ParsePollStatus(const std::string& str);

/// True for statuses no transition leaves
bool IsTerminal(PollStatus status);

enum class VoteChoice : uint8_t {
    Yes = 0,
    No = 1,
    /// Counts toward quorum but not the threshold
    Abstain = 2,
};

const char* VoteChoiceToString(VoteChoice choice);
std::optional<VoteChoice> ParseVoteChoice(const std::string& str);

/// Where a poll's deposit ended up
enum class DepositSettlement : uint8_t {
    Escrowed = 0,
    Refunded = 1,
    Forfeited = 2,
};

const char* DepositSettlementToString(DepositSettlement settlement);

// ============================================================================
// Poll Messages
// ============================================================================

/// Change of the governance's own parameters; unset fields keep their value
struct UpdateConfigMessage {
    std::optional<uint32_t> quorumBps;
    std::optional<uint32_t> thresholdBps;
    std::optional<Height> votingPeriod;
    std::optional<Height> timelockPeriod;
    std::optional<Height> expirationPeriod;
    std::optional<Amount> proposalDeposit;
    std::optional<DepositPolicy> depositPolicy;
    std::optional<bool> lockVotedStake;
    std::optional<uint32_t> maxMessages;
    std::optional<AccountId> owner;
    
    bool IsEmpty() const;
    
    bool operator==(const UpdateConfigMessage& other) const;
};

/// Hand an owned contract over to a new owner
struct TransferOwnershipMessage {
    AccountId contract;
    AccountId newOwner;
    
    bool operator==(const TransferOwnershipMessage& other) const {
        return contract == other.contract && newOwner == other.newOwner;
    }
};

/// Opaque payload for an owned contract
struct ForwardMessage {
    AccountId contract;
    std::vector<Byte> payload;
    
    bool operator==(const ForwardMessage& other) const {
        return contract == other.contract && payload == other.payload;
    }
};

/// Closed set of actions a passed poll can carry
using PollMessage = std::variant<UpdateConfigMessage, TransferOwnershipMessage, ForwardMessage>;

/// "UpdateConfig", "TransferOwnership" or "Forward"
const char* PollMessageTypeName(const PollMessage& message);

/// Messages handled by the governance itself rather than an owned contract
inline bool IsInternalMessage(const PollMessage& message) {
    return std::holds_alternative<UpdateConfigMessage>(message);
}

void SerializeMessage(DataStream& ss, const PollMessage& message);

/// Throws std::ios_base::failure on malformed input
PollMessage UnserializeMessage(DataStream& ss);

// ============================================================================
// Vote Record
// ============================================================================

struct Vote {
    PollId pollId{0};
    AccountId voter;
    VoteChoice choice{VoteChoice::Abstain};
    
    /// Staked balance at cast time, fixed for the poll's life
    Amount power{0};
    
    Height height{0};
    
    std::vector<Byte> Serialize() const;
    static std::optional<Vote> Deserialize(const Byte* data, size_t len);
    
    std::string ToString() const;
};

// ============================================================================
// Poll
// ============================================================================

struct Poll {
    PollId id{0};
    AccountId creator;
    
    /// Escrowed from the creator's token balance
    Amount depositAmount{0};
    
    std::string title;
    std::string description;
    std::optional<std::string> link;
    std::vector<PollMessage> messages;
    
    PollStatus status{PollStatus::InProgress};
    
    Amount yesVotes{0};
    Amount noVotes{0};
    Amount abstainVotes{0};
    
    /// Quorum denominator: total stake when the poll was created
    Amount totalVotingPowerAtCreation{0};
    
    Height startHeight{0};
    Height endHeight{0};
    
    /// Height of the last status change (0 while InProgress)
    Height settledHeight{0};
    
    DepositSettlement depositSettlement{DepositSettlement::Escrowed};
    
    /// Index of the message that failed, for Failed polls
    std::optional<uint32_t> failedMessageIndex;
    
    Amount TotalVotes() const { return yesVotes + noVotes + abstainVotes; }
    
    bool IsTerminal() const { return governance::IsTerminal(status); }
    
    /// First height at which a passed poll may execute
    Height ExecutableFrom(Height timelock) const { return endHeight + timelock; }
    
    /// Last height at which a passed poll may execute
    Height ExecutableUntil(Height timelock, Height expiration) const {
        return endHeight + timelock + expiration;
    }
    
    /// Participation reaches quorumBps of the creation-time stake
    bool HasQuorum(uint32_t quorumBps) const;
    
    /// yes / (yes + no) reaches thresholdBps
    bool HasThreshold(uint32_t thresholdBps) const;
    
    /// SHA-256 of creator, title, description, link and messages
    Hash256 GetContentHash() const;
    
    std::vector<Byte> Serialize() const;
    static std::optional<Poll> Deserialize(const Byte* data, size_t len);
    
    std::string ToString() const;
};

/// Check title, description, link and message count
Status ValidatePollContent(const std::string& title,
                           const std::string& description,
                           const std::optional<std::string>& link,
                           size_t messageCount,
                           uint32_t maxMessages);

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_POLL_H
