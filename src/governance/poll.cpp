// AGORA - Poll Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/poll.h"
#include "agora/crypto/sha256.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace agora {
namespace governance {

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

enum MessageTag : uint8_t {
    TAG_UPDATE_CONFIG = 0,
    TAG_TRANSFER_OWNERSHIP = 1,
    TAG_FORWARD = 2,
};

template<typename Enum>
Enum ReadEnum(DataStream& ss, uint8_t maxValue) {
    uint8_t raw = ser_readdata8(ss);
    if (raw > maxValue) {
        throw std::ios_base::failure("enum value out of range");
    }
    return static_cast<Enum>(raw);
}

} // namespace

// ============================================================================
// Enum Conversions
// ============================================================================

const char* PollStatusToString(PollStatus status) {
    switch (status) {
        case PollStatus::InProgress: return "InProgress";
        case PollStatus::Passed: return "Passed";
        case PollStatus::Rejected: return "Rejected";
        case PollStatus::Executed: return "Executed";
        case PollStatus::Expired: return "Expired";
        case PollStatus::Failed: return "Failed";
        default: return "Unknown";
    }
}

std::optional<PollStatus> ParsePollStatus(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "inprogress" || lower == "in_progress") return PollStatus::InProgress;
    if (lower == "passed") return PollStatus::Passed;
    if (lower == "rejected") return PollStatus::Rejected;
    if (lower == "executed") return PollStatus::Executed;
    if (lower == "expired") return PollStatus::Expired;
    if (lower == "failed") return PollStatus::Failed;
    return std::nullopt;
}

bool IsTerminal(PollStatus status) {
    return status == PollStatus::Rejected || status == PollStatus::Executed ||
           status == PollStatus::Expired || status == PollStatus::Failed;
}

const char* VoteChoiceToString(VoteChoice choice) {
    switch (choice) {
        case VoteChoice::Yes: return "Yes";
        case VoteChoice::No: return "No";
        case VoteChoice::Abstain: return "Abstain";
        default: return "Unknown";
    }
}

std::optional<VoteChoice> ParseVoteChoice(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "yes") return VoteChoice::Yes;
    if (lower == "no") return VoteChoice::No;
    if (lower == "abstain") return VoteChoice::Abstain;
    return std::nullopt;
}

const char* DepositSettlementToString(DepositSettlement settlement) {
    switch (settlement) {
        case DepositSettlement::Escrowed: return "Escrowed";
        case DepositSettlement::Refunded: return "Refunded";
        case DepositSettlement::Forfeited: return "Forfeited";
        default: return "Unknown";
    }
}

// ============================================================================
// Poll Messages
// ============================================================================

bool UpdateConfigMessage::IsEmpty() const {
    return !quorumBps && !thresholdBps && !votingPeriod && !timelockPeriod &&
           !expirationPeriod && !proposalDeposit && !depositPolicy &&
           !lockVotedStake && !maxMessages && !owner;
}

bool UpdateConfigMessage::operator==(const UpdateConfigMessage& other) const {
    return quorumBps == other.quorumBps && thresholdBps == other.thresholdBps &&
           votingPeriod == other.votingPeriod && timelockPeriod == other.timelockPeriod &&
           expirationPeriod == other.expirationPeriod &&
           proposalDeposit == other.proposalDeposit &&
           depositPolicy == other.depositPolicy && lockVotedStake == other.lockVotedStake &&
           maxMessages == other.maxMessages && owner == other.owner;
}

const char* PollMessageTypeName(const PollMessage& message) {
    switch (message.index()) {
        case TAG_UPDATE_CONFIG: return "UpdateConfig";
        case TAG_TRANSFER_OWNERSHIP: return "TransferOwnership";
        case TAG_FORWARD: return "Forward";
        default: return "Unknown";
    }
}

void SerializeMessage(DataStream& ss, const PollMessage& message) {
    ser_writedata8(ss, static_cast<uint8_t>(message.index()));
    
    if (const auto* update = std::get_if<UpdateConfigMessage>(&message)) {
        ss << update->quorumBps << update->thresholdBps << update->votingPeriod
           << update->timelockPeriod << update->expirationPeriod << update->proposalDeposit;
        ser_writedata8(ss, update->depositPolicy ? 1 : 0);
        if (update->depositPolicy) {
            ser_writedata8(ss, static_cast<uint8_t>(*update->depositPolicy));
        }
        ss << update->lockVotedStake << update->maxMessages << update->owner;
    } else if (const auto* transfer = std::get_if<TransferOwnershipMessage>(&message)) {
        ss << transfer->contract << transfer->newOwner;
    } else {
        const auto& forward = std::get<ForwardMessage>(message);
        ss << forward.contract << forward.payload;
    }
}

PollMessage UnserializeMessage(DataStream& ss) {
    uint8_t tag = ser_readdata8(ss);
    switch (tag) {
        case TAG_UPDATE_CONFIG: {
            UpdateConfigMessage update;
            ss >> update.quorumBps >> update.thresholdBps >> update.votingPeriod
               >> update.timelockPeriod >> update.expirationPeriod >> update.proposalDeposit;
            if (ser_readdata8(ss) != 0) {
                update.depositPolicy = ReadEnum<DepositPolicy>(ss, 2);
            }
            ss >> update.lockVotedStake >> update.maxMessages >> update.owner;
            return update;
        }
        case TAG_TRANSFER_OWNERSHIP: {
            TransferOwnershipMessage transfer;
            ss >> transfer.contract >> transfer.newOwner;
            return transfer;
        }
        case TAG_FORWARD: {
            ForwardMessage forward;
            ss >> forward.contract >> forward.payload;
            return forward;
        }
        default:
            throw std::ios_base::failure("unknown poll message tag " + std::to_string(tag));
    }
}

// ============================================================================
// Vote Implementation
// ============================================================================

std::vector<Byte> Vote::Serialize() const {
    DataStream ss;
    ss << pollId << voter;
    ser_writedata8(ss, static_cast<uint8_t>(choice));
    ss << power << height;
    return ss.Data();
}

std::optional<Vote> Vote::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    
    try {
        DataStream ss(data, len);
        Vote vote;
        ss >> vote.pollId >> vote.voter;
        vote.choice = ReadEnum<VoteChoice>(ss, 2);
        ss >> vote.power >> vote.height;
        if (!ss.empty() || vote.power <= 0 || vote.power > MAX_MONEY) {
            return std::nullopt;
        }
        return vote;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string Vote::ToString() const {
    std::ostringstream ss;
    ss << "Vote { poll: " << pollId
       << ", voter: " << voter.ToHex().substr(0, 12) << "..."
       << ", choice: " << VoteChoiceToString(choice)
       << ", power: " << power
       << " }";
    return ss.str();
}

// ============================================================================
// Poll Implementation
// ============================================================================

bool Poll::HasQuorum(uint32_t quorumBps) const {
    Amount cast = TotalVotes();
    if (totalVotingPowerAtCreation <= 0 || cast <= 0) {
        return false;
    }
    return static_cast<uint128_t>(cast) * BPS_DENOMINATOR >=
           static_cast<uint128_t>(quorumBps) * static_cast<uint128_t>(totalVotingPowerAtCreation);
}

bool Poll::HasThreshold(uint32_t thresholdBps) const {
    Amount decisive = yesVotes + noVotes;
    if (decisive <= 0) {
        return false;
    }
    return static_cast<uint128_t>(yesVotes) * BPS_DENOMINATOR >=
           static_cast<uint128_t>(thresholdBps) * static_cast<uint128_t>(decisive);
}

Hash256 Poll::GetContentHash() const {
    DataStream ss;
    ss << creator << title << description << link;
    WriteCompactSize(ss, messages.size());
    for (const auto& message : messages) {
        SerializeMessage(ss, message);
    }
    return SHA256Hash(ss.Data());
}

std::vector<Byte> Poll::Serialize() const {
    DataStream ss;
    
    ss << id << creator << depositAmount << title << description << link;
    
    WriteCompactSize(ss, messages.size());
    for (const auto& message : messages) {
        SerializeMessage(ss, message);
    }
    
    ser_writedata8(ss, static_cast<uint8_t>(status));
    ss << yesVotes << noVotes << abstainVotes << totalVotingPowerAtCreation;
    ss << startHeight << endHeight << settledHeight;
    ser_writedata8(ss, static_cast<uint8_t>(depositSettlement));
    ss << failedMessageIndex;
    
    return ss.Data();
}

std::optional<Poll> Poll::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    
    try {
        DataStream ss(data, len);
        Poll poll;
        
        ss >> poll.id >> poll.creator >> poll.depositAmount
           >> poll.title >> poll.description >> poll.link;
        
        uint64_t count = ReadCompactSize(ss);
        poll.messages.reserve(std::min<uint64_t>(count, 1024));
        for (uint64_t i = 0; i < count; ++i) {
            poll.messages.push_back(UnserializeMessage(ss));
        }
        
        poll.status = ReadEnum<PollStatus>(ss, 5);
        ss >> poll.yesVotes >> poll.noVotes >> poll.abstainVotes
           >> poll.totalVotingPowerAtCreation;
        ss >> poll.startHeight >> poll.endHeight >> poll.settledHeight;
        poll.depositSettlement = ReadEnum<DepositSettlement>(ss, 2);
        ss >> poll.failedMessageIndex;
        
        if (!ss.empty() || poll.id == 0 || !MoneyRange(poll.yesVotes) ||
            !MoneyRange(poll.noVotes) || !MoneyRange(poll.abstainVotes) ||
            poll.startHeight < 0 || poll.endHeight < poll.startHeight ||
            poll.endHeight > MAX_HEIGHT + MAX_PERIOD) {
            return std::nullopt;
        }
        return poll;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string Poll::ToString() const {
    std::ostringstream ss;
    ss << "Poll { id: " << id
       << ", title: \"" << title << "\""
       << ", status: " << PollStatusToString(status)
       << ", yes: " << yesVotes
       << ", no: " << noVotes
       << ", abstain: " << abstainVotes
       << ", of: " << totalVotingPowerAtCreation
       << ", end: " << endHeight
       << ", messages: " << messages.size()
       << " }";
    return ss.str();
}

// ============================================================================
// Validation
// ============================================================================

Status ValidatePollContent(const std::string& title,
                           const std::string& description,
                           const std::optional<std::string>& link,
                           size_t messageCount,
                           uint32_t maxMessages) {
    if (title.size() < MIN_TITLE_LENGTH) {
        return Status::InvalidPoll("title too short");
    }
    if (title.size() > MAX_TITLE_LENGTH) {
        return Status::InvalidPoll("title too long");
    }
    if (description.size() < MIN_DESCRIPTION_LENGTH) {
        return Status::InvalidPoll("description too short");
    }
    if (description.size() > MAX_DESCRIPTION_LENGTH) {
        return Status::InvalidPoll("description too long");
    }
    if (link) {
        if (link->size() < MIN_LINK_LENGTH) {
            return Status::InvalidPoll("link too short");
        }
        if (link->size() > MAX_LINK_LENGTH) {
            return Status::InvalidPoll("link too long");
        }
    }
    if (messageCount > maxMessages) {
        return Status::InvalidPoll("poll carries " + std::to_string(messageCount) +
                                   " messages, limit is " + std::to_string(maxMessages));
    }
    return Status::Ok();
}

} // namespace governance
} // namespace agora
