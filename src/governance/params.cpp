// AGORA - Governance Parameters Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/params.h"
#include "agora/core/serialize.h"
#include "agora/governance/poll.h"
#include "agora/util/config.h"
#include "agora/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace agora {
namespace governance {

// ============================================================================
// Deposit Policy
// ============================================================================

const char* DepositPolicyToString(DepositPolicy policy) {
    switch (policy) {
        case DepositPolicy::Forfeit: return "forfeit";
        case DepositPolicy::Refund: return "refund";
        case DepositPolicy::RefundIfQuorum: return "refund_if_quorum";
        default: return "unknown";
    }
}

std::optional<DepositPolicy> ParseDepositPolicy(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (lower == "forfeit") return DepositPolicy::Forfeit;
    if (lower == "refund") return DepositPolicy::Refund;
    if (lower == "refund_if_quorum") return DepositPolicy::RefundIfQuorum;
    return std::nullopt;
}

// ============================================================================
// Validation
// ============================================================================

Status GovernanceParams::Validate() const {
    if (quorumBps > BPS_DENOMINATOR) {
        return Status::InvalidConfig("quorum exceeds 100%");
    }
    if (thresholdBps > BPS_DENOMINATOR) {
        return Status::InvalidConfig("threshold exceeds 100%");
    }
    if (votingPeriod <= 0) {
        return Status::InvalidConfig("voting period must be positive");
    }
    if (timelockPeriod < 0) {
        return Status::InvalidConfig("timelock period is negative");
    }
    if (expirationPeriod < 0) {
        return Status::InvalidConfig("expiration period is negative");
    }
    if (votingPeriod > MAX_PERIOD || timelockPeriod > MAX_PERIOD ||
        expirationPeriod > MAX_PERIOD) {
        return Status::InvalidConfig("periods are limited to " + std::to_string(MAX_PERIOD) +
                                     " blocks");
    }
    if (!MoneyRange(proposalDeposit)) {
        return Status::InvalidConfig("proposal deposit out of range");
    }
    if (static_cast<uint8_t>(depositPolicy) > static_cast<uint8_t>(DepositPolicy::RefundIfQuorum)) {
        return Status::InvalidConfig("unknown deposit policy");
    }
    return Status::Ok();
}

void GovernanceParams::ApplyUpdate(const UpdateConfigMessage& update) {
    if (update.quorumBps) quorumBps = *update.quorumBps;
    if (update.thresholdBps) thresholdBps = *update.thresholdBps;
    if (update.votingPeriod) votingPeriod = *update.votingPeriod;
    if (update.timelockPeriod) timelockPeriod = *update.timelockPeriod;
    if (update.expirationPeriod) expirationPeriod = *update.expirationPeriod;
    if (update.proposalDeposit) proposalDeposit = *update.proposalDeposit;
    if (update.depositPolicy) depositPolicy = *update.depositPolicy;
    if (update.lockVotedStake) lockVotedStake = *update.lockVotedStake;
    if (update.maxMessages) maxMessages = *update.maxMessages;
    if (update.owner) owner = *update.owner;
}

// ============================================================================
// Configuration File
// ============================================================================

namespace {

/// Decimal fraction in [0, 1] to basis points
bool RatioToBps(double ratio, uint32_t* out) {
    if (!std::isfinite(ratio) || ratio < 0.0 || ratio > 1.0) {
        return false;
    }
    *out = static_cast<uint32_t>(std::llround(ratio * BPS_DENOMINATOR));
    return true;
}

Status ConfigError(const std::string& key, const std::string& reason) {
    LOG_ERROR(util::LogCategory::CONFIG) << "[governance] " << key << ": " << reason;
    return Status::InvalidConfig(key + ": " + reason);
}

} // namespace

Status GovernanceParams::FromConfig(const util::ConfigManager& config, GovernanceParams* out) {
    using namespace util::ConfigKeys;
    const std::string section = GOVERNANCE_SECTION;
    
    GovernanceParams params;
    
    if (config.HasKey(QUORUM, section)) {
        auto ratio = config.TryGetDouble(QUORUM, section);
        if (!ratio || !RatioToBps(*ratio, &params.quorumBps)) {
            return ConfigError(QUORUM, "expected a fraction between 0 and 1");
        }
    }
    
    if (config.HasKey(THRESHOLD, section)) {
        auto ratio = config.TryGetDouble(THRESHOLD, section);
        if (!ratio || !RatioToBps(*ratio, &params.thresholdBps)) {
            return ConfigError(THRESHOLD, "expected a fraction between 0 and 1");
        }
    }
    
    struct HeightKey {
        const char* key;
        Height* field;
    };
    const HeightKey heightKeys[] = {
        {VOTING_PERIOD, &params.votingPeriod},
        {TIMELOCK_PERIOD, &params.timelockPeriod},
        {EXPIRATION_PERIOD, &params.expirationPeriod},
    };
    for (const auto& entry : heightKeys) {
        if (!config.HasKey(entry.key, section)) {
            continue;
        }
        auto value = config.TryGetInt(entry.key, section);
        if (!value) {
            return ConfigError(entry.key, "expected a block count");
        }
        *entry.field = *value;
    }
    
    if (config.HasKey(PROPOSAL_DEPOSIT, section)) {
        auto value = config.TryGetInt(PROPOSAL_DEPOSIT, section);
        if (!value) {
            return ConfigError(PROPOSAL_DEPOSIT, "expected an amount in base units");
        }
        params.proposalDeposit = *value;
    }
    
    if (config.HasKey(DEPOSIT_POLICY, section)) {
        auto policy = ParseDepositPolicy(config.GetString(DEPOSIT_POLICY, "", section));
        if (!policy) {
            return ConfigError(DEPOSIT_POLICY, "expected forfeit, refund or refund_if_quorum");
        }
        params.depositPolicy = *policy;
    }
    
    if (config.HasKey(LOCK_VOTED_STAKE, section)) {
        auto value = config.TryGetBool(LOCK_VOTED_STAKE, section);
        if (!value) {
            return ConfigError(LOCK_VOTED_STAKE, "expected a boolean");
        }
        params.lockVotedStake = *value;
    }
    
    if (config.HasKey(MAX_MESSAGES, section)) {
        auto value = config.TryGetInt(MAX_MESSAGES, section);
        if (!value || *value < 0 || *value > UINT32_MAX) {
            return ConfigError(MAX_MESSAGES, "expected a message count");
        }
        params.maxMessages = static_cast<uint32_t>(*value);
    }
    
    if (config.HasKey(OWNER, section)) {
        std::string hex = config.GetString(OWNER, "", section);
        if (!hex.empty()) {
            try {
                params.owner = AccountId::FromHex(hex);
            } catch (const std::invalid_argument& e) {
                return ConfigError(OWNER, e.what());
            }
        }
    }
    
    Status status = params.Validate();
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Rejected governance config: " << status.message();
        return status;
    }
    
    LOG_INFO(util::LogCategory::CONFIG) << "Loaded " << params.ToString();
    *out = params;
    return Status::Ok();
}

// ============================================================================
// Serialization
// ============================================================================

std::vector<Byte> GovernanceParams::Serialize() const {
    DataStream ss;
    ss << quorumBps << thresholdBps << votingPeriod << timelockPeriod
       << expirationPeriod << proposalDeposit;
    ser_writedata8(ss, static_cast<uint8_t>(depositPolicy));
    ss << lockVotedStake << maxMessages << owner;
    return ss.Data();
}

std::optional<GovernanceParams> GovernanceParams::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    
    try {
        DataStream ss(data, len);
        GovernanceParams params;
        ss >> params.quorumBps >> params.thresholdBps >> params.votingPeriod
           >> params.timelockPeriod >> params.expirationPeriod >> params.proposalDeposit;
        params.depositPolicy = static_cast<DepositPolicy>(ser_readdata8(ss));
        ss >> params.lockVotedStake >> params.maxMessages >> params.owner;
        
        if (!ss.empty() || !params.Validate().ok()) {
            return std::nullopt;
        }
        return params;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string GovernanceParams::ToString() const {
    std::ostringstream ss;
    ss << "GovernanceParams { quorum: " << quorumBps << "bps"
       << ", threshold: " << thresholdBps << "bps"
       << ", voting: " << votingPeriod
       << ", timelock: " << timelockPeriod
       << ", expiration: " << expirationPeriod
       << ", deposit: " << proposalDeposit
       << ", policy: " << DepositPolicyToString(depositPolicy)
       << ", lock: " << (lockVotedStake ? "on" : "off")
       << ", owner: " << (owner.IsNull() ? "none" : owner.ToHex().substr(0, 12))
       << " }";
    return ss.str();
}

bool GovernanceParams::operator==(const GovernanceParams& other) const {
    return quorumBps == other.quorumBps && thresholdBps == other.thresholdBps &&
           votingPeriod == other.votingPeriod && timelockPeriod == other.timelockPeriod &&
           expirationPeriod == other.expirationPeriod &&
           proposalDeposit == other.proposalDeposit && depositPolicy == other.depositPolicy &&
           lockVotedStake == other.lockVotedStake && maxMessages == other.maxMessages &&
           owner == other.owner;
}

} // namespace governance
} // namespace agora
