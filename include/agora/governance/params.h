// AGORA - Governance Parameters
// Copyright (c) 2024 AGORA Developers
// MIT License

#ifndef AGORA_GOVERNANCE_PARAMS_H
#define AGORA_GOVERNANCE_PARAMS_H

#include "agora/core/status.h"
#include "agora/core/types.h"

#include <optional>
#include <string>
#include <vector>

namespace agora {

namespace util {
class ConfigManager;
}

namespace governance {

struct UpdateConfigMessage;

// ============================================================================
// Constants
// ============================================================================

/// Ratios are expressed in basis points
constexpr uint32_t BPS_DENOMINATOR = 10000;

/// Defaults (blocks are ~6 seconds)
constexpr uint32_t DEFAULT_QUORUM_BPS = 1000;       // 10%
constexpr uint32_t DEFAULT_THRESHOLD_BPS = 5000;    // 50%
constexpr Height DEFAULT_VOTING_PERIOD = 94097;     // ~7 days
constexpr Height DEFAULT_TIMELOCK_PERIOD = 13443;   // ~1 day
constexpr Height DEFAULT_EXPIRATION_PERIOD = 13443; // ~1 day
constexpr Amount DEFAULT_PROPOSAL_DEPOSIT = 1000 * COIN;
constexpr uint32_t DEFAULT_MAX_MESSAGES = 16;

/// Upper bound for each period parameter
constexpr Height MAX_PERIOD = 52560000;             // ~10 years

/// Highest block height accepted; keeps end + timelock + expiration in range
constexpr Height MAX_HEIGHT = INT64_MAX / 4;

// ============================================================================
// Deposit Policy
// ============================================================================

/// What happens to the deposit of a rejected poll
enum class DepositPolicy : uint8_t {
    /// Deposit becomes staker income
    Forfeit = 0,
    
    /// Deposit goes back to the creator
    Refund = 1,
    
    /// Refunded only if the poll reached quorum
    RefundIfQuorum = 2,
};

const char* DepositPolicyToString(DepositPolicy policy);
std::optional<DepositPolicy> ParseDepositPolicy(const std::string& str);

// ============================================================================
// Governance Parameters
// ============================================================================

struct GovernanceParams {
    /// Minimum participation, as a share of stake at poll creation
    uint32_t quorumBps{DEFAULT_QUORUM_BPS};
    
    /// Minimum yes / (yes + no)
    uint32_t thresholdBps{DEFAULT_THRESHOLD_BPS};
    
    Height votingPeriod{DEFAULT_VOTING_PERIOD};
    
    /// Blocks after voting ends before a passed poll may execute
    Height timelockPeriod{DEFAULT_TIMELOCK_PERIOD};
    
    /// Blocks after the timelock during which execution is allowed
    Height expirationPeriod{DEFAULT_EXPIRATION_PERIOD};
    
    /// Minimum deposit to create a poll
    Amount proposalDeposit{DEFAULT_PROPOSAL_DEPOSIT};
    
    DepositPolicy depositPolicy{DepositPolicy::Forfeit};
    
    /// Keep voted power staked until the poll leaves InProgress
    bool lockVotedStake{true};
    
    uint32_t maxMessages{DEFAULT_MAX_MESSAGES};
    
    /// May update parameters directly; null means only polls can
    AccountId owner;
    
    /// InvalidConfig describing the first bad field
    Status Validate() const;
    
    /// Overwrite the fields the update sets
    void ApplyUpdate(const UpdateConfigMessage& update);
    
    /**
     * Load from the [governance] section, starting from defaults.
     * Ratios are decimal fractions ("0.3"), amounts are base units.
     */
    static Status FromConfig(const util::ConfigManager& config, GovernanceParams* out);
    
    std::vector<Byte> Serialize() const;
    static std::optional<GovernanceParams> Deserialize(const Byte* data, size_t len);
    
    std::string ToString() const;
    
    bool operator==(const GovernanceParams& other) const;
    bool operator!=(const GovernanceParams& other) const { return !(*this == other); }
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_PARAMS_H
