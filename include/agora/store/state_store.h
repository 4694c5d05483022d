// AGORA - State Store
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Persists the complete governance state into a key-value database.
// Each record is its payload followed by SHA-256(key || payload).

#ifndef AGORA_STORE_STATE_STORE_H
#define AGORA_STORE_STATE_STORE_H

#include "agora/core/status.h"
#include "agora/core/types.h"
#include "agora/db/database.h"
#include "agora/governance/governance.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agora {
namespace store {

/// Bumped when the record layout changes
constexpr uint32_t STATE_FORMAT_VERSION = 1;

/// Key prefixes
namespace prefix {
    constexpr char META = 'M';
    constexpr char PARAMS = 'C';
    constexpr char REWARD_INDEX = 'R';
    constexpr char STAKE = 'S';
    constexpr char POLL = 'P';
    constexpr char VOTE = 'V';
}

/// Height, poll counter and layout version
struct StateMeta {
    uint32_t version{STATE_FORMAT_VERSION};
    Height height{0};
    governance::PollId nextPollId{1};
    
    std::vector<Byte> Serialize() const;
    static std::optional<StateMeta> Deserialize(const Byte* data, size_t len);
};

class StateStore {
public:
    /// Store over an open database; db must outlive the store
    explicit StateStore(db::Database& db);
    
    /// Open (or create) the database at path and own it
    static std::pair<Status, std::unique_ptr<StateStore>> Open(
        const std::filesystem::path& path,
        const db::Options& options = db::Options());
    
    /// Replace the stored state with this one in a single batch
    Status Save(const governance::GovernanceState& state);
    
    /**
     * Read the stored state.
     *
     * @return NotFound if nothing was saved, Corruption on a checksum,
     *         decode or consistency failure
     */
    Status Load(governance::GovernanceState* out);
    
    bool HasState();
    
    /// Save the contract's current state
    Status SaveContract(const governance::GovernanceContract& contract);
    
    /// Load and import into the contract
    Status LoadContract(governance::GovernanceContract& contract);
    
    // === Keys ===
    
    static std::string MetaKey();
    static std::string StakeKey(const AccountId& account);
    static std::string PollKey(governance::PollId pollId);
    static std::string VoteKey(governance::PollId pollId, const AccountId& voter);

private:
    StateStore(std::unique_ptr<db::Database> owned);
    
    /// Append the checksum and stage the record
    static void PutRecord(db::WriteBatch& batch, const std::string& key,
                          const std::vector<Byte>& payload);
    
    /// Strip and verify the checksum
    static Status DecodeRecord(const std::string& key, const std::string& value,
                               std::vector<Byte>* payload);
    
    Status ReadRecord(const std::string& key, std::vector<Byte>* payload);
    
    /// Payloads of every record whose key starts with prefix
    Status ReadPrefix(char keyPrefix, std::vector<std::vector<Byte>>* payloads);
    
    Status CollectKeys(char keyPrefix, std::vector<std::string>* keys);
    
    std::unique_ptr<db::Database> owned_;
    db::Database& db_;
};

} // namespace store
} // namespace agora

#endif // AGORA_STORE_STATE_STORE_H
