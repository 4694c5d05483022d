// AGORA - State Store Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/store/state_store.h"
#include "agora/core/serialize.h"
#include "agora/crypto/sha256.h"
#include "agora/util/logging.h"

#include <cstring>
#include <map>

namespace agora {
namespace store {

namespace {

constexpr size_t CHECKSUM_SIZE = 32;

Hash256 RecordChecksum(const std::string& key, const Byte* payload, size_t len) {
    SHA256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>(key.data()), key.size());
    hasher.Write(payload, len);
    Hash256 checksum;
    hasher.Finalize(checksum.data());
    return checksum;
}

void AppendBigEndian64(std::string& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xff));
    }
}

} // namespace

// ============================================================================
// StateMeta
// ============================================================================

std::vector<Byte> StateMeta::Serialize() const {
    DataStream ss;
    ss << version << height << nextPollId;
    return ss.Data();
}

std::optional<StateMeta> StateMeta::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    
    try {
        DataStream ss(data, len);
        StateMeta meta;
        ss >> meta.version >> meta.height >> meta.nextPollId;
        if (!ss.empty() || meta.nextPollId == 0) {
            return std::nullopt;
        }
        return meta;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

// ============================================================================
// Keys
// ============================================================================

std::string StateStore::MetaKey() {
    return db::MakeKey(prefix::META);
}

std::string StateStore::StakeKey(const AccountId& account) {
    return db::MakeKey(prefix::STAKE,
                       db::Slice(reinterpret_cast<const char*>(account.data()), account.size()));
}

std::string StateStore::PollKey(governance::PollId pollId) {
    // Big-endian so iteration order matches id order
    std::string key = db::MakeKey(prefix::POLL);
    AppendBigEndian64(key, pollId);
    return key;
}

std::string StateStore::VoteKey(governance::PollId pollId, const AccountId& voter) {
    std::string key = db::MakeKey(prefix::VOTE);
    AppendBigEndian64(key, pollId);
    key.append(reinterpret_cast<const char*>(voter.data()), voter.size());
    return key;
}

// ============================================================================
// Construction
// ============================================================================

StateStore::StateStore(db::Database& db) : db_(db) {}

StateStore::StateStore(std::unique_ptr<db::Database> owned)
    : owned_(std::move(owned)), db_(*owned_) {}

std::pair<Status, std::unique_ptr<StateStore>> StateStore::Open(
    const std::filesystem::path& path, const db::Options& options) {
    auto [status, database] = db::OpenDatabase(path, options);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "Failed to open " << path.string() << ": "
                                            << status.ToString();
        return {status, nullptr};
    }
    return {Status::Ok(), std::unique_ptr<StateStore>(new StateStore(std::move(database)))};
}

// ============================================================================
// Records
// ============================================================================

void StateStore::PutRecord(db::WriteBatch& batch, const std::string& key,
                           const std::vector<Byte>& payload) {
    Hash256 checksum = RecordChecksum(key, payload.data(), payload.size());
    
    std::string value(reinterpret_cast<const char*>(payload.data()), payload.size());
    value.append(reinterpret_cast<const char*>(checksum.data()), CHECKSUM_SIZE);
    batch.Put(db::Slice(key), db::Slice(value));
}

Status StateStore::DecodeRecord(const std::string& key, const std::string& value,
                                std::vector<Byte>* payload) {
    if (value.size() < CHECKSUM_SIZE) {
        return Status::Corruption("truncated record");
    }
    
    size_t len = value.size() - CHECKSUM_SIZE;
    const Byte* bytes = reinterpret_cast<const Byte*>(value.data());
    Hash256 expected = RecordChecksum(key, bytes, len);
    if (std::memcmp(expected.data(), bytes + len, CHECKSUM_SIZE) != 0) {
        return Status::Corruption("checksum mismatch");
    }
    
    payload->assign(bytes, bytes + len);
    return Status::Ok();
}

Status StateStore::ReadRecord(const std::string& key, std::vector<Byte>* payload) {
    std::string value;
    Status s = db_.Get(db::Slice(key), &value);
    if (!s.ok()) {
        return s;
    }
    return DecodeRecord(key, value, payload);
}

Status StateStore::ReadPrefix(char keyPrefix, std::vector<std::vector<Byte>>* payloads) {
    std::string start = db::MakeKey(keyPrefix);
    auto it = db_.NewIterator();
    for (it->Seek(db::Slice(start)); it->Valid(); it->Next()) {
        db::Slice key = it->key();
        if (!key.starts_with(db::Slice(start))) {
            break;
        }
        std::vector<Byte> payload;
        Status s = DecodeRecord(key.ToString(), it->value().ToString(), &payload);
        if (!s.ok()) {
            return Status::Corruption(std::string("record under '") + keyPrefix + "': " +
                                      s.message());
        }
        payloads->push_back(std::move(payload));
    }
    return it->status();
}

Status StateStore::CollectKeys(char keyPrefix, std::vector<std::string>* keys) {
    std::string start = db::MakeKey(keyPrefix);
    auto it = db_.NewIterator();
    for (it->Seek(db::Slice(start)); it->Valid(); it->Next()) {
        db::Slice key = it->key();
        if (!key.starts_with(db::Slice(start))) {
            break;
        }
        keys->push_back(key.ToString());
    }
    return it->status();
}

// ============================================================================
// Save / Load
// ============================================================================

Status StateStore::Save(const governance::GovernanceState& state) {
    util::ScopedLogTimer timer(util::LogCategory::STORE, "state save");
    
    db::WriteBatch batch;
    
    // Drop records of the previous save; puts below recreate live ones
    for (char keyPrefix : {prefix::STAKE, prefix::POLL, prefix::VOTE}) {
        std::vector<std::string> stale;
        Status s = CollectKeys(keyPrefix, &stale);
        if (!s.ok()) {
            return s;
        }
        for (const auto& key : stale) {
            batch.Delete(db::Slice(key));
        }
    }
    
    StateMeta meta;
    meta.height = state.height;
    meta.nextPollId = state.nextPollId;
    PutRecord(batch, MetaKey(), meta.Serialize());
    PutRecord(batch, db::MakeKey(prefix::PARAMS), state.params.Serialize());
    PutRecord(batch, db::MakeKey(prefix::REWARD_INDEX), state.rewardIndex.Serialize());
    
    for (const auto& stake : state.stakes) {
        PutRecord(batch, StakeKey(stake.account), stake.Serialize());
    }
    for (const auto& poll : state.polls) {
        PutRecord(batch, PollKey(poll.id), poll.Serialize());
    }
    for (const auto& vote : state.votes) {
        PutRecord(batch, VoteKey(vote.pollId, vote.voter), vote.Serialize());
    }
    
    db::WriteOptions options;
    options.sync = true;
    Status s = db_.Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "State save failed: " << s.ToString();
        return s;
    }
    
    LOG_INFO(util::LogCategory::STORE) << "Saved state at height " << state.height << " ("
                                       << state.stakes.size() << " stakes, "
                                       << state.polls.size() << " polls, "
                                       << state.votes.size() << " votes)";
    return Status::Ok();
}

Status StateStore::Load(governance::GovernanceState* out) {
    util::ScopedLogTimer timer(util::LogCategory::STORE, "state load");
    
    std::vector<Byte> payload;
    Status s = ReadRecord(MetaKey(), &payload);
    if (!s.ok()) {
        return s.code() == Status::NOT_FOUND ? Status::NotFound("no saved state") : s;
    }
    
    auto meta = StateMeta::Deserialize(payload.data(), payload.size());
    if (!meta) {
        return Status::Corruption("undecodable meta record");
    }
    if (meta->version != STATE_FORMAT_VERSION) {
        return Status::NotSupported("state format version " + std::to_string(meta->version));
    }
    
    governance::GovernanceState state;
    state.height = meta->height;
    state.nextPollId = meta->nextPollId;
    
    s = ReadRecord(db::MakeKey(prefix::PARAMS), &payload);
    if (!s.ok()) {
        return s.code() == Status::NOT_FOUND ? Status::Corruption("missing parameters") : s;
    }
    auto params = governance::GovernanceParams::Deserialize(payload.data(), payload.size());
    if (!params) {
        return Status::Corruption("undecodable parameters");
    }
    state.params = *params;
    
    s = ReadRecord(db::MakeKey(prefix::REWARD_INDEX), &payload);
    if (!s.ok()) {
        return s.code() == Status::NOT_FOUND ? Status::Corruption("missing reward index") : s;
    }
    auto index = staking::RewardIndex::Deserialize(payload.data(), payload.size());
    if (!index) {
        return Status::Corruption("undecodable reward index");
    }
    state.rewardIndex = *index;
    
    std::vector<std::vector<Byte>> records;
    s = ReadPrefix(prefix::STAKE, &records);
    if (!s.ok()) {
        return s;
    }
    Amount stakeSum = 0;
    for (const auto& record : records) {
        auto stake = staking::StakeInfo::Deserialize(record.data(), record.size());
        if (!stake) {
            return Status::Corruption("undecodable stake record");
        }
        stakeSum += stake->amount;
        state.stakes.push_back(*stake);
    }
    if (stakeSum != state.rewardIndex.totalStaked) {
        return Status::Corruption("stakes sum to " + std::to_string(stakeSum) +
                                  " but the index records " +
                                  std::to_string(state.rewardIndex.totalStaked));
    }
    
    records.clear();
    s = ReadPrefix(prefix::POLL, &records);
    if (!s.ok()) {
        return s;
    }
    for (const auto& record : records) {
        auto poll = governance::Poll::Deserialize(record.data(), record.size());
        if (!poll) {
            return Status::Corruption("undecodable poll record");
        }
        state.polls.push_back(std::move(*poll));
    }
    
    records.clear();
    s = ReadPrefix(prefix::VOTE, &records);
    if (!s.ok()) {
        return s;
    }
    std::map<governance::PollId, Amount> powers;
    for (const auto& record : records) {
        auto vote = governance::Vote::Deserialize(record.data(), record.size());
        if (!vote) {
            return Status::Corruption("undecodable vote record");
        }
        powers[vote->pollId] += vote->power;
        state.votes.push_back(*vote);
    }
    for (const auto& poll : state.polls) {
        if (poll.TotalVotes() != powers[poll.id]) {
            return Status::Corruption("tallies of poll " + std::to_string(poll.id) +
                                      " disagree with its votes");
        }
    }
    
    LOG_INFO(util::LogCategory::STORE) << "Loaded state at height " << state.height;
    *out = std::move(state);
    return Status::Ok();
}

bool StateStore::HasState() {
    std::string value;
    return db_.Get(db::Slice(MetaKey()), &value).ok();
}

Status StateStore::SaveContract(const governance::GovernanceContract& contract) {
    return Save(contract.ExportState());
}

Status StateStore::LoadContract(governance::GovernanceContract& contract) {
    governance::GovernanceState state;
    Status s = Load(&state);
    if (!s.ok()) {
        return s;
    }
    return contract.ImportState(state);
}

} // namespace store
} // namespace agora
