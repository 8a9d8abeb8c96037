// STAKEVOTE - Voting State Store Implementation
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License

#include "stakevote/voting/store.h"
#include "stakevote/util/logging.h"

#include <map>

namespace stakevote {
namespace voting {

using db::MakeKey;
namespace prefix = db::prefix;

namespace {

/// Decode the part of a key after its prefix byte; false on malformed keys
template<typename... Ts>
bool DecodeKey(const std::string& key, Ts&... parts) {
    if (key.size() < 1) {
        return false;
    }
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(key.data()) + 1, key.size() - 1);
        (Unserialize(ss, parts), ...);
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

/// Visit every (key, value) whose key starts with prefix, in key order
template<typename Func>
db::Status ForEachWithPrefix(db::Database& database, char keyPrefix, Func&& func) {
    const std::string start(1, keyPrefix);
    std::unique_ptr<db::Iterator> it = database.NewIterator();

    for (it->Seek(db::Slice(start)); it->Valid(); it->Next()) {
        db::Slice key = it->key();
        if (key.empty() || key[0] != keyPrefix) {
            break;
        }
        db::Status s = func(key.ToString(), it->value().ToString());
        if (!s.ok()) {
            return s;
        }
    }
    return it->status();
}

db::Status BadRecord(const char* what, const std::string& key) {
    std::string hex;
    static const char digits[] = "0123456789abcdef";
    for (unsigned char c : key) {
        hex.push_back(digits[c >> 4]);
        hex.push_back(digits[c & 0x0F]);
    }
    return db::Status::Corruption(std::string("bad ") + what + " record " + hex);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

VotingStore::VotingStore(std::unique_ptr<db::Database> database)
    : db_(std::move(database)) {}

std::pair<db::Status, std::unique_ptr<VotingStore>> VotingStore::Open(
    const std::filesystem::path& path,
    const db::Options& options)
{
    auto [status, database] = db::OpenDatabase(path, options);
    if (!status.ok()) {
        return {status, nullptr};
    }
    return {db::Status::Ok(), std::make_unique<VotingStore>(std::move(database))};
}

// ============================================================================
// Voting State
// ============================================================================

db::Status VotingStore::Commit(const StateDelta& delta) {
    if (delta.Empty()) {
        return db::Status::Ok();
    }

    db::WriteBatch batch;

    if (delta.project) {
        batch.Put(MakeKey(prefix::PROJECT, delta.project->id),
                  db::SerializeToString(*delta.project));
    }
    if (delta.stake) {
        const StakeKey& key = delta.stake->first;
        batch.Put(MakeKey(prefix::STAKE, key.first, key.second),
                  db::SerializeToString(delta.stake->second));
    }
    if (delta.appendVoter) {
        batch.Put(MakeKey(prefix::VOTER, delta.appendVoter->projectId,
                          delta.appendVoter->index),
                  db::SerializeToString(delta.appendVoter->voter));
    }
    if (delta.totalStaked) {
        std::string key = MakeKey(prefix::TOTAL_STAKED, delta.totalStaked->first);
        if (delta.totalStaked->second == 0) {
            batch.Delete(key);
        } else {
            batch.Put(key, db::SerializeToString(delta.totalStaked->second));
        }
    }
    if (delta.nextProjectId) {
        batch.Put(MakeKey(prefix::NEXT_ID), db::SerializeToString(*delta.nextProjectId));
    }

    std::lock_guard<std::mutex> lock(writeMutex_);
    if (delta.ledgerState) {
        StageLedger(*delta.ledgerState, batch);
    }
    db::Status s = db_->Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Commit of " << batch.Count()
                                         << " records failed: " << s.ToString();
        return s;
    }
    ++commits_;
    return s;
}

void VotingStore::ClearPrefix(char keyPrefix, db::WriteBatch& batch) const {
    std::unique_ptr<db::Iterator> it = db_->NewIterator();
    const std::string start(1, keyPrefix);
    for (it->Seek(db::Slice(start)); it->Valid(); it->Next()) {
        db::Slice key = it->key();
        if (key.empty() || key[0] != keyPrefix) {
            break;
        }
        batch.Delete(key);
    }
}

db::Status VotingStore::Load(VotingState& state) const {
    VotingState loaded;
    std::string value;

    db::Status s = db_->Get(MakeKey(prefix::NEXT_ID), &value);
    if (s.ok()) {
        if (!db::DeserializeFromString(value, loaded.nextProjectId)) {
            return BadRecord("next-id", MakeKey(prefix::NEXT_ID));
        }
    } else if (!s.IsNotFound()) {
        return s;
    }

    s = ForEachWithPrefix(*db_, prefix::PROJECT,
        [&](const std::string& key, const std::string& data) {
            ProjectId id = 0;
            Project project;
            if (!DecodeKey(key, id) || !db::DeserializeFromString(data, project) ||
                project.id != id) {
                return BadRecord("project", key);
            }
            loaded.projects.emplace(id, std::move(project));
            return db::Status::Ok();
        });
    if (!s.ok()) return s;

    s = ForEachWithPrefix(*db_, prefix::STAKE,
        [&](const std::string& key, const std::string& data) {
            ProjectId id = 0;
            Address voter;
            StakeRecord record;
            if (!DecodeKey(key, id, voter) || !db::DeserializeFromString(data, record)) {
                return BadRecord("stake", key);
            }
            loaded.stakes.emplace(StakeKey(id, voter), record);
            return db::Status::Ok();
        });
    if (!s.ok()) return s;

    // Keys are not in numeric order, so collect positions before building lists
    std::map<ProjectId, std::map<uint32_t, Address>> positions;
    s = ForEachWithPrefix(*db_, prefix::VOTER,
        [&](const std::string& key, const std::string& data) {
            ProjectId id = 0;
            uint32_t index = 0;
            Address voter;
            if (!DecodeKey(key, id, index) || !db::DeserializeFromString(data, voter)) {
                return BadRecord("voter", key);
            }
            positions[id][index] = voter;
            return db::Status::Ok();
        });
    if (!s.ok()) return s;

    for (const auto& [id, byIndex] : positions) {
        std::vector<Address>& list = loaded.voters[id];
        for (const auto& [index, voter] : byIndex) {
            if (index != list.size()) {
                return db::Status::Corruption("gap in voter list of project " +
                                              std::to_string(id));
            }
            list.push_back(voter);
        }
    }

    s = ForEachWithPrefix(*db_, prefix::TOTAL_STAKED,
        [&](const std::string& key, const std::string& data) {
            Address owner;
            Amount amount = 0;
            if (!DecodeKey(key, owner) || !db::DeserializeFromString(data, amount) ||
                !MoneyRange(amount)) {
                return BadRecord("total-staked", key);
            }
            loaded.totalStaked[owner] = amount;
            return db::Status::Ok();
        });
    if (!s.ok()) return s;

    if (!loaded.IsConsistent()) {
        return db::Status::Corruption("voting records are inconsistent");
    }

    LOG_INFO(util::LogCategory::DB) << "Loaded " << loaded.projects.size() << " projects, "
                                    << loaded.stakes.size() << " stakes";
    state = std::move(loaded);
    return db::Status::Ok();
}

// ============================================================================
// Reference Ledger
// ============================================================================

void VotingStore::StageLedger(const ledger::LedgerSnapshot& snapshot,
                              db::WriteBatch& batch) const {
    ClearPrefix(prefix::BALANCE, batch);
    ClearPrefix(prefix::ALLOWANCE, batch);

    for (const auto& [owner, balance] : snapshot.balances) {
        if (balance != 0) {
            batch.Put(MakeKey(prefix::BALANCE, owner), db::SerializeToString(balance));
        }
    }
    for (const auto& [pair, allowance] : snapshot.allowances) {
        if (allowance != 0) {
            batch.Put(MakeKey(prefix::ALLOWANCE, pair.first, pair.second),
                      db::SerializeToString(allowance));
        }
    }
    batch.Put(MakeKey(prefix::TOTAL_SUPPLY), db::SerializeToString(snapshot.totalSupply));
}

db::Status VotingStore::SaveLedger(const ledger::LedgerSnapshot& snapshot) {
    db::WriteBatch batch;

    std::lock_guard<std::mutex> lock(writeMutex_);
    StageLedger(snapshot, batch);

    db::Status s = db_->Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Saving ledger failed: " << s.ToString();
    }
    return s;
}

db::Status VotingStore::LoadLedger(ledger::LedgerSnapshot& snapshot) const {
    ledger::LedgerSnapshot loaded;
    std::string value;

    db::Status s = db_->Get(MakeKey(prefix::TOTAL_SUPPLY), &value);
    if (s.ok()) {
        if (!db::DeserializeFromString(value, loaded.totalSupply) ||
            !MoneyRange(loaded.totalSupply)) {
            return BadRecord("total-supply", MakeKey(prefix::TOTAL_SUPPLY));
        }
    } else if (!s.IsNotFound()) {
        return s;
    }

    Amount sum = 0;
    s = ForEachWithPrefix(*db_, prefix::BALANCE,
        [&](const std::string& key, const std::string& data) {
            Address owner;
            Amount balance = 0;
            if (!DecodeKey(key, owner) || !db::DeserializeFromString(data, balance) ||
                balance <= 0 || balance > MAX_MONEY - sum) {
                return BadRecord("balance", key);
            }
            sum += balance;
            loaded.balances[owner] = balance;
            return db::Status::Ok();
        });
    if (!s.ok()) return s;

    s = ForEachWithPrefix(*db_, prefix::ALLOWANCE,
        [&](const std::string& key, const std::string& data) {
            Address owner;
            Address spender;
            Amount allowance = 0;
            if (!DecodeKey(key, owner, spender) ||
                !db::DeserializeFromString(data, allowance) || !MoneyRange(allowance)) {
                return BadRecord("allowance", key);
            }
            loaded.allowances[{owner, spender}] = allowance;
            return db::Status::Ok();
        });
    if (!s.ok()) return s;

    if (sum != loaded.totalSupply) {
        return db::Status::Corruption("ledger balances do not add up to total supply");
    }

    snapshot = std::move(loaded);
    return db::Status::Ok();
}

} // namespace voting
} // namespace stakevote
