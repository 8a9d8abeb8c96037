// STAKEVOTE - Voting State Store
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License
//
// Persists engine and reference-ledger state on the key-value database.

#ifndef STAKEVOTE_VOTING_STORE_H
#define STAKEVOTE_VOTING_STORE_H

#include "stakevote/db/database.h"
#include "stakevote/ledger/ledger.h"
#include "stakevote/voting/project.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace stakevote {
namespace voting {

// ============================================================================
// State Delta
// ============================================================================

/// Records touched by one engine operation, written as one batch
struct StateDelta {
    std::optional<Project> project;
    std::optional<std::pair<StakeKey, StakeRecord>> stake;

    /// (project, position in the voter list, voter)
    struct VoterEntry {
        ProjectId projectId{0};
        uint32_t index{0};
        Address voter;
    };
    std::optional<VoterEntry> appendVoter;

    std::optional<std::pair<Address, Amount>> totalStaked;
    std::optional<ProjectId> nextProjectId;

    /// Ledger contents after the operation's token movement
    std::optional<ledger::LedgerSnapshot> ledgerState;

    bool Empty() const {
        return !project && !stake && !appendVoter && !totalStaked &&
               !nextProjectId && !ledgerState;
    }
};

// ============================================================================
// Voting Store
// ============================================================================

/**
 * Durable home of the voting state.
 *
 * Each Commit() is a single atomic write batch covering the voting records
 * and, when the delta carries one, the ledger, so a crash never leaves a
 * half-applied operation. Load() validates every record and the
 * cross-record invariants and reports Corruption otherwise.
 */
class VotingStore {
public:
    explicit VotingStore(std::unique_ptr<db::Database> database);

    VotingStore(const VotingStore&) = delete;
    VotingStore& operator=(const VotingStore&) = delete;

    /// Open (or create) the database at path
    static std::pair<db::Status, std::unique_ptr<VotingStore>> Open(
        const std::filesystem::path& path,
        const db::Options& options = db::Options());

    // ========================================================================
    // Voting State
    // ========================================================================

    db::Status Commit(const StateDelta& delta);

    /// Rebuild the voting state; an empty database yields a fresh state
    db::Status Load(VotingState& state) const;

    // ========================================================================
    // Reference Ledger
    // ========================================================================

    /// Replace the persisted ledger contents with snapshot
    db::Status SaveLedger(const ledger::LedgerSnapshot& snapshot);

    db::Status LoadLedger(ledger::LedgerSnapshot& snapshot) const;

    // ========================================================================
    // Statistics
    // ========================================================================

    uint64_t GetCommitCount() const { return commits_.load(); }

    db::Database* GetDatabase() const { return db_.get(); }

private:
    void ClearPrefix(char prefix, db::WriteBatch& batch) const;

    /// Add records replacing the stored ledger; caller holds writeMutex_
    void StageLedger(const ledger::LedgerSnapshot& snapshot, db::WriteBatch& batch) const;

    std::unique_ptr<db::Database> db_;
    std::mutex writeMutex_;
    std::atomic<uint64_t> commits_{0};
};

} // namespace voting
} // namespace stakevote

#endif // STAKEVOTE_VOTING_STORE_H
