// STAKEVOTE - Voting Engine
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License
//
// Token-weighted project voting.
//
// Key features:
// - Admin-created projects with a fixed voting window
// - Stakes pulled from participants through the token ledger
// - Admin finalization picking the largest stake (earliest voter on ties)
// - Withdrawal paying the winner twice their stake, principal to the rest
// - Reentrancy guard around every mutating call
// - Events after every committed operation

#ifndef STAKEVOTE_VOTING_ENGINE_H
#define STAKEVOTE_VOTING_ENGINE_H

#include "stakevote/core/types.h"
#include "stakevote/ledger/ledger.h"
#include "stakevote/voting/project.h"
#include "stakevote/voting/store.h"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace stakevote {

namespace util {
class ConfigManager;
}

namespace voting {

// ============================================================================
// Errors
// ============================================================================

/// Outcome of an engine operation
enum class VoteError {
    OK,
    NotFound,
    InvalidSchedule,
    ProjectNotActive,
    ProjectAlreadyFinalized,
    InvalidVotingPeriod,
    VotingPeriodNotEnded,
    InsufficientAllowance,
    NoVotesCast,
    AlreadyUnstaked,
    ProjectNotFinalized,
    Unauthorized,
    ReentrantCall,
    InvalidAmount,
    PayoutFailed,
    StorageError
};

const char* VoteErrorToString(VoteError error);

// ============================================================================
// Events
// ============================================================================

enum class VotingEventType {
    ProjectCreated,
    VoteCast,
    ProjectFinalized,
    TokensUnstaked
};

const char* VotingEventTypeToString(VotingEventType type);

/**
 * Notification of a committed operation.
 *
 * Field use by type:
 *  ProjectCreated   - name, startTime, endTime
 *  VoteCast         - participant, amount (this vote), total (new stake)
 *  ProjectFinalized - participant (winner), total (totalVotes)
 *  TokensUnstaked   - participant, amount (payout), isWinner
 */
struct VotingEvent {
    VotingEventType type{VotingEventType::ProjectCreated};
    ProjectId projectId{0};
    Address participant;
    Amount amount{0};
    Amount total{0};
    std::string name;
    Timestamp startTime{0};
    Timestamp endTime{0};
    bool isWinner{false};

    std::string ToString() const;
};

// ============================================================================
// Configuration
// ============================================================================

struct EngineConfig {
    /// Only this address may create and finalize projects
    Address admin;

    /// Ledger account that holds staked tokens
    Address custody;

    /// Keep state in the datadir database
    bool persist{true};
};

/**
 * Read the [engine] section.
 * @param error Set to a description when the section is invalid
 * @return nullopt if admin or custody is missing or malformed
 */
std::optional<EngineConfig> LoadEngineConfig(const util::ConfigManager& config,
                                             std::string* error = nullptr);

// ============================================================================
// Voting Engine
// ============================================================================

class VotingEngine {
public:
    using EventCallback = std::function<void(const VotingEvent&)>;

    /**
     * @param admin Address allowed to create and finalize projects
     * @param ledger Token collaborator for stakes and payouts
     * @param store Optional persistence; every operation commits to it, along
     *              with the ledger's Checkpoint() when tokens move
     */
    VotingEngine(const Address& admin,
                 std::shared_ptr<ledger::ITokenLedger> ledger,
                 std::shared_ptr<VotingStore> store = nullptr);

    VotingEngine(const VotingEngine&) = delete;
    VotingEngine& operator=(const VotingEngine&) = delete;

    /// Replace the in-memory state, e.g. with one read by VotingStore::Load
    /// @return false if the state is inconsistent (nothing is changed)
    bool Restore(const VotingState& state);

    // ========================================================================
    // Mutating Operations
    // ========================================================================

    /**
     * Create a project whose window is [startTime, startTime + duration].
     * Admin only. startTime must lie in the future and duration be positive.
     */
    VoteError CreateProject(const Address& caller,
                            const std::string& name,
                            const std::string& description,
                            Timestamp startTime,
                            int64_t duration,
                            Timestamp now,
                            ProjectId* outId = nullptr);

    /// Stake amount on a project during its window
    VoteError Vote(const Address& caller, ProjectId projectId, Amount amount, Timestamp now);

    /// Close a project after its window and select the winner. Admin only.
    VoteError FinalizeProject(const Address& caller, ProjectId projectId, Timestamp now);

    /// Withdraw the caller's stake (doubled for the winner)
    VoteError UnstakeTokens(const Address& caller, ProjectId projectId, Timestamp now,
                            Amount* outPayout = nullptr);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<Project> GetProject(ProjectId projectId, VoteError* error = nullptr) const;

    size_t GetTotalProjects() const;

    /// Voters in order of their first stake; empty for unknown projects
    std::vector<Address> GetVoters(ProjectId projectId) const;

    /// What UnstakeTokens would pay at now (0 when it would fail)
    Amount GetUnstakeableBalance(ProjectId projectId, const Address& participant,
                                 Timestamp now) const;

    std::optional<StakeRecord> GetStake(ProjectId projectId, const Address& participant) const;

    /// Sum of the participant's stakes not yet withdrawn
    Amount GetTotalStaked(const Address& participant) const;

    const Address& GetAdmin() const { return admin_; }

    bool IsAdmin(const Address& addr) const { return addr == admin_; }

    /// Copy of the whole state
    VotingState GetState() const;

    // ========================================================================
    // Events
    // ========================================================================

    /**
     * Register a callback; returns a handle for Unsubscribe.
     *
     * Callbacks run outside the engine lock, one at a time, in commit order.
     * When calls race, an event may be delivered on the thread of a later
     * call after its own call has returned.
     */
    uint64_t Subscribe(EventCallback callback);

    void Unsubscribe(uint64_t handle);

private:
    class GuardScope;

    /// Lock for reads; skipped when this thread is inside a mutating call
    std::unique_lock<std::mutex> LockForRead() const;

    bool InGuardedCall() const;

    VoteError CreateProjectLocked(const Address& caller, const std::string& name,
                                  const std::string& description, Timestamp startTime,
                                  int64_t duration, Timestamp now, ProjectId& outId,
                                  std::vector<VotingEvent>& events);
    VoteError VoteLocked(const Address& caller, ProjectId projectId, Amount amount,
                         Timestamp now, std::vector<VotingEvent>& events);
    VoteError FinalizeLocked(const Address& caller, ProjectId projectId, Timestamp now,
                             std::vector<VotingEvent>& events);
    VoteError UnstakeLocked(const Address& caller, ProjectId projectId, Timestamp now,
                            Amount& outPayout, std::vector<VotingEvent>& events);

    /// Payout if caller could withdraw now, or the reason it cannot
    VoteError ComputePayout(ProjectId projectId, const Address& participant,
                            Timestamp now, Amount& payout, bool& isWinner) const;

    Amount TotalStakedLocked(const Address& participant) const;

    /// Write a delta if a store is attached
    bool Persist(const StateDelta& delta);

    /// Append to the delivery queue; called with mutex_ held so the queue
    /// follows commit order
    void QueueEvents(std::vector<VotingEvent>& events);

    /// Deliver queued events unless another call is already delivering
    void Publish();

    const Address admin_;
    std::shared_ptr<ledger::ITokenLedger> ledger_;
    std::shared_ptr<VotingStore> store_;

    VotingState state_;
    mutable std::mutex mutex_;

    /// Thread currently inside a mutating call (default id when none)
    std::atomic<std::thread::id> guardOwner_{};

    std::deque<VotingEvent> pendingEvents_;
    bool dispatching_{false};
    std::mutex eventsMutex_;

    std::map<uint64_t, EventCallback> subscribers_;
    uint64_t nextSubscriberId_{1};
    mutable std::mutex subscribersMutex_;
};

} // namespace voting
} // namespace stakevote

#endif // STAKEVOTE_VOTING_ENGINE_H
