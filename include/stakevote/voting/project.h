// STAKEVOTE - Project Registry Types
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License
//
// Projects, per-participant stake records and the aggregate voting state
// that the engine mutates and the store persists.

#ifndef STAKEVOTE_VOTING_PROJECT_H
#define STAKEVOTE_VOTING_PROJECT_H

#include "stakevote/core/types.h"
#include "stakevote/core/serialize.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace stakevote {
namespace voting {

// ============================================================================
// Constants
// ============================================================================

/// The winner withdraws this multiple of their stake
constexpr Amount WINNER_PAYOUT_MULTIPLIER = 2;

/// First id handed out by CreateProject
constexpr ProjectId FIRST_PROJECT_ID = 1;

/// Record format version written in front of persisted records
constexpr uint8_t RECORD_VERSION = 1;

// ============================================================================
// Project Status
// ============================================================================

/// Display status derived from the lifecycle flags and the clock
enum class ProjectStatus {
    /// Active, voting window not yet open
    Pending,

    /// Active, inside [startTime, endTime]
    Voting,

    /// Active, window closed, waiting for the admin
    AwaitingFinalization,

    /// Winner selected, withdrawals open
    Finalized,

    /// Inactive without finalization (only reachable from stored records)
    Deactivated
};

const char* ProjectStatusToString(ProjectStatus status);

// ============================================================================
// Project
// ============================================================================

struct Project {
    ProjectId id{0};
    std::string name;
    std::string description;
    Timestamp startTime{0};
    Timestamp endTime{0};

    /// Sum of every stake cast, never decreases
    Amount totalVotes{0};

    bool isActive{false};
    bool isFinalized{false};

    /// Null until finalization
    Address winner;

    /// startTime <= now <= endTime
    bool IsVotingOpen(Timestamp now) const {
        return now >= startTime && now <= endTime;
    }

    /// now > endTime
    bool HasEnded(Timestamp now) const { return now > endTime; }

    ProjectStatus GetStatus(Timestamp now) const;

    /// Field-level invariants that must hold for any stored project
    bool IsConsistent() const;

    std::string ToString() const;
};

// ============================================================================
// Stake Record
// ============================================================================

/// One participant's stake on one project
struct StakeRecord {
    /// Cumulative amount staked
    Amount amount{0};

    Timestamp lastStakeTime{0};

    bool hasUnstaked{false};

    std::string ToString() const;
};

using StakeKey = std::pair<ProjectId, Address>;

// ============================================================================
// Voting State
// ============================================================================

/**
 * Everything the engine owns. Copyable, so a loaded snapshot can be
 * handed to an engine and an engine's state can be inspected in tests.
 */
struct VotingState {
    ProjectId nextProjectId{FIRST_PROJECT_ID};
    std::map<ProjectId, Project> projects;
    std::map<StakeKey, StakeRecord> stakes;

    /// Voters per project in order of their first stake
    std::map<ProjectId, std::vector<Address>> voters;

    /// Amount each participant has staked and not yet withdrawn
    std::map<Address, Amount> totalStaked;

    /// Cross-record checks (voter lists match stakes, ids below nextProjectId)
    bool IsConsistent() const;
};

// ============================================================================
// Serialization
// ============================================================================

using stakevote::Serialize;
using stakevote::Unserialize;

template<typename Stream>
void Serialize(Stream& s, const Project& p) {
    Serialize(s, RECORD_VERSION);
    Serialize(s, p.id);
    Serialize(s, p.name);
    Serialize(s, p.description);
    Serialize(s, p.startTime);
    Serialize(s, p.endTime);
    Serialize(s, p.totalVotes);
    Serialize(s, p.isActive);
    Serialize(s, p.isFinalized);
    Serialize(s, p.winner);
}

template<typename Stream>
void Unserialize(Stream& s, Project& p) {
    uint8_t version;
    Unserialize(s, version);
    if (version != RECORD_VERSION) {
        throw std::ios_base::failure("Project: unknown record version");
    }
    Unserialize(s, p.id);
    Unserialize(s, p.name);
    Unserialize(s, p.description);
    Unserialize(s, p.startTime);
    Unserialize(s, p.endTime);
    Unserialize(s, p.totalVotes);
    Unserialize(s, p.isActive);
    Unserialize(s, p.isFinalized);
    Unserialize(s, p.winner);
}

template<typename Stream>
void Serialize(Stream& s, const StakeRecord& r) {
    Serialize(s, RECORD_VERSION);
    Serialize(s, r.amount);
    Serialize(s, r.lastStakeTime);
    Serialize(s, r.hasUnstaked);
}

template<typename Stream>
void Unserialize(Stream& s, StakeRecord& r) {
    uint8_t version;
    Unserialize(s, version);
    if (version != RECORD_VERSION) {
        throw std::ios_base::failure("StakeRecord: unknown record version");
    }
    Unserialize(s, r.amount);
    Unserialize(s, r.lastStakeTime);
    Unserialize(s, r.hasUnstaked);
}

} // namespace voting
} // namespace stakevote

#endif // STAKEVOTE_VOTING_PROJECT_H
