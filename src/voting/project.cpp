// STAKEVOTE - Project Registry Types Implementation
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License

#include "stakevote/voting/project.h"
#include "stakevote/util/time.h"

#include <algorithm>
#include <set>
#include <sstream>

namespace stakevote {
namespace voting {

const char* ProjectStatusToString(ProjectStatus status) {
    switch (status) {
        case ProjectStatus::Pending: return "Pending";
        case ProjectStatus::Voting: return "Voting";
        case ProjectStatus::AwaitingFinalization: return "AwaitingFinalization";
        case ProjectStatus::Finalized: return "Finalized";
        case ProjectStatus::Deactivated: return "Deactivated";
        default: return "Unknown";
    }
}

// ============================================================================
// Project
// ============================================================================

ProjectStatus Project::GetStatus(Timestamp now) const {
    if (isFinalized) {
        return ProjectStatus::Finalized;
    }
    if (!isActive) {
        return ProjectStatus::Deactivated;
    }
    if (now < startTime) {
        return ProjectStatus::Pending;
    }
    if (now <= endTime) {
        return ProjectStatus::Voting;
    }
    return ProjectStatus::AwaitingFinalization;
}

bool Project::IsConsistent() const {
    if (id < FIRST_PROJECT_ID || endTime <= startTime) {
        return false;
    }
    if (!MoneyRange(totalVotes)) {
        return false;
    }
    if (isFinalized) {
        // A project is only finalized with votes cast, so there is a winner
        return !isActive && !winner.IsNull() && totalVotes > 0;
    }
    return winner.IsNull();
}

std::string Project::ToString() const {
    std::ostringstream ss;
    ss << "Project {"
       << " id: " << id
       << ", name: \"" << name << "\""
       << ", window: " << util::FormatISO8601(startTime)
       << " .. " << util::FormatISO8601(endTime)
       << ", totalVotes: " << totalVotes
       << ", active: " << (isActive ? "yes" : "no")
       << ", finalized: " << (isFinalized ? "yes" : "no");
    if (isFinalized) {
        ss << ", winner: " << winner.ToHex();
    }
    ss << " }";
    return ss.str();
}

// ============================================================================
// Stake Record
// ============================================================================

std::string StakeRecord::ToString() const {
    std::ostringstream ss;
    ss << "Stake {"
       << " amount: " << amount
       << ", lastStakeTime: " << lastStakeTime
       << ", unstaked: " << (hasUnstaked ? "yes" : "no")
       << " }";
    return ss.str();
}

// ============================================================================
// Voting State
// ============================================================================

bool VotingState::IsConsistent() const {
    if (nextProjectId < FIRST_PROJECT_ID) {
        return false;
    }

    for (const auto& [id, project] : projects) {
        if (project.id != id || id >= nextProjectId || !project.IsConsistent()) {
            return false;
        }
    }

    // Every stake belongs to a known project and its owner is listed once
    std::map<Address, Amount> outstanding;
    for (const auto& [key, record] : stakes) {
        if (projects.count(key.first) == 0 || record.amount <= 0) {
            return false;
        }
        auto it = voters.find(key.first);
        if (it == voters.end() ||
            std::find(it->second.begin(), it->second.end(), key.second) == it->second.end()) {
            return false;
        }
        if (!record.hasUnstaked) {
            outstanding[key.second] += record.amount;
        }
    }

    for (const auto& [id, list] : voters) {
        std::set<Address> seen(list.begin(), list.end());
        if (seen.size() != list.size()) {
            return false;
        }
        for (const auto& voter : list) {
            if (stakes.count({id, voter}) == 0) {
                return false;
            }
        }
    }

    for (const auto& [addr, amount] : totalStaked) {
        auto it = outstanding.find(addr);
        Amount expected = it == outstanding.end() ? 0 : it->second;
        if (amount != expected) {
            return false;
        }
    }
    for (const auto& [addr, amount] : outstanding) {
        auto it = totalStaked.find(addr);
        if (it == totalStaked.end() || it->second != amount) {
            return false;
        }
    }

    return true;
}

} // namespace voting
} // namespace stakevote
