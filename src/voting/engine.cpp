// STAKEVOTE - Voting Engine Implementation
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License

#include "stakevote/voting/engine.h"
#include "stakevote/util/config.h"
#include "stakevote/util/logging.h"
#include "stakevote/util/time.h"

#include <limits>
#include <sstream>

namespace stakevote {
namespace voting {

// ============================================================================
// Errors and Events
// ============================================================================

const char* VoteErrorToString(VoteError error) {
    switch (error) {
        case VoteError::OK: return "OK";
        case VoteError::NotFound: return "NotFound";
        case VoteError::InvalidSchedule: return "InvalidSchedule";
        case VoteError::ProjectNotActive: return "ProjectNotActive";
        case VoteError::ProjectAlreadyFinalized: return "ProjectAlreadyFinalized";
        case VoteError::InvalidVotingPeriod: return "InvalidVotingPeriod";
        case VoteError::VotingPeriodNotEnded: return "VotingPeriodNotEnded";
        case VoteError::InsufficientAllowance: return "InsufficientAllowance";
        case VoteError::NoVotesCast: return "NoVotesCast";
        case VoteError::AlreadyUnstaked: return "AlreadyUnstaked";
        case VoteError::ProjectNotFinalized: return "ProjectNotFinalized";
        case VoteError::Unauthorized: return "Unauthorized";
        case VoteError::ReentrantCall: return "ReentrantCall";
        case VoteError::InvalidAmount: return "InvalidAmount";
        case VoteError::PayoutFailed: return "PayoutFailed";
        case VoteError::StorageError: return "StorageError";
        default: return "Unknown";
    }
}

const char* VotingEventTypeToString(VotingEventType type) {
    switch (type) {
        case VotingEventType::ProjectCreated: return "ProjectCreated";
        case VotingEventType::VoteCast: return "VoteCast";
        case VotingEventType::ProjectFinalized: return "ProjectFinalized";
        case VotingEventType::TokensUnstaked: return "TokensUnstaked";
        default: return "Unknown";
    }
}

std::string VotingEvent::ToString() const {
    std::ostringstream ss;
    ss << VotingEventTypeToString(type) << " { project: " << projectId;
    switch (type) {
        case VotingEventType::ProjectCreated:
            ss << ", name: \"" << name << "\""
               << ", window: " << util::FormatISO8601(startTime)
               << " .. " << util::FormatISO8601(endTime);
            break;
        case VotingEventType::VoteCast:
            ss << ", voter: " << participant.ToHex()
               << ", amount: " << amount
               << ", stake: " << total;
            break;
        case VotingEventType::ProjectFinalized:
            ss << ", winner: " << participant.ToHex()
               << ", totalVotes: " << total;
            break;
        case VotingEventType::TokensUnstaked:
            ss << ", voter: " << participant.ToHex()
               << ", payout: " << amount
               << ", winner: " << (isWinner ? "yes" : "no");
            break;
    }
    ss << " }";
    return ss.str();
}

// ============================================================================
// Configuration
// ============================================================================

namespace {

bool ReadAddress(const util::ConfigManager& config, const char* key,
                 Address& out, std::string* error) {
    using util::ConfigKeys::ENGINE_SECTION;

    auto value = config.TryGetString(key, ENGINE_SECTION);
    if (!value || value->empty()) {
        if (error) *error = std::string(ENGINE_SECTION) + "." + key + " is required";
        return false;
    }
    if (!Address::TryParseHex(*value, out) || out.IsNull()) {
        if (error) {
            *error = std::string(ENGINE_SECTION) + "." + key +
                     " is not a valid address: " + *value;
        }
        return false;
    }
    return true;
}

} // namespace

std::optional<EngineConfig> LoadEngineConfig(const util::ConfigManager& config,
                                             std::string* error) {
    using namespace util::ConfigKeys;

    EngineConfig result;
    if (!ReadAddress(config, ADMIN, result.admin, error) ||
        !ReadAddress(config, CUSTODY, result.custody, error)) {
        return std::nullopt;
    }

    if (config.HasKey(PERSIST, ENGINE_SECTION)) {
        auto persist = config.TryGetBool(PERSIST, ENGINE_SECTION);
        if (!persist) {
            if (error) *error = std::string(ENGINE_SECTION) + "." + PERSIST + " must be a boolean";
            return std::nullopt;
        }
        result.persist = *persist;
    }

    return result;
}

// ============================================================================
// Reentrancy Guard
// ============================================================================

/// Marks the current thread as inside a mutating call for its lifetime
class VotingEngine::GuardScope {
public:
    explicit GuardScope(VotingEngine& engine) : engine_(engine) {
        engine_.guardOwner_.store(std::this_thread::get_id());
    }

    ~GuardScope() { engine_.guardOwner_.store(std::thread::id()); }

    GuardScope(const GuardScope&) = delete;
    GuardScope& operator=(const GuardScope&) = delete;

private:
    VotingEngine& engine_;
};

bool VotingEngine::InGuardedCall() const {
    return guardOwner_.load() == std::this_thread::get_id();
}

std::unique_lock<std::mutex> VotingEngine::LockForRead() const {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!InGuardedCall()) {
        lock.lock();
    }
    return lock;
}

// ============================================================================
// Construction
// ============================================================================

VotingEngine::VotingEngine(const Address& admin,
                           std::shared_ptr<ledger::ITokenLedger> ledger,
                           std::shared_ptr<VotingStore> store)
    : admin_(admin), ledger_(std::move(ledger)), store_(std::move(store)) {}

bool VotingEngine::Restore(const VotingState& state) {
    if (InGuardedCall()) {
        return false;
    }
    if (!state.IsConsistent()) {
        LOG_WARN(util::LogCategory::VOTING) << "Refusing to restore inconsistent voting state";
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
    LOG_INFO(util::LogCategory::VOTING) << "Restored " << state_.projects.size()
                                        << " projects, next id " << state_.nextProjectId;
    return true;
}

// ============================================================================
// Mutating Operations
// ============================================================================

namespace {

VoteError Reject(const char* operation, ProjectId projectId, VoteError error) {
    LOG_DEBUG(util::LogCategory::VOTING) << operation << " on project " << projectId
                                         << " rejected: " << VoteErrorToString(error);
    return error;
}

} // namespace

VoteError VotingEngine::CreateProject(const Address& caller,
                                      const std::string& name,
                                      const std::string& description,
                                      Timestamp startTime,
                                      int64_t duration,
                                      Timestamp now,
                                      ProjectId* outId) {
    if (InGuardedCall()) {
        return Reject("CreateProject", 0, VoteError::ReentrantCall);
    }

    std::vector<VotingEvent> events;
    ProjectId id = 0;
    VoteError result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        GuardScope guard(*this);
        result = CreateProjectLocked(caller, name, description, startTime, duration,
                                     now, id, events);
        QueueEvents(events);
    }

    if (result == VoteError::OK && outId) {
        *outId = id;
    }
    Publish();
    return result;
}

VoteError VotingEngine::Vote(const Address& caller, ProjectId projectId,
                             Amount amount, Timestamp now) {
    if (InGuardedCall()) {
        return Reject("Vote", projectId, VoteError::ReentrantCall);
    }

    std::vector<VotingEvent> events;
    VoteError result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        GuardScope guard(*this);
        result = VoteLocked(caller, projectId, amount, now, events);
        QueueEvents(events);
    }

    Publish();
    return result;
}

VoteError VotingEngine::FinalizeProject(const Address& caller, ProjectId projectId,
                                        Timestamp now) {
    if (InGuardedCall()) {
        return Reject("FinalizeProject", projectId, VoteError::ReentrantCall);
    }

    std::vector<VotingEvent> events;
    VoteError result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        GuardScope guard(*this);
        result = FinalizeLocked(caller, projectId, now, events);
        QueueEvents(events);
    }

    Publish();
    return result;
}

VoteError VotingEngine::UnstakeTokens(const Address& caller, ProjectId projectId,
                                      Timestamp now, Amount* outPayout) {
    if (InGuardedCall()) {
        return Reject("UnstakeTokens", projectId, VoteError::ReentrantCall);
    }

    std::vector<VotingEvent> events;
    Amount payout = 0;
    VoteError result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        GuardScope guard(*this);
        result = UnstakeLocked(caller, projectId, now, payout, events);
        QueueEvents(events);
    }

    if (outPayout) {
        *outPayout = result == VoteError::OK ? payout : 0;
    }
    Publish();
    return result;
}

VoteError VotingEngine::CreateProjectLocked(const Address& caller,
                                            const std::string& name,
                                            const std::string& description,
                                            Timestamp startTime,
                                            int64_t duration,
                                            Timestamp now,
                                            ProjectId& outId,
                                            std::vector<VotingEvent>& events) {
    const ProjectId id = state_.nextProjectId;

    if (!IsAdmin(caller)) {
        return Reject("CreateProject", id, VoteError::Unauthorized);
    }
    if (startTime <= now || duration <= 0 ||
        startTime > std::numeric_limits<Timestamp>::max() - duration) {
        return Reject("CreateProject", id, VoteError::InvalidSchedule);
    }

    Project project;
    project.id = id;
    project.name = name;
    project.description = description;
    project.startTime = startTime;
    project.endTime = startTime + duration;
    project.totalVotes = 0;
    project.isActive = true;
    project.isFinalized = false;

    StateDelta delta;
    delta.project = project;
    delta.nextProjectId = id + 1;
    if (!Persist(delta)) {
        return VoteError::StorageError;
    }

    state_.projects.emplace(id, project);
    state_.nextProjectId = id + 1;
    outId = id;

    VotingEvent event;
    event.type = VotingEventType::ProjectCreated;
    event.projectId = id;
    event.name = project.name;
    event.startTime = project.startTime;
    event.endTime = project.endTime;
    events.push_back(std::move(event));
    return VoteError::OK;
}

VoteError VotingEngine::VoteLocked(const Address& caller, ProjectId projectId,
                                   Amount amount, Timestamp now,
                                   std::vector<VotingEvent>& events) {
    auto pit = state_.projects.find(projectId);
    if (pit == state_.projects.end()) {
        return Reject("Vote", projectId, VoteError::NotFound);
    }
    Project& project = pit->second;

    if (project.isFinalized) {
        return Reject("Vote", projectId, VoteError::ProjectAlreadyFinalized);
    }
    if (!project.isActive) {
        return Reject("Vote", projectId, VoteError::ProjectNotActive);
    }
    if (!project.IsVotingOpen(now)) {
        return Reject("Vote", projectId, VoteError::InvalidVotingPeriod);
    }
    if (amount <= 0) {
        return Reject("Vote", projectId, VoteError::NoVotesCast);
    }

    const StakeKey key(projectId, caller);
    auto sit = state_.stakes.find(key);
    const bool firstStake = sit == state_.stakes.end();
    StakeRecord record = firstStake ? StakeRecord() : sit->second;
    const Amount staked = TotalStakedLocked(caller);

    if (amount > MAX_MONEY ||
        record.amount > MAX_MONEY - amount ||
        project.totalVotes > MAX_MONEY - amount ||
        staked > MAX_MONEY - amount) {
        return Reject("Vote", projectId, VoteError::InvalidAmount);
    }

    if (!ledger_->Debit(caller, amount)) {
        return Reject("Vote", projectId, VoteError::InsufficientAllowance);
    }

    record.amount += amount;
    record.lastStakeTime = now;
    record.hasUnstaked = false;

    Project updated = project;
    updated.totalVotes += amount;

    StateDelta delta;
    delta.project = updated;
    delta.stake = std::make_pair(key, record);
    delta.totalStaked = std::make_pair(caller, staked + amount);
    if (firstStake) {
        StateDelta::VoterEntry entry;
        entry.projectId = projectId;
        auto vit = state_.voters.find(projectId);
        entry.index = vit == state_.voters.end() ? 0 : static_cast<uint32_t>(vit->second.size());
        entry.voter = caller;
        delta.appendVoter = entry;
    }
    if (store_) {
        delta.ledgerState = ledger_->Checkpoint();
    }

    if (!Persist(delta)) {
        if (!ledger_->Credit(caller, amount)) {
            LOG_ERROR(util::LogCategory::VOTING) << "Refund of " << amount << " to "
                                                 << caller.ToHex() << " failed";
        }
        return VoteError::StorageError;
    }

    project = updated;
    state_.stakes[key] = record;
    state_.totalStaked[caller] = staked + amount;
    if (firstStake) {
        state_.voters[projectId].push_back(caller);
    }

    VotingEvent event;
    event.type = VotingEventType::VoteCast;
    event.projectId = projectId;
    event.participant = caller;
    event.amount = amount;
    event.total = record.amount;
    events.push_back(std::move(event));
    return VoteError::OK;
}

VoteError VotingEngine::FinalizeLocked(const Address& caller, ProjectId projectId,
                                       Timestamp now,
                                       std::vector<VotingEvent>& events) {
    if (!IsAdmin(caller)) {
        return Reject("FinalizeProject", projectId, VoteError::Unauthorized);
    }

    auto pit = state_.projects.find(projectId);
    if (pit == state_.projects.end()) {
        return Reject("FinalizeProject", projectId, VoteError::NotFound);
    }
    Project& project = pit->second;

    if (project.isFinalized) {
        return Reject("FinalizeProject", projectId, VoteError::ProjectAlreadyFinalized);
    }
    if (!project.isActive) {
        return Reject("FinalizeProject", projectId, VoteError::ProjectNotActive);
    }
    if (!project.HasEnded(now)) {
        return Reject("FinalizeProject", projectId, VoteError::VotingPeriodNotEnded);
    }
    if (project.totalVotes <= 0) {
        return Reject("FinalizeProject", projectId, VoteError::NoVotesCast);
    }

    // Strictly greater keeps the earliest voter among equal stakes
    Address winner;
    Amount best = 0;
    const auto vit = state_.voters.find(projectId);
    const std::vector<Address> noVoters;
    for (const Address& voter : vit == state_.voters.end() ? noVoters : vit->second) {
        auto sit = state_.stakes.find(StakeKey(projectId, voter));
        if (sit != state_.stakes.end() && sit->second.amount > best) {
            best = sit->second.amount;
            winner = voter;
        }
    }

    Project updated = project;
    updated.isActive = false;
    updated.isFinalized = true;
    updated.winner = winner;

    StateDelta delta;
    delta.project = updated;
    if (!Persist(delta)) {
        return VoteError::StorageError;
    }
    project = updated;

    VotingEvent event;
    event.type = VotingEventType::ProjectFinalized;
    event.projectId = projectId;
    event.participant = winner;
    event.total = project.totalVotes;
    events.push_back(std::move(event));
    return VoteError::OK;
}

VoteError VotingEngine::ComputePayout(ProjectId projectId, const Address& participant,
                                      Timestamp now, Amount& payout,
                                      bool& isWinner) const {
    auto pit = state_.projects.find(projectId);
    if (pit == state_.projects.end()) {
        return VoteError::NotFound;
    }
    const Project& project = pit->second;

    if (!project.HasEnded(now)) {
        return VoteError::VotingPeriodNotEnded;
    }
    if (!project.isFinalized) {
        return VoteError::ProjectNotFinalized;
    }

    auto sit = state_.stakes.find(StakeKey(projectId, participant));
    if (sit == state_.stakes.end() || sit->second.amount <= 0) {
        return VoteError::NoVotesCast;
    }
    if (sit->second.hasUnstaked) {
        return VoteError::AlreadyUnstaked;
    }

    isWinner = participant == project.winner;
    payout = isWinner ? sit->second.amount * WINNER_PAYOUT_MULTIPLIER : sit->second.amount;
    return VoteError::OK;
}

VoteError VotingEngine::UnstakeLocked(const Address& caller, ProjectId projectId,
                                      Timestamp now, Amount& outPayout,
                                      std::vector<VotingEvent>& events) {
    Amount payout = 0;
    bool isWinner = false;
    VoteError err = ComputePayout(projectId, caller, now, payout, isWinner);
    if (err != VoteError::OK) {
        return Reject("UnstakeTokens", projectId, err);
    }

    const StakeKey key(projectId, caller);
    const StakeRecord previous = state_.stakes[key];
    const Amount previousTotal = TotalStakedLocked(caller);

    StakeRecord record = previous;
    record.hasUnstaked = true;
    const Amount remaining = previousTotal - previous.amount;

    // Effects land before the payout leaves custody
    state_.stakes[key] = record;
    if (remaining == 0) {
        state_.totalStaked.erase(caller);
    } else {
        state_.totalStaked[caller] = remaining;
    }

    if (!ledger_->Credit(caller, payout)) {
        LOG_WARN(util::LogCategory::VOTING) << "Payout of " << payout << " to "
                                            << caller.ToHex() << " on project "
                                            << projectId << " failed, reverting";
        state_.stakes[key] = previous;
        state_.totalStaked[caller] = previousTotal;
        return VoteError::PayoutFailed;
    }

    // The stake change and the payout reach the store in one batch
    StateDelta delta;
    delta.stake = std::make_pair(key, record);
    delta.totalStaked = std::make_pair(caller, remaining);
    if (store_) {
        delta.ledgerState = ledger_->Checkpoint();
    }
    if (!Persist(delta)) {
        if (!ledger_->Reclaim(caller, payout)) {
            LOG_ERROR(util::LogCategory::VOTING) << "Could not reclaim payout of " << payout
                                                 << " from " << caller.ToHex();
        }
        state_.stakes[key] = previous;
        state_.totalStaked[caller] = previousTotal;
        return VoteError::StorageError;
    }

    outPayout = payout;

    VotingEvent event;
    event.type = VotingEventType::TokensUnstaked;
    event.projectId = projectId;
    event.participant = caller;
    event.amount = payout;
    event.isWinner = isWinner;
    events.push_back(std::move(event));
    return VoteError::OK;
}

bool VotingEngine::Persist(const StateDelta& delta) {
    if (!store_) {
        return true;
    }
    db::Status s = store_->Commit(delta);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::VOTING) << "State commit failed: " << s.ToString();
        return false;
    }
    return true;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Project> VotingEngine::GetProject(ProjectId projectId, VoteError* error) const {
    auto lock = LockForRead();
    auto it = state_.projects.find(projectId);
    if (it == state_.projects.end()) {
        if (error) *error = VoteError::NotFound;
        return std::nullopt;
    }
    if (error) *error = VoteError::OK;
    return it->second;
}

size_t VotingEngine::GetTotalProjects() const {
    auto lock = LockForRead();
    return state_.projects.size();
}

std::vector<Address> VotingEngine::GetVoters(ProjectId projectId) const {
    auto lock = LockForRead();
    auto it = state_.voters.find(projectId);
    if (it == state_.voters.end()) {
        return {};
    }
    return it->second;
}

Amount VotingEngine::GetUnstakeableBalance(ProjectId projectId, const Address& participant,
                                           Timestamp now) const {
    auto lock = LockForRead();
    Amount payout = 0;
    bool isWinner = false;
    if (ComputePayout(projectId, participant, now, payout, isWinner) != VoteError::OK) {
        return 0;
    }
    return payout;
}

std::optional<StakeRecord> VotingEngine::GetStake(ProjectId projectId,
                                                  const Address& participant) const {
    auto lock = LockForRead();
    auto it = state_.stakes.find(StakeKey(projectId, participant));
    if (it == state_.stakes.end()) {
        return std::nullopt;
    }
    return it->second;
}

Amount VotingEngine::GetTotalStaked(const Address& participant) const {
    auto lock = LockForRead();
    return TotalStakedLocked(participant);
}

Amount VotingEngine::TotalStakedLocked(const Address& participant) const {
    auto it = state_.totalStaked.find(participant);
    return it == state_.totalStaked.end() ? 0 : it->second;
}

VotingState VotingEngine::GetState() const {
    auto lock = LockForRead();
    return state_;
}

// ============================================================================
// Events
// ============================================================================

uint64_t VotingEngine::Subscribe(EventCallback callback) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    uint64_t handle = nextSubscriberId_++;
    subscribers_.emplace(handle, std::move(callback));
    return handle;
}

void VotingEngine::Unsubscribe(uint64_t handle) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    subscribers_.erase(handle);
}

void VotingEngine::QueueEvents(std::vector<VotingEvent>& events) {
    if (events.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(eventsMutex_);
    for (VotingEvent& event : events) {
        pendingEvents_.push_back(std::move(event));
    }
    events.clear();
}

void VotingEngine::Publish() {
    std::unique_lock<std::mutex> lock(eventsMutex_);
    // Another call on this or another thread is already draining the queue
    if (dispatching_) {
        return;
    }
    dispatching_ = true;

    // Hand the queue back even when a subscriber throws; undelivered events
    // go out with the next call
    struct DispatchScope {
        std::unique_lock<std::mutex>& lock;
        bool& dispatching;
        ~DispatchScope() {
            if (!lock.owns_lock()) {
                lock.lock();
            }
            dispatching = false;
        }
    } scope{lock, dispatching_};

    while (!pendingEvents_.empty()) {
        VotingEvent event = std::move(pendingEvents_.front());
        pendingEvents_.pop_front();
        lock.unlock();

        std::vector<EventCallback> callbacks;
        {
            std::lock_guard<std::mutex> subscribersLock(subscribersMutex_);
            callbacks.reserve(subscribers_.size());
            for (const auto& [handle, callback] : subscribers_) {
                callbacks.push_back(callback);
            }
        }

        LOG_INFO(util::LogCategory::VOTING) << event.ToString();
        for (const auto& callback : callbacks) {
            callback(event);
        }

        lock.lock();
    }
}

} // namespace voting
} // namespace stakevote
