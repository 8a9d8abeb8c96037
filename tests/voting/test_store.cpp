// STAKEVOTE - Voting State Store Tests
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License

#include <gtest/gtest.h>

#include <stakevote/db/leveldb.h>
#include <stakevote/voting/store.h>

#include <random>

namespace stakevote {
namespace voting {
namespace {

using db::MakeKey;
namespace prefix = db::prefix;

const Address kAlice = Address::FromHex("a11ce00000000000000000000000000000000001");
const Address kBob = Address::FromHex("b0b0000000000000000000000000000000000002");
const Address kCustody = Address::FromHex("cccccccccccccccccccccccccccccccccccccccc");

class VotingStoreTest : public ::testing::Test {
protected:
    std::unique_ptr<VotingStore> store_;

    void SetUp() override {
        store_ = std::make_unique<VotingStore>(std::make_unique<db::MemoryDatabase>());
    }

    static Project MakeProject(ProjectId id) {
        Project p;
        p.id = id;
        p.name = "project-" + std::to_string(id);
        p.startTime = 1000;
        p.endTime = 2000;
        p.isActive = true;
        return p;
    }

    /// One project with two voters
    static VotingState MakeState() {
        VotingState state;
        state.nextProjectId = 2;
        state.projects[1] = MakeProject(1);
        state.projects[1].totalVotes = 50;
        state.stakes[{1, kAlice}] = StakeRecord{30, 1500, false};
        state.stakes[{1, kBob}] = StakeRecord{20, 1600, false};
        state.voters[1] = {kAlice, kBob};
        state.totalStaked[kAlice] = 30;
        state.totalStaked[kBob] = 20;
        return state;
    }

    /// Write state through the commit path, one record per batch
    void Seed(const VotingState& state) {
        StateDelta next;
        next.nextProjectId = state.nextProjectId;
        ASSERT_TRUE(store_->Commit(next).ok());

        for (const auto& [id, project] : state.projects) {
            StateDelta delta;
            delta.project = project;
            ASSERT_TRUE(store_->Commit(delta).ok());
        }
        for (const auto& [id, list] : state.voters) {
            for (uint32_t i = 0; i < list.size(); ++i) {
                StateDelta delta;
                delta.appendVoter = StateDelta::VoterEntry{id, i, list[i]};
                ASSERT_TRUE(store_->Commit(delta).ok());
            }
        }
        for (const auto& [key, record] : state.stakes) {
            StateDelta delta;
            delta.stake = std::make_pair(key, record);
            ASSERT_TRUE(store_->Commit(delta).ok());
        }
        for (const auto& [owner, amount] : state.totalStaked) {
            StateDelta delta;
            delta.totalStaked = std::make_pair(owner, amount);
            ASSERT_TRUE(store_->Commit(delta).ok());
        }
    }
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(VotingStoreTest, EmptyDatabaseLoadsFreshState) {
    VotingState state;
    state.nextProjectId = 99;

    ASSERT_TRUE(store_->Load(state).ok());
    EXPECT_EQ(state.nextProjectId, FIRST_PROJECT_ID);
    EXPECT_TRUE(state.projects.empty());
    EXPECT_TRUE(state.stakes.empty());
}

TEST_F(VotingStoreTest, SaveAndLoadState) {
    VotingState original = MakeState();
    Seed(original);

    VotingState loaded;
    ASSERT_TRUE(store_->Load(loaded).ok());
    EXPECT_EQ(loaded.nextProjectId, 2u);
    ASSERT_EQ(loaded.projects.size(), 1u);
    EXPECT_EQ(loaded.projects.at(1).name, "project-1");
    EXPECT_EQ(loaded.projects.at(1).totalVotes, 50);
    EXPECT_EQ((loaded.stakes.at({1, kBob}).amount), 20);
    EXPECT_EQ(loaded.voters.at(1), (std::vector<Address>{kAlice, kBob}));
    EXPECT_EQ(loaded.totalStaked.at(kAlice), 30);
}

TEST_F(VotingStoreTest, VoterOrderSurvivesManyVoters) {
    // More than 256 voters, so little-endian index keys sort out of order
    VotingState state;
    state.nextProjectId = 2;
    state.projects[1] = MakeProject(1);
    for (uint32_t i = 0; i < 300; ++i) {
        Address voter;
        voter.data()[0] = static_cast<uint8_t>(i & 0xFF);
        voter.data()[1] = static_cast<uint8_t>(i >> 8);
        state.voters[1].push_back(voter);
        state.stakes[{1, voter}] = StakeRecord{1, 1500, false};
        state.totalStaked[voter] = 1;
    }
    state.projects[1].totalVotes = 300;
    ASSERT_TRUE(state.IsConsistent());
    Seed(state);

    VotingState loaded;
    ASSERT_TRUE(store_->Load(loaded).ok());
    EXPECT_EQ(loaded.voters.at(1), state.voters.at(1));
}

// ============================================================================
// Commits
// ============================================================================

TEST_F(VotingStoreTest, CommitAppliesDelta) {
    StateDelta create;
    create.project = MakeProject(1);
    create.nextProjectId = 2;
    ASSERT_TRUE(store_->Commit(create).ok());

    StateDelta vote;
    Project updated = MakeProject(1);
    updated.totalVotes = 10;
    vote.project = updated;
    vote.stake = std::make_pair(StakeKey(1, kAlice), StakeRecord{10, 1500, false});
    vote.appendVoter = StateDelta::VoterEntry{1, 0, kAlice};
    vote.totalStaked = std::make_pair(kAlice, Amount{10});
    ASSERT_TRUE(store_->Commit(vote).ok());
    EXPECT_EQ(store_->GetCommitCount(), 2u);

    VotingState loaded;
    ASSERT_TRUE(store_->Load(loaded).ok());
    EXPECT_EQ(loaded.projects.at(1).totalVotes, 10);
    EXPECT_EQ(loaded.voters.at(1), std::vector<Address>{kAlice});
    EXPECT_EQ(loaded.totalStaked.at(kAlice), 10);
}

TEST_F(VotingStoreTest, CommitCarriesLedger) {
    Seed(MakeState());

    ledger::TokenLedger token(kCustody);
    token.Mint(kAlice, 100);
    token.Approve(kAlice, kCustody, 100);
    ASSERT_TRUE(token.Debit(kAlice, 10));

    StateDelta vote;
    vote.stake = std::make_pair(StakeKey(1, kAlice), StakeRecord{40, 1700, false});
    vote.totalStaked = std::make_pair(kAlice, Amount{40});
    vote.ledgerState = token.Export();
    Project updated = MakeProject(1);
    updated.totalVotes = 60;
    vote.project = updated;

    const uint64_t commits = store_->GetCommitCount();
    ASSERT_TRUE(store_->Commit(vote).ok());
    EXPECT_EQ(store_->GetCommitCount(), commits + 1);

    VotingState loaded;
    ASSERT_TRUE(store_->Load(loaded).ok());
    EXPECT_EQ(loaded.totalStaked.at(kAlice), 40);

    ledger::LedgerSnapshot snapshot;
    ASSERT_TRUE(store_->LoadLedger(snapshot).ok());
    EXPECT_EQ(snapshot.totalSupply, 100);
    EXPECT_EQ(snapshot.balances.at(kAlice), 90);
    EXPECT_EQ(snapshot.balances.at(kCustody), 10);

    // A later commit replaces stale ledger records
    ASSERT_TRUE(token.Credit(kAlice, 10));
    StateDelta payout;
    payout.ledgerState = token.Export();
    ASSERT_TRUE(store_->Commit(payout).ok());
    ASSERT_TRUE(store_->LoadLedger(snapshot).ok());
    EXPECT_EQ(snapshot.balances.count(kCustody), 0u);
    EXPECT_EQ(snapshot.balances.at(kAlice), 100);
}

TEST_F(VotingStoreTest, EmptyCommitWritesNothing) {
    ASSERT_TRUE(store_->Commit(StateDelta()).ok());
    EXPECT_EQ(store_->GetCommitCount(), 0u);
}

TEST_F(VotingStoreTest, ZeroTotalDeletesRecord) {
    Seed(MakeState());

    StateDelta unstake;
    unstake.stake = std::make_pair(StakeKey(1, kBob), StakeRecord{20, 1600, true});
    unstake.totalStaked = std::make_pair(kBob, Amount{0});
    ASSERT_TRUE(store_->Commit(unstake).ok());

    EXPECT_FALSE(store_->GetDatabase()->Exists(MakeKey(prefix::TOTAL_STAKED, kBob)));

    VotingState loaded;
    ASSERT_TRUE(store_->Load(loaded).ok());
    EXPECT_EQ(loaded.totalStaked.count(kBob), 0u);
    EXPECT_TRUE((loaded.stakes.at({1, kBob}).hasUnstaked));
}

// ============================================================================
// Corruption Detection
// ============================================================================

TEST_F(VotingStoreTest, UndecodableProject) {
    Seed(MakeState());
    ASSERT_TRUE(store_->GetDatabase()->Put(MakeKey(prefix::PROJECT, ProjectId{1}),
                                          "garbage").ok());

    VotingState loaded;
    EXPECT_TRUE(store_->Load(loaded).IsCorruption());
}

TEST_F(VotingStoreTest, ProjectIdMismatch) {
    Seed(MakeState());
    ASSERT_TRUE(store_->GetDatabase()->Put(MakeKey(prefix::PROJECT, ProjectId{1}),
                                          db::SerializeToString(MakeProject(3))).ok());

    VotingState loaded;
    EXPECT_TRUE(store_->Load(loaded).IsCorruption());
}

TEST_F(VotingStoreTest, GapInVoterList) {
    Seed(MakeState());
    ASSERT_TRUE(store_->GetDatabase()->Delete(
        MakeKey(prefix::VOTER, ProjectId{1}, uint32_t{0})).ok());

    VotingState loaded;
    db::Status s = store_->Load(loaded);
    EXPECT_TRUE(s.IsCorruption());
    EXPECT_NE(s.message().find("gap"), std::string::npos);
}

TEST_F(VotingStoreTest, InconsistentTotals) {
    Seed(MakeState());
    ASSERT_TRUE(store_->GetDatabase()->Put(MakeKey(prefix::TOTAL_STAKED, kAlice),
                                          db::SerializeToString(Amount{31})).ok());

    VotingState loaded;
    loaded.nextProjectId = 77;
    EXPECT_TRUE(store_->Load(loaded).IsCorruption());
    EXPECT_EQ(loaded.nextProjectId, 77u);  // Untouched on failure
}

// ============================================================================
// Reference Ledger
// ============================================================================

TEST_F(VotingStoreTest, EmptyLedger) {
    ledger::LedgerSnapshot snapshot;
    ASSERT_TRUE(store_->LoadLedger(snapshot).ok());
    EXPECT_TRUE(snapshot.balances.empty());
    EXPECT_EQ(snapshot.totalSupply, 0);
}

TEST_F(VotingStoreTest, SaveAndLoadLedger) {
    ledger::TokenLedger token(kCustody);
    token.Mint(kAlice, 70);
    token.Mint(kBob, 30);
    token.Approve(kAlice, kCustody, 25);
    ASSERT_TRUE(store_->SaveLedger(token.Export()).ok());

    // Shrinking the ledger drops stale records
    token.Transfer(kBob, kAlice, 30);
    ASSERT_TRUE(store_->SaveLedger(token.Export()).ok());

    ledger::LedgerSnapshot loaded;
    ASSERT_TRUE(store_->LoadLedger(loaded).ok());
    EXPECT_EQ(loaded.totalSupply, 100);
    EXPECT_EQ(loaded.balances.size(), 1u);
    EXPECT_EQ(loaded.balances.at(kAlice), 100);
    EXPECT_EQ((loaded.allowances.at({kAlice, kCustody})), 25);
}

TEST_F(VotingStoreTest, LedgerSupplyMismatch) {
    ledger::TokenLedger token(kCustody);
    token.Mint(kAlice, 70);
    ASSERT_TRUE(store_->SaveLedger(token.Export()).ok());
    ASSERT_TRUE(store_->GetDatabase()->Put(MakeKey(prefix::TOTAL_SUPPLY),
                                          db::SerializeToString(Amount{71})).ok());

    ledger::LedgerSnapshot loaded;
    EXPECT_TRUE(store_->LoadLedger(loaded).IsCorruption());
}

TEST_F(VotingStoreTest, LedgerAndVotingRecordsAreSeparate) {
    Seed(MakeState());

    ledger::TokenLedger token(kCustody);
    token.Mint(kAlice, 5);
    ASSERT_TRUE(store_->SaveLedger(token.Export()).ok());

    VotingState loaded;
    ASSERT_TRUE(store_->Load(loaded).ok());
    EXPECT_EQ(loaded.projects.size(), 1u);
}

// ============================================================================
// Opening
// ============================================================================

TEST(VotingStoreOpenTest, OpenCreatesStore) {
    auto dir = std::filesystem::temp_directory_path() /
               ("stakevote_store_test_" + std::to_string(std::random_device()()));
    auto [status, store] = VotingStore::Open(dir);
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_NE(store, nullptr);
    EXPECT_NE(store->GetDatabase(), nullptr);

    VotingState state;
    EXPECT_TRUE(store->Load(state).ok());

    store.reset();
    EXPECT_TRUE(db::DestroyDatabase(dir).ok());
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

} // namespace
} // namespace voting
} // namespace stakevote
