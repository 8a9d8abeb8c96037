// STAKEVOTE - Database Tests
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License

#include <gtest/gtest.h>
#include "stakevote/db/database.h"
#include "stakevote/db/leveldb.h"
#include <filesystem>
#include <random>

using namespace stakevote;
using namespace stakevote::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        // Create a unique test directory
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("stakevote_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> Open() {
        auto [status, db] = OpenDatabase(testDir_ / "test_db");
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }
};

// ============================================================================
// Status and Slice
// ============================================================================

TEST(StatusTest, Codes) {
    EXPECT_TRUE(Status::Ok().ok());
    EXPECT_EQ(Status::Ok().ToString(), "OK");

    Status nf = Status::NotFound("key");
    EXPECT_FALSE(nf.ok());
    EXPECT_TRUE(nf.IsNotFound());
    EXPECT_EQ(nf.ToString(), "NotFound: key");

    EXPECT_TRUE(Status::Corruption("x").IsCorruption());
    EXPECT_TRUE(Status::IOError("disk").IsIOError());
    EXPECT_EQ(Status::InvalidArgument("bad").code(), Status::INVALID_ARGUMENT);
}

TEST(SliceTest, Compare) {
    std::string s("abc");
    Slice a(s);
    Slice b("abd");
    Slice prefix("ab");

    EXPECT_TRUE(a < b);
    EXPECT_TRUE(a.starts_with(prefix));
    EXPECT_FALSE(prefix.starts_with(a));
    EXPECT_TRUE(prefix < a);
    EXPECT_EQ(a, Slice("abc"));
    EXPECT_TRUE(Slice().empty());
}

// ============================================================================
// Basic Database Tests
// ============================================================================

TEST_F(DatabaseTest, OpenAndClose) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
}

TEST_F(DatabaseTest, PutGetDelete) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());

    std::string value;
    ASSERT_TRUE(db->Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");
    EXPECT_TRUE(db->Exists(Slice("key1")));

    ASSERT_TRUE(db->Delete(Slice("key1")).ok());
    EXPECT_TRUE(db->Get(Slice("key1"), &value).IsNotFound());
    EXPECT_FALSE(db->Exists(Slice("key1")));
}

TEST_F(DatabaseTest, BinaryKeysAndValues) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    std::string key("k\0ey", 4);
    std::string val("\0\1\2\3", 4);
    ASSERT_TRUE(db->Put(key, val).ok());

    std::string out;
    ASSERT_TRUE(db->Get(key, &out).ok());
    EXPECT_EQ(out, val);
}

TEST_F(DatabaseTest, WriteBatchIsApplied) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    ASSERT_TRUE(db->Put("gone", "1").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Delete("gone");
    batch.Put("a", "3");  // Later operations win
    EXPECT_EQ(batch.Count(), 4u);

    ASSERT_TRUE(db->Write(&batch).ok());

    std::string value;
    ASSERT_TRUE(db->Get("a", &value).ok());
    EXPECT_EQ(value, "3");
    EXPECT_TRUE(db->Exists("b"));
    EXPECT_FALSE(db->Exists("gone"));

    batch.Clear();
    EXPECT_TRUE(batch.Empty());
}

TEST_F(DatabaseTest, IteratorOrderAndSeek) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    for (const char* k : {"p2", "s1", "p1", "a9", "p3"}) {
        ASSERT_TRUE(db->Put(k, k).ok());
    }

    auto it = db->NewIterator();
    std::vector<std::string> all;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        all.push_back(it->key().ToString());
    }
    EXPECT_EQ(all, (std::vector<std::string>{"a9", "p1", "p2", "p3", "s1"}));

    std::vector<std::string> withPrefix;
    for (it->Seek("p"); it->Valid() && it->key().starts_with("p"); it->Next()) {
        withPrefix.push_back(it->value().ToString());
    }
    EXPECT_EQ(withPrefix, (std::vector<std::string>{"p1", "p2", "p3"}));
    EXPECT_TRUE(it->status().ok());
}

TEST_F(DatabaseTest, IteratorSeesSnapshot) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("a", "1").ok());

    auto it = db.NewIterator();
    ASSERT_TRUE(db.Put("b", "2").ok());

    size_t count = 0;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 1u);
    EXPECT_EQ(db.Size(), 2u);
}

TEST_F(DatabaseTest, MemoryDatabaseStats) {
    MemoryDatabase db;
    db.Put("x", "1");
    EXPECT_EQ(db.GetStats(), "memory: 1 keys");

    db.Clear();
    EXPECT_EQ(db.Size(), 0u);
}

TEST_F(DatabaseTest, DestroyDatabase) {
    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
        ASSERT_TRUE(db->Put("k", "v").ok());
    }
    EXPECT_TRUE(DestroyDatabase(testDir_ / "test_db").ok());

    auto db = Open();
    ASSERT_NE(db, nullptr);
    EXPECT_FALSE(db->Exists("k"));
}

// ============================================================================
// Key and Value Encoding
// ============================================================================

TEST(KeyTest, MakeKeyPrefixes) {
    EXPECT_EQ(MakeKey(prefix::NEXT_ID), "n");

    std::string projectKey = MakeKey(prefix::PROJECT, static_cast<uint64_t>(1));
    ASSERT_EQ(projectKey.size(), 9u);
    EXPECT_EQ(projectKey[0], 'p');
    EXPECT_EQ(projectKey[1], '\x01');

    Address addr = Address::FromHex("00112233445566778899aabbccddeeff00112233");
    std::string stakeKey = MakeKey(prefix::STAKE, static_cast<uint64_t>(7), addr);
    ASSERT_EQ(stakeKey.size(), 1u + 8u + 20u);
    EXPECT_EQ(stakeKey[0], 's');
    EXPECT_EQ(stakeKey.substr(9), std::string(reinterpret_cast<const char*>(addr.data()), 20));
}

TEST(KeyTest, SerializeToStringRoundTrip) {
    std::string encoded = SerializeToString(static_cast<int64_t>(123456789));
    EXPECT_EQ(encoded.size(), 8u);

    int64_t decoded = 0;
    EXPECT_TRUE(DeserializeFromString(encoded, decoded));
    EXPECT_EQ(decoded, 123456789);
}

TEST(KeyTest, DeserializeRejectsBadInput) {
    int64_t value = 0;
    EXPECT_FALSE(DeserializeFromString(std::string("\x01\x02", 2), value));
    EXPECT_FALSE(DeserializeFromString(std::string(9, '\0'), value));  // Trailing byte
}
