#include "storage/snapshot_store.hpp"
#include "storage/completion_log.hpp"
#include "core/ledger/skill_ledger.hpp"
#include "core/proof/verifier.hpp"
#include "utils/logger.hpp"
#include "skillmint/error.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace skillmint;
using namespace skillmint::storage;
using namespace skillmint::ledger;

namespace fs = std::filesystem;

class StorageTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        utils::Logger::init("off");
        test_dir = fs::path("./test_storage_data") /
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    // Two challenges, three proofs (one rejected), two credentials
    static void populate(SkillLedger& ledger) {
        auto react = ledger.create_challenge("alice", "react", 5, 3600, 25, 100, "c1").value();
        auto rust = ledger.create_challenge("carol", "rust", 8, 7200, 0, 0, "c2").value();

        auto p1 = ledger.submit_proof(react, "bob", 100, 85, "s1", "t1").value();
        auto p2 = ledger.submit_proof(rust, "bob", 100, 40, "s2", "t2").value();
        ledger.submit_proof(react, "dave", 100, 10, "s3", "0x00").value();

        ledger.verify_proof(p1).value();
        ledger.verify_proof(p2).value();
        ledger.verify_proof(3).value();
    }

    static void write_file(const fs::path& path, const std::string& text) {
        std::ofstream file(path);
        file << text;
    }
};

// ============================================================================
// Snapshot store
// ============================================================================

TEST_F(StorageTest, SaveAndLoadSnapshot) {
    SkillLedger source(std::make_unique<core::NonEmptyVerifier>());
    populate(source);

    SnapshotStore store(test_dir / "ledger.json");
    EXPECT_FALSE(store.exists());
    store.save(source.snapshot());
    EXPECT_TRUE(store.exists());
    EXPECT_FALSE(fs::exists(test_dir / "ledger.json.tmp"));

    SkillLedger restored(std::make_unique<core::NonEmptyVerifier>());
    restored.restore(store.load());

    EXPECT_EQ(restored.get_challenges_by("alice"), source.get_challenges_by("alice"));
    EXPECT_EQ(restored.get_proofs_by("bob"), source.get_proofs_by("bob"));
    EXPECT_EQ(restored.get_credentials_of("bob"), source.get_credentials_of("bob"));
    EXPECT_EQ(restored.balance_of("bob"), 25u);
    EXPECT_EQ(restored.held_balance(1), 75u);
    EXPECT_EQ(restored.get_proof(3)->rejection_count, 1u);
    EXPECT_EQ(restored.audit_log().size(), 2u);

    auto credential = restored.get_credential(restored.find_credential("bob", "react"));
    ASSERT_TRUE(credential.has_value());
    EXPECT_EQ(credential->proficiency_level, 9);
    EXPECT_EQ(credential->solution_digests, (std::vector<std::string>{"s1"}));

    auto next = restored.create_challenge("alice", "go", 1, 60, 0, 0, "c3");
    EXPECT_EQ(next.value(), 3u);
}

TEST_F(StorageTest, DocumentLayout) {
    SkillLedger ledger(std::make_unique<core::NonEmptyVerifier>());
    populate(ledger);

    auto document = SnapshotStore::to_json(ledger.snapshot());
    EXPECT_EQ(document["version"].get<int>(), SnapshotStore::FORMAT_VERSION);
    EXPECT_EQ(document["challenges"].size(), 2u);
    EXPECT_EQ(document["proofs"].size(), 3u);
    EXPECT_EQ(document["credentials"].size(), 2u);
    EXPECT_EQ(document["counters"]["nextProofId"].get<uint64_t>(), 4u);
    EXPECT_EQ(document["indexes"]["proofsBySolver"]["bob"],
              nlohmann::json::array({1, 2}));
    EXPECT_EQ(document["escrow"]["balances"]["bob"].get<uint64_t>(), 25u);
}

TEST_F(StorageTest, MismatchedIndexRejected) {
    SkillLedger ledger(std::make_unique<core::NonEmptyVerifier>());
    populate(ledger);

    auto document = SnapshotStore::to_json(ledger.snapshot());
    document["indexes"]["proofsBySolver"]["bob"] = nlohmann::json::array({2, 1});

    try {
        SnapshotStore::from_json(document);
        FAIL() << "expected StorageException";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), ErrorCode::StorageCorrupted);
    }
}

TEST_F(StorageTest, IdBeyondCounterRejected) {
    SkillLedger ledger(std::make_unique<core::NonEmptyVerifier>());
    populate(ledger);

    auto document = SnapshotStore::to_json(ledger.snapshot());
    document["counters"]["nextChallengeId"] = 2;
    EXPECT_THROW(SnapshotStore::from_json(document), StorageException);
}

TEST_F(StorageTest, OutOfRangeScoreRejected) {
    SkillLedger ledger(std::make_unique<core::NonEmptyVerifier>());
    populate(ledger);

    auto document = SnapshotStore::to_json(ledger.snapshot());
    document["proofs"][0]["score"] = 150;
    EXPECT_THROW(SnapshotStore::from_json(document), StorageException);
}

TEST_F(StorageTest, WideValuesAreCheckedBeforeNarrowing) {
    SkillLedger ledger(std::make_unique<core::NonEmptyVerifier>());
    populate(ledger);
    const auto original = SnapshotStore::to_json(ledger.snapshot());

    auto expect_corrupted = [](const nlohmann::json& document) {
        try {
            SnapshotStore::from_json(document);
            FAIL() << "expected StorageException";
        } catch (const StorageException& e) {
            EXPECT_EQ(e.code(), ErrorCode::StorageCorrupted);
        }
    };

    // 257 and 266 would wrap to 1 and 10 as uint8_t
    auto difficulty = original;
    difficulty["challenges"][0]["difficulty"] = 257;
    expect_corrupted(difficulty);

    auto proficiency = original;
    proficiency["credentials"][0]["proficiencyLevel"] = 266;
    expect_corrupted(proficiency);

    // 2^32 + 50 would wrap to 50 as uint32_t
    auto score = original;
    score["proofs"][0]["score"] = 4294967346ULL;
    expect_corrupted(score);

    EXPECT_NO_THROW(SnapshotStore::from_json(original));
}

TEST_F(StorageTest, MissingFieldIsDeserializationError) {
    SkillLedger ledger(std::make_unique<core::NonEmptyVerifier>());
    populate(ledger);

    auto document = SnapshotStore::to_json(ledger.snapshot());
    document.erase("counters");

    try {
        SnapshotStore::from_json(document);
        FAIL() << "expected StorageException";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), ErrorCode::DeserializationFailed);
    }
}

TEST_F(StorageTest, UnparseableFileIsCorrupted) {
    write_file(test_dir / "ledger.json", "{ not json");
    SnapshotStore store(test_dir / "ledger.json");

    try {
        store.load();
        FAIL() << "expected StorageException";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), ErrorCode::StorageCorrupted);
    }
}

TEST_F(StorageTest, MissingFileFailsToLoad) {
    SnapshotStore store(test_dir / "absent.json");
    EXPECT_THROW(store.load(), StorageException);
}

// ============================================================================
// Completion log
// ============================================================================

TEST_F(StorageTest, CompletionLogRecordsVerifiedProofs) {
    CompletionLog log(test_dir / "completions");

    LedgerEvent event;
    event.event_type = EventType::PROOF_VERIFIED;
    event.subject_id = 4;
    event.participant = "bob";
    event.timestamp = 1700000000;  // 2023-11-14 UTC
    event.data = {{"challengeId", 2}, {"skillType", "react"}, {"score", 85}};

    auto log_id = log.record(event);
    EXPECT_EQ(log_id, "2_bob_1700000000");
    EXPECT_TRUE(fs::exists(test_dir / "completions" / "completions_20231114.jsonl"));

    auto entries = log.read_day("20231114");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["logId"], "2_bob_1700000000");
    EXPECT_EQ(entries[0]["proofId"].get<uint64_t>(), 4u);
    EXPECT_EQ(entries[0]["skillType"], "react");
    EXPECT_EQ(entries[0]["score"].get<int>(), 85);
}

TEST_F(StorageTest, CompletionLogIgnoresOtherEvents) {
    CompletionLog log(test_dir / "completions");

    LedgerEvent event;
    event.event_type = EventType::PROOF_SUBMITTED;
    event.timestamp = 1700000000;
    EXPECT_TRUE(log.record(event).empty());
    EXPECT_TRUE(log.read_day("20231114").empty());
}

TEST_F(StorageTest, CompletionLogSubscribedToLedger) {
    CompletionLog log(test_dir / "completions");
    SkillLedger ledger(std::make_unique<core::NonEmptyVerifier>());
    ledger.subscribe(log.as_callback());

    populate(ledger);

    size_t total = 0;
    for (const auto& entry : fs::directory_iterator(log.directory())) {
        auto name = entry.path().stem().string();
        total += log.read_day(name.substr(std::string("completions_").size())).size();
    }
    EXPECT_EQ(total, 2u);
}
