#include "core/credential/credential_ledger.hpp"
#include "core/ledger/events.hpp"
#include "utils/logger.hpp"
#include "skillmint/common.hpp"
#include <gtest/gtest.h>

using namespace skillmint;
using namespace skillmint::core;

class CredentialLedgerTest : public ::testing::Test {
protected:
    ledger::EventBus events;
    std::unique_ptr<CredentialLedger> credentials;
    std::vector<ledger::LedgerEvent> seen;

    void SetUp() override {
        utils::Logger::init("off");
        credentials = std::make_unique<CredentialLedger>(events);
        events.subscribe([this](const ledger::LedgerEvent& event) { seen.push_back(event); });
    }
};

// ============================================================================
// Level arithmetic
// ============================================================================

TEST_F(CredentialLedgerTest, ScoreToLevel) {
    EXPECT_EQ(CredentialLedger::score_to_level(100), 10);
    EXPECT_EQ(CredentialLedger::score_to_level(90), 10);
    EXPECT_EQ(CredentialLedger::score_to_level(89), 9);
    EXPECT_EQ(CredentialLedger::score_to_level(85), 9);
    EXPECT_EQ(CredentialLedger::score_to_level(65), 7);
    EXPECT_EQ(CredentialLedger::score_to_level(55), 6);
    EXPECT_EQ(CredentialLedger::score_to_level(10), 2);
    EXPECT_EQ(CredentialLedger::score_to_level(9), 1);
    EXPECT_EQ(CredentialLedger::score_to_level(5), 1);
    EXPECT_EQ(CredentialLedger::score_to_level(0), 1);
}

TEST_F(CredentialLedgerTest, ScoreToLevelIsMonotonic) {
    uint8_t previous = CredentialLedger::score_to_level(0);
    for (uint32_t score = 1; score <= 100; ++score) {
        auto level = CredentialLedger::score_to_level(score);
        EXPECT_GE(level, previous);
        EXPECT_GE(level, constants::MIN_PROFICIENCY);
        EXPECT_LE(level, constants::MAX_PROFICIENCY);
        previous = level;
    }
}

TEST_F(CredentialLedgerTest, AggregateFloorsAverage) {
    EXPECT_EQ(CredentialLedger::aggregate_level(9, 1, 7), 8);
    EXPECT_EQ(CredentialLedger::aggregate_level(10, 1, 1), 5);
    EXPECT_EQ(CredentialLedger::aggregate_level(8, 2, 10), 8);
    EXPECT_EQ(CredentialLedger::aggregate_level(1, 1, 1), 1);
}

// ============================================================================
// Minting and updating
// ============================================================================

TEST_F(CredentialLedgerTest, FirstProofMints) {
    auto result = credentials->apply_verified_proof("alice", "React", 85, "sol-1", 1);
    ASSERT_TRUE(result.is_ok());

    const auto& change = result.value();
    EXPECT_TRUE(change.minted);
    EXPECT_EQ(change.token_id, 1u);
    EXPECT_EQ(change.proficiency_level, 9);
    EXPECT_EQ(change.verification_count, 1u);

    auto credential = credentials->get_credential(change.token_id);
    ASSERT_TRUE(credential.has_value());
    EXPECT_EQ(credential->owner, "alice");
    EXPECT_EQ(credential->skill_type, "react");
    EXPECT_EQ(credential->solution_digests, (std::vector<std::string>{"sol-1"}));

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].event_type, ledger::EventType::CREDENTIAL_MINTED);
}

TEST_F(CredentialLedgerTest, SecondProofUpdatesSameCredential) {
    auto first = credentials->apply_verified_proof("alice", "react", 85, "sol-1", 1).value();
    auto second = credentials->apply_verified_proof("alice", " REACT ", 65, "sol-2", 2).value();

    EXPECT_FALSE(second.minted);
    EXPECT_EQ(second.token_id, first.token_id);
    EXPECT_EQ(second.previous_level, 9);
    EXPECT_EQ(second.proficiency_level, 8);
    EXPECT_EQ(second.verification_count, 2u);

    auto credential = credentials->get_credential(first.token_id);
    EXPECT_EQ(credential->solution_digests, (std::vector<std::string>{"sol-1", "sol-2"}));
    EXPECT_EQ(credentials->credential_count(), 1u);
    EXPECT_EQ(seen.back().event_type, ledger::EventType::CREDENTIAL_UPDATED);
}

TEST_F(CredentialLedgerTest, OneCredentialPerOwnerAndSkill) {
    credentials->apply_verified_proof("alice", "react", 70, "a", 1);
    credentials->apply_verified_proof("alice", "rust", 70, "b", 2);
    credentials->apply_verified_proof("bob", "react", 70, "c", 3);
    credentials->apply_verified_proof("alice", "react", 70, "d", 4);

    EXPECT_EQ(credentials->credential_count(), 3u);
    EXPECT_EQ(credentials->get_credentials_of("alice"), (std::vector<TokenId>{1, 2}));
    EXPECT_EQ(credentials->get_credentials_of("bob"), (std::vector<TokenId>{3}));
    EXPECT_EQ(credentials->find_credential("alice", "React"), 1u);
    EXPECT_EQ(credentials->find_credential("carol", "react"), NO_ID);
}

TEST_F(CredentialLedgerTest, AuditLogRecordsEveryApplication) {
    credentials->apply_verified_proof("alice", "react", 70, "a", 11);
    credentials->apply_verified_proof("alice", "react", 80, "b", 12);

    auto log = credentials->audit_log();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].proof_id, 11u);
    EXPECT_EQ(log[1].solution_digest, "b");
    EXPECT_EQ(log[1].token_id, 1u);
}

TEST_F(CredentialLedgerTest, InvalidApplicationsRejected) {
    auto score = credentials->apply_verified_proof("alice", "react", 101, "a");
    ASSERT_TRUE(score.is_err());
    EXPECT_EQ(score.error().code(), ErrorCode::InvalidScore);

    auto owner = credentials->apply_verified_proof("", "react", 50, "a");
    ASSERT_TRUE(owner.is_err());
    EXPECT_EQ(owner.error().code(), ErrorCode::InvalidArgument);

    auto tag = credentials->apply_verified_proof("alice", "", 50, "a");
    ASSERT_TRUE(tag.is_err());
    EXPECT_EQ(tag.error().code(), ErrorCode::InvalidTag);

    EXPECT_EQ(credentials->credential_count(), 0u);
    EXPECT_TRUE(credentials->audit_log().empty());
    EXPECT_TRUE(seen.empty());
}

TEST_F(CredentialLedgerTest, OwnerLookup) {
    credentials->apply_verified_proof("alice", "react", 50, "a");
    EXPECT_EQ(credentials->owner_of(1), std::optional<ParticipantId>("alice"));
    EXPECT_FALSE(credentials->owner_of(2).has_value());
}

TEST_F(CredentialLedgerTest, ImportRestoresPairIndex) {
    credentials->apply_verified_proof("alice", "react", 85, "a", 1);
    auto state = credentials->export_state();

    ledger::EventBus other_events;
    CredentialLedger restored(other_events);
    restored.import_state(state);

    auto change = restored.apply_verified_proof("alice", "react", 65, "b", 2);
    ASSERT_TRUE(change.is_ok());
    EXPECT_FALSE(change.value().minted);
    EXPECT_EQ(change.value().proficiency_level, 8);

    auto minted = restored.apply_verified_proof("bob", "react", 65, "c", 3);
    EXPECT_EQ(minted.value().token_id, 2u);
}
