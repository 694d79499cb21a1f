#include "core/proof/proof_engine.hpp"
#include "core/proof/verifier.hpp"
#include "core/challenge/challenge_registry.hpp"
#include "core/credential/credential_ledger.hpp"
#include "core/escrow/escrow.hpp"
#include "core/ledger/events.hpp"
#include "utils/logger.hpp"
#include "skillmint/common.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>

using namespace skillmint;
using namespace skillmint::core;

class ProofEngineTest : public ::testing::Test {
protected:
    ledger::EventBus events;
    EscrowPayout escrow;
    ChallengeRegistry registry{escrow, events};
    CredentialLedger credentials{events};

    // Oracle verdict driven by the test
    std::function<bool(const std::string&)> oracle = [](const std::string&) { return true; };
    CallbackVerifier verifier{[this](const std::string& token) { return oracle(token); }};

    ProofSubmissionEngine engine{registry, credentials, escrow, verifier, events};
    std::vector<ledger::LedgerEvent> seen;

    void SetUp() override {
        utils::Logger::init("off");
        events.subscribe([this](const ledger::LedgerEvent& event) { seen.push_back(event); });
    }

    ChallengeId make_challenge(Amount reward = 100, Amount funds = 1000, uint64_t time_limit = 3600) {
        return registry.create_challenge("alice", "react", 4, time_limit, reward, funds, "content").value();
    }

    ProofId submit(ChallengeId challenge, const std::string& solver = "bob", uint32_t score = 85) {
        return engine.submit_proof(challenge, solver, 600, score, "solution", "token").value();
    }

    size_t count_events(ledger::EventType type) const {
        size_t count = 0;
        for (const auto& event : seen) {
            if (event.event_type == type) {
                count++;
            }
        }
        return count;
    }
};

// ============================================================================
// Submission
// ============================================================================

TEST_F(ProofEngineTest, SubmitStoresUnverifiedProof) {
    auto challenge = make_challenge();
    auto id = submit(challenge);
    EXPECT_EQ(id, 1u);

    auto proof = engine.get_proof(id);
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->challenge_id, challenge);
    EXPECT_EQ(proof->solver, "bob");
    EXPECT_EQ(proof->score, 85u);
    EXPECT_FALSE(proof->verified);
    EXPECT_EQ(proof->verified_at, 0u);
    EXPECT_EQ(count_events(ledger::EventType::PROOF_SUBMITTED), 1u);
}

TEST_F(ProofEngineTest, SubmitToInactiveChallenge) {
    auto challenge = make_challenge();
    ASSERT_TRUE(registry.deactivate_challenge(challenge, "alice").is_ok());

    auto result = engine.submit_proof(challenge, "bob", 60, 80, "s", "t");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ChallengeInactive);
    EXPECT_EQ(result.error().category(), ErrorCategory::State);
}

TEST_F(ProofEngineTest, SubmitToUnknownChallengeReadsAsInactive) {
    auto result = engine.submit_proof(77, "bob", 60, 80, "s", "t");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ChallengeInactive);
}

TEST_F(ProofEngineTest, TimeLimitIsInclusive) {
    auto challenge = make_challenge(100, 1000, 600);
    EXPECT_TRUE(engine.submit_proof(challenge, "bob", 600, 80, "s", "t").is_ok());

    auto late = engine.submit_proof(challenge, "bob", 601, 80, "s", "t");
    ASSERT_TRUE(late.is_err());
    EXPECT_EQ(late.error().code(), ErrorCode::TimeLimitExceeded);
}

TEST_F(ProofEngineTest, ScoreAboveHundredRejected) {
    auto challenge = make_challenge();
    auto result = engine.submit_proof(challenge, "bob", 60, 101, "s", "t");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidScore);
    EXPECT_EQ(engine.proof_count(), 0u);
}

TEST_F(ProofEngineTest, ProofsBySolver) {
    auto challenge = make_challenge();
    submit(challenge, "bob");
    submit(challenge, "carol");
    submit(challenge, "bob");
    EXPECT_EQ(engine.get_proofs_by("bob"), (std::vector<ProofId>{1, 3}));
}

// ============================================================================
// Verification
// ============================================================================

TEST_F(ProofEngineTest, VerifyMintsAndPays) {
    auto challenge = make_challenge(100, 1000);
    auto id = submit(challenge);

    auto result = engine.verify_proof(id);
    ASSERT_TRUE(result.is_ok());
    const auto& outcome = result.value();
    EXPECT_TRUE(outcome.valid);
    EXPECT_TRUE(outcome.minted);
    EXPECT_EQ(outcome.proficiency_level, 9);
    EXPECT_EQ(outcome.reward_paid, 100u);

    EXPECT_TRUE(engine.get_proof(id)->verified);
    EXPECT_GT(engine.get_proof(id)->verified_at, 0u);
    EXPECT_EQ(escrow.balance_of("bob"), 100u);
    EXPECT_EQ(escrow.held_balance(challenge), 900u);
    EXPECT_EQ(credentials.find_credential("bob", "react"), outcome.token_id);

    EXPECT_EQ(count_events(ledger::EventType::PROOF_VERIFIED), 1u);
    EXPECT_EQ(count_events(ledger::EventType::CREDENTIAL_MINTED), 1u);
    EXPECT_EQ(count_events(ledger::EventType::REWARD_RELEASED), 1u);
}

TEST_F(ProofEngineTest, RepeatedVerificationsAverageLevel) {
    auto challenge = make_challenge();
    auto first = engine.submit_proof(challenge, "bob", 60, 85, "s1", "t").value();
    auto second = engine.submit_proof(challenge, "bob", 60, 65, "s2", "t").value();

    ASSERT_TRUE(engine.verify_proof(first).is_ok());
    auto outcome = engine.verify_proof(second).value();

    EXPECT_FALSE(outcome.minted);
    EXPECT_EQ(outcome.proficiency_level, 8);
    EXPECT_EQ(outcome.verification_count, 2u);
    EXPECT_EQ(escrow.balance_of("bob"), 200u);
}

TEST_F(ProofEngineTest, VerifyTwiceFails) {
    auto id = submit(make_challenge());
    ASSERT_TRUE(engine.verify_proof(id).is_ok());

    auto again = engine.verify_proof(id);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.error().code(), ErrorCode::ProofAlreadyVerified);
    EXPECT_EQ(escrow.balance_of("bob"), 100u);
    EXPECT_EQ(credentials.get_credential(1)->verification_count, 1u);
}

TEST_F(ProofEngineTest, VerifyUnknownProof) {
    auto result = engine.verify_proof(5);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ProofNotFound);
}

TEST_F(ProofEngineTest, RejectedProofChangesNothing) {
    oracle = [](const std::string&) { return false; };
    auto challenge = make_challenge();
    auto id = submit(challenge);

    auto result = engine.verify_proof(id);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().valid);

    auto proof = engine.get_proof(id);
    EXPECT_FALSE(proof->verified);
    EXPECT_EQ(proof->rejection_count, 1u);
    EXPECT_EQ(credentials.credential_count(), 0u);
    EXPECT_EQ(escrow.held_balance(challenge), 1000u);
    EXPECT_EQ(count_events(ledger::EventType::VERIFICATION_FAILED), 1u);

    // The oracle is asked again on retry
    oracle = [](const std::string&) { return true; };
    EXPECT_TRUE(engine.verify_proof(id).value().valid);
}

TEST_F(ProofEngineTest, VerifierExceptionIsReported) {
    oracle = [](const std::string&) -> bool { throw std::runtime_error("oracle offline"); };
    auto id = submit(make_challenge());

    auto result = engine.verify_proof(id);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::VerifierFailure);
    EXPECT_EQ(result.error().category(), ErrorCategory::Internal);
    EXPECT_FALSE(engine.get_proof(id)->verified);

    oracle = [](const std::string&) { return true; };
    EXPECT_TRUE(engine.verify_proof(id).is_ok());
}

TEST_F(ProofEngineTest, ExhaustedEscrowRollsBackWholeUnit) {
    auto challenge = make_challenge(100, 100);
    auto first = submit(challenge, "bob");
    auto second = submit(challenge, "carol");

    ASSERT_TRUE(engine.verify_proof(first).is_ok());

    auto result = engine.verify_proof(second);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::InsufficientEscrow);

    EXPECT_FALSE(engine.get_proof(second)->verified);
    EXPECT_EQ(credentials.find_credential("carol", "react"), NO_ID);
    EXPECT_EQ(escrow.balance_of("carol"), 0u);
    EXPECT_EQ(escrow.held_balance(challenge), 0u);
    EXPECT_EQ(count_events(ledger::EventType::PROOF_VERIFIED), 1u);
}

TEST_F(ProofEngineTest, DeactivatedChallengeStillPaysSubmittedProof) {
    auto challenge = make_challenge();
    auto id = submit(challenge);
    ASSERT_TRUE(registry.deactivate_challenge(challenge, "alice").is_ok());

    auto result = engine.verify_proof(id);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().valid);
}

TEST_F(ProofEngineTest, ConcurrentVerifyIsRefused) {
    std::promise<void> entered;
    std::promise<void> gate;
    auto gate_open = gate.get_future().share();
    std::atomic<int> oracle_calls{0};

    oracle = [&](const std::string&) {
        if (oracle_calls.fetch_add(1) == 0) {
            entered.set_value();
        }
        gate_open.wait();
        return true;
    };

    auto id = submit(make_challenge());

    std::thread first([&]() {
        auto result = engine.verify_proof(id);
        EXPECT_TRUE(result.is_ok());
    });

    entered.get_future().wait();
    auto second = engine.verify_proof(id);
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.error().code(), ErrorCode::VerificationInProgress);

    gate.set_value();
    first.join();

    EXPECT_EQ(oracle_calls.load(), 1);
    EXPECT_EQ(escrow.balance_of("bob"), 100u);
    EXPECT_EQ(credentials.get_credential(1)->verification_count, 1u);

    auto third = engine.verify_proof(id);
    ASSERT_TRUE(third.is_err());
    EXPECT_EQ(third.error().code(), ErrorCode::ProofAlreadyVerified);
}

TEST_F(ProofEngineTest, ManyThreadsOnePayout) {
    auto id = submit(make_challenge());
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (engine.verify_proof(id).is_ok()) {
                successes++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(escrow.balance_of("bob"), 100u);
    EXPECT_EQ(escrow.payouts().size(), 1u);
}

// ============================================================================
// Event delivery
// ============================================================================

TEST_F(ProofEngineTest, ThrowingSubscriberDoesNotSplitVerification) {
    events.subscribe([](const ledger::LedgerEvent& event) {
        if (event.event_type == ledger::EventType::CREDENTIAL_MINTED) {
            throw std::runtime_error("subscriber failed");
        }
    });

    auto challenge = make_challenge(100, 1000);
    auto id = submit(challenge);

    auto result = engine.verify_proof(id);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().valid);
    EXPECT_TRUE(engine.get_proof(id)->verified);

    auto retry = engine.verify_proof(id);
    ASSERT_TRUE(retry.is_err());
    EXPECT_EQ(retry.error().code(), ErrorCode::ProofAlreadyVerified);

    EXPECT_EQ(escrow.balance_of("bob"), 100u);
    EXPECT_EQ(escrow.payouts().size(), 1u);
    EXPECT_EQ(credentials.get_credential(result.value().token_id)->verification_count, 1u);

    // Later subscribers still see the rest of the unit
    EXPECT_EQ(count_events(ledger::EventType::PROOF_VERIFIED), 1u);
    EXPECT_EQ(count_events(ledger::EventType::REWARD_RELEASED), 1u);
}

TEST_F(ProofEngineTest, EventsFollowCommittedUnit) {
    auto challenge = make_challenge(100, 1000);
    auto id = submit(challenge);

    bool verified_when_minted = false;
    Amount balance_when_minted = 0;
    events.subscribe([&](const ledger::LedgerEvent& event) {
        if (event.event_type == ledger::EventType::CREDENTIAL_MINTED) {
            verified_when_minted = engine.get_proof(id)->verified;
            balance_when_minted = escrow.balance_of("bob");
        }
    });

    ASSERT_TRUE(engine.verify_proof(id).is_ok());
    EXPECT_TRUE(verified_when_minted);
    EXPECT_EQ(balance_when_minted, 100u);
}
