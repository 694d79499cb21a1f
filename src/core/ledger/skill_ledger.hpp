#pragma once

#include "skillmint/common.hpp"
#include "skillmint/error.hpp"
#include "core/ledger/events.hpp"
#include "core/escrow/escrow.hpp"
#include "core/challenge/challenge_registry.hpp"
#include "core/credential/credential_ledger.hpp"
#include "core/proof/proof_engine.hpp"
#include "core/proof/verifier.hpp"
#include "core/account/account_binder.hpp"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace skillmint::ledger {

/**
 * LedgerSnapshot - Every persisted table and counter of a SkillLedger
 */
struct LedgerSnapshot {
    core::ChallengeRegistry::State challenges;
    core::ProofSubmissionEngine::State proofs;
    core::CredentialLedger::State credentials;
    core::EscrowPayout::State escrow;
};

/**
 * LedgerStatistics - Summary counts
 */
struct LedgerStatistics {
    size_t total_challenges;
    size_t total_proofs;
    size_t total_credentials;
    size_t total_payouts;
    Amount total_paid;

    std::string to_string() const;
};

/**
 * SkillLedger - The credential ledger as one unit
 *
 * Owns the components and wires them together:
 *   ChallengeRegistry -> EscrowPayout (deposit on create)
 *   ProofSubmissionEngine -> verifier, CredentialLedger, EscrowPayout
 *   AccountBinder -> CredentialLedger
 *
 * Mutating operations: create_challenge, deactivate_challenge,
 * submit_proof, verify_proof. Everything else is a read.
 */
class SkillLedger {
public:
    SkillLedger(std::unique_ptr<core::ProofVerifier> verifier,
                core::PayoutPolicy payout_policy = core::PayoutPolicy::DECREMENTING);
    ~SkillLedger() = default;
    SKILLMINT_DISALLOW_COPY_AND_MOVE(SkillLedger);

    /**
     * Register for ledger events
     */
    void subscribe(EventCallback callback);

    // Mutating operations
    Result<ChallengeId> create_challenge(
        const ParticipantId& creator,
        const std::string& challenge_type,
        uint32_t difficulty,
        uint64_t time_limit,
        Amount reward_amount,
        Amount funds_provided,
        const std::string& content_digest
    );

    Result<void> deactivate_challenge(ChallengeId challenge_id, const ParticipantId& caller);

    Result<ProofId> submit_proof(
        ChallengeId challenge_id,
        const ParticipantId& solver,
        uint64_t completion_time,
        uint32_t score,
        const std::string& solution_digest,
        const std::string& external_proof
    );

    Result<core::VerificationOutcome> verify_proof(ProofId proof_id);

    // On-demand account derivation
    Result<std::string> derive_account(TokenId token_id, const ParticipantId& requester);

    // Challenge queries
    std::optional<core::Challenge> get_challenge(ChallengeId challenge_id) const;
    std::vector<ChallengeId> get_challenges_by(const ParticipantId& creator) const;

    // Proof queries
    std::optional<core::Proof> get_proof(ProofId proof_id) const;
    std::vector<ProofId> get_proofs_by(const ParticipantId& solver) const;

    // Credential queries
    std::vector<TokenId> get_credentials_of(const ParticipantId& owner) const;
    std::optional<core::Credential> get_credential(TokenId token_id) const;
    TokenId find_credential(const ParticipantId& owner, const std::string& skill_type) const;
    std::vector<core::SolutionAuditEntry> audit_log() const;

    // Escrow queries
    Amount held_balance(ChallengeId challenge_id) const;
    Amount balance_of(const ParticipantId& participant) const;
    std::vector<core::PayoutRecord> payouts() const;

    LedgerStatistics statistics() const;

    /**
     * Copy out every table as one consistent cut. Waits for in-progress
     * challenge creations and verification commits; never captures half
     * of either. Must not be called from a CHALLENGE_CREATED subscriber,
     * which still runs inside the creation.
     */
    LedgerSnapshot snapshot() const;

    /**
     * Replace all state with a snapshot. Same locking as snapshot().
     */
    void restore(const LedgerSnapshot& snapshot);

    // Component access
    core::ChallengeRegistry& registry() { return registry_; }
    core::ProofSubmissionEngine& proofs() { return proofs_; }
    core::CredentialLedger& credentials() { return credentials_; }
    core::EscrowPayout& escrow() { return escrow_; }
    const core::ProofVerifier& verifier() const { return *verifier_; }

private:
    std::unique_ptr<core::ProofVerifier> verifier_;
    EventBus events_;
    core::EscrowPayout escrow_;
    core::ChallengeRegistry registry_;
    core::CredentialLedger credentials_;
    core::ProofSubmissionEngine proofs_;
    core::AccountBinder accounts_;

    // Shared by challenge creation (registry + escrow), exclusive for snapshot/restore
    mutable std::shared_mutex snapshot_mutex_;
};

} // namespace skillmint::ledger
