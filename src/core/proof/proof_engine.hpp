#pragma once

#include "skillmint/common.hpp"
#include "skillmint/error.hpp"
#include "core/challenge/challenge_registry.hpp"
#include "core/credential/credential_ledger.hpp"
#include "core/escrow/escrow.hpp"
#include "core/proof/verifier.hpp"
#include "core/ledger/events.hpp"
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace skillmint::core {

/**
 * Proof - A solver's submission against a challenge
 *
 * `verified` goes false -> true at most once and never reverts.
 */
struct Proof {
    ProofId id;
    ChallengeId challenge_id;
    ParticipantId solver;
    uint64_t completion_time;     // seconds taken by the solver
    uint32_t score;               // 0..100
    std::string solution_digest;
    std::string external_proof;   // opaque token for the verifier oracle
    bool verified;
    uint64_t submitted_at;
    uint64_t verified_at;         // 0 until verified
    uint32_t rejection_count;     // oracle rejections seen so far

    Proof()
        : id(NO_ID), challenge_id(NO_ID), completion_time(0), score(0),
          verified(false), submitted_at(0), verified_at(0), rejection_count(0) {}
};

/**
 * VerificationOutcome - What a verify call did
 *
 * `valid == false` means the oracle rejected the proof and nothing changed
 * besides the rejection count.
 */
struct VerificationOutcome {
    ProofId proof_id;
    bool valid;
    TokenId token_id;
    bool minted;
    uint8_t proficiency_level;
    uint32_t verification_count;
    Amount reward_paid;

    VerificationOutcome()
        : proof_id(NO_ID), valid(false), token_id(NO_ID), minted(false),
          proficiency_level(0), verification_count(0), reward_paid(0) {}
};

/**
 * ProofSubmissionEngine - Records proofs and drives verification
 *
 * Verification claims the proof under the engine lock (compare-and-set
 * against `verified` and any in-flight claim), calls the oracle with no
 * lock held, then commits in this order:
 *   1. escrow release      (may fail: nothing to undo)
 *   2. credential apply    (on failure the release is refunded)
 *   3. verified flag flip  (cannot fail)
 * A failed unit leaves the proof unverified and retryable. Events for the
 * unit are published only after step 3.
 */
class ProofSubmissionEngine {
public:
    ProofSubmissionEngine(
        ChallengeRegistry& registry,
        CredentialLedger& credentials,
        EscrowPayout& escrow,
        ProofVerifier& verifier,
        ledger::EventBus& events
    );
    SKILLMINT_DISALLOW_COPY_AND_MOVE(ProofSubmissionEngine);

    /**
     * Store an unverified proof
     * @return New proof id
     */
    Result<ProofId> submit_proof(
        ChallengeId challenge_id,
        const ParticipantId& solver,
        uint64_t completion_time,
        uint32_t score,
        const std::string& solution_digest,
        const std::string& external_proof
    );

    /**
     * Verify a proof with the oracle and, if valid, mint/update the
     * solver's credential and release the reward as one unit.
     */
    Result<VerificationOutcome> verify_proof(ProofId proof_id);

    /**
     * Block verification commits for as long as the returned lock is held.
     * A commit already in progress finishes first. Oracle calls continue.
     */
    std::unique_lock<std::shared_mutex> pause_commits() const;

    // Queries
    std::optional<Proof> get_proof(ProofId proof_id) const;
    std::vector<ProofId> get_proofs_by(const ParticipantId& solver) const;
    size_t proof_count() const;

    /**
     * Full engine state, used by snapshots. In-flight claims are not part
     * of it.
     */
    struct State {
        std::vector<Proof> proofs;
        ProofId next_id = 1;
    };

    State export_state() const;
    void import_state(const State& state);

private:
    ChallengeRegistry& registry_;
    CredentialLedger& credentials_;
    EscrowPayout& escrow_;
    ProofVerifier& verifier_;
    ledger::EventBus& events_;

    mutable std::shared_mutex mutex_;
    mutable std::shared_mutex commit_mutex_;    // shared per commit, exclusive to pause
    std::map<ProofId, Proof> proofs_;
    std::map<ParticipantId, std::vector<ProofId>> proofs_by_solver_;
    std::set<ProofId> in_flight_;
    ProofId next_id_;

    Result<Proof> claim(ProofId proof_id);
    void release_claim(ProofId proof_id);
    void record_rejection(ProofId proof_id);
    void mark_verified(ProofId proof_id);
    Result<VerificationOutcome> commit_verified(const Proof& proof);
};

} // namespace skillmint::core
