#include "core/proof/proof_engine.hpp"
#include "skillmint/time_utils.hpp"
#include "utils/logger.hpp"
#include <functional>
#include <mutex>

namespace skillmint::core {

namespace {
    // Releases an in-flight claim on every exit path
    class ClaimGuard {
    public:
        ClaimGuard(std::function<void()> release) : release_(std::move(release)) {}
        ~ClaimGuard() { release_(); }
        SKILLMINT_DISALLOW_COPY_AND_MOVE(ClaimGuard);

    private:
        std::function<void()> release_;
    };
}

ProofSubmissionEngine::ProofSubmissionEngine(
    ChallengeRegistry& registry,
    CredentialLedger& credentials,
    EscrowPayout& escrow,
    ProofVerifier& verifier,
    ledger::EventBus& events
)
    : registry_(registry)
    , credentials_(credentials)
    , escrow_(escrow)
    , verifier_(verifier)
    , events_(events)
    , next_id_(1)
{
    SKILLMINT_LOG_DEBUG("Proof engine using verifier '{}'", verifier_.name());
}

Result<ProofId> ProofSubmissionEngine::submit_proof(
    ChallengeId challenge_id,
    const ParticipantId& solver,
    uint64_t completion_time,
    uint32_t score,
    const std::string& solution_digest,
    const std::string& external_proof
) {
    // A missing challenge reads as inactive
    auto challenge = registry_.get_challenge(challenge_id);
    if (!challenge || !challenge->active) {
        SKILLMINT_LOG_WARN("Rejected proof from {}: challenge {} not active", solver, challenge_id);
        return Result<ProofId>::Err(ErrorCode::ChallengeInactive,
            "challenge " + std::to_string(challenge_id) + " is not active");
    }
    if (completion_time > challenge->time_limit) {
        SKILLMINT_LOG_WARN("Rejected proof from {}: {}s exceeds limit of {}s",
                           solver, completion_time, challenge->time_limit);
        return Result<ProofId>::Err(Error(ErrorCode::TimeLimitExceeded,
            "completion time exceeds the challenge time limit",
            "completion=" + std::to_string(completion_time) +
            " limit=" + std::to_string(challenge->time_limit)));
    }
    if (score > constants::MAX_SCORE) {
        SKILLMINT_LOG_WARN("Rejected proof from {}: score {} out of range", solver, score);
        return Result<ProofId>::Err(Error(ErrorCode::InvalidScore,
            "score must be within [0, 100]", "score=" + std::to_string(score)));
    }
    if (solver.empty()) {
        return Result<ProofId>::Err(ErrorCode::InvalidArgument, "solver must not be empty");
    }

    Proof proof;
    proof.challenge_id = challenge_id;
    proof.solver = solver;
    proof.completion_time = completion_time;
    proof.score = score;
    proof.solution_digest = solution_digest;
    proof.external_proof = external_proof;
    proof.submitted_at = time::timestamp_seconds();

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        proof.id = next_id_++;
        proofs_[proof.id] = proof;
        proofs_by_solver_[solver].push_back(proof.id);
    }

    SKILLMINT_LOG_INFO("Proof {} submitted by {} for challenge {} (score {})",
                       proof.id, solver, challenge_id, score);
    events_.publish(ledger::EventType::PROOF_SUBMITTED, proof.id, solver, {
        {"challengeId", challenge_id},
        {"score", score},
        {"completionTime", completion_time}
    });

    return Result<ProofId>::Ok(proof.id);
}

Result<Proof> ProofSubmissionEngine::claim(ProofId proof_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = proofs_.find(proof_id);
    if (it == proofs_.end()) {
        return Result<Proof>::Err(ErrorCode::ProofNotFound,
            "proof " + std::to_string(proof_id) + " does not exist");
    }
    if (it->second.verified) {
        return Result<Proof>::Err(ErrorCode::ProofAlreadyVerified,
            "proof " + std::to_string(proof_id) + " is already verified");
    }
    if (!in_flight_.insert(proof_id).second) {
        return Result<Proof>::Err(ErrorCode::VerificationInProgress,
            "proof " + std::to_string(proof_id) + " is being verified");
    }
    return Result<Proof>::Ok(it->second);
}

void ProofSubmissionEngine::release_claim(ProofId proof_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    in_flight_.erase(proof_id);
}

void ProofSubmissionEngine::record_rejection(ProofId proof_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = proofs_.find(proof_id);
    if (it != proofs_.end()) {
        it->second.rejection_count++;
    }
}

void ProofSubmissionEngine::mark_verified(ProofId proof_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& proof = proofs_.at(proof_id);
    proof.verified = true;
    proof.verified_at = time::timestamp_seconds();
}

Result<VerificationOutcome> ProofSubmissionEngine::verify_proof(ProofId proof_id) {
    auto claimed = claim(proof_id);
    if (claimed.is_err()) {
        SKILLMINT_LOG_WARN("Verification of proof {} refused: {}",
                           proof_id, claimed.error().to_string());
        return Result<VerificationOutcome>::Err(claimed.error());
    }
    ClaimGuard guard([this, proof_id]() { release_claim(proof_id); });
    const Proof proof = claimed.value();

    // Sole suspension point: no ledger lock is held across the oracle call
    bool valid = false;
    try {
        valid = verifier_.verify(proof.external_proof);
    } catch (const std::exception& e) {
        SKILLMINT_LOG_ERROR("Verifier '{}' failed on proof {}: {}", verifier_.name(), proof_id, e.what());
        return Result<VerificationOutcome>::Err(Error(ErrorCode::VerifierFailure,
            "proof verifier raised an error", e.what()));
    }

    if (!valid) {
        record_rejection(proof_id);
        SKILLMINT_LOG_WARN("Proof {} rejected by verifier '{}'", proof_id, verifier_.name());
        events_.publish(ledger::EventType::VERIFICATION_FAILED, proof_id, proof.solver, {
            {"challengeId", proof.challenge_id}
        });

        VerificationOutcome outcome;
        outcome.proof_id = proof_id;
        outcome.valid = false;
        return Result<VerificationOutcome>::Ok(outcome);
    }

    return commit_verified(proof);
}

Result<VerificationOutcome> ProofSubmissionEngine::commit_verified(const Proof& proof) {
    auto challenge = registry_.get_challenge(proof.challenge_id);
    if (!challenge) {
        return Result<VerificationOutcome>::Err(ErrorCode::ChallengeNotFound,
            "challenge " + std::to_string(proof.challenge_id) + " does not exist");
    }

    auto applicable = CredentialLedger::check_application(
        proof.solver, challenge->challenge_type, proof.score);
    if (applicable.is_err()) {
        return Result<VerificationOutcome>::Err(applicable.error());
    }

    CredentialChange change;
    PayoutRecord payout;
    {
        // Snapshots wait for the whole unit; nothing is published in here
        std::shared_lock<std::shared_mutex> unit(commit_mutex_);

        auto released = escrow_.release(proof.challenge_id, proof.solver, proof.id);
        if (released.is_err()) {
            SKILLMINT_LOG_WARN("Proof {} verified by oracle but payout failed, nothing committed: {}",
                               proof.id, released.error().to_string());
            return Result<VerificationOutcome>::Err(released.error());
        }
        payout = released.value();

        try {
            auto recorded = credentials_.record_verified_proof(
                proof.solver, challenge->challenge_type, proof.score, proof.solution_digest, proof.id);
            if (recorded.is_err()) {
                escrow_.refund(payout);
                SKILLMINT_LOG_ERROR("Proof {} credential update failed, rolled back: {}",
                                    proof.id, recorded.error().to_string());
                return Result<VerificationOutcome>::Err(recorded.error());
            }
            change = recorded.value();
        } catch (const std::exception& e) {
            escrow_.refund(payout);
            SKILLMINT_LOG_ERROR("Proof {} credential update threw, rolled back: {}", proof.id, e.what());
            return Result<VerificationOutcome>::Err(Error(ErrorCode::Unknown,
                "credential update failed", e.what()));
        }

        mark_verified(proof.id);
    }

    VerificationOutcome outcome;
    outcome.proof_id = proof.id;
    outcome.valid = true;
    outcome.token_id = change.token_id;
    outcome.minted = change.minted;
    outcome.proficiency_level = change.proficiency_level;
    outcome.verification_count = change.verification_count;
    outcome.reward_paid = payout.amount;

    SKILLMINT_LOG_INFO("Proof {} verified: credential {} at level {}, reward {}",
                       proof.id, outcome.token_id, outcome.proficiency_level, outcome.reward_paid);

    credentials_.announce(change);
    events_.publish(ledger::EventType::PROOF_VERIFIED, proof.id, proof.solver, {
        {"challengeId", proof.challenge_id},
        {"skillType", challenge->challenge_type},
        {"score", proof.score},
        {"completionTime", proof.completion_time},
        {"solutionDigest", proof.solution_digest},
        {"tokenId", outcome.token_id},
        {"proficiencyLevel", outcome.proficiency_level},
        {"rewardPaid", outcome.reward_paid}
    });
    if (outcome.reward_paid > 0) {
        events_.publish(ledger::EventType::REWARD_RELEASED, proof.challenge_id, proof.solver, {
            {"proofId", proof.id},
            {"amount", outcome.reward_paid}
        });
    }

    return Result<VerificationOutcome>::Ok(outcome);
}

std::unique_lock<std::shared_mutex> ProofSubmissionEngine::pause_commits() const {
    return std::unique_lock<std::shared_mutex>(commit_mutex_);
}

std::optional<Proof> ProofSubmissionEngine::get_proof(ProofId proof_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = proofs_.find(proof_id);
    if (it == proofs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ProofId> ProofSubmissionEngine::get_proofs_by(const ParticipantId& solver) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = proofs_by_solver_.find(solver);
    if (it == proofs_by_solver_.end()) {
        return {};
    }
    return it->second;
}

size_t ProofSubmissionEngine::proof_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return proofs_.size();
}

ProofSubmissionEngine::State ProofSubmissionEngine::export_state() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    State state;
    for (const auto& [id, proof] : proofs_) {
        state.proofs.push_back(proof);
    }
    state.next_id = next_id_;
    return state;
}

void ProofSubmissionEngine::import_state(const State& state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    proofs_.clear();
    proofs_by_solver_.clear();
    in_flight_.clear();

    for (const auto& proof : state.proofs) {
        proofs_[proof.id] = proof;
    }
    for (const auto& [id, proof] : proofs_) {
        proofs_by_solver_[proof.solver].push_back(id);
    }
    next_id_ = state.next_id;
}

} // namespace skillmint::core
