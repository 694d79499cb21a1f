#include "core/ledger/skill_ledger.hpp"
#include "utils/logger.hpp"
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace skillmint::ledger {

namespace {
    std::unique_ptr<core::ProofVerifier> require_verifier(std::unique_ptr<core::ProofVerifier> verifier) {
        if (!verifier) {
            throw std::invalid_argument("SkillLedger requires a proof verifier");
        }
        return verifier;
    }
}

std::string LedgerStatistics::to_string() const {
    std::ostringstream oss;
    oss << "Ledger statistics:\n";
    oss << "  Challenges: " << total_challenges << "\n";
    oss << "  Proofs: " << total_proofs << "\n";
    oss << "  Credentials: " << total_credentials << "\n";
    oss << "  Payouts: " << total_payouts << " (" << total_paid << " paid)";
    return oss.str();
}

SkillLedger::SkillLedger(std::unique_ptr<core::ProofVerifier> verifier,
                         core::PayoutPolicy payout_policy)
    : verifier_(require_verifier(std::move(verifier)))
    , escrow_(payout_policy)
    , registry_(escrow_, events_)
    , credentials_(events_)
    , proofs_(registry_, credentials_, escrow_, *verifier_, events_)
    , accounts_(credentials_, events_)
{
    SKILLMINT_LOG_INFO("SkillLedger initialized (verifier: {}, payout policy: {})",
                       verifier_->name(), core::payout_policy_to_string(payout_policy));
}

void SkillLedger::subscribe(EventCallback callback) {
    events_.subscribe(std::move(callback));
}

Result<ChallengeId> SkillLedger::create_challenge(
    const ParticipantId& creator,
    const std::string& challenge_type,
    uint32_t difficulty,
    uint64_t time_limit,
    Amount reward_amount,
    Amount funds_provided,
    const std::string& content_digest
) {
    std::shared_lock<std::shared_mutex> lock(snapshot_mutex_);
    return registry_.create_challenge(creator, challenge_type, difficulty, time_limit,
                                      reward_amount, funds_provided, content_digest);
}

Result<void> SkillLedger::deactivate_challenge(ChallengeId challenge_id, const ParticipantId& caller) {
    return registry_.deactivate_challenge(challenge_id, caller);
}

Result<ProofId> SkillLedger::submit_proof(
    ChallengeId challenge_id,
    const ParticipantId& solver,
    uint64_t completion_time,
    uint32_t score,
    const std::string& solution_digest,
    const std::string& external_proof
) {
    return proofs_.submit_proof(challenge_id, solver, completion_time, score,
                                solution_digest, external_proof);
}

Result<core::VerificationOutcome> SkillLedger::verify_proof(ProofId proof_id) {
    return proofs_.verify_proof(proof_id);
}

Result<std::string> SkillLedger::derive_account(TokenId token_id, const ParticipantId& requester) {
    return accounts_.derive_account(token_id, requester);
}

std::optional<core::Challenge> SkillLedger::get_challenge(ChallengeId challenge_id) const {
    return registry_.get_challenge(challenge_id);
}

std::vector<ChallengeId> SkillLedger::get_challenges_by(const ParticipantId& creator) const {
    return registry_.get_challenges_by(creator);
}

std::optional<core::Proof> SkillLedger::get_proof(ProofId proof_id) const {
    return proofs_.get_proof(proof_id);
}

std::vector<ProofId> SkillLedger::get_proofs_by(const ParticipantId& solver) const {
    return proofs_.get_proofs_by(solver);
}

std::vector<TokenId> SkillLedger::get_credentials_of(const ParticipantId& owner) const {
    return credentials_.get_credentials_of(owner);
}

std::optional<core::Credential> SkillLedger::get_credential(TokenId token_id) const {
    return credentials_.get_credential(token_id);
}

TokenId SkillLedger::find_credential(const ParticipantId& owner, const std::string& skill_type) const {
    return credentials_.find_credential(owner, skill_type);
}

std::vector<core::SolutionAuditEntry> SkillLedger::audit_log() const {
    return credentials_.audit_log();
}

Amount SkillLedger::held_balance(ChallengeId challenge_id) const {
    return escrow_.held_balance(challenge_id);
}

Amount SkillLedger::balance_of(const ParticipantId& participant) const {
    return escrow_.balance_of(participant);
}

std::vector<core::PayoutRecord> SkillLedger::payouts() const {
    return escrow_.payouts();
}

LedgerStatistics SkillLedger::statistics() const {
    LedgerStatistics stats;
    stats.total_challenges = registry_.challenge_count();
    stats.total_proofs = proofs_.proof_count();
    stats.total_credentials = credentials_.credential_count();

    auto records = escrow_.payouts();
    stats.total_payouts = records.size();
    stats.total_paid = 0;
    for (const auto& record : records) {
        stats.total_paid += record.amount;
    }
    return stats;
}

LedgerSnapshot SkillLedger::snapshot() const {
    std::unique_lock<std::shared_mutex> lock(snapshot_mutex_);
    auto commits = proofs_.pause_commits();

    LedgerSnapshot snapshot;
    snapshot.challenges = registry_.export_state();
    snapshot.proofs = proofs_.export_state();
    snapshot.credentials = credentials_.export_state();
    snapshot.escrow = escrow_.export_state();
    return snapshot;
}

void SkillLedger::restore(const LedgerSnapshot& snapshot) {
    std::unique_lock<std::shared_mutex> lock(snapshot_mutex_);
    auto commits = proofs_.pause_commits();

    escrow_.import_state(snapshot.escrow);
    registry_.import_state(snapshot.challenges);
    credentials_.import_state(snapshot.credentials);
    proofs_.import_state(snapshot.proofs);

    SKILLMINT_LOG_INFO("Ledger restored: {} challenges, {} proofs, {} credentials",
                       snapshot.challenges.challenges.size(),
                       snapshot.proofs.proofs.size(),
                       snapshot.credentials.credentials.size());
}

} // namespace skillmint::ledger
