#include "core/credential/credential_ledger.hpp"
#include "skillmint/time_utils.hpp"
#include "utils/logger.hpp"
#include <mutex>

namespace skillmint::core {

CredentialLedger::CredentialLedger(ledger::EventBus& events)
    : events_(events), next_token_id_(1)
{
}

uint8_t CredentialLedger::score_to_level(uint32_t score) {
    if (score >= 90) return 10;
    if (score >= 80) return 9;
    if (score >= 70) return 8;
    if (score >= 60) return 7;
    if (score >= 50) return 6;
    if (score >= 40) return 5;
    if (score >= 30) return 4;
    if (score >= 20) return 3;
    if (score >= 10) return 2;
    return 1;
}

uint8_t CredentialLedger::aggregate_level(uint8_t current_level, uint32_t verification_count,
                                          uint8_t new_level) {
    uint64_t total = static_cast<uint64_t>(current_level) * verification_count + new_level;
    return static_cast<uint8_t>(total / (static_cast<uint64_t>(verification_count) + 1));
}

Result<void> CredentialLedger::check_application(const ParticipantId& owner,
                                                 const std::string& skill_type,
                                                 uint32_t score) {
    if (score > constants::MAX_SCORE) {
        return Result<void>::Err(Error(ErrorCode::InvalidScore,
            "score must be within [0, 100]", "score=" + std::to_string(score)));
    }
    if (owner.empty()) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "credential owner must not be empty");
    }
    if (normalize_tag(skill_type).empty()) {
        return Result<void>::Err(ErrorCode::InvalidTag, "skill type must not be empty");
    }
    return Result<void>::Ok();
}

Result<CredentialChange> CredentialLedger::apply_verified_proof(
    const ParticipantId& owner,
    const std::string& skill_type,
    uint32_t score,
    const std::string& solution_digest,
    ProofId proof_id
) {
    auto change = record_verified_proof(owner, skill_type, score, solution_digest, proof_id);
    if (change.is_ok()) {
        announce(change.value());
    }
    return change;
}

Result<CredentialChange> CredentialLedger::record_verified_proof(
    const ParticipantId& owner,
    const std::string& skill_type,
    uint32_t score,
    const std::string& solution_digest,
    ProofId proof_id
) {
    auto valid = check_application(owner, skill_type, score);
    if (valid.is_err()) {
        return Result<CredentialChange>::Err(valid.error());
    }

    auto skill = normalize_tag(skill_type);
    auto new_level = score_to_level(score);
    auto now = time::timestamp_seconds();

    CredentialChange change;
    change.owner = owner;
    change.skill_type = skill;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto key = std::make_pair(owner, skill);
        auto existing = credential_by_skill_.find(key);

        if (existing == credential_by_skill_.end()) {
            Credential credential;
            credential.token_id = next_token_id_++;
            credential.owner = owner;
            credential.skill_type = skill;
            credential.proficiency_level = new_level;
            credential.verification_count = 1;
            credential.created_at = now;
            credential.updated_at = now;
            credential.solution_digests.push_back(solution_digest);

            credentials_[credential.token_id] = credential;
            credential_by_skill_[key] = credential.token_id;
            credentials_by_owner_[owner].push_back(credential.token_id);

            change.token_id = credential.token_id;
            change.minted = true;
            change.proficiency_level = new_level;
            change.verification_count = 1;
        } else {
            auto& credential = credentials_.at(existing->second);

            change.token_id = credential.token_id;
            change.previous_level = credential.proficiency_level;

            credential.proficiency_level = aggregate_level(
                credential.proficiency_level, credential.verification_count, new_level);
            credential.verification_count++;
            credential.updated_at = now;
            credential.solution_digests.push_back(solution_digest);

            change.proficiency_level = credential.proficiency_level;
            change.verification_count = credential.verification_count;
        }

        SolutionAuditEntry entry;
        entry.token_id = change.token_id;
        entry.proof_id = proof_id;
        entry.solution_digest = solution_digest;
        entry.recorded_at = now;
        audit_log_.push_back(entry);
    }

    return Result<CredentialChange>::Ok(change);
}

void CredentialLedger::announce(const CredentialChange& change) const {
    if (change.minted) {
        SKILLMINT_LOG_INFO("Minted credential {} for {} ({}) at level {}",
                           change.token_id, change.owner, change.skill_type, change.proficiency_level);
        events_.publish(ledger::EventType::CREDENTIAL_MINTED, change.token_id, change.owner, {
            {"skillType", change.skill_type},
            {"proficiencyLevel", change.proficiency_level}
        });
    } else {
        SKILLMINT_LOG_INFO("Updated credential {} for {} ({}): level {} -> {}, {} verifications",
                           change.token_id, change.owner, change.skill_type, change.previous_level,
                           change.proficiency_level, change.verification_count);
        events_.publish(ledger::EventType::CREDENTIAL_UPDATED, change.token_id, change.owner, {
            {"skillType", change.skill_type},
            {"previousLevel", change.previous_level},
            {"proficiencyLevel", change.proficiency_level},
            {"verificationCount", change.verification_count}
        });
    }
}

std::vector<TokenId> CredentialLedger::get_credentials_of(const ParticipantId& owner) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = credentials_by_owner_.find(owner);
    if (it == credentials_by_owner_.end()) {
        return {};
    }
    return it->second;
}

std::optional<Credential> CredentialLedger::get_credential(TokenId token_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = credentials_.find(token_id);
    if (it == credentials_.end()) {
        return std::nullopt;
    }
    return it->second;
}

TokenId CredentialLedger::find_credential(const ParticipantId& owner,
                                          const std::string& skill_type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = credential_by_skill_.find(std::make_pair(owner, normalize_tag(skill_type)));
    return it == credential_by_skill_.end() ? NO_ID : it->second;
}

std::optional<ParticipantId> CredentialLedger::owner_of(TokenId token_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = credentials_.find(token_id);
    if (it == credentials_.end()) {
        return std::nullopt;
    }
    return it->second.owner;
}

std::vector<SolutionAuditEntry> CredentialLedger::audit_log() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return audit_log_;
}

size_t CredentialLedger::credential_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return credentials_.size();
}

CredentialLedger::State CredentialLedger::export_state() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    State state;
    for (const auto& [id, credential] : credentials_) {
        state.credentials.push_back(credential);
    }
    state.audit_log = audit_log_;
    state.next_token_id = next_token_id_;
    return state;
}

void CredentialLedger::import_state(const State& state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    credentials_.clear();
    credential_by_skill_.clear();
    credentials_by_owner_.clear();

    for (const auto& credential : state.credentials) {
        credentials_[credential.token_id] = credential;
    }
    // Token ids are minted in order, so ascending id is first-minted order
    for (const auto& [id, credential] : credentials_) {
        credential_by_skill_[std::make_pair(credential.owner, credential.skill_type)] = id;
        credentials_by_owner_[credential.owner].push_back(id);
    }
    audit_log_ = state.audit_log;
    next_token_id_ = state.next_token_id;
}

} // namespace skillmint::core
