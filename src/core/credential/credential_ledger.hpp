#pragma once

#include "skillmint/common.hpp"
#include "skillmint/error.hpp"
#include "core/ledger/events.hpp"
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace skillmint::core {

/**
 * Credential - Non-fungible record of a verified skill
 *
 * Unique per (owner, skill_type). proficiency_level stays within [1, 10];
 * verification_count only grows.
 */
struct Credential {
    TokenId token_id;
    ParticipantId owner;
    std::string skill_type;                     // normalized tag
    uint8_t proficiency_level;
    uint32_t verification_count;
    uint64_t created_at;
    uint64_t updated_at;
    std::vector<std::string> solution_digests;  // contribution order

    Credential()
        : token_id(NO_ID), proficiency_level(0), verification_count(0),
          created_at(0), updated_at(0) {}
};

/**
 * SolutionAuditEntry - One verified solution applied to a credential
 */
struct SolutionAuditEntry {
    TokenId token_id;
    ProofId proof_id;
    std::string solution_digest;
    uint64_t recorded_at;

    SolutionAuditEntry() : token_id(NO_ID), proof_id(NO_ID), recorded_at(0) {}
};

/**
 * CredentialChange - Outcome of applying a verified proof
 */
struct CredentialChange {
    TokenId token_id;
    ParticipantId owner;
    std::string skill_type;     // normalized
    bool minted;
    uint8_t previous_level;     // 0 when minted
    uint8_t proficiency_level;
    uint32_t verification_count;

    CredentialChange()
        : token_id(NO_ID), minted(false), previous_level(0),
          proficiency_level(0), verification_count(0) {}
};

/**
 * CredentialLedger - Mints and upgrades skill credentials
 *
 * Proficiency is a running floor-average of the per-proof level:
 *   updated = floor((level * count + new_level) / (count + 1))
 */
class CredentialLedger {
public:
    explicit CredentialLedger(ledger::EventBus& events);
    SKILLMINT_DISALLOW_COPY_AND_MOVE(CredentialLedger);

    /**
     * Map a score in [0, 100] to a proficiency level in [1, 10]
     */
    static uint8_t score_to_level(uint32_t score);

    /**
     * Fold one more level into a running average
     */
    static uint8_t aggregate_level(uint8_t current_level, uint32_t verification_count,
                                   uint8_t new_level);

    /**
     * Check that a proof could be applied, without changing state
     */
    static Result<void> check_application(const ParticipantId& owner,
                                          const std::string& skill_type,
                                          uint32_t score);

    /**
     * Mint a credential for (owner, skill_type) or fold the proof into the
     * existing one, then publish the change.
     * @param proof_id Proof being applied, recorded in the audit log
     */
    Result<CredentialChange> apply_verified_proof(
        const ParticipantId& owner,
        const std::string& skill_type,
        uint32_t score,
        const std::string& solution_digest,
        ProofId proof_id = NO_ID
    );

    /**
     * Same state change as apply_verified_proof, without publishing.
     * Callers that batch the change into a larger unit announce it once
     * the unit is committed.
     */
    Result<CredentialChange> record_verified_proof(
        const ParticipantId& owner,
        const std::string& skill_type,
        uint32_t score,
        const std::string& solution_digest,
        ProofId proof_id = NO_ID
    );

    /**
     * Log and publish CREDENTIAL_MINTED or CREDENTIAL_UPDATED for a change
     */
    void announce(const CredentialChange& change) const;

    /**
     * Credential ids of an owner in first-minted order
     */
    std::vector<TokenId> get_credentials_of(const ParticipantId& owner) const;

    std::optional<Credential> get_credential(TokenId token_id) const;

    /**
     * Token id for (owner, skill_type), or NO_ID
     */
    TokenId find_credential(const ParticipantId& owner, const std::string& skill_type) const;

    std::optional<ParticipantId> owner_of(TokenId token_id) const;

    std::vector<SolutionAuditEntry> audit_log() const;
    size_t credential_count() const;

    /**
     * Full ledger state, used by snapshots
     */
    struct State {
        std::vector<Credential> credentials;
        std::vector<SolutionAuditEntry> audit_log;
        TokenId next_token_id = 1;
    };

    State export_state() const;
    void import_state(const State& state);

private:
    ledger::EventBus& events_;

    mutable std::shared_mutex mutex_;
    std::map<TokenId, Credential> credentials_;
    std::map<std::pair<ParticipantId, std::string>, TokenId> credential_by_skill_;
    std::map<ParticipantId, std::vector<TokenId>> credentials_by_owner_;
    std::vector<SolutionAuditEntry> audit_log_;
    TokenId next_token_id_;
};

} // namespace skillmint::core
