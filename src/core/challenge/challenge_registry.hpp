#pragma once

#include "skillmint/common.hpp"
#include "skillmint/error.hpp"
#include "core/escrow/escrow.hpp"
#include "core/ledger/events.hpp"
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace skillmint::core {

/**
 * Challenge - A task posted by a creator with an escrowed reward
 *
 * `active` starts true and flips to false at most once.
 */
struct Challenge {
    ChallengeId id;
    std::string challenge_type;   // normalized type tag
    uint8_t difficulty;           // 1..10
    uint64_t time_limit;          // seconds, > 0
    Amount reward_amount;
    bool active;
    ParticipantId creator;
    std::string content_digest;   // opaque, supplied by the content generator
    uint64_t created_at;

    Challenge()
        : id(NO_ID), difficulty(0), time_limit(0), reward_amount(0),
          active(false), created_at(0) {}
};

/**
 * ChallengeRegistry - Creates and deactivates challenges
 *
 * Funds supplied at creation are escrowed with the EscrowPayout under the
 * new challenge id. Ids are allocated from a single counter starting at 1.
 */
class ChallengeRegistry {
public:
    ChallengeRegistry(EscrowPayout& escrow, ledger::EventBus& events);
    SKILLMINT_DISALLOW_COPY_AND_MOVE(ChallengeRegistry);

    /**
     * Create a challenge and escrow its funds
     * @param creator Participant posting the challenge
     * @param challenge_type Type tag, normalized before storage
     * @param difficulty Must be within [1, 10]
     * @param time_limit Seconds allowed for a solution, must be > 0
     * @param reward_amount Paid to each verified solver (subject to payout policy)
     * @param funds_provided Escrowed amount, must cover reward_amount
     * @param content_digest Opaque digest of the challenge content
     * @return New challenge id
     */
    Result<ChallengeId> create_challenge(
        const ParticipantId& creator,
        const std::string& challenge_type,
        uint32_t difficulty,
        uint64_t time_limit,
        Amount reward_amount,
        Amount funds_provided,
        const std::string& content_digest
    );

    /**
     * Deactivate a challenge. Creator only; idempotent.
     */
    Result<void> deactivate_challenge(ChallengeId challenge_id, const ParticipantId& caller);

    // Queries
    std::optional<Challenge> get_challenge(ChallengeId challenge_id) const;
    std::vector<ChallengeId> get_challenges_by(const ParticipantId& creator) const;
    bool is_active(ChallengeId challenge_id) const;
    size_t challenge_count() const;

    /**
     * Full registry state, used by snapshots
     */
    struct State {
        std::vector<Challenge> challenges;
        ChallengeId next_id = 1;
    };

    State export_state() const;
    void import_state(const State& state);

private:
    EscrowPayout& escrow_;
    ledger::EventBus& events_;

    mutable std::shared_mutex mutex_;
    std::map<ChallengeId, Challenge> challenges_;
    std::map<ParticipantId, std::vector<ChallengeId>> challenges_by_creator_;
    ChallengeId next_id_;

    static Result<void> validate(const std::string& normalized_type,
                                 uint32_t difficulty,
                                 uint64_t time_limit,
                                 Amount reward_amount,
                                 Amount funds_provided);
};

} // namespace skillmint::core
