#pragma once

#include "skillmint/common.hpp"
#include "skillmint/error.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace skillmint::core {

/**
 * PayoutPolicy - How repeated releases against one challenge are funded
 */
enum class PayoutPolicy : uint8_t {
    DECREMENTING = 1,        // Debit the held balance; fail once exhausted
    ONCE_PER_CHALLENGE = 2,  // Pay at most one reward per challenge
    UNBOUNDED = 3            // Pay every release without debiting (legacy behaviour)
};

const char* payout_policy_to_string(PayoutPolicy policy);
std::optional<PayoutPolicy> payout_policy_from_string(const std::string& name);

/**
 * EscrowAccount - Funds held against a single challenge
 */
struct EscrowAccount {
    ChallengeId challenge_id;
    Amount reward_amount;
    Amount deposited;
    Amount held;
    uint32_t payouts;

    EscrowAccount()
        : challenge_id(NO_ID), reward_amount(0), deposited(0), held(0), payouts(0) {}
};

/**
 * PayoutRecord - A completed transfer to a solver
 */
struct PayoutRecord {
    uint64_t sequence;
    ChallengeId challenge_id;
    ProofId proof_id;
    ParticipantId recipient;
    Amount amount;
    uint64_t paid_at;

    PayoutRecord()
        : sequence(0), challenge_id(NO_ID), proof_id(NO_ID), amount(0), paid_at(0) {}
};

/**
 * EscrowPayout - Holds challenge funds and releases rewards to solvers
 *
 * A release that yields amount 0 (zero-reward challenge) moves nothing and
 * leaves no payout record.
 */
class EscrowPayout {
public:
    explicit EscrowPayout(PayoutPolicy policy = PayoutPolicy::DECREMENTING);
    SKILLMINT_DISALLOW_COPY_AND_MOVE(EscrowPayout);

    PayoutPolicy policy() const { return policy_; }

    /**
     * Open the escrow account for a new challenge
     * @param challenge_id Challenge the funds are held against
     * @param reward_amount Reward paid per release
     * @param funds Amount deposited by the creator
     */
    Result<void> deposit(ChallengeId challenge_id, Amount reward_amount, Amount funds);

    /**
     * Transfer the challenge reward to a recipient
     * @return The payout record (amount 0 for zero-reward challenges)
     */
    Result<PayoutRecord> release(ChallengeId challenge_id,
                                 const ParticipantId& recipient,
                                 ProofId proof_id = NO_ID);

    /**
     * Undo a release. Only used to roll back a failed verification unit.
     */
    void refund(const PayoutRecord& receipt);

    // Queries
    std::optional<EscrowAccount> get_account(ChallengeId challenge_id) const;
    Amount held_balance(ChallengeId challenge_id) const;
    Amount balance_of(const ParticipantId& participant) const;
    std::vector<PayoutRecord> payouts() const;
    std::vector<PayoutRecord> payouts_to(const ParticipantId& recipient) const;

    /**
     * Full escrow state, used by snapshots
     */
    struct State {
        std::vector<EscrowAccount> accounts;
        std::map<ParticipantId, Amount> balances;
        std::vector<PayoutRecord> payouts;
        uint64_t next_sequence = 1;
    };

    State export_state() const;
    void import_state(const State& state);

private:
    PayoutPolicy policy_;

    mutable std::mutex mutex_;
    std::map<ChallengeId, EscrowAccount> accounts_;
    std::map<ParticipantId, Amount> balances_;
    std::vector<PayoutRecord> payouts_;
    uint64_t next_sequence_;
};

} // namespace skillmint::core
