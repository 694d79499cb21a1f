#include "core/escrow/escrow.hpp"
#include "skillmint/time_utils.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <limits>

namespace skillmint::core {

const char* payout_policy_to_string(PayoutPolicy policy) {
    switch (policy) {
        case PayoutPolicy::DECREMENTING: return "decrementing";
        case PayoutPolicy::ONCE_PER_CHALLENGE: return "once_per_challenge";
        case PayoutPolicy::UNBOUNDED: return "unbounded";
        default: return "unknown";
    }
}

std::optional<PayoutPolicy> payout_policy_from_string(const std::string& name) {
    if (name == "decrementing") return PayoutPolicy::DECREMENTING;
    if (name == "once_per_challenge") return PayoutPolicy::ONCE_PER_CHALLENGE;
    if (name == "unbounded") return PayoutPolicy::UNBOUNDED;
    return std::nullopt;
}

EscrowPayout::EscrowPayout(PayoutPolicy policy)
    : policy_(policy), next_sequence_(1)
{
    if (policy_ == PayoutPolicy::UNBOUNDED) {
        SKILLMINT_LOG_WARN("Escrow running with unbounded payout policy: "
                           "every verified proof pays the full reward without debiting escrow");
    }
}

Result<void> EscrowPayout::deposit(ChallengeId challenge_id, Amount reward_amount, Amount funds) {
    if (challenge_id == NO_ID) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "escrow deposit requires a challenge id");
    }
    if (funds < reward_amount) {
        return Result<void>::Err(Error(ErrorCode::InsufficientFunds,
            "funds do not cover the reward",
            "funds=" + std::to_string(funds) + " reward=" + std::to_string(reward_amount)));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (accounts_.count(challenge_id) > 0) {
        return Result<void>::Err(ErrorCode::InvalidArgument,
            "escrow already open for challenge " + std::to_string(challenge_id));
    }

    EscrowAccount account;
    account.challenge_id = challenge_id;
    account.reward_amount = reward_amount;
    account.deposited = funds;
    account.held = funds;
    accounts_[challenge_id] = account;

    SKILLMINT_LOG_DEBUG("Escrow opened for challenge {}: {} held, reward {}",
                        challenge_id, funds, reward_amount);
    return Result<void>::Ok();
}

Result<PayoutRecord> EscrowPayout::release(ChallengeId challenge_id,
                                           const ParticipantId& recipient,
                                           ProofId proof_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = accounts_.find(challenge_id);
    if (it == accounts_.end()) {
        return Result<PayoutRecord>::Err(ErrorCode::ChallengeNotFound,
            "no escrow for challenge " + std::to_string(challenge_id));
    }
    auto& account = it->second;

    PayoutRecord record;
    record.challenge_id = challenge_id;
    record.proof_id = proof_id;
    record.recipient = recipient;
    record.amount = 0;

    if (account.reward_amount == 0) {
        return Result<PayoutRecord>::Ok(record);
    }

    auto current = balances_.find(recipient);
    Amount credited = current == balances_.end() ? 0 : current->second;
    if (credited > std::numeric_limits<Amount>::max() - account.reward_amount) {
        return Result<PayoutRecord>::Err(Error(ErrorCode::BalanceOverflow,
            "payout would overflow the balance of " + recipient,
            "balance=" + std::to_string(credited) +
            " reward=" + std::to_string(account.reward_amount)));
    }

    switch (policy_) {
        case PayoutPolicy::ONCE_PER_CHALLENGE:
            if (account.payouts > 0) {
                return Result<PayoutRecord>::Err(ErrorCode::RewardAlreadyPaid,
                    "reward for challenge " + std::to_string(challenge_id) + " already paid");
            }
            [[fallthrough]];
        case PayoutPolicy::DECREMENTING:
            if (account.held < account.reward_amount) {
                return Result<PayoutRecord>::Err(Error(ErrorCode::InsufficientEscrow,
                    "escrow exhausted for challenge " + std::to_string(challenge_id),
                    "held=" + std::to_string(account.held) +
                    " reward=" + std::to_string(account.reward_amount)));
            }
            account.held -= account.reward_amount;
            break;
        case PayoutPolicy::UNBOUNDED:
            if (account.deposited < account.reward_amount) {
                return Result<PayoutRecord>::Err(ErrorCode::InsufficientEscrow,
                    "escrow deposit below reward for challenge " + std::to_string(challenge_id));
            }
            break;
    }

    account.payouts++;
    balances_[recipient] += account.reward_amount;

    record.amount = account.reward_amount;
    record.sequence = next_sequence_++;
    record.paid_at = time::timestamp_seconds();
    payouts_.push_back(record);

    SKILLMINT_LOG_INFO("Released {} from challenge {} to {}", record.amount, challenge_id, recipient);
    return Result<PayoutRecord>::Ok(record);
}

void EscrowPayout::refund(const PayoutRecord& receipt) {
    if (receipt.amount == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = accounts_.find(receipt.challenge_id);
    if (it != accounts_.end()) {
        if (policy_ != PayoutPolicy::UNBOUNDED) {
            it->second.held += receipt.amount;
        }
        if (it->second.payouts > 0) {
            it->second.payouts--;
        }
    }

    auto balance = balances_.find(receipt.recipient);
    if (balance != balances_.end()) {
        balance->second -= std::min(balance->second, receipt.amount);
        if (balance->second == 0) {
            balances_.erase(balance);
        }
    }

    payouts_.erase(
        std::remove_if(payouts_.begin(), payouts_.end(),
            [&receipt](const PayoutRecord& r) { return r.sequence == receipt.sequence; }),
        payouts_.end());

    SKILLMINT_LOG_WARN("Refunded {} to escrow of challenge {} (payout {} rolled back)",
                       receipt.amount, receipt.challenge_id, receipt.sequence);
}

std::optional<EscrowAccount> EscrowPayout::get_account(ChallengeId challenge_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(challenge_id);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Amount EscrowPayout::held_balance(ChallengeId challenge_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(challenge_id);
    return it == accounts_.end() ? 0 : it->second.held;
}

Amount EscrowPayout::balance_of(const ParticipantId& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(participant);
    return it == balances_.end() ? 0 : it->second;
}

std::vector<PayoutRecord> EscrowPayout::payouts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return payouts_;
}

std::vector<PayoutRecord> EscrowPayout::payouts_to(const ParticipantId& recipient) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PayoutRecord> result;
    for (const auto& record : payouts_) {
        if (record.recipient == recipient) {
            result.push_back(record);
        }
    }
    return result;
}

EscrowPayout::State EscrowPayout::export_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    State state;
    for (const auto& [id, account] : accounts_) {
        state.accounts.push_back(account);
    }
    state.balances = balances_;
    state.payouts = payouts_;
    state.next_sequence = next_sequence_;
    return state;
}

void EscrowPayout::import_state(const State& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    accounts_.clear();
    for (const auto& account : state.accounts) {
        accounts_[account.challenge_id] = account;
    }
    balances_ = state.balances;
    payouts_ = state.payouts;
    next_sequence_ = state.next_sequence;
}

} // namespace skillmint::core
