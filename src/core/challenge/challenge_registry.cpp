#include "core/challenge/challenge_registry.hpp"
#include "skillmint/time_utils.hpp"
#include "utils/logger.hpp"
#include <mutex>

namespace skillmint::core {

ChallengeRegistry::ChallengeRegistry(EscrowPayout& escrow, ledger::EventBus& events)
    : escrow_(escrow), events_(events), next_id_(1)
{
}

Result<void> ChallengeRegistry::validate(const std::string& normalized_type,
                                         uint32_t difficulty,
                                         uint64_t time_limit,
                                         Amount reward_amount,
                                         Amount funds_provided) {
    if (difficulty < constants::MIN_DIFFICULTY || difficulty > constants::MAX_DIFFICULTY) {
        return Result<void>::Err(Error(ErrorCode::InvalidDifficulty,
            "difficulty must be within [1, 10]",
            "difficulty=" + std::to_string(difficulty)));
    }
    if (time_limit == 0) {
        return Result<void>::Err(ErrorCode::InvalidTimeLimit, "time limit must be positive");
    }
    if (normalized_type.empty()) {
        return Result<void>::Err(ErrorCode::InvalidTag, "challenge type must not be empty");
    }
    if (funds_provided < reward_amount) {
        return Result<void>::Err(Error(ErrorCode::InsufficientFunds,
            "insufficient funds for reward",
            "funds=" + std::to_string(funds_provided) +
            " reward=" + std::to_string(reward_amount)));
    }
    return Result<void>::Ok();
}

Result<ChallengeId> ChallengeRegistry::create_challenge(
    const ParticipantId& creator,
    const std::string& challenge_type,
    uint32_t difficulty,
    uint64_t time_limit,
    Amount reward_amount,
    Amount funds_provided,
    const std::string& content_digest
) {
    auto normalized_type = normalize_tag(challenge_type);

    auto valid = validate(normalized_type, difficulty, time_limit, reward_amount, funds_provided);
    if (valid.is_err()) {
        SKILLMINT_LOG_WARN("Rejected challenge from {}: {}", creator, valid.error().to_string());
        return Result<ChallengeId>::Err(valid.error());
    }

    Challenge challenge;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        challenge.id = next_id_;
        challenge.challenge_type = normalized_type;
        challenge.difficulty = static_cast<uint8_t>(difficulty);
        challenge.time_limit = time_limit;
        challenge.reward_amount = reward_amount;
        challenge.active = true;
        challenge.creator = creator;
        challenge.content_digest = content_digest;
        challenge.created_at = time::timestamp_seconds();

        auto escrowed = escrow_.deposit(challenge.id, reward_amount, funds_provided);
        if (escrowed.is_err()) {
            SKILLMINT_LOG_ERROR("Escrow deposit failed for challenge {}: {}",
                                challenge.id, escrowed.error().to_string());
            return Result<ChallengeId>::Err(escrowed.error());
        }

        next_id_++;
        challenges_[challenge.id] = challenge;
        challenges_by_creator_[creator].push_back(challenge.id);
    }

    SKILLMINT_LOG_INFO("Challenge {} created by {} ({}, difficulty {}, reward {})",
                       challenge.id, creator, challenge.challenge_type,
                       difficulty, reward_amount);

    events_.publish(ledger::EventType::CHALLENGE_CREATED, challenge.id, creator, {
        {"type", challenge.challenge_type},
        {"difficulty", difficulty},
        {"timeLimit", time_limit},
        {"rewardAmount", reward_amount},
        {"fundsProvided", funds_provided}
    });

    return Result<ChallengeId>::Ok(challenge.id);
}

Result<void> ChallengeRegistry::deactivate_challenge(ChallengeId challenge_id,
                                                     const ParticipantId& caller) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = challenges_.find(challenge_id);
        if (it == challenges_.end()) {
            return Result<void>::Err(ErrorCode::ChallengeNotFound,
                "challenge " + std::to_string(challenge_id) + " does not exist");
        }
        if (it->second.creator != caller) {
            SKILLMINT_LOG_WARN("{} attempted to deactivate challenge {} owned by {}",
                               caller, challenge_id, it->second.creator);
            return Result<void>::Err(ErrorCode::NotChallengeCreator,
                "only the creator may deactivate challenge " + std::to_string(challenge_id));
        }
        if (!it->second.active) {
            return Result<void>::Ok();
        }
        it->second.active = false;
    }

    SKILLMINT_LOG_INFO("Challenge {} deactivated by {}", challenge_id, caller);
    events_.publish(ledger::EventType::CHALLENGE_DEACTIVATED, challenge_id, caller);
    return Result<void>::Ok();
}

std::optional<Challenge> ChallengeRegistry::get_challenge(ChallengeId challenge_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = challenges_.find(challenge_id);
    if (it == challenges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ChallengeId> ChallengeRegistry::get_challenges_by(const ParticipantId& creator) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = challenges_by_creator_.find(creator);
    if (it == challenges_by_creator_.end()) {
        return {};
    }
    return it->second;
}

bool ChallengeRegistry::is_active(ChallengeId challenge_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = challenges_.find(challenge_id);
    return it != challenges_.end() && it->second.active;
}

size_t ChallengeRegistry::challenge_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return challenges_.size();
}

ChallengeRegistry::State ChallengeRegistry::export_state() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    State state;
    for (const auto& [id, challenge] : challenges_) {
        state.challenges.push_back(challenge);
    }
    state.next_id = next_id_;
    return state;
}

void ChallengeRegistry::import_state(const State& state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    challenges_.clear();
    challenges_by_creator_.clear();

    // Ids are allocated in creation order, so ascending id is insertion order
    for (const auto& challenge : state.challenges) {
        challenges_[challenge.id] = challenge;
    }
    for (const auto& [id, challenge] : challenges_) {
        challenges_by_creator_[challenge.creator].push_back(id);
    }
    next_id_ = state.next_id;
}

} // namespace skillmint::core
