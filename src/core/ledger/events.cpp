#include "core/ledger/events.hpp"
#include "skillmint/time_utils.hpp"
#include "utils/logger.hpp"

namespace skillmint::ledger {

const char* event_type_to_string(EventType type) {
    switch (type) {
        case EventType::CHALLENGE_CREATED: return "ChallengeCreated";
        case EventType::CHALLENGE_DEACTIVATED: return "ChallengeDeactivated";
        case EventType::PROOF_SUBMITTED: return "ProofSubmitted";
        case EventType::PROOF_VERIFIED: return "ProofVerified";
        case EventType::VERIFICATION_FAILED: return "VerificationFailed";
        case EventType::CREDENTIAL_MINTED: return "CredentialMinted";
        case EventType::CREDENTIAL_UPDATED: return "CredentialUpdated";
        case EventType::REWARD_RELEASED: return "RewardReleased";
        case EventType::ACCOUNT_DERIVED: return "AccountDerived";
        default: return "Unknown";
    }
}

nlohmann::json LedgerEvent::to_json() const {
    return nlohmann::json{
        {"event", event_type_to_string(event_type)},
        {"subjectId", subject_id},
        {"participant", participant},
        {"timestamp", timestamp},
        {"data", data}
    };
}

void EventBus::subscribe(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(std::move(callback));
}

void EventBus::publish(const LedgerEvent& event) const {
    std::vector<EventCallback> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers = subscribers_;
    }
    for (const auto& callback : subscribers) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            SKILLMINT_LOG_ERROR("Event subscriber failed on {}: {}",
                                event_type_to_string(event.event_type), e.what());
        }
    }
}

void EventBus::publish(EventType type, uint64_t subject_id, const ParticipantId& participant,
                       nlohmann::json data) const {
    LedgerEvent event;
    event.event_type = type;
    event.subject_id = subject_id;
    event.participant = participant;
    event.timestamp = time::timestamp_seconds();
    event.data = std::move(data);
    publish(event);
}

} // namespace skillmint::ledger
