#pragma once

#include "skillmint/common.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <mutex>
#include <vector>

namespace skillmint::ledger {

/**
 * EventType - Signals emitted by the ledger components
 */
enum class EventType : uint8_t {
    // Challenge events
    CHALLENGE_CREATED = 1,
    CHALLENGE_DEACTIVATED = 2,

    // Proof events
    PROOF_SUBMITTED = 10,
    PROOF_VERIFIED = 11,
    VERIFICATION_FAILED = 12,

    // Credential events
    CREDENTIAL_MINTED = 20,
    CREDENTIAL_UPDATED = 21,

    // Escrow events
    REWARD_RELEASED = 30,

    // Informational
    ACCOUNT_DERIVED = 40,
};

const char* event_type_to_string(EventType type);

/**
 * LedgerEvent - A single emitted signal
 *
 * subject_id is the challenge, proof or token id the event is about,
 * depending on the event type.
 */
struct LedgerEvent {
    EventType event_type;
    uint64_t subject_id;
    ParticipantId participant;
    uint64_t timestamp;
    nlohmann::json data;

    LedgerEvent()
        : event_type(EventType::CHALLENGE_CREATED), subject_id(NO_ID), timestamp(0),
          data(nlohmann::json::object()) {}

    nlohmann::json to_json() const;
};

/**
 * Event callback function type
 */
using EventCallback = std::function<void(const LedgerEvent& event)>;

/**
 * EventBus - Fan-out of ledger events to subscribers
 *
 * Components publish only after their state change is committed and
 * their own locks are released, so callbacks may query the ledger.
 * A subscriber that throws is logged and skipped; later subscribers still
 * run and the publisher never sees the exception.
 */
class EventBus {
public:
    EventBus() = default;
    SKILLMINT_DISALLOW_COPY_AND_MOVE(EventBus);

    void subscribe(EventCallback callback);

    void publish(const LedgerEvent& event) const;

    /**
     * Convenience: build and publish an event stamped with the current time
     */
    void publish(EventType type, uint64_t subject_id, const ParticipantId& participant,
                 nlohmann::json data = nlohmann::json::object()) const;

private:
    mutable std::mutex mutex_;
    std::vector<EventCallback> subscribers_;
};

} // namespace skillmint::ledger
