#pragma once

#include "skillmint/common.hpp"
#include "skillmint/error.hpp"
#include "core/credential/credential_ledger.hpp"
#include "core/ledger/events.hpp"
#include <atomic>
#include <functional>
#include <string>

namespace skillmint::core {

/**
 * AccountBinder - Derives an auxiliary account identifier for a credential
 *
 * The identifier is a BLAKE3 digest over (token id, current time in
 * microseconds, derivation sequence), rendered as 0x + 40 hex digits.
 * It is NOT stable: every call yields a new value. Nothing is persisted;
 * the derivation is only announced through an ACCOUNT_DERIVED event.
 */
class AccountBinder {
public:
    using TimeSource = std::function<uint64_t()>;

    AccountBinder(const CredentialLedger& credentials, ledger::EventBus& events,
                  TimeSource time_source = nullptr);
    SKILLMINT_DISALLOW_COPY_AND_MOVE(AccountBinder);

    /**
     * @param token_id Credential to derive for
     * @param requester Must currently own token_id
     */
    Result<std::string> derive_account(TokenId token_id, const ParticipantId& requester);

private:
    const CredentialLedger& credentials_;
    ledger::EventBus& events_;
    TimeSource time_source_;
    std::atomic<uint64_t> sequence_;
};

} // namespace skillmint::core
