#include "core/account/account_binder.hpp"
#include "crypto/blake3.hpp"
#include "skillmint/time_utils.hpp"
#include "utils/logger.hpp"

namespace skillmint::core {

AccountBinder::AccountBinder(const CredentialLedger& credentials, ledger::EventBus& events,
                             TimeSource time_source)
    : credentials_(credentials)
    , events_(events)
    , time_source_(time_source ? std::move(time_source) : TimeSource(&time::timestamp_microseconds))
    , sequence_(0)
{
}

Result<std::string> AccountBinder::derive_account(TokenId token_id, const ParticipantId& requester) {
    auto owner = credentials_.owner_of(token_id);
    if (!owner) {
        return Result<std::string>::Err(ErrorCode::CredentialNotFound,
            "credential " + std::to_string(token_id) + " does not exist");
    }
    if (*owner != requester) {
        SKILLMINT_LOG_WARN("{} attempted to derive an account for credential {} owned by {}",
                           requester, token_id, *owner);
        return Result<std::string>::Err(ErrorCode::NotCredentialOwner,
            "only the owner may derive an account for credential " + std::to_string(token_id));
    }

    auto derived_at = time_source_();
    auto sequence = sequence_.fetch_add(1);

    crypto::Blake3Hasher hasher;
    hasher.update(token_id).update(derived_at).update(sequence);
    auto digest = hasher.finalize();

    auto hex = crypto::Blake3::hash_to_hex(digest);
    auto account = "0x" + hex.substr(0, constants::ACCOUNT_ID_BYTES * 2);

    SKILLMINT_LOG_INFO("Derived account {} for credential {}", account, token_id);
    events_.publish(ledger::EventType::ACCOUNT_DERIVED, token_id, requester, {
        {"account", account},
        {"derivedAt", derived_at}
    });

    return Result<std::string>::Ok(account);
}

} // namespace skillmint::core
