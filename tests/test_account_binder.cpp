#include "core/account/account_binder.hpp"
#include "core/credential/credential_ledger.hpp"
#include "core/ledger/events.hpp"
#include "utils/logger.hpp"
#include "skillmint/common.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

using namespace skillmint;
using namespace skillmint::core;

class AccountBinderTest : public ::testing::Test {
protected:
    ledger::EventBus events;
    CredentialLedger credentials{events};
    uint64_t clock = 1700000000000000ULL;
    AccountBinder binder{credentials, events, [this]() { return clock; }};
    std::vector<ledger::LedgerEvent> seen;

    void SetUp() override {
        utils::Logger::init("off");
        credentials.apply_verified_proof("alice", "react", 80, "sol");
        events.subscribe([this](const ledger::LedgerEvent& event) { seen.push_back(event); });
    }

    static bool is_account(const std::string& account) {
        if (account.size() != 2 + constants::ACCOUNT_ID_BYTES * 2 || account.compare(0, 2, "0x") != 0) {
            return false;
        }
        return std::all_of(account.begin() + 2, account.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
    }
};

TEST_F(AccountBinderTest, OwnerDerivesAccount) {
    auto result = binder.derive_account(1, "alice");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(is_account(result.value())) << result.value();

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].event_type, ledger::EventType::ACCOUNT_DERIVED);
    EXPECT_EQ(seen[0].subject_id, 1u);
    EXPECT_EQ(seen[0].data["account"].get<std::string>(), result.value());
    EXPECT_EQ(seen[0].data["derivedAt"].get<uint64_t>(), clock);
}

TEST_F(AccountBinderTest, DerivationIsNotStable) {
    std::set<std::string> accounts;
    for (int i = 0; i < 5; ++i) {
        accounts.insert(binder.derive_account(1, "alice").value());
    }
    // Same clock reading, distinct sequence numbers
    EXPECT_EQ(accounts.size(), 5u);
}

TEST_F(AccountBinderTest, NonOwnerRefused) {
    auto result = binder.derive_account(1, "mallory");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotCredentialOwner);
    EXPECT_EQ(result.error().category(), ErrorCategory::Authorization);
    EXPECT_TRUE(seen.empty());
}

TEST_F(AccountBinderTest, UnknownCredential) {
    auto result = binder.derive_account(99, "alice");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::CredentialNotFound);
    EXPECT_EQ(result.error().category(), ErrorCategory::NotFound);
}

TEST_F(AccountBinderTest, DefaultClockProducesAccounts) {
    AccountBinder wall_clock(credentials, events);
    auto result = wall_clock.derive_account(1, "alice");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(is_account(result.value()));
}
