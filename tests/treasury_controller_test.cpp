#include <gtest/gtest.h>

#include <limits>

#include "core/errors.hpp"
#include "test_support.hpp"

using namespace sel;
using namespace sel::test_support;

namespace {

// 2026-01-15T00:00:00Z
const int64_t DAY = 1768435200;

} // namespace

TEST(TreasuryControllerTest, InitializeOpensTreasuryOnce) {
    TestEconomy eco;
    eco.treasury.initialize();

    TreasuryStats stats = eco.treasury.stats();
    EXPECT_EQ(stats.balance, 100000);
    EXPECT_EQ(stats.total_refilled, 100000);
    EXPECT_EQ(stats.daily_cap, 1000);
    EXPECT_EQ(stats.spent_today, 0);
    EXPECT_EQ(eco.balance(ISSUANCE_WALLET), -100000);
    EXPECT_EQ(eco.transaction_count(), 1u);
}

TEST(TreasuryControllerTest, CanAffordRespectsWalletCap) {
    TestEconomy eco;
    eco.open_bot("bot-1", 50);
    eco.treasury.debit_for_bot_spend("bot-1", 45, "seed");
    std::size_t count = eco.transaction_count();

    EXPECT_FALSE(eco.treasury.can_afford("bot-1", 10));
    EXPECT_TRUE(eco.treasury.can_afford("bot-1", 5));
    EXPECT_EQ(eco.transaction_count(), count);
    EXPECT_EQ(eco.balance("bot-1"), 45);
}

TEST(TreasuryControllerTest, DefaultBotCapAppliesToUncappedWallets) {
    EconomyConfig cfg = test_config();
    cfg.bot_wallet_cap = 199;
    TestEconomy eco(cfg);
    eco.open_bot("bot-1");

    EXPECT_TRUE(eco.treasury.can_afford("bot-1", 199));
    EXPECT_FALSE(eco.treasury.can_afford("bot-1", 200));
    EXPECT_THROW(eco.treasury.debit_for_bot_spend("bot-1", 200, "too much"), CapExceeded);
    EXPECT_EQ(eco.treasury.stats().spent_today, 0);
}

TEST(TreasuryControllerTest, SpendOverWalletCapIsRefused) {
    TestEconomy eco;
    eco.open_bot("bot-1", 50);
    eco.treasury.debit_for_bot_spend("bot-1", 45, "seed");

    EXPECT_THROW(eco.treasury.debit_for_bot_spend("bot-1", 10, "over"), CapExceeded);
    EXPECT_EQ(eco.balance("bot-1"), 45);
    EXPECT_EQ(eco.treasury.stats().spent_today, 45);
}

TEST(TreasuryControllerTest, DailyCapBlocksSpendWithoutTouchingCounter) {
    TestEconomy eco;
    eco.open_bot("bot-1");
    eco.treasury.debit_for_bot_spend("bot-1", 950, "morning");
    coin_amount treasury_before = eco.balance(TREASURY_WALLET);

    EXPECT_FALSE(eco.treasury.can_afford("bot-1", 100));
    EXPECT_THROW(eco.treasury.debit_for_bot_spend("bot-1", 100, "afternoon"), CapExceeded);

    TreasuryStats stats = eco.treasury.stats();
    EXPECT_EQ(stats.spent_today, 950);
    EXPECT_EQ(stats.remaining_today, 50);
    EXPECT_EQ(eco.balance(TREASURY_WALLET), treasury_before);
    EXPECT_EQ(eco.balance("bot-1"), 950);

    EXPECT_NO_THROW(eco.treasury.debit_for_bot_spend("bot-1", 50, "last"));
    EXPECT_EQ(eco.treasury.stats().remaining_today, 0);
}

TEST(TreasuryControllerTest, RepeatedKeyDoesNotCountTwice) {
    TestEconomy eco;
    eco.open_bot("bot-1");

    TransactionResult first = eco.treasury.debit_for_bot_spend("bot-1", 30, "reply", "spend-1");
    TransactionResult second = eco.treasury.debit_for_bot_spend("bot-1", 30, "reply", "spend-1");

    EXPECT_FALSE(first.replayed);
    EXPECT_TRUE(second.replayed);
    EXPECT_EQ(second.transaction_id, first.transaction_id);
    EXPECT_EQ(eco.treasury.stats().spent_today, 30);
    EXPECT_EQ(eco.treasury.stats().total_bot_spend, 30);
    EXPECT_EQ(eco.balance("bot-1"), 30);
}

TEST(TreasuryControllerTest, OnlyBotWalletsMayReceiveBotSpend) {
    TestEconomy eco;
    eco.engine.open_wallet("alice", OwnerKind::user);

    EXPECT_THROW(eco.treasury.debit_for_bot_spend("alice", 10, "nope"), InvalidEntrySet);
    EXPECT_THROW(eco.treasury.debit_for_bot_spend("ghost", 10, "nope"), WalletNotFound);
    EXPECT_THROW(eco.treasury.can_afford("ghost", 10), WalletNotFound);
    EXPECT_EQ(eco.treasury.stats().spent_today, 0);
}

TEST(TreasuryControllerTest, EmptyTreasuryCannotFundBots) {
    EconomyConfig cfg = test_config();
    cfg.treasury_initial_balance = 100;
    TestEconomy eco(cfg);
    eco.open_bot("bot-1");

    EXPECT_FALSE(eco.treasury.can_afford("bot-1", 200));
    EXPECT_THROW(eco.treasury.debit_for_bot_spend("bot-1", 200, "big"), InsufficientBalance);
    EXPECT_EQ(eco.treasury.stats().spent_today, 0);
    EXPECT_EQ(eco.balance(TREASURY_WALLET), 100);
}

TEST(TreasuryControllerTest, DailyResetHappensOncePerUtcDay) {
    TestEconomy eco;
    eco.open_bot("bot-1");
    eco.treasury.debit_for_bot_spend("bot-1", 400, "spend");

    EXPECT_TRUE(eco.treasury.reset_daily_spend(at(DAY + 60)));
    EXPECT_EQ(eco.treasury.stats().spent_today, 0);
    EXPECT_EQ(eco.treasury.stats().last_reset_date, "2026-01-15");

    eco.treasury.debit_for_bot_spend("bot-1", 100, "spend");
    EXPECT_FALSE(eco.treasury.reset_daily_spend(at(DAY + 3600)));
    EXPECT_EQ(eco.treasury.stats().spent_today, 100);

    EXPECT_TRUE(eco.treasury.reset_daily_spend(at(DAY + 86400)));
    EXPECT_EQ(eco.treasury.stats().spent_today, 0);
    EXPECT_EQ(eco.treasury.stats().total_bot_spend, 500);
}

TEST(TreasuryControllerTest, RefillMintsFromIssuance) {
    TestEconomy eco;

    TransactionResult result = eco.treasury.refill(5000, "refill-1");
    EXPECT_EQ(result.resulting_balances.at(TREASURY_WALLET), 105000);
    EXPECT_TRUE(eco.treasury.refill(5000, "refill-1").replayed);

    TreasuryStats stats = eco.treasury.stats();
    EXPECT_EQ(stats.balance, 105000);
    EXPECT_EQ(stats.total_refilled, 105000);
    EXPECT_EQ(eco.balance(ISSUANCE_WALLET), -105000);

    EXPECT_THROW(eco.treasury.refill(0), InvalidEntrySet);
}

TEST(TreasuryControllerTest, CapsCanBeRetuned) {
    TestEconomy eco;
    eco.open_bot("bot-1");

    eco.treasury.set_daily_cap(20);
    EXPECT_FALSE(eco.treasury.can_afford("bot-1", 21));

    eco.treasury.set_bot_cap(10);
    EXPECT_FALSE(eco.treasury.can_afford("bot-1", 15));
    EXPECT_TRUE(eco.treasury.can_afford("bot-1", 10));

    EXPECT_THROW(eco.treasury.set_daily_cap(-1), InvalidEntrySet);
}

TEST(TreasuryControllerTest, HugeAmountsAreRejectedNotWrapped) {
    TestEconomy eco;
    eco.open_bot("bot-1", 50);
    eco.treasury.debit_for_bot_spend("bot-1", 45, "seed");
    const coin_amount huge = std::numeric_limits<coin_amount>::max();

    EXPECT_THROW(eco.treasury.can_afford("bot-1", huge), InvalidEntrySet);
    EXPECT_THROW(eco.treasury.debit_for_bot_spend("bot-1", huge, "overflow"), InvalidEntrySet);
    EXPECT_THROW(eco.treasury.refill(huge), InvalidEntrySet);

    // The largest legal amount is compared without overflowing.
    EXPECT_FALSE(eco.treasury.can_afford("bot-1", MAX_COIN_AMOUNT));
    EXPECT_THROW(eco.treasury.debit_for_bot_spend("bot-1", MAX_COIN_AMOUNT, "too much"), CapExceeded);
    EXPECT_EQ(eco.balance("bot-1"), 45);
    EXPECT_EQ(eco.treasury.stats().spent_today, 45);
}
