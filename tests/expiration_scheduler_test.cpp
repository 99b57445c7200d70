#include <gtest/gtest.h>

#include <thread>

#include "core/errors.hpp"
#include "test_support.hpp"

using namespace sel;
using namespace sel::test_support;

namespace {

const int64_t DUE = 1776211200;    // 2026-04-15T00:00:00Z

class ExpirationSchedulerTest : public ::testing::Test {
protected:
    TestEconomy eco;
};

} // namespace

TEST_F(ExpirationSchedulerTest, TakesAtMostWhatTheWalletHolds) {
    eco.fund_user("alice", 100);
    CoinExpirationRecord scheduled = eco.expirations.schedule("alice", 150, at(DUE));

    JobSummary summary = eco.expirations.run(at(DUE + 60));

    EXPECT_EQ(summary.candidates, 1);
    EXPECT_EQ(summary.processed, 1);
    EXPECT_EQ(summary.amount, 100);
    EXPECT_EQ(eco.balance("alice"), 0);
    EXPECT_EQ(eco.balance(BURN_WALLET), 100);

    CoinExpirationRecord record = *eco.expirations.find(scheduled.id);
    EXPECT_EQ(record.status, ExpirationStatus::processed);
    EXPECT_EQ(record.original_amount, 150);
    EXPECT_EQ(record.actual_amount, 100);
    EXPECT_FALSE(record.transaction_id.empty());
    EXPECT_TRUE(record.notification_sent);

    ASSERT_EQ(eco.sink.sent.size(), 1u);
    EXPECT_EQ(eco.sink.sent[0].user_id, "alice");
    EXPECT_EQ(eco.sink.sent[0].amount, 100);
    EXPECT_EQ(eco.sink.sent[0].expiration_id, scheduled.id);
}

TEST_F(ExpirationSchedulerTest, ProcessedRecordIsNeverTouchedAgain) {
    eco.fund_user("alice", 100);
    eco.expirations.schedule("alice", 40, at(DUE));
    eco.expirations.run(at(DUE + 60));
    std::size_t count = eco.transaction_count();

    JobSummary summary = eco.expirations.run(at(DUE + 120));

    EXPECT_EQ(summary.candidates, 0);
    EXPECT_EQ(eco.balance("alice"), 60);
    EXPECT_EQ(eco.transaction_count(), count);
    EXPECT_EQ(eco.sink.sent.size(), 1u);
}

TEST_F(ExpirationSchedulerTest, OverlappingRunsExpireOnce) {
    eco.fund_user("alice", 100);
    eco.fund_user("bob", 100);
    eco.expirations.schedule("alice", 30, at(DUE));
    eco.expirations.schedule("bob", 30, at(DUE));

    JobSummary first;
    JobSummary second;
    std::thread a([&]() { first = eco.expirations.run(at(DUE + 60)); });
    std::thread b([&]() { second = eco.expirations.run(at(DUE + 60)); });
    a.join();
    b.join();

    EXPECT_EQ(first.processed + second.processed, 2);
    EXPECT_EQ(first.failed + second.failed, 0);
    EXPECT_EQ(eco.balance("alice"), 70);
    EXPECT_EQ(eco.balance("bob"), 70);
    EXPECT_EQ(eco.balance(BURN_WALLET), 60);
    EXPECT_EQ(eco.sink.sent.size(), 2u);
}

TEST_F(ExpirationSchedulerTest, FailedNotificationKeepsTheDebit) {
    eco.fund_user("alice", 100);
    CoinExpirationRecord scheduled = eco.expirations.schedule("alice", 50, at(DUE));
    eco.sink.fail = true;

    JobSummary summary = eco.expirations.run(at(DUE + 60));

    EXPECT_EQ(summary.processed, 1);
    EXPECT_EQ(summary.failed, 0);
    EXPECT_EQ(summary.notification_failures, 1);
    EXPECT_EQ(eco.balance("alice"), 50);

    CoinExpirationRecord record = *eco.expirations.find(scheduled.id);
    EXPECT_EQ(record.status, ExpirationStatus::processed);
    EXPECT_FALSE(record.notification_sent);
    EXPECT_EQ(eco.sink.attempts, 1);
}

TEST_F(ExpirationSchedulerTest, EmptyWalletIsProcessedWithoutTransaction) {
    eco.engine.open_wallet("alice", OwnerKind::user);
    CoinExpirationRecord scheduled = eco.expirations.schedule("alice", 50, at(DUE));
    std::size_t count = eco.transaction_count();

    JobSummary summary = eco.expirations.run(at(DUE + 60));

    EXPECT_EQ(summary.processed, 1);
    EXPECT_EQ(summary.amount, 0);
    EXPECT_EQ(eco.transaction_count(), count);
    EXPECT_EQ(eco.sink.attempts, 0);

    CoinExpirationRecord record = *eco.expirations.find(scheduled.id);
    EXPECT_EQ(record.status, ExpirationStatus::processed);
    EXPECT_EQ(record.actual_amount, 0);
    EXPECT_TRUE(record.transaction_id.empty());
}

TEST_F(ExpirationSchedulerTest, OverdrawnWalletIsNotDebited) {
    eco.fund_user("alice", 10);
    eco.engine.open_wallet("bob", OwnerKind::user);
    CommitRequest overdraw = transfer("od-1", "alice", "bob", 30);
    overdraw.allow_overdraft = true;
    eco.engine.commit(overdraw);
    eco.expirations.schedule("alice", 50, at(DUE));

    JobSummary summary = eco.expirations.run(at(DUE + 60));

    EXPECT_EQ(summary.amount, 0);
    EXPECT_EQ(eco.balance("alice"), -20);
}

TEST_F(ExpirationSchedulerTest, NotDueYetIsLeftAlone) {
    eco.fund_user("alice", 100);
    eco.expirations.schedule("alice", 50, at(DUE));

    EXPECT_EQ(eco.expirations.run(at(DUE - 1)).candidates, 0);
    EXPECT_EQ(eco.balance("alice"), 100);
}

TEST_F(ExpirationSchedulerTest, TreasurySinkRecyclesCoins) {
    EconomyConfig cfg = test_config();
    cfg.expiration_sink = ExpirationSink::treasury;
    TestEconomy recycling(cfg);
    recycling.fund_user("alice", 100);
    coin_amount treasury = recycling.balance(TREASURY_WALLET);
    recycling.expirations.schedule("alice", 25, at(DUE));

    recycling.expirations.run(at(DUE + 60));

    EXPECT_EQ(recycling.balance("alice"), 75);
    EXPECT_EQ(recycling.balance(TREASURY_WALLET), treasury + 25);
    EXPECT_EQ(recycling.balance(BURN_WALLET), 0);
}

TEST_F(ExpirationSchedulerTest, CancelledRecordIsSkipped) {
    eco.fund_user("alice", 100);
    CoinExpirationRecord scheduled = eco.expirations.schedule("alice", 50, at(DUE));

    EXPECT_TRUE(eco.expirations.cancel(scheduled.id));
    EXPECT_FALSE(eco.expirations.cancel(scheduled.id));
    EXPECT_EQ(eco.expirations.run(at(DUE + 60)).candidates, 0);
    EXPECT_EQ(eco.balance("alice"), 100);
    EXPECT_EQ(eco.expirations.find(scheduled.id)->status, ExpirationStatus::cancelled);
    EXPECT_THROW(eco.expirations.cancel("exp_missing"), NotFound);
}

TEST_F(ExpirationSchedulerTest, StoreOutageLeavesRecordForNextRun) {
    eco.fund_user("alice", 100);
    CoinExpirationRecord scheduled = eco.expirations.schedule("alice", 50, at(DUE));
    // begin() calls of a run: due list, then one per record.
    eco.store.fail_call(2);

    JobSummary summary = eco.expirations.run(at(DUE + 60));
    EXPECT_EQ(summary.failed, 1);
    EXPECT_EQ(eco.expirations.find(scheduled.id)->status, ExpirationStatus::pending);
    EXPECT_EQ(eco.balance("alice"), 100);

    EXPECT_EQ(eco.expirations.run(at(DUE + 120)).processed, 1);
    EXPECT_EQ(eco.balance("alice"), 50);
}

TEST_F(ExpirationSchedulerTest, ScheduleValidatesInput) {
    eco.fund_user("alice", 100);

    EXPECT_THROW(eco.expirations.schedule("ghost", 10, at(DUE)), WalletNotFound);
    EXPECT_THROW(eco.expirations.schedule("alice", 0, at(DUE)), InvalidEntrySet);
}

TEST_F(ExpirationSchedulerTest, RejectsAmountsBeyondTheLedgerMaximum) {
    eco.fund_user("alice", 100);

    EXPECT_THROW(eco.expirations.schedule("alice", MAX_COIN_AMOUNT + 1, at(DUE)), InvalidEntrySet);
}

TEST_F(ExpirationSchedulerTest, SinkCrashDoesNotStopTheBatch) {
    eco.fund_user("alice", 100);
    eco.fund_user("bob", 100);
    eco.expirations.schedule("alice", 10, at(DUE));
    eco.expirations.schedule("bob", 10, at(DUE));
    eco.sink.crash = true;

    JobSummary summary = eco.expirations.run(at(DUE + 60));

    EXPECT_EQ(summary.candidates, 2);
    EXPECT_EQ(summary.processed, 2);
    EXPECT_EQ(summary.notification_failures, 2);
    EXPECT_EQ(eco.sink.attempts, 2);
    EXPECT_EQ(eco.balance("alice"), 90);
    EXPECT_EQ(eco.balance("bob"), 90);
}

TEST_F(ExpirationSchedulerTest, SlowNotificationCountsAsFailure) {
    EconomyConfig cfg = test_config();
    cfg.item_timeout_ms = 20;
    TestEconomy slow(cfg);
    slow.fund_user("alice", 100);
    CoinExpirationRecord scheduled = slow.expirations.schedule("alice", 10, at(DUE));
    slow.sink.delay_ms = 80;

    JobSummary summary = slow.expirations.run(at(DUE + 60));

    EXPECT_EQ(summary.processed, 0);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_EQ(summary.timed_out, 1);

    // The debit had already committed and is not repeated.
    EXPECT_EQ(slow.balance("alice"), 90);
    EXPECT_EQ(slow.expirations.find(scheduled.id)->status, ExpirationStatus::processed);
    EXPECT_EQ(slow.expirations.run(at(DUE + 120)).candidates, 0);
}

TEST_F(ExpirationSchedulerTest, OverrunBeforeCommitRollsBack) {
    EconomyConfig cfg = test_config();
    cfg.item_timeout_ms = 20;
    TestEconomy slow(cfg);
    slow.fund_user("alice", 100);
    CoinExpirationRecord scheduled = slow.expirations.schedule("alice", 10, at(DUE));
    // begin() calls of a run: due list, then one per record.
    slow.store.delay_call(2, 80);

    JobSummary summary = slow.expirations.run(at(DUE + 60));

    EXPECT_EQ(summary.failed, 1);
    EXPECT_EQ(summary.timed_out, 1);
    EXPECT_EQ(slow.balance("alice"), 100);
    EXPECT_EQ(slow.expirations.find(scheduled.id)->status, ExpirationStatus::pending);

    EXPECT_EQ(slow.expirations.run(at(DUE + 120)).processed, 1);
    EXPECT_EQ(slow.balance("alice"), 90);
}
