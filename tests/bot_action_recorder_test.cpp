#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "test_support.hpp"

using namespace sel;
using namespace sel::test_support;

namespace {

class BotActionRecorderTest : public ::testing::Test {
protected:
    void SetUp() override { eco.open_bot("bot-1"); }

    TestEconomy eco;
};

} // namespace

TEST_F(BotActionRecorderTest, RecordSpendDebitsTreasuryAndKeepsTrail) {
    std::string id = eco.recorder.record_spend("bot-1", "reply", {"thread", "t-42"}, 5,
                                               {{"model", "small"}});

    std::optional<BotActionRecord> action = eco.recorder.find(id);
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(action->bot_id, "bot-1");
    EXPECT_EQ(action->action_type, "reply");
    EXPECT_EQ(action->target_type, "thread");
    EXPECT_EQ(action->target_id, "t-42");
    EXPECT_EQ(action->coin_cost, 5);
    EXPECT_FALSE(action->was_refunded);
    EXPECT_FALSE(action->transaction_id.empty());
    EXPECT_EQ(action->metadata.value("model", ""), "small");

    EXPECT_EQ(eco.balance("bot-1"), 5);
    EXPECT_EQ(eco.balance(TREASURY_WALLET), 100000 - 5);
    EXPECT_EQ(eco.treasury.stats().spent_today, 5);
}

TEST_F(BotActionRecorderTest, RepeatedKeyReturnsFirstAction) {
    std::string first = eco.recorder.record_spend("bot-1", "reply", {"thread", "t-1"}, 5,
                                                  json::object(), "act-key");
    std::string second = eco.recorder.record_spend("bot-1", "reply", {"thread", "t-1"}, 5,
                                                   json::object(), "act-key");

    EXPECT_EQ(first, second);
    EXPECT_EQ(eco.recorder.list_for_bot("bot-1").size(), 1u);
    EXPECT_EQ(eco.balance("bot-1"), 5);
}

TEST_F(BotActionRecorderTest, DeclinedSpendLeavesNoAction) {
    eco.treasury.set_daily_cap(3);

    EXPECT_THROW(eco.recorder.record_spend("bot-1", "reply", {"thread", "t-1"}, 5), CapExceeded);
    EXPECT_TRUE(eco.recorder.list_for_bot("bot-1").empty());
    EXPECT_EQ(eco.balance("bot-1"), 0);
}

TEST_F(BotActionRecorderTest, MarkRefundedOnlyOnce) {
    std::string id = eco.recorder.record_spend("bot-1", "post", {"content", "c-1"}, 7);
    std::size_t count = eco.transaction_count();

    TransactionResult refund = eco.recorder.mark_refunded(id);
    EXPECT_TRUE(eco.recorder.find(id)->was_refunded);
    EXPECT_THROW(eco.recorder.mark_refunded(id), AlreadyRefunded);
    EXPECT_THROW(eco.recorder.mark_refunded("act_missing"), NotFound);

    // Exactly one compensating transaction, bot back to zero.
    EXPECT_EQ(eco.transaction_count(), count + 1);
    std::optional<LedgerTransaction> tx = eco.store.begin()->find_transaction(refund.transaction_id);
    ASSERT_TRUE(tx.has_value());
    EXPECT_EQ(tx->type, tx_type::REFUND);
    EXPECT_EQ(eco.balance("bot-1"), 0);
    EXPECT_EQ(eco.balance(TREASURY_WALLET), 100000);
    EXPECT_EQ(eco.treasury.stats().total_refunded, 7);
}

TEST_F(BotActionRecorderTest, MarkRefundedOnSpentBotChangesNothing) {
    std::string id = eco.recorder.record_spend("bot-1", "post", {"content", "c-1"}, 7);
    eco.engine.open_wallet("alice", OwnerKind::user);
    eco.engine.commit(transfer("tip-1", "bot-1", "alice", 7));

    EXPECT_THROW(eco.recorder.mark_refunded(id), InsufficientBalance);
    EXPECT_FALSE(eco.recorder.find(id)->was_refunded);
}

TEST_F(BotActionRecorderTest, ScheduleRefundIsIdempotent) {
    std::string id = eco.recorder.record_spend("bot-1", "post", {"content", "c-1"}, 7);

    RefundCandidate first = eco.recorder.schedule_refund(id, at(1000), "content disqualified");
    RefundCandidate again = eco.recorder.schedule_refund(id, at(2000), "reported twice");

    EXPECT_EQ(first.id, again.id);
    EXPECT_EQ(first.amount, 7);
    EXPECT_EQ(first.bot_id, "bot-1");
    EXPECT_EQ(first.status, RefundStatus::pending);
    EXPECT_EQ(again.reason, "content disqualified");
    EXPECT_EQ(eco.store.begin()->list_refunds(RefundStatus::pending).size(), 1u);
}

TEST_F(BotActionRecorderTest, RefundedActionCannotBeScheduled) {
    std::string id = eco.recorder.record_spend("bot-1", "post", {"content", "c-1"}, 7);
    eco.recorder.mark_refunded(id);

    EXPECT_THROW(eco.recorder.schedule_refund(id, at(1000), "late"), AlreadyRefunded);
    EXPECT_THROW(eco.recorder.schedule_refund("act_missing", at(1000), "x"), NotFound);
}

TEST_F(BotActionRecorderTest, ListsActionsPerBot) {
    eco.open_bot("bot-2");
    eco.recorder.record_spend("bot-1", "reply", {"thread", "t-1"}, 1);
    eco.recorder.record_spend("bot-2", "reply", {"thread", "t-2"}, 2);
    eco.recorder.record_spend("bot-1", "post", {"content", "c-3"}, 3);

    std::vector<BotActionRecord> actions = eco.recorder.list_for_bot("bot-1");
    ASSERT_EQ(actions.size(), 2u);
    for (const auto& a : actions) EXPECT_EQ(a.bot_id, "bot-1");
}
