#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "test_support.hpp"

using namespace sel;
using namespace sel::test_support;

namespace {

class EconomyApiTest : public ::testing::Test {
protected:
    EconomyApiTest()
        : api(eco.engine, eco.treasury, eco.recorder, eco.refunds, eco.expirations, eco.reconciler) {}

    void SetUp() override {
        eco.fund_user("alice", 100);
        eco.engine.open_wallet("bob", OwnerKind::user);
        eco.open_bot("bot-1");
    }

    static std::string commit_body(const std::string& key, coin_amount amount) {
        json body = {
            {"type", "purchase"},
            {"idempotency_key", key},
            {"entries", {
                {{"wallet_id", "alice"}, {"direction", "debit"}, {"amount", amount}},
                {{"wallet_id", "bob"}, {"direction", "credit"}, {"amount", amount}}
            }}
        };
        return body.dump();
    }

    TestEconomy eco;
    EconomyApi api;
};

} // namespace

TEST_F(EconomyApiTest, CommitThenReplay) {
    ApiResponse first = api.commit(commit_body("order-1", 30));
    ApiResponse again = api.commit(commit_body("order-1", 30));

    EXPECT_EQ(first.status, 201);
    EXPECT_EQ(first.body.at("resulting_balances").at("alice").get<coin_amount>(), 70);
    EXPECT_FALSE(first.body.at("replayed").get<bool>());

    EXPECT_EQ(again.status, 200);
    EXPECT_TRUE(again.body.at("replayed").get<bool>());
    EXPECT_EQ(again.body.at("transaction_id"), first.body.at("transaction_id"));
}

TEST_F(EconomyApiTest, MalformedRequestsAreBadRequests) {
    EXPECT_EQ(api.commit("{not json").status, 400);
    EXPECT_EQ(api.commit("[1, 2]").status, 400);
    EXPECT_EQ(api.commit(R"({"type": "purchase"})").status, 400);
    EXPECT_EQ(api.adjust(R"({"idempotency_key": "a", "wallet_id": "bob", "direction": "sideways", "amount": 1})").status,
              400);

    ApiResponse unbalanced = api.commit(R"({"type": "x", "idempotency_key": "k", "entries": []})");
    EXPECT_EQ(unbalanced.status, 400);
    EXPECT_EQ(unbalanced.body.at("error").get<std::string>(), "InvalidEntrySet");
}

TEST_F(EconomyApiTest, AmountsMustBeWholeCoins) {
    auto with_amount = [](const std::string& amount) {
        return R"({"type": "purchase", "idempotency_key": "frac", "entries": [)"
               R"({"wallet_id": "alice", "direction": "debit", "amount": )" + amount + "},"
               R"({"wallet_id": "bob", "direction": "credit", "amount": )" + amount + "}]}";
    };

    for (const std::string amount : {"10.9", "1e300", "\"5\"", "true", "9223372036854775808", "-3"}) {
        ApiResponse response = api.commit(with_amount(amount));
        EXPECT_EQ(response.status, 400) << amount;
        EXPECT_EQ(response.body.at("error").get<std::string>(), "InvalidEntrySet") << amount;
    }
    EXPECT_EQ(eco.balance("bob"), 0);
    EXPECT_EQ(eco.balance("alice"), 100);

    EXPECT_EQ(api.bot_spend(R"({"bot_id": "bot-1", "amount": 2.5})").status, 400);
    EXPECT_EQ(api.record_action(
        R"({"bot_id": "bot-1", "action_type": "post", "target": {"type": "content", "id": "c"}, "cost": 0.5})").status,
        400);
    EXPECT_EQ(api.refill(R"({"amount": 9.99})").status, 400);
    EXPECT_EQ(api.schedule_expiration(R"({"user_id": "alice", "amount": 1, "retention_days": 1e12})").status, 400);
    EXPECT_EQ(api.schedule_expiration(R"({"user_id": "alice", "amount": 1, "retention_days": 9000000000000000000})").status,
              400);
    EXPECT_EQ(eco.balance(TREASURY_WALLET), 100000 - 100);
}

TEST_F(EconomyApiTest, DeclinedActionsMapToConflictAndLimits) {
    ApiResponse broke = api.commit(commit_body("order-big", 500));
    EXPECT_EQ(broke.status, 409);
    EXPECT_EQ(broke.body.at("status").get<std::string>(), "ERROR");

    ApiResponse capped = api.bot_spend(R"({"bot_id": "bot-1", "amount": 5000})");
    EXPECT_EQ(capped.status, 429);

    EXPECT_EQ(api.get_wallet("ghost").status, 404);
    EXPECT_EQ(api.wallet_entries("ghost").status, 404);
}

TEST_F(EconomyApiTest, StoreOutageIsServiceUnavailable) {
    eco.store.fail_call(1);
    EXPECT_EQ(api.get_wallet("alice").status, 503);
    EXPECT_EQ(api.get_wallet("alice").status, 200);
}

TEST_F(EconomyApiTest, StatusTableCoversEveryCode) {
    EXPECT_EQ(EconomyApi::status_for(ErrorCode::InvalidEntrySet), 400);
    EXPECT_EQ(EconomyApi::status_for(ErrorCode::WalletNotFound), 404);
    EXPECT_EQ(EconomyApi::status_for(ErrorCode::NotFound), 404);
    EXPECT_EQ(EconomyApi::status_for(ErrorCode::InsufficientBalance), 409);
    EXPECT_EQ(EconomyApi::status_for(ErrorCode::AlreadyRefunded), 409);
    EXPECT_EQ(EconomyApi::status_for(ErrorCode::DuplicateIdempotencyKey), 409);
    EXPECT_EQ(EconomyApi::status_for(ErrorCode::CapExceeded), 429);
    EXPECT_EQ(EconomyApi::status_for(ErrorCode::NotificationFailed), 502);
    EXPECT_EQ(EconomyApi::status_for(ErrorCode::StoreUnavailable), 503);
}

TEST_F(EconomyApiTest, SystemWalletsCannotBeOpened) {
    EXPECT_EQ(api.open_wallet(R"({"id": "mint-2", "kind": "system"})").status, 400);

    ApiResponse opened = api.open_wallet(R"({"id": "bot-2", "kind": "bot", "cap": 25})");
    EXPECT_EQ(opened.status, 200);
    EXPECT_EQ(opened.body.at("cap").get<coin_amount>(), 25);
}

TEST_F(EconomyApiTest, DisqualifiedActionIsRefundedByTheJob) {
    ApiResponse recorded = api.record_action(
        R"({"bot_id": "bot-1", "action_type": "post", "target": {"type": "content", "id": "c-1"}, "cost": 5})");
    ASSERT_EQ(recorded.status, 201);
    std::string action_id = recorded.body.at("id").get<std::string>();

    ApiResponse queued = api.disqualify_action(action_id, R"({"reason": "spam"})");
    EXPECT_EQ(queued.status, 202);
    EXPECT_EQ(queued.body.at("status").get<std::string>(), "pending");

    ApiResponse run = api.run_refunds();
    EXPECT_EQ(run.status, 200);
    EXPECT_EQ(run.body.at("processed").get<int>(), 1);
    EXPECT_EQ(eco.balance("bot-1"), 0);

    // Disqualifying again hands back the settled candidate.
    ApiResponse repeat = api.disqualify_action(action_id, "");
    EXPECT_EQ(repeat.status, 202);
    EXPECT_EQ(repeat.body.at("id"), queued.body.at("id"));
    EXPECT_EQ(repeat.body.at("status").get<std::string>(), "processed");
    EXPECT_EQ(api.disqualify_action(action_id, R"({"delay_seconds": -1})").status, 400);
    EXPECT_EQ(api.disqualify_action(action_id, R"({"delay_seconds": 9223372036854775807})").status, 400);
}

TEST_F(EconomyApiTest, ExpirationScheduledThroughTheApi) {
    ApiResponse scheduled = api.schedule_expiration(R"({"user_id": "alice", "amount": 40, "expires_at": 1000})");
    EXPECT_EQ(scheduled.status, 201);

    ApiResponse run = api.run_expirations();
    EXPECT_EQ(run.status, 200);
    EXPECT_EQ(run.body.at("amount").get<coin_amount>(), 40);
    EXPECT_EQ(eco.balance("alice"), 60);

    EXPECT_EQ(api.schedule_expiration(R"({"user_id": "ghost", "amount": 40})").status, 404);
}

TEST_F(EconomyApiTest, TreasuryAndAuditEndpoints) {
    ApiResponse refill = api.refill(R"({"amount": 1000, "idempotency_key": "refill-api"})");
    EXPECT_EQ(refill.status, 201);
    EXPECT_EQ(api.refill(R"({"amount": 1000, "idempotency_key": "refill-api"})").status, 200);

    ApiResponse stats = api.treasury_stats();
    EXPECT_EQ(stats.status, 200);
    EXPECT_EQ(stats.body.at("total_refilled").get<coin_amount>(), 101000);

    ApiResponse afford = api.can_afford(R"({"bot_id": "bot-1", "amount": 10})");
    EXPECT_TRUE(afford.body.at("can_afford").get<bool>());

    ApiResponse audit = api.run_reconcile();
    EXPECT_EQ(audit.status, 200);
    EXPECT_TRUE(audit.body.at("healthy").get<bool>());

    EXPECT_EQ(api.health().body.at("status").get<std::string>(), "OK");
    EXPECT_TRUE(api.system_logs().body.is_array());
}
