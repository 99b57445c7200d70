#include <gtest/gtest.h>

#include <cstdlib>

#include "core/crypto.hpp"
#include "core/errors.hpp"
#include "economy/TreasuryController.hpp"
#include "ledger/PgLedgerStore.hpp"
#include "test_support.hpp"

using namespace sel;
using namespace sel::test_support;

// Runs against a real PostgreSQL database named by SEL_TEST_DB_CONN.
// Every test uses fresh wallet ids, so the database may be shared.
class PgLedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* conn = std::getenv("SEL_TEST_DB_CONN");
        if (!conn) {
            GTEST_SKIP() << "SEL_TEST_DB_CONN not set";
        }
        store = std::make_unique<PgLedgerStore>(conn, 5000);
        store->ensure_schema();
        engine = std::make_unique<LedgerEngine>(*store);
        treasury = std::make_unique<TreasuryController>(*store, *engine, test_config());
        treasury->initialize();

        suffix = SELCrypto::generate_random_string(8);
        alice = "pg-alice-" + suffix;
        bob = "pg-bob-" + suffix;
        engine->open_wallet(alice, OwnerKind::user);
        engine->open_wallet(bob, OwnerKind::user);
        engine->adjust(tx_type::REWARD, "pg-grant-" + suffix, alice, Direction::credit, 100);
    }

    std::unique_ptr<PgLedgerStore> store;
    std::unique_ptr<LedgerEngine> engine;
    std::unique_ptr<TreasuryController> treasury;
    std::string suffix;
    std::string alice;
    std::string bob;
};

TEST_F(PgLedgerStoreTest, CommitAndReplay) {
    TransactionResult first = engine->commit(transfer("pg-t-" + suffix, alice, bob, 30));
    TransactionResult again = engine->commit(transfer("pg-t-" + suffix, alice, bob, 30));

    EXPECT_FALSE(first.replayed);
    EXPECT_TRUE(again.replayed);
    EXPECT_EQ(again.transaction_id, first.transaction_id);
    EXPECT_EQ(again.resulting_balances.at(alice), 70);
    EXPECT_EQ(engine->find_wallet(alice)->balance, 70);
    EXPECT_EQ(engine->entries(bob).size(), 1u);
}

TEST_F(PgLedgerStoreTest, DeclinedCommitRollsBack) {
    EXPECT_THROW(engine->commit(transfer("pg-big-" + suffix, alice, bob, 500)), InsufficientBalance);
    EXPECT_EQ(engine->find_wallet(alice)->balance, 100);
    EXPECT_FALSE(store->begin()->find_transaction_by_key("pg-big-" + suffix).has_value());
}

TEST_F(PgLedgerStoreTest, UncommittedSessionIsRolledBack) {
    {
        std::unique_ptr<LedgerSession> session = store->begin();
        Wallet wallet = session->lock_wallets({bob}).front();
        wallet.balance = 999;
        session->put_wallet(wallet);
    }
    EXPECT_EQ(engine->find_wallet(bob)->balance, 0);
}

TEST_F(PgLedgerStoreTest, DuplicateKeyIsRejectedByTheDatabase) {
    engine->commit(transfer("pg-dup-" + suffix, alice, bob, 5));

    std::unique_ptr<LedgerSession> session = store->begin();
    LedgerTransaction tx;
    tx.id = "tx-dup-" + suffix;
    tx.type = "transfer";
    tx.idempotency_key = "pg-dup-" + suffix;
    EXPECT_THROW({
        session->insert_transaction(tx);
        session->commit();
    }, DuplicateIdempotencyKey);
}

TEST_F(PgLedgerStoreTest, ExpirationTransitionIsCompareAndSet) {
    CoinExpirationRecord record;
    record.id = "exp-" + suffix;
    record.user_id = alice;
    record.original_amount = 10;
    record.expired_amount = 10;
    record.scheduled_expiry = at(1000);
    {
        std::unique_ptr<LedgerSession> session = store->begin();
        session->insert_expiration(record);
        session->commit();
    }

    CoinExpirationRecord cancelled = record;
    cancelled.status = ExpirationStatus::cancelled;
    {
        std::unique_ptr<LedgerSession> session = store->begin();
        EXPECT_TRUE(session->transition_expiration(cancelled, ExpirationStatus::pending));
        session->commit();
    }
    std::unique_ptr<LedgerSession> session = store->begin();
    EXPECT_FALSE(session->transition_expiration(cancelled, ExpirationStatus::pending));
    EXPECT_EQ(session->find_expiration(record.id)->status, ExpirationStatus::cancelled);
}
