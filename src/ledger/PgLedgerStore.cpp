/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: PgLedgerStore.cpp
 * ============================================================================
 * * DESCRIPTION:
 * libpqxx implementation of the LedgerStore contract. Timestamps are
 * TIMESTAMPTZ columns exchanged as epoch seconds; an unset timestamp (epoch
 * 0) is stored as NULL.
 * ============================================================================
 */

#include "PgLedgerStore.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"
#include <memory>
#include <set>
#include <pqxx/pqxx>

namespace sel {

namespace {

const char* const SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS sel_wallets (
    id              TEXT PRIMARY KEY,
    kind            TEXT NOT NULL,
    balance         BIGINT NOT NULL DEFAULT 0,
    lifetime_earned BIGINT NOT NULL DEFAULT 0,
    lifetime_spent  BIGINT NOT NULL DEFAULT 0,
    cap             BIGINT NOT NULL DEFAULT 0,
    head_seal       TEXT NOT NULL DEFAULT 'GENESIS',
    updated_at      TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS sel_transactions (
    id              TEXT PRIMARY KEY,
    type            TEXT NOT NULL,
    idempotency_key TEXT NOT NULL,
    status          TEXT NOT NULL,
    metadata        JSONB NOT NULL DEFAULT '{}'::jsonb,
    created_at      TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP
);
CREATE UNIQUE INDEX IF NOT EXISTS sel_transactions_key_idx ON sel_transactions (idempotency_key);

CREATE TABLE IF NOT EXISTS sel_entries (
    sequence        BIGSERIAL PRIMARY KEY,
    transaction_id  TEXT NOT NULL REFERENCES sel_transactions (id),
    wallet_id       TEXT NOT NULL REFERENCES sel_wallets (id),
    direction       TEXT NOT NULL CHECK (direction IN ('debit', 'credit')),
    amount          BIGINT NOT NULL CHECK (amount > 0),
    balance_before  BIGINT NOT NULL,
    balance_after   BIGINT NOT NULL,
    seal            TEXT NOT NULL,
    created_at      TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP
);
CREATE INDEX IF NOT EXISTS sel_entries_wallet_idx ON sel_entries (wallet_id, sequence);

CREATE TABLE IF NOT EXISTS sel_treasury_state (
    wallet_id       TEXT PRIMARY KEY REFERENCES sel_wallets (id),
    daily_spent     BIGINT NOT NULL DEFAULT 0,
    daily_cap       BIGINT NOT NULL,
    bot_wallet_cap  BIGINT NOT NULL,
    last_reset_date TEXT NOT NULL DEFAULT '',
    total_bot_spend BIGINT NOT NULL DEFAULT 0,
    total_refunded  BIGINT NOT NULL DEFAULT 0,
    total_refilled  BIGINT NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS sel_bot_actions (
    id              TEXT PRIMARY KEY,
    bot_id          TEXT NOT NULL REFERENCES sel_wallets (id),
    action_type     TEXT NOT NULL,
    target_type     TEXT NOT NULL,
    target_id       TEXT NOT NULL,
    coin_cost       BIGINT NOT NULL,
    transaction_id  TEXT NOT NULL REFERENCES sel_transactions (id),
    was_refunded    BOOLEAN NOT NULL DEFAULT FALSE,
    refunded_at     TIMESTAMPTZ,
    created_at      TIMESTAMPTZ NOT NULL,
    metadata        JSONB NOT NULL DEFAULT '{}'::jsonb
);
CREATE INDEX IF NOT EXISTS sel_bot_actions_bot_idx ON sel_bot_actions (bot_id, created_at);

CREATE TABLE IF NOT EXISTS sel_refunds (
    id              TEXT PRIMARY KEY,
    action_id       TEXT NOT NULL UNIQUE REFERENCES sel_bot_actions (id),
    bot_id          TEXT NOT NULL,
    amount          BIGINT NOT NULL CHECK (amount > 0),
    status          TEXT NOT NULL,
    scheduled_for   TIMESTAMPTZ NOT NULL,
    reason          TEXT NOT NULL DEFAULT '',
    processed_at    TIMESTAMPTZ,
    error           TEXT NOT NULL DEFAULT '',
    transaction_id  TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS sel_refunds_due_idx ON sel_refunds (status, scheduled_for);

CREATE TABLE IF NOT EXISTS sel_expirations (
    id                   TEXT PRIMARY KEY,
    user_id              TEXT NOT NULL,
    original_amount      BIGINT NOT NULL,
    expired_amount       BIGINT NOT NULL,
    actual_amount        BIGINT NOT NULL DEFAULT 0,
    scheduled_expiry     TIMESTAMPTZ NOT NULL,
    status               TEXT NOT NULL,
    processed_at         TIMESTAMPTZ,
    transaction_id       TEXT NOT NULL DEFAULT '',
    notification_sent    BOOLEAN NOT NULL DEFAULT FALSE,
    notification_sent_at TIMESTAMPTZ
);
CREATE INDEX IF NOT EXISTS sel_expirations_due_idx ON sel_expirations (status, scheduled_expiry);
)SQL";

const char* const WALLET_COLUMNS =
    "id, kind, balance, lifetime_earned, lifetime_spent, cap, head_seal, "
    "EXTRACT(EPOCH FROM updated_at)::BIGINT";

const char* const ENTRY_COLUMNS =
    "sequence, transaction_id, wallet_id, direction, amount, balance_before, balance_after, seal, "
    "EXTRACT(EPOCH FROM created_at)::BIGINT";

const char* const TRANSACTION_COLUMNS =
    "id, type, idempotency_key, status, metadata::text, EXTRACT(EPOCH FROM created_at)::BIGINT";

const char* const TREASURY_COLUMNS =
    "wallet_id, daily_spent, daily_cap, bot_wallet_cap, last_reset_date, total_bot_spend, total_refunded, total_refilled";

const char* const ACTION_COLUMNS =
    "id, bot_id, action_type, target_type, target_id, coin_cost, transaction_id, was_refunded, "
    "COALESCE(EXTRACT(EPOCH FROM refunded_at), 0)::BIGINT, EXTRACT(EPOCH FROM created_at)::BIGINT, metadata::text";

const char* const REFUND_COLUMNS =
    "id, action_id, bot_id, amount, status, EXTRACT(EPOCH FROM scheduled_for)::BIGINT, reason, "
    "COALESCE(EXTRACT(EPOCH FROM processed_at), 0)::BIGINT, error, transaction_id";

const char* const EXPIRATION_COLUMNS =
    "id, user_id, original_amount, expired_amount, actual_amount, EXTRACT(EPOCH FROM scheduled_expiry)::BIGINT, "
    "status, COALESCE(EXTRACT(EPOCH FROM processed_at), 0)::BIGINT, transaction_id, notification_sent, "
    "COALESCE(EXTRACT(EPOCH FROM notification_sent_at), 0)::BIGINT";

// Transient SQLSTATEs: query_canceled (statement timeout), serialization
// failure, deadlock, lock not available.
bool is_transient(const std::string& sqlstate) {
    return sqlstate == "57014" || sqlstate == "40001" || sqlstate == "40P01" || sqlstate == "55P03";
}

template <typename Fn>
auto pg_guard(const char* what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const pqxx::broken_connection& e) {
        sel_log("ERROR", std::string("PostgreSQL connection lost during ") + what + ": " + e.what());
        throw StoreUnavailable(std::string(what) + ": " + e.what());
    } catch (const pqxx::in_doubt_error& e) {
        sel_log("CRITICAL", std::string("PostgreSQL commit in doubt during ") + what + ": " + e.what());
        throw StoreUnavailable(std::string(what) + ": " + e.what());
    } catch (const pqxx::sql_error& e) {
        if (is_transient(e.sqlstate())) {
            sel_log("WARN", std::string("PostgreSQL transient failure during ") + what + ": " + e.what());
            throw StoreUnavailable(std::string(what) + ": " + e.what());
        }
        throw;
    }
}

Wallet wallet_from_row(const pqxx::row& row) {
    Wallet w;
    w.id = row[0].as<std::string>();
    w.kind = owner_kind_from_string(row[1].as<std::string>());
    w.balance = row[2].as<int64_t>();
    w.lifetime_earned = row[3].as<int64_t>();
    w.lifetime_spent = row[4].as<int64_t>();
    w.cap = row[5].as<int64_t>();
    w.head_seal = row[6].as<std::string>();
    w.updated_at = from_epoch_seconds(row[7].as<int64_t>());
    return w;
}

LedgerEntry entry_from_row(const pqxx::row& row) {
    LedgerEntry e;
    e.sequence = row[0].as<int64_t>();
    e.transaction_id = row[1].as<std::string>();
    e.wallet_id = row[2].as<std::string>();
    e.direction = direction_from_string(row[3].as<std::string>());
    e.amount = row[4].as<int64_t>();
    e.balance_before = row[5].as<int64_t>();
    e.balance_after = row[6].as<int64_t>();
    e.seal = row[7].as<std::string>();
    e.created_at = from_epoch_seconds(row[8].as<int64_t>());
    return e;
}

TreasuryState treasury_from_row(const pqxx::row& row) {
    TreasuryState s;
    s.wallet_id = row[0].as<std::string>();
    s.daily_spent = row[1].as<int64_t>();
    s.daily_cap = row[2].as<int64_t>();
    s.bot_wallet_cap = row[3].as<int64_t>();
    s.last_reset_date = row[4].as<std::string>();
    s.total_bot_spend = row[5].as<int64_t>();
    s.total_refunded = row[6].as<int64_t>();
    s.total_refilled = row[7].as<int64_t>();
    return s;
}

BotActionRecord action_from_row(const pqxx::row& row) {
    BotActionRecord a;
    a.id = row[0].as<std::string>();
    a.bot_id = row[1].as<std::string>();
    a.action_type = row[2].as<std::string>();
    a.target_type = row[3].as<std::string>();
    a.target_id = row[4].as<std::string>();
    a.coin_cost = row[5].as<int64_t>();
    a.transaction_id = row[6].as<std::string>();
    a.was_refunded = row[7].as<bool>();
    a.refunded_at = from_epoch_seconds(row[8].as<int64_t>());
    a.created_at = from_epoch_seconds(row[9].as<int64_t>());
    a.metadata = json::parse(row[10].as<std::string>());
    return a;
}

RefundCandidate refund_from_row(const pqxx::row& row) {
    RefundCandidate r;
    r.id = row[0].as<std::string>();
    r.action_id = row[1].as<std::string>();
    r.bot_id = row[2].as<std::string>();
    r.amount = row[3].as<int64_t>();
    r.status = refund_status_from_string(row[4].as<std::string>());
    r.scheduled_for = from_epoch_seconds(row[5].as<int64_t>());
    r.reason = row[6].as<std::string>();
    r.processed_at = from_epoch_seconds(row[7].as<int64_t>());
    r.error = row[8].as<std::string>();
    r.transaction_id = row[9].as<std::string>();
    return r;
}

CoinExpirationRecord expiration_from_row(const pqxx::row& row) {
    CoinExpirationRecord e;
    e.id = row[0].as<std::string>();
    e.user_id = row[1].as<std::string>();
    e.original_amount = row[2].as<int64_t>();
    e.expired_amount = row[3].as<int64_t>();
    e.actual_amount = row[4].as<int64_t>();
    e.scheduled_expiry = from_epoch_seconds(row[5].as<int64_t>());
    e.status = expiration_status_from_string(row[6].as<std::string>());
    e.processed_at = from_epoch_seconds(row[7].as<int64_t>());
    e.transaction_id = row[8].as<std::string>();
    e.notification_sent = row[9].as<bool>();
    e.notification_sent_at = from_epoch_seconds(row[10].as<int64_t>());
    return e;
}

std::string select_from(const char* columns, const char* table) {
    return std::string("SELECT ") + columns + " FROM " + table + " ";
}

} // namespace

// ----------------------------------------------------------------------------
// PgLedgerSession
// One connection, one pqxx::work. Destroying the session without commit()
// aborts the work and releases every row lock.
// ----------------------------------------------------------------------------
class PgLedgerSession : public LedgerSession {
public:
    PgLedgerSession(const std::string& conn_str, int statement_timeout_ms)
        : conn_(new pqxx::connection(conn_str)),
          work_(new pqxx::work(*conn_)) {
        if (statement_timeout_ms > 0) {
            work_->exec("SET LOCAL statement_timeout = " + std::to_string(statement_timeout_ms));
        }
    }

    std::optional<Wallet> find_wallet(const std::string& wallet_id) override {
        return pg_guard("find_wallet", [&]() -> std::optional<Wallet> {
            pqxx::result R = work_->exec_params(select_from(WALLET_COLUMNS, "sel_wallets") + "WHERE id = $1", wallet_id);
            if (R.empty()) return std::nullopt;
            return wallet_from_row(R[0]);
        });
    }

    std::vector<Wallet> list_wallets() override {
        return pg_guard("list_wallets", [&]() {
            pqxx::result R = work_->exec(select_from(WALLET_COLUMNS, "sel_wallets") + "ORDER BY id ASC");
            std::vector<Wallet> wallets;
            for (auto row : R) wallets.push_back(wallet_from_row(row));
            return wallets;
        });
    }

    bool create_wallet(const Wallet& wallet) override {
        return pg_guard("create_wallet", [&]() {
            pqxx::result R = work_->exec_params(
                "INSERT INTO sel_wallets (id, kind, balance, lifetime_earned, lifetime_spent, cap, head_seal, updated_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, to_timestamp($8)) ON CONFLICT (id) DO NOTHING",
                wallet.id, to_string(wallet.kind), wallet.balance, wallet.lifetime_earned,
                wallet.lifetime_spent, wallet.cap, wallet.head_seal, to_epoch_seconds(wallet.updated_at));
            return R.affected_rows() == 1;
        });
    }

    std::vector<Wallet> lock_wallets(const std::vector<std::string>& wallet_ids) override {
        std::set<std::string> sorted(wallet_ids.begin(), wallet_ids.end());
        return pg_guard("lock_wallets", [&]() {
            std::vector<Wallet> wallets;
            for (const auto& id : sorted) {
                pqxx::result R = work_->exec_params(
                    select_from(WALLET_COLUMNS, "sel_wallets") + "WHERE id = $1 FOR UPDATE", id);
                if (R.empty()) throw WalletNotFound(id);
                wallets.push_back(wallet_from_row(R[0]));
            }
            return wallets;
        });
    }

    void put_wallet(const Wallet& wallet) override {
        pg_guard("put_wallet", [&]() {
            work_->exec_params(
                "UPDATE sel_wallets SET balance = $2, lifetime_earned = $3, lifetime_spent = $4, cap = $5, "
                "head_seal = $6, updated_at = to_timestamp($7) WHERE id = $1",
                wallet.id, wallet.balance, wallet.lifetime_earned, wallet.lifetime_spent,
                wallet.cap, wallet.head_seal, to_epoch_seconds(wallet.updated_at));
        });
    }

    std::optional<LedgerTransaction> find_transaction(const std::string& transaction_id) override {
        return pg_guard("find_transaction", [&]() {
            return load_transaction(select_from(TRANSACTION_COLUMNS, "sel_transactions") + "WHERE id = $1", transaction_id);
        });
    }

    std::optional<LedgerTransaction> find_transaction_by_key(const std::string& idempotency_key) override {
        return pg_guard("find_transaction_by_key", [&]() {
            return load_transaction(select_from(TRANSACTION_COLUMNS, "sel_transactions") + "WHERE idempotency_key = $1", idempotency_key);
        });
    }

    void insert_transaction(const LedgerTransaction& transaction) override {
        pg_guard("insert_transaction", [&]() {
            try {
                work_->exec_params(
                    "INSERT INTO sel_transactions (id, type, idempotency_key, status, metadata, created_at) "
                    "VALUES ($1, $2, $3, $4, $5::jsonb, to_timestamp($6))",
                    transaction.id, transaction.type, transaction.idempotency_key, transaction.status,
                    transaction.metadata.dump(), to_epoch_seconds(transaction.created_at));
            } catch (const pqxx::unique_violation&) {
                throw DuplicateIdempotencyKey(transaction.idempotency_key);
            }
            for (const auto& entry : transaction.entries) {
                work_->exec_params(
                    "INSERT INTO sel_entries (transaction_id, wallet_id, direction, amount, balance_before, balance_after, seal, created_at) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, to_timestamp($8))",
                    transaction.id, entry.wallet_id, to_string(entry.direction), entry.amount,
                    entry.balance_before, entry.balance_after, entry.seal, to_epoch_seconds(entry.created_at));
            }
        });
    }

    std::vector<LedgerEntry> entries_for_wallet(const std::string& wallet_id) override {
        return pg_guard("entries_for_wallet", [&]() {
            pqxx::result R = work_->exec_params(
                select_from(ENTRY_COLUMNS, "sel_entries") + "WHERE wallet_id = $1 ORDER BY sequence ASC", wallet_id);
            std::vector<LedgerEntry> entries;
            for (auto row : R) entries.push_back(entry_from_row(row));
            return entries;
        });
    }

    std::size_t count_transactions() override {
        return pg_guard("count_transactions", [&]() {
            pqxx::result R = work_->exec("SELECT COUNT(*) FROM sel_transactions");
            return R[0][0].as<std::size_t>();
        });
    }

    std::optional<TreasuryState> find_treasury_state(const std::string& wallet_id) override {
        return pg_guard("find_treasury_state", [&]() -> std::optional<TreasuryState> {
            pqxx::result R = work_->exec_params(
                select_from(TREASURY_COLUMNS, "sel_treasury_state") + "WHERE wallet_id = $1", wallet_id);
            if (R.empty()) return std::nullopt;
            return treasury_from_row(R[0]);
        });
    }

    bool create_treasury_state(const TreasuryState& state) override {
        return pg_guard("create_treasury_state", [&]() {
            pqxx::result R = work_->exec_params(
                "INSERT INTO sel_treasury_state (" + std::string(TREASURY_COLUMNS) + ") "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8) ON CONFLICT (wallet_id) DO NOTHING",
                state.wallet_id, state.daily_spent, state.daily_cap, state.bot_wallet_cap,
                state.last_reset_date, state.total_bot_spend, state.total_refunded, state.total_refilled);
            return R.affected_rows() == 1;
        });
    }

    TreasuryState lock_treasury_state(const std::string& wallet_id) override {
        return pg_guard("lock_treasury_state", [&]() {
            pqxx::result R = work_->exec_params(
                select_from(TREASURY_COLUMNS, "sel_treasury_state") + "WHERE wallet_id = $1 FOR UPDATE", wallet_id);
            if (R.empty()) throw NotFound("Treasury state not initialised for " + wallet_id);
            return treasury_from_row(R[0]);
        });
    }

    void put_treasury_state(const TreasuryState& state) override {
        pg_guard("put_treasury_state", [&]() {
            work_->exec_params(
                "UPDATE sel_treasury_state SET daily_spent = $2, daily_cap = $3, bot_wallet_cap = $4, "
                "last_reset_date = $5, total_bot_spend = $6, total_refunded = $7, total_refilled = $8 "
                "WHERE wallet_id = $1",
                state.wallet_id, state.daily_spent, state.daily_cap, state.bot_wallet_cap,
                state.last_reset_date, state.total_bot_spend, state.total_refunded, state.total_refilled);
        });
    }

    void insert_bot_action(const BotActionRecord& action) override {
        pg_guard("insert_bot_action", [&]() {
            work_->exec_params(
                "INSERT INTO sel_bot_actions (id, bot_id, action_type, target_type, target_id, coin_cost, "
                "transaction_id, was_refunded, refunded_at, created_at, metadata) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, to_timestamp(NULLIF($9::BIGINT, 0)), to_timestamp($10), $11::jsonb)",
                action.id, action.bot_id, action.action_type, action.target_type, action.target_id,
                action.coin_cost, action.transaction_id, action.was_refunded,
                to_epoch_seconds(action.refunded_at), to_epoch_seconds(action.created_at), action.metadata.dump());
        });
    }

    std::optional<BotActionRecord> find_bot_action(const std::string& action_id) override {
        return pg_guard("find_bot_action", [&]() -> std::optional<BotActionRecord> {
            pqxx::result R = work_->exec_params(
                select_from(ACTION_COLUMNS, "sel_bot_actions") + "WHERE id = $1", action_id);
            if (R.empty()) return std::nullopt;
            return action_from_row(R[0]);
        });
    }

    std::optional<BotActionRecord> find_bot_action_by_transaction(const std::string& transaction_id) override {
        return pg_guard("find_bot_action_by_transaction", [&]() -> std::optional<BotActionRecord> {
            pqxx::result R = work_->exec_params(
                select_from(ACTION_COLUMNS, "sel_bot_actions") + "WHERE transaction_id = $1", transaction_id);
            if (R.empty()) return std::nullopt;
            return action_from_row(R[0]);
        });
    }

    std::vector<BotActionRecord> list_bot_actions(const std::string& bot_id) override {
        return pg_guard("list_bot_actions", [&]() {
            pqxx::result R = work_->exec_params(
                select_from(ACTION_COLUMNS, "sel_bot_actions") + "WHERE bot_id = $1 ORDER BY created_at ASC", bot_id);
            std::vector<BotActionRecord> actions;
            for (auto row : R) actions.push_back(action_from_row(row));
            return actions;
        });
    }

    bool claim_refund_flag(const std::string& action_id, timestamp refunded_at) override {
        return pg_guard("claim_refund_flag", [&]() {
            pqxx::result R = work_->exec_params(
                "UPDATE sel_bot_actions SET was_refunded = TRUE, refunded_at = to_timestamp($2) "
                "WHERE id = $1 AND was_refunded = FALSE",
                action_id, to_epoch_seconds(refunded_at));
            if (R.affected_rows() == 1) return true;
            pqxx::result exists = work_->exec_params("SELECT 1 FROM sel_bot_actions WHERE id = $1", action_id);
            if (exists.empty()) throw NotFound("Bot action not found: " + action_id);
            return false;
        });
    }

    void insert_refund(const RefundCandidate& refund) override {
        pg_guard("insert_refund", [&]() {
            try {
                work_->exec_params(
                    "INSERT INTO sel_refunds (id, action_id, bot_id, amount, status, scheduled_for, reason, "
                    "processed_at, error, transaction_id) "
                    "VALUES ($1, $2, $3, $4, $5, to_timestamp($6), $7, to_timestamp(NULLIF($8::BIGINT, 0)), $9, $10)",
                    refund.id, refund.action_id, refund.bot_id, refund.amount, to_string(refund.status),
                    to_epoch_seconds(refund.scheduled_for), refund.reason, to_epoch_seconds(refund.processed_at),
                    refund.error, refund.transaction_id);
            } catch (const pqxx::unique_violation&) {
                throw DuplicateIdempotencyKey("refund:" + refund.action_id);
            }
        });
    }

    std::optional<RefundCandidate> find_refund(const std::string& refund_id) override {
        return pg_guard("find_refund", [&]() -> std::optional<RefundCandidate> {
            pqxx::result R = work_->exec_params(select_from(REFUND_COLUMNS, "sel_refunds") + "WHERE id = $1", refund_id);
            if (R.empty()) return std::nullopt;
            return refund_from_row(R[0]);
        });
    }

    std::optional<RefundCandidate> find_refund_for_action(const std::string& action_id) override {
        return pg_guard("find_refund_for_action", [&]() -> std::optional<RefundCandidate> {
            pqxx::result R = work_->exec_params(select_from(REFUND_COLUMNS, "sel_refunds") + "WHERE action_id = $1", action_id);
            if (R.empty()) return std::nullopt;
            return refund_from_row(R[0]);
        });
    }

    std::vector<RefundCandidate> due_refunds(timestamp now) override {
        return pg_guard("due_refunds", [&]() {
            pqxx::result R = work_->exec_params(
                select_from(REFUND_COLUMNS, "sel_refunds") +
                "WHERE status = 'pending' AND scheduled_for <= to_timestamp($1) ORDER BY scheduled_for ASC",
                to_epoch_seconds(now));
            std::vector<RefundCandidate> refunds;
            for (auto row : R) refunds.push_back(refund_from_row(row));
            return refunds;
        });
    }

    std::vector<RefundCandidate> list_refunds(RefundStatus status) override {
        return pg_guard("list_refunds", [&]() {
            pqxx::result R = work_->exec_params(
                select_from(REFUND_COLUMNS, "sel_refunds") + "WHERE status = $1 ORDER BY scheduled_for ASC",
                to_string(status));
            std::vector<RefundCandidate> refunds;
            for (auto row : R) refunds.push_back(refund_from_row(row));
            return refunds;
        });
    }

    bool transition_refund(const RefundCandidate& updated, RefundStatus expected) override {
        return pg_guard("transition_refund", [&]() {
            pqxx::result R = work_->exec_params(
                "UPDATE sel_refunds SET status = $2, processed_at = to_timestamp(NULLIF($3::BIGINT, 0)), "
                "error = $4, transaction_id = $5 WHERE id = $1 AND status = $6",
                updated.id, to_string(updated.status), to_epoch_seconds(updated.processed_at),
                updated.error, updated.transaction_id, to_string(expected));
            if (R.affected_rows() == 1) return true;
            pqxx::result exists = work_->exec_params("SELECT 1 FROM sel_refunds WHERE id = $1", updated.id);
            if (exists.empty()) throw NotFound("Refund candidate not found: " + updated.id);
            return false;
        });
    }

    void insert_expiration(const CoinExpirationRecord& record) override {
        pg_guard("insert_expiration", [&]() {
            work_->exec_params(
                "INSERT INTO sel_expirations (id, user_id, original_amount, expired_amount, actual_amount, "
                "scheduled_expiry, status, processed_at, transaction_id, notification_sent, notification_sent_at) "
                "VALUES ($1, $2, $3, $4, $5, to_timestamp($6), $7, to_timestamp(NULLIF($8::BIGINT, 0)), $9, $10, "
                "to_timestamp(NULLIF($11::BIGINT, 0)))",
                record.id, record.user_id, record.original_amount, record.expired_amount, record.actual_amount,
                to_epoch_seconds(record.scheduled_expiry), to_string(record.status),
                to_epoch_seconds(record.processed_at), record.transaction_id, record.notification_sent,
                to_epoch_seconds(record.notification_sent_at));
        });
    }

    std::optional<CoinExpirationRecord> find_expiration(const std::string& expiration_id) override {
        return pg_guard("find_expiration", [&]() -> std::optional<CoinExpirationRecord> {
            pqxx::result R = work_->exec_params(
                select_from(EXPIRATION_COLUMNS, "sel_expirations") + "WHERE id = $1", expiration_id);
            if (R.empty()) return std::nullopt;
            return expiration_from_row(R[0]);
        });
    }

    CoinExpirationRecord lock_expiration(const std::string& expiration_id) override {
        return pg_guard("lock_expiration", [&]() {
            pqxx::result R = work_->exec_params(
                select_from(EXPIRATION_COLUMNS, "sel_expirations") + "WHERE id = $1 FOR UPDATE", expiration_id);
            if (R.empty()) throw NotFound("Expiration record not found: " + expiration_id);
            return expiration_from_row(R[0]);
        });
    }

    std::vector<CoinExpirationRecord> due_expirations(timestamp now) override {
        return pg_guard("due_expirations", [&]() {
            pqxx::result R = work_->exec_params(
                select_from(EXPIRATION_COLUMNS, "sel_expirations") +
                "WHERE status = 'pending' AND scheduled_expiry <= to_timestamp($1) ORDER BY scheduled_expiry ASC",
                to_epoch_seconds(now));
            std::vector<CoinExpirationRecord> records;
            for (auto row : R) records.push_back(expiration_from_row(row));
            return records;
        });
    }

    bool transition_expiration(const CoinExpirationRecord& updated, ExpirationStatus expected) override {
        return pg_guard("transition_expiration", [&]() {
            pqxx::result R = work_->exec_params(
                "UPDATE sel_expirations SET status = $2, actual_amount = $3, "
                "processed_at = to_timestamp(NULLIF($4::BIGINT, 0)), transaction_id = $5 "
                "WHERE id = $1 AND status = $6",
                updated.id, to_string(updated.status), updated.actual_amount,
                to_epoch_seconds(updated.processed_at), updated.transaction_id, to_string(expected));
            if (R.affected_rows() == 1) return true;
            pqxx::result exists = work_->exec_params("SELECT 1 FROM sel_expirations WHERE id = $1", updated.id);
            if (exists.empty()) throw NotFound("Expiration record not found: " + updated.id);
            return false;
        });
    }

    void mark_notified(const std::string& expiration_id, timestamp sent_at) override {
        pg_guard("mark_notified", [&]() {
            pqxx::result R = work_->exec_params(
                "UPDATE sel_expirations SET notification_sent = TRUE, notification_sent_at = to_timestamp($2) WHERE id = $1",
                expiration_id, to_epoch_seconds(sent_at));
            if (R.affected_rows() != 1) throw NotFound("Expiration record not found: " + expiration_id);
        });
    }

    void commit() override {
        pg_guard("commit", [&]() {
            try {
                work_->commit();
            } catch (const pqxx::unique_violation& e) {
                throw DuplicateIdempotencyKey(e.what());
            }
        });
    }

private:
    std::optional<LedgerTransaction> load_transaction(const std::string& query, const std::string& param) {
        pqxx::result R = work_->exec_params(query, param);
        if (R.empty()) return std::nullopt;

        LedgerTransaction tx;
        tx.id = R[0][0].as<std::string>();
        tx.type = R[0][1].as<std::string>();
        tx.idempotency_key = R[0][2].as<std::string>();
        tx.status = R[0][3].as<std::string>();
        tx.metadata = json::parse(R[0][4].as<std::string>());
        tx.created_at = from_epoch_seconds(R[0][5].as<int64_t>());

        pqxx::result entries = work_->exec_params(
            select_from(ENTRY_COLUMNS, "sel_entries") + "WHERE transaction_id = $1 ORDER BY sequence ASC", tx.id);
        for (auto row : entries) tx.entries.push_back(entry_from_row(row));
        return tx;
    }

    std::unique_ptr<pqxx::connection> conn_;
    std::unique_ptr<pqxx::work> work_;
};

PgLedgerStore::PgLedgerStore(const std::string& conn_str, int statement_timeout_ms)
    : conn_str_(conn_str), statement_timeout_ms_(statement_timeout_ms) {}

std::unique_ptr<LedgerSession> PgLedgerStore::begin() {
    return pg_guard("begin", [&]() {
        return std::make_unique<PgLedgerSession>(conn_str_, statement_timeout_ms_);
    });
}

void PgLedgerStore::ensure_schema() {
    pg_guard("ensure_schema", [&]() {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        W.exec(SCHEMA_SQL);
        W.commit();
    });
    sel_log("INFO", "PostgreSQL ledger schema verified.");
}

} // namespace sel
