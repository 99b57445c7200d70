/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: PgLedgerStore.hpp
 * ============================================================================
 * * DESCRIPTION:
 * PostgreSQL implementation of the LedgerStore, built on libpqxx. Every
 * session opens its own connection and a single pqxx::work; row locks are
 * SELECT ... FOR UPDATE; idempotency keys are protected by a unique index.
 * * FAILURE MAPPING:
 * - broken connection, statement timeout, serialization failure
 *       -> StoreUnavailable
 * - unique violation on an idempotency key / refund action
 *       -> DuplicateIdempotencyKey
 * ============================================================================
 */

#ifndef SEL_PG_LEDGER_STORE_HPP
#define SEL_PG_LEDGER_STORE_HPP

#include <string>
#include "LedgerStore.hpp"

namespace sel {

class PgLedgerStore : public LedgerStore {
public:
    /**
     * @param conn_str libpq connection string (SEL_DB_CONN).
     * @param statement_timeout_ms Applied with SET LOCAL to every session;
     *        0 disables it.
     */
    PgLedgerStore(const std::string& conn_str, int statement_timeout_ms);

    std::unique_ptr<LedgerSession> begin() override;

    // Creates the sel_* tables and indexes if they do not exist.
    void ensure_schema();

private:
    std::string conn_str_;
    int statement_timeout_ms_;
};

} // namespace sel

#endif // SEL_PG_LEDGER_STORE_HPP
