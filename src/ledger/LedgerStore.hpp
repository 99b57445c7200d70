/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: LedgerStore.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The storage contract of the economy core. A LedgerStore hands out
 * LedgerSessions; a session is exactly one store transaction. Everything
 * written through a session becomes visible atomically on commit() and is
 * discarded if the session is destroyed first.
 * * LOCKING:
 * lock_* methods take row locks held until the session ends. Callers take
 * them in a fixed order to stay deadlock free:
 *     treasury state -> bot action -> refund / expiration -> wallets
 * Wallets are always locked in one call, sorted by id.
 * * IMPLEMENTATIONS:
 * PgLedgerStore (PostgreSQL via libpqxx) and MemoryLedgerStore.
 * ============================================================================
 */

#ifndef SEL_LEDGER_STORE_HPP
#define SEL_LEDGER_STORE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../core/types.hpp"

namespace sel {

class LedgerSession {
public:
    virtual ~LedgerSession() {}

    // --- Wallets -----------------------------------------------------------
    virtual std::optional<Wallet> find_wallet(const std::string& wallet_id) = 0;
    virtual std::vector<Wallet> list_wallets() = 0;

    /**
     * @brief Inserts a wallet unless one with the same id exists.
     * @return true if this call created it.
     */
    virtual bool create_wallet(const Wallet& wallet) = 0;

    /**
     * @brief Row-locks the given wallets (sorted, de-duplicated) and returns
     * their current state in id order. Throws WalletNotFound.
     */
    virtual std::vector<Wallet> lock_wallets(const std::vector<std::string>& wallet_ids) = 0;

    // Only valid for wallets locked by this session.
    virtual void put_wallet(const Wallet& wallet) = 0;

    // --- Transactions & entries ---------------------------------------------
    virtual std::optional<LedgerTransaction> find_transaction(const std::string& transaction_id) = 0;
    virtual std::optional<LedgerTransaction> find_transaction_by_key(const std::string& idempotency_key) = 0;

    /**
     * @brief Persists a committed transaction with all of its entries. Entry
     * sequence numbers are assigned by the store. Throws
     * DuplicateIdempotencyKey if the key is already taken.
     */
    virtual void insert_transaction(const LedgerTransaction& transaction) = 0;

    // Entries of one wallet in commit order.
    virtual std::vector<LedgerEntry> entries_for_wallet(const std::string& wallet_id) = 0;
    virtual std::size_t count_transactions() = 0;

    // --- Treasury state ------------------------------------------------------
    virtual std::optional<TreasuryState> find_treasury_state(const std::string& wallet_id) = 0;
    virtual bool create_treasury_state(const TreasuryState& state) = 0;
    virtual TreasuryState lock_treasury_state(const std::string& wallet_id) = 0;
    virtual void put_treasury_state(const TreasuryState& state) = 0;

    // --- Bot actions ---------------------------------------------------------
    virtual void insert_bot_action(const BotActionRecord& action) = 0;
    virtual std::optional<BotActionRecord> find_bot_action(const std::string& action_id) = 0;
    virtual std::optional<BotActionRecord> find_bot_action_by_transaction(const std::string& transaction_id) = 0;
    virtual std::vector<BotActionRecord> list_bot_actions(const std::string& bot_id) = 0;

    /**
     * @brief Compare-and-set of was_refunded from false to true.
     * @return false if the flag was already set. Throws NotFound.
     */
    virtual bool claim_refund_flag(const std::string& action_id, timestamp refunded_at) = 0;

    // --- Refund candidates ---------------------------------------------------
    // Throws DuplicateIdempotencyKey if the action already has a candidate.
    virtual void insert_refund(const RefundCandidate& refund) = 0;
    virtual std::optional<RefundCandidate> find_refund(const std::string& refund_id) = 0;
    virtual std::optional<RefundCandidate> find_refund_for_action(const std::string& action_id) = 0;

    // Pending candidates with scheduled_for <= now, oldest first.
    virtual std::vector<RefundCandidate> due_refunds(timestamp now) = 0;
    virtual std::vector<RefundCandidate> list_refunds(RefundStatus status) = 0;

    /**
     * @brief Writes `updated` only if the stored status still equals
     * `expected`. The row stays locked until the session ends.
     */
    virtual bool transition_refund(const RefundCandidate& updated, RefundStatus expected) = 0;

    // --- Coin expirations ----------------------------------------------------
    virtual void insert_expiration(const CoinExpirationRecord& record) = 0;
    virtual std::optional<CoinExpirationRecord> find_expiration(const std::string& expiration_id) = 0;

    // Row-locks the record and returns its current state. Throws NotFound.
    virtual CoinExpirationRecord lock_expiration(const std::string& expiration_id) = 0;

    // Pending records with scheduled_expiry <= now, oldest first.
    virtual std::vector<CoinExpirationRecord> due_expirations(timestamp now) = 0;
    virtual bool transition_expiration(const CoinExpirationRecord& updated, ExpirationStatus expected) = 0;
    virtual void mark_notified(const std::string& expiration_id, timestamp sent_at) = 0;

    /**
     * @brief Makes every write of this session durable and visible.
     * Throws DuplicateIdempotencyKey or StoreUnavailable.
     */
    virtual void commit() = 0;
};

class LedgerStore {
public:
    virtual ~LedgerStore() {}

    // Throws StoreUnavailable when no session can be opened.
    virtual std::unique_ptr<LedgerSession> begin() = 0;
};

} // namespace sel

#endif // SEL_LEDGER_STORE_HPP
