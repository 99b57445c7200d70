/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: TreasuryController.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Owns the central pool that funds every bot spend. The pool balance is the
 * `treasury` wallet; the daily counter, caps and lifetime totals live in the
 * treasury state row. Both are only ever changed inside a ledger session
 * that holds the treasury state lock, so the counter moves atomically with
 * the commit that justifies it.
 * ============================================================================
 */

#ifndef SEL_TREASURY_CONTROLLER_HPP
#define SEL_TREASURY_CONTROLLER_HPP

#include <string>
#include "../core/config.hpp"
#include "../ledger/LedgerEngine.hpp"

namespace sel {

struct TreasuryStats {
    coin_amount balance = 0;
    coin_amount daily_cap = 0;
    coin_amount spent_today = 0;
    coin_amount remaining_today = 0;
    coin_amount bot_wallet_cap = 0;
    coin_amount total_bot_spend = 0;
    coin_amount total_refunded = 0;
    coin_amount total_refilled = 0;
    std::string last_reset_date;
};

void to_json(json& j, const TreasuryStats& s);

class TreasuryController {
public:
    TreasuryController(LedgerStore& store, LedgerEngine& engine, const EconomyConfig& config);

    /**
     * @brief Opens the system wallets and the treasury state row and mints
     * the configured opening balance. Safe to call on every start.
     */
    void initialize();

    /**
     * @brief Read-only pre-check for a bot spend. False when the bot would
     * end above its wallet cap, the daily budget would be exceeded or the
     * treasury cannot cover the amount.
     */
    bool can_afford(const std::string& bot_id, coin_amount amount);

    /**
     * @brief Credits the bot and debits the treasury, bumping the daily
     * counter in the same store transaction. Throws CapExceeded (counter
     * untouched) or InsufficientBalance. An empty key gets a fresh one.
     */
    TransactionResult debit_for_bot_spend(const std::string& bot_id, coin_amount amount,
                                          const std::string& reason,
                                          const std::string& idempotency_key = "");

    // Same inside a caller-owned session (used by the Bot Action Recorder).
    TransactionResult debit_for_bot_spend_in(LedgerSession& session, const std::string& bot_id,
                                             coin_amount amount, const std::string& reason,
                                             const std::string& idempotency_key,
                                             const json& metadata = json::object());

    /**
     * @brief Returns refunded coins from a bot wallet to the treasury and
     * adds them to the lifetime refunded total. Runs inside the caller's
     * session; the caller commits.
     */
    TransactionResult absorb_refund_in(LedgerSession& session, const std::string& bot_id,
                                       coin_amount amount, const std::string& idempotency_key,
                                       const json& metadata = json::object());

    // Mints `amount` from the issuance wallet into the treasury.
    TransactionResult refill(coin_amount amount, const std::string& idempotency_key = "");

    /**
     * @brief Zeroes the daily counter once per UTC day.
     * @return false if `now` falls on the day of the last reset.
     */
    bool reset_daily_spend(timestamp now);

    TreasuryStats stats();

    void set_daily_cap(coin_amount cap);
    void set_bot_cap(coin_amount cap);

private:
    LedgerStore& store_;
    LedgerEngine& engine_;
    EconomyConfig config_;
};

} // namespace sel

#endif // SEL_TREASURY_CONTROLLER_HPP
