/**
 * SEL: Sweets Economy Ledger - In-Process Ledger Store
 * Purpose: LedgerStore kept entirely in memory. Used by the test suite and
 * by the engine when no database connection is configured.
 *
 * Row locks are one mutex per row key, held by the session until it ends.
 * Writes are staged in the session and applied under a single data mutex
 * at commit, where idempotency-key uniqueness is enforced.
 */

#ifndef SEL_MEMORY_LEDGER_STORE_HPP
#define SEL_MEMORY_LEDGER_STORE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "LedgerStore.hpp"

namespace sel {

class MemoryLedgerSession;

class MemoryLedgerStore : public LedgerStore {
public:
    MemoryLedgerStore() {}

    std::unique_ptr<LedgerSession> begin() override;

private:
    friend class MemoryLedgerSession;

    std::mutex& row_mutex(const std::string& key);

    std::mutex locks_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> row_locks_;

    // Committed state, guarded by data_mutex_.
    std::mutex data_mutex_;
    std::map<std::string, Wallet> wallets_;
    std::map<std::string, LedgerTransaction> transactions_;
    std::map<std::string, std::string> idempotency_keys_;
    std::vector<LedgerEntry> entries_;
    int64_t next_sequence_ = 1;
    std::map<std::string, TreasuryState> treasury_states_;
    std::map<std::string, BotActionRecord> bot_actions_;
    std::map<std::string, RefundCandidate> refunds_;
    std::map<std::string, CoinExpirationRecord> expirations_;
};

} // namespace sel

#endif // SEL_MEMORY_LEDGER_STORE_HPP
