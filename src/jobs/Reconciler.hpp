/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: Reconciler.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Read-only audit pass over the whole ledger:
 * - drift between each wallet's cached balance and the sum of its entries;
 * - the SHA-256 seal chain of each wallet, up to its head seal;
 * - conservation, i.e. all balances together sum to zero;
 * - a snapshot of where the coins currently sit.
 * ============================================================================
 */

#ifndef SEL_RECONCILER_HPP
#define SEL_RECONCILER_HPP

#include <string>
#include <vector>
#include "../ledger/LedgerStore.hpp"

namespace sel {

enum class DriftSeverity { medium, high, critical };

std::string to_string(DriftSeverity severity);

// Drift thresholds in coins (strictly greater than).
const coin_amount DRIFT_MEDIUM = 1;
const coin_amount DRIFT_HIGH = 100;
const coin_amount DRIFT_CRITICAL = 1000;

struct WalletDrift {
    std::string wallet_id;
    coin_amount cached_balance = 0;
    coin_amount entry_balance = 0;
    coin_amount drift = 0;
    DriftSeverity severity = DriftSeverity::medium;
};

struct SealBreak {
    std::string wallet_id;
    int64_t sequence = 0;    // 0 when the head seal itself is wrong
    std::string reason;
};

struct ReconcileReport {
    int wallets_checked = 0;
    std::vector<WalletDrift> drifts;
    std::vector<SealBreak> seal_breaks;
    coin_amount total_drift = 0;

    coin_amount net_total = 0;
    bool conserved = true;

    coin_amount user_total = 0;
    coin_amount bot_total = 0;
    coin_amount treasury_balance = 0;
    coin_amount burned_total = 0;
    coin_amount issued_total = 0;
    coin_amount pending_refunds = 0;

    timestamp generated_at;

    bool healthy() const { return drifts.empty() && seal_breaks.empty() && conserved; }
};

void to_json(json& j, const ReconcileReport& r);

class Reconciler {
public:
    explicit Reconciler(LedgerStore& store) : store_(store) {}

    ReconcileReport run(timestamp now);

private:
    LedgerStore& store_;
};

} // namespace sel

#endif // SEL_RECONCILER_HPP
