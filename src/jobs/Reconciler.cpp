/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: Reconciler.cpp
 * ============================================================================
 */

#include "Reconciler.hpp"
#include "../core/crypto.hpp"
#include "../core/logger.hpp"

namespace sel {

std::string to_string(DriftSeverity severity) {
    switch (severity) {
        case DriftSeverity::medium: return "medium";
        case DriftSeverity::high: return "high";
        case DriftSeverity::critical: return "critical";
    }
    return "medium";
}

void to_json(json& j, const ReconcileReport& r) {
    json drifts = json::array();
    for (const auto& d : r.drifts) {
        drifts.push_back({
            {"wallet_id", d.wallet_id},
            {"cached_balance", d.cached_balance},
            {"entry_balance", d.entry_balance},
            {"drift", d.drift},
            {"severity", to_string(d.severity)}
        });
    }
    json breaks = json::array();
    for (const auto& b : r.seal_breaks) {
        breaks.push_back({{"wallet_id", b.wallet_id}, {"sequence", b.sequence}, {"reason", b.reason}});
    }

    j = {
        {"healthy", r.healthy()},
        {"wallets_checked", r.wallets_checked},
        {"drifts", drifts},
        {"seal_breaks", breaks},
        {"total_drift", r.total_drift},
        {"net_total", r.net_total},
        {"conserved", r.conserved},
        {"snapshot", {
            {"user_total", r.user_total},
            {"bot_total", r.bot_total},
            {"treasury_balance", r.treasury_balance},
            {"burned_total", r.burned_total},
            {"issued_total", r.issued_total},
            {"pending_refunds", r.pending_refunds}
        }},
        {"generated_at", format_iso8601(r.generated_at)}
    };
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------
ReconcileReport Reconciler::run(timestamp now) {
    ReconcileReport report;
    report.generated_at = now;

    std::unique_ptr<LedgerSession> session = store_.begin();
    std::vector<Wallet> wallets = session->list_wallets();
    sel_log("INFO", "[AUDIT] Checking " + std::to_string(wallets.size()) + " wallets...");

    for (const auto& wallet : wallets) {
        report.wallets_checked++;
        report.net_total += wallet.balance;

        switch (wallet.kind) {
            case OwnerKind::user: report.user_total += wallet.balance; break;
            case OwnerKind::bot: report.bot_total += wallet.balance; break;
            case OwnerKind::system:
                if (wallet.id == TREASURY_WALLET) report.treasury_balance = wallet.balance;
                else if (wallet.id == BURN_WALLET) report.burned_total = wallet.balance;
                else if (wallet.id == ISSUANCE_WALLET) report.issued_total = -wallet.balance;
                break;
        }

        std::vector<LedgerEntry> entries = session->entries_for_wallet(wallet.id);

        // Replay the chain from genesis.
        std::string link = "GENESIS";
        coin_amount running = 0;
        bool chain_ok = true;
        for (const auto& entry : entries) {
            if (entry.balance_before != running) {
                report.seal_breaks.push_back({wallet.id, entry.sequence, "balance continuity broken"});
                chain_ok = false;
                break;
            }
            if (SELCrypto::calculate_entry_seal(link, entry) != entry.seal) {
                report.seal_breaks.push_back({wallet.id, entry.sequence, "seal mismatch"});
                chain_ok = false;
                break;
            }
            coin_amount signed_amount = entry.direction == Direction::credit ? entry.amount : -entry.amount;
            running += signed_amount;
            link = entry.seal;
        }
        if (chain_ok && link != wallet.head_seal) {
            report.seal_breaks.push_back({wallet.id, 0, "head seal does not match last entry"});
        }

        // Drift is measured against the plain entry sum, independent of the chain.
        coin_amount entry_balance = 0;
        for (const auto& entry : entries) {
            entry_balance += entry.direction == Direction::credit ? entry.amount : -entry.amount;
        }
        coin_amount drift = wallet.balance > entry_balance ? wallet.balance - entry_balance
                                                           : entry_balance - wallet.balance;
        if (drift > DRIFT_MEDIUM) {
            WalletDrift d;
            d.wallet_id = wallet.id;
            d.cached_balance = wallet.balance;
            d.entry_balance = entry_balance;
            d.drift = drift;
            d.severity = drift > DRIFT_CRITICAL ? DriftSeverity::critical
                       : drift > DRIFT_HIGH ? DriftSeverity::high
                       : DriftSeverity::medium;
            report.drifts.push_back(d);
            report.total_drift += drift;

            std::string level = d.severity == DriftSeverity::critical ? "CRITICAL" : "WARN";
            sel_log(level, "[AUDIT] " + to_string(d.severity) + " drift on " + wallet.id + ": " +
                    std::to_string(drift) + " coins (wallet=" + std::to_string(wallet.balance) +
                    ", entries=" + std::to_string(entry_balance) + ")");
        }
    }

    for (const auto& refund : session->list_refunds(RefundStatus::pending)) {
        report.pending_refunds += refund.amount;
    }

    report.conserved = report.net_total == 0;
    if (!report.conserved) {
        sel_log("CRITICAL", "[AUDIT] Conservation violated: balances sum to " + std::to_string(report.net_total));
    }
    for (const auto& b : report.seal_breaks) {
        sel_log("CRITICAL", "[AUDIT] Seal chain broken on " + b.wallet_id + ": " + b.reason);
    }

    sel_log("INFO", std::string("[AUDIT] ") + (report.healthy() ? "PASSED" : "FAILED") + ": " +
            std::to_string(report.wallets_checked) + " wallets, drift " + std::to_string(report.total_drift) +
            ", treasury " + std::to_string(report.treasury_balance) + ", issued " +
            std::to_string(report.issued_total));
    return report;
}

} // namespace sel
