/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ExpirationScheduler.cpp
 * ============================================================================
 */

#include "ExpirationScheduler.hpp"
#include "../core/crypto.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace sel {

std::string ExpirationScheduler::sink_wallet() const {
    return config_.expiration_sink == ExpirationSink::burn ? BURN_WALLET : TREASURY_WALLET;
}

// ----------------------------------------------------------------------------
// schedule
// ----------------------------------------------------------------------------
CoinExpirationRecord ExpirationScheduler::schedule(const std::string& user_id, coin_amount amount,
                                                   timestamp expires_at) {
    if (amount <= 0 || amount > MAX_COIN_AMOUNT) {
        throw InvalidEntrySet("Expiration amount must be between 1 and " + std::to_string(MAX_COIN_AMOUNT));
    }

    std::unique_ptr<LedgerSession> session = store_.begin();
    if (!session->find_wallet(user_id)) throw WalletNotFound(user_id);

    CoinExpirationRecord record;
    record.id = SELCrypto::generate_id("exp");
    record.user_id = user_id;
    record.original_amount = amount;
    record.expired_amount = amount;
    record.scheduled_expiry = expires_at;
    record.status = ExpirationStatus::pending;

    session->insert_expiration(record);
    session->commit();

    sel_log("INFO", "[EXPIRY] " + std::to_string(amount) + " coins of " + user_id + " scheduled to expire " +
            format_iso8601(expires_at) + " (" + record.id + ")");
    return record;
}

bool ExpirationScheduler::cancel(const std::string& expiration_id) {
    std::unique_ptr<LedgerSession> session = store_.begin();
    CoinExpirationRecord record = session->lock_expiration(expiration_id);
    if (record.status != ExpirationStatus::pending) return false;

    record.status = ExpirationStatus::cancelled;
    record.processed_at = std::chrono::system_clock::now();
    bool changed = session->transition_expiration(record, ExpirationStatus::pending);
    session->commit();
    if (changed) sel_log("INFO", "[EXPIRY] Cancelled " + expiration_id);
    return changed;
}

std::optional<CoinExpirationRecord> ExpirationScheduler::find(const std::string& expiration_id) {
    std::unique_ptr<LedgerSession> session = store_.begin();
    return session->find_expiration(expiration_id);
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------
JobSummary ExpirationScheduler::run(timestamp now) {
    JobSummary summary;
    summary.job = "expirations";
    summary.started_at = std::chrono::system_clock::now();

    std::vector<CoinExpirationRecord> due;
    {
        std::unique_ptr<LedgerSession> session = store_.begin();
        due = session->due_expirations(now);
    }
    summary.candidates = static_cast<int>(due.size());
    sel_log("INFO", "[EXPIRY] " + std::to_string(due.size()) + " expiration record(s) due.");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.max_run_seconds);

    for (std::size_t i = 0; i < due.size(); ++i) {
        if (std::chrono::steady_clock::now() >= deadline) {
            summary.deferred = static_cast<int>(due.size() - i);
            sel_log("WARN", "[EXPIRY] Run deadline reached, " + std::to_string(summary.deferred) +
                    " record(s) left for the next run.");
            break;
        }
        if (i > 0 && config_.item_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.item_delay_ms));
        }

        switch (process_one(due[i], now, summary)) {
            case Outcome::processed: summary.processed++; break;
            case Outcome::skipped: summary.skipped++; break;
            case Outcome::failed: summary.failed++; break;
            case Outcome::timed_out:
                summary.failed++;
                summary.timed_out++;
                break;
        }
    }

    summary.finished_at = std::chrono::system_clock::now();
    sel_log("INFO", "[EXPIRY] " + describe(summary));
    return summary;
}

// ----------------------------------------------------------------------------
// process_one
// ----------------------------------------------------------------------------
ExpirationScheduler::Outcome ExpirationScheduler::process_one(const CoinExpirationRecord& due, timestamp now,
                                                              JobSummary& summary) {
    ItemClock clock(config_.item_timeout_ms);
    CoinExpirationRecord record;
    try {
        std::unique_ptr<LedgerSession> session = store_.begin();

        record = session->lock_expiration(due.id);
        if (record.status != ExpirationStatus::pending) {
            sel_log("DEBUG", "[EXPIRY] " + due.id + " no longer pending, skipping.");
            return Outcome::skipped;
        }

        // Both wallets in one call so the sorted lock order holds.
        std::string sink = sink_wallet();
        std::vector<Wallet> locked = session->lock_wallets({record.user_id, sink});
        coin_amount balance = 0;
        for (const auto& w : locked) {
            if (w.id == record.user_id) balance = w.balance;
        }

        // Never take more than the wallet holds right now.
        coin_amount actual = std::min(std::max<coin_amount>(balance, 0), record.expired_amount);

        std::string transaction_id;
        if (actual > 0) {
            CommitRequest request;
            request.type = tx_type::EXPIRATION;
            request.idempotency_key = "expiration-" + record.id;
            request.metadata = {
                {"expiration_id", record.id},
                {"reason", config_.expiration_reason},
                {"requested", record.expired_amount}
            };

            EntryRequest debit_user;
            debit_user.wallet_id = record.user_id;
            debit_user.direction = Direction::debit;
            debit_user.amount = actual;

            EntryRequest credit_sink;
            credit_sink.wallet_id = sink;
            credit_sink.direction = Direction::credit;
            credit_sink.amount = actual;

            request.entries.push_back(debit_user);
            request.entries.push_back(credit_sink);
            transaction_id = engine_.commit_in(*session, request).transaction_id;
        }

        record.status = ExpirationStatus::processed;
        record.processed_at = now;
        record.actual_amount = actual;
        record.transaction_id = transaction_id;
        if (!session->transition_expiration(record, ExpirationStatus::pending)) {
            return Outcome::skipped;
        }
        if (clock.overran()) {
            throw ItemTimedOut("took " + std::to_string(clock.elapsed_ms()) + "ms before commit");
        }
        session->commit();

        summary.amount += actual;
        sel_log("INFO", "[EXPIRY] Expired " + std::to_string(actual) + " of " +
                std::to_string(record.expired_amount) + " coins from " + record.user_id + " into " + sink);
    } catch (const ItemTimedOut& e) {
        // Rolled back; the record stays pending for the next run.
        sel_log("WARN", "[EXPIRY] Record " + due.id + " timed out: " + e.what());
        return Outcome::timed_out;
    } catch (const std::exception& e) {
        sel_log("ERROR", "[EXPIRY] Record " + due.id + " failed: " + e.what());
        return Outcome::failed;
    }

    if (!record.notification_sent && record.actual_amount > 0) {
        notify_user(record, now, summary);
    }
    if (clock.overran()) {
        sel_log("WARN", "[EXPIRY] Record " + due.id + " expired but overran its budget (" +
                std::to_string(clock.elapsed_ms()) + "ms)");
        return Outcome::timed_out;
    }
    return Outcome::processed;
}

// ----------------------------------------------------------------------------
// notify_user
// ----------------------------------------------------------------------------
void ExpirationScheduler::notify_user(const CoinExpirationRecord& record, timestamp now, JobSummary& summary) {
    notify::ExpirationNotice notice;
    notice.expiration_id = record.id;
    notice.user_id = record.user_id;
    notice.amount = record.actual_amount;
    notice.reason = config_.expiration_reason;
    notice.effective_date = now;

    try {
        notifier_.Send(notice);
    } catch (const std::exception& e) {
        summary.notification_failures++;
        sel_log("WARN", "[EXPIRY] Notification for " + record.id + " failed: " + e.what());
        return;
    }

    try {
        std::unique_ptr<LedgerSession> session = store_.begin();
        session->mark_notified(record.id, now);
        session->commit();
    } catch (const std::exception& e) {
        sel_log("ERROR", "[EXPIRY] Could not flag " + record.id + " as notified: " + e.what());
    }
}

} // namespace sel
