/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ExpirationScheduler.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Daily job that removes dormant coins once their retention window has
 * passed. Per due record, oldest first, in one store session:
 *     lock record -> lock wallets -> debit min(balance, expired amount)
 *     -> mark processed
 * The user is notified afterwards, at most once per record, and only when
 * coins were actually taken. A failed notification never reverses the
 * debit.
 * ============================================================================
 */

#ifndef SEL_EXPIRATION_SCHEDULER_HPP
#define SEL_EXPIRATION_SCHEDULER_HPP

#include <optional>
#include <string>
#include "JobSummary.hpp"
#include "../core/config.hpp"
#include "../ledger/LedgerEngine.hpp"
#include "../notify/NotificationSink.hpp"

namespace sel {

class ExpirationScheduler {
public:
    ExpirationScheduler(LedgerStore& store, LedgerEngine& engine, notify::NotificationSink& notifier,
                        const EconomyConfig& config)
        : store_(store), engine_(engine), notifier_(notifier), config_(config) {}

    /**
     * @brief Registers a future expiry of `amount` coins for a user. Called
     * by the granting flow, typically with a 90-day horizon.
     */
    CoinExpirationRecord schedule(const std::string& user_id, coin_amount amount, timestamp expires_at);

    // Pending -> cancelled. Returns false if the record is no longer pending.
    bool cancel(const std::string& expiration_id);

    std::optional<CoinExpirationRecord> find(const std::string& expiration_id);

    JobSummary run(timestamp now);

private:
    enum class Outcome { processed, skipped, failed, timed_out };

    Outcome process_one(const CoinExpirationRecord& due, timestamp now, JobSummary& summary);
    void notify_user(const CoinExpirationRecord& record, timestamp now, JobSummary& summary);
    std::string sink_wallet() const;

    LedgerStore& store_;
    LedgerEngine& engine_;
    notify::NotificationSink& notifier_;
    EconomyConfig config_;
};

} // namespace sel

#endif // SEL_EXPIRATION_SCHEDULER_HPP
