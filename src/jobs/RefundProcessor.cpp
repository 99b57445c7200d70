/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: RefundProcessor.cpp
 * ============================================================================
 */

#include "RefundProcessor.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"
#include <chrono>
#include <thread>

namespace sel {

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------
JobSummary RefundProcessor::run(timestamp now) {
    JobSummary summary;
    summary.job = "refunds";
    summary.started_at = std::chrono::system_clock::now();

    std::vector<RefundCandidate> due;
    {
        std::unique_ptr<LedgerSession> session = store_.begin();
        due = session->due_refunds(now);
    }
    summary.candidates = static_cast<int>(due.size());
    sel_log("INFO", "[REFUNDS] " + std::to_string(due.size()) + " refund candidate(s) due.");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.max_run_seconds);

    for (std::size_t i = 0; i < due.size(); ++i) {
        if (std::chrono::steady_clock::now() >= deadline) {
            summary.deferred = static_cast<int>(due.size() - i);
            sel_log("WARN", "[REFUNDS] Run deadline reached, " + std::to_string(summary.deferred) +
                    " candidate(s) left for the next run.");
            break;
        }
        if (i > 0 && config_.item_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.item_delay_ms));
        }

        switch (process_one(due[i], now)) {
            case Outcome::processed:
                summary.processed++;
                summary.amount += due[i].amount;
                break;
            case Outcome::skipped: summary.skipped++; break;
            case Outcome::released: summary.released++; break;
            case Outcome::failed: summary.failed++; break;
            case Outcome::timed_out:
                summary.failed++;
                summary.timed_out++;
                break;
        }
    }

    try {
        summary.daily_reset = treasury_.reset_daily_spend(now);
    } catch (const std::exception& e) {
        sel_log("ERROR", std::string("[REFUNDS] Daily spend reset failed: ") + e.what());
    }

    summary.finished_at = std::chrono::system_clock::now();
    sel_log("INFO", "[REFUNDS] " + describe(summary));
    return summary;
}

// ----------------------------------------------------------------------------
// process_one
// ----------------------------------------------------------------------------
RefundProcessor::Outcome RefundProcessor::process_one(const RefundCandidate& candidate, timestamp now) {
    ItemClock clock(config_.item_timeout_ms);
    RefundCandidate claimed = candidate;
    claimed.status = RefundStatus::processing;

    // 1. Claim
    try {
        std::unique_ptr<LedgerSession> session = store_.begin();
        if (!session->transition_refund(claimed, RefundStatus::pending)) {
            sel_log("DEBUG", "[REFUNDS] " + candidate.id + " already claimed, skipping.");
            return Outcome::skipped;
        }
        session->commit();
    } catch (const StoreUnavailable& e) {
        sel_log("WARN", "[REFUNDS] Could not claim " + candidate.id + ": " + e.what());
        return Outcome::released;
    } catch (const std::exception& e) {
        sel_log("ERROR", "[REFUNDS] Claim of " + candidate.id + " failed: " + e.what());
        return Outcome::failed;
    }

    // 2. Execute
    try {
        std::unique_ptr<LedgerSession> session = store_.begin();

        // Treasury state before the action row, as every treasury writer does.
        session->lock_treasury_state(TREASURY_WALLET);
        recorder_.mark_refunded_in(*session, candidate.action_id, now);

        json metadata = {
            {"refund_id", candidate.id},
            {"action_id", candidate.action_id},
            {"reason", candidate.reason}
        };
        TransactionResult result = treasury_.absorb_refund_in(*session, candidate.bot_id, candidate.amount,
                                                              "refund-" + candidate.id, metadata);

        RefundCandidate done = claimed;
        done.status = RefundStatus::processed;
        done.processed_at = now;
        done.transaction_id = result.transaction_id;
        if (!session->transition_refund(done, RefundStatus::processing)) {
            throw NotFound("Refund " + candidate.id + " left processing state during execution");
        }
        if (clock.overran()) {
            throw ItemTimedOut("took " + std::to_string(clock.elapsed_ms()) + "ms before commit");
        }
        session->commit();

        sel_log("INFO", "[REFUNDS] Refunded " + std::to_string(candidate.amount) + " coins from " +
                candidate.bot_id + " to treasury (action " + candidate.action_id + ", tx " +
                result.transaction_id + ")");
        return Outcome::processed;
    } catch (const StoreUnavailable& e) {
        sel_log("WARN", "[REFUNDS] Store unavailable for " + candidate.id + ", releasing claim: " + e.what());
        release(claimed);
        return Outcome::released;
    } catch (const ItemTimedOut& e) {
        // Nothing was committed, so the candidate can safely run again.
        sel_log("WARN", "[REFUNDS] Refund " + candidate.id + " timed out, releasing claim: " + e.what());
        release(claimed);
        return Outcome::timed_out;
    } catch (const std::exception& e) {
        sel_log("ERROR", "[REFUNDS] Refund " + candidate.id + " failed: " + e.what());
        park_failed(claimed, e.what(), now);
        return Outcome::failed;
    }
}

void RefundProcessor::release(const RefundCandidate& claimed) {
    RefundCandidate pending = claimed;
    pending.status = RefundStatus::pending;
    try {
        std::unique_ptr<LedgerSession> session = store_.begin();
        session->transition_refund(pending, RefundStatus::processing);
        session->commit();
    } catch (const std::exception& e) {
        sel_log("CRITICAL", "[REFUNDS] Refund " + claimed.id + " stuck in processing: " + e.what());
    }
}

void RefundProcessor::park_failed(const RefundCandidate& claimed, const std::string& reason, timestamp now) {
    RefundCandidate failed = claimed;
    failed.status = RefundStatus::failed;
    failed.error = reason;
    failed.processed_at = now;
    try {
        std::unique_ptr<LedgerSession> session = store_.begin();
        session->transition_refund(failed, RefundStatus::processing);
        session->commit();
    } catch (const std::exception& e) {
        sel_log("CRITICAL", "[REFUNDS] Refund " + claimed.id + " stuck in processing: " + e.what());
    }
}

} // namespace sel
