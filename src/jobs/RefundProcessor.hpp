/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: RefundProcessor.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Daily job that reverses bot spends on content later disqualified. Each
 * candidate moves pending -> processing -> processed | failed:
 * 1. Claim: compare-and-set pending -> processing in its own session, so an
 *    overlapping run skips it.
 * 2. Execute: flip was_refunded, commit the compensating transaction
 *    (debit bot, credit treasury, key "refund-<id>") and mark processed,
 *    all in one session.
 * 3. A transient store failure, or an execute phase that overruns
 *    jobs.item_timeout_ms, releases the claim back to pending. Any other
 *    failure parks the candidate as failed for manual inspection.
 * After the batch the treasury daily counter is reset.
 * ============================================================================
 */

#ifndef SEL_REFUND_PROCESSOR_HPP
#define SEL_REFUND_PROCESSOR_HPP

#include "JobSummary.hpp"
#include "../core/config.hpp"
#include "../economy/BotActionRecorder.hpp"

namespace sel {

class RefundProcessor {
public:
    RefundProcessor(LedgerStore& store, TreasuryController& treasury, BotActionRecorder& recorder,
                    const EconomyConfig& config)
        : store_(store), treasury_(treasury), recorder_(recorder), config_(config) {}

    JobSummary run(timestamp now);

private:
    enum class Outcome { processed, skipped, released, failed, timed_out };

    Outcome process_one(const RefundCandidate& candidate, timestamp now);
    void release(const RefundCandidate& claimed);
    void park_failed(const RefundCandidate& claimed, const std::string& reason, timestamp now);

    LedgerStore& store_;
    TreasuryController& treasury_;
    BotActionRecorder& recorder_;
    EconomyConfig config_;
};

} // namespace sel

#endif // SEL_REFUND_PROCESSOR_HPP
