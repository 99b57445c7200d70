/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: BotActionRecorder.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Audit trail of every coin-spending action taken by an autonomous agent.
 * Each record is written in the same store transaction as the bot spend it
 * describes, and can be refunded at most once.
 * ============================================================================
 */

#ifndef SEL_BOT_ACTION_RECORDER_HPP
#define SEL_BOT_ACTION_RECORDER_HPP

#include <optional>
#include <string>
#include <vector>
#include "TreasuryController.hpp"

namespace sel {

struct ActionTarget {
    std::string type;   // e.g. "thread", "content", "reply"
    std::string id;
};

class BotActionRecorder {
public:
    BotActionRecorder(LedgerStore& store, LedgerEngine& engine, TreasuryController& treasury)
        : store_(store), engine_(engine), treasury_(treasury) {}

    /**
     * @brief Debits the treasury for the bot and records the action.
     * @return The action id. A repeated idempotency key returns the id of
     *         the action recorded the first time.
     */
    std::string record_spend(const std::string& bot_id, const std::string& action_type,
                             const ActionTarget& target, coin_amount cost,
                             const json& metadata = json::object(),
                             const std::string& idempotency_key = "");

    /**
     * @brief Refunds the action's cost to the treasury straight away.
     * Throws AlreadyRefunded on the second call for the same action, and
     * InsufficientBalance (nothing changed) if the bot has spent the coins.
     */
    TransactionResult mark_refunded(const std::string& action_id,
                                    const std::string& reason = "Manual refund");

    // Claims the flag only; the caller commits the compensating transaction
    // in the same session.
    void mark_refunded_in(LedgerSession& session, const std::string& action_id, timestamp refunded_at);

    /**
     * @brief Queues a refund of the action's full cost. Returns the existing
     * candidate if the action was already scheduled.
     */
    RefundCandidate schedule_refund(const std::string& action_id, timestamp scheduled_for,
                                    const std::string& reason);

    std::optional<BotActionRecord> find(const std::string& action_id);
    std::vector<BotActionRecord> list_for_bot(const std::string& bot_id);

private:
    LedgerStore& store_;
    LedgerEngine& engine_;
    TreasuryController& treasury_;
};

} // namespace sel

#endif // SEL_BOT_ACTION_RECORDER_HPP
