/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: BotActionRecorder.cpp
 * ============================================================================
 */

#include "BotActionRecorder.hpp"
#include "../core/crypto.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"

namespace sel {

// ----------------------------------------------------------------------------
// record_spend
// ----------------------------------------------------------------------------
std::string BotActionRecorder::record_spend(const std::string& bot_id, const std::string& action_type,
                                            const ActionTarget& target, coin_amount cost,
                                            const json& metadata, const std::string& idempotency_key) {
    if (action_type.empty()) {
        throw InvalidEntrySet("Action type is required.");
    }
    std::string key = idempotency_key.empty() ? "bot-action-" + SELCrypto::generate_random_string(24)
                                              : idempotency_key;
    std::string reason = action_type + " " + target.type + ":" + target.id;

    std::string transaction_id;
    try {
        std::unique_ptr<LedgerSession> session = store_.begin();
        TransactionResult result = treasury_.debit_for_bot_spend_in(*session, bot_id, cost, reason, key, metadata);
        transaction_id = result.transaction_id;

        if (!result.replayed) {
            BotActionRecord action;
            action.id = SELCrypto::generate_id("act");
            action.bot_id = bot_id;
            action.action_type = action_type;
            action.target_type = target.type;
            action.target_id = target.id;
            action.coin_cost = cost;
            action.transaction_id = result.transaction_id;
            action.created_at = std::chrono::system_clock::now();
            action.metadata = metadata.is_object() ? metadata : json::object();

            session->insert_bot_action(action);
            session->commit();

            sel_log("INFO", "[BOT] " + bot_id + " " + reason + " for " + std::to_string(cost) +
                    " coins (action " + action.id + ")");
            return action.id;
        }
    } catch (const DuplicateIdempotencyKey&) {
        transaction_id = engine_.replay(key).transaction_id;
    }

    // Replay: the action belongs to the transaction committed under this key.
    std::unique_ptr<LedgerSession> session = store_.begin();
    std::optional<BotActionRecord> existing = session->find_bot_action_by_transaction(transaction_id);
    if (!existing) {
        throw InvalidEntrySet("Idempotency key " + key + " belongs to a transaction with no bot action");
    }
    return existing->id;
}

// ----------------------------------------------------------------------------
// mark_refunded
// Flips was_refunded and commits the compensating bot -> treasury
// transaction in one session. A queued candidate for the action is settled
// with the same transaction so the refund job does not touch it again.
// ----------------------------------------------------------------------------
TransactionResult BotActionRecorder::mark_refunded(const std::string& action_id, const std::string& reason) {
    std::unique_ptr<LedgerSession> session = store_.begin();
    timestamp now = std::chrono::system_clock::now();

    // Treasury state before the action row, as every treasury writer does.
    session->lock_treasury_state(TREASURY_WALLET);
    std::optional<BotActionRecord> action = session->find_bot_action(action_id);
    if (!action) throw NotFound("Bot action not found: " + action_id);
    mark_refunded_in(*session, action_id, now);

    json metadata = {{"action_id", action_id}, {"reason", reason}};
    std::optional<RefundCandidate> queued = session->find_refund_for_action(action_id);
    if (queued) metadata["refund_id"] = queued->id;

    TransactionResult result = treasury_.absorb_refund_in(*session, action->bot_id, action->coin_cost,
                                                          "refund-action-" + action_id, metadata);

    if (queued && queued->status == RefundStatus::pending) {
        RefundCandidate done = *queued;
        done.status = RefundStatus::processed;
        done.processed_at = now;
        done.transaction_id = result.transaction_id;
        session->transition_refund(done, RefundStatus::pending);
    }
    session->commit();

    sel_log("INFO", "[BOT] Refunded " + std::to_string(action->coin_cost) + " coins of action " + action_id +
            " from " + action->bot_id + " (tx " + result.transaction_id + ")");
    return result;
}

void BotActionRecorder::mark_refunded_in(LedgerSession& session, const std::string& action_id,
                                         timestamp refunded_at) {
    if (!session.claim_refund_flag(action_id, refunded_at)) {
        sel_log("WARN", "[BOT] Action " + action_id + " already refunded");
        throw AlreadyRefunded("Bot action already refunded: " + action_id);
    }
}

// ----------------------------------------------------------------------------
// schedule_refund
// ----------------------------------------------------------------------------
RefundCandidate BotActionRecorder::schedule_refund(const std::string& action_id, timestamp scheduled_for,
                                                   const std::string& reason) {
    try {
        std::unique_ptr<LedgerSession> session = store_.begin();
        std::optional<BotActionRecord> action = session->find_bot_action(action_id);
        if (!action) throw NotFound("Bot action not found: " + action_id);

        std::optional<RefundCandidate> existing = session->find_refund_for_action(action_id);
        if (existing) return *existing;

        if (action->was_refunded) {
            throw AlreadyRefunded("Bot action already refunded: " + action_id);
        }

        RefundCandidate candidate;
        candidate.id = SELCrypto::generate_id("rf");
        candidate.action_id = action->id;
        candidate.bot_id = action->bot_id;
        candidate.amount = action->coin_cost;
        candidate.status = RefundStatus::pending;
        candidate.scheduled_for = scheduled_for;
        candidate.reason = reason;

        session->insert_refund(candidate);
        session->commit();

        sel_log("INFO", "[BOT] Refund " + candidate.id + " of " + std::to_string(candidate.amount) +
                " coins scheduled for action " + action_id + " at " + format_iso8601(scheduled_for));
        return candidate;
    } catch (const DuplicateIdempotencyKey&) {
        std::unique_ptr<LedgerSession> session = store_.begin();
        std::optional<RefundCandidate> existing = session->find_refund_for_action(action_id);
        if (!existing) throw StoreUnavailable("Refund for action " + action_id + " not yet visible.");
        return *existing;
    }
}

std::optional<BotActionRecord> BotActionRecorder::find(const std::string& action_id) {
    std::unique_ptr<LedgerSession> session = store_.begin();
    return session->find_bot_action(action_id);
}

std::vector<BotActionRecord> BotActionRecorder::list_for_bot(const std::string& bot_id) {
    std::unique_ptr<LedgerSession> session = store_.begin();
    return session->list_bot_actions(bot_id);
}

} // namespace sel
