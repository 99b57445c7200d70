/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: TreasuryController.cpp
 * ============================================================================
 */

#include "TreasuryController.hpp"
#include "../core/crypto.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"

namespace sel {

namespace {

const char* const GENESIS_REFILL_KEY = "treasury-genesis";

coin_amount effective_cap(const Wallet& bot, const TreasuryState& state) {
    return bot.cap > 0 ? bot.cap : state.bot_wallet_cap;
}

void require_amount(coin_amount amount, const std::string& what) {
    if (amount <= 0 || amount > MAX_COIN_AMOUNT) {
        throw InvalidEntrySet(what + " amount must be between 1 and " + std::to_string(MAX_COIN_AMOUNT) +
                              ", got " + std::to_string(amount));
    }
}

// Written as differences so that neither side can overflow.
bool over_cap(coin_amount held, coin_amount amount, coin_amount cap) {
    return amount > cap - held;
}

} // namespace

void to_json(json& j, const TreasuryStats& s) {
    j = {
        {"balance", s.balance},
        {"daily_cap", s.daily_cap},
        {"spent_today", s.spent_today},
        {"remaining_today", s.remaining_today},
        {"bot_wallet_cap", s.bot_wallet_cap},
        {"total_bot_spend", s.total_bot_spend},
        {"total_refunded", s.total_refunded},
        {"total_refilled", s.total_refilled},
        {"last_reset_date", s.last_reset_date}
    };
}

TreasuryController::TreasuryController(LedgerStore& store, LedgerEngine& engine, const EconomyConfig& config)
    : store_(store), engine_(engine), config_(config) {}

// ----------------------------------------------------------------------------
// initialize
// ----------------------------------------------------------------------------
void TreasuryController::initialize() {
    engine_.open_wallet(TREASURY_WALLET, OwnerKind::system);
    engine_.open_wallet(ISSUANCE_WALLET, OwnerKind::system);
    engine_.open_wallet(BURN_WALLET, OwnerKind::system);

    {
        TreasuryState state;
        state.wallet_id = TREASURY_WALLET;
        state.daily_cap = config_.daily_spend_cap;
        state.bot_wallet_cap = config_.bot_wallet_cap;

        std::unique_ptr<LedgerSession> session = store_.begin();
        if (session->create_treasury_state(state)) {
            session->commit();
            sel_log("INFO", "Treasury state created. Daily cap " + std::to_string(state.daily_cap) +
                    ", bot wallet cap " + std::to_string(state.bot_wallet_cap));
        }
    }

    if (config_.treasury_initial_balance > 0) {
        TransactionResult result = refill(config_.treasury_initial_balance, GENESIS_REFILL_KEY);
        if (!result.replayed) {
            sel_log("INFO", "Treasury opened with " + std::to_string(config_.treasury_initial_balance) + " coins.");
        }
    }
}

// ----------------------------------------------------------------------------
// can_afford
// ----------------------------------------------------------------------------
bool TreasuryController::can_afford(const std::string& bot_id, coin_amount amount) {
    require_amount(amount, "Spend");

    std::unique_ptr<LedgerSession> session = store_.begin();
    std::optional<Wallet> bot = session->find_wallet(bot_id);
    if (!bot) throw WalletNotFound(bot_id);

    std::optional<TreasuryState> state = session->find_treasury_state(TREASURY_WALLET);
    if (!state) throw NotFound("Treasury state not initialised");

    coin_amount cap = effective_cap(*bot, *state);
    if (cap > 0 && over_cap(bot->balance, amount, cap)) {
        sel_log("DEBUG", "can_afford(" + bot_id + ", " + std::to_string(amount) + "): wallet cap " +
                std::to_string(cap) + " reached");
        return false;
    }
    if (over_cap(state->daily_spent, amount, state->daily_cap)) {
        sel_log("DEBUG", "can_afford(" + bot_id + ", " + std::to_string(amount) + "): daily budget exhausted");
        return false;
    }

    std::optional<Wallet> treasury = session->find_wallet(TREASURY_WALLET);
    if (!treasury || treasury->balance < amount) {
        sel_log("DEBUG", "can_afford(" + bot_id + ", " + std::to_string(amount) + "): treasury short");
        return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
// debit_for_bot_spend
// ----------------------------------------------------------------------------
TransactionResult TreasuryController::debit_for_bot_spend(const std::string& bot_id, coin_amount amount,
                                                          const std::string& reason,
                                                          const std::string& idempotency_key) {
    std::string key = idempotency_key.empty() ? "bot-spend-" + SELCrypto::generate_random_string(24)
                                              : idempotency_key;
    try {
        std::unique_ptr<LedgerSession> session = store_.begin();
        TransactionResult result = debit_for_bot_spend_in(*session, bot_id, amount, reason, key);
        if (!result.replayed) {
            session->commit();
        }
        return result;
    } catch (const DuplicateIdempotencyKey&) {
        return engine_.replay(key);
    }
}

TransactionResult TreasuryController::debit_for_bot_spend_in(LedgerSession& session, const std::string& bot_id,
                                                             coin_amount amount, const std::string& reason,
                                                             const std::string& idempotency_key,
                                                             const json& metadata) {
    require_amount(amount, "Spend");

    // Lock order: treasury state first, wallets inside the engine.
    TreasuryState state = session.lock_treasury_state(TREASURY_WALLET);

    std::optional<LedgerTransaction> existing = session.find_transaction_by_key(idempotency_key);
    if (existing) {
        return LedgerEngine::replay_of(*existing);
    }

    if (over_cap(state.daily_spent, amount, state.daily_cap)) {
        sel_log("WARN", "[TREASURY] Daily cap reached: spent " + std::to_string(state.daily_spent) + " of " +
                std::to_string(state.daily_cap) + ", requested " + std::to_string(amount) + " for " + bot_id);
        throw CapExceeded("Daily treasury spend cap exceeded: " + std::to_string(state.daily_spent) + " + " +
                          std::to_string(amount) + " > " + std::to_string(state.daily_cap));
    }

    CommitRequest request;
    request.type = tx_type::BOT_SPEND;
    request.idempotency_key = idempotency_key;
    request.metadata = metadata.is_object() ? metadata : json::object();
    request.metadata["reason"] = reason;
    request.metadata["bot_id"] = bot_id;

    EntryRequest credit_bot;
    credit_bot.wallet_id = bot_id;
    credit_bot.direction = Direction::credit;
    credit_bot.amount = amount;

    EntryRequest debit_treasury;
    debit_treasury.wallet_id = TREASURY_WALLET;
    debit_treasury.direction = Direction::debit;
    debit_treasury.amount = amount;

    request.entries.push_back(credit_bot);
    request.entries.push_back(debit_treasury);

    TransactionResult result = engine_.commit_in(session, request, [&](const std::map<std::string, Wallet>& wallets) {
        const Wallet& bot = wallets.at(bot_id);
        if (bot.kind != OwnerKind::bot) {
            throw InvalidEntrySet("Wallet " + bot_id + " is not a bot wallet");
        }
        coin_amount cap = effective_cap(bot, state);
        if (cap > 0 && over_cap(bot.balance, amount, cap)) {
            sel_log("WARN", "[TREASURY] Bot " + bot_id + " at wallet cap: holds " + std::to_string(bot.balance) +
                    ", cap " + std::to_string(cap));
            throw CapExceeded("Bot wallet cap exceeded for " + bot_id + ": " + std::to_string(bot.balance) +
                              " + " + std::to_string(amount) + " > " + std::to_string(cap));
        }
    });

    if (!result.replayed) {
        state.daily_spent += amount;
        state.total_bot_spend += amount;
        session.put_treasury_state(state);
        sel_log("INFO", "[TREASURY] Spent " + std::to_string(amount) + " coins: " + reason + ". Today " +
                std::to_string(state.daily_spent) + "/" + std::to_string(state.daily_cap));
    }
    return result;
}

// ----------------------------------------------------------------------------
// absorb_refund_in
// ----------------------------------------------------------------------------
TransactionResult TreasuryController::absorb_refund_in(LedgerSession& session, const std::string& bot_id,
                                                       coin_amount amount, const std::string& idempotency_key,
                                                       const json& metadata) {
    require_amount(amount, "Refund");

    TreasuryState state = session.lock_treasury_state(TREASURY_WALLET);

    CommitRequest request;
    request.type = tx_type::REFUND;
    request.idempotency_key = idempotency_key;
    request.metadata = metadata.is_object() ? metadata : json::object();
    request.metadata["bot_id"] = bot_id;

    EntryRequest debit_bot;
    debit_bot.wallet_id = bot_id;
    debit_bot.direction = Direction::debit;
    debit_bot.amount = amount;

    EntryRequest credit_treasury;
    credit_treasury.wallet_id = TREASURY_WALLET;
    credit_treasury.direction = Direction::credit;
    credit_treasury.amount = amount;

    request.entries.push_back(debit_bot);
    request.entries.push_back(credit_treasury);

    TransactionResult result = engine_.commit_in(session, request);
    if (!result.replayed) {
        state.total_refunded += amount;
        session.put_treasury_state(state);
    }
    return result;
}

// ----------------------------------------------------------------------------
// refill
// ----------------------------------------------------------------------------
TransactionResult TreasuryController::refill(coin_amount amount, const std::string& idempotency_key) {
    require_amount(amount, "Refill");
    std::string key = idempotency_key.empty() ? "refill-" + SELCrypto::generate_random_string(24)
                                              : idempotency_key;

    CommitRequest request;
    request.type = tx_type::TREASURY_REFILL;
    request.idempotency_key = key;
    request.allow_overdraft = true;

    EntryRequest mint;
    mint.wallet_id = ISSUANCE_WALLET;
    mint.direction = Direction::debit;
    mint.amount = amount;

    EntryRequest fund;
    fund.wallet_id = TREASURY_WALLET;
    fund.direction = Direction::credit;
    fund.amount = amount;

    request.entries.push_back(mint);
    request.entries.push_back(fund);

    try {
        std::unique_ptr<LedgerSession> session = store_.begin();
        TreasuryState state = session->lock_treasury_state(TREASURY_WALLET);
        TransactionResult result = engine_.commit_in(*session, request);
        if (result.replayed) {
            return result;
        }
        state.total_refilled += amount;
        session->put_treasury_state(state);
        session->commit();
        sel_log("INFO", "[TREASURY] Refilled " + std::to_string(amount) + " coins. New balance: " +
                std::to_string(result.resulting_balances[TREASURY_WALLET]));
        return result;
    } catch (const DuplicateIdempotencyKey&) {
        return engine_.replay(key);
    }
}

// ----------------------------------------------------------------------------
// reset_daily_spend
// ----------------------------------------------------------------------------
bool TreasuryController::reset_daily_spend(timestamp now) {
    std::string today = utc_date(now);

    std::unique_ptr<LedgerSession> session = store_.begin();
    TreasuryState state = session->lock_treasury_state(TREASURY_WALLET);
    if (state.last_reset_date == today) {
        sel_log("DEBUG", "[TREASURY] Daily spend already reset for " + today);
        return false;
    }

    coin_amount previous = state.daily_spent;
    state.daily_spent = 0;
    state.last_reset_date = today;
    session->put_treasury_state(state);
    session->commit();

    sel_log("INFO", "[TREASURY] Daily spend reset for " + today + " (was " + std::to_string(previous) + ")");
    return true;
}

// ----------------------------------------------------------------------------
// stats
// ----------------------------------------------------------------------------
TreasuryStats TreasuryController::stats() {
    std::unique_ptr<LedgerSession> session = store_.begin();
    std::optional<TreasuryState> state = session->find_treasury_state(TREASURY_WALLET);
    if (!state) throw NotFound("Treasury state not initialised");
    std::optional<Wallet> treasury = session->find_wallet(TREASURY_WALLET);
    if (!treasury) throw WalletNotFound(TREASURY_WALLET);

    TreasuryStats s;
    s.balance = treasury->balance;
    s.daily_cap = state->daily_cap;
    s.spent_today = state->daily_spent;
    s.remaining_today = state->daily_cap > state->daily_spent ? state->daily_cap - state->daily_spent : 0;
    s.bot_wallet_cap = state->bot_wallet_cap;
    s.total_bot_spend = state->total_bot_spend;
    s.total_refunded = state->total_refunded;
    s.total_refilled = state->total_refilled;
    s.last_reset_date = state->last_reset_date;
    return s;
}

void TreasuryController::set_daily_cap(coin_amount cap) {
    if (cap < 0 || cap > MAX_COIN_AMOUNT) throw InvalidEntrySet("Daily cap out of range");
    std::unique_ptr<LedgerSession> session = store_.begin();
    TreasuryState state = session->lock_treasury_state(TREASURY_WALLET);
    state.daily_cap = cap;
    session->put_treasury_state(state);
    session->commit();
    sel_log("INFO", "[TREASURY] Daily cap set to " + std::to_string(cap));
}

void TreasuryController::set_bot_cap(coin_amount cap) {
    if (cap < 0 || cap > MAX_COIN_AMOUNT) throw InvalidEntrySet("Bot wallet cap out of range");
    std::unique_ptr<LedgerSession> session = store_.begin();
    TreasuryState state = session->lock_treasury_state(TREASURY_WALLET);
    state.bot_wallet_cap = cap;
    session->put_treasury_state(state);
    session->commit();
    sel_log("INFO", "[TREASURY] Default bot wallet cap set to " + std::to_string(cap));
}

} // namespace sel
