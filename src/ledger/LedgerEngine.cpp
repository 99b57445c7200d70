/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: LedgerEngine.cpp
 * ============================================================================
 */

#include "LedgerEngine.hpp"
#include "../core/crypto.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"
#include <limits>

namespace sel {

// ----------------------------------------------------------------------------
// validate
// The fundamental rule of the ledger: debits and credits must cancel.
// ----------------------------------------------------------------------------
void LedgerEngine::validate(const CommitRequest& request) const {
    if (request.type.empty()) {
        throw InvalidEntrySet("Transaction type is required.");
    }
    if (request.idempotency_key.empty()) {
        throw InvalidEntrySet("Idempotency key is required.");
    }
    if (request.entries.empty()) {
        throw InvalidEntrySet("Transaction must have at least one entry.");
    }

    coin_amount debits = 0;
    coin_amount credits = 0;
    const coin_amount limit = std::numeric_limits<coin_amount>::max() / 2;

    for (const auto& entry : request.entries) {
        if (entry.wallet_id.empty()) {
            throw InvalidEntrySet("Entry wallet id is required.");
        }
        if (entry.amount <= 0) {
            throw InvalidEntrySet("Entry amount must be positive, got " + std::to_string(entry.amount) +
                                  " for " + entry.wallet_id);
        }
        coin_amount& side = entry.direction == Direction::debit ? debits : credits;
        if (entry.amount > limit - side) {
            throw InvalidEntrySet("Entry amounts overflow.");
        }
        side += entry.amount;
    }

    if (debits != credits) {
        throw InvalidEntrySet("Transaction unbalanced! Debits " + std::to_string(debits) +
                              " != credits " + std::to_string(credits));
    }
}

// ----------------------------------------------------------------------------
// commit
// ----------------------------------------------------------------------------
TransactionResult LedgerEngine::commit(const CommitRequest& request) {
    validate(request);

    try {
        std::unique_ptr<LedgerSession> session = store_.begin();
        TransactionResult result = commit_in(*session, request);
        if (!result.replayed) {
            session->commit();
        }
        return result;
    } catch (const DuplicateIdempotencyKey&) {
        // Lost the race for this key; the winner's result is the answer.
        sel_log("INFO", "Concurrent commit of key " + request.idempotency_key + " resolved as replay.");
        return replay(request.idempotency_key);
    }
}

// ----------------------------------------------------------------------------
// commit_in
// Locks, guards, applies, seals and persists. Nothing reaches the session
// until every check has passed.
// ----------------------------------------------------------------------------
TransactionResult LedgerEngine::commit_in(LedgerSession& session, const CommitRequest& request,
                                          const CommitGuard& guard) {
    validate(request);

    std::optional<LedgerTransaction> existing = session.find_transaction_by_key(request.idempotency_key);
    if (existing) {
        return replay_of(*existing);
    }

    std::vector<std::string> wallet_ids;
    for (const auto& entry : request.entries) wallet_ids.push_back(entry.wallet_id);

    std::map<std::string, Wallet> wallets;
    for (auto& wallet : session.lock_wallets(wallet_ids)) {
        wallets[wallet.id] = wallet;
    }

    // A commit of the same key may have finished while we waited on a lock.
    existing = session.find_transaction_by_key(request.idempotency_key);
    if (existing) {
        return replay_of(*existing);
    }

    if (guard) {
        guard(wallets);
    }

    timestamp now = std::chrono::system_clock::now();
    LedgerTransaction tx;
    tx.id = SELCrypto::generate_id("tx");
    tx.type = request.type;
    tx.idempotency_key = request.idempotency_key;
    tx.metadata = request.metadata.is_null() ? json::object() : request.metadata;
    tx.created_at = now;

    std::map<std::string, coin_amount> opening;
    for (const auto& pair : wallets) opening[pair.first] = pair.second.balance;

    for (const auto& req : request.entries) {
        Wallet& wallet = wallets.at(req.wallet_id);

        LedgerEntry entry;
        entry.transaction_id = tx.id;
        entry.wallet_id = wallet.id;
        entry.direction = req.direction;
        entry.amount = req.amount;
        entry.balance_before = wallet.balance;
        entry.balance_after = req.direction == Direction::credit ? wallet.balance + req.amount
                                                                 : wallet.balance - req.amount;
        entry.created_at = now;

        // Bond this entry to the wallet's history.
        entry.seal = SELCrypto::calculate_entry_seal(wallet.head_seal, entry);
        wallet.head_seal = entry.seal;

        wallet.balance = entry.balance_after;
        if (req.direction == Direction::credit) {
            wallet.lifetime_earned += req.amount;
        } else {
            wallet.lifetime_spent += req.amount;
        }
        wallet.updated_at = now;

        tx.entries.push_back(entry);
    }

    if (!request.allow_overdraft) {
        for (const auto& pair : wallets) {
            const Wallet& wallet = pair.second;
            if (wallet.balance < 0 && wallet.balance < opening[wallet.id]) {
                sel_log("WARN", "Declined " + request.type + " [" + request.idempotency_key + "]: wallet " +
                        wallet.id + " holds " + std::to_string(opening[wallet.id]) + ", needs " +
                        std::to_string(opening[wallet.id] - wallet.balance));
                throw InsufficientBalance("Insufficient balance in wallet " + wallet.id + ": balance " +
                                          std::to_string(opening[wallet.id]) + ", shortfall " +
                                          std::to_string(-wallet.balance));
            }
        }
    }

    for (const auto& pair : wallets) session.put_wallet(pair.second);
    session.insert_transaction(tx);

    TransactionResult result;
    result.transaction_id = tx.id;
    for (const auto& pair : wallets) result.resulting_balances[pair.first] = pair.second.balance;

    sel_log("INFO", "Committed " + tx.type + " " + tx.id + " (" + std::to_string(tx.entries.size()) +
            " entries, key " + tx.idempotency_key + ")");
    return result;
}

// ----------------------------------------------------------------------------
// adjust
// ----------------------------------------------------------------------------
TransactionResult LedgerEngine::adjust(const std::string& type, const std::string& idempotency_key,
                                       const std::string& wallet_id, Direction direction, coin_amount amount,
                                       const json& metadata, const std::string& counterparty) {
    if (wallet_id == counterparty) {
        throw InvalidEntrySet("Adjustment counterparty must differ from the wallet: " + wallet_id);
    }

    CommitRequest request;
    request.type = type;
    request.idempotency_key = idempotency_key;
    request.metadata = metadata;

    EntryRequest leg;
    leg.wallet_id = wallet_id;
    leg.direction = direction;
    leg.amount = amount;

    EntryRequest counter;
    counter.wallet_id = counterparty;
    counter.direction = direction == Direction::credit ? Direction::debit : Direction::credit;
    counter.amount = amount;

    request.entries.push_back(leg);
    request.entries.push_back(counter);
    return commit(request);
}

// ----------------------------------------------------------------------------
// open_wallet
// ----------------------------------------------------------------------------
Wallet LedgerEngine::open_wallet(const std::string& wallet_id, OwnerKind kind, coin_amount cap) {
    if (wallet_id.empty()) {
        throw InvalidEntrySet("Wallet id is required.");
    }
    if (cap < 0) {
        throw InvalidEntrySet("Wallet cap cannot be negative.");
    }

    Wallet wallet;
    wallet.id = wallet_id;
    wallet.kind = kind;
    wallet.cap = cap;
    wallet.updated_at = std::chrono::system_clock::now();

    std::unique_ptr<LedgerSession> session = store_.begin();
    if (session->create_wallet(wallet)) {
        session->commit();
        sel_log("INFO", "Opened " + to_string(kind) + " wallet " + wallet_id);
        return wallet;
    }

    std::optional<Wallet> current = session->find_wallet(wallet_id);
    if (!current) throw WalletNotFound(wallet_id);
    return *current;
}

std::optional<Wallet> LedgerEngine::find_wallet(const std::string& wallet_id) {
    std::unique_ptr<LedgerSession> session = store_.begin();
    return session->find_wallet(wallet_id);
}

std::vector<LedgerEntry> LedgerEngine::entries(const std::string& wallet_id) {
    std::unique_ptr<LedgerSession> session = store_.begin();
    if (!session->find_wallet(wallet_id)) throw WalletNotFound(wallet_id);
    return session->entries_for_wallet(wallet_id);
}

// ----------------------------------------------------------------------------
// Replays
// ----------------------------------------------------------------------------
TransactionResult LedgerEngine::replay_of(const LedgerTransaction& transaction) {
    TransactionResult result;
    result.transaction_id = transaction.id;
    result.replayed = true;
    // Entries are in commit order, so the last one per wallet wins.
    for (const auto& entry : transaction.entries) {
        result.resulting_balances[entry.wallet_id] = entry.balance_after;
    }
    return result;
}

TransactionResult LedgerEngine::replay(const std::string& idempotency_key) {
    std::unique_ptr<LedgerSession> session = store_.begin();
    std::optional<LedgerTransaction> existing = session->find_transaction_by_key(idempotency_key);
    if (!existing) {
        throw StoreUnavailable("Transaction for key " + idempotency_key + " not yet visible.");
    }
    return replay_of(*existing);
}

} // namespace sel
