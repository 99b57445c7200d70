/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: LedgerEngine.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The single write path for balances. Every coin movement in the economy,
 * whether a purchase, a bot spend, a refund or an expiration, is a balanced
 * multi-entry transaction committed here.
 * * RULES:
 * 1. sum(debits) == sum(credits), at least one entry, positive amounts.
 * 2. One idempotency key commits at most once; a repeat returns the
 *    original result with replayed = true.
 * 3. All entries apply or none do. No balance is driven below zero unless
 *    the request allows overdraft.
 * 4. Each entry is sealed onto its wallet's SHA-256 chain.
 * ============================================================================
 */

#ifndef SEL_LEDGER_ENGINE_HPP
#define SEL_LEDGER_ENGINE_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "LedgerStore.hpp"

namespace sel {

// Called by commit_in once every wallet of the request is locked and before
// any balance changes. Throwing aborts the commit.
typedef std::function<void(const std::map<std::string, Wallet>&)> CommitGuard;

class LedgerEngine {
public:
    explicit LedgerEngine(LedgerStore& store) : store_(store) {}

    /**
     * validate
     * Rejects empty, unbalanced or non-positive entry sets with
     * InvalidEntrySet. Does not touch the store.
     */
    void validate(const CommitRequest& request) const;

    /**
     * commit
     * Runs the request in its own store session. A concurrent commit of the
     * same idempotency key is resolved into a replay of the winner.
     * Throws InvalidEntrySet, InsufficientBalance, WalletNotFound or
     * StoreUnavailable.
     */
    TransactionResult commit(const CommitRequest& request);

    /**
     * commit_in
     * Same as commit() inside a caller-owned session; the caller commits.
     * If the key is already committed the replay is returned and nothing is
     * written. DuplicateIdempotencyKey propagates to the caller.
     */
    TransactionResult commit_in(LedgerSession& session, const CommitRequest& request,
                                const CommitGuard& guard = CommitGuard());

    /**
     * adjust
     * One-sided adjustment of a single wallet, balanced against
     * `counterparty` (the treasury unless stated otherwise).
     */
    TransactionResult adjust(const std::string& type, const std::string& idempotency_key,
                             const std::string& wallet_id, Direction direction, coin_amount amount,
                             const json& metadata = json::object(),
                             const std::string& counterparty = TREASURY_WALLET);

    // Creates the wallet if it does not exist and returns its current state.
    Wallet open_wallet(const std::string& wallet_id, OwnerKind kind, coin_amount cap = 0);

    std::optional<Wallet> find_wallet(const std::string& wallet_id);
    std::vector<LedgerEntry> entries(const std::string& wallet_id);

    // Result of an already committed transaction, with the balances its
    // entries recorded at the time.
    static TransactionResult replay_of(const LedgerTransaction& transaction);

    // Replay of the committed transaction holding `idempotency_key`, read in
    // a fresh session. Used after losing a DuplicateIdempotencyKey race.
    TransactionResult replay(const std::string& idempotency_key);

private:
    LedgerStore& store_;
};

} // namespace sel

#endif // SEL_LEDGER_ENGINE_HPP
