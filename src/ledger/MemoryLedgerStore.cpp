/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: MemoryLedgerStore.cpp
 * ============================================================================
 */

#include "MemoryLedgerStore.hpp"
#include "../core/errors.hpp"
#include <algorithm>
#include <set>

namespace sel {

std::mutex& MemoryLedgerStore::row_mutex(const std::string& key) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    std::unique_ptr<std::mutex>& slot = row_locks_[key];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

// ----------------------------------------------------------------------------
// MemoryLedgerSession
// Reads see committed state overlaid with this session's staged writes.
// ----------------------------------------------------------------------------
class MemoryLedgerSession : public LedgerSession {
public:
    explicit MemoryLedgerSession(MemoryLedgerStore& store) : store_(store) {}

    // Staged writes are simply dropped; row locks release with held_.
    ~MemoryLedgerSession() override {}

    std::optional<Wallet> find_wallet(const std::string& wallet_id) override {
        auto staged = wallets_.find(wallet_id);
        if (staged != wallets_.end()) return staged->second;
        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        auto it = store_.wallets_.find(wallet_id);
        if (it == store_.wallets_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Wallet> list_wallets() override {
        std::map<std::string, Wallet> merged;
        {
            std::lock_guard<std::mutex> lock(store_.data_mutex_);
            merged = store_.wallets_;
        }
        for (const auto& pair : wallets_) merged[pair.first] = pair.second;

        std::vector<Wallet> result;
        for (const auto& pair : merged) result.push_back(pair.second);
        return result;
    }

    bool create_wallet(const Wallet& wallet) override {
        lock_row("wallet:" + wallet.id);
        if (find_wallet(wallet.id)) return false;
        wallets_[wallet.id] = wallet;
        return true;
    }

    std::vector<Wallet> lock_wallets(const std::vector<std::string>& wallet_ids) override {
        std::set<std::string> sorted(wallet_ids.begin(), wallet_ids.end());
        std::vector<Wallet> result;
        for (const auto& id : sorted) {
            lock_row("wallet:" + id);
            std::optional<Wallet> wallet = find_wallet(id);
            if (!wallet) throw WalletNotFound(id);
            result.push_back(*wallet);
        }
        return result;
    }

    void put_wallet(const Wallet& wallet) override {
        if (!holds("wallet:" + wallet.id)) {
            throw std::logic_error("put_wallet on unlocked wallet " + wallet.id);
        }
        wallets_[wallet.id] = wallet;
    }

    std::optional<LedgerTransaction> find_transaction(const std::string& transaction_id) override {
        for (const auto& tx : transactions_) {
            if (tx.id == transaction_id) return tx;
        }
        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        auto it = store_.transactions_.find(transaction_id);
        if (it == store_.transactions_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<LedgerTransaction> find_transaction_by_key(const std::string& idempotency_key) override {
        for (const auto& tx : transactions_) {
            if (tx.idempotency_key == idempotency_key) return tx;
        }
        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        auto key = store_.idempotency_keys_.find(idempotency_key);
        if (key == store_.idempotency_keys_.end()) return std::nullopt;
        return store_.transactions_.at(key->second);
    }

    void insert_transaction(const LedgerTransaction& transaction) override {
        if (find_transaction_by_key(transaction.idempotency_key)) {
            throw DuplicateIdempotencyKey(transaction.idempotency_key);
        }
        transactions_.push_back(transaction);
    }

    std::vector<LedgerEntry> entries_for_wallet(const std::string& wallet_id) override {
        std::vector<LedgerEntry> result;
        {
            std::lock_guard<std::mutex> lock(store_.data_mutex_);
            for (const auto& entry : store_.entries_) {
                if (entry.wallet_id == wallet_id) result.push_back(entry);
            }
        }
        for (const auto& tx : transactions_) {
            for (const auto& entry : tx.entries) {
                if (entry.wallet_id == wallet_id) result.push_back(entry);
            }
        }
        return result;
    }

    std::size_t count_transactions() override {
        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        return store_.transactions_.size() + transactions_.size();
    }

    std::optional<TreasuryState> find_treasury_state(const std::string& wallet_id) override {
        auto staged = treasury_states_.find(wallet_id);
        if (staged != treasury_states_.end()) return staged->second;
        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        auto it = store_.treasury_states_.find(wallet_id);
        if (it == store_.treasury_states_.end()) return std::nullopt;
        return it->second;
    }

    bool create_treasury_state(const TreasuryState& state) override {
        lock_row("treasury:" + state.wallet_id);
        if (find_treasury_state(state.wallet_id)) return false;
        treasury_states_[state.wallet_id] = state;
        return true;
    }

    TreasuryState lock_treasury_state(const std::string& wallet_id) override {
        lock_row("treasury:" + wallet_id);
        std::optional<TreasuryState> state = find_treasury_state(wallet_id);
        if (!state) throw NotFound("Treasury state not initialised for " + wallet_id);
        return *state;
    }

    void put_treasury_state(const TreasuryState& state) override {
        if (!holds("treasury:" + state.wallet_id)) {
            throw std::logic_error("put_treasury_state without lock");
        }
        treasury_states_[state.wallet_id] = state;
    }

    void insert_bot_action(const BotActionRecord& action) override {
        bot_actions_[action.id] = action;
    }

    std::optional<BotActionRecord> find_bot_action(const std::string& action_id) override {
        auto staged = bot_actions_.find(action_id);
        if (staged != bot_actions_.end()) return staged->second;
        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        auto it = store_.bot_actions_.find(action_id);
        if (it == store_.bot_actions_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<BotActionRecord> find_bot_action_by_transaction(const std::string& transaction_id) override {
        for (const auto& action : merged_actions()) {
            if (action.transaction_id == transaction_id) return action;
        }
        return std::nullopt;
    }

    std::vector<BotActionRecord> list_bot_actions(const std::string& bot_id) override {
        std::vector<BotActionRecord> result;
        for (const auto& action : merged_actions()) {
            if (action.bot_id == bot_id) result.push_back(action);
        }
        std::stable_sort(result.begin(), result.end(), [](const BotActionRecord& a, const BotActionRecord& b) {
            return a.created_at < b.created_at;
        });
        return result;
    }

    bool claim_refund_flag(const std::string& action_id, timestamp refunded_at) override {
        lock_row("action:" + action_id);
        std::optional<BotActionRecord> action = find_bot_action(action_id);
        if (!action) throw NotFound("Bot action not found: " + action_id);
        if (action->was_refunded) return false;
        action->was_refunded = true;
        action->refunded_at = refunded_at;
        bot_actions_[action_id] = *action;
        return true;
    }

    void insert_refund(const RefundCandidate& refund) override {
        if (find_refund_for_action(refund.action_id)) {
            throw DuplicateIdempotencyKey("refund:" + refund.action_id);
        }
        refunds_[refund.id] = refund;
    }

    std::optional<RefundCandidate> find_refund(const std::string& refund_id) override {
        auto staged = refunds_.find(refund_id);
        if (staged != refunds_.end()) return staged->second;
        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        auto it = store_.refunds_.find(refund_id);
        if (it == store_.refunds_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<RefundCandidate> find_refund_for_action(const std::string& action_id) override {
        for (const auto& refund : merged_refunds()) {
            if (refund.action_id == action_id) return refund;
        }
        return std::nullopt;
    }

    std::vector<RefundCandidate> due_refunds(timestamp now) override {
        std::vector<RefundCandidate> result;
        for (const auto& refund : merged_refunds()) {
            if (refund.status == RefundStatus::pending && refund.scheduled_for <= now) {
                result.push_back(refund);
            }
        }
        std::stable_sort(result.begin(), result.end(), [](const RefundCandidate& a, const RefundCandidate& b) {
            return a.scheduled_for < b.scheduled_for;
        });
        return result;
    }

    std::vector<RefundCandidate> list_refunds(RefundStatus status) override {
        std::vector<RefundCandidate> result;
        for (const auto& refund : merged_refunds()) {
            if (refund.status == status) result.push_back(refund);
        }
        return result;
    }

    bool transition_refund(const RefundCandidate& updated, RefundStatus expected) override {
        lock_row("refund:" + updated.id);
        std::optional<RefundCandidate> current = find_refund(updated.id);
        if (!current) throw NotFound("Refund candidate not found: " + updated.id);
        if (current->status != expected) return false;
        refunds_[updated.id] = updated;
        return true;
    }

    void insert_expiration(const CoinExpirationRecord& record) override {
        expirations_[record.id] = record;
    }

    std::optional<CoinExpirationRecord> find_expiration(const std::string& expiration_id) override {
        auto staged = expirations_.find(expiration_id);
        if (staged != expirations_.end()) return staged->second;
        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        auto it = store_.expirations_.find(expiration_id);
        if (it == store_.expirations_.end()) return std::nullopt;
        return it->second;
    }

    CoinExpirationRecord lock_expiration(const std::string& expiration_id) override {
        lock_row("expiration:" + expiration_id);
        std::optional<CoinExpirationRecord> record = find_expiration(expiration_id);
        if (!record) throw NotFound("Expiration record not found: " + expiration_id);
        return *record;
    }

    std::vector<CoinExpirationRecord> due_expirations(timestamp now) override {
        std::map<std::string, CoinExpirationRecord> merged;
        {
            std::lock_guard<std::mutex> lock(store_.data_mutex_);
            merged = store_.expirations_;
        }
        for (const auto& pair : expirations_) merged[pair.first] = pair.second;

        std::vector<CoinExpirationRecord> result;
        for (const auto& pair : merged) {
            if (pair.second.status == ExpirationStatus::pending && pair.second.scheduled_expiry <= now) {
                result.push_back(pair.second);
            }
        }
        std::stable_sort(result.begin(), result.end(), [](const CoinExpirationRecord& a, const CoinExpirationRecord& b) {
            return a.scheduled_expiry < b.scheduled_expiry;
        });
        return result;
    }

    bool transition_expiration(const CoinExpirationRecord& updated, ExpirationStatus expected) override {
        lock_row("expiration:" + updated.id);
        std::optional<CoinExpirationRecord> current = find_expiration(updated.id);
        if (!current) throw NotFound("Expiration record not found: " + updated.id);
        if (current->status != expected) return false;
        expirations_[updated.id] = updated;
        return true;
    }

    void mark_notified(const std::string& expiration_id, timestamp sent_at) override {
        lock_row("expiration:" + expiration_id);
        std::optional<CoinExpirationRecord> current = find_expiration(expiration_id);
        if (!current) throw NotFound("Expiration record not found: " + expiration_id);
        current->notification_sent = true;
        current->notification_sent_at = sent_at;
        expirations_[expiration_id] = *current;
    }

    void commit() override {
        std::lock_guard<std::mutex> lock(store_.data_mutex_);

        // Uniqueness is checked before anything is applied.
        for (const auto& tx : transactions_) {
            if (store_.idempotency_keys_.count(tx.idempotency_key)) {
                throw DuplicateIdempotencyKey(tx.idempotency_key);
            }
        }
        for (const auto& pair : refunds_) {
            if (store_.refunds_.count(pair.first)) continue;
            for (const auto& existing : store_.refunds_) {
                if (existing.second.action_id == pair.second.action_id) {
                    throw DuplicateIdempotencyKey("refund:" + pair.second.action_id);
                }
            }
        }

        for (const auto& pair : wallets_) store_.wallets_[pair.first] = pair.second;
        for (auto tx : transactions_) {
            for (auto& entry : tx.entries) {
                entry.sequence = store_.next_sequence_++;
                store_.entries_.push_back(entry);
            }
            store_.idempotency_keys_[tx.idempotency_key] = tx.id;
            store_.transactions_[tx.id] = tx;
        }
        for (const auto& pair : treasury_states_) store_.treasury_states_[pair.first] = pair.second;
        for (const auto& pair : bot_actions_) store_.bot_actions_[pair.first] = pair.second;
        for (const auto& pair : refunds_) store_.refunds_[pair.first] = pair.second;
        for (const auto& pair : expirations_) store_.expirations_[pair.first] = pair.second;

        wallets_.clear();
        transactions_.clear();
        treasury_states_.clear();
        bot_actions_.clear();
        refunds_.clear();
        expirations_.clear();
    }

private:
    void lock_row(const std::string& key) {
        if (held_keys_.count(key)) return;
        std::mutex& m = store_.row_mutex(key);
        held_.emplace_back(m);
        held_keys_.insert(key);
    }

    bool holds(const std::string& key) const {
        return held_keys_.count(key) > 0;
    }

    std::vector<BotActionRecord> merged_actions() {
        std::map<std::string, BotActionRecord> merged;
        {
            std::lock_guard<std::mutex> lock(store_.data_mutex_);
            merged = store_.bot_actions_;
        }
        for (const auto& pair : bot_actions_) merged[pair.first] = pair.second;
        std::vector<BotActionRecord> result;
        for (const auto& pair : merged) result.push_back(pair.second);
        return result;
    }

    std::vector<RefundCandidate> merged_refunds() {
        std::map<std::string, RefundCandidate> merged;
        {
            std::lock_guard<std::mutex> lock(store_.data_mutex_);
            merged = store_.refunds_;
        }
        for (const auto& pair : refunds_) merged[pair.first] = pair.second;
        std::vector<RefundCandidate> result;
        for (const auto& pair : merged) result.push_back(pair.second);
        return result;
    }

    MemoryLedgerStore& store_;
    std::vector<std::unique_lock<std::mutex>> held_;
    std::set<std::string> held_keys_;

    std::map<std::string, Wallet> wallets_;
    std::vector<LedgerTransaction> transactions_;
    std::map<std::string, TreasuryState> treasury_states_;
    std::map<std::string, BotActionRecord> bot_actions_;
    std::map<std::string, RefundCandidate> refunds_;
    std::map<std::string, CoinExpirationRecord> expirations_;
};

std::unique_ptr<LedgerSession> MemoryLedgerStore::begin() {
    return std::make_unique<MemoryLedgerSession>(*this);
}

} // namespace sel
