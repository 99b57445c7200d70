#include "test_support.hpp"
#include "core/errors.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

namespace sel {
namespace test_support {

std::unique_ptr<LedgerSession> FlakyStore::begin() {
    int call = ++calls_;
    int delay = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_.erase(call)) {
            throw StoreUnavailable("injected failure on begin() #" + std::to_string(call));
        }
        auto it = delays_.find(call);
        if (it != delays_.end()) {
            delay = it->second;
            delays_.erase(it);
        }
    }
    if (delay > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    return inner_.begin();
}

void FlakyStore::fail_call(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_.insert(calls_ + n);
}

void FlakyStore::delay_call(int n, int ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    delays_[calls_ + n] = ms;
}

void RecordingSink::Send(const notify::ExpirationNotice& notice) {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts++;
    if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    if (fail) {
        throw NotificationFailed("endpoint down");
    }
    if (crash) {
        throw std::runtime_error("smtp socket reset");
    }
    sent.push_back(notice);
}

EconomyConfig test_config() {
    EconomyConfig cfg;
    cfg.treasury_initial_balance = 100000;
    cfg.daily_spend_cap = 1000;
    cfg.bot_wallet_cap = 0;
    cfg.item_delay_ms = 0;
    cfg.max_run_seconds = 60;
    return cfg;
}

TestEconomy::TestEconomy(const EconomyConfig& cfg)
    : config(cfg),
      engine(store),
      treasury(store, engine, config),
      recorder(store, engine, treasury),
      refunds(store, treasury, recorder, config),
      expirations(store, engine, sink, config),
      reconciler(store) {
    treasury.initialize();
}

coin_amount TestEconomy::balance(const std::string& wallet_id) {
    std::optional<Wallet> wallet = engine.find_wallet(wallet_id);
    if (!wallet) throw WalletNotFound(wallet_id);
    return wallet->balance;
}

void TestEconomy::fund_user(const std::string& user_id, coin_amount amount) {
    engine.open_wallet(user_id, OwnerKind::user);
    engine.adjust(tx_type::REWARD, "grant-" + user_id + "-" + std::to_string(transaction_count()),
                  user_id, Direction::credit, amount);
}

void TestEconomy::open_bot(const std::string& bot_id, coin_amount cap) {
    engine.open_wallet(bot_id, OwnerKind::bot, cap);
}

std::size_t TestEconomy::transaction_count() {
    return store.begin()->count_transactions();
}

CommitRequest transfer(const std::string& key, const std::string& from, const std::string& to,
                       coin_amount amount, const std::string& type) {
    CommitRequest request;
    request.type = type;
    request.idempotency_key = key;

    EntryRequest debit;
    debit.wallet_id = from;
    debit.direction = Direction::debit;
    debit.amount = amount;

    EntryRequest credit;
    credit.wallet_id = to;
    credit.direction = Direction::credit;
    credit.amount = amount;

    request.entries.push_back(debit);
    request.entries.push_back(credit);
    return request;
}

timestamp at(int64_t epoch_seconds) {
    return from_epoch_seconds(epoch_seconds);
}

} // namespace test_support
} // namespace sel
