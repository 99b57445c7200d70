/**
 * SEL: Sweets Economy Ledger - Test Support
 * Purpose: A fully wired in-memory economy plus the doubles the job tests
 * need (a store that fails on demand, a notification sink that records).
 */

#ifndef SEL_TEST_SUPPORT_HPP
#define SEL_TEST_SUPPORT_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "api/EconomyApi.hpp"
#include "ledger/MemoryLedgerStore.hpp"

namespace sel {
namespace test_support {

// Delegates to a MemoryLedgerStore; the chosen begin() calls throw
// StoreUnavailable instead.
class FlakyStore : public LedgerStore {
public:
    std::unique_ptr<LedgerSession> begin() override;

    // Makes the n-th begin() from now (1 = the next one) fail.
    void fail_call(int n);
    // Makes the n-th begin() from now sleep for `ms` before it returns.
    void delay_call(int n, int ms);
    int calls() const { return calls_; }

private:
    MemoryLedgerStore inner_;
    std::atomic<int> calls_{0};
    std::mutex mutex_;
    std::set<int> failing_;
    std::map<int, int> delays_;
};

class RecordingSink : public notify::NotificationSink {
public:
    void Send(const notify::ExpirationNotice& notice) override;

    // Read only once the runs that call Send have finished.
    std::vector<notify::ExpirationNotice> sent;
    int attempts = 0;
    std::atomic<bool> fail{false};      // throws NotificationFailed
    std::atomic<bool> crash{false};     // throws a plain std::runtime_error
    int delay_ms = 0;

private:
    std::mutex mutex_;
};

EconomyConfig test_config();

/**
 * @brief Every component of the core over one FlakyStore, treasury
 * initialised. Nothing fails unless a test asks the store to.
 */
struct TestEconomy {
    explicit TestEconomy(const EconomyConfig& cfg = test_config());

    EconomyConfig config;
    FlakyStore store;
    RecordingSink sink;
    LedgerEngine engine;
    TreasuryController treasury;
    BotActionRecorder recorder;
    RefundProcessor refunds;
    ExpirationScheduler expirations;
    Reconciler reconciler;

    coin_amount balance(const std::string& wallet_id);

    // Opens a user wallet and grants it `amount` coins from the treasury.
    void fund_user(const std::string& user_id, coin_amount amount);

    void open_bot(const std::string& bot_id, coin_amount cap = 0);
    std::size_t transaction_count();
};

CommitRequest transfer(const std::string& key, const std::string& from, const std::string& to,
                       coin_amount amount, const std::string& type = "transfer");

timestamp at(int64_t epoch_seconds);

} // namespace test_support
} // namespace sel

#endif // SEL_TEST_SUPPORT_HPP
