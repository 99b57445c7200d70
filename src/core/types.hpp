/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: types.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The shared vocabulary of the economy core: wallets, ledger transactions
 * and their entries, treasury state, bot action records, refund candidates
 * and coin expiration records. Every component talks in these structs and
 * every one of them round-trips through nlohmann::json for the API layer.
 * ============================================================================
 */

#ifndef SEL_TYPES_HPP
#define SEL_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sel {

    // coin_amount: minor-unit coins. Signed so that the issuance wallet can
    // carry the (negative) total of everything ever minted.
    typedef int64_t coin_amount;

    typedef std::chrono::system_clock::time_point timestamp;

    // Largest amount a single request may move. Keeps every balance and
    // counter sum well inside int64_t.
    extern const coin_amount MAX_COIN_AMOUNT;

    // Well-known system wallets.
    extern const char* const TREASURY_WALLET;
    extern const char* const ISSUANCE_WALLET;
    extern const char* const BURN_WALLET;

    enum class OwnerKind { user, bot, system };
    enum class Direction { debit, credit };

    std::string to_string(OwnerKind kind);
    std::string to_string(Direction direction);
    OwnerKind owner_kind_from_string(const std::string& value);
    Direction direction_from_string(const std::string& value);

    // Transaction type tags used by the core itself. Callers may commit any
    // non-empty tag; these are the ones the components emit.
    namespace tx_type {
        extern const char* const PURCHASE;
        extern const char* const REWARD;
        extern const char* const BOT_SPEND;
        extern const char* const REFUND;
        extern const char* const EXPIRATION;
        extern const char* const TREASURY_REFILL;
        extern const char* const ADJUSTMENT;
    }

    /**
     * @brief A balance-holding account. The balance is a cache of the sum of
     * the wallet's entries and is only ever written by the Ledger Engine.
     */
    struct Wallet {
        std::string id;
        OwnerKind kind = OwnerKind::user;
        coin_amount balance = 0;
        coin_amount lifetime_earned = 0;
        coin_amount lifetime_spent = 0;
        coin_amount cap = 0;            // 0 = uncapped
        std::string head_seal = "GENESIS";
        timestamp updated_at;
    };

    /**
     * @brief One leg of a ledger transaction as requested by a caller.
     */
    struct EntryRequest {
        std::string wallet_id;
        Direction direction = Direction::debit;
        coin_amount amount = 0;
    };

    /**
     * @brief One settled leg, as stored.
     */
    struct LedgerEntry {
        int64_t sequence = 0;
        std::string transaction_id;
        std::string wallet_id;
        Direction direction = Direction::debit;
        coin_amount amount = 0;
        coin_amount balance_before = 0;
        coin_amount balance_after = 0;
        std::string seal;
        timestamp created_at;
    };

    struct LedgerTransaction {
        std::string id;
        std::string type;
        std::string idempotency_key;
        std::string status = "committed";
        json metadata = json::object();
        timestamp created_at;
        std::vector<LedgerEntry> entries;
    };

    struct CommitRequest {
        std::string type;
        std::string idempotency_key;
        std::vector<EntryRequest> entries;
        json metadata = json::object();
        bool allow_overdraft = false;
    };

    /**
     * @brief What a commit hands back. Replayed results carry the balances
     * recorded by the original commit, never re-derived ones.
     */
    struct TransactionResult {
        std::string transaction_id;
        std::map<std::string, coin_amount> resulting_balances;
        bool replayed = false;
    };

    struct TreasuryState {
        std::string wallet_id;
        coin_amount daily_spent = 0;
        coin_amount daily_cap = 0;
        coin_amount bot_wallet_cap = 0;
        std::string last_reset_date;    // YYYY-MM-DD, UTC
        coin_amount total_bot_spend = 0;
        coin_amount total_refunded = 0;
        coin_amount total_refilled = 0;
    };

    struct BotActionRecord {
        std::string id;
        std::string bot_id;
        std::string action_type;
        std::string target_type;
        std::string target_id;
        coin_amount coin_cost = 0;
        std::string transaction_id;
        bool was_refunded = false;
        timestamp refunded_at;
        timestamp created_at;
        json metadata = json::object();
    };

    enum class RefundStatus { pending, processing, processed, failed };

    struct RefundCandidate {
        std::string id;
        std::string action_id;
        std::string bot_id;
        coin_amount amount = 0;
        RefundStatus status = RefundStatus::pending;
        timestamp scheduled_for;
        std::string reason;
        timestamp processed_at;
        std::string error;
        std::string transaction_id;
    };

    enum class ExpirationStatus { pending, processed, cancelled };

    struct CoinExpirationRecord {
        std::string id;
        std::string user_id;
        coin_amount original_amount = 0;
        coin_amount expired_amount = 0;
        coin_amount actual_amount = 0;
        timestamp scheduled_expiry;
        ExpirationStatus status = ExpirationStatus::pending;
        timestamp processed_at;
        std::string transaction_id;
        bool notification_sent = false;
        timestamp notification_sent_at;
    };

    std::string to_string(RefundStatus status);
    std::string to_string(ExpirationStatus status);
    RefundStatus refund_status_from_string(const std::string& value);
    ExpirationStatus expiration_status_from_string(const std::string& value);

    // Time helpers shared by the stores and the jobs.
    int64_t to_epoch_seconds(timestamp t);
    timestamp from_epoch_seconds(int64_t seconds);
    std::string format_iso8601(timestamp t);
    std::string utc_date(timestamp t);

    // JSON mapping (ADL hooks for nlohmann::json).
    void to_json(json& j, const Wallet& w);
    void to_json(json& j, const LedgerEntry& e);
    void to_json(json& j, const LedgerTransaction& t);
    void to_json(json& j, const TransactionResult& r);
    void to_json(json& j, const TreasuryState& s);
    void to_json(json& j, const BotActionRecord& a);
    void to_json(json& j, const RefundCandidate& r);
    void to_json(json& j, const CoinExpirationRecord& e);
    // Integer fields of a request body. Floats, strings and values outside
    // [min, max] throw InvalidEntrySet.
    int64_t integer_field(const json& j, const std::string& key, int64_t min, int64_t max);
    int64_t integer_field(const json& j, const std::string& key, int64_t fallback, int64_t min, int64_t max);
    coin_amount amount_field(const json& j, const std::string& key);

    void from_json(const json& j, EntryRequest& e);
    void from_json(const json& j, CommitRequest& r);

} // namespace sel

#endif // SEL_TYPES_HPP
