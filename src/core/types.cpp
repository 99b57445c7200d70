/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: types.cpp
 * ============================================================================
 */

#include "types.hpp"
#include "errors.hpp"
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace sel {

const char* const TREASURY_WALLET = "treasury";
const char* const ISSUANCE_WALLET = "issuance";
const char* const BURN_WALLET = "burn";

const coin_amount MAX_COIN_AMOUNT = 1000000000000LL;

namespace tx_type {
    const char* const PURCHASE = "purchase";
    const char* const REWARD = "reward";
    const char* const BOT_SPEND = "bot_spend";
    const char* const REFUND = "refund";
    const char* const EXPIRATION = "expiration";
    const char* const TREASURY_REFILL = "treasury_refill";
    const char* const ADJUSTMENT = "adjustment";
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::InvalidEntrySet: return "InvalidEntrySet";
        case ErrorCode::AlreadyRefunded: return "AlreadyRefunded";
        case ErrorCode::CapExceeded: return "CapExceeded";
        case ErrorCode::StoreUnavailable: return "StoreUnavailable";
        case ErrorCode::NotificationFailed: return "NotificationFailed";
        case ErrorCode::WalletNotFound: return "WalletNotFound";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::DuplicateIdempotencyKey: return "DuplicateIdempotencyKey";
    }
    return "Unknown";
}

std::string to_string(OwnerKind kind) {
    switch (kind) {
        case OwnerKind::user: return "user";
        case OwnerKind::bot: return "bot";
        case OwnerKind::system: return "system";
    }
    return "user";
}

std::string to_string(Direction direction) {
    return direction == Direction::debit ? "debit" : "credit";
}

OwnerKind owner_kind_from_string(const std::string& value) {
    if (value == "user") return OwnerKind::user;
    if (value == "bot") return OwnerKind::bot;
    if (value == "system") return OwnerKind::system;
    throw InvalidEntrySet("Unknown owner kind: " + value);
}

Direction direction_from_string(const std::string& value) {
    if (value == "debit") return Direction::debit;
    if (value == "credit") return Direction::credit;
    throw InvalidEntrySet("Unknown entry direction: " + value);
}

std::string to_string(RefundStatus status) {
    switch (status) {
        case RefundStatus::pending: return "pending";
        case RefundStatus::processing: return "processing";
        case RefundStatus::processed: return "processed";
        case RefundStatus::failed: return "failed";
    }
    return "pending";
}

std::string to_string(ExpirationStatus status) {
    switch (status) {
        case ExpirationStatus::pending: return "pending";
        case ExpirationStatus::processed: return "processed";
        case ExpirationStatus::cancelled: return "cancelled";
    }
    return "pending";
}

RefundStatus refund_status_from_string(const std::string& value) {
    if (value == "pending") return RefundStatus::pending;
    if (value == "processing") return RefundStatus::processing;
    if (value == "processed") return RefundStatus::processed;
    if (value == "failed") return RefundStatus::failed;
    throw std::runtime_error("Unknown refund status: " + value);
}

ExpirationStatus expiration_status_from_string(const std::string& value) {
    if (value == "pending") return ExpirationStatus::pending;
    if (value == "processed") return ExpirationStatus::processed;
    if (value == "cancelled") return ExpirationStatus::cancelled;
    throw std::runtime_error("Unknown expiration status: " + value);
}

int64_t to_epoch_seconds(timestamp t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

timestamp from_epoch_seconds(int64_t seconds) {
    return timestamp(std::chrono::seconds(seconds));
}

std::string format_iso8601(timestamp t) {
    if (t.time_since_epoch().count() == 0) return "";
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm_utc{};
    gmtime_r(&tt, &tm_utc);
    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string utc_date(timestamp t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm_utc{};
    gmtime_r(&tt, &tm_utc);
    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%d");
    return ss.str();
}

// ----------------------------------------------------------------------------
// JSON mapping
// Timestamps go out as ISO-8601 strings; an unset timestamp renders as "".
// ----------------------------------------------------------------------------
void to_json(json& j, const Wallet& w) {
    j = {
        {"id", w.id},
        {"kind", to_string(w.kind)},
        {"balance", w.balance},
        {"lifetime_earned", w.lifetime_earned},
        {"lifetime_spent", w.lifetime_spent},
        {"cap", w.cap},
        {"updated_at", format_iso8601(w.updated_at)}
    };
}

void to_json(json& j, const LedgerEntry& e) {
    j = {
        {"sequence", e.sequence},
        {"transaction_id", e.transaction_id},
        {"wallet_id", e.wallet_id},
        {"direction", to_string(e.direction)},
        {"amount", e.amount},
        {"balance_before", e.balance_before},
        {"balance_after", e.balance_after},
        {"seal", e.seal},
        {"created_at", format_iso8601(e.created_at)}
    };
}

void to_json(json& j, const LedgerTransaction& t) {
    j = {
        {"id", t.id},
        {"type", t.type},
        {"idempotency_key", t.idempotency_key},
        {"status", t.status},
        {"metadata", t.metadata},
        {"created_at", format_iso8601(t.created_at)},
        {"entries", t.entries}
    };
}

void to_json(json& j, const TransactionResult& r) {
    j = {
        {"transaction_id", r.transaction_id},
        {"resulting_balances", r.resulting_balances},
        {"replayed", r.replayed}
    };
}

void to_json(json& j, const TreasuryState& s) {
    j = {
        {"wallet_id", s.wallet_id},
        {"daily_spent", s.daily_spent},
        {"daily_cap", s.daily_cap},
        {"bot_wallet_cap", s.bot_wallet_cap},
        {"last_reset_date", s.last_reset_date},
        {"total_bot_spend", s.total_bot_spend},
        {"total_refunded", s.total_refunded},
        {"total_refilled", s.total_refilled}
    };
}

void to_json(json& j, const BotActionRecord& a) {
    j = {
        {"id", a.id},
        {"bot_id", a.bot_id},
        {"action_type", a.action_type},
        {"target_type", a.target_type},
        {"target_id", a.target_id},
        {"coin_cost", a.coin_cost},
        {"transaction_id", a.transaction_id},
        {"was_refunded", a.was_refunded},
        {"refunded_at", format_iso8601(a.refunded_at)},
        {"created_at", format_iso8601(a.created_at)},
        {"metadata", a.metadata}
    };
}

void to_json(json& j, const RefundCandidate& r) {
    j = {
        {"id", r.id},
        {"action_id", r.action_id},
        {"bot_id", r.bot_id},
        {"amount", r.amount},
        {"status", to_string(r.status)},
        {"scheduled_for", format_iso8601(r.scheduled_for)},
        {"reason", r.reason},
        {"processed_at", format_iso8601(r.processed_at)},
        {"error", r.error},
        {"transaction_id", r.transaction_id}
    };
}

void to_json(json& j, const CoinExpirationRecord& e) {
    j = {
        {"id", e.id},
        {"user_id", e.user_id},
        {"original_amount", e.original_amount},
        {"expired_amount", e.expired_amount},
        {"actual_amount", e.actual_amount},
        {"scheduled_expiry", format_iso8601(e.scheduled_expiry)},
        {"status", to_string(e.status)},
        {"processed_at", format_iso8601(e.processed_at)},
        {"transaction_id", e.transaction_id},
        {"notification_sent", e.notification_sent}
    };
}

int64_t integer_field(const json& j, const std::string& key, int64_t min, int64_t max) {
    const json& value = j.at(key);
    if (!value.is_number_integer()) {
        throw InvalidEntrySet("Field '" + key + "' must be an integer.");
    }
    if (value.is_number_unsigned() &&
        value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw InvalidEntrySet("Field '" + key + "' is out of range.");
    }
    int64_t n = value.get<int64_t>();
    if (n < min || n > max) {
        throw InvalidEntrySet("Field '" + key + "' must be between " + std::to_string(min) + " and " +
                              std::to_string(max) + ".");
    }
    return n;
}

int64_t integer_field(const json& j, const std::string& key, int64_t fallback, int64_t min, int64_t max) {
    if (!j.contains(key)) return fallback;
    return integer_field(j, key, min, max);
}

coin_amount amount_field(const json& j, const std::string& key) {
    return integer_field(j, key, 1, MAX_COIN_AMOUNT);
}

void from_json(const json& j, EntryRequest& e) {
    e.wallet_id = j.at("wallet_id").get<std::string>();
    e.direction = direction_from_string(j.at("direction").get<std::string>());
    e.amount = amount_field(j, "amount");
}

void from_json(const json& j, CommitRequest& r) {
    r.type = j.at("type").get<std::string>();
    r.idempotency_key = j.at("idempotency_key").get<std::string>();
    r.entries = j.at("entries").get<std::vector<EntryRequest>>();
    r.metadata = j.value("metadata", json::object());
    r.allow_overdraft = j.value("allow_overdraft", false);
}

} // namespace sel
