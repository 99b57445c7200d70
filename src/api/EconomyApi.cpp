/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: EconomyApi.cpp
 * ============================================================================
 */

#include "EconomyApi.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"
#include <chrono>
#include <httplib.h>

namespace sel {

namespace {

json error_body(const std::string& error, const std::string& message) {
    return {{"status", "ERROR"}, {"error", error}, {"message", message}};
}

json parse_body(const std::string& body) {
    if (body.empty()) return json::object();
    json j = json::parse(body);
    if (!j.is_object()) {
        throw InvalidEntrySet("Request body must be a JSON object.");
    }
    return j;
}

// Scheduling bounds: ten years ahead, or the year 9999.
const int64_t MAX_DELAY_SECONDS = 10LL * 366 * 24 * 3600;
const int64_t MAX_RETENTION_DAYS = 10LL * 366;
const int64_t MAX_EPOCH_SECONDS = 253402300799LL;

timestamp now() {
    return std::chrono::system_clock::now();
}

} // namespace

int EconomyApi::status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidEntrySet: return 400;
        case ErrorCode::WalletNotFound:
        case ErrorCode::NotFound: return 404;
        case ErrorCode::InsufficientBalance:
        case ErrorCode::AlreadyRefunded:
        case ErrorCode::DuplicateIdempotencyKey: return 409;
        case ErrorCode::CapExceeded: return 429;
        case ErrorCode::StoreUnavailable: return 503;
        case ErrorCode::NotificationFailed: return 502;
    }
    return 500;
}

// ----------------------------------------------------------------------------
// guarded
// Typed failures become their HTTP status. Declined financial actions are
// always reported back, never swallowed.
// ----------------------------------------------------------------------------
template <typename Fn>
ApiResponse EconomyApi::guarded(const std::string& operation, Fn&& fn) {
    try {
        return fn();
    } catch (const LedgerError& e) {
        int status = status_for(e.code());
        sel_log(status >= 500 ? "ERROR" : "WARN", operation + " declined (" + to_string(e.code()) + "): " + e.what());
        return {status, error_body(to_string(e.code()), e.what())};
    } catch (const json::exception& e) {
        sel_log("WARN", operation + " rejected malformed request: " + e.what());
        return {400, error_body("BadRequest", e.what())};
    } catch (const std::exception& e) {
        sel_log("ERROR", operation + " failed: " + e.what());
        return {500, error_body("InternalError", e.what())};
    }
}

// ----------------------------------------------------------------------------
// Ledger
// ----------------------------------------------------------------------------
ApiResponse EconomyApi::commit(const std::string& body) {
    return guarded("commit", [&]() -> ApiResponse {
        CommitRequest request = parse_body(body).get<CommitRequest>();
        TransactionResult result = engine_.commit(request);
        return {result.replayed ? 200 : 201, result};
    });
}

ApiResponse EconomyApi::adjust(const std::string& body) {
    return guarded("adjust", [&]() -> ApiResponse {
        json j = parse_body(body);
        TransactionResult result = engine_.adjust(
            j.value("type", std::string(tx_type::ADJUSTMENT)),
            j.at("idempotency_key").get<std::string>(),
            j.at("wallet_id").get<std::string>(),
            direction_from_string(j.at("direction").get<std::string>()),
            amount_field(j, "amount"),
            j.value("metadata", json::object()),
            j.value("counterparty", std::string(TREASURY_WALLET)));
        return {result.replayed ? 200 : 201, result};
    });
}

// ----------------------------------------------------------------------------
// Wallets
// ----------------------------------------------------------------------------
ApiResponse EconomyApi::open_wallet(const std::string& body) {
    return guarded("open_wallet", [&]() -> ApiResponse {
        json j = parse_body(body);
        OwnerKind kind = owner_kind_from_string(j.value("kind", std::string("user")));
        if (kind == OwnerKind::system) {
            throw InvalidEntrySet("System wallets cannot be opened over the API.");
        }
        Wallet wallet = engine_.open_wallet(j.at("id").get<std::string>(), kind,
                                            integer_field(j, "cap", 0, 0, MAX_COIN_AMOUNT));
        return {200, wallet};
    });
}

ApiResponse EconomyApi::get_wallet(const std::string& wallet_id) {
    return guarded("get_wallet", [&]() -> ApiResponse {
        std::optional<Wallet> wallet = engine_.find_wallet(wallet_id);
        if (!wallet) throw WalletNotFound(wallet_id);
        return {200, *wallet};
    });
}

ApiResponse EconomyApi::wallet_entries(const std::string& wallet_id) {
    return guarded("wallet_entries", [&]() -> ApiResponse {
        json entries = engine_.entries(wallet_id);
        return {200, entries};
    });
}

// ----------------------------------------------------------------------------
// Treasury
// ----------------------------------------------------------------------------
ApiResponse EconomyApi::can_afford(const std::string& body) {
    return guarded("can_afford", [&]() -> ApiResponse {
        json j = parse_body(body);
        std::string bot_id = j.at("bot_id").get<std::string>();
        bool ok = treasury_.can_afford(bot_id, amount_field(j, "amount"));
        return {200, {{"bot_id", bot_id}, {"can_afford", ok}}};
    });
}

ApiResponse EconomyApi::bot_spend(const std::string& body) {
    return guarded("bot_spend", [&]() -> ApiResponse {
        json j = parse_body(body);
        TransactionResult result = treasury_.debit_for_bot_spend(
            j.at("bot_id").get<std::string>(),
            amount_field(j, "amount"),
            j.value("reason", std::string("bot spend")),
            j.value("idempotency_key", std::string()));
        return {result.replayed ? 200 : 201, result};
    });
}

ApiResponse EconomyApi::refill(const std::string& body) {
    return guarded("refill", [&]() -> ApiResponse {
        json j = parse_body(body);
        TransactionResult result = treasury_.refill(amount_field(j, "amount"),
                                                    j.value("idempotency_key", std::string()));
        return {result.replayed ? 200 : 201, result};
    });
}

ApiResponse EconomyApi::treasury_stats() {
    return guarded("treasury_stats", [&]() -> ApiResponse {
        return {200, treasury_.stats()};
    });
}

// ----------------------------------------------------------------------------
// Bots
// ----------------------------------------------------------------------------
ApiResponse EconomyApi::record_action(const std::string& body) {
    return guarded("record_action", [&]() -> ApiResponse {
        json j = parse_body(body);
        ActionTarget target;
        target.type = j.at("target").at("type").get<std::string>();
        target.id = j.at("target").at("id").get<std::string>();

        std::string action_id = recorder_.record_spend(
            j.at("bot_id").get<std::string>(),
            j.at("action_type").get<std::string>(),
            target,
            amount_field(j, "cost"),
            j.value("metadata", json::object()),
            j.value("idempotency_key", std::string()));

        std::optional<BotActionRecord> action = recorder_.find(action_id);
        if (!action) throw NotFound("Bot action not found: " + action_id);
        return {201, *action};
    });
}

ApiResponse EconomyApi::disqualify_action(const std::string& action_id, const std::string& body) {
    return guarded("disqualify_action", [&]() -> ApiResponse {
        json j = parse_body(body);
        int64_t delay = integer_field(j, "delay_seconds", 0, 0, MAX_DELAY_SECONDS);

        RefundCandidate candidate = recorder_.schedule_refund(
            action_id, now() + std::chrono::seconds(delay),
            j.value("reason", std::string("Content disqualified")));
        return {202, candidate};
    });
}

// ----------------------------------------------------------------------------
// Expirations
// ----------------------------------------------------------------------------
ApiResponse EconomyApi::schedule_expiration(const std::string& body) {
    return guarded("schedule_expiration", [&]() -> ApiResponse {
        json j = parse_body(body);
        timestamp expires_at;
        if (j.contains("expires_at")) {
            expires_at = from_epoch_seconds(integer_field(j, "expires_at", 0, MAX_EPOCH_SECONDS));
        } else {
            int64_t days = integer_field(j, "retention_days", 90, 0, MAX_RETENTION_DAYS);
            expires_at = now() + std::chrono::hours(24 * days);
        }
        CoinExpirationRecord record = expirations_.schedule(
            j.at("user_id").get<std::string>(), amount_field(j, "amount"), expires_at);
        return {201, record};
    });
}

// ----------------------------------------------------------------------------
// Scheduler triggers
// ----------------------------------------------------------------------------
ApiResponse EconomyApi::run_refunds() {
    return guarded("run_refunds", [&]() -> ApiResponse {
        return {200, refunds_.run(now())};
    });
}

ApiResponse EconomyApi::run_expirations() {
    return guarded("run_expirations", [&]() -> ApiResponse {
        return {200, expirations_.run(now())};
    });
}

ApiResponse EconomyApi::run_daily_reset() {
    return guarded("run_daily_reset", [&]() -> ApiResponse {
        bool reset = treasury_.reset_daily_spend(now());
        return {200, {{"reset", reset}, {"date", utc_date(now())}}};
    });
}

ApiResponse EconomyApi::run_reconcile() {
    return guarded("run_reconcile", [&]() -> ApiResponse {
        return {200, reconciler_.run(now())};
    });
}

// ----------------------------------------------------------------------------
// System
// ----------------------------------------------------------------------------
ApiResponse EconomyApi::system_logs() {
    return {200, recent_logs()};
}

ApiResponse EconomyApi::health() {
    return {200, {{"status", "OK"}, {"service", "sel-engine"}}};
}

// ----------------------------------------------------------------------------
// register_routes
// ----------------------------------------------------------------------------
void register_routes(httplib::Server& svr, EconomyApi& api) {
    auto reply = [](httplib::Response& res, const ApiResponse& out) {
        res.status = out.status;
        res.set_content(out.body.dump(), "application/json");
    };

    // === [SEARCH: LEDGER COMMIT] ===
    svr.Post("/api/ledger/commit", [&api, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, api.commit(req.body));
    });
    svr.Post("/api/ledger/adjust", [&api, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, api.adjust(req.body));
    });

    // === [SEARCH: WALLETS] ===
    svr.Post("/api/wallets", [&api, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, api.open_wallet(req.body));
    });
    svr.Get(R"(/api/wallets/([^/]+))", [&api, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, api.get_wallet(req.matches[1]));
    });
    svr.Get(R"(/api/wallets/([^/]+)/entries)", [&api, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, api.wallet_entries(req.matches[1]));
    });

    // === [SEARCH: TREASURY] ===
    svr.Post("/api/treasury/can-afford", [&api, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, api.can_afford(req.body));
    });
    svr.Post("/api/treasury/bot-spend", [&api, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, api.bot_spend(req.body));
    });
    svr.Post("/api/treasury/refill", [&api, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, api.refill(req.body));
    });
    svr.Get("/api/treasury/stats", [&api, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, api.treasury_stats());
    });

    // === [SEARCH: BOT ACTIONS] ===
    svr.Post("/api/bots/actions", [&api, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, api.record_action(req.body));
    });
    svr.Post(R"(/api/bots/actions/([^/]+)/disqualify)", [&api, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, api.disqualify_action(req.matches[1], req.body));
    });

    // === [SEARCH: EXPIRATIONS] ===
    svr.Post("/api/expirations", [&api, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, api.schedule_expiration(req.body));
    });

    // === [SEARCH: SCHEDULER TRIGGERS] ===
    // Invoked by the external cron runner; each run is idempotent per candidate.
    svr.Post("/api/jobs/refunds/run", [&api, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, api.run_refunds());
    });
    svr.Post("/api/jobs/expirations/run", [&api, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, api.run_expirations());
    });
    svr.Post("/api/jobs/daily-reset/run", [&api, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, api.run_daily_reset());
    });
    svr.Post("/api/jobs/reconcile/run", [&api, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, api.run_reconcile());
    });

    // === [SEARCH: SYSTEM] ===
    svr.Get("/api/system/logs", [&api, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, api.system_logs());
    });
    svr.Get("/api/health", [&api, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, api.health());
    });
}

} // namespace sel
