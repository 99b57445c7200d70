/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: EconomyApi.hpp
 * ============================================================================
 * * DESCRIPTION:
 * JSON surface of the economy core. Each handler takes the raw request body
 * (and path parameters) and returns an ApiResponse, so the whole API can be
 * exercised without a socket. register_routes() binds the handlers to a
 * cpp-httplib server.
 * * STATUS MAPPING:
 * InvalidEntrySet, malformed JSON     -> 400
 * WalletNotFound, NotFound            -> 404
 * InsufficientBalance, AlreadyRefunded -> 409
 * CapExceeded                         -> 429
 * StoreUnavailable                    -> 503
 * ============================================================================
 */

#ifndef SEL_ECONOMY_API_HPP
#define SEL_ECONOMY_API_HPP

#include <string>
#include "../core/errors.hpp"
#include "../economy/BotActionRecorder.hpp"
#include "../jobs/ExpirationScheduler.hpp"
#include "../jobs/Reconciler.hpp"
#include "../jobs/RefundProcessor.hpp"

namespace httplib {
class Server;
}

namespace sel {

struct ApiResponse {
    int status = 200;
    json body;
};

class EconomyApi {
public:
    EconomyApi(LedgerEngine& engine, TreasuryController& treasury, BotActionRecorder& recorder,
               RefundProcessor& refunds, ExpirationScheduler& expirations, Reconciler& reconciler)
        : engine_(engine), treasury_(treasury), recorder_(recorder),
          refunds_(refunds), expirations_(expirations), reconciler_(reconciler) {}

    // Ledger
    ApiResponse commit(const std::string& body);
    ApiResponse adjust(const std::string& body);

    // Wallets
    ApiResponse open_wallet(const std::string& body);
    ApiResponse get_wallet(const std::string& wallet_id);
    ApiResponse wallet_entries(const std::string& wallet_id);

    // Treasury
    ApiResponse can_afford(const std::string& body);
    ApiResponse bot_spend(const std::string& body);
    ApiResponse refill(const std::string& body);
    ApiResponse treasury_stats();

    // Bots
    ApiResponse record_action(const std::string& body);
    ApiResponse disqualify_action(const std::string& action_id, const std::string& body);

    // Expirations
    ApiResponse schedule_expiration(const std::string& body);

    // Scheduler triggers
    ApiResponse run_refunds();
    ApiResponse run_expirations();
    ApiResponse run_daily_reset();
    ApiResponse run_reconcile();

    // System
    ApiResponse system_logs();
    ApiResponse health();

    static int status_for(ErrorCode code);

private:
    template <typename Fn>
    ApiResponse guarded(const std::string& operation, Fn&& fn);

    LedgerEngine& engine_;
    TreasuryController& treasury_;
    BotActionRecorder& recorder_;
    RefundProcessor& refunds_;
    ExpirationScheduler& expirations_;
    Reconciler& reconciler_;
};

void register_routes(httplib::Server& svr, EconomyApi& api);

} // namespace sel

#endif // SEL_ECONOMY_API_HPP
