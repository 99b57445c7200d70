/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: main.cpp
 * ============================================================================
 * * DESCRIPTION:
 * The sel_engine daemon. Wires the ledger store, the engine, the treasury,
 * the bot recorder and the batch jobs together and serves the Economy API.
 * * USAGE:
 *     sel_engine            PostgreSQL store from SEL_DB_CONN
 *     sel_engine --memory   in-process store (demo / local testing)
 * ============================================================================
 */

#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <httplib.h>
#include "config.hpp"
#include "logger.hpp"
#include "../api/EconomyApi.hpp"
#include "../ledger/MemoryLedgerStore.hpp"
#include "../ledger/PgLedgerStore.hpp"

using namespace sel;

namespace {

const int STATEMENT_TIMEOUT_MS = 10000;

} // namespace

int main(int argc, char** argv) {
    bool memory_mode = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--memory") == 0) memory_mode = true;
    }

    EconomyConfig config;
    try {
        config = load_config();
    } catch (const std::exception& e) {
        sel_log("FATAL", std::string("Configuration rejected: ") + e.what() + ". System halted.");
        return 1;
    }

    // === [SEARCH: LEDGER STORE] ===
    std::unique_ptr<LedgerStore> store;
    if (memory_mode) {
        sel_log("WARN", "Running on the in-memory ledger store. Nothing will survive a restart.");
        store = std::make_unique<MemoryLedgerStore>();
    } else {
        if (config.db_conn.empty()) {
            sel_log("FATAL", "Database connection variable missing. System halted.");
            return 1;
        }
        auto pg = std::make_unique<PgLedgerStore>(config.db_conn, STATEMENT_TIMEOUT_MS);
        try {
            pg->ensure_schema();
        } catch (const std::exception& e) {
            sel_log("FATAL", std::string("Ledger schema bootstrap failed: ") + e.what());
            return 1;
        }
        store = std::move(pg);
    }

    // === [SEARCH: NOTIFICATION GATEWAY] ===
    std::unique_ptr<notify::NotificationSink> notifier;
    if (config.notify_url.empty()) {
        sel_log("WARN", "No notification endpoint configured. Expiration notices will only be logged.");
        notifier = std::make_unique<notify::LogNotificationSink>();
    } else {
        notifier = std::make_unique<notify::HttpNotificationSink>(config.notify_url, config.item_timeout_ms);
    }

    LedgerEngine engine(*store);
    TreasuryController treasury(*store, engine, config);
    BotActionRecorder recorder(*store, engine, treasury);
    RefundProcessor refunds(*store, treasury, recorder, config);
    ExpirationScheduler expirations(*store, engine, *notifier, config);
    Reconciler reconciler(*store);

    try {
        treasury.initialize();
    } catch (const std::exception& e) {
        sel_log("FATAL", std::string("Treasury initialisation failed: ") + e.what());
        return 1;
    }

    EconomyApi api(engine, treasury, recorder, refunds, expirations, reconciler);

    httplib::Server svr;
    sel_log("INFO", "SEL: Sweets Economy Ledger: Engine Active.");

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::string log_msg = "API Request: " + req.method + " " + req.path + " -> Status " + std::to_string(res.status);
        sel_log("INFO", log_msg);
    });

    register_routes(svr, api);

    sel_log("INFO", "Listening on 0.0.0.0:" + std::to_string(config.port));
    if (!svr.listen("0.0.0.0", config.port)) {
        sel_log("FATAL", "Could not bind port " + std::to_string(config.port));
        return 1;
    }
    return 0;
}
