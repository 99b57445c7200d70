/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Economy configuration. Read from the JSON manifest named by SEL_CONFIG
 * (default /app/core/config/sel_config.json); a missing manifest falls back
 * to the defaults below. Environment variables win over the manifest.
 * ============================================================================
 */

#ifndef SEL_CONFIG_HPP
#define SEL_CONFIG_HPP

#include <string>
#include "types.hpp"

namespace sel {

enum class ExpirationSink { burn, treasury };

struct EconomyConfig {
    // Storage & server
    std::string db_conn;                // empty = in-memory store
    int port = 8080;

    // Treasury
    coin_amount treasury_initial_balance = 100000;
    coin_amount daily_spend_cap = 500;
    coin_amount bot_wallet_cap = 199;

    // Expiration
    ExpirationSink expiration_sink = ExpirationSink::burn;
    std::string expiration_reason = "Coins expired after 90 days of inactivity";

    // Batch jobs
    int item_delay_ms = 0;
    int item_timeout_ms = 5000;
    int max_run_seconds = 600;

    // Notification collaborator (empty = log only)
    std::string notify_url;
};

const char* const DEFAULT_CONFIG_PATH = "/app/core/config/sel_config.json";

// Applies manifest keys on top of `base`. Unknown keys are ignored.
EconomyConfig config_from_json(const json& manifest, EconomyConfig base = EconomyConfig());

// Reads SEL_CONFIG (or the default path), then SEL_DB_CONN, SEL_PORT and
// SEL_NOTIFY_URL. Throws std::runtime_error on a corrupt manifest.
EconomyConfig load_config();

json config_to_json(const EconomyConfig& config);

} // namespace sel

#endif // SEL_CONFIG_HPP
