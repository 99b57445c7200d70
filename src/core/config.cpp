/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.cpp
 * ============================================================================
 */

#include "config.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace sel {

namespace {

ExpirationSink sink_from_string(const std::string& value) {
    if (value == "burn") return ExpirationSink::burn;
    if (value == "treasury") return ExpirationSink::treasury;
    throw std::runtime_error("expiration.sink must be 'burn' or 'treasury', got '" + value + "'");
}

} // namespace

EconomyConfig config_from_json(const json& manifest, EconomyConfig base) {
    EconomyConfig cfg = base;

    if (manifest.contains("treasury")) {
        const json& t = manifest.at("treasury");
        cfg.treasury_initial_balance = t.value("initial_balance", cfg.treasury_initial_balance);
        cfg.daily_spend_cap = t.value("daily_spend_cap", cfg.daily_spend_cap);
        cfg.bot_wallet_cap = t.value("bot_wallet_cap", cfg.bot_wallet_cap);
    }
    if (manifest.contains("expiration")) {
        const json& e = manifest.at("expiration");
        if (e.contains("sink")) cfg.expiration_sink = sink_from_string(e.at("sink").get<std::string>());
        cfg.expiration_reason = e.value("reason", cfg.expiration_reason);
    }
    if (manifest.contains("jobs")) {
        const json& jb = manifest.at("jobs");
        cfg.item_delay_ms = jb.value("item_delay_ms", cfg.item_delay_ms);
        cfg.item_timeout_ms = jb.value("item_timeout_ms", cfg.item_timeout_ms);
        cfg.max_run_seconds = jb.value("max_run_seconds", cfg.max_run_seconds);
    }
    if (manifest.contains("notify")) {
        cfg.notify_url = manifest.at("notify").value("url", cfg.notify_url);
    }
    if (manifest.contains("server")) {
        cfg.port = manifest.at("server").value("port", cfg.port);
    }

    if (cfg.daily_spend_cap < 0 || cfg.bot_wallet_cap < 0 || cfg.treasury_initial_balance < 0) {
        throw std::runtime_error("treasury amounts must be non-negative");
    }
    return cfg;
}

EconomyConfig load_config() {
    EconomyConfig cfg;

    const char* env_config = std::getenv("SEL_CONFIG");
    std::string config_path = env_config ? env_config : DEFAULT_CONFIG_PATH;

    std::ifstream ifs(config_path);
    if (ifs.is_open()) {
        json manifest;
        try {
            manifest = json::parse(ifs);
        } catch (const json::exception& e) {
            sel_log("ERROR", "Config Parse Error: " + std::string(e.what()));
            throw std::runtime_error("Configuration file is corrupt: " + config_path);
        }
        cfg = config_from_json(manifest, cfg);
        sel_log("INFO", "Loaded economy configuration from " + config_path);
    } else {
        sel_log("WARN", "Config file missing at " + config_path + ". Using system defaults.");
    }

    if (const char* env_db = std::getenv("SEL_DB_CONN")) cfg.db_conn = env_db;
    if (const char* env_port = std::getenv("SEL_PORT")) cfg.port = std::stoi(env_port);
    if (const char* env_notify = std::getenv("SEL_NOTIFY_URL")) cfg.notify_url = env_notify;

    return cfg;
}

json config_to_json(const EconomyConfig& config) {
    json j;
    j["treasury"]["initial_balance"] = config.treasury_initial_balance;
    j["treasury"]["daily_spend_cap"] = config.daily_spend_cap;
    j["treasury"]["bot_wallet_cap"] = config.bot_wallet_cap;
    j["expiration"]["sink"] = config.expiration_sink == ExpirationSink::burn ? "burn" : "treasury";
    j["expiration"]["reason"] = config.expiration_reason;
    j["jobs"]["item_delay_ms"] = config.item_delay_ms;
    j["jobs"]["item_timeout_ms"] = config.item_timeout_ms;
    j["jobs"]["max_run_seconds"] = config.max_run_seconds;
    j["notify"]["url"] = config.notify_url;
    j["server"]["port"] = config.port;
    return j;
}

} // namespace sel
