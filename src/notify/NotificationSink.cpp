/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: NotificationSink.cpp
 * ============================================================================
 * * DESCRIPTION:
 * cpp-httplib bridge to the notification collaborator. Connection, read and
 * write timeouts are all set to the per-item job timeout so a stuck
 * endpoint costs one item, never the batch.
 * ============================================================================
 */

#include "NotificationSink.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"
#include <httplib.h>

namespace sel {
namespace notify {

void to_json(json& j, const ExpirationNotice& n) {
    j = {
        {"expiration_id", n.expiration_id},
        {"user_id", n.user_id},
        {"amount", n.amount},
        {"reason", n.reason},
        {"effective_date", format_iso8601(n.effective_date)}
    };
}

// ----------------------------------------------------------------------------
// Constructor
// Splits the endpoint into the client base ("http://host:port") and the
// request path.
// ----------------------------------------------------------------------------
HttpNotificationSink::HttpNotificationSink(const std::string& endpoint_url, int timeout_ms)
    : timeout_ms_(timeout_ms) {
    std::string::size_type scheme_end = endpoint_url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::runtime_error("Notification URL must include a scheme: " + endpoint_url);
    }
    std::string::size_type path_start = endpoint_url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        base_url_ = endpoint_url;
        path_ = "/";
    } else {
        base_url_ = endpoint_url.substr(0, path_start);
        path_ = endpoint_url.substr(path_start);
    }
    sel_log("INFO", "Notification endpoint: " + base_url_ + path_);
}

// ----------------------------------------------------------------------------
// Send
// ----------------------------------------------------------------------------
void HttpNotificationSink::Send(const ExpirationNotice& notice) {
    httplib::Client cli(base_url_);

    time_t sec = timeout_ms_ / 1000;
    time_t usec = (timeout_ms_ % 1000) * 1000;
    cli.set_connection_timeout(sec, usec);
    cli.set_read_timeout(sec, usec);
    cli.set_write_timeout(sec, usec);

    json body = notice;
    body["type"] = "coin_expiration";
    body["source"] = "SEL_CORE";

    auto res = cli.Post(path_, body.dump(), "application/json");
    if (!res) {
        throw NotificationFailed("Notification transport error for " + notice.user_id + ": " +
                                 httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw NotificationFailed("Notification endpoint answered HTTP " + std::to_string(res->status) +
                                 " for " + notice.user_id);
    }
    sel_log("INFO", "[NOTIFY] Expiration notice sent to " + notice.user_id + " (" +
            std::to_string(notice.amount) + " coins)");
}

void LogNotificationSink::Send(const ExpirationNotice& notice) {
    json body = notice;
    sel_log("INFO", "[NOTIFY] " + body.dump());
}

} // namespace notify
} // namespace sel
