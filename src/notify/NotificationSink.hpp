/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: NotificationSink.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The outbound edge to the notification collaborator. The economy core only
 * decides that a user must be told about an expiration; delivery belongs to
 * whatever service sits behind the sink.
 * * CONTRACT:
 * Send() either returns (accepted) or throws NotificationFailed. It must
 * not block longer than the timeout it was built with.
 * ============================================================================
 */

#ifndef SEL_NOTIFICATION_SINK_HPP
#define SEL_NOTIFICATION_SINK_HPP

#include <string>
#include "../core/types.hpp"

namespace sel {
namespace notify {

    /**
     * @brief Structured message for an expired balance.
     */
    struct ExpirationNotice {
        std::string expiration_id;
        std::string user_id;
        coin_amount amount = 0;
        std::string reason;
        timestamp effective_date;
    };

    void to_json(json& j, const ExpirationNotice& n);

    class NotificationSink {
    public:
        virtual ~NotificationSink() {}

        virtual void Send(const ExpirationNotice& notice) = 0;
    };

    /**
     * @brief POSTs the notice as JSON to a configured endpoint
     * (e.g. "http://sel-notify:8090/api/notifications") via cpp-httplib.
     * Any transport error or non-2xx answer raises NotificationFailed.
     */
    class HttpNotificationSink : public NotificationSink {
    public:
        HttpNotificationSink(const std::string& endpoint_url, int timeout_ms);

        void Send(const ExpirationNotice& notice) override;

    private:
        std::string base_url_;   // scheme://host[:port]
        std::string path_;
        int timeout_ms_;
    };

    // Used when no endpoint is configured: the notice is only logged.
    class LogNotificationSink : public NotificationSink {
    public:
        void Send(const ExpirationNotice& notice) override;
    };

} // namespace notify
} // namespace sel

#endif // SEL_NOTIFICATION_SINK_HPP
