#ifndef NOTIFIER_LOGS_HPP
#define NOTIFIER_LOGS_HPP

#include <cstddef>
#include <string>

namespace DiscordRelay {
namespace Logging {

/**
 * Local diagnostics for the delivery path.
 * Everything here goes to the console/log file only, never to the chat endpoint.
 */
class NotifierLogs {
public:
    // Transport outcomes
    static void log_rate_limited(long long retry_after_ms, const std::string& response_body);
    static void log_retry_after_parse_fallback(const std::string& reason, int fallback_ms);
    static void log_delivery_failed(long status_code, const std::string& response_body);
    static void log_transport_exception(const std::string& error_message);

    // Dispatcher
    static void log_dispatcher_exception(const std::string& error_message);
    static void log_worker_start_failed(const std::string& error_message);
    static void log_messages_abandoned(size_t abandoned_count);

    // Flush
    static void log_forced_flush_timeout(int timeout_ms, size_t pending_count);

    // Local echo of an accepted notification
    static void log_notification(const std::string& formatted_message);
};

} // namespace Logging
} // namespace DiscordRelay

#endif // NOTIFIER_LOGS_HPP
