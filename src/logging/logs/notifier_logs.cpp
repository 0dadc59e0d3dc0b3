#include "notifier_logs.hpp"
#include "logging/logger/async_logger.hpp"

using namespace DiscordRelay::Logging;

void NotifierLogs::log_rate_limited(long long retry_after_ms, const std::string& response_body) {
    log_message("WARNING: Discord rate limited the request (HTTP 429), retrying in " +
                std::to_string(retry_after_ms) + "ms. Response: " + response_body, "");
}

void NotifierLogs::log_retry_after_parse_fallback(const std::string& reason, int fallback_ms) {
    log_message("WARNING: Could not read retry_after (" + reason + "), using " +
                std::to_string(fallback_ms) + "ms", "");
}

void NotifierLogs::log_delivery_failed(long status_code, const std::string& response_body) {
    log_message("ERROR: Failed to send message to Discord. Status code: " + std::to_string(status_code) +
                " Response: " + response_body, "");
}

void NotifierLogs::log_transport_exception(const std::string& error_message) {
    log_message("ERROR: Error sending message to Discord: " + error_message, "");
}

void NotifierLogs::log_dispatcher_exception(const std::string& error_message) {
    log_message("ERROR: Delivery dispatcher exception: " + error_message, "");
}

void NotifierLogs::log_worker_start_failed(const std::string& error_message) {
    log_message("ERROR: Failed to start delivery worker: " + error_message, "");
}

void NotifierLogs::log_messages_abandoned(size_t abandoned_count) {
    log_message("WARNING: Notifier stopped with " + std::to_string(abandoned_count) +
                " undelivered message(s)", "");
}

void NotifierLogs::log_forced_flush_timeout(int timeout_ms, size_t pending_count) {
    log_message("WARNING: Forced flush gave up after " + std::to_string(timeout_ms) + "ms with " +
                std::to_string(pending_count) + " message(s) still queued", "");
}

void NotifierLogs::log_notification(const std::string& formatted_message) {
    log_message(formatted_message, "");
}
