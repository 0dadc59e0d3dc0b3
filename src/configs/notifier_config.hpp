#ifndef NOTIFIER_CONFIG_HPP
#define NOTIFIER_CONFIG_HPP

#include <string>

namespace DiscordRelay {
namespace Config {

struct NotifierConfig {
    // Authentication and routing
    std::string bot_token;
    std::string channel_id;
    std::string admin_user_id;          // Mentioned on ERROR lines when set

    // Endpoint
    std::string api_base_url = "https://discord.com";
    std::string api_version = "v10";

    // HTTP Configuration
    int timeout_seconds = 10;
    bool enable_ssl_verification = true;
    int default_retry_after_ms = 1000;  // Used when a 429 body carries no usable retry_after

    // Shutdown flush
    int flush_poll_interval_ms = 100;
    int forced_flush_timeout_ms = 5000;

    // Local diagnostics; empty means console only
    std::string log_file;
};

} // namespace Config
} // namespace DiscordRelay

#endif // NOTIFIER_CONFIG_HPP
