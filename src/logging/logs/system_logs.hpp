#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <cstddef>
#include <string>

namespace DiscordRelay {
namespace Logging {

/**
 * Process lifecycle logging for the relay CLI.
 */
class SystemLogs {
public:
    // Startup and shutdown
    static void log_startup(const std::string& config_path);
    static void log_shutdown_requested(int signal_number);
    static void log_forced_exit(size_t pending_count);
    static void log_shutdown_complete(unsigned long logger_iterations);
    static void log_system_shutdown_error(const std::string& error_message);

    // CLI
    static void log_usage(const std::string& program_name);
    static void log_unknown_severity(const std::string& severity_name);
    static void log_delivery_summary(size_t delivered_count, size_t submitted_count);

    static void log_fatal_error(const std::string& error_message);
};

} // namespace Logging
} // namespace DiscordRelay

#endif // SYSTEM_LOGS_HPP
