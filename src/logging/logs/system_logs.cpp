#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"

using namespace DiscordRelay::Logging;

void SystemLogs::log_startup(const std::string& config_path) {
    log_message("SYSTEM_STARTUP: Discord relay starting with configuration " + config_path, "");
}

void SystemLogs::log_shutdown_requested(int signal_number) {
    log_message("SYSTEM_SHUTDOWN: Signal " + std::to_string(signal_number) +
                " received, flushing pending notifications", "");
}

void SystemLogs::log_forced_exit(size_t pending_count) {
    log_message("SYSTEM_SHUTDOWN: Second signal received, exiting with " + std::to_string(pending_count) +
                " message(s) queued", "");
}

void SystemLogs::log_shutdown_complete(unsigned long logger_iterations) {
    log_message("SYSTEM_SHUTDOWN: Relay stopped (logger iterations: " +
                std::to_string(logger_iterations) + ")", "");
}

void SystemLogs::log_system_shutdown_error(const std::string& error_message) {
    log_message("ERROR: System shutdown error: " + error_message, "");
}

void SystemLogs::log_usage(const std::string& program_name) {
    log_message("Usage: " + program_name + " <info|success|warning|error|log> <message>", "");
    log_message("       " + program_name + " (no arguments sends one test message per severity)", "");
}

void SystemLogs::log_unknown_severity(const std::string& severity_name) {
    log_message("ERROR: Unknown severity '" + severity_name + "'", "");
}

void SystemLogs::log_delivery_summary(size_t delivered_count, size_t submitted_count) {
    log_message("DELIVERY: " + std::to_string(delivered_count) + " of " +
                std::to_string(submitted_count) + " message(s) delivered", "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message("FATAL: " + error_message, "");
}
