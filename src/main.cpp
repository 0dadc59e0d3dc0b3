// main.cpp
#include "configs/config_loader.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/system_logs.hpp"
#include "notifier/discord_notifier.hpp"
#include "notifier/error_interceptor.hpp"
#include "system/shutdown_handler.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace DiscordRelay;
using DiscordRelay::Logging::SystemLogs;

namespace {

const char* const DEFAULT_ENV_PATH = ".env";
const char* const ENV_PATH_VARIABLE = "DISCORD_RELAY_ENV";
const char* const CLI_ORIGIN = "CLI";

struct CliRequest {
    bool valid = false;
    std::vector<std::pair<Core::Severity, std::string>> messages;
};

std::string resolve_config_path() {
    const char* configured_path = std::getenv(ENV_PATH_VARIABLE);
    if (configured_path && configured_path[0] != '\0') {
        return configured_path;
    }
    return DEFAULT_ENV_PATH;
}

CliRequest parse_arguments(int argc, char* argv[]) {
    CliRequest request;
    const std::string program_name = argc > 0 ? argv[0] : "discord_relay";

    if (argc <= 1) {
        const Core::Severity all_severities[] = {Core::Severity::LOG, Core::Severity::INFO, Core::Severity::SUCCESS,
                                                 Core::Severity::WARNING, Core::Severity::ERROR};
        for (Core::Severity severity : all_severities) {
            request.messages.emplace_back(severity, std::string("Test ") + Core::severity_label(severity) + " message");
        }
        request.valid = true;
        return request;
    }

    Core::Severity severity;
    if (!Core::parse_severity(argv[1], severity)) {
        SystemLogs::log_unknown_severity(argv[1]);
        SystemLogs::log_usage(program_name);
        return request;
    }

    std::string message_text;
    for (int argument_index = 2; argument_index < argc; ++argument_index) {
        if (!message_text.empty()) {
            message_text += " ";
        }
        message_text += argv[argument_index];
    }
    if (message_text.empty()) {
        SystemLogs::log_usage(program_name);
        return request;
    }

    request.messages.emplace_back(severity, message_text);
    request.valid = true;
    return request;
}

// Cooperative flush. A first shutdown signal is only logged; a second one exits at once and
// leaves the still-registered notifier to the bounded flush of the exit hook.
void wait_for_delivery(Core::DiscordNotifier& notifier) {
    System::ShutdownHandler& shutdown_handler = System::ShutdownHandler::get_instance();
    bool shutdown_logged = false;

    bool drained = notifier.flush([&shutdown_handler, &shutdown_logged]() {
        if (shutdown_handler.is_shutdown_requested() && !shutdown_logged) {
            SystemLogs::log_shutdown_requested(shutdown_handler.get_signal_number());
            shutdown_logged = true;
        }
        return shutdown_handler.is_forced_exit_requested();
    });

    if (!drained) {
        SystemLogs::log_forced_exit(notifier.pending_count());
        std::exit(EXIT_FAILURE);
    }
}

int run_relay(const CliRequest& request, const Config::NotifierConfig& config) {
    Core::DiscordNotifier notifier(config);
    System::ExitFlushRegistration exit_flush_registration(notifier);

    size_t delivered_count = 0;
    {
        Core::ErrorInterceptor error_interceptor(notifier);

        std::vector<Core::DeliveryResult> delivery_results;
        for (const auto& queued_request : request.messages) {
            delivery_results.push_back(notifier.submit(queued_request.first, queued_request.second, CLI_ORIGIN));
        }

        wait_for_delivery(notifier);

        for (Core::DeliveryResult& delivery_result : delivery_results) {
            if (delivery_result.get()) {
                ++delivered_count;
            }
        }
    }

    SystemLogs::log_delivery_summary(delivered_count, request.messages.size());
    return delivered_count == request.messages.size() ? 0 : 1;
}

} // namespace

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    try {
        System::ShutdownHandler& shutdown_handler = System::ShutdownHandler::get_instance();
        shutdown_handler.clear_shutdown_request();
        shutdown_handler.install_signal_handlers();
        shutdown_handler.install_exit_hook();

        const std::string config_path = resolve_config_path();
        Config::NotifierConfig config = Config::load_notifier_config(config_path);

        Logging::LoggingContext logging_context;
        Logging::set_logging_context(logging_context);
        std::shared_ptr<Logging::AsyncLogger> logger = Logging::initialize_application_foundation(config);

        std::atomic<unsigned long> logger_iterations{0};
        Threads::LoggingThread logging_thread_functor(logger, logging_context, logger_iterations);
        std::thread logging_thread(std::ref(logging_thread_functor));

        SystemLogs::log_startup(config_path);

        int exit_code = 1;
        try {
            CliRequest request = parse_arguments(argc, argv);
            if (request.valid) {
                exit_code = run_relay(request, config);
            }
        } catch (const std::exception& exception_error) {
            SystemLogs::log_fatal_error(exception_error.what());
            exit_code = 1;
        }

        SystemLogs::log_shutdown_complete(logger_iterations.load());
        Logging::shutdown_global_logger(*logger);
        if (logging_thread.joinable()) {
            logging_thread.join();
        }
        Logging::clear_logging_context();

        return exit_code;
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        return 1;
    }
}
