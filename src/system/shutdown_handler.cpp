#include "shutdown_handler.hpp"
#include <csignal>
#include <cstdlib>

namespace DiscordRelay {
namespace System {

// =============================================================================
// STATIC HOOKS
// =============================================================================
namespace {
    void static_signal_handler(int signal_number) {
        ShutdownHandler::get_instance().signal_handler(signal_number);
    }

    void static_exit_hook() {
        ShutdownHandler::get_instance().run_exit_flush();
    }
}

ShutdownHandler& ShutdownHandler::get_instance() {
    static ShutdownHandler instance;
    return instance;
}

void ShutdownHandler::set_notifier(DiscordRelay::Core::DiscordNotifier* notifier) {
    notifier_pointer.store(notifier);
}

void ShutdownHandler::clear_shutdown_request() {
    signal_count.store(0);
    received_signal_number.store(0);
}

void ShutdownHandler::signal_handler(int signal_number) {
    if (signal_number == SIGINT || signal_number == SIGTERM) {
        received_signal_number.store(signal_number);
        signal_count.fetch_add(1);
    }
}

bool ShutdownHandler::run_exit_flush() {
    DiscordRelay::Core::DiscordNotifier* notifier = notifier_pointer.load();
    if (!notifier) {
        return true;
    }
    return notifier->forced_flush();
}

void ShutdownHandler::install_signal_handlers() {
    std::signal(SIGINT, static_signal_handler);
    std::signal(SIGTERM, static_signal_handler);
}

void ShutdownHandler::install_exit_hook() {
    std::atexit(static_exit_hook);
}

} // namespace System
} // namespace DiscordRelay
