#ifndef SHUTDOWN_HANDLER_HPP
#define SHUTDOWN_HANDLER_HPP

#include <atomic>
#include "notifier/discord_notifier.hpp"

namespace DiscordRelay {
namespace System {

// =============================================================================
// ENCAPSULATED SHUTDOWN HANDLER - NO GLOBAL VARIABLES
// =============================================================================
class ShutdownHandler {
public:
    static ShutdownHandler& get_instance();

    // Notifier drained by the exit hook. Clear it before the notifier is destroyed.
    void set_notifier(DiscordRelay::Core::DiscordNotifier* notifier);

    // First SIGINT/SIGTERM asks for a cooperative flush, a second one for an immediate exit
    bool is_shutdown_requested() const { return signal_count.load() > 0; }
    bool is_forced_exit_requested() const { return signal_count.load() > 1; }
    int get_signal_number() const { return received_signal_number.load(); }
    void clear_shutdown_request();

    // Only touches lock-free atomics so it is safe to call from a signal handler
    void signal_handler(int signal_number);

    // Bounded drain of whatever is still queued. Returns true when nothing was pending.
    // Runs from the exit hook, so it only finds a notifier when std::exit() is called
    // while one is registered (the forced exit after a second signal).
    bool run_exit_flush();

    void install_signal_handlers();
    void install_exit_hook();

private:
    std::atomic<int> signal_count{0};
    std::atomic<int> received_signal_number{0};
    std::atomic<DiscordRelay::Core::DiscordNotifier*> notifier_pointer{nullptr};

    ShutdownHandler() = default;
    ShutdownHandler(const ShutdownHandler&) = delete;
    ShutdownHandler& operator=(const ShutdownHandler&) = delete;
};

// Exposes a notifier to the exit hook for exactly its lifetime
class ExitFlushRegistration {
public:
    explicit ExitFlushRegistration(DiscordRelay::Core::DiscordNotifier& notifier) {
        ShutdownHandler::get_instance().set_notifier(&notifier);
    }
    ~ExitFlushRegistration() {
        ShutdownHandler::get_instance().set_notifier(nullptr);
    }

    ExitFlushRegistration(const ExitFlushRegistration&) = delete;
    ExitFlushRegistration& operator=(const ExitFlushRegistration&) = delete;
};

} // namespace System
} // namespace DiscordRelay

#endif // SHUTDOWN_HANDLER_HPP
