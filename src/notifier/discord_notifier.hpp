#ifndef DISCORD_NOTIFIER_HPP
#define DISCORD_NOTIFIER_HPP

#include <chrono>
#include <functional>
#include <string>
#include "api/general/message_transport_interface.hpp"
#include "configs/notifier_config.hpp"
#include "notifier/delivery_dispatcher.hpp"
#include "notifier/message_formatter.hpp"
#include "notifier/message_queue.hpp"

namespace DiscordRelay {
namespace Core {

/**
 * Ordered, rate-limit aware delivery of status messages to one Discord channel.
 *
 * One instance per process: create it at startup, pass it by reference to whatever
 * produces messages, and drain it with flush() (shutdown signal) or forced_flush()
 * (exit hook) before it is destroyed. Destruction resolves anything still queued
 * as undelivered.
 *
 * Every producer must have returned from its last submit() before destruction
 * starts; a call that overlaps the destructor touches freed state.
 */
class DiscordNotifier {
public:
    // Posts through the Discord HTTP API. Throws Config::ConfigurationError on a missing token or channel.
    explicit DiscordNotifier(const Config::NotifierConfig& notifier_config);
    DiscordNotifier(const Config::NotifierConfig& notifier_config, API::MessageTransportPtr message_transport);
    ~DiscordNotifier();

    DiscordNotifier(const DiscordNotifier&) = delete;
    DiscordNotifier& operator=(const DiscordNotifier&) = delete;

    DeliveryResult log(const std::string& text, const std::string& origin);
    DeliveryResult log_info(const std::string& text, const std::string& origin);
    DeliveryResult log_success(const std::string& text, const std::string& origin);
    DeliveryResult log_warning(const std::string& text, const std::string& origin);
    DeliveryResult log_error(const std::string& text, const std::string& origin);
    DeliveryResult submit(Severity severity, const std::string& text, const std::string& origin);

    // Cooperative: polls until everything queued has been resolved. Unbounded.
    void flush();
    // Same poll, checking stop_waiting() each interval. Returns false if it gave up first.
    bool flush(const std::function<bool()>& stop_waiting);

    // Bounded wait for exit hooks. Returns false if work was still pending at the ceiling.
    bool forced_flush();
    bool forced_flush(std::chrono::milliseconds ceiling);

    bool is_drained() const { return dispatcher.is_drained(); }
    size_t pending_count() const { return queue.size(); }
    const MessageFormatter& get_formatter() const { return formatter; }

private:
    Config::NotifierConfig config;
    MessageFormatter formatter;
    API::MessageTransportPtr transport;
    MessageQueue queue;
    DeliveryDispatcher dispatcher;

    DeliveryResult enqueue(std::string formatted_message);
};

} // namespace Core
} // namespace DiscordRelay

#endif // DISCORD_NOTIFIER_HPP
