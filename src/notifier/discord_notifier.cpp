#include "discord_notifier.hpp"
#include "api/discord/discord_transport.hpp"
#include "configs/config_loader.hpp"
#include "logging/logs/notifier_logs.hpp"
#include <stdexcept>
#include <thread>

using DiscordRelay::Logging::NotifierLogs;

namespace DiscordRelay {
namespace Core {

namespace {
    const Config::NotifierConfig& require_valid(const Config::NotifierConfig& notifier_config) {
        std::string configuration_error_message;
        if (!Config::validate_config(notifier_config, configuration_error_message)) {
            throw Config::ConfigurationError(configuration_error_message);
        }
        return notifier_config;
    }

    API::MessageTransportPtr require_transport(API::MessageTransportPtr message_transport) {
        if (!message_transport) {
            throw std::invalid_argument("DiscordNotifier requires a message transport");
        }
        return message_transport;
    }
}

DiscordNotifier::DiscordNotifier(const Config::NotifierConfig& notifier_config)
    : DiscordNotifier(notifier_config, std::make_unique<API::DiscordTransport>(require_valid(notifier_config))) {}

DiscordNotifier::DiscordNotifier(const Config::NotifierConfig& notifier_config, API::MessageTransportPtr message_transport)
    : config(require_valid(notifier_config)),
      formatter(notifier_config.admin_user_id),
      transport(require_transport(std::move(message_transport))),
      dispatcher(queue, *transport) {}

DiscordNotifier::~DiscordNotifier() {
    dispatcher.stop();
}

DeliveryResult DiscordNotifier::log(const std::string& text, const std::string& origin) {
    return submit(Severity::LOG, text, origin);
}

DeliveryResult DiscordNotifier::log_info(const std::string& text, const std::string& origin) {
    return submit(Severity::INFO, text, origin);
}

DeliveryResult DiscordNotifier::log_success(const std::string& text, const std::string& origin) {
    return submit(Severity::SUCCESS, text, origin);
}

DeliveryResult DiscordNotifier::log_warning(const std::string& text, const std::string& origin) {
    return submit(Severity::WARNING, text, origin);
}

DeliveryResult DiscordNotifier::log_error(const std::string& text, const std::string& origin) {
    return submit(Severity::ERROR, text, origin);
}

DeliveryResult DiscordNotifier::submit(Severity severity, const std::string& text, const std::string& origin) {
    std::string formatted_message = formatter.format(severity, text, origin);
    NotifierLogs::log_notification(formatted_message);
    return enqueue(std::move(formatted_message));
}

DeliveryResult DiscordNotifier::enqueue(std::string formatted_message) {
    DeliveryResult delivery_result = queue.push(std::move(formatted_message));
    dispatcher.schedule();
    return delivery_result;
}

void DiscordNotifier::flush() {
    flush([]() { return false; });
}

bool DiscordNotifier::flush(const std::function<bool()>& stop_waiting) {
    const std::chrono::milliseconds poll_interval(config.flush_poll_interval_ms);
    while (!dispatcher.is_drained()) {
        if (stop_waiting()) {
            return false;
        }
        std::this_thread::sleep_for(poll_interval);
    }
    return true;
}

bool DiscordNotifier::forced_flush() {
    return forced_flush(std::chrono::milliseconds(config.forced_flush_timeout_ms));
}

bool DiscordNotifier::forced_flush(std::chrono::milliseconds ceiling) {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + ceiling;
    bool drained = dispatcher.wait_until_drained(deadline);
    if (!drained) {
        NotifierLogs::log_forced_flush_timeout(static_cast<int>(ceiling.count()), queue.size());
    }
    return drained;
}

} // namespace Core
} // namespace DiscordRelay
