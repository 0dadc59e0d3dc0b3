#include "discord_transport.hpp"
#include "configs/config_loader.hpp"
#include "logging/logs/notifier_logs.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <stdexcept>

using json = nlohmann::json;
using DiscordRelay::Logging::NotifierLogs;

namespace DiscordRelay {
namespace API {

namespace {
    constexpr long HTTP_OK = 200;
    constexpr long HTTP_CREATED = 201;
    constexpr long HTTP_TOO_MANY_REQUESTS = 429;

    // Longest wait honoured from a 429 body; keeps steady_clock deadline arithmetic in range
    constexpr double MAX_RETRY_AFTER_SECONDS = 7.0 * 24.0 * 60.0 * 60.0;

    long long parse_retry_after_ms(const std::string& response_body, int default_retry_after_ms) {
        try {
            json response_json = json::parse(response_body);

            if (!response_json.is_object() || !response_json.contains("retry_after")) {
                NotifierLogs::log_retry_after_parse_fallback("field missing", default_retry_after_ms);
                return default_retry_after_ms;
            }

            const json& retry_after_field = response_json["retry_after"];
            if (!retry_after_field.is_number()) {
                NotifierLogs::log_retry_after_parse_fallback("not a number", default_retry_after_ms);
                return default_retry_after_ms;
            }

            double retry_after_seconds = retry_after_field.get<double>();
            if (!std::isfinite(retry_after_seconds) || retry_after_seconds < 0.0 ||
                retry_after_seconds > MAX_RETRY_AFTER_SECONDS) {
                NotifierLogs::log_retry_after_parse_fallback("out of range", default_retry_after_ms);
                return default_retry_after_ms;
            }
            return TimeUtils::seconds_to_milliseconds_ceil(retry_after_seconds);
        } catch (const json::exception& json_exception_error) {
            NotifierLogs::log_retry_after_parse_fallback(json_exception_error.what(), default_retry_after_ms);
            return default_retry_after_ms;
        }
    }
}

SendOutcome classify_response(const HttpResponse& response, int default_retry_after_ms) {
    if (response.status_code == HTTP_OK || response.status_code == HTTP_CREATED) {
        return SendOutcome::delivered();
    }

    if (response.status_code == HTTP_TOO_MANY_REQUESTS) {
        long long retry_after_ms = parse_retry_after_ms(response.body, default_retry_after_ms);
        NotifierLogs::log_rate_limited(retry_after_ms, response.body);
        return SendOutcome::rate_limited(retry_after_ms);
    }

    NotifierLogs::log_delivery_failed(response.status_code, response.body);
    return SendOutcome::failed();
}

std::string build_message_payload(const std::string& text) {
    json payload;
    payload["content"] = text;
    // Invalid UTF-8 from arbitrary producers is replaced rather than rejected
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

DiscordTransport::DiscordTransport(const Config::NotifierConfig& config, HttpPostFunction post_function)
    : messages_url(Config::build_messages_url(config)),
      bot_token(config.bot_token),
      timeout_seconds(config.timeout_seconds),
      enable_ssl_verification(config.enable_ssl_verification),
      default_retry_after_ms(config.default_retry_after_ms),
      post(std::move(post_function)) {
    if (bot_token.empty()) {
        throw Config::ConfigurationError("Discord bot token is required but not provided");
    }
    if (config.channel_id.empty()) {
        throw Config::ConfigurationError("Discord channel id is required but not provided");
    }
    if (!post) {
        throw std::invalid_argument("DiscordTransport requires an HTTP post function");
    }
}

SendOutcome DiscordTransport::send(const std::string& text) {
    try {
        HttpRequest request(messages_url,
                            {"Authorization: Bot " + bot_token, "Content-Type: application/json"},
                            build_message_payload(text),
                            timeout_seconds,
                            enable_ssl_verification);

        HttpResponse response = post(request);
        return classify_response(response, default_retry_after_ms);
    } catch (const std::exception& exception_error) {
        NotifierLogs::log_transport_exception(exception_error.what());
        return SendOutcome::failed();
    }
}

} // namespace API
} // namespace DiscordRelay
