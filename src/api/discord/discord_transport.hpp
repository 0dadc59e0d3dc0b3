#ifndef DISCORD_TRANSPORT_HPP
#define DISCORD_TRANSPORT_HPP

#include <functional>
#include <string>
#include "api/general/message_transport_interface.hpp"
#include "configs/notifier_config.hpp"
#include "utils/http_utils.hpp"

namespace DiscordRelay {
namespace API {

using HttpPostFunction = std::function<HttpResponse(const HttpRequest&)>;

// Maps an HTTP response to a send outcome. 429 bodies are read for a
// fractional "retry_after" in seconds, rounded up to whole milliseconds.
SendOutcome classify_response(const HttpResponse& response, int default_retry_after_ms);

// JSON payload {"content": text}
std::string build_message_payload(const std::string& text);

class DiscordTransport : public MessageTransportInterface {
public:
    explicit DiscordTransport(const Config::NotifierConfig& config, HttpPostFunction post_function = http_post);

    SendOutcome send(const std::string& text) override;

    const std::string& get_messages_url() const { return messages_url; }

private:
    std::string messages_url;
    std::string bot_token;
    int timeout_seconds;
    bool enable_ssl_verification;
    int default_retry_after_ms;
    HttpPostFunction post;
};

} // namespace API
} // namespace DiscordRelay

#endif // DISCORD_TRANSPORT_HPP
