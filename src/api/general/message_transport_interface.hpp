#ifndef MESSAGE_TRANSPORT_INTERFACE_HPP
#define MESSAGE_TRANSPORT_INTERFACE_HPP

#include <memory>
#include <string>

namespace DiscordRelay {
namespace API {

enum class SendStatus {
    DELIVERED,
    RATE_LIMITED,
    FAILED
};

struct SendOutcome {
    SendStatus status = SendStatus::FAILED;
    long long retry_after_ms = 0;   // Only meaningful for RATE_LIMITED

    static SendOutcome delivered() { return SendOutcome{SendStatus::DELIVERED, 0}; }
    static SendOutcome rate_limited(long long delay_ms) { return SendOutcome{SendStatus::RATE_LIMITED, delay_ms}; }
    static SendOutcome failed() { return SendOutcome{SendStatus::FAILED, 0}; }
};

// One synchronous attempt to post a message. Implementations classify the
// outcome instead of throwing.
class MessageTransportInterface {
public:
    virtual ~MessageTransportInterface() = default;

    virtual SendOutcome send(const std::string& text) = 0;
};

using MessageTransportPtr = std::unique_ptr<MessageTransportInterface>;

} // namespace API
} // namespace DiscordRelay

#endif // MESSAGE_TRANSPORT_INTERFACE_HPP
