#ifndef MESSAGE_QUEUE_HPP
#define MESSAGE_QUEUE_HPP

#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace DiscordRelay {
namespace Core {

struct Message {
    const std::string text;
    const std::chrono::system_clock::time_point submitted_at;

    Message(std::string message_text, std::chrono::system_clock::time_point submitted)
        : text(std::move(message_text)), submitted_at(submitted) {}
};

// Resolved exactly once with the delivered/failed outcome of one message.
using DeliveryResult = std::future<bool>;

struct QueuedMessage {
    Message message;
    std::promise<bool> result;

    explicit QueuedMessage(Message queued_message) : message(std::move(queued_message)) {}
    QueuedMessage(QueuedMessage&&) = default;
    QueuedMessage& operator=(QueuedMessage&&) = delete;
};

/**
 * Unbounded FIFO of pending messages. Entries leave only from the front, and
 * every entry handed out by try_pop/drain_all must be resolved by the taker.
 */
class MessageQueue {
public:
    MessageQueue() = default;
    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    DeliveryResult push(std::string text);

    // Removes the front entry. Returns nullptr when the queue was observed empty.
    std::unique_ptr<QueuedMessage> try_pop();

    // Removes every entry, oldest first.
    std::vector<QueuedMessage> drain_all();

    bool empty() const;
    size_t size() const;

private:
    mutable std::mutex queue_mutex;
    std::deque<QueuedMessage> entries;
};

} // namespace Core
} // namespace DiscordRelay

#endif // MESSAGE_QUEUE_HPP
