#include "message_queue.hpp"

namespace DiscordRelay {
namespace Core {

DeliveryResult MessageQueue::push(std::string text) {
    QueuedMessage queued_message(Message(std::move(text), std::chrono::system_clock::now()));
    DeliveryResult delivery_result = queued_message.result.get_future();

    std::lock_guard<std::mutex> lock(queue_mutex);
    entries.push_back(std::move(queued_message));
    return delivery_result;
}

std::unique_ptr<QueuedMessage> MessageQueue::try_pop() {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if (entries.empty()) {
        return nullptr;
    }
    std::unique_ptr<QueuedMessage> front_entry = std::make_unique<QueuedMessage>(std::move(entries.front()));
    entries.pop_front();
    return front_entry;
}

std::vector<QueuedMessage> MessageQueue::drain_all() {
    std::vector<QueuedMessage> drained_entries;
    std::lock_guard<std::mutex> lock(queue_mutex);
    drained_entries.reserve(entries.size());
    while (!entries.empty()) {
        drained_entries.push_back(std::move(entries.front()));
        entries.pop_front();
    }
    return drained_entries;
}

bool MessageQueue::empty() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return entries.empty();
}

size_t MessageQueue::size() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return entries.size();
}

} // namespace Core
} // namespace DiscordRelay
