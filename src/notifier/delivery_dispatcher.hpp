#ifndef DELIVERY_DISPATCHER_HPP
#define DELIVERY_DISPATCHER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include "api/general/message_transport_interface.hpp"
#include "notifier/message_queue.hpp"

namespace DiscordRelay {
namespace Core {

enum class DispatcherState {
    IDLE,
    DRAINING
};

/**
 * Single logical consumer of a MessageQueue.
 *
 * Whoever wins the IDLE -> DRAINING compare-and-set starts a drain worker; the
 * worker owns the right to call the transport until it observes the queue empty,
 * returns the state to IDLE and fails to re-claim it. A rate-limited message is
 * retried after the requested delay before anything behind it is attempted.
 */
class DeliveryDispatcher {
public:
    DeliveryDispatcher(MessageQueue& message_queue, API::MessageTransportInterface& message_transport);
    ~DeliveryDispatcher();

    DeliveryDispatcher(const DeliveryDispatcher&) = delete;
    DeliveryDispatcher& operator=(const DeliveryDispatcher&) = delete;

    // Called after every push. Returns immediately.
    void schedule();

    // Queue empty and no drain in progress
    bool is_drained() const;
    DispatcherState get_state() const { return state.load(); }

    // Blocks until drained or the deadline passes. Never starts work.
    bool wait_until_drained(std::chrono::steady_clock::time_point deadline);

    // Stops draining, wakes a pending rate-limit wait, waits for the worker to exit
    // and resolves every message still queued as undelivered. A schedule() racing
    // stop() never starts a worker; its message is resolved as undelivered.
    void stop();
    bool is_stopped() const { return stopping.load(); }

private:
    MessageQueue& queue;
    API::MessageTransportInterface& transport;

    std::atomic<DispatcherState> state{DispatcherState::IDLE};
    std::atomic<bool> stopping{false};

    // Guards worker bookkeeping and the IDLE transition seen by drained waiters
    std::mutex wait_mutex;
    std::condition_variable wait_cv;
    size_t active_workers = 0;

    bool try_claim();
    void release();
    void launch_worker();
    void drain_loop();
    bool deliver_with_retry(const std::string& text);
    bool wait_for_retry(long long delay_ms);
    void abandon_queued_messages();
};

} // namespace Core
} // namespace DiscordRelay

#endif // DELIVERY_DISPATCHER_HPP
