#include "delivery_dispatcher.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/notifier_logs.hpp"
#include <system_error>
#include <thread>
#include <vector>

using DiscordRelay::Logging::NotifierLogs;

namespace DiscordRelay {
namespace Core {

DeliveryDispatcher::DeliveryDispatcher(MessageQueue& message_queue, API::MessageTransportInterface& message_transport)
    : queue(message_queue), transport(message_transport) {}

DeliveryDispatcher::~DeliveryDispatcher() {
    stop();
}

// ========================================================================
// CLAIM / RELEASE
// ========================================================================

bool DeliveryDispatcher::try_claim() {
    DispatcherState expected_state = DispatcherState::IDLE;
    return state.compare_exchange_strong(expected_state, DispatcherState::DRAINING);
}

void DeliveryDispatcher::release() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex);
        state.store(DispatcherState::IDLE);
    }
    wait_cv.notify_all();
}

void DeliveryDispatcher::schedule() {
    if (stopping.load()) {
        abandon_queued_messages();
        return;
    }
    // Losers return at once: the message is already queued and the winner will reach it
    if (try_claim()) {
        launch_worker();
    }
}

void DeliveryDispatcher::launch_worker() {
    Logging::LoggingContext* logging_context = Logging::find_logging_context();
    bool worker_admitted = false;
    {
        std::lock_guard<std::mutex> lock(wait_mutex);
        // stop() sets the flag under this lock before waiting for workers, so a worker
        // counted here is always waited for and none is started once stop() has begun
        if (stopping.load()) {
            state.store(DispatcherState::IDLE);
        } else {
            ++active_workers;
            worker_admitted = true;
        }
    }
    if (!worker_admitted) {
        abandon_queued_messages();
        return;
    }

    try {
        std::thread worker([this, logging_context]() {
            if (logging_context) {
                Logging::set_logging_context(*logging_context);
                logging_context->set_thread_tag("RELAY");
            }

            drain_loop();

            if (logging_context) {
                logging_context->clear_thread_tag();
            }
            std::unique_lock<std::mutex> lock(wait_mutex);
            --active_workers;
            // Waiters in stop() may destroy this object; release the lock only once the thread is gone
            std::notify_all_at_thread_exit(wait_cv, std::move(lock));
        });
        worker.detach();
    } catch (const std::system_error& system_error) {
        NotifierLogs::log_worker_start_failed(system_error.what());
        {
            std::lock_guard<std::mutex> lock(wait_mutex);
            --active_workers;
        }
        // Messages stay queued; the next schedule() claims again
        release();
    }
}

// ========================================================================
// DRAINING
// ========================================================================

void DeliveryDispatcher::drain_loop() {
    do {
        while (!stopping.load()) {
            std::unique_ptr<QueuedMessage> queued_message = queue.try_pop();
            if (!queued_message) {
                break;
            }
            bool delivered = deliver_with_retry(queued_message->message.text);
            queued_message->result.set_value(delivered);
        }

        release();

        // A producer may have pushed after the empty check but seen DRAINING and left;
        // re-claim so its message is not stranded.
    } while (!stopping.load() && !queue.empty() && try_claim());
}

bool DeliveryDispatcher::deliver_with_retry(const std::string& text) {
    while (true) {
        API::SendOutcome outcome;
        try {
            outcome = transport.send(text);
        } catch (const std::exception& exception_error) {
            NotifierLogs::log_dispatcher_exception(exception_error.what());
            return false;
        }

        switch (outcome.status) {
            case API::SendStatus::DELIVERED:
                return true;
            case API::SendStatus::FAILED:
                return false;
            case API::SendStatus::RATE_LIMITED:
                // No retry ceiling: the same message is retried until it resolves or we stop
                if (!wait_for_retry(outcome.retry_after_ms)) {
                    return false;
                }
                break;
        }
    }
}

bool DeliveryDispatcher::wait_for_retry(long long delay_ms) {
    std::unique_lock<std::mutex> lock(wait_mutex);
    bool stop_requested = wait_cv.wait_for(lock, std::chrono::milliseconds(delay_ms),
                                           [this]() { return stopping.load(); });
    return !stop_requested;
}

// ========================================================================
// STATE OBSERVATION / SHUTDOWN
// ========================================================================

bool DeliveryDispatcher::is_drained() const {
    return queue.empty() && state.load() == DispatcherState::IDLE;
}

bool DeliveryDispatcher::wait_until_drained(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(wait_mutex);
    return wait_cv.wait_until(lock, deadline, [this]() { return is_drained(); });
}

void DeliveryDispatcher::abandon_queued_messages() {
    std::vector<QueuedMessage> abandoned_messages = queue.drain_all();
    for (QueuedMessage& abandoned_message : abandoned_messages) {
        abandoned_message.result.set_value(false);
    }
    if (!abandoned_messages.empty()) {
        NotifierLogs::log_messages_abandoned(abandoned_messages.size());
    }
    wait_cv.notify_all();
}

void DeliveryDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex);
        stopping.store(true);
    }
    wait_cv.notify_all();

    {
        std::unique_lock<std::mutex> lock(wait_mutex);
        wait_cv.wait(lock, [this]() { return active_workers == 0; });
    }

    abandon_queued_messages();
}

} // namespace Core
} // namespace DiscordRelay
