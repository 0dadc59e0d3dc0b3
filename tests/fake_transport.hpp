#ifndef FAKE_TRANSPORT_HPP
#define FAKE_TRANSPORT_HPP

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "api/general/message_transport_interface.hpp"

namespace test_support {

// Scripted transport: replays queued outcomes (DELIVERED once the script runs out)
// and records every attempt in order.
class FakeTransport : public DiscordRelay::API::MessageTransportInterface {
public:
    struct Step {
        DiscordRelay::API::SendOutcome outcome;
        bool throws = false;
    };

    void script(DiscordRelay::API::SendOutcome outcome) {
        std::lock_guard<std::mutex> lock(mutex);
        steps.push_back(Step{outcome, false});
    }

    void script_exception() {
        std::lock_guard<std::mutex> lock(mutex);
        steps.push_back(Step{DiscordRelay::API::SendOutcome::failed(), true});
    }

    void set_delay(std::chrono::milliseconds per_call_delay) { delay = per_call_delay; }

    // Runs inside send(), while the call still counts as in flight
    void set_on_send(std::function<void(const std::string&)> hook) { on_send = std::move(hook); }

    DiscordRelay::API::SendOutcome send(const std::string& text) override {
        int now_in_flight = ++in_flight;
        int observed = max_in_flight.load();
        while (now_in_flight > observed && !max_in_flight.compare_exchange_weak(observed, now_in_flight)) {
        }

        Step step{DiscordRelay::API::SendOutcome::delivered(), false};
        {
            std::lock_guard<std::mutex> lock(mutex);
            attempts.push_back(Attempt{text, std::chrono::steady_clock::now()});
            if (!steps.empty()) {
                step = steps.front();
                steps.pop_front();
            }
        }

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (on_send) {
            on_send(text);
        }
        --in_flight;

        if (step.throws) {
            throw std::runtime_error("scripted transport failure");
        }
        return step.outcome;
    }

    struct Attempt {
        std::string text;
        std::chrono::steady_clock::time_point at;
    };

    std::vector<Attempt> get_attempts() const {
        std::lock_guard<std::mutex> lock(mutex);
        return attempts;
    }

    std::vector<std::string> get_texts() const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::string> texts;
        for (const Attempt& attempt : attempts) {
            texts.push_back(attempt.text);
        }
        return texts;
    }

    int get_max_in_flight() const { return max_in_flight.load(); }

private:
    mutable std::mutex mutex;
    std::deque<Step> steps;
    std::vector<Attempt> attempts;
    std::chrono::milliseconds delay{0};
    std::function<void(const std::string&)> on_send;
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
};

} // namespace test_support

#endif // FAKE_TRANSPORT_HPP
