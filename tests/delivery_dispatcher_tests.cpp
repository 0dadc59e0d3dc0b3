#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "api/discord/discord_transport.hpp"
#include "configs/notifier_config.hpp"
#include "fake_transport.hpp"
#include "notifier/delivery_dispatcher.hpp"
#include "notifier/message_queue.hpp"

using DiscordRelay::API::SendOutcome;
using DiscordRelay::Core::DeliveryDispatcher;
using DiscordRelay::Core::DeliveryResult;
using DiscordRelay::Core::DispatcherState;
using DiscordRelay::Core::MessageQueue;
using test_support::FakeTransport;

namespace {

class DeliveryDispatcherTests : public ::testing::Test {
protected:
    MessageQueue queue;
    FakeTransport transport;
    DeliveryDispatcher dispatcher{queue, transport};

    DeliveryResult submit(const std::string& text) {
        DeliveryResult result = queue.push(text);
        dispatcher.schedule();
        return result;
    }

    bool wait_for_attempts(size_t count, std::chrono::milliseconds limit = std::chrono::milliseconds(2000)) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (transport.get_attempts().size() >= count) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return false;
    }
};

TEST_F(DeliveryDispatcherTests, DeliversSingleMessage) {
    DeliveryResult result = submit("hello");
    EXPECT_TRUE(result.get());
    EXPECT_EQ(transport.get_texts(), (std::vector<std::string>{"hello"}));
}

TEST_F(DeliveryDispatcherTests, RetriesRateLimitedMessageBeforeLaterOnes) {
    transport.script(SendOutcome::rate_limited(50));
    transport.set_delay(std::chrono::milliseconds(5));

    DeliveryResult first = submit("A");
    DeliveryResult second = submit("B");

    EXPECT_TRUE(first.get());
    EXPECT_TRUE(second.get());

    std::vector<FakeTransport::Attempt> attempts = transport.get_attempts();
    ASSERT_EQ(attempts.size(), 3u);
    EXPECT_EQ(attempts[0].text, "A");
    EXPECT_EQ(attempts[1].text, "A");
    EXPECT_EQ(attempts[2].text, "B");
    EXPECT_GE(attempts[1].at - attempts[0].at, std::chrono::milliseconds(50));
}

TEST_F(DeliveryDispatcherTests, RepeatedRateLimitsHoldBackLaterMessages) {
    transport.script(SendOutcome::rate_limited(30));
    transport.script(SendOutcome::rate_limited(40));
    transport.script(SendOutcome::rate_limited(50));

    auto submitted = std::chrono::steady_clock::now();
    DeliveryResult first = submit("A");
    DeliveryResult second = submit("B");

    EXPECT_TRUE(first.get());
    auto first_resolved = std::chrono::steady_clock::now();
    EXPECT_TRUE(second.get());

    EXPECT_GE(first_resolved - submitted, std::chrono::milliseconds(120));
    EXPECT_EQ(transport.get_texts(), (std::vector<std::string>{"A", "A", "A", "A", "B"}));

    std::vector<FakeTransport::Attempt> attempts = transport.get_attempts();
    ASSERT_EQ(attempts.size(), 5u);
    EXPECT_GE(attempts[1].at - attempts[0].at, std::chrono::milliseconds(30));
    EXPECT_GE(attempts[2].at - attempts[1].at, std::chrono::milliseconds(40));
    EXPECT_GE(attempts[3].at - attempts[2].at, std::chrono::milliseconds(50));
}

TEST_F(DeliveryDispatcherTests, MessagePushedDuringLastSendIsStillDelivered) {
    DeliveryResult late;
    std::atomic<bool> pushed{false};
    transport.set_on_send([this, &late, &pushed](const std::string& text) {
        if (text == "last" && !pushed.exchange(true)) {
            late = submit("late");
        }
    });

    DeliveryResult last = submit("last");

    EXPECT_TRUE(last.get());
    ASSERT_TRUE(pushed.load());
    ASSERT_EQ(late.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(late.get());
    EXPECT_EQ(transport.get_texts(), (std::vector<std::string>{"last", "late"}));
    EXPECT_EQ(transport.get_max_in_flight(), 1);
    EXPECT_TRUE(dispatcher.wait_until_drained(std::chrono::steady_clock::now() + std::chrono::seconds(5)));
}

TEST_F(DeliveryDispatcherTests, BurstsAfterEachDrainAreAllDelivered) {
    for (int round = 0; round < 50; ++round) {
        DeliveryResult result = submit("r" + std::to_string(round));
        EXPECT_TRUE(result.get());
    }
    EXPECT_EQ(transport.get_attempts().size(), 50u);
    EXPECT_EQ(transport.get_max_in_flight(), 1);
}

TEST(DeliveryDispatcherRetryAfterTests, UnrepresentableRetryAfterWaitsDefaultDelay) {
    DiscordRelay::Config::NotifierConfig config;
    config.bot_token = "token";
    config.channel_id = "42";
    config.default_retry_after_ms = 100;

    std::atomic<int> post_calls{0};
    DiscordRelay::API::DiscordTransport discord_transport(config, [&post_calls](const HttpRequest&) {
        HttpResponse response;
        if (post_calls.fetch_add(1) == 0) {
            response.status_code = 429;
            response.body = R"({"retry_after": 1e19})";
        } else {
            response.status_code = 200;
        }
        return response;
    });

    MessageQueue queue;
    DeliveryDispatcher dispatcher(queue, discord_transport);
    auto submitted = std::chrono::steady_clock::now();
    DeliveryResult result = queue.push("hello");
    dispatcher.schedule();

    EXPECT_TRUE(result.get());
    EXPECT_GE(std::chrono::steady_clock::now() - submitted, std::chrono::milliseconds(100));
    EXPECT_EQ(post_calls.load(), 2);
}

TEST_F(DeliveryDispatcherTests, FailedMessageIsNotRetriedAndDrainContinues) {
    transport.script(SendOutcome::failed());

    DeliveryResult first = submit("A");
    DeliveryResult second = submit("B");

    EXPECT_FALSE(first.get());
    EXPECT_TRUE(second.get());
    EXPECT_EQ(transport.get_texts(), (std::vector<std::string>{"A", "B"}));
}

TEST_F(DeliveryDispatcherTests, TransportExceptionCountsAsFailure) {
    transport.script_exception();

    DeliveryResult first = submit("A");
    DeliveryResult second = submit("B");

    EXPECT_FALSE(first.get());
    EXPECT_TRUE(second.get());
}

TEST_F(DeliveryDispatcherTests, ConcurrentProducersKeepPerProducerOrderAndSingleSender) {
    constexpr int kProducers = 8;
    constexpr int kPerProducer = 40;
    transport.set_delay(std::chrono::milliseconds(1));

    std::vector<std::vector<DeliveryResult>> results(kProducers);
    std::vector<std::thread> producers;
    for (int producer = 0; producer < kProducers; ++producer) {
        producers.emplace_back([this, producer, &results]() {
            for (int index = 0; index < kPerProducer; ++index) {
                results[producer].push_back(submit(std::to_string(producer) + ":" + std::to_string(index)));
            }
        });
    }
    for (std::thread& producer : producers) {
        producer.join();
    }
    for (std::vector<DeliveryResult>& producer_results : results) {
        for (DeliveryResult& result : producer_results) {
            EXPECT_TRUE(result.get());
        }
    }

    std::vector<std::string> texts = transport.get_texts();
    ASSERT_EQ(texts.size(), static_cast<size_t>(kProducers * kPerProducer));
    EXPECT_EQ(transport.get_max_in_flight(), 1);

    std::vector<int> next_expected(kProducers, 0);
    for (const std::string& text : texts) {
        size_t separator = text.find(':');
        int producer = std::stoi(text.substr(0, separator));
        int index = std::stoi(text.substr(separator + 1));
        EXPECT_EQ(index, next_expected[producer]) << text;
        next_expected[producer] = index + 1;
    }
}

TEST_F(DeliveryDispatcherTests, DrainedOnlyAfterLastMessageResolves) {
    transport.set_delay(std::chrono::milliseconds(20));
    DeliveryResult first = submit("A");
    DeliveryResult second = submit("B");

    EXPECT_FALSE(dispatcher.is_drained());
    EXPECT_TRUE(dispatcher.wait_until_drained(std::chrono::steady_clock::now() + std::chrono::seconds(5)));

    EXPECT_EQ(first.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_EQ(second.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(dispatcher.get_state(), DispatcherState::IDLE);
}

TEST_F(DeliveryDispatcherTests, WaitUntilDrainedTimesOutWhileSendIsSlow) {
    transport.set_delay(std::chrono::milliseconds(300));
    DeliveryResult result = submit("slow");

    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(dispatcher.wait_until_drained(started + std::chrono::milliseconds(30)));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(250));

    EXPECT_TRUE(result.get());
}

TEST_F(DeliveryDispatcherTests, WaitUntilDrainedOnIdleDispatcherReturnsImmediately) {
    EXPECT_TRUE(dispatcher.is_drained());
    EXPECT_TRUE(dispatcher.wait_until_drained(std::chrono::steady_clock::now()));
}

TEST_F(DeliveryDispatcherTests, StopInterruptsRateLimitWaitAndAbandonsQueue) {
    transport.script(SendOutcome::rate_limited(60000));

    DeliveryResult first = submit("A");
    DeliveryResult second = submit("B");
    ASSERT_TRUE(wait_for_attempts(1));

    auto started = std::chrono::steady_clock::now();
    dispatcher.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));

    EXPECT_FALSE(first.get());
    EXPECT_FALSE(second.get());
    EXPECT_TRUE(dispatcher.is_stopped());
    EXPECT_EQ(transport.get_attempts().size(), 1u);
}

TEST_F(DeliveryDispatcherTests, StopRacingProducersResolvesEveryMessage) {
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 100;
    std::vector<std::vector<DeliveryResult>> results(kProducers);
    std::atomic<bool> go{false};

    std::vector<std::thread> producers;
    for (int producer = 0; producer < kProducers; ++producer) {
        producers.emplace_back([this, producer, &results, &go]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int index = 0; index < kPerProducer; ++index) {
                results[producer].push_back(submit("m"));
            }
        });
    }
    go.store(true);
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    dispatcher.stop();
    for (std::thread& producer : producers) {
        producer.join();
    }

    for (std::vector<DeliveryResult>& producer_results : results) {
        for (DeliveryResult& result : producer_results) {
            ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        }
    }
    EXPECT_TRUE(queue.empty());
}

TEST_F(DeliveryDispatcherTests, ScheduleAfterStopResolvesUndelivered) {
    dispatcher.stop();
    DeliveryResult result = submit("late");

    ASSERT_EQ(result.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    EXPECT_FALSE(result.get());
    EXPECT_TRUE(transport.get_attempts().empty());
}

} // namespace
