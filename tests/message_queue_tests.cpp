#include <chrono>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "notifier/message_queue.hpp"

using DiscordRelay::Core::DeliveryResult;
using DiscordRelay::Core::MessageQueue;
using DiscordRelay::Core::QueuedMessage;

namespace {

TEST(MessageQueueTests, PopsInSubmissionOrder) {
    MessageQueue queue;
    queue.push("first");
    queue.push("second");
    queue.push("third");
    EXPECT_EQ(queue.size(), 3u);

    std::vector<std::string> popped;
    while (std::unique_ptr<QueuedMessage> entry = queue.try_pop()) {
        popped.push_back(entry->message.text);
        entry->result.set_value(true);
    }
    EXPECT_EQ(popped, (std::vector<std::string>{"first", "second", "third"}));
    EXPECT_TRUE(queue.empty());
}

TEST(MessageQueueTests, TryPopOnEmptyQueueReturnsNull) {
    MessageQueue queue;
    EXPECT_TRUE(queue.try_pop() == nullptr);
}

TEST(MessageQueueTests, PoppedEntryResolvesProducerFuture) {
    MessageQueue queue;
    DeliveryResult result = queue.push("hello");
    std::unique_ptr<QueuedMessage> entry = queue.try_pop();
    ASSERT_TRUE(entry != nullptr);
    entry->result.set_value(false);

    ASSERT_EQ(result.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_FALSE(result.get());
}

TEST(MessageQueueTests, DrainAllEmptiesQueueOldestFirst) {
    MessageQueue queue;
    DeliveryResult first = queue.push("a");
    DeliveryResult second = queue.push("b");

    std::vector<QueuedMessage> drained = queue.drain_all();
    ASSERT_EQ(drained.size(), 2u);
    EXPECT_EQ(drained[0].message.text, "a");
    EXPECT_EQ(drained[1].message.text, "b");
    EXPECT_TRUE(queue.empty());
    EXPECT_LE(drained[0].message.submitted_at, drained[1].message.submitted_at);

    for (QueuedMessage& entry : drained) {
        entry.result.set_value(true);
    }
    EXPECT_TRUE(first.get());
    EXPECT_TRUE(second.get());
}

} // namespace
