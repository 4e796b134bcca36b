#include <gtest/gtest.h>

#include "corvus/tasks/progress_channel.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace corvus::tasks;

TEST(ProgressChannel, DeliversEventsInSendOrder)
{
    ProgressChannel channel;
    ASSERT_TRUE(channel.send({1, ProgressEvent::update(0.25f)}));
    ASSERT_TRUE(channel.send({2, ProgressEvent::error("boom")}));
    ASSERT_TRUE(channel.send({1, ProgressEvent::completed()}));
    EXPECT_EQ(channel.size(), 3u);

    auto first = channel.receive();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->taskId, 1u);
    EXPECT_EQ(first->event.type, ProgressEvent::Type::Update);
    EXPECT_FLOAT_EQ(first->event.progress, 0.25f);

    auto second = channel.receive();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->taskId, 2u);
    EXPECT_EQ(second->event.type, ProgressEvent::Type::Error);
    EXPECT_EQ(second->event.message, "boom");

    auto third = channel.tryReceive();
    ASSERT_TRUE(third);
    EXPECT_EQ(third->event.type, ProgressEvent::Type::Completed);
    EXPECT_FALSE(channel.tryReceive());
}

TEST(ProgressChannel, DrainsQueuedEventsAfterClose)
{
    ProgressChannel channel;
    channel.send({7, ProgressEvent::completed()});
    channel.close();

    EXPECT_TRUE(channel.closed());
    EXPECT_FALSE(channel.send({8, ProgressEvent::completed()}));

    auto queued = channel.receive();
    ASSERT_TRUE(queued);
    EXPECT_EQ(queued->taskId, 7u);
    EXPECT_FALSE(channel.receive());
}

TEST(ProgressChannel, ReceiveForTimesOutWhenEmpty)
{
    ProgressChannel channel;
    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.receiveFor(std::chrono::milliseconds(20)));
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(15));
}

TEST(ProgressChannel, ReceiveWakesForEventsFromOtherThreads)
{
    auto channel = std::make_shared<ProgressChannel>();
    ProgressSender sender(channel);

    std::vector<std::thread> producers;
    for (TaskId id = 1; id <= 4; ++id)
        producers.emplace_back([sender, id]() { sender.send(id, ProgressEvent::completed()); });

    std::vector<TaskId> seen;
    for (int i = 0; i < 4; ++i)
    {
        auto event = channel->receive();
        ASSERT_TRUE(event);
        seen.push_back(event->taskId);
    }
    for (auto &producer : producers)
        producer.join();

    std::sort(seen.begin(), seen.end());
    EXPECT_EQ(seen, (std::vector<TaskId>{1, 2, 3, 4}));
}

TEST(ProgressChannel, DefaultSenderHasNoChannel)
{
    ProgressSender sender;
    EXPECT_FALSE(sender.valid());
    EXPECT_FALSE(sender.send(1, ProgressEvent::completed()));
}

TEST(ProgressChannel, ClosingWakesBlockedReceiver)
{
    ProgressChannel channel;
    std::thread closer([&channel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        channel.close();
    });
    EXPECT_FALSE(channel.receive());
    closer.join();
}
