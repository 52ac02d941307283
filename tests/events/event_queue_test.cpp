#include <gtest/gtest.h>
#include "sconv/events/event_queue.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace sconv::events;

TEST(ThreadSafeQueue, PushAndPop) {
    ThreadSafeQueue<int> queue;

    queue.push(42);
    queue.push(100);

    auto val1 = queue.pop();
    ASSERT_TRUE(val1.has_value());
    EXPECT_EQ(val1.value(), 42);

    auto val2 = queue.pop();
    ASSERT_TRUE(val2.has_value());
    EXPECT_EQ(val2.value(), 100);
}

TEST(ThreadSafeQueue, TryPop) {
    ThreadSafeQueue<int> queue;

    auto val = queue.try_pop();
    EXPECT_FALSE(val.has_value());

    queue.push(123);

    val = queue.try_pop();
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(val.value(), 123);
}

TEST(ThreadSafeQueue, PopTimeout) {
    ThreadSafeQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::milliseconds(100));
    auto end = std::chrono::steady_clock::now();

    EXPECT_FALSE(val.has_value());

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    EXPECT_GE(duration.count(), 90);
}

TEST(ThreadSafeQueue, Size) {
    ThreadSafeQueue<int> queue;

    EXPECT_EQ(queue.size(), 0u);
    EXPECT_TRUE(queue.empty());

    queue.push(1);
    queue.push(2);
    EXPECT_EQ(queue.size(), 2u);

    queue.pop();
    EXPECT_EQ(queue.size(), 1u);
}

TEST(ThreadSafeQueue, CloseDrainsRemainingItems) {
    ThreadSafeQueue<int> queue;

    queue.push(7);
    queue.close();

    auto val = queue.pop();
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(val.value(), 7);
    EXPECT_FALSE(queue.pop().has_value());
    EXPECT_TRUE(queue.closed());
}

TEST(ThreadSafeQueue, ProducerConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
        queue.close();
    });

    std::thread consumer([&queue, &sum]() {
        while (auto val = queue.pop()) {
            sum += val.value();
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum, 4950);
}

TEST(EventChannel, QueuesEventsInEmissionOrder) {
    EventBus bus;
    EventChannel channel(bus);

    bus.emit(SessionStartedEvent{"s1", "in.mkv", "out.mp4", std::nullopt});
    bus.emit(AttemptStartedEvent{"s1", sconv::pipeline::ConversionStrategy::StreamCopy, 1, 10});
    bus.emit(HeartbeatEvent{});

    auto events = channel.drain();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<SessionStartedEvent>(events[0]));
    EXPECT_TRUE(std::holds_alternative<AttemptStartedEvent>(events[1]));
    EXPECT_TRUE(std::holds_alternative<HeartbeatEvent>(events[2]));
}

TEST(EventChannel, SessionFilterDropsOtherSessionsAndClosesOnFinish) {
    EventBus bus;
    EventChannel channel(bus, std::string("wanted"));

    bus.emit(SessionStartedEvent{"other", "a", "b", std::nullopt});
    bus.emit(SessionStartedEvent{"wanted", "a", "b", std::nullopt});
    bus.emit(SessionFinishedEvent{"wanted", sconv::pipeline::Cancelled{}, 0, std::chrono::milliseconds(5)});

    std::vector<PipelineEvent> received;
    while (auto event = channel.pop()) {
        received.push_back(std::move(*event));
    }

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(std::get<SessionStartedEvent>(received[0]).session_id, "wanted");
    EXPECT_TRUE(std::holds_alternative<SessionFinishedEvent>(received[1]));
}

TEST(EventChannel, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        EventChannel channel(bus);
        EXPECT_EQ(bus.subscriber_count<HeartbeatEvent>(), 1u);
    }
    EXPECT_EQ(bus.subscriber_count<HeartbeatEvent>(), 0u);
}
