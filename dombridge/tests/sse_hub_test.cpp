#include <gtest/gtest.h>

#include "sse_hub.hpp"

#include <chrono>
#include <thread>

using namespace dombridge;

TEST(SseHub, PublishReachesEverySubscriber) {
    SseHub hub;
    auto first = hub.subscribe();
    auto second = hub.subscribe();
    EXPECT_EQ(hub.subscriber_count(), 2u);

    hub.publish({{"type", "request"}, {"method", "tools/list"}});

    std::string message;
    ASSERT_EQ(first->next(message, std::chrono::milliseconds(10)), SseSubscriber::Poll::Message);
    EXPECT_EQ(nlohmann::json::parse(message)["method"], "tools/list");
    ASSERT_EQ(second->next(message, std::chrono::milliseconds(10)), SseSubscriber::Poll::Message);
}

TEST(SseHub, IdleSubscriberTimesOut) {
    SseHub hub;
    auto subscriber = hub.subscribe();

    std::string message;
    EXPECT_EQ(subscriber->next(message, std::chrono::milliseconds(10)), SseSubscriber::Poll::Timeout);
}

TEST(SseHub, SlowSubscriberDropsOldest) {
    SseHub hub(2);
    auto subscriber = hub.subscribe();

    hub.publish({{"n", 1}});
    hub.publish({{"n", 2}});
    hub.publish({{"n", 3}});

    std::string message;
    ASSERT_EQ(subscriber->next(message, std::chrono::milliseconds(0)), SseSubscriber::Poll::Message);
    EXPECT_EQ(nlohmann::json::parse(message)["n"], 2);
    EXPECT_EQ(subscriber->dropped(), 1u);
}

TEST(SseHub, CloseAllWakesBlockedReader) {
    SseHub hub;
    auto subscriber = hub.subscribe();

    std::thread closer([&hub] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        hub.close_all();
    });

    std::string message;
    EXPECT_EQ(subscriber->next(message, std::chrono::seconds(5)), SseSubscriber::Poll::Closed);
    closer.join();
}

TEST(SseHub, UnsubscribeRemovesSubscriber) {
    SseHub hub;
    auto subscriber = hub.subscribe();
    hub.unsubscribe(subscriber);

    EXPECT_EQ(hub.subscriber_count(), 0u);
    hub.publish({{"type", "request"}});
    std::string message;
    EXPECT_EQ(subscriber->next(message, std::chrono::milliseconds(0)), SseSubscriber::Poll::Closed);
}

TEST(SseHub, TrySubscribeRespectsLimit) {
    SseHub hub;
    auto first = hub.try_subscribe(2);
    auto second = hub.try_subscribe(2);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(hub.try_subscribe(2), nullptr);
    EXPECT_EQ(hub.subscriber_count(), 2u);

    hub.unsubscribe(first);
    EXPECT_NE(hub.try_subscribe(2), nullptr);
}
