#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dombridge {

/// Outbound event queue of one monitoring-stream client.
class SseSubscriber {
public:
    enum class Poll {
        Message,
        Timeout,
        Closed,
    };

    explicit SseSubscriber(std::size_t capacity);

    /// Queues message; the oldest queued message is dropped when full.
    void push(std::string message);
    Poll next(std::string& message, std::chrono::milliseconds timeout);
    void close();

    std::size_t dropped() const;

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

/// Fan-out of monitoring events to every subscribed SSE client. Best effort.
class SseHub {
public:
    static constexpr std::size_t kDefaultQueueCapacity = 256;

    explicit SseHub(std::size_t queue_capacity = kDefaultQueueCapacity);

    std::shared_ptr<SseSubscriber> subscribe();
    /// nullptr when max_subscribers are already attached.
    std::shared_ptr<SseSubscriber> try_subscribe(std::size_t max_subscribers);
    void unsubscribe(const std::shared_ptr<SseSubscriber>& subscriber);
    void publish(const nlohmann::json& message);
    void close_all();
    std::size_t subscriber_count() const;

private:
    std::size_t queue_capacity_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<SseSubscriber>> subscribers_;
};

} // namespace dombridge
