#include "sse_hub.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <limits>

namespace dombridge {

SseSubscriber::SseSubscriber(std::size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

void SseSubscriber::push(std::string message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(std::move(message));
    }
    cv_.notify_one();
}

SseSubscriber::Poll SseSubscriber::next(std::string& message, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) {
        return Poll::Timeout;
    }
    if (closed_) {
        return Poll::Closed;
    }
    message = std::move(queue_.front());
    queue_.pop_front();
    return Poll::Message;
}

void SseSubscriber::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        queue_.clear();
    }
    cv_.notify_all();
}

std::size_t SseSubscriber::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

SseHub::SseHub(std::size_t queue_capacity)
    : queue_capacity_(queue_capacity) {}

std::shared_ptr<SseSubscriber> SseHub::subscribe() {
    return try_subscribe(std::numeric_limits<std::size_t>::max());
}

std::shared_ptr<SseSubscriber> SseHub::try_subscribe(std::size_t max_subscribers) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (subscribers_.size() >= max_subscribers) {
        return nullptr;
    }
    auto subscriber = std::make_shared<SseSubscriber>(queue_capacity_);
    subscribers_.push_back(subscriber);
    LOG4CPLUS_INFO(mcp_logger(), "SSE client subscribed (" << subscribers_.size() << " total)");
    return subscriber;
}

void SseHub::unsubscribe(const std::shared_ptr<SseSubscriber>& subscriber) {
    subscriber->close();
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), subscriber), subscribers_.end());
    LOG4CPLUS_INFO(mcp_logger(), "SSE client left (" << subscribers_.size() << " remaining)");
}

void SseHub::publish(const nlohmann::json& message) {
    const std::string text = message.dump();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& subscriber : subscribers_) {
        subscriber->push(text);
    }
}

void SseHub::close_all() {
    std::vector<std::shared_ptr<SseSubscriber>> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers.swap(subscribers_);
    }
    for (const auto& subscriber : subscribers) {
        subscriber->close();
    }
}

std::size_t SseHub::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace dombridge
