#include "event_stream.hpp"

#include <algorithm>

namespace sockgate {

std::optional<WorkerEvent> EventSubscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });

    if (queue_.empty()) {
        return std::nullopt;
    }

    WorkerEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void EventSubscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventSubscription::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void EventSubscription::push(const WorkerEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        queue_.push_back(event);
    }
    cv_.notify_one();
}

std::shared_ptr<EventSubscription> EventHub::subscribe() {
    auto subscription = std::make_shared<EventSubscription>();

    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(subscription);
    return subscription;
}

void EventHub::publish(const WorkerEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    // 顺便清理已经释放或关闭的订阅者
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
                       [](const std::weak_ptr<EventSubscription>& weak) {
                           auto subscription = weak.lock();
                           return !subscription || subscription->is_closed();
                       }),
        subscribers_.end());

    for (const auto& weak : subscribers_) {
        if (auto subscription = weak.lock()) {
            subscription->push(event);
        }
    }
}

void EventHub::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& weak : subscribers_) {
        if (auto subscription = weak.lock()) {
            subscription->close();
        }
    }
    subscribers_.clear();
}

} // namespace sockgate
