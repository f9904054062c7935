#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "worker_types.hpp"

namespace sockgate {

/**
 * EventSubscription - 一个订阅者的事件队列（无界）
 *
 * 每次 WorkerPool::watch() 都得到独立的队列，互不影响。
 */
class EventSubscription {
public:
    EventSubscription() = default;

    // 禁止拷贝
    EventSubscription(const EventSubscription&) = delete;
    EventSubscription& operator=(const EventSubscription&) = delete;

    /**
     * 取下一条事件
     * @param timeout 最长等待时间
     * @return 事件；超时或订阅已关闭且队列为空时返回 std::nullopt
     */
    std::optional<WorkerEvent> next(std::chrono::milliseconds timeout);

    /**
     * 关闭订阅，唤醒所有等待者；已排队的事件仍可取出
     */
    void close();

    bool is_closed() const;

    void push(const WorkerEvent& event);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<WorkerEvent> queue_;
    bool closed_ = false;
};

/**
 * EventHub - 把事件分发给所有存活的订阅者
 */
class EventHub {
public:
    std::shared_ptr<EventSubscription> subscribe();

    void publish(const WorkerEvent& event);

    /**
     * 关闭所有订阅
     */
    void close_all();

private:
    std::mutex mutex_;
    std::vector<std::weak_ptr<EventSubscription>> subscribers_;
};

} // namespace sockgate
