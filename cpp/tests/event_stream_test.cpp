#include "event_stream.hpp"
#include "pool_view.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace sockgate;
using namespace std::chrono_literals;

namespace {

WorkerEvent make_event(int id, uint64_t generation, WorkerState old_state, WorkerState new_state,
                       WorkerEventType type = WorkerEventType::Transition) {
    WorkerEvent event;
    event.type = type;
    event.worker_id = id;
    event.generation = generation;
    event.pid = 1000 + id;
    event.old_state = old_state;
    event.new_state = new_state;
    event.time = std::chrono::system_clock::now();
    return event;
}

} // anonymous namespace

TEST(EventSubscription, DeliversInOrder)
{
    EventHub hub;
    auto subscription = hub.subscribe();

    for (int i = 1; i <= 5; ++i) {
        hub.publish(make_event(i, i, WorkerState::Starting, WorkerState::Ready));
    }

    for (int i = 1; i <= 5; ++i) {
        auto event = subscription->next(100ms);
        ASSERT_TRUE(event.has_value());
        EXPECT_EQ(event->worker_id, i);
    }
    EXPECT_FALSE(subscription->next(10ms).has_value());
}

TEST(EventSubscription, WakesWaitingReader)
{
    EventHub hub;
    auto subscription = hub.subscribe();

    std::thread publisher([&] {
        std::this_thread::sleep_for(50ms);
        hub.publish(make_event(7, 1, WorkerState::Starting, WorkerState::Ready));
    });

    auto event = subscription->next(5s);
    publisher.join();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->worker_id, 7);
}

TEST(EventSubscription, CloseStopsDelivery)
{
    EventHub hub;
    auto subscription = hub.subscribe();
    hub.publish(make_event(1, 1, WorkerState::Starting, WorkerState::Ready));

    subscription->close();
    EXPECT_TRUE(subscription->is_closed());
    hub.publish(make_event(2, 2, WorkerState::Starting, WorkerState::Ready));

    // 关闭前的事件仍可读出，之后的不再投递
    auto event = subscription->next(10ms);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->worker_id, 1);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(subscription->next(5s).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(EventHub, SubscribersAreIndependent)
{
    EventHub hub;
    auto a = hub.subscribe();
    auto b = hub.subscribe();

    hub.publish(make_event(1, 1, WorkerState::Starting, WorkerState::Ready));

    ASSERT_TRUE(a->next(10ms).has_value());
    a->close();

    hub.publish(make_event(2, 2, WorkerState::Starting, WorkerState::Ready));

    auto first = b->next(10ms);
    auto second = b->next(10ms);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->worker_id, 1);
    EXPECT_EQ(second->worker_id, 2);
}

TEST(EventHub, CloseAll)
{
    EventHub hub;
    auto subscription = hub.subscribe();
    hub.close_all();
    EXPECT_TRUE(subscription->is_closed());

    hub.publish(make_event(1, 1, WorkerState::Starting, WorkerState::Ready));
    EXPECT_FALSE(subscription->next(10ms).has_value());
}

TEST(PoolView, CountsStates)
{
    PoolView view(3);
    view.apply(make_event(1, 1, WorkerState::Stopped, WorkerState::Starting));
    view.apply(make_event(2, 2, WorkerState::Stopped, WorkerState::Starting));
    view.apply(make_event(3, 3, WorkerState::Stopped, WorkerState::Starting));
    view.apply(make_event(1, 1, WorkerState::Starting, WorkerState::Ready));
    view.apply(make_event(2, 2, WorkerState::Starting, WorkerState::Ready));

    auto status = view.status();
    EXPECT_EQ(status.pool_size, 3u);
    EXPECT_EQ(status.ready, 2);
    EXPECT_EQ(status.starting, 1);
    EXPECT_EQ(status.workers.size(), 3u);
    EXPECT_EQ(view.ready_count(), 2);
    EXPECT_FALSE(view.is_degraded());
}

TEST(PoolView, StoppedWorkersAreRemoved)
{
    PoolView view(1);
    view.apply(make_event(1, 1, WorkerState::Starting, WorkerState::Ready));
    view.apply(make_event(1, 1, WorkerState::Ready, WorkerState::Stopping));
    EXPECT_EQ(view.status().stopping, 1);

    view.apply(make_event(1, 1, WorkerState::Stopping, WorkerState::Stopped));
    EXPECT_TRUE(view.status().workers.empty());
    EXPECT_FALSE(view.find(1).has_value());
}

TEST(PoolView, CrashAndRestart)
{
    PoolView view(1);
    view.apply(make_event(1, 1, WorkerState::Starting, WorkerState::Ready));

    auto crashed = make_event(1, 1, WorkerState::Ready, WorkerState::Crashed);
    crashed.exit_code = 137;
    crashed.restart_count = 1;
    view.apply(crashed);

    auto worker = view.find(1);
    ASSERT_TRUE(worker.has_value());
    EXPECT_EQ(worker->state, WorkerState::Crashed);
    EXPECT_EQ(worker->last_exit_code.value_or(-1), 137);
    EXPECT_FALSE(worker->last_restart_time.has_value());
    EXPECT_EQ(view.status().crashed, 1);

    auto restarted = make_event(1, 1, WorkerState::Crashed, WorkerState::Starting);
    restarted.restart_count = 1;
    view.apply(restarted);

    worker = view.find(1);
    ASSERT_TRUE(worker.has_value());
    EXPECT_EQ(worker->state, WorkerState::Starting);
    EXPECT_EQ(worker->restart_count, 1);
    EXPECT_TRUE(worker->last_restart_time.has_value());
    EXPECT_EQ(worker->last_exit_code.value_or(-1), 137);
}

TEST(PoolView, StabilityResetClearsRestartCount)
{
    PoolView view(1);
    auto ready = make_event(1, 1, WorkerState::Starting, WorkerState::Ready);
    ready.restart_count = 2;
    view.apply(ready);
    EXPECT_EQ(view.find(1)->restart_count, 2);

    view.apply(make_event(1, 1, WorkerState::Ready, WorkerState::Ready,
                          WorkerEventType::StabilityReset));

    auto worker = view.find(1);
    ASSERT_TRUE(worker.has_value());
    EXPECT_EQ(worker->restart_count, 0);
    EXPECT_EQ(worker->state, WorkerState::Ready);
    EXPECT_EQ(view.ready_count(), 1);
}

TEST(PoolView, FindReturnsNewestGeneration)
{
    PoolView view(1);
    view.apply(make_event(1, 1, WorkerState::Starting, WorkerState::Ready));
    view.apply(make_event(1, 4, WorkerState::Stopped, WorkerState::Starting));

    auto worker = view.find(1);
    ASSERT_TRUE(worker.has_value());
    EXPECT_EQ(worker->generation, 4u);
    EXPECT_EQ(worker->state, WorkerState::Starting);

    // 两代共存时只有旧的一代计入 ready
    EXPECT_EQ(view.ready_count(), 1);
}

TEST(PoolView, LaunchFailedAndDegraded)
{
    PoolView view(2);

    auto failed = make_event(1, 1, WorkerState::Starting, WorkerState::Crashed,
                             WorkerEventType::LaunchFailed);
    view.apply(failed);
    EXPECT_EQ(view.status().crashed, 1);
    EXPECT_FALSE(view.is_degraded());

    auto degraded = make_event(2, 2, WorkerState::Crashed, WorkerState::Crashed,
                               WorkerEventType::PoolDegraded);
    view.apply(degraded);
    EXPECT_TRUE(view.is_degraded());
    EXPECT_TRUE(view.status().degraded);
}

TEST(PoolView, SnapshotSeedsState)
{
    PoolView view(1);
    view.apply(make_event(1, 3, WorkerState::Ready, WorkerState::Ready,
                          WorkerEventType::Snapshot));

    auto worker = view.find(1);
    ASSERT_TRUE(worker.has_value());
    EXPECT_EQ(worker->state, WorkerState::Ready);
    EXPECT_EQ(worker->pid, 1001);
    EXPECT_EQ(view.ready_count(), 1);
}

TEST(WorkerEvent, FormatEvent)
{
    auto event = make_event(2, 5, WorkerState::Ready, WorkerState::Crashed);
    event.exit_code = 1;
    event.restart_delay = 100ms;

    std::string line = format_event(event);
    EXPECT_NE(line.find("worker=2"), std::string::npos) << line;
    EXPECT_NE(line.find("Crashed"), std::string::npos) << line;
}
