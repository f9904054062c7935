#include "pool_view.hpp"

namespace sockgate {

void PoolView::set_pool_size(size_t pool_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    pool_size_ = pool_size;
}

void PoolView::apply(const WorkerEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (event.type == WorkerEventType::PoolDegraded) {
        degraded_ = true;
    }

    Key key(event.worker_id, event.generation);

    if (event.new_state == WorkerState::Stopped) {
        workers_.erase(key);
        return;
    }

    auto& worker = workers_[key];
    worker.id = event.worker_id;
    worker.generation = event.generation;
    worker.restart_count = event.restart_count;
    if (event.pid > 0) {
        worker.pid = event.pid;
    }
    if (event.exit_code.has_value()) {
        worker.last_exit_code = event.exit_code;
    }

    if (event.type == WorkerEventType::Snapshot) {
        worker.state = event.new_state;
        worker.last_start_time = event.time;
        return;
    }

    worker.state = event.new_state;
    if (event.type == WorkerEventType::Transition) {
        if (event.new_state == WorkerState::Starting) {
            worker.last_start_time = event.time;
            if (event.old_state == WorkerState::Crashed) {
                worker.last_restart_time = event.time;
            }
        }
    }
}

PoolStatus PoolView::status() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStatus status;
    status.pool_size = pool_size_;
    status.degraded = degraded_;
    status.workers.reserve(workers_.size());

    for (const auto& [key, worker] : workers_) {
        switch (worker.state) {
        case WorkerState::Ready:    status.ready++;    break;
        case WorkerState::Starting: status.starting++; break;
        case WorkerState::Crashed:  status.crashed++;  break;
        case WorkerState::Stopping: status.stopping++; break;
        case WorkerState::Stopped:  break;
        }
        status.workers.push_back(worker);
    }

    return status;
}

int PoolView::ready_count() const {
    std::lock_guard<std::mutex> lock(mutex_);

    int ready = 0;
    for (const auto& [key, worker] : workers_) {
        if (worker.state == WorkerState::Ready) {
            ready++;
        }
    }
    return ready;
}

bool PoolView::is_degraded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return degraded_;
}

std::optional<WorkerStatus> PoolView::find(int worker_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<WorkerStatus> found;
    for (const auto& [key, worker] : workers_) {
        if (key.first == worker_id) {
            found = worker; // map 按 generation 升序，最后一个即最新
        }
    }
    return found;
}

} // namespace sockgate
