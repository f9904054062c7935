#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "worker_types.hpp"

namespace sockgate {

struct WorkerStatus {
    int id = 0;
    uint64_t generation = 0;
    pid_t pid = -1;
    WorkerState state = WorkerState::Starting;
    int restart_count = 0;
    std::chrono::system_clock::time_point last_start_time{};
    std::optional<std::chrono::system_clock::time_point> last_restart_time;
    std::optional<int> last_exit_code;
};

struct PoolStatus {
    size_t pool_size = 0;
    int ready = 0;
    int starting = 0;
    int crashed = 0;
    int stopping = 0;
    bool degraded = false;
    std::vector<WorkerStatus> workers;
};

/**
 * PoolView - 由事件流构建的池状态只读视图
 *
 * 其他组件（Supervisor、Gateway、控制接口）只通过事件了解 Worker 状态，
 * 从不直接读取 WorkerPool 内部的 handle。线程安全。
 */
class PoolView {
public:
    explicit PoolView(size_t pool_size = 0) : pool_size_(pool_size) {}

    void set_pool_size(size_t pool_size);

    /**
     * 应用一条事件。Stopped 的 Worker 从视图中移除。
     */
    void apply(const WorkerEvent& event);

    PoolStatus status() const;

    int ready_count() const;

    bool is_degraded() const;

    /**
     * 查找指定 id 的最新一代 Worker
     */
    std::optional<WorkerStatus> find(int worker_id) const;

private:
    using Key = std::pair<int, uint64_t>; // (worker_id, generation)

    mutable std::mutex mutex_;
    size_t pool_size_;
    bool degraded_ = false;
    std::map<Key, WorkerStatus> workers_;
};

} // namespace sockgate
