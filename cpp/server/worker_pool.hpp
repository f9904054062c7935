#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "event_stream.hpp"
#include "socket_endpoint.hpp"
#include "worker_process.hpp"
#include "worker_types.hpp"

namespace sockgate {

struct PoolOptions {
    RestartPolicy restart_policy;
    std::chrono::milliseconds ready_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds stability_window{std::chrono::seconds(30)};
    std::chrono::milliseconds reload_grace_period{std::chrono::seconds(10)};
    bool ready_notify = true;
};

/**
 * WorkerPool - Worker 进程池管理器
 *
 * 负责：
 * 1. 按 WorkerSpec 启动固定数量的 Worker，共享同一个监听 socket
 * 2. 监控线程等待 Worker 就绪/退出，按 RestartPolicy 退避重启
 * 3. 滚动 reload：Ready 数量始终在 [pool_size - 1, pool_size] 之间
 * 4. 停止：SIGTERM → 宽限期 → SIGKILL，保证一定结束
 *
 * WorkerHandle 只在本类内部、持有 mutex_ 时修改；外部通过 watch() 的事件流
 * 观察状态。
 */
class WorkerPool {
public:
    explicit WorkerPool(PoolOptions options);

    ~WorkerPool();

    // 禁止拷贝
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * 启动所有 Worker 并等待它们就绪
     *
     * 单个 Worker 失败不会影响其他已启动的 Worker，由调用者决定是否回滚。
     *
     * @param specs Worker 描述列表
     * @param endpoint 共享的监听端点（必须比池活得久）
     * @return 每个未能就绪的 Worker 一个 LaunchError；全部成功时为空
     * @throws std::logic_error 池已经启动
     */
    std::vector<LaunchError> start_pool(const std::vector<WorkerSpec>& specs,
                                        const SocketEndpoint& endpoint);

    /**
     * 订阅事件流。新订阅者先收到每个存活 Worker 的 Snapshot，之后是实时事件。
     */
    std::shared_ptr<EventSubscription> watch();

    /**
     * 滚动替换 Worker（按 spec.id 一个一个替换）
     *
     * 替换者就绪后，旧 Worker 先进入 Stopping，替换者再进入 Ready。
     * 任何一个替换者失败都会中止 reload，剩下的旧 Worker 继续服务。
     *
     * @return 失败的替换者对应的 LaunchError；成功时为空
     * @throws std::logic_error 池未启动、正在停止或另一个 reload 正在进行
     */
    std::vector<LaunchError> reload(const std::vector<WorkerSpec>& new_specs);

    /**
     * 停止所有 Worker
     * @param grace_period SIGTERM 之后等待的时间，超时发送 SIGKILL
     */
    void stop_pool(std::chrono::milliseconds grace_period);

    size_t pool_size() const;

    PoolOptions options() const;

    /**
     * 替换重启策略与各项超时，对已在运行的 Worker 立即生效
     */
    void set_options(const PoolOptions& options);

private:
    using Clock = std::chrono::steady_clock;

    struct WorkerHandle {
        WorkerSpec spec;
        uint64_t generation = 0;
        WorkerProcess process;
        WorkerState state = WorkerState::Stopped;
        int restart_count = 0;
        std::deque<Clock::time_point> restart_history;
        std::chrono::system_clock::time_point last_start_time{};

        Clock::time_point ready_deadline{};
        Clock::time_point ready_since{};
        Clock::time_point stop_deadline{};
        Clock::time_point restart_at{};
        bool restart_pending = false;
        bool kill_sent = false;
        bool ready_timed_out = false;

        // start_pool/reload 启动的 Worker 在首次就绪之前失败不会重启
        bool initial_launch = true;
        std::string failure;

        // reload 时被本 Worker 替换的旧 Worker
        std::shared_ptr<WorkerHandle> replaces;
    };

    using HandlePtr = std::shared_ptr<WorkerHandle>;

    void monitor_loop();
    void wake();
    void drain_wake_pipe();

    HandlePtr make_handle_locked(const WorkerSpec& spec);
    std::optional<std::string> launch_locked(WorkerHandle& handle);
    void mark_ready_locked(WorkerHandle& handle);
    void begin_stop_locked(WorkerHandle& handle, std::chrono::milliseconds grace_period);
    void handle_exit_locked(WorkerHandle& handle, int exit_code);
    void handle_crash_locked(WorkerHandle& handle, std::optional<int> exit_code,
                             const std::string& detail, bool launch_failed);
    void run_timers_locked(Clock::time_point now);
    int next_timeout_ms_locked(Clock::time_point now) const;
    void prune_stopped_locked();
    bool all_stopped_locked() const;
    HandlePtr find_active_locked(int worker_id) const;

    void transition_locked(WorkerHandle& handle, WorkerState new_state,
                           std::optional<int> exit_code = std::nullopt,
                           std::optional<std::chrono::milliseconds> restart_delay = std::nullopt,
                           const std::string& detail = "");
    WorkerEvent make_event_locked(const WorkerHandle& handle, WorkerEventType type) const;
    void publish_locked(const WorkerEvent& event);

    PoolOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<HandlePtr> handles_;
    std::vector<WorkerSpec> specs_;
    uint64_t next_generation_ = 1;

    int listen_fd_ = -1;
    std::string socket_path_;

    bool started_ = false;
    bool stopping_ = false;
    bool reloading_ = false;
    bool degraded_ = false;
    bool quit_ = false;

    EventHub hub_;

    int wake_read_fd_ = -1;
    int wake_write_fd_ = -1;
    std::thread monitor_thread_;
};

} // namespace sockgate
