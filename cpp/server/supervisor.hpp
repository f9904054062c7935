#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "event_stream.hpp"
#include "gateway.hpp"
#include "gateway_config.hpp"
#include "pool_view.hpp"
#include "socket_endpoint.hpp"
#include "worker_pool.hpp"

namespace sockgate {

enum class SupervisorState {
    Initializing,
    Running,
    ReloadingConfig,
    Stopping,
    Stopped,
};

const char* to_string(SupervisorState state);

/**
 * SupervisorError - 启动阶段的致命错误（不重试）
 */
class SupervisorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SupervisorStatus {
    SupervisorState state = SupervisorState::Initializing;
    PoolStatus pool;
    GatewayStats gateway;
    size_t active_connections = 0;
    std::string listen_address;
    int gateway_port = 0;
    std::string socket_path;
    std::chrono::system_clock::time_point started_at{};
    uint64_t reload_count = 0;
};

/**
 * Supervisor - 顶层生命周期管理
 *
 * 状态机：Initializing → Running → ReloadingConfig → Running | Stopping → Stopped
 *
 * 启动顺序：Socket Endpoint → Worker 池 → Gateway。
 * 停止顺序：Gateway 停止 accept → stop_pool → 关闭剩余连接 → 删除 Endpoint。
 *
 * request_reload()/request_stop() 只设置标志，可以在信号处理函数中调用；
 * 实际动作在 run() 的主循环里执行。
 */
class Supervisor {
public:
    explicit Supervisor(ConfigSource source);
    ~Supervisor();

    // 禁止拷贝
    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /**
     * Initializing → Running
     * @throws SupervisorError 配置无效、Endpoint 无法创建、没有任何 Worker 就绪、
     *         Gateway 无法监听
     */
    void start();

    /**
     * 主循环（阻塞），处理 reload/stop 请求，直到 Stopped
     * @return 进程退出码：正常停止为 0，PoolDegraded 为 1
     */
    int run();

    void request_reload() { reload_requested_ = true; }
    void request_stop() { stop_requested_ = true; }

    /**
     * 重新加载配置并滚动替换 Worker（同步）
     * @return 是否成功；失败时旧 Worker 继续服务
     */
    bool reload();

    /**
     * 同步停止；重复调用无副作用
     */
    void stop();

    SupervisorState state() const { return state_.load(); }

    SupervisorStatus status() const;

    GatewayConfig config() const;

    int exit_code() const { return exit_code_.load(); }

private:
    void set_state(SupervisorState state);
    void pump_events();
    void wait_for_ready(int expected, std::chrono::milliseconds timeout);
    void teardown();

    static PoolOptions make_pool_options(const GatewayConfig& config);
    static GatewayOptions make_gateway_options(const GatewayConfig& config);

    ConfigSource source_;

    mutable std::mutex config_mutex_;
    GatewayConfig config_;

    // start/reload/stop 互斥
    std::mutex lifecycle_mutex_;

    std::atomic<SupervisorState> state_{SupervisorState::Initializing};
    std::atomic<bool> reload_requested_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> degraded_{false};
    std::atomic<int> exit_code_{0};

    SocketEndpoint endpoint_;
    std::unique_ptr<WorkerPool> pool_;
    std::unique_ptr<Gateway> gateway_;
    PoolView view_;
    std::shared_ptr<EventSubscription> events_;
    std::thread pump_thread_;

    std::chrono::system_clock::time_point started_at_{};
    std::atomic<uint64_t> reload_count_{0};
};

} // namespace sockgate
