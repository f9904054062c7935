#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "relay.hpp"

namespace sockgate {

class GatewayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct GatewayOptions {
    std::string listen_address = "0.0.0.0:80";     // host:port，port 0 = 由内核分配
    std::string backend_path = "/tmp/sockgate.sock";
    std::chrono::milliseconds idle_timeout{std::chrono::seconds(60)};
    int listen_backlog = 128;
    size_t buffer_size = 64 * 1024;
};

struct GatewayStats {
    uint64_t accepted = 0;
    uint64_t completed = 0;
    uint64_t upstream_unavailable = 0;
    uint64_t timeouts = 0;
    uint64_t client_errors = 0;
};

/**
 * Gateway - 对外的反向代理监听器
 *
 * 每个接受的 TCP 连接由一个独立线程处理：连接到 Socket Endpoint，然后
 * relay_connection() 双向转发。后端不可用时返回 502，空闲超时返回 504
 * （仅当还没有转发任何响应字节）。从不透明重试。
 */
class Gateway {
public:
    explicit Gateway(GatewayOptions options);
    ~Gateway();

    // 禁止拷贝
    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    /**
     * 绑定监听地址并启动 accept 线程
     * @throws GatewayError 地址无法解析或绑定失败
     */
    void listen();

    /**
     * 停止接受新连接；已有连接继续转发
     */
    void stop_accepting();

    /**
     * 停止接受并关闭所有剩余连接，等待连接线程结束
     *
     * 先切断各连接的后端，尚未收到响应的客户端得到 502；超过等待时长仍未
     * 结束的连接直接关闭客户端。
     */
    void stop();

    /**
     * 实际监听的端口（listen() 之后有效）
     */
    int port() const { return port_; }

    /**
     * Ready Worker 数量；0 时直接返回 502，负数表示未知（总是尝试连接）
     */
    void set_ready_workers(int count);

    void set_idle_timeout(std::chrono::milliseconds timeout);

    GatewayStats stats() const;

    size_t active_connections() const;

    const GatewayOptions& options() const { return options_; }

private:
    struct ConnectionEntry {
        std::thread thread;
        int client_fd = -1;
        int backend_fd = -1;
    };

    void accept_loop();
    void handle_connection(uint64_t id, int client_fd, std::string peer);
    void set_backend_fd(uint64_t id, int fd);
    void finish_connection(uint64_t id);
    void reap_finished();

    GatewayOptions options_;
    std::atomic<int64_t> idle_timeout_ms_;

    int listen_fd_ = -1;
    int port_ = 0;
    int wake_read_fd_ = -1;
    int wake_write_fd_ = -1;

    std::atomic<bool> accepting_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<int> ready_workers_{-1};
    std::thread accept_thread_;

    mutable std::mutex mutex_;
    std::map<uint64_t, ConnectionEntry> connections_;
    std::condition_variable drained_cv_;
    std::vector<std::thread> finished_;
    uint64_t next_connection_id_ = 1;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> upstream_unavailable_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> client_errors_{0};
};

/**
 * 把 "host:port" / "[v6]:port" / ":port" 拆成 host 与 port
 * @throws GatewayError 格式错误
 */
std::pair<std::string, std::string> split_host_port(const std::string& address);

} // namespace sockgate
