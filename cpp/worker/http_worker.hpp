#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sockgate {

struct HttpWorkerOptions {
    int listen_fd = -1;         // 从 Supervisor 继承的监听 socket
    int ready_fd = -1;          // 就绪管道写端，-1 表示不通知
    int worker_id = 0;
    std::chrono::milliseconds io_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds drain_timeout{std::chrono::seconds(10)};
};

/**
 * 一个已解析的 HTTP/1.1 请求头
 */
struct HttpRequestHead {
    std::string method;
    std::string target;
    std::string version;
    std::map<std::string, std::string> headers;   // 名称已转为小写

    /**
     * @return Content-Length；没有该头时为 0，格式错误时为 -1
     */
    long long content_length() const;
};

/**
 * 解析请求头（不含结尾的空行）
 * @return 格式正确时为 true
 */
bool parse_request_head(const std::string& text, HttpRequestHead& head);

/**
 * HttpWorker - 参考 Worker 实现
 *
 * 在继承来的监听 socket 上 accept，每个连接一个线程，处理一个请求后关闭：
 * - GET /health → 200 "ok"
 * - 带请求体 → 原样回显（流式，Content-Length 相同）
 * - 其他 → 一段描述请求的文本
 *
 * 收到停止信号后不再 accept，等待在途连接结束（最多 drain_timeout）。
 */
class HttpWorker {
public:
    explicit HttpWorker(HttpWorkerOptions options);
    ~HttpWorker();

    // 禁止拷贝
    HttpWorker(const HttpWorker&) = delete;
    HttpWorker& operator=(const HttpWorker&) = delete;

    /**
     * 从 SOCKGATE_LISTEN_FD / SOCKGATE_READY_FD / SOCKGATE_WORKER_ID 读取配置
     * @throws std::runtime_error 缺少 SOCKGATE_LISTEN_FD 或值无效
     */
    static HttpWorkerOptions options_from_environment();

    /**
     * 向 Supervisor 报告就绪（只报告一次）
     */
    void notify_ready();

    /**
     * accept 循环（阻塞），stop_flag 置位后排空在途连接并返回
     */
    void run(const std::atomic<bool>& stop_flag);

    uint64_t served() const { return served_.load(); }

private:
    void handle_connection(uint64_t id, int fd);
    void finish_connection(uint64_t id);
    void reap_finished();
    void drain();

    HttpWorkerOptions options_;

    std::mutex mutex_;
    std::map<uint64_t, std::pair<std::thread, int>> connections_;   // id → (线程, fd)
    std::vector<std::thread> finished_;
    uint64_t next_id_ = 1;

    std::atomic<uint64_t> served_{0};
};

} // namespace sockgate
