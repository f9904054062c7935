#pragma once

#include <string>
#include <chrono>
#include <stdexcept>
#include <sys/types.h>

namespace sockgate {

/**
 * EndpointError - Socket Endpoint 创建/连接失败
 */
class EndpointError : public std::runtime_error {
public:
    enum class Code {
        AddressInUse,
        PermissionDenied,
        Other,
    };

    EndpointError(Code code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }

private:
    Code code_;
};

/**
 * SocketEndpoint - Unix Domain Socket 监听端点
 *
 * Supervisor 在启动 Worker 之前创建，所有 Worker 继承同一个监听 fd 并各自
 * accept()，由内核决定下一个连接交给哪个 Worker。
 * 对象析构时自动 destroy()（unlink 路径），保证任何退出路径都会清理文件。
 */
class SocketEndpoint {
public:
    SocketEndpoint() = default;
    SocketEndpoint(SocketEndpoint&& other) noexcept;
    SocketEndpoint& operator=(SocketEndpoint&& other) noexcept;
    ~SocketEndpoint();

    // 禁止拷贝
    SocketEndpoint(const SocketEndpoint&) = delete;
    SocketEndpoint& operator=(const SocketEndpoint&) = delete;

    /**
     * 创建监听端点
     *
     * 如果 path 已存在：
     * - 不是 socket 文件 → AddressInUse（不删除）
     * - 是 socket 且有进程在监听 → AddressInUse
     * - 是 socket 但 connect 被拒绝（上次崩溃残留）→ 删除后继续
     *
     * @param path socket 文件路径
     * @param mode 权限位（例如 0660）
     * @param backlog listen backlog
     * @param group 可选的属组名（空字符串表示不修改）
     * @throws EndpointError
     */
    static SocketEndpoint create(const std::string& path, mode_t mode, int backlog,
                                 const std::string& group = "");

    /**
     * 关闭 fd 并删除 socket 文件。重复调用不是错误。
     */
    void destroy();

    bool is_valid() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    const std::string& path() const { return path_; }
    mode_t mode() const { return mode_; }
    int backlog() const { return backlog_; }
    std::chrono::system_clock::time_point created_at() const { return created_at_; }

    /**
     * 检查 path 上是否有进程正在监听（connect 探测，不仅仅是文件存在）
     */
    static bool is_live(const std::string& path);

private:
    int fd_ = -1;
    std::string path_;
    mode_t mode_ = 0;
    int backlog_ = 0;
    std::chrono::system_clock::time_point created_at_{};

    // 只有创建者进程才删除文件；inode 用于确认文件没有被别人替换
    pid_t owner_pid_ = -1;
    ino_t inode_ = 0;
    dev_t device_ = 0;
};

/**
 * 以非阻塞方式连接到 Unix socket
 * @return 已连接的 fd（O_NONBLOCK | O_CLOEXEC）
 * @throws EndpointError 连接失败
 */
int connect_unix_socket(const std::string& path);

} // namespace sockgate
