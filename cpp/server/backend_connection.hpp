#pragma once

#include <string>

namespace sockgate {

/**
 * BackendConnection - 到 Socket Endpoint 的一条连接
 *
 * 每个客户端连接对应一条新的后端连接，用完即关闭（Worker 不复用连接）。
 * 连接以非阻塞方式建立：没有 Worker 在 accept 时 connect 仍可能成功
 * （连接停在 backlog 中），因此 Gateway 额外参考 Ready Worker 数量。
 */
class BackendConnection {
public:
    BackendConnection() = default;

    /**
     * 连接到 socket_path
     * @throws EndpointError 连接失败（路径不存在、被拒绝、backlog 已满）
     */
    explicit BackendConnection(const std::string& socket_path);

    ~BackendConnection();

    // 禁止拷贝
    BackendConnection(const BackendConnection&) = delete;
    BackendConnection& operator=(const BackendConnection&) = delete;

    // 允许移动
    BackendConnection(BackendConnection&& other) noexcept;
    BackendConnection& operator=(BackendConnection&& other) noexcept;

    bool is_valid() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    const std::string& socket_path() const { return socket_path_; }

    void close();

private:
    int fd_ = -1;
    std::string socket_path_;
};

} // namespace sockgate
