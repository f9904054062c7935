#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace sockgate {

struct RelayOptions {
    std::chrono::milliseconds idle_timeout{std::chrono::seconds(60)};
    size_t buffer_size = 64 * 1024;   // 每个方向一个缓冲区
};

enum class RelayOutcome {
    Completed,          // 后端 EOF，响应已全部转发给客户端
    UpstreamFailed,     // 后端在发出任何响应字节之前断开
    UpstreamReset,      // 后端在响应中途断开
    IdleTimeout,        // 两个方向都没有数据超过 idle_timeout
    ClientError,        // 客户端读写出错（连接被重置等）
    ClientClosed,       // 客户端读写两个方向都已关闭，不再等待响应
};

const char* to_string(RelayOutcome outcome);

struct RelayResult {
    RelayOutcome outcome = RelayOutcome::Completed;
    uint64_t bytes_to_backend = 0;
    uint64_t bytes_to_client = 0;
    int error = 0;                  // 导致结束的 errno（如果有）
};

/**
 * 在 client_fd 与 backend_fd 之间双向转发字节
 *
 * 两个 fd 都必须是非阻塞的 socket。每个方向最多缓存 buffer_size 字节，缓冲区
 * 满时停止读取对端（背压）。客户端 EOF 时对后端 shutdown(SHUT_WR)，响应方向
 * 继续转发。同一方向内字节顺序不变。
 *
 * 客户端 EOF 之后若连接出现 POLLHUP/POLLERR（对端完全关闭或被重置），立即以
 * ClientClosed 结束。TCP 上单独一个 FIN 与半关闭无法区分，这种情况继续等待响应，
 * 写回响应时收到 RST 或空闲超时结束。
 *
 * 不关闭任何 fd，也不向客户端写错误响应；由调用者根据 outcome 处理。
 */
RelayResult relay_connection(int client_fd, int backend_fd, const RelayOptions& options);

} // namespace sockgate
