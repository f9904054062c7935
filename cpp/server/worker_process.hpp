#pragma once

#include <optional>
#include <string>
#include <sys/types.h>

#include "worker_types.hpp"

namespace sockgate {

/**
 * WorkerProcess - 单个 Worker 子进程
 *
 * 负责：
 * 1. fork + exec 启动 Worker，exec 失败通过 CLOEXEC 状态管道报告
 * 2. 把监听 socket fd 和就绪管道 fd 通过环境变量传给子进程
 * 3. 就绪信号（SOCKGATE_READY_FD 上写入任意字节）
 * 4. 发送信号、回收退出状态
 *
 * 只由 WorkerPool 使用，本身不做任何状态机决策。
 */
class WorkerProcess {
public:
    WorkerProcess() = default;
    ~WorkerProcess();

    // 禁止拷贝
    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    /**
     * 派生 Worker 进程
     * @param spec Worker 描述
     * @param listen_fd 共享的监听 socket（子进程继承）
     * @param socket_path 监听 socket 的路径（仅作为环境变量传递）
     * @param ready_notify 是否创建就绪管道
     * @throws LaunchError 如果 fork/chdir/exec 失败
     */
    void spawn(const WorkerSpec& spec, int listen_fd, const std::string& socket_path,
               bool ready_notify);

    /**
     * 非阻塞读取就绪管道
     * @return true 如果收到就绪信号；管道关闭时自动关闭 ready_fd
     */
    bool read_ready();

    /**
     * 向进程发送信号（进程已被回收时什么也不做）
     */
    void send_signal(int signo);

    /**
     * 非阻塞回收
     * @return 退出码（信号终止为 128 + signo），进程仍在运行时返回 std::nullopt
     */
    std::optional<int> try_reap();

    pid_t pid() const { return pid_; }
    int pidfd() const { return pidfd_; }
    int ready_fd() const { return ready_fd_; }
    bool has_exited() const { return exited_; }

    void close_ready_fd();

private:
    pid_t pid_ = -1;
    int pidfd_ = -1;
    int ready_fd_ = -1;
    bool exited_ = false;
};

/**
 * 把 waitpid() 的 status 转换为 shell 风格的退出码
 */
int decode_wait_status(int status);

} // namespace sockgate
