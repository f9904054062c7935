#include "worker_process.hpp"

#include <vector>
#include <map>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/wait.h>

extern char** environ;

namespace sockgate {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// 子进程中只调用 async-signal-safe 的函数
[[noreturn]] void child_fail(int status_fd, int err) {
    ssize_t ignored = write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

int open_pidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    return static_cast<int>(syscall(SYS_pidfd_open, pid, 0));
#else
    (void)pid;
    return -1;
#endif
}

std::vector<std::string> build_environment(const WorkerSpec& spec, int listen_fd, int ready_fd,
                                           const std::string& socket_path) {
    std::map<std::string, std::string> overrides = spec.environment;
    if (listen_fd >= 0) {
        overrides["SOCKGATE_LISTEN_FD"] = std::to_string(listen_fd);
    }
    if (!socket_path.empty()) {
        overrides["SOCKGATE_SOCKET_PATH"] = socket_path;
    }
    overrides["SOCKGATE_WORKER_ID"] = std::to_string(spec.id);
    if (ready_fd >= 0) {
        overrides["SOCKGATE_READY_FD"] = std::to_string(ready_fd);
    }

    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string item(*entry);
        std::string key = item.substr(0, item.find('='));
        // 未开启就绪通知时不能把 Supervisor 自己继承来的 READY_FD 传下去
        if (overrides.count(key) > 0 || key == "SOCKGATE_READY_FD") {
            continue;
        }
        env.push_back(std::move(item));
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

} // anonymous namespace

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

WorkerProcess::~WorkerProcess() {
    if (pid_ > 0 && !exited_) {
        kill(pid_, SIGKILL);
        waitpid(pid_, nullptr, 0);
        exited_ = true;
    }
    close_fd(pidfd_);
    close_fd(ready_fd_);
}

void WorkerProcess::spawn(const WorkerSpec& spec, int listen_fd, const std::string& socket_path,
                          bool ready_notify) {
    if (spec.command.empty()) {
        throw LaunchError(spec.id, "empty command");
    }

    // 状态管道：exec 成功时由 CLOEXEC 自动关闭，失败时子进程写入 errno
    int status_fds[2];
    if (pipe2(status_fds, O_CLOEXEC) < 0) {
        throw LaunchError(spec.id, "Failed to create pipe: " + std::string(strerror(errno)));
    }

    int ready_fds[2] = {-1, -1};
    if (ready_notify && pipe2(ready_fds, O_CLOEXEC) < 0) {
        int err = errno;
        close(status_fds[0]);
        close(status_fds[1]);
        throw LaunchError(spec.id, "Failed to create pipe: " + std::string(strerror(err)));
    }

    // fork 之前准备好 argv/envp，子进程里不再分配内存
    std::vector<std::string> env = build_environment(spec, listen_fd, ready_fds[1], socket_path);
    std::vector<char*> envp;
    for (auto& item : env) {
        envp.push_back(item.data());
    }
    envp.push_back(nullptr);

    std::vector<std::string> args = spec.command;
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const char* workdir = spec.working_directory.empty() ? nullptr
                                                         : spec.working_directory.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(status_fds[0]);
        close(status_fds[1]);
        close_fd(ready_fds[0]);
        close_fd(ready_fds[1]);
        throw LaunchError(spec.id, "Fork failed: " + std::string(strerror(err)));
    }

    if (pid == 0) {
        // ===== 子进程 =====
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        signal(SIGPIPE, SIG_DFL);

        if (workdir != nullptr && chdir(workdir) < 0) {
            child_fail(status_fds[1], errno);
        }

        // 监听 socket 与就绪管道需要跨过 exec
        if (listen_fd >= 0 && fcntl(listen_fd, F_SETFD, 0) < 0) {
            child_fail(status_fds[1], errno);
        }
        if (ready_fds[1] >= 0 && fcntl(ready_fds[1], F_SETFD, 0) < 0) {
            child_fail(status_fds[1], errno);
        }

        execvpe(argv[0], argv.data(), envp.data());
        child_fail(status_fds[1], errno);
    }

    // ===== 父进程 =====
    close(status_fds[1]);
    close_fd(ready_fds[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_fds[0]);

    if (n > 0) {
        waitpid(pid, nullptr, 0);
        close_fd(ready_fds[0]);
        throw LaunchError(spec.id, "exec '" + spec.command.front() + "' failed: " +
                                       std::string(strerror(child_errno)));
    }

    pid_ = pid;
    exited_ = false;
    pidfd_ = open_pidfd(pid);
    ready_fd_ = ready_fds[0];
    if (ready_fd_ >= 0) {
        fcntl(ready_fd_, F_SETFL, fcntl(ready_fd_, F_GETFL) | O_NONBLOCK);
    }
}

bool WorkerProcess::read_ready() {
    if (ready_fd_ < 0) {
        return false;
    }

    char buf[64];
    ssize_t n = read(ready_fd_, buf, sizeof(buf));
    if (n > 0) {
        close_ready_fd();
        return true;
    }
    if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        close_ready_fd();
    }
    return false;
}

void WorkerProcess::send_signal(int signo) {
    if (pid_ > 0 && !exited_) {
        kill(pid_, signo);
    }
}

std::optional<int> WorkerProcess::try_reap() {
    if (pid_ <= 0 || exited_) {
        return std::nullopt;
    }

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return std::nullopt;
    }

    exited_ = true;
    close_fd(pidfd_);
    close_fd(ready_fd_);

    if (result < 0) {
        return -1;
    }
    return decode_wait_status(status);
}

void WorkerProcess::close_ready_fd() {
    close_fd(ready_fd_);
}

} // namespace sockgate
