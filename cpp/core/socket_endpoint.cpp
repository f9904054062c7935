#include "socket_endpoint.hpp"

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <fcntl.h>
#include <grp.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

namespace sockgate {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::string errno_message(const std::string& what, int err) {
    return what + ": " + std::string(strerror(err));
}

EndpointError::Code code_for_errno(int err) {
    switch (err) {
    case EADDRINUSE:
        return EndpointError::Code::AddressInUse;
    case EACCES:
    case EPERM:
    case EROFS:
        return EndpointError::Code::PermissionDenied;
    default:
        return EndpointError::Code::Other;
    }
}

sockaddr_un make_address(const std::string& path) {
    if (path.empty() || path.size() >= sizeof(sockaddr_un::sun_path)) {
        throw EndpointError(EndpointError::Code::Other,
                            "Invalid socket path '" + path + "'");
    }

    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size());
    return addr;
}

} // anonymous namespace

SocketEndpoint::SocketEndpoint(SocketEndpoint&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)), mode_(other.mode_),
      backlog_(other.backlog_), created_at_(other.created_at_),
      owner_pid_(other.owner_pid_), inode_(other.inode_), device_(other.device_) {
    other.fd_ = -1;
    other.owner_pid_ = -1;
}

SocketEndpoint& SocketEndpoint::operator=(SocketEndpoint&& other) noexcept {
    if (this != &other) {
        destroy();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        backlog_ = other.backlog_;
        created_at_ = other.created_at_;
        owner_pid_ = other.owner_pid_;
        inode_ = other.inode_;
        device_ = other.device_;
        other.fd_ = -1;
        other.owner_pid_ = -1;
    }
    return *this;
}

SocketEndpoint::~SocketEndpoint() {
    destroy();
}

bool SocketEndpoint::is_live(const std::string& path) {
    sockaddr_un addr = make_address(path);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw EndpointError(EndpointError::Code::Other,
                            errno_message("Failed to create probe socket", errno));
    }

    int ret = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    int err = errno;
    close(fd);

    if (ret == 0) {
        return true;
    }

    switch (err) {
    case ECONNREFUSED:
    case ENOENT:
        return false;
    case EACCES:
    case EPERM:
        throw EndpointError(EndpointError::Code::PermissionDenied,
                            errno_message("Cannot probe " + path, err));
    default:
        // EAGAIN: backlog 已满，说明有人在监听；其他错误按"在用"处理，不删除
        return true;
    }
}

SocketEndpoint SocketEndpoint::create(const std::string& path, mode_t mode, int backlog,
                                      const std::string& group) {
    sockaddr_un addr = make_address(path);

    // 1. 处理残留的 socket 文件
    struct stat st;
    if (lstat(path.c_str(), &st) == 0) {
        if (!S_ISSOCK(st.st_mode)) {
            throw EndpointError(EndpointError::Code::AddressInUse,
                                "'" + path + "' exists and is not a socket");
        }
        if (is_live(path)) {
            throw EndpointError(EndpointError::Code::AddressInUse,
                                "'" + path + "' is in use by a live process");
        }
        std::cout << "[SocketEndpoint] event=stale_socket_removed path=" << path << std::endl;
        if (unlink(path.c_str()) < 0 && errno != ENOENT) {
            int err = errno;
            throw EndpointError(code_for_errno(err),
                                errno_message("Failed to remove stale socket " + path, err));
        }
    } else if (errno != ENOENT) {
        int err = errno;
        throw EndpointError(code_for_errno(err), errno_message("Cannot stat " + path, err));
    }

    // 2. 创建并绑定
    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        int err = errno;
        throw EndpointError(EndpointError::Code::Other,
                            errno_message("Failed to create socket", err));
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close_fd(fd);
        throw EndpointError(code_for_errno(err), errno_message("Failed to bind " + path, err));
    }

    // 绑定之后的任何失败都要删除刚创建的文件
    auto fail = [&](const char* what) -> EndpointError {
        int err = errno;
        close_fd(fd);
        unlink(path.c_str());
        return EndpointError(code_for_errno(err), errno_message(what + (" " + path), err));
    };

    if (chmod(path.c_str(), mode) < 0) {
        throw fail("Failed to chmod");
    }

    if (!group.empty()) {
        struct group* gr = getgrnam(group.c_str());
        if (gr == nullptr) {
            close_fd(fd);
            unlink(path.c_str());
            throw EndpointError(EndpointError::Code::Other, "Unknown group '" + group + "'");
        }
        if (chown(path.c_str(), static_cast<uid_t>(-1), gr->gr_gid) < 0) {
            throw fail("Failed to chown");
        }
    }

    if (listen(fd, backlog) < 0) {
        throw fail("Failed to listen on");
    }

    if (lstat(path.c_str(), &st) < 0) {
        throw fail("Cannot stat");
    }

    SocketEndpoint endpoint;
    endpoint.fd_ = fd;
    endpoint.path_ = path;
    endpoint.mode_ = mode;
    endpoint.backlog_ = backlog;
    endpoint.created_at_ = std::chrono::system_clock::now();
    endpoint.owner_pid_ = getpid();
    endpoint.inode_ = st.st_ino;
    endpoint.device_ = st.st_dev;

    std::cout << "[SocketEndpoint] event=created path=" << path
              << " mode=0" << std::oct << mode << std::dec
              << " backlog=" << backlog << std::endl;
    return endpoint;
}

void SocketEndpoint::destroy() {
    close_fd(fd_);

    if (owner_pid_ < 0) {
        return;
    }
    if (owner_pid_ != getpid()) {
        owner_pid_ = -1;
        return;
    }
    owner_pid_ = -1;

    struct stat st;
    if (lstat(path_.c_str(), &st) == 0 && st.st_ino == inode_ && st.st_dev == device_) {
        if (unlink(path_.c_str()) < 0 && errno != ENOENT) {
            std::cerr << "[SocketEndpoint] event=unlink_failed path=" << path_
                      << " error=\"" << strerror(errno) << "\"" << std::endl;
            return;
        }
        std::cout << "[SocketEndpoint] event=destroyed path=" << path_ << std::endl;
    }
}

int connect_unix_socket(const std::string& path) {
    sockaddr_un addr = make_address(path);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        int err = errno;
        throw EndpointError(EndpointError::Code::Other,
                            errno_message("Failed to create socket", err));
    }

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        throw EndpointError(code_for_errno(err), errno_message("Failed to connect to " + path, err));
    }

    return fd;
}

} // namespace sockgate
