#include "relay.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>
#include <poll.h>
#include <sys/socket.h>

namespace sockgate {

namespace {

using Clock = std::chrono::steady_clock;

/**
 * 单方向的有界缓冲区。读入追加到尾部，写出从头部消费；清空时回到起点。
 */
class RelayBuffer {
public:
    explicit RelayBuffer(size_t capacity) : data_(std::max<size_t>(capacity, 1)) {}

    bool empty() const { return begin_ == end_; }

    bool has_space() {
        if (end_ < data_.size()) {
            return true;
        }
        if (begin_ > 0) {
            std::memmove(data_.data(), data_.data() + begin_, end_ - begin_);
            end_ -= begin_;
            begin_ = 0;
            return true;
        }
        return false;
    }

    void clear() { begin_ = end_ = 0; }

    ssize_t read_from(int fd) {
        ssize_t n = recv(fd, data_.data() + end_, data_.size() - end_, 0);
        if (n > 0) {
            end_ += static_cast<size_t>(n);
        }
        return n;
    }

    ssize_t write_to(int fd) {
        ssize_t n = send(fd, data_.data() + begin_, end_ - begin_, MSG_NOSIGNAL);
        if (n > 0) {
            begin_ += static_cast<size_t>(n);
            if (begin_ == end_) {
                clear();
            }
        }
        return n;
    }

private:
    std::vector<char> data_;
    size_t begin_ = 0;
    size_t end_ = 0;
};

bool would_block(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

} // anonymous namespace

const char* to_string(RelayOutcome outcome) {
    switch (outcome) {
    case RelayOutcome::Completed:      return "completed";
    case RelayOutcome::UpstreamFailed: return "upstream_failed";
    case RelayOutcome::UpstreamReset:  return "upstream_reset";
    case RelayOutcome::IdleTimeout:    return "idle_timeout";
    case RelayOutcome::ClientError:    return "client_error";
    case RelayOutcome::ClientClosed:   return "client_closed";
    }
    return "unknown";
}

RelayResult relay_connection(int client_fd, int backend_fd, const RelayOptions& options) {
    RelayResult result;

    RelayBuffer upstream(options.buffer_size);     // client → backend
    RelayBuffer downstream(options.buffer_size);   // backend → client

    bool client_eof = false;
    bool backend_eof = false;
    bool backend_write_closed = false;
    bool response_started = false;
    auto last_activity = Clock::now();

    auto finish = [&result](RelayOutcome outcome, int err) {
        result.outcome = outcome;
        result.error = err;
        return result;
    };

    for (;;) {
        if (backend_eof) {
            if (!response_started) {
                return finish(RelayOutcome::UpstreamFailed, result.error);
            }
            if (downstream.empty()) {
                shutdown(client_fd, SHUT_WR);
                return finish(RelayOutcome::Completed, 0);
            }
        }

        // 客户端发送完毕：半关闭后端写方向，响应继续
        if (client_eof && upstream.empty() && !backend_write_closed) {
            shutdown(backend_fd, SHUT_WR);
            backend_write_closed = true;
        }

        pollfd fds[2] = {{client_fd, 0, 0}, {backend_fd, 0, 0}};
        if (!client_eof && upstream.has_space()) {
            fds[0].events |= POLLIN;
        }
        if (!downstream.empty()) {
            fds[0].events |= POLLOUT;
        }
        if (!backend_eof && downstream.has_space()) {
            fds[1].events |= POLLIN;
        }
        if (!upstream.empty() && !backend_write_closed) {
            fds[1].events |= POLLOUT;
        }
        // 客户端 EOF 之后仍保留在 poll 中，以便收到 POLLHUP/POLLERR
        if (fds[0].events == 0 && !client_eof) {
            fds[0].fd = -1;
        }
        if (fds[1].events == 0) {
            fds[1].fd = -1;
        }

        auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - last_activity);
        if (idle >= options.idle_timeout) {
            return finish(RelayOutcome::IdleTimeout, ETIMEDOUT);
        }
        int timeout = static_cast<int>((options.idle_timeout - idle).count());

        int ret = poll(fds, 2, timeout);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            return finish(RelayOutcome::ClientError, errno);
        }
        if (ret == 0) {
            continue;
        }

        const short ready_mask = POLLIN | POLLHUP | POLLERR;

        // 客户端 → 缓冲区
        if ((fds[0].events & POLLIN) && (fds[0].revents & ready_mask)) {
            ssize_t n = upstream.read_from(client_fd);
            if (n > 0) {
                last_activity = Clock::now();
                if (backend_write_closed) {
                    upstream.clear(); // 后端已不再接收请求体
                }
            } else if (n == 0) {
                client_eof = true;
            } else if (!would_block(errno)) {
                return finish(RelayOutcome::ClientError, errno);
            }
        }

        // 客户端已完全关闭（不只是半关闭）：立即结束，后端连接随之拆除
        if (client_eof && (fds[0].revents & (POLLHUP | POLLERR)) && !(fds[0].events & POLLOUT)) {
            int err = 0;
            socklen_t len = sizeof(err);
            getsockopt(client_fd, SOL_SOCKET, SO_ERROR, &err, &len);
            return finish(RelayOutcome::ClientClosed, err);
        }

        // 缓冲区 → 后端
        if ((fds[1].events & POLLOUT) && (fds[1].revents & (POLLOUT | POLLHUP | POLLERR))) {
            ssize_t n = upstream.write_to(backend_fd);
            if (n > 0) {
                result.bytes_to_backend += static_cast<uint64_t>(n);
                last_activity = Clock::now();
            } else if (n < 0 && !would_block(errno)) {
                // 后端不再读取，但它可能已经写了响应；继续读后端
                result.error = errno;
                upstream.clear();
                backend_write_closed = true;
            }
        }

        // 后端 → 缓冲区
        if ((fds[1].events & POLLIN) && (fds[1].revents & ready_mask)) {
            ssize_t n = downstream.read_from(backend_fd);
            if (n > 0) {
                response_started = true;
                last_activity = Clock::now();
            } else if (n == 0) {
                backend_eof = true;
            } else if (!would_block(errno)) {
                int err = errno;
                if (!response_started) {
                    return finish(RelayOutcome::UpstreamFailed, err);
                }
                // 响应不完整
                return finish(RelayOutcome::UpstreamReset, err);
            }
        }

        // 缓冲区 → 客户端
        if ((fds[0].events & POLLOUT) && (fds[0].revents & (POLLOUT | POLLHUP | POLLERR))) {
            ssize_t n = downstream.write_to(client_fd);
            if (n > 0) {
                result.bytes_to_client += static_cast<uint64_t>(n);
                last_activity = Clock::now();
            } else if (n < 0 && !would_block(errno)) {
                return finish(RelayOutcome::ClientError, errno);
            }
        }
    }
}

} // namespace sockgate
