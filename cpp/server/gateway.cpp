#include "gateway.hpp"
#include "backend_connection.hpp"
#include "socket_endpoint.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sockgate {

namespace {

// 错误响应的写入与"延迟关闭"时长上限
constexpr int kErrorWriteTimeoutMs = 1000;
constexpr int kLingerTimeoutMs = 1000;

// stop() 等待连接自行发出 502 并结束的时长，超过后强制关闭客户端
constexpr int kStopDrainTimeoutMs = 3000;

std::string format_peer(const sockaddr_storage& addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    int port = 0;

    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
        return std::string(host) + ":" + std::to_string(port);
    }
    if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
        return "[" + std::string(host) + "]:" + std::to_string(port);
    }
    return "unknown";
}

std::string make_error_response(int status, const char* reason, const std::string& body) {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
           "Content-Type: text/plain\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n"
           "Connection: close\r\n"
           "\r\n" + body;
}

/**
 * 向客户端写一个完整的错误响应，然后半关闭并读空客户端剩余的请求字节，
 * 避免未读数据导致 RST 把响应冲掉
 */
void send_error_response(int fd, int status, const char* reason, const std::string& body) {
    std::string response = make_error_response(status, reason, body);

    size_t sent = 0;
    while (sent < response.size()) {
        ssize_t n = send(fd, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd, POLLOUT, 0};
            if (poll(&pfd, 1, kErrorWriteTimeoutMs) > 0) {
                continue;
            }
        }
        return;
    }

    shutdown(fd, SHUT_WR);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kLingerTimeoutMs);
    char buf[4096];
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return;
        }
        pollfd pfd{fd, POLLIN, 0};
        int ret = poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0 && errno == EINTR) {
            continue;
        }
        if (ret <= 0) {
            return;
        }
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n == 0 || (n < 0 && errno != EAGAIN && errno != EINTR)) {
            return;
        }
    }
}

} // anonymous namespace

std::pair<std::string, std::string> split_host_port(const std::string& address) {
    std::string host;
    std::string port;

    if (!address.empty() && address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string::npos || close + 1 >= address.size() ||
            address[close + 1] != ':') {
            throw GatewayError("invalid listen address '" + address + "'");
        }
        host = address.substr(1, close - 1);
        port = address.substr(close + 2);
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string::npos) {
            throw GatewayError("invalid listen address '" + address + "' (expected host:port)");
        }
        host = address.substr(0, colon);
        port = address.substr(colon + 1);
    }

    if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos) {
        throw GatewayError("invalid port in listen address '" + address + "'");
    }
    return {host, port};
}

Gateway::Gateway(GatewayOptions options)
    : options_(std::move(options)),
      idle_timeout_ms_(options_.idle_timeout.count()) {}

Gateway::~Gateway() {
    stop();
    if (wake_read_fd_ >= 0) {
        close(wake_read_fd_);
    }
    if (wake_write_fd_ >= 0) {
        close(wake_write_fd_);
    }
}

void Gateway::listen() {
    if (listen_fd_ >= 0 || accepting_) {
        throw GatewayError("gateway is already listening");
    }

    auto [host, port] = split_host_port(options_.listen_address);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* result = nullptr;
    int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw GatewayError("Failed to resolve " + options_.listen_address + ": " +
                           gai_strerror(rc));
    }

    int last_error = 0;
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                        ai->ai_protocol);
        if (fd < 0) {
            last_error = errno;
            continue;
        }

        int one = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        if (bind(fd, ai->ai_addr, ai->ai_addrlen) < 0 ||
            ::listen(fd, options_.listen_backlog) < 0) {
            last_error = errno;
            close(fd);
            continue;
        }

        listen_fd_ = fd;
        break;
    }
    freeaddrinfo(result);

    if (listen_fd_ < 0) {
        throw GatewayError("Failed to bind " + options_.listen_address + ": " +
                           std::string(strerror(last_error)));
    }

    sockaddr_storage bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        if (bound.ss_family == AF_INET) {
            port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
        } else if (bound.ss_family == AF_INET6) {
            port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
        }
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) < 0) {
        int err = errno;
        close(listen_fd_);
        listen_fd_ = -1;
        throw GatewayError("Failed to create pipe: " + std::string(strerror(err)));
    }
    wake_read_fd_ = fds[0];
    wake_write_fd_ = fds[1];

    accepting_ = true;
    accept_thread_ = std::thread(&Gateway::accept_loop, this);

    std::cout << "[Gateway] event=listening address=" << options_.listen_address
              << " port=" << port_ << " backend=" << options_.backend_path << std::endl;
}

void Gateway::stop_accepting() {
    if (!accepting_.exchange(false)) {
        return;
    }

    char c = 1;
    ssize_t ignored = write(wake_write_fd_, &c, 1);
    (void)ignored;

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    close(listen_fd_);
    listen_fd_ = -1;

    std::cout << "[Gateway] event=accept_stopped active=" << active_connections() << std::endl;
}

void Gateway::stop() {
    stop_accepting();
    stopping_ = true;

    std::vector<std::thread> threads;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!connections_.empty()) {
            std::cout << "[Gateway] event=closing_connections count=" << connections_.size()
                      << std::endl;
        }

        // 只切断后端：连接线程看到后端断开，按 upstream 不可用给客户端回 502
        for (auto& [id, entry] : connections_) {
            if (entry.backend_fd >= 0) {
                shutdown(entry.backend_fd, SHUT_RDWR);
            }
        }

        bool drained = drained_cv_.wait_for(lock, std::chrono::milliseconds(kStopDrainTimeoutMs),
                                            [this] { return connections_.empty(); });
        if (!drained) {
            std::cerr << "[Gateway] event=force_close_connections count=" << connections_.size()
                      << std::endl;
        }

        for (auto& [id, entry] : connections_) {
            if (entry.client_fd >= 0) {
                shutdown(entry.client_fd, SHUT_RDWR);
            }
            if (entry.thread.joinable()) {
                threads.push_back(std::move(entry.thread));
            }
        }
        for (auto& thread : finished_) {
            threads.push_back(std::move(thread));
        }
        finished_.clear();
    }

    for (auto& thread : threads) {
        thread.join();
    }
}

void Gateway::set_ready_workers(int count) {
    ready_workers_ = count;
}

void Gateway::set_idle_timeout(std::chrono::milliseconds timeout) {
    idle_timeout_ms_ = timeout.count();
}

GatewayStats Gateway::stats() const {
    GatewayStats stats;
    stats.accepted = accepted_.load();
    stats.completed = completed_.load();
    stats.upstream_unavailable = upstream_unavailable_.load();
    stats.timeouts = timeouts_.load();
    stats.client_errors = client_errors_.load();
    return stats;
}

size_t Gateway::active_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void Gateway::accept_loop() {
    while (accepting_) {
        pollfd fds[2] = {{listen_fd_, POLLIN, 0}, {wake_read_fd_, POLLIN, 0}};
        int ret = poll(fds, 2, 1000);

        reap_finished();

        if (!accepting_) {
            break;
        }
        if (ret < 0) {
            if (errno != EINTR) {
                std::cerr << "[Gateway] event=poll_error error=\"" << strerror(errno) << "\""
                          << std::endl;
            }
            continue;
        }
        if (!(fds[0].revents & POLLIN)) {
            continue;
        }

        sockaddr_storage addr{};
        socklen_t len = sizeof(addr);
        int fd = accept4(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len,
                         SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            int err = errno;
            if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR || err == ECONNABORTED) {
                continue;
            }
            std::cerr << "[Gateway] event=accept_error error=\"" << strerror(err) << "\""
                      << std::endl;
            if (err == EMFILE || err == ENFILE) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            continue;
        }

        int one = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        accepted_++;

        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t id = next_connection_id_++;
        auto& entry = connections_[id];
        entry.client_fd = fd;
        entry.thread = std::thread(&Gateway::handle_connection, this, id, fd, format_peer(addr));
    }
}

void Gateway::handle_connection(uint64_t id, int client_fd, std::string peer) {
    RelayOptions relay_options;
    relay_options.idle_timeout = std::chrono::milliseconds(idle_timeout_ms_.load());
    relay_options.buffer_size = options_.buffer_size;

    if (ready_workers_.load() == 0) {
        upstream_unavailable_++;
        std::cerr << "[Gateway] event=upstream_unavailable conn=" << id << " peer=" << peer
                  << " reason=\"no ready workers\"" << std::endl;
        send_error_response(client_fd, 502, "Bad Gateway", "upstream unavailable\n");
        finish_connection(id);
        return;
    }

    try {
        BackendConnection backend(options_.backend_path);
        set_backend_fd(id, backend.fd());

        RelayResult result = relay_connection(client_fd, backend.fd(), relay_options);

        set_backend_fd(id, -1);
        backend.close();

        switch (result.outcome) {
        case RelayOutcome::Completed:
            completed_++;
            break;

        case RelayOutcome::UpstreamFailed:
            upstream_unavailable_++;
            std::cerr << "[Gateway] event=upstream_unavailable conn=" << id << " peer=" << peer
                      << " reason=\"backend closed before responding"
                      << (result.error != 0 ? std::string(": ") + strerror(result.error) : "")
                      << "\" bytes_in=" << result.bytes_to_backend << std::endl;
            send_error_response(client_fd, 502, "Bad Gateway", "upstream unavailable\n");
            break;

        case RelayOutcome::UpstreamReset:
            upstream_unavailable_++;
            std::cerr << "[Gateway] event=upstream_reset conn=" << id << " peer=" << peer
                      << " error=\"" << strerror(result.error) << "\""
                      << " bytes_out=" << result.bytes_to_client << std::endl;
            break;

        case RelayOutcome::IdleTimeout:
            timeouts_++;
            std::cerr << "[Gateway] event=idle_timeout conn=" << id << " peer=" << peer
                      << " timeout_ms=" << relay_options.idle_timeout.count()
                      << " bytes_in=" << result.bytes_to_backend
                      << " bytes_out=" << result.bytes_to_client << std::endl;
            if (result.bytes_to_client == 0) {
                send_error_response(client_fd, 504, "Gateway Timeout", "upstream timed out\n");
            }
            break;

        case RelayOutcome::ClientError:
            client_errors_++;
            std::cerr << "[Gateway] event=client_error conn=" << id << " peer=" << peer
                      << " error=\"" << strerror(result.error) << "\"" << std::endl;
            break;

        case RelayOutcome::ClientClosed:
            client_errors_++;
            std::cout << "[Gateway] event=client_closed conn=" << id << " peer=" << peer
                      << " bytes_in=" << result.bytes_to_backend << std::endl;
            break;
        }
    } catch (const EndpointError& e) {
        upstream_unavailable_++;
        std::cerr << "[Gateway] event=upstream_unavailable conn=" << id << " peer=" << peer
                  << " reason=\"" << e.what() << "\"" << std::endl;
        send_error_response(client_fd, 502, "Bad Gateway", "upstream unavailable\n");
    }

    finish_connection(id);
}

void Gateway::set_backend_fd(uint64_t id, int fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return;
    }
    it->second.backend_fd = fd;
    // stop() 已经执行过：新连接的后端也要立即关闭
    if (fd >= 0 && stopping_) {
        shutdown(fd, SHUT_RDWR);
    }
}

void Gateway::finish_connection(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return;
    }
    if (it->second.client_fd >= 0) {
        close(it->second.client_fd);
    }
    if (it->second.thread.joinable()) {
        finished_.push_back(std::move(it->second.thread));
    }
    connections_.erase(it);
    drained_cv_.notify_all();
}

void Gateway::reap_finished() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threads.swap(finished_);
    }
    for (auto& thread : threads) {
        thread.join();
    }
}

} // namespace sockgate
