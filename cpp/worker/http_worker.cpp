#include "http_worker.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace sockgate {

namespace {

constexpr size_t kMaxHeadSize = 64 * 1024;
constexpr size_t kChunkSize = 16 * 1024;
constexpr int kAcceptPollMs = 200;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

int env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("invalid value for ") + name + ": " + value);
    }
}

void set_timeout(int fd, int option, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv));
}

bool send_all(int fd, const char* data, size_t size) {
    size_t sent = 0;
    while (sent < size) {
        ssize_t n = send(fd, data + sent, size - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool send_response(int fd, int status, const char* reason, const std::string& content_type,
                   const std::string& body) {
    std::string response = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
                           "Content-Type: " + content_type + "\r\n"
                           "Content-Length: " + std::to_string(body.size()) + "\r\n"
                           "Connection: close\r\n"
                           "\r\n" + body;
    return send_all(fd, response.data(), response.size());
}

} // anonymous namespace

// ============================================================================
// HTTP parsing
// ============================================================================

long long HttpRequestHead::content_length() const {
    auto it = headers.find("content-length");
    if (it == headers.end()) {
        return 0;
    }
    const std::string& value = it->second;
    if (value.empty() || value.size() > 18 ||
        value.find_first_not_of("0123456789") != std::string::npos) {
        return -1;
    }
    return std::stoll(value);
}

bool parse_request_head(const std::string& text, HttpRequestHead& head) {
    std::istringstream in(text);
    std::string line;

    if (!std::getline(in, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::istringstream request_line(line);
    if (!(request_line >> head.method >> head.target >> head.version)) {
        return false;
    }
    if (head.version.compare(0, 5, "HTTP/") != 0) {
        return false;
    }

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return false;
        }
        head.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

// ============================================================================
// HttpWorker Implementation
// ============================================================================

HttpWorker::HttpWorker(HttpWorkerOptions options)
    : options_(std::move(options)) {}

HttpWorker::~HttpWorker() {
    drain();
    if (options_.ready_fd >= 0) {
        close(options_.ready_fd);
    }
}

HttpWorkerOptions HttpWorker::options_from_environment() {
    HttpWorkerOptions options;
    options.listen_fd = env_int("SOCKGATE_LISTEN_FD", -1);
    options.ready_fd = env_int("SOCKGATE_READY_FD", -1);
    options.worker_id = env_int("SOCKGATE_WORKER_ID", 0);

    if (options.listen_fd < 0) {
        throw std::runtime_error("SOCKGATE_LISTEN_FD is not set; sockgate-worker must be "
                                 "started by sockgated");
    }
    if (fcntl(options.listen_fd, F_GETFD) < 0) {
        throw std::runtime_error("SOCKGATE_LISTEN_FD=" + std::to_string(options.listen_fd) +
                                 " is not an open descriptor");
    }
    return options;
}

void HttpWorker::notify_ready() {
    if (options_.ready_fd < 0) {
        return;
    }
    char c = 'R';
    if (write(options_.ready_fd, &c, 1) != 1) {
        std::cerr << "[Worker " << options_.worker_id << "] event=ready_notify_failed error=\""
                  << strerror(errno) << "\"" << std::endl;
    }
    close(options_.ready_fd);
    options_.ready_fd = -1;
}

void HttpWorker::run(const std::atomic<bool>& stop_flag) {
    int flags = fcntl(options_.listen_fd, F_GETFL);
    if (flags < 0 || fcntl(options_.listen_fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw std::runtime_error("Failed to configure listen socket: " +
                                 std::string(strerror(errno)));
    }

    std::cout << "[Worker " << options_.worker_id << "] event=accepting pid=" << getpid()
              << std::endl;

    while (!stop_flag.load()) {
        pollfd pfd{options_.listen_fd, POLLIN, 0};
        int ret = poll(&pfd, 1, kAcceptPollMs);

        reap_finished();

        if (ret <= 0 || stop_flag.load()) {
            continue;
        }

        // 所有 Worker 共享同一个监听 socket，没抢到连接时返回 EAGAIN
        int fd = accept4(options_.listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR &&
                errno != ECONNABORTED) {
                std::cerr << "[Worker " << options_.worker_id << "] event=accept_error error=\""
                          << strerror(errno) << "\"" << std::endl;
            }
            continue;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t id = next_id_++;
        auto& entry = connections_[id];
        entry.second = fd;
        entry.first = std::thread(&HttpWorker::handle_connection, this, id, fd);
    }

    close(options_.listen_fd);
    options_.listen_fd = -1;

    std::cout << "[Worker " << options_.worker_id << "] event=draining" << std::endl;
    drain();
    std::cout << "[Worker " << options_.worker_id << "] event=stopped served=" << served()
              << std::endl;
}

void HttpWorker::handle_connection(uint64_t id, int fd) {
    set_timeout(fd, SO_RCVTIMEO, options_.io_timeout);
    set_timeout(fd, SO_SNDTIMEO, options_.io_timeout);

    std::string buffer;
    char chunk[kChunkSize];
    size_t head_end;

    while ((head_end = buffer.find("\r\n\r\n")) == std::string::npos) {
        if (buffer.size() > kMaxHeadSize) {
            send_response(fd, 431, "Request Header Fields Too Large", "text/plain",
                          "request head too large\n");
            finish_connection(id);
            return;
        }
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            if (!buffer.empty()) {
                send_response(fd, 400, "Bad Request", "text/plain", "incomplete request\n");
            }
            finish_connection(id);
            return;
        }
        buffer.append(chunk, static_cast<size_t>(n));
    }

    HttpRequestHead head;
    if (!parse_request_head(buffer.substr(0, head_end), head)) {
        send_response(fd, 400, "Bad Request", "text/plain", "malformed request\n");
        finish_connection(id);
        return;
    }

    long long length = head.content_length();
    if (length < 0) {
        send_response(fd, 400, "Bad Request", "text/plain", "invalid Content-Length\n");
        finish_connection(id);
        return;
    }
    if (head.headers.count("transfer-encoding") > 0) {
        send_response(fd, 411, "Length Required", "text/plain", "Content-Length required\n");
        finish_connection(id);
        return;
    }

    std::string body_start = buffer.substr(head_end + 4);

    if (head.method == "GET" && head.target == "/health") {
        send_response(fd, 200, "OK", "text/plain", "ok\n");
    } else if (length > 0) {
        // 回显：边读边写，不缓存整个请求体
        std::string response_head = "HTTP/1.1 200 OK\r\n"
                                    "Content-Type: application/octet-stream\r\n"
                                    "Content-Length: " + std::to_string(length) + "\r\n"
                                    "Connection: close\r\n"
                                    "\r\n";
        bool ok = send_all(fd, response_head.data(), response_head.size());

        size_t first = std::min(body_start.size(), static_cast<size_t>(length));
        ok = ok && send_all(fd, body_start.data(), first);
        long long remaining = length - static_cast<long long>(first);

        while (ok && remaining > 0) {
            size_t want = std::min(sizeof(chunk), static_cast<size_t>(remaining));
            ssize_t n = recv(fd, chunk, want, 0);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                ok = false;
                break;
            }
            ok = send_all(fd, chunk, static_cast<size_t>(n));
            remaining -= n;
        }

        if (!ok) {
            std::cerr << "[Worker " << options_.worker_id << "] event=echo_aborted remaining="
                      << remaining << std::endl;
        }
    } else {
        std::ostringstream body;
        body << "sockgate-worker " << options_.worker_id << " pid " << getpid() << "\n"
             << head.method << " " << head.target << " " << head.version << "\n";
        send_response(fd, 200, "OK", "text/plain", body.str());
    }
    served_++;

    // 响应写完后半关闭，等对端关闭再释放连接
    shutdown(fd, SHUT_WR);
    set_timeout(fd, SO_RCVTIMEO, std::chrono::milliseconds(1000));
    while (recv(fd, chunk, sizeof(chunk), 0) > 0) {
    }

    finish_connection(id);
}

void HttpWorker::finish_connection(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return;
    }
    close(it->second.second);
    if (it->second.first.joinable()) {
        finished_.push_back(std::move(it->second.first));
    }
    connections_.erase(it);
}

void HttpWorker::reap_finished() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threads.swap(finished_);
    }
    for (auto& thread : threads) {
        thread.join();
    }
}

void HttpWorker::drain() {
    auto deadline = std::chrono::steady_clock::now() + options_.drain_timeout;
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (connections_.empty()) {
                break;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : connections_) {
            shutdown(entry.second, SHUT_RDWR);
            if (entry.first.joinable()) {
                threads.push_back(std::move(entry.first));
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

} // namespace sockgate
