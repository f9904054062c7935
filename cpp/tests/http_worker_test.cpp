#include "http_worker.hpp"
#include "socket_endpoint.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <cstring>
#include <thread>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace sockgate;
using namespace std::chrono_literals;

TEST(ParseRequestHead, RequestLineAndHeaders)
{
    HttpRequestHead head;
    ASSERT_TRUE(parse_request_head("POST /upload?x=1 HTTP/1.1\r\n"
                                   "Host: example.com\r\n"
                                   "Content-Length:  42 \r\n"
                                   "X-Custom-Header: Value", head));
    EXPECT_EQ(head.method, "POST");
    EXPECT_EQ(head.target, "/upload?x=1");
    EXPECT_EQ(head.version, "HTTP/1.1");
    EXPECT_EQ(head.headers.at("host"), "example.com");
    EXPECT_EQ(head.headers.at("x-custom-header"), "Value");
    EXPECT_EQ(head.content_length(), 42);
}

TEST(ParseRequestHead, Malformed)
{
    HttpRequestHead head;
    EXPECT_FALSE(parse_request_head("", head));
    EXPECT_FALSE(parse_request_head("GET /\r\n", head));
    EXPECT_FALSE(parse_request_head("GET / FTP/1.0\r\n", head));
    EXPECT_FALSE(parse_request_head("GET / HTTP/1.1\r\nno colon here", head));
    EXPECT_FALSE(parse_request_head("GET / HTTP/1.1\r\n: empty name", head));
}

TEST(ParseRequestHead, ContentLength)
{
    HttpRequestHead head;
    ASSERT_TRUE(parse_request_head("GET / HTTP/1.0", head));
    EXPECT_EQ(head.content_length(), 0);

    head.headers["content-length"] = "abc";
    EXPECT_EQ(head.content_length(), -1);
    head.headers["content-length"] = "-5";
    EXPECT_EQ(head.content_length(), -1);
    head.headers["content-length"] = "0";
    EXPECT_EQ(head.content_length(), 0);
}

namespace {

class HttpWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        socket_path_ = "/tmp/sockgate_worker_test_" + std::to_string(getpid()) + ".sock";
        unlink(socket_path_.c_str());
        endpoint_ = SocketEndpoint::create(socket_path_, 0660, 16);

        HttpWorkerOptions options;
        options.listen_fd = dup(endpoint_.fd());
        options.worker_id = 7;
        options.drain_timeout = 2s;
        thread_ = std::thread([this, options] {
            HttpWorker worker(options);
            worker.run(stop_);
        });
    }

    void TearDown() override {
        stop_ = true;
        thread_.join();
    }

    std::string exchange(const std::string& request) {
        int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        EXPECT_GE(fd, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);
        EXPECT_EQ(connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);

        size_t sent = 0;
        while (sent < request.size()) {
            ssize_t n = send(fd, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                break;
            }
            sent += static_cast<size_t>(n);
        }
        shutdown(fd, SHUT_WR);

        std::string response;
        char buf[4096];
        for (;;) {
            pollfd pfd{fd, POLLIN, 0};
            if (poll(&pfd, 1, 5000) <= 0) {
                break;
            }
            ssize_t n = recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) {
                break;
            }
            response.append(buf, static_cast<size_t>(n));
        }
        close(fd);
        return response;
    }

    std::string socket_path_;
    SocketEndpoint endpoint_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

} // anonymous namespace

TEST_F(HttpWorkerTest, Health)
{
    std::string response = exchange("GET /health HTTP/1.1\r\nHost: x\r\n\r\n");
    EXPECT_EQ(response.compare(0, 15, "HTTP/1.1 200 OK"), 0) << response;
    EXPECT_NE(response.find("\r\n\r\nok\n"), std::string::npos) << response;
}

TEST_F(HttpWorkerTest, DescribesRequest)
{
    std::string response = exchange("DELETE /items/3 HTTP/1.1\r\n\r\n");
    EXPECT_NE(response.find("sockgate-worker 7 pid "), std::string::npos) << response;
    EXPECT_NE(response.find("DELETE /items/3 HTTP/1.1\n"), std::string::npos) << response;
}

TEST_F(HttpWorkerTest, EchoesBody)
{
    std::string response = exchange("PUT /data HTTP/1.1\r\nContent-Length: 11\r\n\r\nhello world");
    EXPECT_NE(response.find("Content-Length: 11\r\n"), std::string::npos) << response;
    EXPECT_NE(response.find("\r\n\r\nhello world"), std::string::npos) << response;
}

TEST_F(HttpWorkerTest, ErrorResponses)
{
    EXPECT_EQ(exchange("NONSENSE\r\n\r\n").compare(0, 12, "HTTP/1.1 400"), 0);
    EXPECT_EQ(exchange("GET / HTTP/1.1\r\nHost").compare(0, 12, "HTTP/1.1 400"), 0);
    EXPECT_EQ(exchange("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n")
                  .compare(0, 12, "HTTP/1.1 411"), 0);
    EXPECT_EQ(exchange("GET / HTTP/1.1\r\nX-Big: " + std::string(70000, 'a') + "\r\n\r\n")
                  .compare(0, 12, "HTTP/1.1 431"), 0);
}

TEST(HttpWorkerOptions, RequiresListenFd)
{
    unsetenv("SOCKGATE_LISTEN_FD");
    EXPECT_THROW(HttpWorker::options_from_environment(), std::runtime_error);

    setenv("SOCKGATE_LISTEN_FD", "not-a-number", 1);
    EXPECT_THROW(HttpWorker::options_from_environment(), std::runtime_error);

    setenv("SOCKGATE_LISTEN_FD", "987", 1);
    EXPECT_THROW(HttpWorker::options_from_environment(), std::runtime_error);
    unsetenv("SOCKGATE_LISTEN_FD");
}
