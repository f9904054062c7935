#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

// Forward declarations for gRPC types
namespace grpc {
class Server;
}

namespace sockgate {

class Supervisor;
class ControlServiceImpl;

/**
 * ControlServer - sockgate.control.GatewayControl gRPC 服务
 *
 * 对外提供 status / reload / stop，把请求转交给 Supervisor。
 * 地址为 gRPC 格式，例如 "unix:///tmp/sockgate-control.sock" 或 "127.0.0.1:9090"。
 */
class ControlServer {
public:
    ControlServer(Supervisor* supervisor, std::string address);
    ~ControlServer();

    // 禁止拷贝
    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    /**
     * 启动 gRPC 服务器（后台线程）
     * @throws std::runtime_error 无法监听
     */
    void start();

    /**
     * 停止服务器并等待线程结束
     */
    void shutdown();

    bool is_running() const { return running_.load(); }

    const std::string& address() const { return address_; }

private:
    Supervisor* supervisor_;
    std::string address_;

    std::unique_ptr<ControlServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
};

} // namespace sockgate
