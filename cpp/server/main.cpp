/**
 * main.cpp - sockgated 可执行文件入口
 *
 * 用法：
 *   sockgated --config /etc/sockgate.conf
 *   sockgated --listen 0.0.0.0:8080 --workers 4 --worker-command "sockgate-worker"
 *
 * 功能：
 * 1. 创建 Socket Endpoint，启动 Worker 池
 * 2. 启动对外的 HTTP 反向代理
 * 3. 启动 GatewayControl gRPC 控制接口（status / reload / stop）
 * 4. SIGHUP → reload，SIGTERM/SIGINT → 优雅停止
 */

#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <memory>

#include "control_service.hpp"
#include "supervisor.hpp"

namespace {

sockgate::Supervisor* g_supervisor = nullptr;

void signal_handler(int signal) {
    if (g_supervisor == nullptr) {
        return;
    }
    if (signal == SIGHUP) {
        g_supervisor->request_reload();
    } else {
        g_supervisor->request_stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE           key = value configuration file\n"
              << "  --listen ADDR           HTTP listen address (default: 0.0.0.0:80)\n"
              << "  --socket PATH           worker socket path (default: /tmp/sockgate.sock)\n"
              << "  --workers N             number of workers (default: 2)\n"
              << "  --worker-command CMD    worker command line (default: sockgate-worker)\n"
              << "  --control ADDR          control address, empty to disable\n"
              << "                          (default: unix:///tmp/sockgate-control.sock)\n"
              << "  --set KEY=VALUE         set any configuration key (repeatable)\n"
              << "  --help                  Show this help message\n"
              << "\n"
              << "Every key can also be set through SOCKGATE_<KEY> environment variables.\n"
              << "Signals: SIGHUP reloads the configuration, SIGTERM/SIGINT stop.\n"
              << std::endl;
}

} // anonymous namespace

int main(int argc, char** argv) {
    // 解析命令行参数
    sockgate::ConfigSource source;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && has_value) {
            source.file = argv[++i];
        } else if (arg == "--listen" && has_value) {
            source.overrides.emplace_back("listen_address", argv[++i]);
        } else if (arg == "--socket" && has_value) {
            source.overrides.emplace_back("socket_path", argv[++i]);
        } else if (arg == "--workers" && has_value) {
            source.overrides.emplace_back("pool_size", argv[++i]);
        } else if (arg == "--worker-command" && has_value) {
            source.overrides.emplace_back("worker_command", argv[++i]);
        } else if (arg == "--control" && has_value) {
            source.overrides.emplace_back("control_address", argv[++i]);
        } else if (arg == "--set" && has_value) {
            std::string setting = argv[++i];
            auto eq = setting.find('=');
            if (eq == std::string::npos) {
                std::cerr << "[Main] --set expects KEY=VALUE, got: " << setting << std::endl;
                return 1;
            }
            source.overrides.emplace_back(setting.substr(0, eq), setting.substr(eq + 1));
        } else {
            std::cerr << "[Main] Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // 写已关闭的连接时由 send() 返回 EPIPE，而不是杀死进程
    std::signal(SIGPIPE, SIG_IGN);

    try {
        std::cout << "============================================" << std::endl;
        std::cout << "  sockgate v0.1.0" << std::endl;
        std::cout << "============================================" << std::endl;

        sockgate::Supervisor supervisor(source);
        g_supervisor = &supervisor;

        // 设置信号处理
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGHUP, signal_handler);

        supervisor.start();

        sockgate::GatewayConfig config = supervisor.config();
        std::unique_ptr<sockgate::ControlServer> control;
        if (!config.control_address.empty()) {
            control = std::make_unique<sockgate::ControlServer>(&supervisor,
                                                                config.control_address);
            try {
                control->start();
            } catch (const std::exception& e) {
                std::cerr << "[Main] Error: " << e.what() << std::endl;
                supervisor.stop();
                g_supervisor = nullptr;
                return 1;
            }
        }

        std::cout << "[Main] Listening on " << config.listen_address
                  << " (port " << supervisor.status().gateway_port << ")" << std::endl;
        std::cout << "[Main] Workers: " << config.pool_size
                  << ", socket: " << config.socket_path << std::endl;
        std::cout << "[Main] Press Ctrl+C to stop" << std::endl;

        // 运行 Supervisor（阻塞）
        int exit_code = supervisor.run();

        if (control) {
            control->shutdown();
        }
        g_supervisor = nullptr;

        std::cout << "[Main] sockgate stopped, exit code " << exit_code << std::endl;
        return exit_code;

    } catch (const std::exception& e) {
        g_supervisor = nullptr;
        std::cerr << "[Main] Error: " << e.what() << std::endl;
        return 1;
    }
}
