/**
 * ctl_main.cpp - sockgatectl 控制客户端
 *
 * 用法：
 *   sockgatectl [--address ADDR] [--timeout SECONDS] status|reload|stop
 */

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <grpcpp/grpcpp.h>
#include "gateway_control.grpc.pb.h"

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS] COMMAND\n"
              << "\n"
              << "Commands:\n"
              << "  status                  Show pool and gateway status\n"
              << "  reload                  Reload configuration (rolling worker restart)\n"
              << "  stop                    Stop the supervisor\n"
              << "\n"
              << "Options:\n"
              << "  --address ADDR          control address (default: unix:///tmp/sockgate-control.sock)\n"
              << "  --timeout SECONDS       RPC deadline (default: 120)\n"
              << "  --help                  Show this help message\n"
              << std::endl;
}

std::string format_time(int64_t unix_ms) {
    if (unix_ms <= 0) {
        return "-";
    }
    std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
    std::tm tm{};
    localtime_r(&seconds, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

int print_status(const sockgate::control::StatusResponse& status) {
    std::cout << "state:        " << status.state() << (status.degraded() ? " (degraded)" : "")
              << "\n"
              << "listen:       " << status.listen_address() << " (port "
              << status.gateway_port() << ")\n"
              << "socket:       " << status.socket_path() << "\n"
              << "started:      " << format_time(status.started_at_ms()) << "\n"
              << "reloads:      " << status.reload_count() << "\n"
              << "pool size:    " << status.pool_size() << "\n"
              << "ready:        " << status.ready() << "\n"
              << "starting:     " << status.starting() << "\n"
              << "crashed:      " << status.crashed() << "\n"
              << "stopping:     " << status.stopping() << "\n";

    const auto& gateway = status.gateway();
    std::cout << "connections:  accepted=" << gateway.accepted()
              << " completed=" << gateway.completed()
              << " upstream_unavailable=" << gateway.upstream_unavailable()
              << " timeouts=" << gateway.timeouts()
              << " client_errors=" << gateway.client_errors()
              << " active=" << gateway.active_connections() << "\n\n";

    std::cout << std::left << std::setw(5) << "ID" << std::setw(8) << "PID"
              << std::setw(10) << "STATE" << std::setw(10) << "RESTARTS"
              << std::setw(6) << "EXIT" << std::setw(21) << "STARTED"
              << "LAST RESTART\n";
    for (const auto& worker : status.workers()) {
        std::cout << std::left << std::setw(5) << worker.id() << std::setw(8) << worker.pid()
                  << std::setw(10) << worker.state() << std::setw(10) << worker.restart_count()
                  << std::setw(6)
                  << (worker.has_last_exit_code() ? std::to_string(worker.last_exit_code()) : "-")
                  << std::setw(21) << format_time(worker.last_start_time_ms())
                  << (worker.has_last_restart_time_ms()
                          ? format_time(worker.last_restart_time_ms())
                          : "-")
                  << "\n";
    }
    std::cout << std::flush;

    return status.degraded() ? 2 : 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string address = "unix:///tmp/sockgate-control.sock";
    int timeout_seconds = 120;
    std::string command;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--address" && i + 1 < argc) {
            address = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            try {
                timeout_seconds = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "[sockgatectl] Invalid timeout: " << argv[i] << std::endl;
                return 1;
            }
        } else if (command.empty() && !arg.empty() && arg[0] != '-') {
            command = arg;
        } else {
            std::cerr << "[sockgatectl] Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
    auto stub = sockgate::control::GatewayControl::NewStub(channel);

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(timeout_seconds));

    grpc::Status rpc_status;

    if (command == "status") {
        sockgate::control::StatusRequest request;
        sockgate::control::StatusResponse response;
        rpc_status = stub->GetStatus(&context, request, &response);
        if (rpc_status.ok()) {
            return print_status(response);
        }
    } else if (command == "reload") {
        sockgate::control::ReloadRequest request;
        sockgate::control::ReloadResponse response;
        rpc_status = stub->Reload(&context, request, &response);
        if (rpc_status.ok()) {
            std::cout << response.message() << std::endl;
            return response.success() ? 0 : 1;
        }
    } else if (command == "stop") {
        sockgate::control::StopRequest request;
        sockgate::control::StopResponse response;
        rpc_status = stub->Stop(&context, request, &response);
        if (rpc_status.ok()) {
            std::cout << (response.accepted() ? "stopping" : "not running") << std::endl;
            return response.accepted() ? 0 : 1;
        }
    } else {
        std::cerr << "[sockgatectl] Unknown command: " << command << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::cerr << "[sockgatectl] RPC failed (" << address << "): " << rpc_status.error_message()
              << std::endl;
    return 1;
}
