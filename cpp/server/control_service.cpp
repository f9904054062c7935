#include "control_service.hpp"
#include "supervisor.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <grpcpp/grpcpp.h>

#include "gateway_control.grpc.pb.h"

namespace sockgate {

namespace {

int64_t to_unix_ms(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

} // anonymous namespace

// ============================================================================
// GatewayControl gRPC Service Implementation
// ============================================================================

class ControlServiceImpl final : public sockgate::control::GatewayControl::Service {
public:
    explicit ControlServiceImpl(Supervisor* supervisor) : supervisor_(supervisor) {}

    grpc::Status GetStatus(
        grpc::ServerContext* context,
        const sockgate::control::StatusRequest* request,
        sockgate::control::StatusResponse* response) override {

        SupervisorStatus status = supervisor_->status();

        response->set_state(to_string(status.state));
        response->set_pool_size(static_cast<uint32_t>(status.pool.pool_size));
        response->set_ready(status.pool.ready);
        response->set_starting(status.pool.starting);
        response->set_crashed(status.pool.crashed);
        response->set_stopping(status.pool.stopping);
        response->set_degraded(status.pool.degraded);

        for (const auto& worker : status.pool.workers) {
            auto* info = response->add_workers();
            info->set_id(worker.id);
            info->set_generation(worker.generation);
            info->set_pid(static_cast<int32_t>(worker.pid));
            info->set_state(to_string(worker.state));
            info->set_restart_count(worker.restart_count);
            info->set_last_start_time_ms(to_unix_ms(worker.last_start_time));
            if (worker.last_restart_time.has_value()) {
                info->set_last_restart_time_ms(to_unix_ms(*worker.last_restart_time));
            }
            if (worker.last_exit_code.has_value()) {
                info->set_last_exit_code(*worker.last_exit_code);
            }
        }

        response->set_listen_address(status.listen_address);
        response->set_gateway_port(status.gateway_port);
        response->set_socket_path(status.socket_path);

        auto* counters = response->mutable_gateway();
        counters->set_accepted(status.gateway.accepted);
        counters->set_completed(status.gateway.completed);
        counters->set_upstream_unavailable(status.gateway.upstream_unavailable);
        counters->set_timeouts(status.gateway.timeouts);
        counters->set_client_errors(status.gateway.client_errors);
        counters->set_active_connections(status.active_connections);

        response->set_reload_count(status.reload_count);
        response->set_started_at_ms(to_unix_ms(status.started_at));
        return grpc::Status::OK;
    }

    grpc::Status Reload(
        grpc::ServerContext* context,
        const sockgate::control::ReloadRequest* request,
        sockgate::control::ReloadResponse* response) override {

        std::cout << "[ControlService] event=reload_requested peer=" << context->peer()
                  << std::endl;

        bool success = supervisor_->reload();
        response->set_success(success);
        if (success) {
            response->set_message("reload complete");
        } else {
            response->set_message("reload failed, previous workers keep serving (see supervisor log)");
        }
        return grpc::Status::OK;
    }

    grpc::Status Stop(
        grpc::ServerContext* context,
        const sockgate::control::StopRequest* request,
        sockgate::control::StopResponse* response) override {

        std::cout << "[ControlService] event=stop_requested peer=" << context->peer()
                  << std::endl;

        SupervisorState state = supervisor_->state();
        bool accepted = state == SupervisorState::Running ||
                        state == SupervisorState::ReloadingConfig;
        if (accepted) {
            supervisor_->request_stop();
        }
        response->set_accepted(accepted);
        return grpc::Status::OK;
    }

private:
    Supervisor* supervisor_;
};

// ============================================================================
// ControlServer Implementation
// ============================================================================

ControlServer::ControlServer(Supervisor* supervisor, std::string address)
    : supervisor_(supervisor), address_(std::move(address)) {}

ControlServer::~ControlServer() {
    shutdown();
}

void ControlServer::start() {
    if (running_.load()) {
        return;
    }

    service_ = std::make_unique<ControlServiceImpl>(supervisor_);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(address_, grpc::InsecureServerCredentials());
    builder.RegisterService(service_.get());

    server_ = builder.BuildAndStart();
    if (!server_) {
        throw std::runtime_error("Failed to start control server on " + address_);
    }

    running_.store(true);
    server_thread_ = std::thread([this] { server_->Wait(); });

    std::cout << "[ControlServer] event=listening address=" << address_ << std::endl;
}

void ControlServer::shutdown() {
    if (running_.exchange(false)) {
        std::cout << "[ControlServer] event=stopping" << std::endl;
        server_->Shutdown();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

} // namespace sockgate
