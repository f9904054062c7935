#include "control_service.hpp"
#include "supervisor.hpp"

#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>

#include "gateway_control.grpc.pb.h"

#include <csignal>
#include <fstream>
#include <functional>
#include <future>
#include <thread>
#include <unistd.h>

using namespace sockgate;
using namespace std::chrono_literals;

namespace {

bool wait_for(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(20ms);
    }
    return predicate();
}

class ControlServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string suffix = std::to_string(getpid());
        socket_path_ = "/tmp/sockgate_control_test_" + suffix + ".sock";
        config_path_ = "/tmp/sockgate_control_test_" + suffix + ".conf";
        control_path_ = "/tmp/sockgate_control_test_" + suffix + ".ctl";
        unlink(socket_path_.c_str());
        unlink(control_path_.c_str());
        write_config(2);

        supervisor_ = std::make_unique<Supervisor>(make_source());
        supervisor_->start();

        control_ = std::make_unique<ControlServer>(supervisor_.get(), "unix://" + control_path_);
        control_->start();

        stub_ = control::GatewayControl::NewStub(
            grpc::CreateChannel("unix://" + control_path_, grpc::InsecureChannelCredentials()));
    }

    void TearDown() override {
        if (control_) {
            control_->shutdown();
        }
        if (supervisor_) {
            supervisor_->stop();
        }
        unlink(config_path_.c_str());
        unlink(control_path_.c_str());
        unlink(socket_path_.c_str());
    }

    void write_config(int pool_size, const std::string& extra = "") {
        std::ofstream out(config_path_);
        out << "listen_address = 127.0.0.1:0\n"
            << "socket_path = " << socket_path_ << "\n"
            << "pool_size = " << pool_size << "\n"
            << "worker_command = " << SOCKGATE_WORKER_PATH << "\n"
            << "backoff_schedule = 100ms\n"
            << "ready_timeout = 5s\n"
            << "stop_grace_period = 3s\n"
            << "reload_grace_period = 3s\n"
            << "control_address =\n"
            << extra;
    }

    ConfigSource make_source() const {
        ConfigSource source;
        source.file = config_path_;
        source.env = [](const char*) -> const char* { return nullptr; };
        return source;
    }

    control::StatusResponse get_status() {
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + 5s);
        control::StatusRequest request;
        control::StatusResponse response;
        grpc::Status status = stub_->GetStatus(&context, request, &response);
        EXPECT_TRUE(status.ok()) << status.error_message();
        return response;
    }

    std::string socket_path_;
    std::string config_path_;
    std::string control_path_;
    std::unique_ptr<Supervisor> supervisor_;
    std::unique_ptr<ControlServer> control_;
    std::unique_ptr<control::GatewayControl::Stub> stub_;
};

} // anonymous namespace

TEST_F(ControlServiceTest, GetStatusReportsPool)
{
    EXPECT_TRUE(control_->is_running());
    ASSERT_TRUE(wait_for([&] { return get_status().ready() == 2; }, 5s));

    auto status = get_status();
    EXPECT_EQ(status.state(), "running");
    EXPECT_EQ(status.pool_size(), 2u);
    EXPECT_EQ(status.crashed(), 0);
    EXPECT_FALSE(status.degraded());
    EXPECT_EQ(status.socket_path(), socket_path_);
    EXPECT_EQ(status.gateway_port(), supervisor_->status().gateway_port);
    EXPECT_GT(status.started_at_ms(), 0);

    ASSERT_EQ(status.workers_size(), 2);
    for (const auto& worker : status.workers()) {
        EXPECT_GT(worker.pid(), 0);
        EXPECT_EQ(worker.state(), "Ready");
        EXPECT_EQ(worker.restart_count(), 0);
        EXPECT_GT(worker.last_start_time_ms(), 0);
        EXPECT_FALSE(worker.has_last_restart_time_ms());
        EXPECT_FALSE(worker.has_last_exit_code());
    }
}

TEST_F(ControlServiceTest, GetStatusReportsRestart)
{
    ASSERT_TRUE(wait_for([&] { return get_status().ready() == 2; }, 5s));

    auto killed = get_status().workers(0);
    ASSERT_EQ(kill(killed.pid(), SIGKILL), 0);

    ASSERT_TRUE(wait_for([&] {
        auto status = get_status();
        for (const auto& worker : status.workers()) {
            if (worker.id() == killed.id() && worker.state() == "Ready" &&
                worker.restart_count() == 1) {
                return status.ready() == 2;
            }
        }
        return false;
    }, 5s));

    for (const auto& worker : get_status().workers()) {
        if (worker.id() != killed.id()) {
            continue;
        }
        EXPECT_NE(worker.pid(), killed.pid());
        ASSERT_TRUE(worker.has_last_exit_code());
        EXPECT_EQ(worker.last_exit_code(), 128 + SIGKILL);
        ASSERT_TRUE(worker.has_last_restart_time_ms());
        EXPECT_GE(worker.last_restart_time_ms(), killed.last_start_time_ms());
    }
}

TEST_F(ControlServiceTest, Reload)
{
    ASSERT_TRUE(wait_for([&] { return get_status().ready() == 2; }, 5s));

    write_config(3);
    {
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + 30s);
        control::ReloadResponse response;
        ASSERT_TRUE(stub_->Reload(&context, control::ReloadRequest(), &response).ok());
        EXPECT_TRUE(response.success()) << response.message();
    }
    EXPECT_EQ(get_status().reload_count(), 1u);
    EXPECT_EQ(get_status().pool_size(), 3u);

    // 配置无效：返回失败，状态不变
    write_config(3, "pool_size = zero\n");
    {
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + 30s);
        control::ReloadResponse response;
        ASSERT_TRUE(stub_->Reload(&context, control::ReloadRequest(), &response).ok());
        EXPECT_FALSE(response.success());
        EXPECT_FALSE(response.message().empty());
    }
    auto status = get_status();
    EXPECT_EQ(status.reload_count(), 1u);
    EXPECT_EQ(status.state(), "running");
}

TEST_F(ControlServiceTest, Stop)
{
    auto result = std::async(std::launch::async, [&] { return supervisor_->run(); });

    {
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + 5s);
        control::StopResponse response;
        EXPECT_TRUE(stub_->Stop(&context, control::StopRequest(), &response).ok());
        EXPECT_TRUE(response.accepted());
    }

    ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(result.get(), 0);
    EXPECT_EQ(get_status().state(), "stopped");

    // 已经停止：不再接受
    {
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + 5s);
        control::StopResponse response;
        ASSERT_TRUE(stub_->Stop(&context, control::StopRequest(), &response).ok());
        EXPECT_FALSE(response.accepted());
    }
}
