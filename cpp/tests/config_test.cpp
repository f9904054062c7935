#include "gateway_config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <map>
#include <string>
#include <unistd.h>

using namespace sockgate;
using namespace std::chrono_literals;

namespace {

std::string write_temp_file(const std::string& content) {
    char path[] = "/tmp/sockgate_config_XXXXXX";
    int fd = mkstemp(path);
    EXPECT_GE(fd, 0);
    close(fd);
    std::ofstream out(path);
    out << content;
    return path;
}

EnvLookup fake_env(const std::map<std::string, std::string>& values) {
    return [values](const char* name) -> const char* {
        auto it = values.find(name);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

} // anonymous namespace

TEST(ParseDuration, Units)
{
    EXPECT_EQ(parse_duration("250"), 250ms);
    EXPECT_EQ(parse_duration("250ms"), 250ms);
    EXPECT_EQ(parse_duration("5s"), 5000ms);
    EXPECT_EQ(parse_duration(" 2m "), 120000ms);
    EXPECT_EQ(parse_duration("0"), 0ms);
}

TEST(ParseDuration, Invalid)
{
    EXPECT_THROW(parse_duration(""), std::invalid_argument);
    EXPECT_THROW(parse_duration("s"), std::invalid_argument);
    EXPECT_THROW(parse_duration("-5s"), std::invalid_argument);
    EXPECT_THROW(parse_duration("10h"), std::invalid_argument);
}

TEST(GatewayConfig, Defaults)
{
    GatewayConfig config;
    EXPECT_EQ(config.listen_address, "0.0.0.0:80");
    EXPECT_EQ(config.socket_path, "/tmp/sockgate.sock");
    EXPECT_EQ(config.socket_mode, 0660u);
    EXPECT_EQ(config.restart_policy.mode, RestartPolicy::Mode::Always);
    EXPECT_FALSE(config.restart_policy.max_restarts_per_window.has_value());
    EXPECT_NO_THROW(validate(config));
}

TEST(GatewayConfig, ApplySetting)
{
    GatewayConfig config;
    apply_setting(config, "pool_size", "4");
    apply_setting(config, "socket_mode", "0600");
    apply_setting(config, "restart_policy", "on-failure");
    apply_setting(config, "backoff_schedule", "50ms, 1s ,2s");
    apply_setting(config, "max_restarts_per_window", "3");
    apply_setting(config, "restart_window", "30s");
    apply_setting(config, "worker_command", "  /usr/bin/app   --port 1 ");
    apply_setting(config, "worker_env.MODE", "test");
    apply_setting(config, "ready_notify", "no");
    apply_setting(config, "idle_timeout", "1500");

    EXPECT_EQ(config.pool_size, 4);
    EXPECT_EQ(config.socket_mode, 0600u);
    EXPECT_EQ(config.restart_policy.mode, RestartPolicy::Mode::OnFailure);
    ASSERT_EQ(config.restart_policy.backoff_schedule.size(), 3u);
    EXPECT_EQ(config.restart_policy.backoff_schedule[0], 50ms);
    EXPECT_EQ(config.restart_policy.backoff_schedule[1], 1000ms);
    EXPECT_EQ(config.restart_policy.backoff_schedule[2], 2000ms);
    EXPECT_EQ(config.restart_policy.max_restarts_per_window.value_or(-1), 3);
    EXPECT_EQ(config.restart_policy.restart_window, 30000ms);
    EXPECT_EQ(config.worker_command,
              (std::vector<std::string>{"/usr/bin/app", "--port", "1"}));
    EXPECT_EQ(config.worker_env.at("MODE"), "test");
    EXPECT_FALSE(config.ready_notify);
    EXPECT_EQ(config.idle_timeout, 1500ms);

    apply_setting(config, "max_restarts_per_window", "none");
    EXPECT_FALSE(config.restart_policy.max_restarts_per_window.has_value());
}

TEST(GatewayConfig, InvalidValuesNameTheKey)
{
    GatewayConfig config;

    try {
        apply_setting(config, "pool_size", "many");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.key(), "pool_size");
        EXPECT_NE(std::string(e.what()).find("pool_size"), std::string::npos);
    }

    EXPECT_THROW(apply_setting(config, "pool_size", "0"), ConfigError);
    EXPECT_THROW(apply_setting(config, "socket_mode", "0999"), ConfigError);
    EXPECT_THROW(apply_setting(config, "restart_policy", "sometimes"), ConfigError);
    EXPECT_THROW(apply_setting(config, "backoff_schedule", "1s,,2s"), ConfigError);
    EXPECT_THROW(apply_setting(config, "ready_notify", "maybe"), ConfigError);
    EXPECT_THROW(apply_setting(config, "listen_address", "localhost"), ConfigError);
    EXPECT_THROW(apply_setting(config, "no_such_key", "1"), ConfigError);
}

TEST(GatewayConfig, LoadFile)
{
    std::string path = write_temp_file(
        "# sockgate test configuration\n"
        "\n"
        "listen_address = 127.0.0.1:8080\n"
        "socket_path=/tmp/test-sockgate.sock\n"
        "  pool_size = 3  \n"
        "worker_env.GREETING = hello world\n");

    GatewayConfig config;
    load_config_file(config, path);
    unlink(path.c_str());

    EXPECT_EQ(config.listen_address, "127.0.0.1:8080");
    EXPECT_EQ(config.socket_path, "/tmp/test-sockgate.sock");
    EXPECT_EQ(config.pool_size, 3);
    EXPECT_EQ(config.worker_env.at("GREETING"), "hello world");
}

TEST(GatewayConfig, LoadFileReportsLine)
{
    std::string path = write_temp_file("pool_size = 2\npool_size = lots\n");

    GatewayConfig config;
    try {
        load_config_file(config, path);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.key(), "pool_size");
        EXPECT_NE(std::string(e.what()).find(":2:"), std::string::npos);
    }
    unlink(path.c_str());

    EXPECT_THROW(load_config_file(config, "/nonexistent/sockgate.conf"), ConfigError);
}

TEST(GatewayConfig, Environment)
{
    GatewayConfig config;
    apply_environment(config, fake_env({
        {"SOCKGATE_POOL_SIZE", "5"},
        {"SOCKGATE_IDLE_TIMEOUT", "2s"},
        {"SOCKGATE_UNRELATED", "x"},
    }));

    EXPECT_EQ(config.pool_size, 5);
    EXPECT_EQ(config.idle_timeout, 2000ms);

    EXPECT_THROW(apply_environment(config, fake_env({{"SOCKGATE_POOL_SIZE", "-1"}})),
                 ConfigError);
}

TEST(GatewayConfig, SourceLayering)
{
    std::string path = write_temp_file("pool_size = 2\nidle_timeout = 1s\nstop_grace_period = 3s\n");

    ConfigSource source;
    source.file = path;
    source.env = fake_env({{"SOCKGATE_POOL_SIZE", "3"}, {"SOCKGATE_IDLE_TIMEOUT", "4s"}});
    source.overrides.emplace_back("pool_size", "7");

    GatewayConfig config = source.load();
    unlink(path.c_str());

    EXPECT_EQ(config.pool_size, 7);                // 命令行覆盖环境变量
    EXPECT_EQ(config.idle_timeout, 4000ms);        // 环境变量覆盖文件
    EXPECT_EQ(config.stop_grace_period, 3000ms);   // 只有文件设置
}

TEST(GatewayConfig, Validate)
{
    GatewayConfig config;
    config.worker_command.clear();
    EXPECT_THROW(validate(config), ConfigError);

    config = GatewayConfig();
    config.socket_path = std::string(200, 'x');
    EXPECT_THROW(validate(config), ConfigError);

    config = GatewayConfig();
    config.socket_path.clear();
    EXPECT_THROW(validate(config), ConfigError);
}

TEST(GatewayConfig, MakeWorkerSpecs)
{
    GatewayConfig config;
    config.pool_size = 3;
    config.worker_command = {"worker", "--flag"};
    config.worker_directory = "/srv";
    config.worker_env["A"] = "1";

    auto specs = make_worker_specs(config);
    ASSERT_EQ(specs.size(), 3u);
    for (size_t i = 0; i < specs.size(); ++i) {
        EXPECT_EQ(specs[i].id, static_cast<int>(i + 1));
        EXPECT_EQ(specs[i].command, config.worker_command);
        EXPECT_EQ(specs[i].working_directory, "/srv");
        EXPECT_EQ(specs[i].environment.at("A"), "1");
    }
}

TEST(RestartPolicy, DelayFor)
{
    RestartPolicy policy;
    policy.backoff_schedule = {100ms, 1000ms, 5000ms};

    EXPECT_EQ(policy.delay_for(0), 100ms);
    EXPECT_EQ(policy.delay_for(1), 1000ms);
    EXPECT_EQ(policy.delay_for(2), 5000ms);
    EXPECT_EQ(policy.delay_for(10), 5000ms);

    policy.backoff_schedule.clear();
    EXPECT_EQ(policy.delay_for(3), 0ms);
}

TEST(RestartPolicy, ParseMode)
{
    EXPECT_EQ(parse_restart_mode("Always"), RestartPolicy::Mode::Always);
    EXPECT_EQ(parse_restart_mode("on_failure"), RestartPolicy::Mode::OnFailure);
    EXPECT_EQ(parse_restart_mode("never"), RestartPolicy::Mode::Never);
    EXPECT_THROW(parse_restart_mode("sometimes"), std::invalid_argument);
}
