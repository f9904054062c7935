#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

#include "worker_types.hpp"

namespace sockgate {

/**
 * ConfigError - 配置项无效（错误信息带上配置项名称）
 */
class ConfigError : public std::runtime_error {
public:
    ConfigError(const std::string& key, const std::string& message)
        : std::runtime_error(key.empty() ? message : key + ": " + message),
          key_(key), message_(message) {}

    const std::string& key() const { return key_; }
    const std::string& message() const { return message_; }

private:
    std::string key_;
    std::string message_;
};

/**
 * GatewayConfig - sockgated 的全部配置
 *
 * 来源优先级（后者覆盖前者）：默认值 → 配置文件 → SOCKGATE_<KEY> 环境变量 → 命令行
 */
struct GatewayConfig {
    std::string listen_address = "0.0.0.0:80";
    std::string socket_path = "/tmp/sockgate.sock";
    mode_t socket_mode = 0660;
    std::string socket_group;
    int socket_backlog = 128;

    int pool_size = 2;
    std::vector<std::string> worker_command{"sockgate-worker"};
    std::string worker_directory;
    std::map<std::string, std::string> worker_env;

    RestartPolicy restart_policy;
    std::chrono::milliseconds stability_window{std::chrono::seconds(30)};
    std::chrono::milliseconds ready_timeout{std::chrono::seconds(10)};
    bool ready_notify = true;

    std::chrono::milliseconds idle_timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds reload_grace_period{std::chrono::seconds(10)};
    std::chrono::milliseconds stop_grace_period{std::chrono::seconds(10)};

    std::string control_address = "unix:///tmp/sockgate-control.sock";  // 空 = 不启动
};

/**
 * 所有可识别的配置项名称（不含 worker_env.* 前缀项）
 */
const std::vector<std::string>& config_keys();

/**
 * 设置单个配置项
 * @throws ConfigError 未知的配置项或无效的值
 */
void apply_setting(GatewayConfig& config, const std::string& key, const std::string& value);

/**
 * 读取 key = value 格式的配置文件（# 开头为注释）
 * @throws ConfigError 文件无法打开或某一行无效（信息包含行号）
 */
void load_config_file(GatewayConfig& config, const std::string& path);

using EnvLookup = std::function<const char*(const char*)>;

/**
 * 应用 SOCKGATE_<KEY> 环境变量（KEY 为大写的配置项名称）
 * @param lookup 环境变量查找函数，默认为 ::getenv
 */
void apply_environment(GatewayConfig& config, const EnvLookup& lookup = EnvLookup());

/**
 * 检查配置之间的一致性
 * @throws ConfigError
 */
void validate(const GatewayConfig& config);

/**
 * 根据配置生成 pool_size 个 WorkerSpec（id 从 1 开始）
 */
std::vector<WorkerSpec> make_worker_specs(const GatewayConfig& config);

/**
 * 解析时长："250ms"、"5s"、"2m"，纯数字按毫秒
 * @throws std::invalid_argument
 */
std::chrono::milliseconds parse_duration(const std::string& text);

/**
 * ConfigSource - 可重复加载的配置来源（启动与 reload 使用同一套规则）
 */
struct ConfigSource {
    std::string file;                                            // 空 = 不读文件
    std::vector<std::pair<std::string, std::string>> overrides;  // 命令行 --set key=value
    EnvLookup env;                                               // 空 = ::getenv

    /**
     * @throws ConfigError
     */
    GatewayConfig load() const;
};

} // namespace sockgate
