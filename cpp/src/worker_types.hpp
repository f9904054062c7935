#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <cstdint>
#include <sys/types.h>

namespace sockgate {

/**
 * WorkerSpec - 一个 Worker 的启动描述（池创建后不可变）
 */
struct WorkerSpec {
    int id = 0;
    std::vector<std::string> command;               // argv，argv[0] 通过 PATH 查找
    std::string working_directory;                  // 空 = 继承 Supervisor 的工作目录
    std::map<std::string, std::string> environment;
};

enum class WorkerState {
    Starting,
    Ready,
    Crashed,
    Stopping,
    Stopped,
};

const char* to_string(WorkerState state);

/**
 * RestartPolicy - Worker 意外退出后的重启策略（运行时只读）
 */
struct RestartPolicy {
    enum class Mode {
        Always,
        OnFailure,
        Never,
    };

    Mode mode = Mode::Always;
    std::vector<std::chrono::milliseconds> backoff_schedule{
        std::chrono::milliseconds(100),
        std::chrono::milliseconds(1000),
        std::chrono::milliseconds(5000),
    };
    std::optional<int> max_restarts_per_window;
    std::chrono::milliseconds restart_window{std::chrono::seconds(60)};

    /**
     * 第 restart_count 次重启的延迟：backoff_schedule[min(restart_count, len-1)]
     */
    std::chrono::milliseconds delay_for(int restart_count) const;
};

const char* to_string(RestartPolicy::Mode mode);

/**
 * @throws std::invalid_argument 无法识别的名称
 */
RestartPolicy::Mode parse_restart_mode(const std::string& name);

enum class WorkerEventType {
    Transition,     // 状态迁移
    Snapshot,       // 新订阅者收到的当前状态
    LaunchFailed,   // fork/exec 失败
    PoolDegraded,   // 重启预算耗尽
    StabilityReset, // 稳定运行超过 stability_window，restart_count 清零
};

const char* to_string(WorkerEventType type);

/**
 * WorkerEvent - 池事件流中的一条记录
 */
struct WorkerEvent {
    WorkerEventType type = WorkerEventType::Transition;
    int worker_id = 0;
    uint64_t generation = 0;
    pid_t pid = -1;
    WorkerState old_state = WorkerState::Starting;
    WorkerState new_state = WorkerState::Starting;
    std::optional<int> exit_code;                           // 信号终止时为 128 + signo
    int restart_count = 0;
    std::optional<std::chrono::milliseconds> restart_delay; // 仅在安排了重启时设置
    std::chrono::system_clock::time_point time;
    std::string detail;
};

/**
 * 格式化为一行 key=value 日志
 */
std::string format_event(const WorkerEvent& event);

/**
 * LaunchError - 某个 Worker 启动失败
 */
class LaunchError : public std::runtime_error {
public:
    LaunchError(int spec_id, const std::string& cause)
        : std::runtime_error("worker " + std::to_string(spec_id) + ": " + cause),
          spec_id_(spec_id), cause_(cause) {}

    int spec_id() const { return spec_id_; }
    const std::string& cause() const { return cause_; }

private:
    int spec_id_;
    std::string cause_;
};

} // namespace sockgate
