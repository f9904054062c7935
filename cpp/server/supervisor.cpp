#include "supervisor.hpp"

#include <iostream>

namespace sockgate {

namespace {

constexpr std::chrono::milliseconds kLoopInterval{100};
constexpr std::chrono::milliseconds kEventPollInterval{200};

} // anonymous namespace

const char* to_string(SupervisorState state) {
    switch (state) {
    case SupervisorState::Initializing:    return "initializing";
    case SupervisorState::Running:         return "running";
    case SupervisorState::ReloadingConfig: return "reloading_config";
    case SupervisorState::Stopping:        return "stopping";
    case SupervisorState::Stopped:         return "stopped";
    }
    return "unknown";
}

Supervisor::Supervisor(ConfigSource source)
    : source_(std::move(source)) {}

Supervisor::~Supervisor() {
    stop();

    // start() 中途抛出异常时事件线程可能还在运行
    if (events_) {
        events_->close();
    }
    if (pump_thread_.joinable()) {
        pump_thread_.join();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void Supervisor::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (state_ != SupervisorState::Initializing || pool_) {
        throw std::logic_error("supervisor already started");
    }
    std::cout << "[Supervisor] event=state state=" << to_string(state_.load()) << std::endl;

    GatewayConfig config;
    try {
        config = source_.load();
    } catch (const ConfigError& e) {
        set_state(SupervisorState::Stopped);
        throw SupervisorError(std::string("invalid configuration: ") + e.what());
    }
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = config;
    }

    // 1. Socket Endpoint
    try {
        endpoint_ = SocketEndpoint::create(config.socket_path, config.socket_mode,
                                           config.socket_backlog, config.socket_group);
    } catch (const EndpointError& e) {
        set_state(SupervisorState::Stopped);
        throw SupervisorError(std::string("cannot create socket endpoint: ") + e.what());
    }

    // 2. Worker 池；先订阅再启动，事件一个都不漏
    pool_ = std::make_unique<WorkerPool>(make_pool_options(config));
    gateway_ = std::make_unique<Gateway>(make_gateway_options(config));
    view_.set_pool_size(static_cast<size_t>(config.pool_size));
    events_ = pool_->watch();
    pump_thread_ = std::thread(&Supervisor::pump_events, this);

    std::vector<WorkerSpec> specs = make_worker_specs(config);
    std::vector<LaunchError> errors = pool_->start_pool(specs, endpoint_);
    for (const auto& error : errors) {
        std::cerr << "[Supervisor] event=launch_error worker=" << error.spec_id()
                  << " cause=\"" << error.cause() << "\"" << std::endl;
    }

    if (errors.size() == specs.size()) {
        teardown();
        set_state(SupervisorState::Stopped);
        throw SupervisorError("no worker could be started: " + std::string(errors.front().what()));
    }

    int expected = static_cast<int>(specs.size() - errors.size());
    wait_for_ready(expected, std::chrono::seconds(2));

    // 3. Gateway
    try {
        gateway_->listen();
    } catch (const GatewayError& e) {
        teardown();
        set_state(SupervisorState::Stopped);
        throw SupervisorError(std::string("cannot start gateway: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        started_at_ = std::chrono::system_clock::now();
    }
    set_state(SupervisorState::Running);

    if (!errors.empty()) {
        std::cerr << "[Supervisor] event=partial_start ready=" << expected
                  << " failed=" << errors.size() << std::endl;
    }
}

int Supervisor::run() {
    while (state_ != SupervisorState::Stopped) {
        if (stop_requested_.exchange(false)) {
            stop();
            break;
        }

        if (degraded_ && state_ == SupervisorState::Running) {
            std::cerr << "[Supervisor] event=fatal reason=\"worker pool degraded\"" << std::endl;
            exit_code_ = 1;
            stop();
            break;
        }

        if (reload_requested_.exchange(false)) {
            reload();
        }

        std::this_thread::sleep_for(kLoopInterval);
    }

    return exit_code_;
}

bool Supervisor::reload() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (state_ != SupervisorState::Running) {
        std::cerr << "[Supervisor] event=reload_ignored state=" << to_string(state_.load())
                  << std::endl;
        return false;
    }
    set_state(SupervisorState::ReloadingConfig);

    GatewayConfig current = config();
    GatewayConfig next;
    try {
        next = source_.load();
    } catch (const ConfigError& e) {
        std::cerr << "[Supervisor] event=reload_failed reason=\"" << e.what() << "\"" << std::endl;
        set_state(SupervisorState::Running);
        return false;
    }

    // 监听地址与 socket 需要重启进程才能变更
    auto keep = [](const char* key, auto& next_value, const auto& current_value) {
        if (next_value != current_value) {
            std::cerr << "[Supervisor] event=reload_setting_ignored key=" << key
                      << " reason=\"requires restart\"" << std::endl;
            next_value = current_value;
        }
    };
    keep("listen_address", next.listen_address, current.listen_address);
    keep("socket_path", next.socket_path, current.socket_path);
    keep("socket_mode", next.socket_mode, current.socket_mode);
    keep("socket_group", next.socket_group, current.socket_group);
    keep("socket_backlog", next.socket_backlog, current.socket_backlog);
    keep("control_address", next.control_address, current.control_address);

    pool_->set_options(make_pool_options(next));
    gateway_->set_idle_timeout(next.idle_timeout);

    std::vector<LaunchError> errors;
    try {
        errors = pool_->reload(make_worker_specs(next));
    } catch (const std::logic_error& e) {
        std::cerr << "[Supervisor] event=reload_failed reason=\"" << e.what() << "\"" << std::endl;
        pool_->set_options(make_pool_options(current));
        gateway_->set_idle_timeout(current.idle_timeout);
        set_state(SupervisorState::Running);
        return false;
    }

    if (!errors.empty()) {
        for (const auto& error : errors) {
            std::cerr << "[Supervisor] event=reload_failed worker=" << error.spec_id()
                      << " cause=\"" << error.cause() << "\"" << std::endl;
        }
        pool_->set_options(make_pool_options(current));
        gateway_->set_idle_timeout(current.idle_timeout);
        set_state(SupervisorState::Running);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = next;
    }
    view_.set_pool_size(static_cast<size_t>(next.pool_size));
    reload_count_++;

    set_state(SupervisorState::Running);
    std::cout << "[Supervisor] event=reload_complete pool_size=" << next.pool_size
              << " reloads=" << reload_count_.load() << std::endl;
    return true;
}

void Supervisor::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    SupervisorState current = state_.load();
    if (current == SupervisorState::Stopped || current == SupervisorState::Stopping) {
        return;
    }
    if (current == SupervisorState::Initializing) {
        set_state(SupervisorState::Stopped);
        return;
    }

    set_state(SupervisorState::Stopping);
    teardown();
    set_state(SupervisorState::Stopped);
}

// ============================================================================
// Status
// ============================================================================

SupervisorStatus Supervisor::status() const {
    SupervisorStatus status;
    status.state = state_.load();
    status.pool = view_.status();
    status.reload_count = reload_count_.load();

    if (gateway_) {
        status.gateway = gateway_->stats();
        status.active_connections = gateway_->active_connections();
        status.gateway_port = gateway_->port();
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    status.listen_address = config_.listen_address;
    status.socket_path = config_.socket_path;
    status.started_at = started_at_;
    return status;
}

GatewayConfig Supervisor::config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

// ============================================================================
// Internals
// ============================================================================

void Supervisor::set_state(SupervisorState state) {
    SupervisorState old = state_.exchange(state);
    if (old != state) {
        std::cout << "[Supervisor] event=state from=" << to_string(old)
                  << " to=" << to_string(state) << std::endl;
    }
}

void Supervisor::pump_events() {
    for (;;) {
        std::optional<WorkerEvent> event = events_->next(kEventPollInterval);
        if (!event) {
            if (events_->is_closed()) {
                break;
            }
            continue;
        }

        view_.apply(*event);
        gateway_->set_ready_workers(view_.ready_count());

        if (event->type == WorkerEventType::PoolDegraded && !degraded_.exchange(true)) {
            std::cerr << "[Supervisor] event=pool_degraded worker=" << event->worker_id
                      << " detail=\"" << event->detail << "\"" << std::endl;
        }
    }
}

void Supervisor::wait_for_ready(int expected, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (view_.ready_count() < expected && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void Supervisor::teardown() {
    GatewayConfig config = this->config();

    if (gateway_) {
        gateway_->stop_accepting();
    }
    if (pool_) {
        pool_->stop_pool(config.stop_grace_period);
    }
    if (gateway_) {
        gateway_->stop();
    }

    if (events_) {
        events_->close();
    }
    if (pump_thread_.joinable()) {
        pump_thread_.join();
    }

    endpoint_.destroy();
}

PoolOptions Supervisor::make_pool_options(const GatewayConfig& config) {
    PoolOptions options;
    options.restart_policy = config.restart_policy;
    options.ready_timeout = config.ready_timeout;
    options.stability_window = config.stability_window;
    options.reload_grace_period = config.reload_grace_period;
    options.ready_notify = config.ready_notify;
    return options;
}

GatewayOptions Supervisor::make_gateway_options(const GatewayConfig& config) {
    GatewayOptions options;
    options.listen_address = config.listen_address;
    options.backend_path = config.socket_path;
    options.idle_timeout = config.idle_timeout;
    return options;
}

} // namespace sockgate
