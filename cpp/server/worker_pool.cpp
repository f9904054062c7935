#include "worker_pool.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace sockgate {

namespace {

// SIGKILL 之后等待内核回收的额外时间
constexpr std::chrono::milliseconds kKillMargin{2000};

// 没有 pidfd 时的轮询间隔；同时也是监控循环的最长睡眠时间
constexpr int kMaxPollMs = 250;
constexpr int kSweepPollMs = 50;

} // anonymous namespace

WorkerPool::WorkerPool(PoolOptions options)
    : options_(std::move(options)) {

    int fds[2];
    if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw std::runtime_error("Failed to create pipe: " + std::string(strerror(errno)));
    }
    wake_read_fd_ = fds[0];
    wake_write_fd_ = fds[1];

    monitor_thread_ = std::thread(&WorkerPool::monitor_loop, this);
}

WorkerPool::~WorkerPool() {
    bool running;
    std::chrono::milliseconds grace_period;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running = started_;
        grace_period = options_.reload_grace_period;
    }
    if (running) {
        stop_pool(grace_period);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        quit_ = true;
    }
    wake();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }

    hub_.close_all();
    close(wake_read_fd_);
    close(wake_write_fd_);
}

// ============================================================================
// Public API
// ============================================================================

std::vector<LaunchError> WorkerPool::start_pool(const std::vector<WorkerSpec>& specs,
                                                const SocketEndpoint& endpoint) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (started_) {
        throw std::logic_error("worker pool already started");
    }
    started_ = true;
    stopping_ = false;
    degraded_ = false;
    listen_fd_ = endpoint.fd();
    socket_path_ = endpoint.path();
    specs_ = specs;

    std::cout << "[WorkerPool] event=start_pool size=" << specs.size()
              << " socket=" << socket_path_ << std::endl;

    std::vector<HandlePtr> launched;
    for (const auto& spec : specs) {
        HandlePtr handle = make_handle_locked(spec);
        handles_.push_back(handle);
        launched.push_back(handle);

        if (auto error = launch_locked(*handle)) {
            handle->failure = *error;
        }
    }
    wake();

    auto deadline = Clock::now() + options_.ready_timeout + kKillMargin;
    cv_.wait_until(lock, deadline, [&] {
        return std::none_of(launched.begin(), launched.end(), [](const HandlePtr& h) {
            return h->state == WorkerState::Starting;
        });
    });

    std::vector<LaunchError> errors;
    for (const auto& handle : launched) {
        if (handle->state == WorkerState::Ready) {
            continue;
        }
        std::string cause = handle->failure.empty() ? "not ready within "
                                + std::to_string(options_.ready_timeout.count()) + "ms"
                                                    : handle->failure;
        errors.emplace_back(handle->spec.id, cause);
    }
    return errors;
}

std::shared_ptr<EventSubscription> WorkerPool::watch() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto subscription = hub_.subscribe();
    for (const auto& handle : handles_) {
        if (handle->state == WorkerState::Stopped) {
            continue;
        }
        WorkerEvent event = make_event_locked(*handle, WorkerEventType::Snapshot);
        event.time = handle->last_start_time;
        subscription->push(event);
    }
    return subscription;
}

std::vector<LaunchError> WorkerPool::reload(const std::vector<WorkerSpec>& new_specs) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!started_ || stopping_) {
        throw std::logic_error("worker pool is not running");
    }
    if (reloading_) {
        throw std::logic_error("reload already in progress");
    }
    reloading_ = true;

    std::cout << "[WorkerPool] event=reload_begin size=" << new_specs.size() << std::endl;

    std::vector<LaunchError> errors;
    for (const auto& spec : new_specs) {
        if (stopping_) {
            errors.emplace_back(spec.id, "pool is stopping");
            break;
        }

        HandlePtr old = find_active_locked(spec.id);
        HandlePtr replacement = make_handle_locked(spec);
        replacement->replaces = old;
        handles_.push_back(replacement);

        if (auto error = launch_locked(*replacement)) {
            replacement->replaces.reset();
            transition_locked(*replacement, WorkerState::Stopped);
            errors.emplace_back(spec.id, *error);
            break;
        }
        wake();

        auto deadline = Clock::now() + options_.ready_timeout + kKillMargin;
        cv_.wait_until(lock, deadline, [&] {
            return replacement->state != WorkerState::Starting || stopping_;
        });

        if (replacement->state != WorkerState::Ready) {
            std::string cause = replacement->failure.empty() ? "not ready within "
                                    + std::to_string(options_.ready_timeout.count()) + "ms"
                                                             : replacement->failure;
            replacement->replaces.reset();
            begin_stop_locked(*replacement, std::chrono::milliseconds(0));
            wake();
            errors.emplace_back(spec.id, cause);
            break;
        }

        // 旧 Worker 已经进入 Stopping，等它排空后再换下一个
        if (old) {
            cv_.wait_until(lock, Clock::now() + options_.reload_grace_period + kKillMargin,
                           [&] { return old->state == WorkerState::Stopped; });
        }
    }

    if (errors.empty()) {
        // 新配置里不再存在的 Worker 最后停止
        for (const auto& handle : std::vector<HandlePtr>(handles_)) {
            bool kept = std::any_of(new_specs.begin(), new_specs.end(),
                                    [&](const WorkerSpec& spec) {
                                        return spec.id == handle->spec.id;
                                    });
            if (kept || handle->state == WorkerState::Stopped ||
                handle->state == WorkerState::Stopping) {
                continue;
            }
            begin_stop_locked(*handle, options_.reload_grace_period);
            wake();
            cv_.wait_until(lock, Clock::now() + options_.reload_grace_period + kKillMargin,
                           [&] { return handle->state == WorkerState::Stopped; });
        }
        specs_ = new_specs;
    }

    reloading_ = false;
    cv_.notify_all();

    std::cout << "[WorkerPool] event=reload_end size=" << specs_.size()
              << " failures=" << errors.size() << std::endl;
    return errors;
}

void WorkerPool::stop_pool(std::chrono::milliseconds grace_period) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!started_) {
        return;
    }
    stopping_ = true;

    std::cout << "[WorkerPool] event=stop_pool grace_ms=" << grace_period.count()
              << " workers=" << handles_.size() << std::endl;

    for (const auto& handle : handles_) {
        begin_stop_locked(*handle, grace_period);
    }
    wake();

    bool done = cv_.wait_for(lock, grace_period + kKillMargin,
                             [this] { return all_stopped_locked(); });
    if (!done) {
        // 正常情况下监控线程已经在宽限期结束时发送了 SIGKILL
        for (const auto& handle : handles_) {
            if (handle->state == WorkerState::Stopping) {
                handle->process.send_signal(SIGKILL);
            }
        }
        wake();
        done = cv_.wait_for(lock, kKillMargin, [this] { return all_stopped_locked(); });
        if (!done) {
            std::cerr << "[WorkerPool] event=stop_incomplete remaining=" << handles_.size()
                      << std::endl;
        }
    }

    started_ = false;
    std::cout << "[WorkerPool] event=pool_stopped" << std::endl;
}

size_t WorkerPool::pool_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return specs_.size();
}

PoolOptions WorkerPool::options() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

void WorkerPool::set_options(const PoolOptions& options) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        options_ = options;
    }
    wake();
}

// ============================================================================
// Monitor thread
// ============================================================================

void WorkerPool::monitor_loop() {
    std::vector<pollfd> fds;
    std::vector<HandlePtr> owners;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!quit_) {
        fds.clear();
        owners.clear();
        fds.push_back({wake_read_fd_, POLLIN, 0});
        owners.push_back(nullptr);

        bool need_sweep = false;
        for (const auto& handle : handles_) {
            if (handle->process.pid() <= 0 || handle->process.has_exited()) {
                continue;
            }
            if (handle->process.pidfd() >= 0) {
                fds.push_back({handle->process.pidfd(), POLLIN, 0});
                owners.push_back(handle);
            } else {
                need_sweep = true;
            }
            if (handle->state == WorkerState::Starting && handle->process.ready_fd() >= 0) {
                fds.push_back({handle->process.ready_fd(), POLLIN, 0});
                owners.push_back(handle);
            }
        }

        int timeout = next_timeout_ms_locked(Clock::now());
        if (need_sweep) {
            timeout = std::min(timeout, kSweepPollMs);
        }

        lock.unlock();
        int ret = poll(fds.data(), fds.size(), timeout);
        int poll_errno = errno;
        lock.lock();

        if (quit_) {
            break;
        }
        if (ret < 0 && poll_errno != EINTR) {
            std::cerr << "[WorkerPool] event=poll_error error=\"" << strerror(poll_errno)
                      << "\"" << std::endl;
        }

        if (fds[0].revents != 0) {
            drain_wake_pipe();
        }

        // 先处理就绪信号，再处理退出：同一轮里"就绪后立即崩溃"的顺序不会颠倒
        for (size_t i = 1; i < fds.size(); ++i) {
            const HandlePtr& handle = owners[i];
            if (fds[i].revents == 0 || fds[i].fd != handle->process.ready_fd()) {
                continue;
            }
            if (handle->state == WorkerState::Starting && handle->process.read_ready()) {
                mark_ready_locked(*handle);
            }
        }

        for (const auto& handle : std::vector<HandlePtr>(handles_)) {
            if (auto exit_code = handle->process.try_reap()) {
                handle_exit_locked(*handle, *exit_code);
            }
        }

        run_timers_locked(Clock::now());
        prune_stopped_locked();
        cv_.notify_all();
    }
}

void WorkerPool::wake() {
    char c = 1;
    ssize_t ignored = write(wake_write_fd_, &c, 1);
    (void)ignored;
}

void WorkerPool::drain_wake_pipe() {
    char buf[64];
    while (read(wake_read_fd_, buf, sizeof(buf)) > 0) {
    }
}

void WorkerPool::run_timers_locked(Clock::time_point now) {
    for (const auto& handle : std::vector<HandlePtr>(handles_)) {
        WorkerHandle& h = *handle;

        switch (h.state) {
        case WorkerState::Starting:
            if (!h.ready_timed_out && now >= h.ready_deadline) {
                h.ready_timed_out = true;
                std::cerr << "[WorkerPool] event=ready_timeout worker=" << h.spec.id
                          << " pid=" << h.process.pid()
                          << " timeout_ms=" << options_.ready_timeout.count() << std::endl;
                h.process.send_signal(SIGKILL);
            }
            break;

        case WorkerState::Stopping:
            if (!h.kill_sent && now >= h.stop_deadline) {
                h.kill_sent = true;
                std::cerr << "[WorkerPool] event=stop_timeout worker=" << h.spec.id
                          << " pid=" << h.process.pid() << " action=SIGKILL" << std::endl;
                h.process.send_signal(SIGKILL);
            }
            break;

        case WorkerState::Crashed:
            if (h.restart_pending && now >= h.restart_at && !stopping_) {
                h.restart_pending = false;
                if (auto error = launch_locked(h)) {
                    handle_crash_locked(h, std::nullopt, *error, true);
                }
            }
            break;

        case WorkerState::Ready:
            if (h.restart_count > 0 && now - h.ready_since >= options_.stability_window) {
                WorkerEvent event = make_event_locked(h, WorkerEventType::StabilityReset);
                event.detail = "previous_restart_count=" + std::to_string(h.restart_count);
                h.restart_count = 0;
                event.restart_count = 0;
                publish_locked(event);
            }
            break;

        case WorkerState::Stopped:
            break;
        }
    }
}

int WorkerPool::next_timeout_ms_locked(Clock::time_point now) const {
    Clock::time_point next = now + std::chrono::milliseconds(kMaxPollMs);

    for (const auto& handle : handles_) {
        const WorkerHandle& h = *handle;
        switch (h.state) {
        case WorkerState::Starting:
            if (!h.ready_timed_out) {
                next = std::min(next, h.ready_deadline);
            }
            break;
        case WorkerState::Stopping:
            if (!h.kill_sent) {
                next = std::min(next, h.stop_deadline);
            }
            break;
        case WorkerState::Crashed:
            if (h.restart_pending) {
                next = std::min(next, h.restart_at);
            }
            break;
        case WorkerState::Ready:
            if (h.restart_count > 0) {
                next = std::min(next, h.ready_since + options_.stability_window);
            }
            break;
        case WorkerState::Stopped:
            break;
        }
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(next - now).count();
    // 向上取整，避免在截止时间前空转
    return static_cast<int>(std::max<long long>(ms + 1, 0));
}

// ============================================================================
// State transitions (mutex_ held)
// ============================================================================

WorkerPool::HandlePtr WorkerPool::make_handle_locked(const WorkerSpec& spec) {
    auto handle = std::make_shared<WorkerHandle>();
    handle->spec = spec;
    handle->generation = next_generation_++;
    return handle;
}

std::optional<std::string> WorkerPool::launch_locked(WorkerHandle& handle) {
    try {
        handle.process.spawn(handle.spec, listen_fd_, socket_path_, options_.ready_notify);
    } catch (const LaunchError& e) {
        WorkerEvent event = make_event_locked(handle, WorkerEventType::LaunchFailed);
        event.detail = e.cause();
        if (handle.initial_launch) {
            // 首次启动失败：不重启，留在 Crashed 供状态查询
            handle.state = WorkerState::Crashed;
            event.new_state = WorkerState::Crashed;
            publish_locked(event);
        }
        return e.cause();
    }

    handle.last_start_time = std::chrono::system_clock::now();
    handle.ready_deadline = Clock::now() + options_.ready_timeout;
    handle.ready_timed_out = false;
    handle.kill_sent = false;
    transition_locked(handle, WorkerState::Starting);

    if (!options_.ready_notify) {
        mark_ready_locked(handle);
    }
    return std::nullopt;
}

void WorkerPool::mark_ready_locked(WorkerHandle& handle) {
    if (handle.replaces) {
        WorkerHandle& old = *handle.replaces;
        if (old.state == WorkerState::Ready || old.state == WorkerState::Starting ||
            old.state == WorkerState::Crashed) {
            // 先让旧 Worker 离开 Ready，保证 Ready 数量不超过 pool_size
            begin_stop_locked(old, options_.reload_grace_period);
        }
        handle.replaces.reset();
    }

    handle.initial_launch = false;
    handle.ready_since = Clock::now();
    transition_locked(handle, WorkerState::Ready);
}

void WorkerPool::begin_stop_locked(WorkerHandle& handle, std::chrono::milliseconds grace_period) {
    switch (handle.state) {
    case WorkerState::Starting:
    case WorkerState::Ready:
        handle.stop_deadline = Clock::now() + grace_period;
        handle.kill_sent = false;
        handle.process.send_signal(SIGTERM);
        transition_locked(handle, WorkerState::Stopping);
        break;

    case WorkerState::Crashed:
        handle.restart_pending = false;
        transition_locked(handle, WorkerState::Stopped);
        break;

    case WorkerState::Stopping:
        // 已经在停止：缩短截止时间
        handle.stop_deadline = std::min(handle.stop_deadline, Clock::now() + grace_period);
        break;

    case WorkerState::Stopped:
        break;
    }
}

void WorkerPool::handle_exit_locked(WorkerHandle& handle, int exit_code) {
    if (handle.state == WorkerState::Stopping) {
        transition_locked(handle, WorkerState::Stopped, exit_code);
        return;
    }

    std::string detail;
    if (handle.ready_timed_out) {
        detail = "not ready within " + std::to_string(options_.ready_timeout.count()) + "ms";
    } else if (handle.state == WorkerState::Starting) {
        detail = "exited before becoming ready";
    } else {
        detail = "exited unexpectedly";
    }

    if (handle.initial_launch) {
        handle.failure = detail + " (exit code " + std::to_string(exit_code) + ")";
        transition_locked(handle, WorkerState::Crashed, exit_code, std::nullopt, detail);
        return;
    }

    const RestartPolicy& policy = options_.restart_policy;
    bool clean_exit = exit_code == 0;

    if (stopping_ || policy.mode == RestartPolicy::Mode::Never ||
        (policy.mode == RestartPolicy::Mode::OnFailure && clean_exit)) {
        transition_locked(handle, clean_exit ? WorkerState::Stopped : WorkerState::Crashed,
                          exit_code, std::nullopt, detail);
        return;
    }

    // 稳定运行足够久之后，退避从头开始
    if (handle.state == WorkerState::Ready &&
        Clock::now() - handle.ready_since >= options_.stability_window) {
        handle.restart_count = 0;
    }

    handle_crash_locked(handle, exit_code, detail, false);
}

void WorkerPool::handle_crash_locked(WorkerHandle& handle, std::optional<int> exit_code,
                                     const std::string& detail, bool launch_failed) {
    const RestartPolicy& policy = options_.restart_policy;
    auto now = Clock::now();

    while (!handle.restart_history.empty() &&
           now - handle.restart_history.front() > policy.restart_window) {
        handle.restart_history.pop_front();
    }

    std::optional<std::chrono::milliseconds> delay;
    bool budget_exhausted = false;

    if (stopping_) {
        // 不再重启
    } else if (policy.max_restarts_per_window.has_value() &&
               static_cast<int>(handle.restart_history.size()) >=
                   policy.max_restarts_per_window.value()) {
        budget_exhausted = true;
    } else {
        delay = policy.delay_for(handle.restart_count);
        handle.restart_count++;
        handle.restart_history.push_back(now);
        handle.restart_at = now + delay.value();
        handle.restart_pending = true;
    }

    if (launch_failed) {
        WorkerEvent event = make_event_locked(handle, WorkerEventType::LaunchFailed);
        event.exit_code = exit_code;
        event.restart_delay = delay;
        event.detail = detail;
        publish_locked(event);
    } else {
        transition_locked(handle, WorkerState::Crashed, exit_code, delay, detail);
    }

    if (budget_exhausted) {
        degraded_ = true;
        WorkerEvent event = make_event_locked(handle, WorkerEventType::PoolDegraded);
        event.detail = std::to_string(handle.restart_history.size()) + " restarts within " +
                       std::to_string(policy.restart_window.count()) + "ms";
        publish_locked(event);
    }
}

void WorkerPool::prune_stopped_locked() {
    handles_.erase(std::remove_if(handles_.begin(), handles_.end(),
                                  [](const HandlePtr& h) {
                                      return h->state == WorkerState::Stopped;
                                  }),
                   handles_.end());
}

bool WorkerPool::all_stopped_locked() const {
    return std::all_of(handles_.begin(), handles_.end(), [](const HandlePtr& h) {
        return h->state == WorkerState::Stopped;
    });
}

WorkerPool::HandlePtr WorkerPool::find_active_locked(int worker_id) const {
    HandlePtr found;
    for (const auto& handle : handles_) {
        if (handle->spec.id != worker_id || handle->state == WorkerState::Stopped ||
            handle->state == WorkerState::Stopping) {
            continue;
        }
        if (!found || handle->generation > found->generation) {
            found = handle;
        }
    }
    return found;
}

void WorkerPool::transition_locked(WorkerHandle& handle, WorkerState new_state,
                                   std::optional<int> exit_code,
                                   std::optional<std::chrono::milliseconds> restart_delay,
                                   const std::string& detail) {
    WorkerEvent event = make_event_locked(handle, WorkerEventType::Transition);
    event.old_state = handle.state;
    event.new_state = new_state;
    event.exit_code = exit_code;
    event.restart_delay = restart_delay;
    event.detail = detail;

    handle.state = new_state;
    publish_locked(event);
}

WorkerEvent WorkerPool::make_event_locked(const WorkerHandle& handle, WorkerEventType type) const {
    WorkerEvent event;
    event.type = type;
    event.worker_id = handle.spec.id;
    event.generation = handle.generation;
    event.pid = handle.process.pid();
    event.old_state = handle.state;
    event.new_state = handle.state;
    event.restart_count = handle.restart_count;
    event.time = std::chrono::system_clock::now();
    return event;
}

void WorkerPool::publish_locked(const WorkerEvent& event) {
    bool is_error = event.type == WorkerEventType::LaunchFailed ||
                    event.type == WorkerEventType::PoolDegraded ||
                    event.new_state == WorkerState::Crashed;
    (is_error ? std::cerr : std::cout) << "[WorkerPool] " << format_event(event) << std::endl;

    hub_.publish(event);
    cv_.notify_all();
}

} // namespace sockgate
