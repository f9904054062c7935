#include "worker_types.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace sockgate {

const char* to_string(WorkerState state) {
    switch (state) {
    case WorkerState::Starting: return "Starting";
    case WorkerState::Ready:    return "Ready";
    case WorkerState::Crashed:  return "Crashed";
    case WorkerState::Stopping: return "Stopping";
    case WorkerState::Stopped:  return "Stopped";
    }
    return "Unknown";
}

const char* to_string(RestartPolicy::Mode mode) {
    switch (mode) {
    case RestartPolicy::Mode::Always:    return "always";
    case RestartPolicy::Mode::OnFailure: return "on-failure";
    case RestartPolicy::Mode::Never:     return "never";
    }
    return "unknown";
}

const char* to_string(WorkerEventType type) {
    switch (type) {
    case WorkerEventType::Transition:   return "transition";
    case WorkerEventType::Snapshot:     return "snapshot";
    case WorkerEventType::LaunchFailed: return "launch_failed";
    case WorkerEventType::PoolDegraded: return "pool_degraded";
    case WorkerEventType::StabilityReset: return "stability_reset";
    }
    return "unknown";
}

RestartPolicy::Mode parse_restart_mode(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "always") {
        return RestartPolicy::Mode::Always;
    }
    if (lower == "on-failure" || lower == "on_failure" || lower == "onfailure") {
        return RestartPolicy::Mode::OnFailure;
    }
    if (lower == "never" || lower == "no") {
        return RestartPolicy::Mode::Never;
    }
    throw std::invalid_argument("unknown restart policy '" + name + "'");
}

std::chrono::milliseconds RestartPolicy::delay_for(int restart_count) const {
    if (backoff_schedule.empty()) {
        return std::chrono::milliseconds(0);
    }
    size_t index = std::min(static_cast<size_t>(std::max(restart_count, 0)),
                            backoff_schedule.size() - 1);
    return backoff_schedule[index];
}

std::string format_event(const WorkerEvent& event) {
    std::ostringstream out;
    out << "event=" << to_string(event.type)
        << " worker=" << event.worker_id
        << " generation=" << event.generation
        << " pid=" << event.pid;

    if (event.type == WorkerEventType::Transition) {
        out << " from=" << to_string(event.old_state)
            << " to=" << to_string(event.new_state);
    } else {
        out << " state=" << to_string(event.new_state);
    }

    if (event.exit_code.has_value()) {
        out << " exit_code=" << event.exit_code.value();
    }
    out << " restart_count=" << event.restart_count;
    if (event.restart_delay.has_value()) {
        out << " restart_delay_ms=" << event.restart_delay->count();
    }
    if (!event.detail.empty()) {
        out << " detail=\"" << event.detail << "\"";
    }
    return out.str();
}

} // namespace sockgate
