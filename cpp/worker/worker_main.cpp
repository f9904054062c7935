/**
 * worker_main.cpp - sockgate-worker 可执行文件入口
 *
 * 由 sockgated 启动，不直接运行：监听 socket 与就绪管道通过
 * SOCKGATE_LISTEN_FD / SOCKGATE_READY_FD 继承。
 */

#include <atomic>
#include <csignal>
#include <iostream>

#include "http_worker.hpp"

namespace {

std::atomic<bool> g_stop_requested{false};

void signal_handler(int signal) {
    (void)signal;
    g_stop_requested = true;
}

} // anonymous namespace

int main() {
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    try {
        sockgate::HttpWorker worker(sockgate::HttpWorker::options_from_environment());
        worker.notify_ready();
        worker.run(g_stop_requested);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[Worker] Error: " << e.what() << std::endl;
        return 1;
    }
}
