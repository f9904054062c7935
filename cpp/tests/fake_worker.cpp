/**
 * fake_worker.cpp - 测试用的脚本化 Worker
 *
 * 用法: fake_worker MODE [ARGS]
 *
 *   ready                      报告就绪，等待 SIGTERM 后以 0 退出
 *   silent                     从不报告就绪，等待 SIGTERM
 *   exit CODE                  立即以 CODE 退出（不报告就绪）
 *   ready-exit CODE DELAY_MS   报告就绪，DELAY_MS 后以 CODE 退出
 *   ignore-term                报告就绪，忽略 SIGTERM（只能被 SIGKILL 结束）
 *   env-dump FILE              把 SOCKGATE_* 与 FAKE_* 环境变量写入 FILE，然后同 ready
 */

#include <atomic>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace {

std::atomic<bool> g_terminated{false};

void on_term(int) {
    g_terminated = true;
}

void notify_ready() {
    const char* value = std::getenv("SOCKGATE_READY_FD");
    if (value == nullptr) {
        return;
    }
    int fd = std::atoi(value);
    char c = 'R';
    if (write(fd, &c, 1) != 1) {
        std::cerr << "[fake_worker] ready notify failed: " << strerror(errno) << std::endl;
    }
    close(fd);
}

int wait_for_term() {
    while (!g_terminated) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: fake_worker MODE [ARGS]" << std::endl;
        return 2;
    }
    std::string mode = argv[1];

    std::signal(SIGTERM, on_term);

    if (mode == "ready") {
        notify_ready();
        return wait_for_term();
    }

    if (mode == "silent") {
        return wait_for_term();
    }

    if (mode == "exit" && argc >= 3) {
        return std::atoi(argv[2]);
    }

    if (mode == "ready-exit" && argc >= 4) {
        notify_ready();
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(std::atoi(argv[3]));
        while (!g_terminated && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return g_terminated ? 0 : std::atoi(argv[2]);
    }

    if (mode == "ignore-term") {
        std::signal(SIGTERM, SIG_IGN);
        notify_ready();
        for (;;) {
            pause();
        }
    }

    if (mode == "env-dump" && argc >= 3) {
        {
            std::ofstream out(argv[2]);
            for (char** entry = environ; *entry != nullptr; ++entry) {
                std::string item(*entry);
                if (item.compare(0, 9, "SOCKGATE_") == 0 || item.compare(0, 5, "FAKE_") == 0) {
                    out << item << "\n";
                }
            }
            char cwd[4096];
            if (getcwd(cwd, sizeof(cwd)) != nullptr) {
                out << "CWD=" << cwd << "\n";
            }
        }
        notify_ready();
        return wait_for_term();
    }

    std::cerr << "[fake_worker] unknown mode: " << mode << std::endl;
    return 2;
}
