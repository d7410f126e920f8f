#include "engine/process_manager.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>

ProcessManager::ProcessManager() = default;

ProcessManager::~ProcessManager() {
    if (released_.load()) {
        stop_monitor();
        return;
    }
    stop();
}

void ProcessManager::record_exit(int status) {
    int code = -1;
    if (WIFEXITED(status)) {
        code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        code = 128 + WTERMSIG(status);
    }
    exit_code_.store(code);
    exited_.store(true);
}

bool ProcessManager::start(const std::string& binary_path, const std::vector<std::string>& args) {
    // Stop existing process if running
    if (is_running()) {
        stop();
    }

    child_pid_ = -1;
    exit_code_.store(-1);
    exited_.store(false);
    released_.store(false);

    // Build argv before forking; only async-signal-safe calls in the child
    std::vector<const char*> argv;
    argv.push_back(binary_path.c_str());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        return false; // fork failed
    }

    if (pid == 0) {
        // Child: detach from the terminal so Ctrl+C reaches only the parent
        setsid();
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }

        execvp(binary_path.c_str(), const_cast<char* const*>(argv.data()));

        // If execvp returns, it failed
        _exit(127);
    }

    // Parent process
    child_pid_ = pid;

    monitor_running_.store(true);
    monitor_thread_ = std::thread(&ProcessManager::monitor_loop, this);
    return true;
}

bool ProcessManager::stop(int grace_ms) {
    stop_monitor();

    pid_t pid = child_pid_;
    if (pid > 0 && !exited_.load()) {
        int status;
        // Send SIGTERM first
        if (kill(pid, SIGTERM) == 0) {
            // Wait for graceful exit
            for (int waited = 0; waited < grace_ms; waited += 100) {
                if (waitpid(pid, &status, WNOHANG) > 0) {
                    record_exit(status);
                    return true;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }

            // Force kill if still running
            kill(pid, SIGKILL);
        }
        if (waitpid(pid, &status, 0) > 0) {
            record_exit(status);
        } else {
            exited_.store(true);
        }
    }
    return true;
}

void ProcessManager::release() {
    released_.store(true);
    stop_monitor();
}

bool ProcessManager::is_running() const {
    pid_t pid = child_pid_;
    if (pid <= 0 || exited_.load()) return false;
    if (released_.load()) return pid_alive(pid);
    // The monitor reaps the child, so a live pid here is not a zombie
    return kill(pid, 0) == 0;
}

pid_t ProcessManager::child_pid() const {
    return child_pid_;
}

void ProcessManager::stop_monitor() {
    monitor_running_.store(false);
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
}

void ProcessManager::monitor_loop() {
    while (monitor_running_.load()) {
        pid_t pid = child_pid_;
        if (pid > 0) {
            int status;
            pid_t result = waitpid(pid, &status, WNOHANG);
            if (result > 0) {
                record_exit(status);
                if (on_exit) {
                    on_exit(exit_code_.load());
                }
                return;
            }
        }

        for (int i = 0; i < 2 && monitor_running_.load(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
}

bool ProcessManager::pid_alive(pid_t pid) {
    if (pid <= 0) return false;
    if (kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

bool ProcessManager::terminate(pid_t pid, int grace_ms) {
    if (pid <= 0) return false;
    if (kill(pid, SIGTERM) != 0) {
        return errno == ESRCH;  // already gone
    }

    auto gone = [pid]() {
        int status;
        // Reaps it if it happens to be our child; ECHILD otherwise
        waitpid(pid, &status, WNOHANG);
        return !pid_alive(pid);
    };

    for (int waited = 0; waited < grace_ms; waited += 100) {
        if (gone()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (kill(pid, SIGKILL) != 0 && errno != ESRCH) return false;
    for (int i = 0; i < 20; ++i) {
        if (gone()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}
