#pragma once

#include <string>
#include <functional>
#include <atomic>
#include <thread>
#include <vector>
#include <sys/types.h>

class ProcessManager {
public:
    ProcessManager();
    ~ProcessManager();

    /// Start a child process in its own session, stdio on /dev/null
    bool start(const std::string& binary_path, const std::vector<std::string>& args = {});

    /// Stop the child process (SIGTERM, wait, then SIGKILL if needed)
    bool stop(int grace_ms = 5000);

    /// Stop supervising the child without killing it. The child keeps
    /// running after this process exits; the destructor leaves it alone.
    void release();
    bool released() const { return released_.load(); }

    /// Check if the child process is currently running
    bool is_running() const;

    /// True once the monitor has reaped the child
    bool has_exited() const { return exited_.load(); }

    /// Exit status of the reaped child, 128+signal if it was killed,
    /// -1 while it is still running
    int exit_code() const { return exit_code_.load(); }

    /// Get the PID of the child process (-1 if not started)
    pid_t child_pid() const;

    /// Callback invoked from the monitor thread when the child exits
    std::function<void(int exit_code)> on_exit;

    /// True if a process with this pid exists (ours or not)
    static bool pid_alive(pid_t pid);

    /// SIGTERM a process that need not be our child, SIGKILL after grace_ms.
    /// Returns false if it could not be signalled or would not die.
    static bool terminate(pid_t pid, int grace_ms);

private:
    std::atomic<pid_t> child_pid_{-1};
    std::atomic<int> exit_code_{-1};
    std::atomic<bool> exited_{false};
    std::atomic<bool> released_{false};
    std::atomic<bool> monitor_running_{false};
    std::thread monitor_thread_;

    void monitor_loop();
    void stop_monitor();
    void record_exit(int status);
};
