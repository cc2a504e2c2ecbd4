#pragma once

#include <string>
#include <vector>
#include <optional>

namespace platform {

// How a child process ended.
struct ExitStatus {
    bool exited = false;     // normal exit (code valid)
    int code = -1;
    int signal = 0;          // terminating signal if !exited

    bool success() const { return exited && code == 0; }
};

// Handle to a spawned child process. Owns the pid until it is reaped.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Non-blocking: the exit status once the child has ended, nullopt while running.
    std::optional<ExitStatus> poll();

    // Block until the process exits.
    ExitStatus wait();

    // SIGTERM, then SIGKILL after grace_ms. Reaps the child.
    ExitStatus terminate(int grace_ms = 2000);

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    std::optional<ExitStatus> status_;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& output_log,
                               const std::string& working_dir);
};

// Spawn a child process in its own process group.
// output_log: if non-empty, stdout and stderr are appended to this file.
// working_dir: if non-empty, the child chdirs there before exec.
// An exec failure shows up as exit code 127.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& output_log = "",
                    const std::string& working_dir = "");

// Start a long-lived service that outlives this process: double fork, new
// session, stdio on /dev/null or output_log. False if the fork failed.
bool spawn_detached(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& output_log = "");

} // namespace platform
