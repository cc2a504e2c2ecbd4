#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace platform {

static ExitStatus decode_status(int status) {
    ExitStatus s;
    if (WIFEXITED(status)) {
        s.exited = true;
        s.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        s.signal = WTERMSIG(status);
        s.code = 128 + s.signal;
    }
    return s;
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    // Never leave a zombie or an orphaned task behind
    if (pid_ > 0 && !status_) {
        terminate(0);
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), status_(other.status_) {
    other.pid_ = -1;
    other.status_.reset();
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0 && !status_) terminate(0);
        pid_ = other.pid_;
        status_ = other.status_;
        other.pid_ = -1;
        other.status_.reset();
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

std::optional<ExitStatus> ProcessHandle::poll() {
    if (status_ || pid_ <= 0) return status_;
    int status = 0;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        status_ = decode_status(status);
    } else if (ret < 0 && errno == ECHILD) {
        status_ = ExitStatus{};
    }
    return status_;
}

ExitStatus ProcessHandle::wait() {
    if (status_ || pid_ <= 0) return status_.value_or(ExitStatus{});
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    status_ = (ret == pid_) ? decode_status(status) : ExitStatus{};
    return *status_;
}

ExitStatus ProcessHandle::terminate(int grace_ms) {
    if (pid_ <= 0) return ExitStatus{};
    if (poll()) return *status_;

    // The child leads its own group; signal the whole group so helpers die too
    kill(-pid_, SIGTERM);
    for (int waited = 0; waited < grace_ms; waited += 50) {
        if (poll()) return *status_;
        sleep_ms(50);
    }
    kill(-pid_, SIGKILL);
    return wait();
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& output_log,
                    const std::string& working_dir) {
    ProcessHandle handle;

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!output_log.empty()) {
            int fd = open(output_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDOUT_FILENO);
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    setpgid(pid, pid);
    handle.pid_ = pid;
    return handle;
}

bool spawn_detached(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& output_log) {
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return false;

    if (pid == 0) {
        setsid();
        pid_t service = fork();
        if (service != 0) _exit(service < 0 ? 1 : 0);

        int in = open("/dev/null", O_RDONLY);
        if (in >= 0) {
            dup2(in, STDIN_FILENO);
            close(in);
        }
        int out = output_log.empty()
                      ? open("/dev/null", O_WRONLY)
                      : open(output_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (out >= 0) {
            dup2(out, STDOUT_FILENO);
            dup2(out, STDERR_FILENO);
            close(out);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    // The intermediate child exits at once; the service is reparented
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

} // namespace platform
