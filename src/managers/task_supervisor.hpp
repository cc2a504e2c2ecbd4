#pragma once

#include <string>
#include <vector>
#include <utility>
#include <filesystem>
#include <core/abort_token.hpp>
#include <core/types.hpp>
#include <platform/process.hpp>

namespace fs = std::filesystem;

// One supervised invocation of the experimental task.
struct TaskSpec {
    std::string command;
    std::vector<std::string> args;      // already substituted
    fs::path working_dir;
    fs::path log_path;                  // stdout + stderr
    int timeout_secs = 0;               // 0 = no timeout
    int poll_interval_ms = 200;
};

struct TaskOutcome {
    bool spawned = false;
    platform::ExitStatus status;
    bool timed_out = false;
    bool aborted = false;
    int duration_secs = 0;
    std::string error;                  // "" on success

    bool success() const { return spawned && !timed_out && !aborted && status.success(); }
};

// Runs the task to completion, honoring the abort token and the timeout.
class TaskRunner {
public:
    virtual ~TaskRunner() = default;
    virtual TaskOutcome run(const TaskSpec& spec, AbortToken& abort) = 0;
};

// Spawns the command as a child process group and polls it.
class ProcessTaskRunner : public TaskRunner {
public:
    TaskOutcome run(const TaskSpec& spec, AbortToken& abort) override;
};

// Placeholder values for task arguments.
struct TaskVariables {
    std::string session_dir;
    std::string subject;
    std::string session_id;
    std::string rig_id;
};

// Expand {session_dir}, {subject}, {session_id} and {rig_id} in every argument.
std::vector<std::string> substitute_task_args(const std::vector<std::string>& args,
                                              const TaskVariables& vars);

// Build a spec from task config, logging into <session_dir>/.expctl/task.log.
TaskSpec make_task_spec(const TaskConfig& config, const fs::path& session_dir,
                        const TaskVariables& vars);
