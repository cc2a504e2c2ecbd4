#include "task_supervisor.hpp"
#include "run_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

static std::string describe_exit(const platform::ExitStatus& st) {
    if (st.exited) return fmt::format("exited with code {}", st.code);
    return fmt::format("killed by signal {}", st.signal);
}

TaskOutcome ProcessTaskRunner::run(const TaskSpec& spec, AbortToken& abort) {
    TaskOutcome outcome;
    if (spec.command.empty()) {
        outcome.error = "task.command is not set";
        return outcome;
    }

    std::error_code ec;
    if (!spec.log_path.empty()) {
        fs::create_directories(spec.log_path.parent_path(), ec);
    }

    auto start = std::chrono::steady_clock::now();
    auto proc = platform::spawn(spec.command, spec.args, spec.log_path.string(),
                                spec.working_dir.string());
    if (!proc.valid()) {
        outcome.error = fmt::format("failed to start '{}'", spec.command);
        return outcome;
    }
    outcome.spawned = true;
    expctl_log(fmt::format("task: started {} (pid {})", spec.command, proc.native_handle()));

    int interval = std::max(spec.poll_interval_ms, MONITOR_MIN_INTERVAL_MS);
    while (true) {
        if (auto st = proc.poll()) {
            outcome.status = *st;
            break;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (abort.requested()) {
            outcome.aborted = true;
            outcome.status = proc.terminate(TERMINATE_GRACE_MS);
            outcome.error = fmt::format("task stopped: {}", abort.reason());
            break;
        }
        if (spec.timeout_secs > 0 && elapsed >= std::chrono::seconds(spec.timeout_secs)) {
            outcome.timed_out = true;
            outcome.status = proc.terminate(TERMINATE_GRACE_MS);
            outcome.error = fmt::format("task timed out after {}s", spec.timeout_secs);
            break;
        }
        platform::sleep_ms(interval);
    }

    outcome.duration_secs = static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start).count());

    if (outcome.error.empty() && !outcome.status.success()) {
        if (outcome.status.exited && outcome.status.code == 127) {
            outcome.error = fmt::format("'{}' could not be executed (exit 127)", spec.command);
        } else {
            outcome.error = fmt::format("task {}", describe_exit(outcome.status));
        }
    }

    expctl_log(fmt::format("task: {} after {}s{}", describe_exit(outcome.status),
                           outcome.duration_secs,
                           outcome.error.empty() ? "" : " (" + outcome.error + ")"));
    return outcome;
}

std::vector<std::string> substitute_task_args(const std::vector<std::string>& args,
                                              const TaskVariables& vars) {
    std::vector<std::pair<std::string, std::string>> table = {
        {"session_dir", vars.session_dir},
        {"subject", vars.subject},
        {"session_id", vars.session_id},
        {"rig_id", vars.rig_id},
    };
    std::vector<std::string> out;
    out.reserve(args.size());
    for (const auto& a : args) {
        out.push_back(substitute_placeholders(a, table));
    }
    return out;
}

TaskSpec make_task_spec(const TaskConfig& config, const fs::path& session_dir,
                        const TaskVariables& vars) {
    TaskSpec spec;
    spec.command = config.command;
    spec.args = substitute_task_args(config.args, vars);
    spec.working_dir = session_dir;
    spec.log_path = session_dir / STATE_DIR_NAME / TASK_LOG_NAME;
    spec.timeout_secs = config.timeout_secs;
    spec.poll_interval_ms = config.poll_interval_ms;
    return spec;
}
