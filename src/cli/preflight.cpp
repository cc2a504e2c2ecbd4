#include "preflight.hpp"
#include <managers/picker.hpp>
#include <platform/platform.hpp>
#include <algorithm>
#include <fmt/format.h>

namespace fs = std::filesystem;

static void append(std::vector<PreflightIssue>& all, const std::vector<PreflightIssue>& more) {
    all.insert(all.end(), more.begin(), more.end());
}

std::vector<PreflightIssue> check_global_config() {
    std::vector<PreflightIssue> issues;

    if (!global_config_exists()) {
        issues.push_back({
            "Global config not found at " + get_global_config_path().string(),
            "Run 'expctl setup' to write a rig template",
            true
        });
        return issues;
    }

    auto result = Config::load_global();
    if (result.is_err()) {
        issues.push_back({result.error, "Check YAML syntax in " + get_global_config_path().string()});
    }
    return issues;
}

std::vector<PreflightIssue> check_rig(const Config& config) {
    std::vector<PreflightIssue> issues;
    const auto& data_root = config.rig().data_root;

    if (data_root.empty()) {
        issues.push_back({"rig.data_root is not set",
                          "Set rig.data_root in ~/.expctl/config.yaml"});
        return issues;
    }

    std::error_code ec;
    if (!fs::exists(data_root, ec)) {
        issues.push_back({
            fmt::format("Data root {} does not exist yet", data_root),
            "It is created on the first run",
            true
        });
    } else if (!fs::is_directory(data_root, ec)) {
        issues.push_back({fmt::format("Data root {} is not a directory", data_root),
                          "Point rig.data_root at a directory"});
    }
    return issues;
}

std::vector<PreflightIssue> check_repository(const Config& config) {
    std::vector<PreflightIssue> issues;
    const auto& repo = config.repository();

    std::error_code ec;
    if (!fs::is_directory(repo.path, ec)) {
        issues.push_back({fmt::format("Repository path {} not found", repo.path),
                          "Fix repository.path in expctl.yaml"});
        return issues;
    }

    if (!fs::exists(fs::path(repo.path) / ".git", ec)) {
        bool blocking = repo.policy == GitPolicy::Strict;
        issues.push_back({
            fmt::format("{} is not a git repository", repo.path),
            blocking ? "Run the task from a git checkout or set repository.policy: force"
                     : "Provenance will not be recorded",
            !blocking
        });
    }
    return issues;
}

std::vector<PreflightIssue> check_task(const Config& config) {
    std::vector<PreflightIssue> issues;
    const auto& task = config.task();

    if (task.command.empty()) {
        issues.push_back({"task.command is not set", "Set task.command in expctl.yaml"});
        return issues;
    }

    if (!platform::find_executable(task.command, config.base_dir())) {
        issues.push_back({
            fmt::format("Task command '{}' not found or not executable", task.command),
            task.command.find('/') != std::string::npos
                ? "Check the path (relative paths start at the config directory)"
                : "Install it or use an absolute path"
        });
    }

    if (task.timeout_secs < 0) {
        issues.push_back({"task.timeout_secs is negative", "Use 0 for no timeout"});
    }
    return issues;
}

std::vector<PreflightIssue> check_transfer(const Config& config,
                                           const CredentialProvider& credentials) {
    std::vector<PreflightIssue> issues;
    const auto& transfer = config.transfer();

    if (transfer.destination.empty()) {
        issues.push_back({"transfer.destination is not set",
                          "Set transfer.destination to the mounted server share"});
    } else {
        std::error_code ec;
        if (!fs::is_directory(transfer.destination, ec)) {
            issues.push_back({
                fmt::format("Destination {} is not reachable", transfer.destination),
                "Mount the server share before running"
            });
        }
    }

    if (transfer.notify == "watchdog") {
        const auto& wd = transfer.watchdog;
        if (wd.flag_dir.empty()) {
            issues.push_back({"transfer.watchdog.flag_dir is not set",
                              "Set it to the directory the watchdog service watches"});
        }
        if (wd.project_name.empty()) {
            issues.push_back({"transfer.watchdog.project_name is not set",
                              "Set it to the server-side project name"});
        }
        auto user = credentials.get("user");
        if (user.is_err() || user.value.empty()) {
            issues.push_back({
                "No 'user' credential for the watchdog manifest",
                "Run 'expctl setup' or export EXPCTL_USER",
                true
            });
        }
        if (!wd.executable.empty() &&
            !platform::find_executable(wd.executable, config.base_dir())) {
            issues.push_back({
                fmt::format("Watchdog executable '{}' not found or not executable", wd.executable),
                "Point transfer.watchdog.executable at the installed watchdog service"
            });
        }
    } else if (transfer.notify != "none") {
        issues.push_back({fmt::format("Unknown transfer.notify '{}'", transfer.notify),
                          "Use 'watchdog' or 'none'"});
    }
    return issues;
}

std::vector<PreflightIssue> check_picker(const Config& config) {
    std::vector<PreflightIssue> issues;
    if (config.picker().mode != PickerMode::Headless) return issues;

    const auto& defaults = config.picker().defaults;
    auto missing = [&](const char* id) {
        auto it = defaults.find(id);
        return it == defaults.end() || it->second.empty();
    };

    if (config.session().operator_name.empty() && missing(DECISION_OPERATOR)) {
        issues.push_back({"Headless run has no operator",
                          "Set session.operator or picker.defaults.operator"});
    }
    if (config.session().subject.empty() && missing(DECISION_SUBJECT)) {
        issues.push_back({"Headless run has no subject",
                          "Set session.subject or picker.defaults.subject"});
    }
    if (missing(DECISION_CONFIRM_TRANSFER)) {
        issues.push_back({"Headless run cannot confirm the transfer",
                          "Set picker.defaults.confirm_transfer: yes"});
    }
    return issues;
}

bool has_errors(const std::vector<PreflightIssue>& issues) {
    return std::any_of(issues.begin(), issues.end(),
                       [](const PreflightIssue& i) { return !i.is_hint; });
}

std::vector<PreflightIssue> run_preflight_checks(const fs::path& config_file,
                                                 const CredentialProvider& credentials) {
    std::vector<PreflightIssue> all = check_global_config();

    // No point checking anything else if the configuration does not load
    auto loaded = Config::load(config_file);
    if (loaded.is_err()) {
        all.push_back({loaded.error, config_file.empty()
                                         ? "Create expctl.yaml or pass --config <file>"
                                         : "Check YAML syntax"});
        return all;
    }

    const auto& config = loaded.value;
    append(all, check_rig(config));
    append(all, check_repository(config));
    append(all, check_task(config));
    append(all, check_transfer(config, credentials));
    append(all, check_picker(config));
    return all;
}
