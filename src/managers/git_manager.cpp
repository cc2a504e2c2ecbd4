#include "git_manager.hpp"
#include "run_log.hpp"
#include <core/config.hpp>
#include <core/semver.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <sstream>

CommandResult GitManager::git(const fs::path& repo, const std::string& args) const {
    std::string cmd = fmt::format("git -C {} {}", shell_quote(repo.string()), args);
    auto r = run_command(cmd);
    expctl_log_cmd("git", cmd, r);
    return r;
}

std::vector<std::string> GitManager::uncommitted_changes(const fs::path& repo) const {
    std::vector<std::string> paths;
    auto r = git(repo, "status --porcelain --untracked-files=all");
    if (r.failed()) return paths;

    std::istringstream ss(r.output);
    std::string line;
    while (std::getline(ss, line)) {
        // "XY path" or "XY old -> new"
        if (line.size() < 4) continue;
        std::string path = line.substr(3);
        auto arrow = path.find(" -> ");
        if (arrow != std::string::npos) path = path.substr(arrow + 4);
        trim(path);
        if (!path.empty()) paths.push_back(path);
    }
    return paths;
}

Result<GitState> GitManager::validate(const fs::path& repo, GitPolicy policy,
                                      const std::string& version_constraint) const {
    GitState state;
    state.policy = policy;
    state.version_constraint = version_constraint;

    std::error_code ec;
    if (!fs::is_directory(repo, ec)) {
        std::string msg = fmt::format("repository path does not exist: {}", repo.string());
        if (policy != GitPolicy::Force) return Result<GitState>::Err(msg);
        state.version_ok = version_constraint.empty();
        state.violations.push_back(msg);
        return Result<GitState>::Ok(state);
    }

    auto inside = git(repo, "rev-parse --is-inside-work-tree");
    std::string inside_out = inside.output;
    trim(inside_out);
    if (inside.failed() || inside_out != "true") {
        std::string msg = fmt::format("not a git repository: {}", repo.string());
        if (policy != GitPolicy::Force) return Result<GitState>::Err(msg);
        state.version_ok = version_constraint.empty();
        state.violations.push_back(msg);
        return Result<GitState>::Ok(state);
    }
    state.is_repo = true;

    auto head = git(repo, "rev-parse HEAD");
    if (head.success()) {
        state.commit = head.output;
        trim(state.commit);
    } else {
        state.violations.push_back("repository has no commits");
    }

    auto branch = git(repo, "rev-parse --abbrev-ref HEAD");
    if (branch.success()) {
        state.branch = branch.output;
        trim(state.branch);
    }

    auto tag = git(repo, "describe --tags --abbrev=0");
    if (tag.success()) {
        state.tag = tag.output;
        trim(state.tag);
    }

    auto changes = uncommitted_changes(repo);
    state.dirty = !changes.empty();
    bool dirty_violation = false;
    if (state.dirty) {
        dirty_violation = true;
        state.violations.push_back(fmt::format(
            "working tree has {} uncommitted change(s): {}{}", changes.size(), changes.front(),
            changes.size() > 1 ? ", ..." : ""));
    }

    bool version_violation = false;
    if (!version_constraint.empty()) {
        if (!is_valid_constraint(version_constraint)) {
            state.version_ok = false;
            state.violations.push_back(
                fmt::format("invalid version constraint '{}'", version_constraint));
        } else if (state.tag.empty()) {
            state.version_ok = false;
            state.violations.push_back(
                fmt::format("no tag found to check against '{}'", version_constraint));
        } else {
            state.version_ok = satisfies(state.tag, version_constraint);
            if (!state.version_ok) {
                state.violations.push_back(fmt::format(
                    "version '{}' does not satisfy '{}'", state.tag, version_constraint));
            }
        }
        version_violation = !state.version_ok;
    }

    bool rejected = false;
    switch (policy) {
        case GitPolicy::Strict:
            rejected = dirty_violation || version_violation || state.commit.empty();
            break;
        case GitPolicy::VersionOnly:
            rejected = version_violation;
            break;
        case GitPolicy::Force:
            break;
    }

    if (rejected) {
        std::string msg = fmt::format("repository check failed ({})", git_policy_name(policy));
        for (const auto& v : state.violations) {
            msg += "\n  " + v;
        }
        return Result<GitState>::Err(msg);
    }
    return Result<GitState>::Ok(state);
}
