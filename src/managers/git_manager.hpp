#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Provenance of the task repository, computed once in VALIDATE_ENV.
struct GitState {
    bool is_repo = false;
    std::string commit;
    std::string branch;
    std::string tag;                    // nearest tag, "" if none
    bool dirty = false;                 // includes untracked files
    bool version_ok = true;
    std::string version_constraint;
    GitPolicy policy = GitPolicy::Strict;
    std::vector<std::string> violations;
};

// Inspects the local repository that backs the experimental task. Shells
// out to the local git binary; never touches a remote.
class GitManager {
public:
    GitManager() = default;

    // Err (a validation failure) when the policy rejects the repository state.
    // Under `force` this always succeeds and the violations are recorded.
    Result<GitState> validate(const fs::path& repo, GitPolicy policy,
                              const std::string& version_constraint) const;

    // Paths reported by `git status --porcelain`, for the operator message.
    std::vector<std::string> uncommitted_changes(const fs::path& repo) const;

private:
    CommandResult git(const fs::path& repo, const std::string& args) const;
};
