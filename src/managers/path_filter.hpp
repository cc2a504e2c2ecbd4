#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Gitignore-style filter over a session directory. Patterns come from the
// transfer.exclude list and an optional ".expctlignore" in the root; the
// ".expctl/" state directory is always excluded.
class PathFilter {
public:
    explicit PathFilter(const fs::path& root,
                        const std::vector<std::string>& patterns = {});

    // Check if a path should be excluded from transfer
    bool is_excluded(const std::string& path) const;
    bool is_excluded(const fs::path& path) const;

    // Collect all non-excluded regular files recursively, sorted
    std::vector<fs::path> collect_files() const;

    // Get relative path from the root
    fs::path get_relative_path(const fs::path& full_path) const;

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
    std::vector<std::pair<std::string, bool>> patterns_;  // (pattern, is_negation)

    void add_pattern(std::string line);
    void load_ignore_file();
    bool matches_pattern(const std::string& path, const std::string& pattern) const;
    std::string glob_to_regex(const std::string& glob) const;
};
