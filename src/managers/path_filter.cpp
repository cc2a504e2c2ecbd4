#include "path_filter.hpp"
#include <core/utils.hpp>
#include <core/constants.hpp>
#include <fstream>
#include <regex>
#include <algorithm>

PathFilter::PathFilter(const fs::path& root, const std::vector<std::string>& patterns)
    : root_(root) {
    for (const auto& p : patterns) {
        add_pattern(p);
    }
    load_ignore_file();
}

void PathFilter::add_pattern(std::string line) {
    trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
        return;
    }

    bool is_negation = false;
    if (line[0] == '!') {
        is_negation = true;
        line = line.substr(1);
    }
    if (!line.empty()) {
        patterns_.push_back({line, is_negation});
    }
}

void PathFilter::load_ignore_file() {
    fs::path ignore_path = root_ / ".expctlignore";
    if (!fs::exists(ignore_path)) {
        return;
    }

    std::ifstream file(ignore_path);
    std::string line;
    while (std::getline(file, line)) {
        add_pattern(line);
    }
}

bool PathFilter::is_excluded(const std::string& path) const {
    return is_excluded(fs::path(path));
}

bool PathFilter::is_excluded(const fs::path& path) const {
    std::string rel_path = get_relative_path(path).generic_string();

    // State directory can never be negated back in
    std::string state_dir = STATE_DIR_NAME;
    if (rel_path == state_dir || rel_path.rfind(state_dir + "/", 0) == 0) {
        return true;
    }

    bool excluded = false;

    // Later patterns override earlier ones
    for (const auto& [pattern, is_negation] : patterns_) {
        if (matches_pattern(rel_path, pattern)) {
            excluded = !is_negation;
        }
    }

    return excluded;
}

fs::path PathFilter::get_relative_path(const fs::path& full_path) const {
    if (full_path.is_relative()) {
        return full_path;
    }
    return fs::relative(full_path, root_);
}

std::vector<fs::path> PathFilter::collect_files() const {
    std::vector<fs::path> files;

    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        return files;
    }

    for (const auto& entry : fs::recursive_directory_iterator(root_, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        if (is_excluded(entry.path())) {
            continue;
        }
        files.push_back(entry.path());
    }

    // Sort for a stable ledger order
    std::sort(files.begin(), files.end());

    return files;
}

bool PathFilter::matches_pattern(const std::string& path, const std::string& pattern) const {
    bool is_dir_pattern = pattern.back() == '/';

    if (pattern == "*") {
        return true;
    }

    if (pattern.find('*') != std::string::npos || pattern.find('?') != std::string::npos) {
        try {
            std::regex re("(^|/)" + glob_to_regex(pattern) + (is_dir_pattern ? "" : "($|/)"));
            return std::regex_search(path, re);
        } catch (const std::regex_error&) {
            return false;
        }
    }

    // Exact match or prefix match
    if (is_dir_pattern) {
        std::string dir = pattern.substr(0, pattern.length() - 1);
        return path == dir || path.rfind(dir + "/", 0) == 0 ||
               path.find("/" + dir + "/") != std::string::npos;
    }

    return path == pattern || path.rfind(pattern + "/", 0) == 0 ||
           path.find("/" + pattern) != std::string::npos;
}

std::string PathFilter::glob_to_regex(const std::string& glob) const {
    std::string regex;
    bool escape = false;

    for (size_t i = 0; i < glob.length(); ++i) {
        char c = glob[i];

        if (escape) {
            regex += '\\';
            regex += c;
            escape = false;
        } else if (c == '\\') {
            escape = true;
        } else if (c == '*') {
            if (i + 1 < glob.length() && glob[i + 1] == '*') {
                regex += ".*";
                i++;
            } else {
                regex += "[^/]*";
            }
        } else if (c == '?') {
            regex += "[^/]";
        } else if (c == '.' || c == '+' || c == '(' || c == ')' ||
                   c == '^' || c == '$' || c == '|' || c == '{' || c == '}') {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }

    return regex;
}
