#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Compact timestamp for directory and id names (YYYYMMDDTHHMMSS).
std::string now_compact();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Single-quote a string for /bin/sh.
std::string shell_quote(const std::string& s);

// Run a command through the shell, capturing stdout and stderr together.
CommandResult run_command(const std::string& cmd);

// Hex digest of a file via the system checksum tool (sha256sum / md5sum).
// Returns "" if the file is missing or the tool fails.
std::string compute_file_sha256(const std::filesystem::path& path);
std::string compute_file_md5(const std::filesystem::path& path);

// Replace every "{key}" in `text` with its value.
std::string substitute_placeholders(const std::string& text,
                                    const std::vector<std::pair<std::string, std::string>>& vars);
