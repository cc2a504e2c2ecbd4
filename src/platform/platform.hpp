#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), falling back to the temp dir.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Short hostname of this machine, "unknown" if unavailable.
std::string hostname();

// Login name of the current user, "unknown" if unavailable.
std::string username();

// Resolves a program the way execvp would: names containing '/' are taken
// relative to `base_dir`, bare names are searched on PATH. Only executable
// regular files match.
std::optional<std::filesystem::path> find_executable(const std::string& program,
                                                     const std::filesystem::path& base_dir);

// Pids of live (non-zombie) processes whose name (/proc/<pid>/comm) equals `name`.
// The kernel truncates names to 15 characters; longer names are compared
// on that prefix.
std::vector<int> find_processes(const std::string& name);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// ── Host metrics ─────────────────────────────────────────────

// Free space available to unprivileged users on the volume holding `path`.
// A path that does not exist yet is measured at its nearest existing ancestor.
std::optional<int64_t> free_disk_mb(const std::filesystem::path& path);

// MemAvailable from /proc/meminfo (falls back to sysinfo free+buffers).
std::optional<int64_t> available_memory_mb();

// One-minute load average.
std::optional<double> load_average_1m();

} // namespace platform
