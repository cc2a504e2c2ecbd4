#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Captured output of a local command (git, checksum tools)
struct CommandResult {
    int exit_code = -1;
    std::string output;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// ── Configuration structures ────────────────────────────────

enum class GitPolicy { Strict, Force, VersionOnly };

enum class FingerprintMethod { Sha256, Md5, SizeMtime };

enum class MappingErrorPolicy { Fail, Remediate };

enum class PickerMode { Interactive, Headless };

struct RigConfig {
    std::string id;
    std::string data_root;                       // sessions are created under here
};

struct SessionConfig {
    std::string operator_name;                   // prompted for if empty
    std::string subject;                         // picked from `subjects` if empty
    std::vector<std::string> subjects;
};

struct RepositoryConfig {
    std::string path = ".";
    GitPolicy policy = GitPolicy::Strict;
    std::string version;                         // constraint, e.g. ">=1.2.0"
};

struct TaskConfig {
    std::string command;
    std::vector<std::string> args;               // {session_dir}, {subject}, ... substituted
    int timeout_secs = 0;                        // 0 = no timeout
    int poll_interval_ms = 200;
    std::string output_file = "session_output.yaml";
};

// A zero threshold disables that metric.
struct ResourceThresholds {
    int64_t min_free_disk_local_mb = 0;
    int64_t min_free_disk_destination_mb = 0;
    int64_t min_free_memory_mb = 0;
    double max_load = 0.0;
};

struct ResourceConfig {
    ResourceThresholds run;
    ResourceThresholds transfer;
    ResourceThresholds background;
    int poll_interval_ms = 5000;
};

struct WatchdogConfig {
    std::string flag_dir;                        // directory the watchdog service watches
    std::string project_name;
    std::string platform = "behavior";
    std::string schedule_time = "20:00";
    bool force_cloud_sync = true;
    std::string executable;                      // empty: liveness not checked
    std::string process_name;                    // empty: basename of executable
    int start_wait_ms = 3000;
};

struct TransferConfig {
    std::string destination;
    int workers = 4;
    FingerprintMethod fingerprint = FingerprintMethod::Sha256;
    std::vector<std::string> exclude;
    std::string notify = "none";                 // "watchdog" or "none"
    WatchdogConfig watchdog;
};

struct RetryPolicy {
    int max_attempts = 5;
    int base_backoff_ms = 500;
    int max_backoff_ms = 30000;
    int jitter_min_ms = 0;
    int jitter_max_ms = 250;
};

struct MappingConfig {
    MappingErrorPolicy on_error = MappingErrorPolicy::Fail;
    int max_attempts = 3;
};

struct PickerConfig {
    PickerMode mode = PickerMode::Interactive;
    std::map<std::string, std::string> defaults; // decision id -> answer
};

struct LoggingConfig {
    bool debug = false;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
