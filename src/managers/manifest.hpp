#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/errors.hpp>
#include <core/stage.hpp>
#include <core/types.hpp>
#include "data_mapper.hpp"
#include "git_manager.hpp"
#include "resource_monitor.hpp"

namespace fs = std::filesystem;

// Stage outcomes as written in the history
constexpr const char* OUTCOME_RUNNING = "running";
constexpr const char* OUTCOME_OK      = "ok";
constexpr const char* OUTCOME_SKIPPED = "skipped";
constexpr const char* OUTCOME_FAILED  = "failed";
constexpr const char* OUTCOME_ABORTED = "aborted";
constexpr const char* OUTCOME_FINAL   = "final";

struct StageRecord {
    Stage stage = Stage::Init;
    std::string outcome;
    std::string timestamp;
    std::string message;
};

// One experiment run. Only the launcher mutates it.
struct Session {
    std::string id;                 // <subject>_<YYYYMMDDTHHMMSS>
    std::string start_time;
    std::string end_time;
    std::string operator_name;
    std::string subject;
    std::string rig_id;
    Stage stage = Stage::Init;
    std::optional<Stage> status;    // terminal stage once reached
    std::vector<StageRecord> history;
    std::string session_dir;

    bool finished() const { return status.has_value(); }
};

// A later `expctl resume` pass over the transfer ledger.
struct RecoveryRecord {
    std::string timestamp;
    Stage result = Stage::Partial;
    int confirmed = 0;
    int failed = 0;
    int total = 0;
    bool notified = false;
    std::string message;
};

struct Manifest {
    Session session;
    std::optional<GitState> git;
    std::vector<ResourceSnapshot> snapshots;
    std::optional<SchemaRecord> record;
    std::vector<StageError> errors;
    std::string ledger_file;        // relative to the session directory, "" before transfer
    std::vector<RecoveryRecord> recoveries;
};

// <session_dir>/.expctl/session_manifest.yaml, rewritten atomically under
// the sibling .lock file after every transition.
class ManifestStore {
public:
    explicit ManifestStore(const fs::path& session_dir);

    bool exists() const;
    Result<Manifest> load() const;
    Result<void> save(const Manifest& manifest) const;

    const fs::path& path() const { return manifest_path_; }

private:
    fs::path manifest_path_;
};

std::string manifest_to_yaml(const Manifest& manifest);
Result<Manifest> manifest_from_yaml(const std::string& text);
