#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <core/abort_token.hpp>
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <core/errors.hpp>
#include <core/stage.hpp>
#include "data_mapper.hpp"
#include "data_transfer.hpp"
#include "git_manager.hpp"
#include "ledger.hpp"
#include "manifest.hpp"
#include "picker.hpp"
#include "resource_monitor.hpp"
#include "task_supervisor.hpp"
#include "transfer_backend.hpp"

namespace fs = std::filesystem;

// Everything the launcher talks to. Tests swap in fakes.
struct Collaborators {
    std::shared_ptr<Picker> picker;
    std::shared_ptr<MetricsSource> metrics;
    std::shared_ptr<TaskRunner> task_runner;
    std::shared_ptr<FileCopier> copier;
    std::shared_ptr<TransferBackend> backend;           // null: built from transfer.notify
    std::shared_ptr<const SchemaMapper> schema;
    std::shared_ptr<const CredentialProvider> credentials;
    std::function<void(int)> sleeper;                   // backoff sleep override
};

// Host implementations: process runner, local copier, statvfs metrics, the
// behavior_session schema and file+environment credentials.
Collaborators default_collaborators(const Config& config, std::istream& in, std::ostream& out);

struct SessionResult {
    Stage final_stage = Stage::Init;
    int exit_code = 0;
    Session session;
    std::optional<GitState> git;
    std::vector<ResourceSnapshot> snapshots;
    std::optional<SchemaRecord> record;
    std::optional<Ledger> ledger;
    std::vector<StageError> errors;
};

// Exit code for a finished session: 0, 1 (validation), 2 (task or mapping),
// 3 (partial) or 130 (aborted).
int exit_code_for(Stage final_stage, const std::vector<StageError>& errors);

// State threaded through every stage of one run.
struct RunContext {
    const Config& config;
    AbortToken& abort;
    Manifest manifest;
    fs::path session_dir;
    std::optional<Ledger> ledger;
    std::string unsaved;        // first manifest save failure; fails the current stage

    RunContext(const Config& c, AbortToken& a) : config(c), abort(a) {}

    Session& session() { return manifest.session; }
};

// Drives one experiment session through
// INIT -> VALIDATE_ENV -> RUN_TASK -> MAP_METADATA -> TRANSFER_DATA -> DONE.
class Launcher {
public:
    explicit Launcher(Collaborators collaborators);

    SessionResult run(const Config& config, AbortToken& abort);

    // Re-attempt the transfer of a finished session from its ledger.
    SessionResult resume(const Config& config, const fs::path& session_dir, AbortToken& abort);

    void set_status_callback(StatusCallback cb) { on_status_ = std::move(cb); }

private:
    struct StageOutcome {
        bool ok = true;
        ErrorKind kind = ErrorKind::Validation;
        std::string cause;
        std::string entity;

        static StageOutcome Ok() { return {}; }
        static StageOutcome Fail(ErrorKind k, const std::string& cause,
                                 const std::string& entity = "") {
            return {false, k, cause, entity};
        }
    };

    StageOutcome run_stage(RunContext& ctx, Stage stage);
    StageOutcome execute_stage(RunContext& ctx, Stage stage);
    StageOutcome unsaved_outcome(RunContext& ctx, Stage stage) const;
    StageOutcome stage_init(RunContext& ctx);
    StageOutcome stage_validate_env(RunContext& ctx);
    StageOutcome stage_run_task(RunContext& ctx);
    StageOutcome stage_map_metadata(RunContext& ctx);
    StageOutcome stage_transfer_data(RunContext& ctx);

    // Copy, verify and notify; shared by TRANSFER_DATA and resume, which
    // first reconciles the ledger against the files on disk.
    StageOutcome transfer_ledger(RunContext& ctx, Ledger ledger, const PathFilter* reconcile_with);
    Result<std::shared_ptr<TransferBackend>> transfer_backend(const Config& config) const;

    void enter(RunContext& ctx, Stage stage);
    void finish_stage(RunContext& ctx, const std::string& outcome, const std::string& message);
    void finalize(RunContext& ctx, Stage terminal);
    void record_error(RunContext& ctx, Stage stage, ErrorKind kind,
                      const std::string& cause, const std::string& entity);
    Result<void> persist(RunContext& ctx);
    void log(RunContext& ctx, const std::string& level, const std::string& msg);
    void status(const std::string& msg);

    SessionResult make_result(RunContext& ctx);

    Collaborators c_;
    StatusCallback on_status_;
};
