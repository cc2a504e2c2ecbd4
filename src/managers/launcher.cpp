#include "launcher.hpp"
#include "path_filter.hpp"
#include "run_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

static const Stage kPipeline[] = {
    Stage::Init,
    Stage::ValidateEnv,
    Stage::RunTask,
    Stage::MapMetadata,
    Stage::TransferData,
};

static ErrorKind default_kind(Stage stage) {
    switch (stage) {
        case Stage::RunTask:      return ErrorKind::Task;
        case Stage::MapMetadata:  return ErrorKind::Mapping;
        case Stage::TransferData: return ErrorKind::TransferPermanent;
        default:                  return ErrorKind::Validation;
    }
}

static bool any_enabled(const ResourceThresholds& t) {
    return t.min_free_disk_local_mb > 0 || t.min_free_disk_destination_mb > 0 ||
           t.min_free_memory_mb > 0 || t.max_load > 0.0;
}

static std::optional<std::string> check_subject(const std::string& subject) {
    if (subject.empty()) return std::string("subject is empty");
    if (subject == "." || subject == ".." ||
        subject.find_first_of("/\\") != std::string::npos) {
        return fmt::format("subject '{}' is not a valid directory name", subject);
    }
    return std::nullopt;
}

int exit_code_for(Stage final_stage, const std::vector<StageError>& errors) {
    switch (final_stage) {
        case Stage::Done:    return EXIT_OK;
        case Stage::Aborted: return EXIT_ABORTED;
        case Stage::Partial: return EXIT_TRANSFER_FAILURE;
        case Stage::Failed:  break;
        default:             return EXIT_VALIDATION_FAILURE;
    }

    if (errors.empty()) return EXIT_VALIDATION_FAILURE;
    const auto& last = errors.back();
    switch (last.kind) {
        case ErrorKind::Validation: return EXIT_VALIDATION_FAILURE;
        case ErrorKind::Task:
        case ErrorKind::Mapping:    return EXIT_TASK_FAILURE;
        default:
            return stage_rank(last.stage) <= stage_rank(Stage::ValidateEnv)
                       ? EXIT_VALIDATION_FAILURE
                       : EXIT_TASK_FAILURE;
    }
}

Collaborators default_collaborators(const Config& config, std::istream& in, std::ostream& out) {
    Collaborators c;
    c.picker = make_picker(config.picker(), in, out);
    c.metrics = std::make_shared<HostMetricsSource>();
    c.task_runner = std::make_shared<ProcessTaskRunner>();
    c.copier = std::make_shared<LocalFileCopier>();
    c.schema = std::make_shared<SessionSchemaMapper>();
    c.credentials = std::make_shared<ChainedCredentialProvider>(
        std::vector<std::shared_ptr<const CredentialProvider>>{
            std::make_shared<EnvCredentialProvider>(),
            std::make_shared<FileCredentialProvider>(),
        });
    return c;
}

Launcher::Launcher(Collaborators collaborators)
    : c_(std::move(collaborators)) {}

// ── Bookkeeping ─────────────────────────────────────────────

void Launcher::status(const std::string& msg) {
    if (on_status_) on_status_(msg);
}

void Launcher::log(RunContext& ctx, const std::string& level, const std::string& msg) {
    append_session_log(ctx.session_dir, level, msg, ctx.config.logging().debug);
    expctl_log(fmt::format("launcher: {} {}", level, msg));
}

Result<void> Launcher::persist(RunContext& ctx) {
    if (ctx.session_dir.empty()) return Result<void>::Ok();
    ManifestStore store(ctx.session_dir);
    auto r = store.save(ctx.manifest);
    if (r.is_err()) {
        log(ctx, "ERROR", fmt::format("manifest not saved: {}", r.error));
        if (ctx.unsaved.empty()) ctx.unsaved = r.error;
    }
    return r;
}

Launcher::StageOutcome Launcher::unsaved_outcome(RunContext& ctx, Stage stage) const {
    return StageOutcome::Fail(default_kind(stage),
                              fmt::format("session manifest not saved: {}", ctx.unsaved),
                              ManifestStore(ctx.session_dir).path().string());
}

void Launcher::enter(RunContext& ctx, Stage stage) {
    auto& s = ctx.session();
    if (!s.history.empty() && !can_transition(s.stage, stage)) {
        throw std::logic_error(fmt::format("illegal transition {} -> {}",
                                           stage_name(s.stage), stage_name(stage)));
    }
    s.stage = stage;
    s.history.push_back({stage, OUTCOME_RUNNING, now_iso(), ""});
    persist(ctx);
    log(ctx, "INFO", fmt::format("entering {}", stage_name(stage)));
}

void Launcher::finish_stage(RunContext& ctx, const std::string& outcome, const std::string& message) {
    auto& rec = ctx.session().history.back();
    rec.outcome = outcome;
    rec.message = message;
    persist(ctx);
}

void Launcher::finalize(RunContext& ctx, Stage terminal) {
    auto& s = ctx.session();
    s.stage = terminal;
    s.status = terminal;
    s.end_time = now_iso();
    s.history.push_back({terminal, OUTCOME_FINAL, s.end_time, ""});
    persist(ctx);
    log(ctx, "INFO", fmt::format("session {} finished: {}", s.id, stage_name(terminal)));
}

void Launcher::record_error(RunContext& ctx, Stage stage, ErrorKind kind,
                            const std::string& cause, const std::string& entity) {
    StageError e;
    e.stage = stage;
    e.kind = kind;
    e.timestamp = now_iso();
    e.cause = cause;
    e.entity = entity;
    ctx.manifest.errors.push_back(e);
    log(ctx, kind == ErrorKind::Abort ? "WARN" : "ERROR",
        fmt::format("{} [{}]: {}{}", stage_name(stage), error_kind_name(kind), cause,
                    entity.empty() ? "" : " (" + entity + ")"));
}

SessionResult Launcher::make_result(RunContext& ctx) {
    SessionResult r;
    r.session = ctx.manifest.session;
    r.final_stage = r.session.status.value_or(r.session.stage);
    r.git = ctx.manifest.git;
    r.snapshots = ctx.manifest.snapshots;
    r.record = ctx.manifest.record;
    r.ledger = ctx.ledger;
    r.errors = ctx.manifest.errors;
    r.exit_code = exit_code_for(r.final_stage, r.errors);
    return r;
}

// ── Pipeline ────────────────────────────────────────────────

SessionResult Launcher::run(const Config& config, AbortToken& abort) {
    RunContext ctx(config, abort);
    ctx.session().start_time = now_iso();

    std::optional<Stage> terminal;
    for (Stage stage : kPipeline) {
        if (abort.requested()) {
            record_error(ctx, ctx.session().stage, ErrorKind::Abort, abort.reason(), "");
            terminal = Stage::Aborted;
            break;
        }

        enter(ctx, stage);
        status(fmt::format("{}...", stage_name(stage)));

        StageOutcome out = ctx.unsaved.empty() ? execute_stage(ctx, stage) : unsaved_outcome(ctx, stage);
        if (out.ok) {
            finish_stage(ctx, OUTCOME_OK, "");
            if (ctx.unsaved.empty()) continue;
            out = unsaved_outcome(ctx, stage);
        }

        record_error(ctx, stage, out.kind, out.cause, out.entity);

        if (out.kind == ErrorKind::Abort) {
            finish_stage(ctx, OUTCOME_ABORTED, out.cause);
            terminal = Stage::Aborted;
            break;
        }
        if (config.is_optional(stage) && ctx.unsaved.empty()) {
            finish_stage(ctx, OUTCOME_SKIPPED, out.cause);
            log(ctx, "WARN", fmt::format("{} is optional; continuing", stage_name(stage)));
            status(fmt::format("{} skipped: {}", stage_name(stage), out.cause));
            continue;
        }

        finish_stage(ctx, OUTCOME_FAILED, out.cause);
        // The task already ran; what is left is recoverable from the ledger
        terminal = stage == Stage::TransferData ? Stage::Partial : Stage::Failed;
        break;
    }

    finalize(ctx, terminal.value_or(Stage::Done));
    return make_result(ctx);
}

// A failure that raced an abort request is reported as the abort.
Launcher::StageOutcome Launcher::execute_stage(RunContext& ctx, Stage stage) {
    StageOutcome out;
    try {
        out = run_stage(ctx, stage);
    } catch (const PickerError& e) {
        out = StageOutcome::Fail(ErrorKind::Picker, e.what(), e.decision());
    } catch (const std::exception& e) {
        out = StageOutcome::Fail(default_kind(stage), fmt::format("unexpected error: {}", e.what()));
    }
    if (!out.ok && out.kind != ErrorKind::Abort && ctx.abort.requested()) {
        log(ctx, "WARN", fmt::format("{} failed after abort request: {}", stage_name(stage), out.cause));
        out = StageOutcome::Fail(ErrorKind::Abort, ctx.abort.reason(), out.entity);
    }
    return out;
}

Launcher::StageOutcome Launcher::run_stage(RunContext& ctx, Stage stage) {
    switch (stage) {
        case Stage::Init:         return stage_init(ctx);
        case Stage::ValidateEnv:  return stage_validate_env(ctx);
        case Stage::RunTask:      return stage_run_task(ctx);
        case Stage::MapMetadata:  return stage_map_metadata(ctx);
        case Stage::TransferData: return stage_transfer_data(ctx);
        default: break;
    }
    throw std::logic_error(fmt::format("{} is not a pipeline stage", stage_name(stage)));
}

// ── INIT ────────────────────────────────────────────────────

Launcher::StageOutcome Launcher::stage_init(RunContext& ctx) {
    auto& s = ctx.session();
    const auto& sc = ctx.config.session();

    s.operator_name = sc.operator_name;
    if (s.operator_name.empty()) {
        s.operator_name = c_.picker->input_text(
            {DECISION_OPERATOR, "Operator name", platform::username()});
    }

    s.subject = sc.subject;
    if (s.subject.empty()) {
        if (!sc.subjects.empty()) {
            s.subject = c_.picker->pick_one({DECISION_SUBJECT, "Subject", ""}, sc.subjects);
        } else {
            s.subject = c_.picker->input_text({DECISION_SUBJECT, "Subject id", ""}, check_subject);
        }
    }
    if (auto problem = check_subject(s.subject)) {
        return StageOutcome::Fail(ErrorKind::Validation, *problem, "session.subject");
    }

    s.rig_id = ctx.config.rig().id.empty() ? platform::hostname() : ctx.config.rig().id;

    const auto& data_root = ctx.config.rig().data_root;
    if (data_root.empty()) {
        return StageOutcome::Fail(ErrorKind::Validation, "rig.data_root is not set", "rig.data_root");
    }

    s.id = fmt::format(SESSION_DIR_FORMAT, s.subject, now_compact());
    fs::path dir = fs::path(data_root) / s.subject / s.id;

    std::error_code ec;
    if (fs::exists(dir, ec)) {
        return StageOutcome::Fail(ErrorKind::Validation,
                                  fmt::format("session directory {} already exists", dir.string()),
                                  dir.string());
    }
    fs::create_directories(dir / STATE_DIR_NAME, ec);
    if (ec) {
        return StageOutcome::Fail(ErrorKind::Validation,
                                  fmt::format("cannot create {}: {}", dir.string(), ec.message()),
                                  dir.string());
    }

    ctx.session_dir = dir;
    s.session_dir = dir.string();
    log(ctx, "INFO", fmt::format("session {} (operator {}, rig {}) in {}",
                                 s.id, s.operator_name, s.rig_id, dir.string()));
    return StageOutcome::Ok();
}

// ── VALIDATE_ENV ────────────────────────────────────────────

Launcher::StageOutcome Launcher::stage_validate_env(RunContext& ctx) {
    const auto& repo = ctx.config.repository();

    GitManager git;
    auto state = git.validate(repo.path, repo.policy, repo.version);
    if (state.is_err()) {
        return StageOutcome::Fail(ErrorKind::Validation, state.error, repo.path);
    }
    ctx.manifest.git = state.value;

    const auto& g = state.value;
    log(ctx, "INFO", fmt::format("repository {} at {} ({}){}", repo.path,
                                 g.commit.empty() ? "-" : g.commit.substr(0, 12),
                                 g.branch.empty() ? "detached" : g.branch,
                                 g.tag.empty() ? "" : ", tag " + g.tag));
    for (const auto& v : g.violations) {
        log(ctx, "WARN", fmt::format("git ({}): {}", git_policy_name(g.policy), v));
    }

    if (ctx.config.task().command.empty()) {
        return StageOutcome::Fail(ErrorKind::Validation, "task.command is not set", "task.command");
    }
    return StageOutcome::Ok();
}

// ── RUN_TASK ────────────────────────────────────────────────

Launcher::StageOutcome Launcher::stage_run_task(RunContext& ctx) {
    const auto& res = ctx.config.resources();
    ResourceMonitor monitor(c_.metrics, ctx.session_dir, ctx.config.transfer().destination);

    auto gate = monitor.check(res.run, Checkpoint::Run);
    ctx.manifest.snapshots.push_back(gate);
    if (!gate.passed) {
        return StageOutcome::Fail(ErrorKind::Validation,
                                  fmt::format("resource gate failed: {}", join(gate.details, "; ")),
                                  join(gate.failing, ","));
    }

    if (any_enabled(res.background)) {
        AbortToken& abort = ctx.abort;
        monitor.start_background(res.background, res.poll_interval_ms,
                                 [&abort](const ResourceSnapshot& snap) {
                                     abort.request(fmt::format("resource breach during task: {}",
                                                               join(snap.details, "; ")));
                                 });
    }

    auto& s = ctx.session();
    TaskVariables vars{ctx.session_dir.string(), s.subject, s.id, s.rig_id};
    auto spec = make_task_spec(ctx.config.task(), ctx.session_dir, vars);
    log(ctx, "INFO", fmt::format("starting task: {} {}", spec.command, join(spec.args, " ")));

    auto outcome = c_.task_runner->run(spec, ctx.abort);

    monitor.stop_background();
    if (auto breach = monitor.breach()) {
        ctx.manifest.snapshots.push_back(*breach);
    }

    if (outcome.aborted) {
        log(ctx, "WARN", "task process terminated");
        return StageOutcome::Fail(ErrorKind::Abort, ctx.abort.reason(), spec.command);
    }
    if (!outcome.success()) {
        return StageOutcome::Fail(ErrorKind::Task, outcome.error, spec.command);
    }
    log(ctx, "INFO", fmt::format("task finished in {}s", outcome.duration_secs));
    return StageOutcome::Ok();
}

// ── MAP_METADATA ────────────────────────────────────────────

Launcher::StageOutcome Launcher::stage_map_metadata(RunContext& ctx) {
    const auto& mc = ctx.config.mapping();
    fs::path output = ctx.session_dir / ctx.config.task().output_file;

    MappingContext mctx;
    mctx.session_id = ctx.session().id;
    mctx.rig_id = ctx.session().rig_id;
    if (ctx.manifest.git) {
        mctx.commit = ctx.manifest.git->commit;
        mctx.branch = ctx.manifest.git->branch;
        mctx.repo_dirty = ctx.manifest.git->dirty;
        mctx.version = ctx.manifest.git->tag;
    }

    DataMapper mapper(c_.schema);
    int max_attempts = mc.on_error == MappingErrorPolicy::Remediate ? std::max(1, mc.max_attempts) : 1;

    std::string error;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (ctx.abort.requested()) {
            return StageOutcome::Fail(ErrorKind::Abort, ctx.abort.reason(), output.string());
        }

        auto raw = load_raw_output(output);
        if (raw.is_ok()) {
            auto record = mapper.map(raw.value, mctx);
            if (record.is_ok()) {
                ctx.manifest.record = record.value;
                log(ctx, "INFO", fmt::format("mapped {} field(s) into {} {}",
                                             record.value.fields.size(), record.value.schema,
                                             record.value.schema_version));
                return StageOutcome::Ok();
            }
            error = record.error;
        } else {
            error = raw.error;
        }

        log(ctx, "WARN", fmt::format("mapping attempt {} failed: {}", attempt, error));
        if (attempt == max_attempts) break;

        DecisionPoint retry{DECISION_RETRY_MAPPING,
                            fmt::format("Mapping failed ({}). Fix {} and retry?",
                                        error, output.filename().string()),
                            "y"};
        if (!c_.picker->confirm(retry)) break;
    }

    return StageOutcome::Fail(ErrorKind::Mapping, error, output.string());
}

// ── TRANSFER_DATA ───────────────────────────────────────────

Result<std::shared_ptr<TransferBackend>> Launcher::transfer_backend(const Config& config) const {
    if (c_.backend) {
        return Result<std::shared_ptr<TransferBackend>>::Ok(c_.backend);
    }
    return make_transfer_backend(config.transfer(), c_.credentials);
}

Launcher::StageOutcome Launcher::stage_transfer_data(RunContext& ctx) {
    const auto& tc = ctx.config.transfer();
    auto& s = ctx.session();

    if (tc.destination.empty()) {
        return StageOutcome::Fail(ErrorKind::TransferPermanent,
                                  "transfer.destination is not set", "transfer.destination");
    }

    ResourceMonitor monitor(c_.metrics, ctx.session_dir, tc.destination);
    auto gate = monitor.check(ctx.config.resources().transfer, Checkpoint::Transfer);
    ctx.manifest.snapshots.push_back(gate);
    if (!gate.passed) {
        return StageOutcome::Fail(ErrorKind::Validation,
                                  fmt::format("resource gate failed: {}", join(gate.details, "; ")),
                                  join(gate.failing, ","));
    }

    fs::path dest_root = fs::path(tc.destination) / s.subject / s.id;
    DecisionPoint confirm{DECISION_CONFIRM_TRANSFER,
                          fmt::format("Transfer {} to {}?", s.id, dest_root.string()), "y"};
    if (!c_.picker->confirm(confirm)) {
        return StageOutcome::Fail(ErrorKind::TransferPermanent, "transfer declined by operator",
                                  dest_root.string());
    }

    PathFilter filter(ctx.session_dir, tc.exclude);
    auto ledger = build_ledger(s.id, ctx.session_dir, dest_root, filter, tc.fingerprint);
    if (ledger.is_err()) {
        return StageOutcome::Fail(ErrorKind::TransferPermanent, ledger.error, ctx.session_dir.string());
    }
    return transfer_ledger(ctx, ledger.value, nullptr);
}

Launcher::StageOutcome Launcher::transfer_ledger(RunContext& ctx, Ledger ledger,
                                                 const PathFilter* reconcile_with) {
    auto backend = transfer_backend(ctx.config);
    if (backend.is_err()) {
        return StageOutcome::Fail(ErrorKind::TransferPermanent, backend.error, "transfer.notify");
    }

    auto store = std::make_shared<LedgerStore>(ctx.session_dir);
    ctx.manifest.ledger_file = (fs::path(STATE_DIR_NAME) / LEDGER_FILE_NAME).generic_string();
    if (auto saved = persist(ctx); saved.is_err()) {
        return StageOutcome::Fail(ErrorKind::TransferPermanent,
                                  fmt::format("session manifest not saved: {}", saved.error),
                                  ManifestStore(ctx.session_dir).path().string());
    }

    TransferOptions options;
    options.workers = std::clamp(ctx.config.transfer().workers, 1, MAX_TRANSFER_WORKERS);
    options.retry = ctx.config.retry();

    DataTransfer transfer(options, c_.copier, backend.value, store);
    if (c_.sleeper) transfer.set_sleeper(c_.sleeper);

    if (reconcile_with) {
        ledger = transfer.reconcile(std::move(ledger), *reconcile_with);
    }

    fs::path destination = ledger.destination_root;
    status(fmt::format("Transferring {} file(s) to {}", ledger.jobs.size(), destination.string()));
    log(ctx, "INFO", fmt::format("transfer: {} job(s), {} confirmed, notify via {}",
                                 ledger.jobs.size(), ledger.count(JobState::Confirmed),
                                 backend.value->name()));

    auto done = transfer.transfer(std::move(ledger), destination, &ctx.abort);
    ctx.ledger = done;

    if (!transfer.persist_error().empty()) {
        return StageOutcome::Fail(ErrorKind::TransferPermanent,
                                  fmt::format("transfer ledger not saved: {}", transfer.persist_error()),
                                  store->path().string());
    }
    // Everything landed and was announced before the abort arrived
    if (done.all_confirmed() && done.notified) {
        log(ctx, "INFO", fmt::format("transfer complete: {} file(s) confirmed, {} notified",
                                     done.jobs.size(), backend.value->name()));
        return StageOutcome::Ok();
    }
    if (ctx.abort.requested()) {
        log(ctx, "WARN", fmt::format("transfer stopped; ledger saved at {}", store->path().string()));
        return StageOutcome::Fail(ErrorKind::Abort, ctx.abort.reason(), store->path().string());
    }

    int total = static_cast<int>(done.jobs.size());
    int confirmed = done.count(JobState::Confirmed);
    if (confirmed < total) {
        for (const auto& j : done.jobs) {
            if (j.state != JobState::Failed) continue;
            record_error(ctx, Stage::TransferData,
                         j.permanent ? ErrorKind::TransferPermanent : ErrorKind::TransferTransient,
                         j.last_error, j.relative_path);
        }
        return StageOutcome::Fail(ErrorKind::TransferPermanent,
                                  fmt::format("{} of {} file(s) not transferred", total - confirmed, total),
                                  store->path().string());
    }

    if (!done.notified) {
        std::string cause = done.notification_error.empty()
                                ? fmt::format("{} was not notified", backend.value->name())
                                : done.notification_error;
        return StageOutcome::Fail(ErrorKind::TransferPermanent, cause, backend.value->name());
    }

    log(ctx, "INFO", fmt::format("transfer complete: {} file(s) confirmed, {} notified",
                                 total, backend.value->name()));
    return StageOutcome::Ok();
}

// ── Resume ──────────────────────────────────────────────────

SessionResult Launcher::resume(const Config& config, const fs::path& session_dir, AbortToken& abort) {
    RunContext ctx(config, abort);
    ctx.session_dir = session_dir;

    auto refuse = [&](const std::string& why) {
        log(ctx, "ERROR", fmt::format("resume refused: {}", why));
        SessionResult r;
        r.session = ctx.manifest.session;
        r.final_stage = Stage::Failed;
        r.exit_code = EXIT_VALIDATION_FAILURE;
        StageError e;
        e.stage = Stage::TransferData;
        e.kind = ErrorKind::Validation;
        e.timestamp = now_iso();
        e.cause = why;
        e.entity = session_dir.string();
        r.errors.push_back(e);
        return r;
    };

    ManifestStore mstore(session_dir);
    auto loaded = mstore.load();
    if (loaded.is_err()) {
        return refuse(loaded.error);
    }
    ctx.manifest = loaded.value;
    auto& s = ctx.session();

    bool reached_transfer = std::any_of(s.history.begin(), s.history.end(),
                                        [](const StageRecord& r) { return r.stage == Stage::TransferData; });
    if (!s.status || !reached_transfer ||
        (*s.status != Stage::Partial && *s.status != Stage::Done && *s.status != Stage::Aborted)) {
        return refuse(fmt::format("session {} ended in {} before its data could be transferred",
                                  s.id, s.status ? stage_name(*s.status) : stage_name(s.stage)));
    }

    const auto& tc = config.transfer();
    PathFilter filter(session_dir, tc.exclude);
    LedgerStore lstore(session_dir);

    Ledger ledger;
    if (lstore.exists()) {
        auto l = lstore.load();
        if (l.is_err()) return refuse(l.error);
        ledger = l.value;
    } else {
        if (tc.destination.empty()) {
            return refuse("no transfer ledger and transfer.destination is not set");
        }
        auto built = build_ledger(s.id, session_dir, fs::path(tc.destination) / s.subject / s.id,
                                  filter, tc.fingerprint);
        if (built.is_err()) return refuse(built.error);
        ledger = built.value;
    }
    if (ledger.destination_root.empty()) {
        return refuse("ledger has no destination");
    }

    log(ctx, "INFO", fmt::format("resuming transfer for {} ({} job(s))", s.id, ledger.jobs.size()));

    ResourceMonitor monitor(c_.metrics, session_dir, ledger.destination_root);
    auto gate = monitor.check(config.resources().transfer, Checkpoint::Transfer);
    ctx.manifest.snapshots.push_back(gate);

    StageOutcome out;
    if (!gate.passed) {
        out = StageOutcome::Fail(ErrorKind::Validation,
                                 fmt::format("resource gate failed: {}", join(gate.details, "; ")),
                                 join(gate.failing, ","));
    } else {
        try {
            out = transfer_ledger(ctx, ledger, &filter);
        } catch (const std::exception& e) {
            out = StageOutcome::Fail(ErrorKind::TransferPermanent,
                                     fmt::format("unexpected error: {}", e.what()));
        }
        if (!out.ok && out.kind != ErrorKind::Abort && abort.requested()) {
            out = StageOutcome::Fail(ErrorKind::Abort, abort.reason(), out.entity);
        }
    }

    RecoveryRecord rec;
    rec.timestamp = now_iso();
    rec.result = out.ok ? Stage::Done : (out.kind == ErrorKind::Abort ? Stage::Aborted : Stage::Partial);
    const Ledger& result_ledger = ctx.ledger ? *ctx.ledger : ledger;
    rec.total = static_cast<int>(result_ledger.jobs.size());
    rec.confirmed = result_ledger.count(JobState::Confirmed);
    rec.failed = result_ledger.count(JobState::Failed);
    rec.notified = result_ledger.notified;
    rec.message = out.ok ? "" : out.cause;

    if (!out.ok) {
        record_error(ctx, Stage::TransferData, out.kind, out.cause, out.entity);
    }
    ctx.manifest.recoveries.push_back(rec);
    if (auto saved = persist(ctx); saved.is_err()) {
        record_error(ctx, Stage::TransferData, ErrorKind::TransferPermanent,
                     fmt::format("session manifest not saved: {}", saved.error), mstore.path().string());
        if (rec.result == Stage::Done) rec.result = Stage::Partial;
        ctx.manifest.recoveries.back().result = rec.result;
    }

    log(ctx, "INFO", fmt::format("resume finished: {} ({}/{} confirmed)",
                                 stage_name(rec.result), rec.confirmed, rec.total));

    auto result = make_result(ctx);
    result.final_stage = rec.result;
    result.exit_code = exit_code_for(rec.result, result.errors);
    return result;
}
