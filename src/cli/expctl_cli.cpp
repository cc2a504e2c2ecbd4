#include "expctl_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/credentials.hpp>
#include <core/time_utils.hpp>
#include <managers/ledger.hpp>
#include <managers/manifest.hpp>
#include <managers/picker.hpp>
#include <platform/platform.hpp>
#include <ostream>
#include <fmt/format.h>

ExpctlCLI::ExpctlCLI(AbortToken& abort, std::istream& in, std::ostream& out)
    : abort_(abort), in_(in), out_(out) {
    factory_ = [this](const Config& config) {
        return default_collaborators(config, in_, out_);
    };

    add_command("run", [](ExpctlCLI& cli, const std::vector<std::string>& a) {
        return cli.run_session(a);
    }, "run [--config <file>] [--headless] [--debug]", "Run one experiment session");

    add_command("resume", [](ExpctlCLI& cli, const std::vector<std::string>& a) {
        return cli.run_resume(a);
    }, "resume <session_dir> [--config <file>]", "Retry the transfer of a finished session");

    add_command("status", [](ExpctlCLI& cli, const std::vector<std::string>& a) {
        return cli.run_status(a);
    }, "status <session_dir>", "Show stage history and transfer ledger");

    add_command("check", [](ExpctlCLI& cli, const std::vector<std::string>& a) {
        return cli.run_check(a);
    }, "check [--config <file>]", "Run preflight checks");

    add_command("setup", [](ExpctlCLI& cli, const std::vector<std::string>& a) {
        return cli.run_setup(a);
    }, "setup", "Write the rig config template and store credentials");
}

void ExpctlCLI::add_command(const std::string& name, CommandHandler handler,
                            const std::string& usage, const std::string& help) {
    commands_[name] = {std::move(handler), usage, help};
}

int ExpctlCLI::execute(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        out_ << theme::fail("Unknown command: " + command);
        out_ << theme::step("Run 'expctl --help' for available commands.");
        return EXIT_VALIDATION_FAILURE;
    }
    return it->second.handler(*this, args);
}

void ExpctlCLI::print_help() const {
    out_ << theme::banner();
    out_ << theme::section("Usage");
    for (const auto& [name, entry] : commands_) {
        out_ << theme::color::BLUE << fmt::format("    expctl {:<46}", entry.usage)
             << theme::color::RESET << theme::color::DIM << entry.help
             << theme::color::RESET << "\n";
    }
    out_ << "\n";
    out_ << theme::color::DIM
         << "    expctl --version        Show version\n"
         << "    expctl --help           Show this help"
         << theme::color::RESET << "\n\n";
    out_ << theme::section("Exit codes");
    out_ << theme::kv("0", "session done");
    out_ << theme::kv("1", "validation failure");
    out_ << theme::kv("2", "task or mapping failure");
    out_ << theme::kv("3", "transfer incomplete (partial)");
    out_ << theme::kv("130", "aborted") << "\n";
}

// ── Options ─────────────────────────────────────────────────

ExpctlCLI::Options ExpctlCLI::parse_options(const std::vector<std::string>& args) const {
    Options opts;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a == "--config" || a == "-c") {
            if (i + 1 >= args.size()) {
                opts.error = a + " needs a file argument";
                return opts;
            }
            opts.config_file = args[++i];
        } else if (a.rfind("--config=", 0) == 0) {
            opts.config_file = a.substr(9);
        } else if (a == "--headless") {
            opts.headless = true;
        } else if (a == "--debug") {
            opts.debug = true;
        } else if (a.size() > 1 && a[0] == '-') {
            opts.error = "Unknown option: " + a;
            return opts;
        } else {
            opts.positional.push_back(a);
        }
    }
    return opts;
}

Result<Config> ExpctlCLI::load_config(const Options& opts) const {
    auto loaded = Config::load(opts.config_file);
    if (loaded.is_err()) return loaded;
    if (opts.headless) loaded.value.force_headless();
    if (opts.debug) loaded.value.enable_debug();
    return loaded;
}

Launcher ExpctlCLI::make_launcher(const Config& config) {
    Launcher launcher(factory_(config));
    launcher.set_status_callback([this](const std::string& msg) {
        out_ << theme::step(msg);
        out_.flush();
    });
    return launcher;
}

// ── Output ──────────────────────────────────────────────────

static std::string stage_color(Stage s) {
    switch (s) {
        case Stage::Done:    return theme::green(stage_name(s));
        case Stage::Partial: return theme::yellow(stage_name(s));
        case Stage::Failed:
        case Stage::Aborted: return theme::red(stage_name(s));
        default:             return stage_name(s);
    }
}

void ExpctlCLI::print_ledger(const Ledger& ledger) const {
    int total = static_cast<int>(ledger.jobs.size());
    out_ << theme::kv("files", fmt::format("{} confirmed / {} total",
                                           ledger.count(JobState::Confirmed), total));
    if (int failed = ledger.count(JobState::Failed)) {
        out_ << theme::kv("failed", std::to_string(failed));
    }
    int waiting = ledger.count(JobState::Pending) + ledger.count(JobState::InFlight);
    if (waiting > 0) {
        out_ << theme::kv("pending", std::to_string(waiting));
    }
    out_ << theme::kv("destination", ledger.destination_root);
    out_ << theme::kv("notified", ledger.notified ? "yes" : "no");
    if (!ledger.notification_error.empty()) {
        out_ << theme::fail("notification: " + ledger.notification_error);
    }
    for (const auto& job : ledger.jobs) {
        if (job.state == JobState::Failed) {
            out_ << theme::fail(fmt::format("{} ({} attempt{}): {}", job.relative_path,
                                            job.attempts, job.attempts == 1 ? "" : "s",
                                            job.last_error));
        }
    }
}

void ExpctlCLI::print_result(const SessionResult& result) const {
    out_ << theme::section("Session");
    if (!result.session.id.empty()) {
        out_ << theme::kv("id", result.session.id);
        out_ << theme::kv("directory", result.session.session_dir);
    }
    out_ << theme::kv("result", stage_color(result.final_stage));
    if (result.ledger) {
        print_ledger(*result.ledger);
    }
    for (const auto& e : result.errors) {
        out_ << theme::fail(fmt::format("{} [{}] {}", stage_name(e.stage),
                                        error_kind_name(e.kind), e.cause));
    }
    if (result.final_stage == Stage::Partial && !result.session.session_dir.empty()) {
        out_ << theme::step("Retry with: expctl resume " + result.session.session_dir);
    }
    out_ << "\n";
}

// ── Commands ────────────────────────────────────────────────

int ExpctlCLI::run_session(const std::vector<std::string>& args) {
    auto opts = parse_options(args);
    if (!opts.error.empty()) {
        out_ << theme::fail(opts.error);
        return EXIT_VALIDATION_FAILURE;
    }

    auto config = load_config(opts);
    if (config.is_err()) {
        out_ << theme::fail(config.error);
        out_ << theme::step("Run 'expctl check' for details.");
        return EXIT_VALIDATION_FAILURE;
    }

    Launcher launcher = make_launcher(config.value);
    auto result = launcher.run(config.value, abort_);
    print_result(result);
    return result.exit_code;
}

int ExpctlCLI::run_resume(const std::vector<std::string>& args) {
    auto opts = parse_options(args);
    if (!opts.error.empty() || opts.positional.size() != 1) {
        out_ << theme::fail(opts.error.empty() ? "Usage: expctl resume <session_dir>" : opts.error);
        return EXIT_VALIDATION_FAILURE;
    }

    auto config = load_config(opts);
    if (config.is_err()) {
        out_ << theme::fail(config.error);
        return EXIT_VALIDATION_FAILURE;
    }

    fs::path dir = fs::absolute(opts.positional[0]).lexically_normal();
    Launcher launcher = make_launcher(config.value);
    auto result = launcher.resume(config.value, dir, abort_);
    if (result.session.session_dir.empty()) {
        result.session.session_dir = dir.string();
    }
    print_result(result);
    return result.exit_code;
}

int ExpctlCLI::run_status(const std::vector<std::string>& args) {
    auto opts = parse_options(args);
    if (!opts.error.empty() || opts.positional.size() != 1) {
        out_ << theme::fail(opts.error.empty() ? "Usage: expctl status <session_dir>" : opts.error);
        return EXIT_VALIDATION_FAILURE;
    }

    fs::path dir = fs::absolute(opts.positional[0]).lexically_normal();
    auto loaded = ManifestStore(dir).load();
    if (loaded.is_err()) {
        out_ << theme::fail(loaded.error);
        return EXIT_VALIDATION_FAILURE;
    }
    const auto& m = loaded.value;
    const auto& s = m.session;

    out_ << theme::section(s.id.empty() ? dir.filename().string() : s.id);
    out_ << theme::kv("subject", s.subject);
    out_ << theme::kv("operator", s.operator_name);
    out_ << theme::kv("rig", s.rig_id);
    if (!s.start_time.empty()) {
        out_ << theme::kv("started", s.start_time);
        out_ << theme::kv("duration", format_duration(s.start_time, s.end_time));
    }
    out_ << theme::kv("status", s.status ? stage_color(*s.status)
                                         : stage_name(s.stage) + theme::dim(" (in progress)"));
    if (m.git && m.git->is_repo) {
        out_ << theme::kv("commit", fmt::format("{}{}{}", m.git->commit.substr(0, 12),
                                                m.git->tag.empty() ? "" : " " + m.git->tag,
                                                m.git->dirty ? " (dirty)" : ""));
    }

    out_ << theme::section("History");
    for (const auto& rec : s.history) {
        std::string line = fmt::format("{:<14} {}{}", stage_name(rec.stage),
                                       theme::dim(format_clock(rec.timestamp)),
                                       rec.message.empty() ? "" : "  " + rec.message);
        if (rec.outcome == OUTCOME_FAILED || rec.outcome == OUTCOME_ABORTED) {
            out_ << theme::fail(line);
        } else if (rec.outcome == OUTCOME_SKIPPED || rec.outcome == OUTCOME_RUNNING) {
            out_ << theme::info(line + theme::dim(" " + rec.outcome));
        } else {
            out_ << theme::ok(line);
        }
    }

    if (!m.errors.empty()) {
        out_ << theme::section("Errors");
        for (const auto& e : m.errors) {
            out_ << theme::fail(fmt::format("{} [{}] {}{}", stage_name(e.stage),
                                            error_kind_name(e.kind), e.cause,
                                            e.entity.empty() ? "" : theme::dim(" (" + e.entity + ")")));
        }
    }

    LedgerStore lstore(dir);
    if (lstore.exists()) {
        out_ << theme::section("Transfer");
        auto ledger = lstore.load();
        if (ledger.is_ok()) {
            print_ledger(ledger.value);
        } else {
            out_ << theme::fail(ledger.error);
        }
    }

    if (!m.recoveries.empty()) {
        out_ << theme::section("Recoveries");
        for (const auto& r : m.recoveries) {
            out_ << theme::info(fmt::format("{} {}  {}/{} confirmed{}", r.timestamp,
                                            stage_color(r.result), r.confirmed, r.total,
                                            r.notified ? ", notified" : ""));
        }
    }
    out_ << "\n";
    return EXIT_OK;
}

int ExpctlCLI::run_check(const std::vector<std::string>& args) {
    auto opts = parse_options(args);
    if (!opts.error.empty()) {
        out_ << theme::fail(opts.error);
        return EXIT_VALIDATION_FAILURE;
    }

    ChainedCredentialProvider creds({std::make_shared<EnvCredentialProvider>(),
                                     std::make_shared<FileCredentialProvider>()});
    auto issues = run_preflight_checks(opts.config_file, creds);

    out_ << theme::section("Preflight");
    if (issues.empty()) {
        out_ << theme::ok("Ready to run") << "\n";
        return EXIT_OK;
    }
    for (const auto& issue : issues) {
        out_ << (issue.is_hint ? theme::warn(issue.message) : theme::fail(issue.message));
        if (!issue.fix.empty()) {
            out_ << theme::dim("      " + issue.fix) << "\n";
        }
    }
    out_ << "\n";
    return has_errors(issues) ? EXIT_VALIDATION_FAILURE : EXIT_OK;
}

int ExpctlCLI::run_setup(const std::vector<std::string>& args) {
    if (!args.empty()) {
        out_ << theme::fail("Usage: expctl setup");
        return EXIT_VALIDATION_FAILURE;
    }

    out_ << theme::section("Setup");
    bool existed = global_config_exists();
    auto created = create_default_global_config();
    if (created.is_err()) {
        out_ << theme::fail(created.error);
        return EXIT_VALIDATION_FAILURE;
    }
    out_ << (existed ? theme::info(get_global_config_path().string() + theme::dim(" (exists)"))
                     : theme::ok("Wrote " + get_global_config_path().string()));

    FileCredentialProvider store;
    auto current = store.get("user");
    InteractivePicker picker(in_, out_);
    try {
        std::string user = picker.input_text(
            {"user", "Name recorded on watchdog manifests",
             current.is_ok() ? current.value : platform::username()});
        auto saved = store.set("user", user);
        if (saved.is_err()) {
            out_ << theme::fail(saved.error);
            return EXIT_VALIDATION_FAILURE;
        }
        out_ << theme::ok("Stored credential 'user' in " + store.path().string());
    } catch (const PickerError& e) {
        if (abort_.requested()) {
            out_ << theme::warn("Setup interrupted: " + abort_.reason());
            return EXIT_ABORTED;
        }
        out_ << theme::fail(e.what());
        return EXIT_VALIDATION_FAILURE;
    }

    out_ << theme::step("Edit the rig config, then run 'expctl check'.") << "\n";
    return EXIT_OK;
}
