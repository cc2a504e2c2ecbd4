#include "manifest.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <platform/file_io.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

// ── Emit ────────────────────────────────────────────────────

static void emit_strings(YAML::Emitter& out, const char* key, const std::vector<std::string>& v) {
    out << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& s : v) out << s;
    out << YAML::EndSeq;
}

static void emit_session(YAML::Emitter& out, const Session& s) {
    out << YAML::Key << "session" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << s.id;
    out << YAML::Key << "start_time" << YAML::Value << s.start_time;
    out << YAML::Key << "end_time" << YAML::Value << s.end_time;
    out << YAML::Key << "operator" << YAML::Value << s.operator_name;
    out << YAML::Key << "subject" << YAML::Value << s.subject;
    out << YAML::Key << "rig_id" << YAML::Value << s.rig_id;
    out << YAML::Key << "session_dir" << YAML::Value << s.session_dir;
    out << YAML::Key << "stage" << YAML::Value << stage_name(s.stage);
    out << YAML::Key << "status" << YAML::Value << (s.status ? stage_name(*s.status) : "");

    out << YAML::Key << "history" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : s.history) {
        out << YAML::BeginMap;
        out << YAML::Key << "stage" << YAML::Value << stage_name(r.stage);
        out << YAML::Key << "outcome" << YAML::Value << r.outcome;
        out << YAML::Key << "timestamp" << YAML::Value << r.timestamp;
        if (!r.message.empty()) {
            out << YAML::Key << "message" << YAML::Value << r.message;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

static void emit_git(YAML::Emitter& out, const GitState& g) {
    out << YAML::Key << "git" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "is_repo" << YAML::Value << g.is_repo;
    out << YAML::Key << "commit" << YAML::Value << g.commit;
    out << YAML::Key << "branch" << YAML::Value << g.branch;
    out << YAML::Key << "tag" << YAML::Value << g.tag;
    out << YAML::Key << "dirty" << YAML::Value << g.dirty;
    out << YAML::Key << "version_ok" << YAML::Value << g.version_ok;
    out << YAML::Key << "version_constraint" << YAML::Value << g.version_constraint;
    out << YAML::Key << "policy" << YAML::Value << git_policy_name(g.policy);
    emit_strings(out, "violations", g.violations);
    out << YAML::EndMap;
}

static void emit_snapshot(YAML::Emitter& out, const ResourceSnapshot& s) {
    out << YAML::BeginMap;
    out << YAML::Key << "timestamp" << YAML::Value << s.timestamp;
    out << YAML::Key << "checkpoint" << YAML::Value << checkpoint_name(s.checkpoint);
    out << YAML::Key << "free_disk_local_mb" << YAML::Value << s.free_disk_local_mb;
    out << YAML::Key << "free_disk_destination_mb" << YAML::Value << s.free_disk_destination_mb;
    out << YAML::Key << "free_memory_mb" << YAML::Value << s.free_memory_mb;
    out << YAML::Key << "load_1m" << YAML::Value << s.load_1m;
    out << YAML::Key << "passed" << YAML::Value << s.passed;
    emit_strings(out, "failing", s.failing);
    emit_strings(out, "details", s.details);
    out << YAML::EndMap;
}

static void emit_record(YAML::Emitter& out, const SchemaRecord& r) {
    out << YAML::Key << "record" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "schema" << YAML::Value << r.schema;
    out << YAML::Key << "schema_version" << YAML::Value << r.schema_version;
    out << YAML::Key << "mapped_at" << YAML::Value << r.mapped_at;
    // A sequence of single-key maps keeps field order
    out << YAML::Key << "fields" << YAML::Value << YAML::BeginSeq;
    for (const auto& [k, v] : r.fields) {
        out << YAML::Flow << YAML::BeginMap << YAML::Key << k << YAML::Value << v << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

std::string manifest_to_yaml(const Manifest& m) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    emit_session(out, m.session);
    if (m.git) emit_git(out, *m.git);

    out << YAML::Key << "snapshots" << YAML::Value << YAML::BeginSeq;
    for (const auto& s : m.snapshots) emit_snapshot(out, s);
    out << YAML::EndSeq;

    if (m.record) emit_record(out, *m.record);

    out << YAML::Key << "errors" << YAML::Value << YAML::BeginSeq;
    for (const auto& e : m.errors) {
        out << YAML::BeginMap;
        out << YAML::Key << "stage" << YAML::Value << stage_name(e.stage);
        out << YAML::Key << "kind" << YAML::Value << error_kind_name(e.kind);
        out << YAML::Key << "timestamp" << YAML::Value << e.timestamp;
        out << YAML::Key << "cause" << YAML::Value << e.cause;
        out << YAML::Key << "entity" << YAML::Value << e.entity;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "ledger_file" << YAML::Value << m.ledger_file;

    out << YAML::Key << "recoveries" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : m.recoveries) {
        out << YAML::BeginMap;
        out << YAML::Key << "timestamp" << YAML::Value << r.timestamp;
        out << YAML::Key << "result" << YAML::Value << stage_name(r.result);
        out << YAML::Key << "confirmed" << YAML::Value << r.confirmed;
        out << YAML::Key << "failed" << YAML::Value << r.failed;
        out << YAML::Key << "total" << YAML::Value << r.total;
        out << YAML::Key << "notified" << YAML::Value << r.notified;
        out << YAML::Key << "message" << YAML::Value << r.message;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

// ── Parse ───────────────────────────────────────────────────

static std::vector<std::string> load_strings(const YAML::Node& n) {
    std::vector<std::string> out;
    if (n && n.IsSequence()) {
        for (const auto& s : n) out.push_back(s.as<std::string>(""));
    }
    return out;
}

static Stage load_stage(const YAML::Node& n, Stage fallback) {
    auto s = stage_from_name(n.as<std::string>(""));
    return s ? *s : fallback;
}

Result<Manifest> manifest_from_yaml(const std::string& text) {
    Manifest m;
    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap() || !root["session"]) {
            return Result<Manifest>::Err("manifest has no session section");
        }

        auto s = root["session"];
        m.session.id = s["id"].as<std::string>("");
        m.session.start_time = s["start_time"].as<std::string>("");
        m.session.end_time = s["end_time"].as<std::string>("");
        m.session.operator_name = s["operator"].as<std::string>("");
        m.session.subject = s["subject"].as<std::string>("");
        m.session.rig_id = s["rig_id"].as<std::string>("");
        m.session.session_dir = s["session_dir"].as<std::string>("");
        m.session.stage = load_stage(s["stage"], Stage::Init);
        m.session.status = stage_from_name(s["status"].as<std::string>(""));

        if (s["history"] && s["history"].IsSequence()) {
            for (const auto& n : s["history"]) {
                auto stage = stage_from_name(n["stage"].as<std::string>(""));
                if (!stage) {
                    return Result<Manifest>::Err(fmt::format(
                        "unknown stage '{}' in history", n["stage"].as<std::string>("")));
                }
                StageRecord r;
                r.stage = *stage;
                r.outcome = n["outcome"].as<std::string>("");
                r.timestamp = n["timestamp"].as<std::string>("");
                r.message = n["message"].as<std::string>("");
                m.session.history.push_back(r);
            }
        }

        if (auto g = root["git"]) {
            GitState gs;
            gs.is_repo = g["is_repo"].as<bool>(false);
            gs.commit = g["commit"].as<std::string>("");
            gs.branch = g["branch"].as<std::string>("");
            gs.tag = g["tag"].as<std::string>("");
            gs.dirty = g["dirty"].as<bool>(false);
            gs.version_ok = g["version_ok"].as<bool>(true);
            gs.version_constraint = g["version_constraint"].as<std::string>("");
            gs.policy = git_policy_from_name(g["policy"].as<std::string>("strict"))
                            .value_or(GitPolicy::Strict);
            gs.violations = load_strings(g["violations"]);
            m.git = gs;
        }

        if (root["snapshots"] && root["snapshots"].IsSequence()) {
            for (const auto& n : root["snapshots"]) {
                ResourceSnapshot snap;
                snap.timestamp = n["timestamp"].as<std::string>("");
                snap.checkpoint = checkpoint_from_name(n["checkpoint"].as<std::string>("run"))
                                      .value_or(Checkpoint::Run);
                snap.free_disk_local_mb = n["free_disk_local_mb"].as<int64_t>(-1);
                snap.free_disk_destination_mb = n["free_disk_destination_mb"].as<int64_t>(-1);
                snap.free_memory_mb = n["free_memory_mb"].as<int64_t>(-1);
                snap.load_1m = n["load_1m"].as<double>(-1.0);
                snap.passed = n["passed"].as<bool>(true);
                snap.failing = load_strings(n["failing"]);
                snap.details = load_strings(n["details"]);
                m.snapshots.push_back(snap);
            }
        }

        if (auto r = root["record"]) {
            SchemaRecord rec;
            rec.schema = r["schema"].as<std::string>("");
            rec.schema_version = r["schema_version"].as<std::string>("");
            rec.mapped_at = r["mapped_at"].as<std::string>("");
            if (r["fields"] && r["fields"].IsSequence()) {
                for (const auto& f : r["fields"]) {
                    for (const auto& kv : f) {
                        rec.fields.emplace_back(kv.first.as<std::string>(),
                                                kv.second.as<std::string>(""));
                    }
                }
            }
            m.record = rec;
        }

        if (root["errors"] && root["errors"].IsSequence()) {
            for (const auto& n : root["errors"]) {
                StageError e;
                e.stage = load_stage(n["stage"], Stage::Init);
                e.kind = error_kind_from_name(n["kind"].as<std::string>(""))
                             .value_or(ErrorKind::Validation);
                e.timestamp = n["timestamp"].as<std::string>("");
                e.cause = n["cause"].as<std::string>("");
                e.entity = n["entity"].as<std::string>("");
                m.errors.push_back(e);
            }
        }

        m.ledger_file = root["ledger_file"].as<std::string>("");

        if (root["recoveries"] && root["recoveries"].IsSequence()) {
            for (const auto& n : root["recoveries"]) {
                RecoveryRecord r;
                r.timestamp = n["timestamp"].as<std::string>("");
                r.result = load_stage(n["result"], Stage::Partial);
                r.confirmed = n["confirmed"].as<int>(0);
                r.failed = n["failed"].as<int>(0);
                r.total = n["total"].as<int>(0);
                r.notified = n["notified"].as<bool>(false);
                r.message = n["message"].as<std::string>("");
                m.recoveries.push_back(r);
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<Manifest>::Err(fmt::format("cannot parse manifest: {}", e.what()));
    }
    return Result<Manifest>::Ok(m);
}

// ── ManifestStore ───────────────────────────────────────────

ManifestStore::ManifestStore(const fs::path& session_dir)
    : manifest_path_(session_dir / STATE_DIR_NAME / MANIFEST_FILE_NAME) {}

bool ManifestStore::exists() const {
    std::error_code ec;
    return fs::exists(manifest_path_, ec);
}

Result<Manifest> ManifestStore::load() const {
    if (!exists()) {
        return Result<Manifest>::Err(fmt::format("no session manifest at {}", manifest_path_.string()));
    }

    platform::FileLock lock(manifest_path_);
    if (!lock.locked()) {
        return Result<Manifest>::Err(lock.error());
    }

    std::ifstream in(manifest_path_);
    std::stringstream ss;
    ss << in.rdbuf();
    return manifest_from_yaml(ss.str());
}

Result<void> ManifestStore::save(const Manifest& manifest) const {
    std::error_code ec;
    fs::create_directories(manifest_path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("cannot create {}: {}",
                                             manifest_path_.parent_path().string(), ec.message()));
    }

    platform::FileLock lock(manifest_path_);
    if (!lock.locked()) {
        return Result<void>::Err(lock.error());
    }
    return platform::write_file_atomic(manifest_path_, manifest_to_yaml(manifest));
}
