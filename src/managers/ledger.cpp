#include "ledger.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/file_io.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <sstream>

std::string job_state_name(JobState s) {
    switch (s) {
        case JobState::Pending:   return "PENDING";
        case JobState::InFlight:  return "IN_FLIGHT";
        case JobState::Confirmed: return "CONFIRMED";
        case JobState::Failed:    return "FAILED";
    }
    return "PENDING";
}

std::optional<JobState> job_state_from_name(const std::string& name) {
    if (name == "PENDING") return JobState::Pending;
    if (name == "IN_FLIGHT") return JobState::InFlight;
    if (name == "CONFIRMED") return JobState::Confirmed;
    if (name == "FAILED") return JobState::Failed;
    return std::nullopt;
}

// ── Ledger ──────────────────────────────────────────────────

TransferJob* Ledger::find(const std::string& relative_path) {
    for (auto& j : jobs) {
        if (j.relative_path == relative_path) return &j;
    }
    return nullptr;
}

int Ledger::count(JobState s) const {
    return static_cast<int>(std::count_if(jobs.begin(), jobs.end(),
                                          [s](const TransferJob& j) { return j.state == s; }));
}

bool Ledger::all_confirmed() const {
    return count(JobState::Confirmed) == static_cast<int>(jobs.size());
}

// ── YAML ────────────────────────────────────────────────────

std::string ledger_to_yaml(const Ledger& ledger) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "session_id" << YAML::Value << ledger.session_id;
    out << YAML::Key << "source_root" << YAML::Value << ledger.source_root;
    out << YAML::Key << "destination_root" << YAML::Value << ledger.destination_root;
    out << YAML::Key << "fingerprint_method" << YAML::Value
        << fingerprint_method_name(ledger.fingerprint_method);
    out << YAML::Key << "notified" << YAML::Value << ledger.notified;
    out << YAML::Key << "notification_error" << YAML::Value << ledger.notification_error;
    out << YAML::Key << "updated_at" << YAML::Value << ledger.updated_at;

    out << YAML::Key << "jobs" << YAML::Value << YAML::BeginSeq;
    for (const auto& j : ledger.jobs) {
        out << YAML::BeginMap;
        out << YAML::Key << "relative_path" << YAML::Value << j.relative_path;
        out << YAML::Key << "source" << YAML::Value << j.source;
        out << YAML::Key << "destination" << YAML::Value << j.destination;
        out << YAML::Key << "fingerprint" << YAML::Value << j.fingerprint;
        out << YAML::Key << "size" << YAML::Value << j.size;
        out << YAML::Key << "state" << YAML::Value << job_state_name(j.state);
        out << YAML::Key << "retry_count" << YAML::Value << j.retry_count;
        out << YAML::Key << "attempts" << YAML::Value << j.attempts;
        out << YAML::Key << "last_error" << YAML::Value << j.last_error;
        out << YAML::Key << "permanent" << YAML::Value << j.permanent;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<Ledger> ledger_from_yaml(const std::string& text) {
    Ledger ledger;
    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) {
            return Result<Ledger>::Err("ledger is not a YAML map");
        }

        ledger.session_id = root["session_id"].as<std::string>("");
        ledger.source_root = root["source_root"].as<std::string>("");
        ledger.destination_root = root["destination_root"].as<std::string>("");
        auto method = fingerprint_method_from_name(root["fingerprint_method"].as<std::string>("sha256"));
        if (!method) {
            return Result<Ledger>::Err(fmt::format("unknown fingerprint method '{}'",
                                                   root["fingerprint_method"].as<std::string>("")));
        }
        ledger.fingerprint_method = *method;
        ledger.notified = root["notified"].as<bool>(false);
        ledger.notification_error = root["notification_error"].as<std::string>("");
        ledger.updated_at = root["updated_at"].as<std::string>("");

        if (root["jobs"] && root["jobs"].IsSequence()) {
            for (const auto& n : root["jobs"]) {
                TransferJob j;
                j.relative_path = n["relative_path"].as<std::string>("");
                j.source = n["source"].as<std::string>("");
                j.destination = n["destination"].as<std::string>("");
                j.fingerprint = n["fingerprint"].as<std::string>("");
                j.size = n["size"].as<int64_t>(0);
                auto state = job_state_from_name(n["state"].as<std::string>("PENDING"));
                if (!state) {
                    return Result<Ledger>::Err(fmt::format("job {} has unknown state '{}'",
                                                           j.relative_path,
                                                           n["state"].as<std::string>("")));
                }
                j.state = *state;
                j.retry_count = n["retry_count"].as<int>(0);
                j.attempts = n["attempts"].as<int>(0);
                j.last_error = n["last_error"].as<std::string>("");
                j.permanent = n["permanent"].as<bool>(false);
                ledger.jobs.push_back(j);
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<Ledger>::Err(fmt::format("cannot parse ledger: {}", e.what()));
    }
    return Result<Ledger>::Ok(ledger);
}

// ── LedgerStore ─────────────────────────────────────────────

LedgerStore::LedgerStore(const fs::path& session_dir)
    : ledger_path_(session_dir / STATE_DIR_NAME / LEDGER_FILE_NAME) {}

bool LedgerStore::exists() const {
    std::error_code ec;
    return fs::exists(ledger_path_, ec);
}

Result<Ledger> LedgerStore::load() const {
    if (!exists()) {
        return Result<Ledger>::Err(fmt::format("no ledger at {}", ledger_path_.string()));
    }

    platform::FileLock lock(ledger_path_);
    if (!lock.locked()) {
        return Result<Ledger>::Err(lock.error());
    }

    std::ifstream in(ledger_path_);
    std::stringstream ss;
    ss << in.rdbuf();
    return ledger_from_yaml(ss.str());
}

Result<void> LedgerStore::save(const Ledger& ledger) const {
    platform::FileLock lock(ledger_path_);
    if (!lock.locked()) {
        return Result<void>::Err(lock.error());
    }
    Ledger stamped = ledger;
    stamped.updated_at = now_iso();
    return platform::write_file_atomic(ledger_path_, ledger_to_yaml(stamped));
}
