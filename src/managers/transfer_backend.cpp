#include "transfer_backend.hpp"
#include "run_log.hpp"
#include <core/config.hpp>
#include <core/utils.hpp>
#include <platform/file_io.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <cerrno>
#include <unistd.h>

WatchdogManifestBackend::WatchdogManifestBackend(WatchdogConfig config,
                                                 std::shared_ptr<const CredentialProvider> credentials)
    : config_(std::move(config)), credentials_(std::move(credentials)) {}

fs::path WatchdogManifestBackend::manifest_path(const Ledger& ledger) const {
    return fs::path(config_.flag_dir) / fmt::format("manifest_{}.yaml", ledger.session_id);
}

std::string WatchdogManifestBackend::requesting_user() const {
    if (credentials_) {
        auto user = credentials_->get("user");
        if (user.is_ok()) return user.value;
    }
    return platform::username();
}

std::string WatchdogManifestBackend::render_manifest(const Ledger& ledger) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << ledger.session_id;
    out << YAML::Key << "project_name" << YAML::Value << config_.project_name;
    out << YAML::Key << "platform" << YAML::Value << config_.platform;
    out << YAML::Key << "schedule_time" << YAML::Value << config_.schedule_time;
    out << YAML::Key << "force_cloud_sync" << YAML::Value << config_.force_cloud_sync;
    out << YAML::Key << "processor_full_name" << YAML::Value << requesting_user();
    out << YAML::Key << "source" << YAML::Value << ledger.source_root;
    out << YAML::Key << "destination" << YAML::Value << ledger.destination_root;
    out << YAML::Key << "fingerprint_method" << YAML::Value
        << fingerprint_method_name(ledger.fingerprint_method);
    out << YAML::Key << "created_at" << YAML::Value << now_iso();

    out << YAML::Key << "files" << YAML::Value << YAML::BeginSeq;
    for (const auto& j : ledger.jobs) {
        out << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << j.relative_path;
        out << YAML::Key << "size" << YAML::Value << j.size;
        out << YAML::Key << "fingerprint" << YAML::Value << j.fingerprint;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

std::string WatchdogManifestBackend::process_name() const {
    if (!config_.process_name.empty()) return config_.process_name;
    return fs::path(config_.executable).filename().string();
}

AttemptResult WatchdogManifestBackend::ensure_service_running() {
    auto name = process_name();
    if (!platform::find_processes(name).empty()) return AttemptResult::Ok();

    expctl_log(fmt::format("watchdog: {} not running, starting {}", name, config_.executable));
    if (!platform::spawn_detached(config_.executable, {})) {
        return AttemptResult::Transient(fmt::format("cannot start {}", config_.executable));
    }

    const int step_ms = 50;
    for (int waited = 0; waited <= config_.start_wait_ms; waited += step_ms) {
        if (!platform::find_processes(name).empty()) return AttemptResult::Ok();
        platform::sleep_ms(step_ms);
    }
    return AttemptResult::Transient(fmt::format(
        "watchdog service '{}' is not running after starting {}", name, config_.executable));
}

AttemptResult WatchdogManifestBackend::notify(const Ledger& ledger) {
    if (config_.flag_dir.empty()) {
        return AttemptResult::Permanent("transfer.watchdog.flag_dir is not set");
    }
    if (config_.project_name.empty()) {
        return AttemptResult::Permanent("transfer.watchdog.project_name is not set");
    }

    fs::path flag_dir(config_.flag_dir);
    std::error_code ec;
    fs::create_directories(flag_dir, ec);
    if (ec) {
        return attempt_from_errno(ec.value(), fmt::format("cannot create {}", flag_dir.string()));
    }
    if (::access(flag_dir.c_str(), W_OK) != 0) {
        return attempt_from_errno(errno, fmt::format("cannot write to {}", flag_dir.string()));
    }

    // The manifest is only written while the service runs
    if (!config_.executable.empty()) {
        auto alive = ensure_service_running();
        if (!alive.ok) return alive;
    }

    auto path = manifest_path(ledger);
    auto written = platform::write_file_atomic(path, render_manifest(ledger));
    if (written.is_err()) {
        // flag_dir is usually a network share; write failures are retried
        return AttemptResult::Transient(written.error);
    }

    expctl_log(fmt::format("watchdog: manifest written to {}", path.string()));
    return AttemptResult::Ok();
}

Result<std::shared_ptr<TransferBackend>> make_transfer_backend(
    const TransferConfig& config, std::shared_ptr<const CredentialProvider> credentials) {
    using R = Result<std::shared_ptr<TransferBackend>>;
    if (config.notify.empty() || config.notify == "none") {
        return R::Ok(std::make_shared<NullTransferBackend>());
    }
    if (config.notify == "watchdog") {
        return R::Ok(std::make_shared<WatchdogManifestBackend>(config.watchdog, std::move(credentials)));
    }
    return R::Err(fmt::format("unknown transfer.notify '{}' (expected watchdog or none)", config.notify));
}
